#pragma once

// This header includes the CMake-generated export header
// and provides the NBFACADE_API macro

#include "nbfacade/nbfacade_export.h"

#ifndef NBFACADE_API
    #define NBFACADE_API NBFACADE_EXPORT
#endif
