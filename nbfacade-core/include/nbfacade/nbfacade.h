#pragma once

// Main header file for nbfacade
// Include this to get access to the notebook facade and its protocol proxy

#define NBFACADE_VERSION_MAJOR 0
#define NBFACADE_VERSION_MINOR 1
#define NBFACADE_VERSION_PATCH 0

// API export macros
#include "api_export.h"

// Document model (order matters - no dependencies first)
#include "cell.h"
#include "line_format.h"
#include "document.h"

// Views and synchronization
#include "anchor_tracker.h"
#include "text_view.h"
#include "shadow_projector.h"
#include "edit_overlay.h"
#include "task_queue.h"
#include "view_synchronizer.h"

// Sessions and external collaborators
#include "uri.h"
#include "collaborators.h"
#include "notebook_session.h"
#include "facade_config.h"

// Language-server protocol proxy
#include "lsp/backend.h"
#include "lsp/method_table.h"
#include "lsp/request_tracker.h"
#include "lsp/session_registry.h"
#include "lsp/text_edit.h"
#include "lsp/protocol_proxy.h"

namespace nbfacade {

// Initialize logging and configuration
NBFACADE_API bool Initialize();

// Flush logs
NBFACADE_API void Shutdown();

// Get version string
NBFACADE_API const char* GetVersionString();

} // namespace nbfacade
