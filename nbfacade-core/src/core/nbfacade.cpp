#include "nbfacade/nbfacade.h"
#include <spdlog/spdlog.h>
#include <cstdio>

namespace nbfacade {

static bool g_initialized = false;

bool Initialize() {
    if (g_initialized) {
        spdlog::warn("nbfacade already initialized");
        return true;
    }

    spdlog::info("Initializing nbfacade v{}.{}.{}",
                 NBFACADE_VERSION_MAJOR,
                 NBFACADE_VERSION_MINOR,
                 NBFACADE_VERSION_PATCH);

    auto& config = FacadeConfig::Instance();
    const std::string level_name = config.GetLogLevel();
    auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off") {
        spdlog::warn("Unknown log level '{}', using info", level_name);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);

#ifdef NBFACADE_DEBUG
    spdlog::set_level(spdlog::level::debug);
    spdlog::info("Debug mode enabled");
#endif

    spdlog::debug("Shadow documents under {}", config.GetShadowDirectory().string());

    g_initialized = true;
    return true;
}

void Shutdown() {
    if (!g_initialized) {
        return;
    }

    spdlog::info("Shutting down nbfacade");
    spdlog::default_logger()->flush();

    g_initialized = false;
}

const char* GetVersionString() {
    static char version[32];
    snprintf(version, sizeof(version), "%d.%d.%d",
             NBFACADE_VERSION_MAJOR,
             NBFACADE_VERSION_MINOR,
             NBFACADE_VERSION_PATCH);
    return version;
}

} // namespace nbfacade
