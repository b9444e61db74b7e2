// facade_config.cpp - Runtime configuration implementation
#include "nbfacade/facade_config.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

namespace nbfacade {

using json = nlohmann::json;

FacadeConfig& FacadeConfig::Instance() {
    static FacadeConfig instance;
    return instance;
}

FacadeConfig::FacadeConfig() {
    SetDefaults();
    Load();
}

void FacadeConfig::SetDefaults() {
    format_enabled_ = true;
    trailing_blank_lines_ = 0;
    tab_size_ = 4;
    insert_spaces_ = true;

    std::error_code ec;
    shadow_directory_ = std::filesystem::temp_directory_path(ec);
    if (ec) {
        shadow_directory_ = std::filesystem::path("/tmp");
    }
    extension_overrides_.clear();

    log_level_ = "info";
}

void FacadeConfig::ResetToDefaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    SetDefaults();
    modified_ = true;
}

std::filesystem::path FacadeConfig::GetUserConfigDir() const {
#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    if (appdata) {
        return std::filesystem::path(appdata) / "nbfacade";
    }
    return std::filesystem::path(".");
#else
    const char* home = std::getenv("HOME");
    if (!home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : ".";
    }
    return std::filesystem::path(home) / ".nbfacade";
#endif
}

std::filesystem::path FacadeConfig::FindConfigFile() const {
    const std::string config_name = "nbfacade.json";

    std::vector<std::filesystem::path> search_paths = {
        std::filesystem::current_path() / config_name,
        std::filesystem::current_path() / "config" / config_name,
        GetUserConfigDir() / config_name
    };

    for (const auto& path : search_paths) {
        if (std::filesystem::exists(path)) {
            spdlog::info("Found config file: {}", path.string());
            return path;
        }
    }

    // Default location for creation
    return std::filesystem::current_path() / config_name;
}

bool FacadeConfig::Load() {
    return Load(FindConfigFile());
}

bool FacadeConfig::Load(const std::filesystem::path& config_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!std::filesystem::exists(config_path)) {
        spdlog::debug("Config file not found at {}, using defaults", config_path.string());
        config_path_ = config_path;
        return false;
    }

    try {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            spdlog::error("Failed to open config file: {}", config_path.string());
            return false;
        }

        json config = json::parse(file);

        if (config.contains("format")) {
            const auto& format = config["format"];
            if (format.contains("enabled")) {
                format_enabled_ = format["enabled"].get<bool>();
            }
            if (format.contains("trailing_blank_lines")) {
                trailing_blank_lines_ = std::max(0, format["trailing_blank_lines"].get<int>());
            }
            if (format.contains("tab_size")) {
                tab_size_ = format["tab_size"].get<int>();
            }
            if (format.contains("insert_spaces")) {
                insert_spaces_ = format["insert_spaces"].get<bool>();
            }
        }

        if (config.contains("shadow")) {
            const auto& shadow = config["shadow"];
            if (shadow.contains("directory")) {
                shadow_directory_ = shadow["directory"].get<std::string>();
            }
            if (shadow.contains("extensions")) {
                for (const auto& [language, ext] : shadow["extensions"].items()) {
                    extension_overrides_[language] = ext.get<std::string>();
                }
            }
        }

        if (config.contains("logging")) {
            const auto& logging = config["logging"];
            if (logging.contains("level")) {
                log_level_ = logging["level"].get<std::string>();
            }
        }

        config_path_ = config_path;
        modified_ = false;

        spdlog::info("Loaded config from: {}", config_path.string());
        spdlog::debug("  Trailing blank lines: {}", trailing_blank_lines_);
        spdlog::debug("  Shadow directory: {}", shadow_directory_.string());

        return true;

    } catch (const json::exception& e) {
        spdlog::error("Failed to parse config file: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        spdlog::error("Error loading config: {}", e.what());
        return false;
    }
}

bool FacadeConfig::Save() {
    std::filesystem::path path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        path = config_path_;
    }
    if (path.empty()) {
        path = FindConfigFile();
    }
    return Save(path);
}

bool FacadeConfig::Save(const std::filesystem::path& config_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        auto parent = config_path.parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            std::filesystem::create_directories(parent);
        }

        json config;

        config["format"] = {
            {"enabled", format_enabled_},
            {"trailing_blank_lines", trailing_blank_lines_},
            {"tab_size", tab_size_},
            {"insert_spaces", insert_spaces_}
        };

        config["shadow"] = {
            {"directory", shadow_directory_.string()},
            {"extensions", extension_overrides_}
        };

        config["logging"] = {
            {"level", log_level_}
        };

        std::ofstream file(config_path);
        if (!file.is_open()) {
            spdlog::error("Failed to create config file: {}", config_path.string());
            return false;
        }

        file << config.dump(4);

        config_path_ = config_path;
        modified_ = false;

        spdlog::info("Saved config to: {}", config_path.string());
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Error saving config: {}", e.what());
        return false;
    }
}

bool FacadeConfig::Reload() {
    std::filesystem::path path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        path = config_path_;
    }
    return Load(path);
}

std::filesystem::path FacadeConfig::GetConfigPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_path_;
}

// ===== Getters and Setters =====

bool FacadeConfig::IsFormatEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return format_enabled_;
}

void FacadeConfig::SetFormatEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (format_enabled_ != enabled) {
        format_enabled_ = enabled;
        modified_ = true;
    }
}

int FacadeConfig::GetTrailingBlankLines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trailing_blank_lines_;
}

void FacadeConfig::SetTrailingBlankLines(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    count = std::max(0, count);
    if (trailing_blank_lines_ != count) {
        trailing_blank_lines_ = count;
        modified_ = true;
    }
}

int FacadeConfig::GetTabSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tab_size_;
}

void FacadeConfig::SetTabSize(int size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tab_size_ != size) {
        tab_size_ = size;
        modified_ = true;
    }
}

bool FacadeConfig::GetInsertSpaces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return insert_spaces_;
}

void FacadeConfig::SetInsertSpaces(bool insert_spaces) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (insert_spaces_ != insert_spaces) {
        insert_spaces_ = insert_spaces;
        modified_ = true;
    }
}

std::filesystem::path FacadeConfig::GetShadowDirectory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shadow_directory_;
}

void FacadeConfig::SetShadowDirectory(const std::filesystem::path& dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shadow_directory_ != dir) {
        shadow_directory_ = dir;
        modified_ = true;
    }
}

std::map<std::string, std::string> FacadeConfig::GetExtensionOverrides() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return extension_overrides_;
}

void FacadeConfig::SetExtensionOverride(const std::string& language, const std::string& extension) {
    std::lock_guard<std::mutex> lock(mutex_);
    extension_overrides_[language] = extension;
    modified_ = true;
}

std::string FacadeConfig::GetLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_level_;
}

void FacadeConfig::SetLogLevel(const std::string& level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_level_ != level) {
        log_level_ = level;
        modified_ = true;
    }
}

} // namespace nbfacade
