// facade_config.h - Runtime configuration for nbfacade
#pragma once

#include "api_export.h"
#include <string>
#include <map>
#include <mutex>
#include <filesystem>

namespace nbfacade {

/**
 * @brief Runtime configuration for the notebook facade.
 *
 * Loads from nbfacade.json and supports runtime modifications.
 *
 * Config file search order:
 * 1. ./nbfacade.json
 * 2. ./config/nbfacade.json
 * 3. User config directory (~/.nbfacade/nbfacade.json on Linux/macOS,
 *    %APPDATA%/nbfacade/nbfacade.json on Windows)
 *
 * Usage:
 *   auto& config = FacadeConfig::Instance();
 *   int keep = config.GetTrailingBlankLines();
 */
class NBFACADE_API FacadeConfig {
public:
    static FacadeConfig& Instance();

    // Prevent copying
    FacadeConfig(const FacadeConfig&) = delete;
    FacadeConfig& operator=(const FacadeConfig&) = delete;

    // Load configuration from file
    bool Load();
    bool Load(const std::filesystem::path& config_path);

    // Save current configuration to file
    bool Save();
    bool Save(const std::filesystem::path& config_path);

    // Reload configuration from disk
    bool Reload();

    // Restore built-in defaults (keeps the config path)
    void ResetToDefaults();

    std::filesystem::path GetConfigPath() const;

    // ===== Formatting =====

    bool IsFormatEnabled() const;
    void SetFormatEnabled(bool enabled);

    // Blank lines kept at the end of a formatted cell
    int GetTrailingBlankLines() const;
    void SetTrailingBlankLines(int count);

    int GetTabSize() const;
    void SetTabSize(int size);

    bool GetInsertSpaces() const;
    void SetInsertSpaces(bool insert_spaces);

    // ===== Shadow Documents =====

    // Directory used for shadow document identities
    std::filesystem::path GetShadowDirectory() const;
    void SetShadowDirectory(const std::filesystem::path& dir);

    // Language -> extension overrides (merged over the built-in table)
    std::map<std::string, std::string> GetExtensionOverrides() const;
    void SetExtensionOverride(const std::string& language, const std::string& extension);

    // ===== Logging =====

    std::string GetLogLevel() const;
    void SetLogLevel(const std::string& level);

    bool IsModified() const { return modified_; }

private:
    FacadeConfig();
    ~FacadeConfig() = default;

    std::filesystem::path FindConfigFile() const;
    std::filesystem::path GetUserConfigDir() const;
    void SetDefaults();

    mutable std::mutex mutex_;
    std::filesystem::path config_path_;
    bool modified_ = false;

    // Formatting
    bool format_enabled_ = true;
    int trailing_blank_lines_ = 0;
    int tab_size_ = 4;
    bool insert_spaces_ = true;

    // Shadow documents
    std::filesystem::path shadow_directory_;
    std::map<std::string, std::string> extension_overrides_;

    // Logging
    std::string log_level_ = "info";
};

} // namespace nbfacade
