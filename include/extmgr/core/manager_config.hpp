#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "extmgr/core/io_interface.hpp"
#include "extmgr/utils/logging.hpp"
#include "extmgr/utils/result.hpp"

namespace extmgr {
namespace core {

/**
 * @brief Configuration of an extension manager instance.
 */
struct ManagerConfig {
    std::string extensionsRoot{"ext"};               // Installed extensions, <root>/<vendor>/<name>/
    std::string repositoryPath{"repository"};        // Local package repository
    std::string manifestPath{"ext/.installed.json"}; // Packages managed by the installer
    std::string statePath{"ext/.state.json"};        // Enabled state of extensions
    std::string packageType{"extension"};            // Type of packages handled by the installer
    std::string exceptionPrefix{"EXTENSIONS_"};      // Prefix of manager error keys
    std::string hostVersion{"1.0.0"};                // Checked against each extension's "requires"
    std::string backupSuffix{"__backup__"};          // Appended to an extension path while it is migrated
    std::string messagesPath;                        // Optional message catalog override
    Verbosity verbosity{Verbosity::Normal};
    utils::LoggingConfig logging;

    nlohmann::json to_json() const;

    /**
     * @brief Reads a configuration object. Missing keys keep their defaults.
     *
     * @throws nlohmann::json::exception on mistyped values
     * @throws std::invalid_argument on an unknown verbosity name
     */
    static ManagerConfig from_json(const nlohmann::json& j);
};

Verbosity parse_verbosity(const std::string& name);
const char* to_string(Verbosity verbosity);

/**
 * @brief Loads a configuration file.
 */
Result<ManagerConfig> load_config(const std::string& path);

/**
 * @brief Writes a configuration file.
 */
Result<void> save_config(const ManagerConfig& config, const std::string& path);

} // namespace core
} // namespace extmgr
