#include "extmgr/core/manager_config.hpp"

#include <fstream>
#include <stdexcept>

namespace extmgr {
namespace core {

Verbosity parse_verbosity(const std::string& name) {
    if (name == "quiet") return Verbosity::Quiet;
    if (name == "normal") return Verbosity::Normal;
    if (name == "verbose") return Verbosity::Verbose;
    if (name == "very_verbose") return Verbosity::VeryVerbose;
    if (name == "debug") return Verbosity::Debug;
    throw std::invalid_argument("Unknown verbosity: " + name);
}

const char* to_string(Verbosity verbosity) {
    switch (verbosity) {
        case Verbosity::Quiet:       return "quiet";
        case Verbosity::Normal:      return "normal";
        case Verbosity::Verbose:     return "verbose";
        case Verbosity::VeryVerbose: return "very_verbose";
        case Verbosity::Debug:       return "debug";
    }
    return "normal";
}

nlohmann::json ManagerConfig::to_json() const {
    nlohmann::json j = {
        {"extensions_root", extensionsRoot},
        {"repository_path", repositoryPath},
        {"manifest_path", manifestPath},
        {"state_path", statePath},
        {"package_type", packageType},
        {"exception_prefix", exceptionPrefix},
        {"host_version", hostVersion},
        {"backup_suffix", backupSuffix},
        {"verbosity", to_string(verbosity)},
        {"logging", {
            {"level", logging.level},
            {"pattern", logging.pattern},
            {"file", logging.file}
        }}
    };
    if (!messagesPath.empty()) {
        j["messages_path"] = messagesPath;
    }
    return j;
}

ManagerConfig ManagerConfig::from_json(const nlohmann::json& j) {
    ManagerConfig config;
    config.extensionsRoot = j.value("extensions_root", config.extensionsRoot);
    config.repositoryPath = j.value("repository_path", config.repositoryPath);
    config.manifestPath = j.value("manifest_path", config.manifestPath);
    config.statePath = j.value("state_path", config.statePath);
    config.packageType = j.value("package_type", config.packageType);
    config.exceptionPrefix = j.value("exception_prefix", config.exceptionPrefix);
    config.hostVersion = j.value("host_version", config.hostVersion);
    config.backupSuffix = j.value("backup_suffix", config.backupSuffix);
    config.messagesPath = j.value("messages_path", config.messagesPath);

    if (j.contains("verbosity")) {
        config.verbosity = parse_verbosity(j["verbosity"].get<std::string>());
    }

    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        config.logging.level = logging.value("level", config.logging.level);
        config.logging.pattern = logging.value("pattern", config.logging.pattern);
        config.logging.file = logging.value("file", config.logging.file);
    }

    return config;
}

Result<ManagerConfig> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return utils::make_error("Failed to open configuration file: " + path);
    }

    try {
        nlohmann::json data;
        file >> data;
        if (!data.is_object()) {
            return utils::make_error("Configuration file " + path + " must contain a JSON object");
        }
        auto config = ManagerConfig::from_json(data);
        if (config.backupSuffix.empty()) {
            return utils::make_error("backup_suffix must not be empty");
        }
        return config;
    } catch (const nlohmann::json::exception& e) {
        return utils::make_error("Failed to parse configuration file " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        return utils::make_error("Invalid configuration file " + path + ": " + e.what());
    }
}

Result<void> save_config(const ManagerConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return utils::make_error("Failed to open configuration file for writing: " + path);
    }
    file << config.to_json().dump(2);
    if (!file) {
        return utils::make_error("Failed to write configuration file: " + path);
    }
    return {};
}

} // namespace core
} // namespace extmgr
