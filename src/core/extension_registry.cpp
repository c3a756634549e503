#include "extmgr/core/extension_registry.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "extmgr/core/exceptions.hpp"
#include "extmgr/utils/logging.hpp"

namespace extmgr {
namespace core {

namespace fs = std::filesystem;

namespace {
    // "vendor/name", both parts non-empty, no traversal
    bool isValidId(const std::string& id) {
        auto slash = id.find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 >= id.size()) {
            return false;
        }
        if (id.find('/', slash + 1) != std::string::npos) {
            return false;
        }
        auto vendor = id.substr(0, slash);
        auto name = id.substr(slash + 1);
        return vendor != "." && vendor != ".." && name != "." && name != ".." &&
               id.find('\\') == std::string::npos;
    }

    nlohmann::json readJsonFromFile(const fs::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for reading: " + path.string());
        }
        nlohmann::json data;
        file >> data;
        return data;
    }
}

nlohmann::json ExtensionMetadata::to_json() const {
    return {
        {"name", name},
        {"version", version},
        {"display_name", displayName},
        {"type", type},
        {"requires", hostRequirement}
    };
}

ExtensionMetadata ExtensionMetadata::from_json(const nlohmann::json& j) {
    ExtensionMetadata metadata;
    metadata.name = j.at("name").get<std::string>();
    metadata.version = j.at("version").get<std::string>();
    metadata.displayName = j.value("display_name", metadata.name);
    metadata.type = j.value("type", std::string("extension"));
    metadata.hostRequirement = j.value("requires", std::string("*"));
    return metadata;
}

DirectoryExtensionRegistry::DirectoryExtensionRegistry(std::string root, std::string statePath, Version hostVersion)
    : root_(std::move(root))
    , statePath_(std::move(statePath))
    , hostVersion_(hostVersion) {}

ExtensionMap DirectoryExtensionRegistry::all_available() const {
    ExtensionMap available;

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return available;
    }

    for (const auto& vendor : fs::directory_iterator(root_, ec)) {
        if (!vendor.is_directory()) continue;
        for (const auto& extension : fs::directory_iterator(vendor.path(), ec)) {
            if (!extension.is_directory()) continue;
            if (!fs::exists(extension.path() / kMetadataFile)) continue;

            const std::string id = vendor.path().filename().string() + "/" + extension.path().filename().string();
            try {
                available.emplace(id, readMetadata(id));
            } catch (const ExtensionError& e) {
                EMLOG_WARN("Skipping extension " + id + ": " + e.what());
            }
        }
    }

    return available;
}

bool DirectoryExtensionRegistry::is_available(const std::string& id) const {
    if (!isValidId(id)) {
        return false;
    }
    std::error_code ec;
    if (!fs::exists(fs::path(root_) / id / kMetadataFile, ec)) {
        return false;
    }
    try {
        readMetadata(id);
        return true;
    } catch (const ExtensionError& e) {
        EMLOG_WARN("Extension " + id + " has invalid metadata: " + e.what());
        return false;
    }
}

bool DirectoryExtensionRegistry::is_enabled(const std::string& id) const {
    auto state = loadState();
    const auto& extensions = state["extensions"];
    return extensions.contains(id) && extensions[id].value("enabled", false);
}

void DirectoryExtensionRegistry::enable(const std::string& id) {
    if (!is_available(id)) {
        throw ExtensionError("EXTENSION_NOT_AVAILABLE", {id});
    }
    auto metadata = readMetadata(id);
    checkEnableable(metadata);

    // Keep the version stamp of an earlier enable
    std::string stamp = enabled_version(id);
    markEnabled(id, stamp.empty() ? metadata.version : stamp);
}

void DirectoryExtensionRegistry::enabling(const std::string& id) {
    if (!is_available(id)) {
        throw ExtensionError("EXTENSION_NOT_AVAILABLE", {id});
    }
    auto metadata = readMetadata(id);
    checkEnableable(metadata);

    const std::string previous = enabled_version(id);
    if (!previous.empty() && previous != metadata.version) {
        EMLOG_INFO("Extension " + id + " changed from " + previous + " to " + metadata.version);
    }
    markEnabled(id, metadata.version);
}

void DirectoryExtensionRegistry::disable(const std::string& id) {
    auto state = loadState();
    auto& extensions = state["extensions"];
    if (!extensions.contains(id) || !extensions[id].value("enabled", false)) {
        return;
    }
    extensions[id]["enabled"] = false;
    saveState(state);
    EMLOG_DEBUG("Disabled extension " + id);
}

std::string DirectoryExtensionRegistry::get_extension_path(const std::string& id, bool mustExist) const {
    if (!isValidId(id)) {
        throw ExtensionError("EXTENSION_NOT_AVAILABLE", {id});
    }

    std::string path = (fs::path(root_) / id).string() + "/";
    std::error_code ec;
    if (mustExist && !fs::is_directory(path, ec)) {
        throw ExtensionError("EXTENSION_PATH_MISSING", {id, path});
    }
    return path;
}

std::string DirectoryExtensionRegistry::enabled_version(const std::string& id) const {
    auto state = loadState();
    const auto& extensions = state["extensions"];
    if (!extensions.contains(id)) {
        return {};
    }
    return extensions[id].value("version", std::string());
}

ExtensionMetadata DirectoryExtensionRegistry::readMetadata(const std::string& id) const {
    const fs::path file = fs::path(root_) / id / kMetadataFile;
    ExtensionMetadata metadata;
    try {
        metadata = ExtensionMetadata::from_json(readJsonFromFile(file));
    } catch (const std::exception& e) {
        throw ExtensionError("EXTENSION_METADATA_INVALID", {id, e.what()});
    }
    if (metadata.name != id) {
        throw ExtensionError("EXTENSION_METADATA_INVALID", {id, "declared name is " + metadata.name});
    }
    return metadata;
}

void DirectoryExtensionRegistry::checkEnableable(const ExtensionMetadata& metadata) const {
    VersionConstraint constraint;
    try {
        constraint = VersionConstraint::parse(metadata.hostRequirement);
    } catch (const std::invalid_argument& e) {
        throw ExtensionError("EXTENSION_METADATA_INVALID", {metadata.name, e.what()});
    }
    if (!constraint.matches(hostVersion_)) {
        throw ExtensionError("EXTENSION_NOT_ENABLEABLE",
                             {metadata.name, metadata.hostRequirement, hostVersion_.toString()});
    }
}

void DirectoryExtensionRegistry::markEnabled(const std::string& id, const std::string& version) {
    auto state = loadState();
    state["extensions"][id] = {{"enabled", true}, {"version", version}};
    saveState(state);
    EMLOG_DEBUG("Enabled extension " + id + " (" + version + ")");
}

nlohmann::json DirectoryExtensionRegistry::loadState() const {
    std::error_code ec;
    if (!fs::exists(statePath_, ec)) {
        return {{"extensions", nlohmann::json::object()}};
    }

    nlohmann::json state;
    try {
        state = readJsonFromFile(statePath_);
    } catch (const std::exception& e) {
        throw ExtensionError("EXTENSION_STATE_ERROR", {statePath_, e.what()});
    }
    if (!state.is_object()) {
        throw ExtensionError("EXTENSION_STATE_ERROR", {statePath_, "not a JSON object"});
    }
    if (!state.contains("extensions") || !state["extensions"].is_object()) {
        state["extensions"] = nlohmann::json::object();
    }
    return state;
}

void DirectoryExtensionRegistry::saveState(const nlohmann::json& state) const {
    const fs::path target(statePath_);
    const fs::path temp = target.string() + ".tmp";

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }

    {
        std::ofstream file(temp);
        if (!file.is_open()) {
            throw ExtensionError("EXTENSION_STATE_ERROR", {statePath_, "cannot open for writing"});
        }
        file << state.dump(2);
        if (!file) {
            throw ExtensionError("EXTENSION_STATE_ERROR", {statePath_, "write failed"});
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        throw ExtensionError("EXTENSION_STATE_ERROR", {statePath_, ec.message()});
    }
}

} // namespace core
} // namespace extmgr
