#include "extmgr/core/message_catalog.hpp"

#include <cctype>
#include <fstream>

namespace extmgr {
namespace core {

namespace {
    std::string appendParameters(const std::string& key, const std::vector<std::string>& parameters) {
        if (parameters.empty()) {
            return key;
        }
        std::string text = key + " [";
        for (size_t i = 0; i < parameters.size(); ++i) {
            if (i > 0) text += ", ";
            text += parameters[i];
        }
        return text + "]";
    }

    std::string format(const std::string& tmpl, const std::vector<std::string>& parameters) {
        std::string out;
        out.reserve(tmpl.size());
        size_t next = 0;

        for (size_t i = 0; i < tmpl.size(); ++i) {
            if (tmpl[i] != '%' || i + 1 >= tmpl.size()) {
                out += tmpl[i];
                continue;
            }

            if (tmpl[i + 1] == '%') {
                out += '%';
                ++i;
                continue;
            }
            if (tmpl[i + 1] == 's') {
                if (next < parameters.size()) out += parameters[next];
                ++next;
                ++i;
                continue;
            }

            // Positional form: %<n>$s
            size_t j = i + 1;
            size_t position = 0;
            while (j < tmpl.size() && std::isdigit(static_cast<unsigned char>(tmpl[j]))) {
                position = position * 10 + static_cast<size_t>(tmpl[j] - '0');
                ++j;
            }
            if (j > i + 1 && j + 1 < tmpl.size() && tmpl[j] == '$' && tmpl[j + 1] == 's') {
                if (position >= 1 && position <= parameters.size()) out += parameters[position - 1];
                i = j + 1;
                continue;
            }

            out += tmpl[i];
        }
        return out;
    }
}

MessageCatalog MessageCatalog::defaults() {
    MessageCatalog catalog;

    // Status notices
    catalog.set("DISABLING_EXTENSIONS", "Disabling extensions...");
    catalog.set("ENABLING_EXTENSIONS", "Enabling extensions...");
    catalog.set("DISABLING_EXTENSION", "Disabling extension...");
    catalog.set("ENABLING_EXTENSION", "Enabling extension...");
    catalog.set("INSTALLING_PACKAGES", "Installing packages...");
    catalog.set("UPDATING_PACKAGES", "Updating packages...");
    catalog.set("REMOVING_PACKAGES", "Removing packages...");
    catalog.set("INSTALLING_PACKAGE", "  - Installing %s (%s)");
    catalog.set("UPDATING_PACKAGE", "  - Updating %s (%s => %s)");
    catalog.set("REMOVING_PACKAGE", "  - Removing %s (%s)");

    // Manager errors, default prefix
    catalog.set("EXTENSIONS_ALREADY_INSTALLED", "The extension(s) %s are already installed.");
    catalog.set("EXTENSIONS_ALREADY_INSTALLED_MANUALLY",
                "The extension(s) %s are already installed manually. Start managing them instead.");
    catalog.set("EXTENSIONS_NOT_INSTALLED", "The extension(s) %s are not installed.");
    catalog.set("EXTENSIONS_NOT_MANAGED", "The extension(s) %s are not managed by the installer.");
    catalog.set("EXTENSIONS_ALREADY_MANAGED", "The extension %s is already managed.");
    catalog.set("EXTENSIONS_CANNOT_MANAGE_FILESYSTEM_ERROR",
                "The extension %s could not be managed: its files could not be backed up.");
    catalog.set("EXTENSIONS_CANNOT_MANAGE_INSTALL_ERROR",
                "The extension %s could not be installed. It has been restored to its previous state.");
    catalog.set("EXTENSIONS_CANNOT_MANAGE_BACKUP_EXISTS",
                "The extension %1$s could not be managed: the backup directory %2$s already exists.");
    catalog.set("EXTENSIONS_CANNOT_MANAGE_ROLLBACK_ERROR",
                "The extension %1$s could not be installed and its files could not be restored. "
                "They are still available in %2$s.");
    catalog.set("EXTENSIONS_MANAGED_WITH_CLEAN_ERROR",
                "The extension %1$s is now managed, but the backup directory %2$s could not be removed. "
                "Please remove it manually.");
    catalog.set("EXTENSIONS_MANAGED_WITH_ENABLE_ERROR",
                "The extension %s is now managed, but it could not be enabled again. Please enable it manually.");
    catalog.set("EXTENSIONS_INSTALL_FAILED", "Installing %s failed: %s");
    catalog.set("EXTENSIONS_PACKAGE_NOT_FOUND", "No package matches %s (%s).");
    catalog.set("EXTENSIONS_NOT_SUPPORTED", "This operation is not supported.");

    // Registry errors
    catalog.set("EXTENSION_NOT_AVAILABLE", "The extension %s is not available.");
    catalog.set("EXTENSION_NOT_ENABLEABLE", "The extension %1$s requires version %2$s, found %3$s.");
    catalog.set("EXTENSION_PATH_MISSING", "The directory of extension %1$s does not exist: %2$s");
    catalog.set("EXTENSION_STATE_ERROR", "The extension state file %s could not be used: %s");
    catalog.set("EXTENSION_METADATA_INVALID", "The metadata of extension %s is invalid: %s");

    // Filesystem errors
    catalog.set("FILESYSTEM_CANNOT_RENAME", "Cannot rename %1$s to %2$s: %3$s");
    catalog.set("FILESYSTEM_CANNOT_REMOVE", "Cannot remove %1$s: %2$s");
    catalog.set("FILESYSTEM_CANNOT_COPY", "Cannot copy %1$s to %2$s: %3$s");
    catalog.set("FILESYSTEM_DESTINATION_EXISTS", "Cannot rename %1$s to %2$s: destination exists");

    return catalog;
}

void MessageCatalog::set(const std::string& key, const std::string& text) {
    entries_[key] = text;
}

bool MessageCatalog::contains(const std::string& key) const {
    return entries_.count(key) > 0;
}

std::string MessageCatalog::translate(const std::string& key,
                                      const std::vector<std::string>& parameters) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return appendParameters(key, parameters);
    }
    return format(it->second, parameters);
}

Result<void> MessageCatalog::merge(const nlohmann::json& entries) {
    if (!entries.is_object()) {
        return utils::make_error("message catalog must be a JSON object");
    }
    for (const auto& [key, value] : entries.items()) {
        if (!value.is_string()) {
            return utils::make_error("message '" + key + "' is not a string");
        }
    }
    for (const auto& [key, value] : entries.items()) {
        entries_[key] = value.get<std::string>();
    }
    return {};
}

Result<void> MessageCatalog::merge_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return utils::make_error("Failed to open message catalog: " + path);
    }
    try {
        nlohmann::json data;
        file >> data;
        return merge(data);
    } catch (const nlohmann::json::exception& e) {
        return utils::make_error("Failed to parse message catalog " + path + ": " + e.what());
    }
}

} // namespace core
} // namespace extmgr
