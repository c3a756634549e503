#ifndef EXTMGR_CORE_EXTENSION_REGISTRY_HPP
#define EXTMGR_CORE_EXTENSION_REGISTRY_HPP

#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "extmgr/core/version.h"

namespace extmgr {
namespace core {

/**
 * @brief Metadata read from an extension's extension.json.
 */
struct ExtensionMetadata {
    std::string name;            ///< Identifier, "vendor/name"
    std::string version;         ///< Version text as declared
    std::string displayName;     ///< Human-readable name
    std::string type{"extension"};
    std::string hostRequirement{"*"};  ///< Constraint on the host version ("requires")

    nlohmann::json to_json() const;

    /**
     * @throws nlohmann::json::exception on missing or mistyped fields
     */
    static ExtensionMetadata from_json(const nlohmann::json& j);
};

using ExtensionMap = std::map<std::string, ExtensionMetadata>;

/**
 * @brief Knows which extensions exist on disk and which of them are enabled.
 *
 * Failures of enable/disable/path lookups are reported as ExtensionError.
 */
class ExtensionRegistry {
public:
    virtual ~ExtensionRegistry() = default;

    /**
     * @brief Every extension present on disk, managed or not.
     */
    virtual ExtensionMap all_available() const = 0;

    virtual bool is_available(const std::string& id) const = 0;
    virtual bool is_enabled(const std::string& id) const = 0;

    virtual void enable(const std::string& id) = 0;

    /**
     * @brief Enables an extension whose files were just replaced, refreshing
     * whatever the registry remembers about the previous copy.
     */
    virtual void enabling(const std::string& id) = 0;

    virtual void disable(const std::string& id) = 0;

    /**
     * @brief On-disk location of an extension, with a trailing separator.
     *
     * @param mustExist throw ExtensionError when the directory is missing
     */
    virtual std::string get_extension_path(const std::string& id, bool mustExist = false) const = 0;
};

/**
 * @brief Extensions stored as <root>/<vendor>/<name>/extension.json, enabled
 * state persisted in a JSON state file.
 *
 * Availability is read from disk on every query so that packages installed
 * or removed by an installer are seen immediately.
 */
class DirectoryExtensionRegistry : public ExtensionRegistry {
public:
    static constexpr const char* kMetadataFile = "extension.json";

    /**
     * @param root Directory holding vendor directories
     * @param statePath JSON file holding the enabled state, created on first write
     * @param hostVersion Version checked against each extension's "requires"
     */
    DirectoryExtensionRegistry(std::string root, std::string statePath, Version hostVersion);

    ExtensionMap all_available() const override;
    bool is_available(const std::string& id) const override;
    bool is_enabled(const std::string& id) const override;
    void enable(const std::string& id) override;
    void enabling(const std::string& id) override;
    void disable(const std::string& id) override;
    std::string get_extension_path(const std::string& id, bool mustExist = false) const override;

    /**
     * @brief Version recorded when the extension was last enabled, empty if none.
     */
    std::string enabled_version(const std::string& id) const;

    const std::string& root() const { return root_; }

private:
    ExtensionMetadata readMetadata(const std::string& id) const;
    void checkEnableable(const ExtensionMetadata& metadata) const;
    void markEnabled(const std::string& id, const std::string& version);

    nlohmann::json loadState() const;
    void saveState(const nlohmann::json& state) const;

    std::string root_;
    std::string statePath_;
    Version hostVersion_;
};

} // namespace core
} // namespace extmgr

#endif // EXTMGR_CORE_EXTENSION_REGISTRY_HPP
