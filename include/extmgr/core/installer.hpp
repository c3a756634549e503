#ifndef EXTMGR_CORE_INSTALLER_HPP
#define EXTMGR_CORE_INSTALLER_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "extmgr/core/filesystem.hpp"
#include "extmgr/core/io_interface.hpp"
#include "extmgr/core/version.h"

namespace extmgr {
namespace core {

/**
 * @brief Requested packages: identifier -> version constraint ("*" for any).
 */
using PackageSet = std::map<std::string, std::string>;

/**
 * @brief Backend that actually puts package files in place.
 *
 * Implementations report failures as ManagerError (InstallFailed,
 * PackageNotFound) built with the prefix given at construction.
 */
class Installer {
public:
    virtual ~Installer() = default;

    /**
     * @brief Packages installed by this installer: identifier -> installed version.
     */
    virtual PackageSet installed_packages() const = 0;

    /**
     * @brief Installs each package at the newest version matching its constraint.
     */
    virtual void install(const PackageSet& packages, IOInterface& io) = 0;

    /**
     * @brief Moves installed packages to the newest version matching their constraint.
     */
    virtual void update(const PackageSet& packages, IOInterface& io) = 0;

    virtual void remove(const std::vector<std::string>& packages, IOInterface& io) = 0;
};

/**
 * @brief Entry of the installed-packages manifest.
 */
struct ManifestEntry {
    std::string version;
    std::string checksum;   ///< SHA-256 of the installed tree
};

/**
 * @brief Installs packages from a local repository directory.
 *
 * Repository layout: <repository>/<vendor>/<name>/<version>/extension.json.
 * Packages are copied to <target>/<vendor>/<name>/ and recorded in a JSON
 * manifest. No dependency resolution and no downloads.
 */
class LocalRepositoryInstaller : public Installer {
public:
    /**
     * @param repository Repository root
     * @param target Directory receiving installed packages
     * @param manifestPath JSON manifest of installed packages
     * @param packageType Only packages of this type are installable
     * @param exceptionPrefix Prefix of raised ManagerError keys
     * @param filesystem Filesystem used for every file operation
     */
    LocalRepositoryInstaller(std::string repository,
                             std::string target,
                             std::string manifestPath,
                             std::string packageType,
                             std::string exceptionPrefix,
                             std::shared_ptr<FilesystemOperator> filesystem);

    PackageSet installed_packages() const override;
    void install(const PackageSet& packages, IOInterface& io) override;
    void update(const PackageSet& packages, IOInterface& io) override;
    void remove(const std::vector<std::string>& packages, IOInterface& io) override;

    /**
     * @brief Versions of a package available in the repository, ascending.
     */
    std::vector<Version> available_versions(const std::string& package) const;

    /**
     * @brief Recomputes the checksum of an installed package and compares it
     * with the manifest.
     */
    bool verify(const std::string& package) const;

    std::optional<ManifestEntry> manifest_entry(const std::string& package) const;

    /**
     * @brief Hex SHA-256 over the relative paths and contents of a tree.
     */
    static std::string checksum_tree(const std::string& directory);

private:
    struct Candidate {
        Version version;
        std::string versionText;
        std::string path;
    };

    Candidate resolve(const std::string& package, const std::string& constraint) const;
    void put(const std::string& package, const Candidate& candidate, std::map<std::string, ManifestEntry>& manifest);
    void discardStaging(const std::string& staging);
    std::string targetPath(const std::string& package) const;

    std::map<std::string, ManifestEntry> loadManifest() const;
    void saveManifest(const std::map<std::string, ManifestEntry>& manifest) const;

    std::string repository_;
    std::string target_;
    std::string manifestPath_;
    std::string packageType_;
    std::string exceptionPrefix_;
    std::shared_ptr<FilesystemOperator> filesystem_;
};

} // namespace core
} // namespace extmgr

#endif // EXTMGR_CORE_INSTALLER_HPP
