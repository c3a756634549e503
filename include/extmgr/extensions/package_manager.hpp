#pragma once

#include <memory>
#include <string>
#include <vector>
#include "extmgr/core/installer.hpp"
#include "extmgr/core/io_interface.hpp"
#include "extmgr/extensions/batch_context.hpp"

namespace extmgr {
namespace extensions {

using core::PackageSet;

/**
 * @brief Validates bulk package operations and brackets the installer
 * backend with pre/post hooks.
 *
 * Subclasses override the hooks they need; every hook receives the
 * BatchContext of the running operation. All errors raised by the manager
 * itself are core::ManagerError built with exception_prefix().
 */
class PackageManager {
public:
    /**
     * @param installer Backend doing the file work
     * @param packageType Type of the packages this manager handles
     * @param exceptionPrefix Prefix of raised error keys
     */
    PackageManager(std::shared_ptr<core::Installer> installer,
                   std::string packageType,
                   std::string exceptionPrefix);

    virtual ~PackageManager() = default;

    PackageManager(const PackageManager&) = delete;
    PackageManager& operator=(const PackageManager&) = delete;

    /**
     * @brief Installs packages that are not managed yet.
     * @throws core::ManagerError AlreadyInstalled if any package is already managed
     */
    virtual BatchContext install(const PackageSet& packages, core::IOInterface& io);

    /**
     * @brief Updates managed packages.
     * @throws core::ManagerError NotManaged if any package is not managed
     */
    virtual BatchContext update(const PackageSet& packages, core::IOInterface& io);

    /**
     * @brief Removes managed packages.
     * @throws core::ManagerError NotManaged if any package is not managed
     */
    virtual BatchContext remove(const PackageSet& packages, core::IOInterface& io);

    /**
     * @brief Puts an already present, unmanaged package under management.
     * Not supported by the base manager.
     */
    virtual void start_managing(const std::string& package, core::IOInterface& io);

    bool is_managed(const std::string& package) const;

    /**
     * @brief Managed packages with their installed versions.
     */
    PackageSet managed_packages() const;

    /**
     * @brief Splits "vendor/name:constraint" keys and replaces empty
     * constraints with "*".
     */
    PackageSet normalize_version(const PackageSet& packages) const;

    /**
     * @brief Builds a package set from command-line style requests,
     * "vendor/name" or "vendor/name:constraint".
     */
    static PackageSet parse_requests(const std::vector<std::string>& requests);

    const std::string& exception_prefix() const { return exceptionPrefix_; }
    const std::string& package_type() const { return packageType_; }

    // Hooks, no-ops by default
    virtual void pre_install(const PackageSet& packages, core::IOInterface& io, BatchContext& context);
    virtual void post_install(const PackageSet& packages, core::IOInterface& io, BatchContext& context);
    virtual void pre_update(const PackageSet& packages, core::IOInterface& io, BatchContext& context);
    virtual void post_update(const PackageSet& packages, core::IOInterface& io, BatchContext& context);
    virtual void pre_remove(const PackageSet& packages, core::IOInterface& io, BatchContext& context);
    virtual void post_remove(const PackageSet& packages, core::IOInterface& io, BatchContext& context);

protected:
    /**
     * @brief Joins package identifiers with '|' for error parameters.
     */
    static std::string join_ids(const std::vector<std::string>& ids);

    static std::vector<std::string> keys(const PackageSet& packages);

    std::shared_ptr<core::Installer> installer_;
    std::string packageType_;
    std::string exceptionPrefix_;
};

} // namespace extensions
} // namespace extmgr
