#pragma once

#include <memory>
#include <string>
#include "extmgr/core/extension_registry.hpp"
#include "extmgr/core/filesystem.hpp"
#include "extmgr/extensions/package_manager.hpp"

namespace extmgr {
namespace extensions {

/**
 * @brief Package manager for extensions.
 *
 * Keeps installer operations consistent with the extension registry:
 * - refuses to install over extensions that were installed manually
 * - disables extensions around updates and re-enables the ones that were enabled
 * - disables extensions before they are removed
 * - moves a manually installed extension under management, with a backup of
 *   its directory that is restored if the installation fails
 *
 * Instances are not safe for concurrent use; run one operation at a time.
 */
class ExtensionManager : public PackageManager {
public:
    static constexpr const char* kDefaultBackupSuffix = "__backup__";

    /**
     * @param installer Backend doing the file work
     * @param registry Registry of extensions present on disk
     * @param filesystem Used for the backup rename/remove of start_managing()
     * @param packageType Type of the packages this manager handles
     * @param exceptionPrefix Prefix of raised error keys
     * @param backupSuffix Appended to the extension path to form its backup path
     */
    ExtensionManager(std::shared_ptr<core::Installer> installer,
                     std::shared_ptr<core::ExtensionRegistry> registry,
                     std::shared_ptr<core::FilesystemOperator> filesystem,
                     std::string packageType,
                     std::string exceptionPrefix,
                     std::string backupSuffix = kDefaultBackupSuffix);

    /**
     * @brief Validates that none of the packages exists on disk, then removes
     * them through the installer.
     * @throws core::ManagerError NotInstalled listing the missing extensions
     */
    BatchContext remove(const PackageSet& packages, core::IOInterface& io) override;

    /**
     * @brief Moves an extension that was installed manually under management.
     *
     * The extension directory is renamed to its backup path, the package is
     * installed, then the backup is deleted. A previously enabled extension is
     * disabled for the duration and enabled again at the end, or after the
     * files were restored when the migration is rolled back. A failure to
     * enable it again during a rollback is logged and written to @p io; the
     * error that caused the rollback is the one raised.
     *
     * @throws core::ManagerError NotInstalled, AlreadyManaged,
     *         CannotManageBackupExists: nothing was changed
     * @throws core::ManagerError CannotManageFilesystemError: the backup could
     *         not be made, the extension is left as it was
     * @throws core::ManagerError CannotManageInstallError: install failed, the
     *         extension files and enabled state were restored
     * @throws core::ManagerError CannotManageRollbackError: install failed and
     *         the files could not be restored, they remain at the backup path
     *         and the extension stays disabled
     * @throws core::ManagedWithCleanError managed, the backup directory remains
     * @throws core::ManagedWithEnableError managed, but left disabled
     */
    void start_managing(const std::string& package, core::IOInterface& io) override;

    /**
     * @brief Path the extension directory is moved to during start_managing().
     */
    std::string backup_path(const std::string& package) const;

    void pre_install(const PackageSet& packages, core::IOInterface& io, BatchContext& context) override;
    void pre_update(const PackageSet& packages, core::IOInterface& io, BatchContext& context) override;
    void post_update(const PackageSet& packages, core::IOInterface& io, BatchContext& context) override;
    void pre_remove(const PackageSet& packages, core::IOInterface& io, BatchContext& context) override;

private:
    /**
     * @brief Enables an extension again after a rolled back migration.
     * Failures are logged and written to @p io, never thrown.
     */
    void restoreEnabled(const std::string& package, core::IOInterface& io);

    /**
     * @brief Writes a swallowed per-item error to the io sink and records it.
     */
    void reportFailure(const std::string& package,
                       const std::exception& error,
                       core::IOInterface& io,
                       BatchContext& context) const;

    std::shared_ptr<core::ExtensionRegistry> registry_;
    std::shared_ptr<core::FilesystemOperator> filesystem_;
    std::string backupSuffix_;
};

} // namespace extensions
} // namespace extmgr
