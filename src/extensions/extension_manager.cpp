#include "extmgr/extensions/extension_manager.hpp"

#include "extmgr/core/exceptions.hpp"
#include "extmgr/utils/logging.hpp"

namespace extmgr {
namespace extensions {

using core::ManagerErrc;
using core::ManagerError;
using core::Message;
using core::Verbosity;

ExtensionManager::ExtensionManager(std::shared_ptr<core::Installer> installer,
                                   std::shared_ptr<core::ExtensionRegistry> registry,
                                   std::shared_ptr<core::FilesystemOperator> filesystem,
                                   std::string packageType,
                                   std::string exceptionPrefix,
                                   std::string backupSuffix)
    : PackageManager(std::move(installer), std::move(packageType), std::move(exceptionPrefix))
    , registry_(std::move(registry))
    , filesystem_(std::move(filesystem))
    , backupSuffix_(std::move(backupSuffix)) {}

void ExtensionManager::pre_install(const PackageSet& packages, core::IOInterface&, BatchContext&) {
    const auto available = registry_->all_available();

    std::vector<std::string> installedManually;
    for (const auto& [package, constraint] : packages) {
        if (available.count(package) != 0) {
            installedManually.push_back(package);
        }
    }
    if (!installedManually.empty()) {
        throw ManagerError(exceptionPrefix_, ManagerErrc::AlreadyInstalledManually, {join_ids(installedManually)});
    }
}

void ExtensionManager::pre_update(const PackageSet& packages, core::IOInterface& io, BatchContext& context) {
    io.write_error("DISABLING_EXTENSIONS", true, Verbosity::Quiet);
    context.enabledExtensions.clear();

    for (const auto& [package, constraint] : packages) {
        try {
            if (registry_->is_enabled(package)) {
                context.enabledExtensions.push_back(package);
                registry_->disable(package);
            }
        } catch (const std::exception& e) {
            reportFailure(package, e, io, context);
        }
    }
}

void ExtensionManager::post_update(const PackageSet&, core::IOInterface& io, BatchContext& context) {
    io.write_error("ENABLING_EXTENSIONS", true, Verbosity::Quiet);

    for (const auto& package : context.enabledExtensions) {
        try {
            registry_->enable(package);
        } catch (const std::exception& e) {
            reportFailure(package, e, io, context);
        }
    }
}

BatchContext ExtensionManager::remove(const PackageSet& requested, core::IOInterface& io) {
    const PackageSet packages = normalize_version(requested);
    const auto available = registry_->all_available();

    std::vector<std::string> notInstalled;
    for (const auto& [package, constraint] : packages) {
        if (available.count(package) == 0) {
            notInstalled.push_back(package);
        }
    }
    if (!notInstalled.empty()) {
        throw ManagerError(exceptionPrefix_, ManagerErrc::NotInstalled, {join_ids(notInstalled)});
    }

    return PackageManager::remove(packages, io);
}

void ExtensionManager::pre_remove(const PackageSet& packages, core::IOInterface& io, BatchContext& context) {
    io.write_error("DISABLING_EXTENSIONS", true, Verbosity::Quiet);

    for (const auto& [package, constraint] : packages) {
        try {
            if (registry_->is_enabled(package)) {
                registry_->disable(package);
            }
        } catch (const std::exception& e) {
            reportFailure(package, e, io, context);
        }
    }
}

void ExtensionManager::start_managing(const std::string& package, core::IOInterface& io) {
    if (!registry_->is_available(package)) {
        throw ManagerError(exceptionPrefix_, ManagerErrc::NotInstalled, {package});
    }
    if (is_managed(package)) {
        throw ManagerError(exceptionPrefix_, ManagerErrc::AlreadyManaged, {package});
    }

    const std::string extensionPath = registry_->get_extension_path(package, true);
    const std::string backupPath = backup_path(package);
    if (filesystem_->exists(backupPath)) {
        throw ManagerError(exceptionPrefix_, ManagerErrc::CannotManageBackupExists, {package, backupPath});
    }
    EMLOG_DEBUG("Managing " + package + ": validated, backup path " + backupPath);

    // Disable failures propagate: continuing with a half-disabled extension is unsafe
    bool enabled = false;
    if (registry_->is_enabled(package)) {
        enabled = true;
        io.write_error("DISABLING_EXTENSION", true, Verbosity::Quiet);
        registry_->disable(package);
        EMLOG_DEBUG("Managing " + package + ": disabled");
    }

    try {
        filesystem_->rename(extensionPath, backupPath);
    } catch (const core::FilesystemError& e) {
        EMLOG_ERROR("Managing " + package + ": backup failed: " + e.what());
        if (enabled) {
            restoreEnabled(package, io);
        }
        throw ManagerError(exceptionPrefix_, ManagerErrc::CannotManageFilesystemError,
                           {package}, std::current_exception());
    }
    EMLOG_DEBUG("Managing " + package + ": backed up to " + backupPath);

    try {
        install(PackageSet{{package, "*"}}, io);
    } catch (const std::exception& e) {
        EMLOG_WARN("Managing " + package + ": install failed, restoring backup: " + e.what());
        auto installError = std::current_exception();
        try {
            filesystem_->rename(backupPath, extensionPath);
        } catch (const core::FilesystemError& restoreError) {
            EMLOG_CRITICAL("Managing " + package + ": cannot restore " + backupPath + ": " + restoreError.what());
            throw ManagerError(exceptionPrefix_, ManagerErrc::CannotManageRollbackError,
                               {package, backupPath}, installError);
        }
        if (enabled) {
            restoreEnabled(package, io);
        }
        throw ManagerError(exceptionPrefix_, ManagerErrc::CannotManageInstallError, {package}, installError);
    }
    EMLOG_DEBUG("Managing " + package + ": installed");

    // The package is installed from here on, later failures are not rolled back
    try {
        filesystem_->remove(backupPath);
    } catch (const core::FilesystemError& e) {
        EMLOG_ERROR("Managing " + package + ": managed, but backup " + backupPath + " remains: " + e.what());
        throw core::ManagedWithCleanError(exceptionPrefix_, package, backupPath, std::current_exception());
    }
    EMLOG_DEBUG("Managing " + package + ": backup removed");

    if (enabled) {
        try {
            io.write_error("ENABLING_EXTENSION", true, Verbosity::Quiet);
            registry_->enabling(package);
        } catch (const std::exception& e) {
            EMLOG_ERROR("Managing " + package + ": managed, but enabling failed: " + e.what());
            throw core::ManagedWithEnableError(exceptionPrefix_, package, std::current_exception());
        }
        EMLOG_DEBUG("Managing " + package + ": enabled");
    }

    EMLOG_INFO("Extension " + package + " is now managed");
}

std::string ExtensionManager::backup_path(const std::string& package) const {
    std::string path = registry_->get_extension_path(package, false);
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path + backupSuffix_;
}

void ExtensionManager::restoreEnabled(const std::string& package, core::IOInterface& io) {
    try {
        io.write_error("ENABLING_EXTENSION", true, Verbosity::Quiet);
        registry_->enable(package);
        EMLOG_DEBUG("Managing " + package + ": enabled again after rollback");
    } catch (const std::exception& e) {
        // The caller raises the error that started the rollback
        EMLOG_ERROR("Managing " + package + ": cannot enable again after rollback: " + e.what());
        if (auto domainError = dynamic_cast<const core::Exception*>(&e)) {
            io.write_error(Message(domainError->message_key(), domainError->parameters()), true, Verbosity::Quiet);
        } else {
            io.write_error(Message(e.what()), true, Verbosity::Quiet);
        }
    }
}

void ExtensionManager::reportFailure(const std::string& package,
                                     const std::exception& error,
                                     core::IOInterface& io,
                                     BatchContext& context) const {
    if (auto domainError = dynamic_cast<const core::Exception*>(&error)) {
        io.write_error(Message(domainError->message_key(), domainError->parameters()), true, Verbosity::Verbose);
        context.failures.push_back({package, domainError->message_key(), domainError->parameters()});
    } else {
        io.write_error(Message(error.what()), true, Verbosity::Verbose);
        context.failures.push_back({package, error.what(), {}});
    }
    EMLOG_WARN("Extension " + package + ": " + error.what());
}

} // namespace extensions
} // namespace extmgr
