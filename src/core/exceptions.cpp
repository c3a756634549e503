#include "extmgr/core/exceptions.hpp"

#include <utility>

namespace extmgr {
namespace core {

namespace {
    std::string describe(const std::string& key, const std::vector<std::string>& parameters) {
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
}

Exception::Exception(const std::string& messageKey,
                     std::vector<std::string> parameters,
                     std::exception_ptr previous)
    : std::runtime_error(describe(messageKey, parameters))
    , messageKey_(messageKey)
    , parameters_(std::move(parameters))
    , previous_(std::move(previous)) {}

std::string Exception::previous_message() const {
    if (!previous_) {
        return {};
    }
    try {
        std::rethrow_exception(previous_);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

const char* to_message_key(ManagerErrc code) noexcept {
    switch (code) {
        case ManagerErrc::AlreadyInstalled:            return "ALREADY_INSTALLED";
        case ManagerErrc::AlreadyInstalledManually:    return "ALREADY_INSTALLED_MANUALLY";
        case ManagerErrc::NotInstalled:                return "NOT_INSTALLED";
        case ManagerErrc::NotManaged:                  return "NOT_MANAGED";
        case ManagerErrc::AlreadyManaged:              return "ALREADY_MANAGED";
        case ManagerErrc::CannotManageFilesystemError: return "CANNOT_MANAGE_FILESYSTEM_ERROR";
        case ManagerErrc::CannotManageInstallError:    return "CANNOT_MANAGE_INSTALL_ERROR";
        case ManagerErrc::CannotManageBackupExists:    return "CANNOT_MANAGE_BACKUP_EXISTS";
        case ManagerErrc::CannotManageRollbackError:   return "CANNOT_MANAGE_ROLLBACK_ERROR";
        case ManagerErrc::ManagedWithCleanError:       return "MANAGED_WITH_CLEAN_ERROR";
        case ManagerErrc::ManagedWithEnableError:      return "MANAGED_WITH_ENABLE_ERROR";
        case ManagerErrc::InstallFailed:               return "INSTALL_FAILED";
        case ManagerErrc::PackageNotFound:             return "PACKAGE_NOT_FOUND";
        case ManagerErrc::NotSupported:                return "NOT_SUPPORTED";
    }
    return "UNKNOWN_ERROR";
}

ManagerError::ManagerError(const std::string& prefix,
                           ManagerErrc code,
                           std::vector<std::string> parameters,
                           std::exception_ptr previous)
    : Exception(prefix + to_message_key(code), std::move(parameters), std::move(previous))
    , code_(code) {}

ManagedWithCleanError::ManagedWithCleanError(const std::string& prefix,
                                             const std::string& extension,
                                             const std::string& backupPath,
                                             std::exception_ptr previous)
    : ManagedWithError(prefix, ManagerErrc::ManagedWithCleanError,
                       {extension, backupPath}, std::move(previous)) {}

ManagedWithEnableError::ManagedWithEnableError(const std::string& prefix,
                                               const std::string& extension,
                                               std::exception_ptr previous)
    : ManagedWithError(prefix, ManagerErrc::ManagedWithEnableError,
                       {extension}, std::move(previous)) {}

} // namespace core
} // namespace extmgr
