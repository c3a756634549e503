#ifndef EXTMGR_CORE_EXCEPTIONS_HPP
#define EXTMGR_CORE_EXCEPTIONS_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace extmgr {
namespace core {

/**
 * @brief Base of all extmgr errors.
 *
 * Carries a message key (translated by a MessageCatalog for display), the
 * structured parameters of the message, and optionally the exception that
 * caused it.
 */
class Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& messageKey,
                       std::vector<std::string> parameters = {},
                       std::exception_ptr previous = nullptr);

    const std::string& message_key() const noexcept { return messageKey_; }
    const std::vector<std::string>& parameters() const noexcept { return parameters_; }

    /**
     * @brief The wrapped cause, or nullptr.
     */
    std::exception_ptr previous() const noexcept { return previous_; }

    /**
     * @brief what() of the wrapped cause, empty when there is none.
     */
    std::string previous_message() const;

private:
    std::string messageKey_;
    std::vector<std::string> parameters_;
    std::exception_ptr previous_;
};

/**
 * @brief Raised by a FilesystemOperator when a rename, remove or copy fails.
 */
class FilesystemError : public Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Raised by an ExtensionRegistry (enable, disable, path lookup).
 */
class ExtensionError : public Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Error codes of the package manager family and installer backend.
 */
enum class ManagerErrc {
    AlreadyInstalled,
    AlreadyInstalledManually,
    NotInstalled,
    NotManaged,
    AlreadyManaged,
    CannotManageFilesystemError,
    CannotManageInstallError,
    CannotManageBackupExists,
    CannotManageRollbackError,
    ManagedWithCleanError,
    ManagedWithEnableError,
    InstallFailed,
    PackageNotFound,
    NotSupported
};

/**
 * @brief Message key suffix of a code, e.g. "NOT_INSTALLED".
 */
const char* to_message_key(ManagerErrc code) noexcept;

/**
 * @brief Raised by package managers. The message key is the manager's
 * exception prefix followed by the code key, e.g. "EXTENSIONS_NOT_INSTALLED".
 */
class ManagerError : public Exception {
public:
    ManagerError(const std::string& prefix,
                 ManagerErrc code,
                 std::vector<std::string> parameters = {},
                 std::exception_ptr previous = nullptr);

    ManagerErrc code() const noexcept { return code_; }

private:
    ManagerErrc code_;
};

/**
 * @brief The package is installed and managed, but a follow-up step failed
 * and needs manual remediation.
 */
class ManagedWithError : public ManagerError {
public:
    using ManagerError::ManagerError;
};

/**
 * @brief Managed, but the backup directory could not be removed.
 * Parameters: extension id, backup path.
 */
class ManagedWithCleanError : public ManagedWithError {
public:
    ManagedWithCleanError(const std::string& prefix,
                          const std::string& extension,
                          const std::string& backupPath,
                          std::exception_ptr previous = nullptr);

    const std::string& backup_path() const noexcept { return parameters().at(1); }
};

/**
 * @brief Managed, but the extension could not be enabled again.
 * Parameters: extension id.
 */
class ManagedWithEnableError : public ManagedWithError {
public:
    ManagedWithEnableError(const std::string& prefix,
                           const std::string& extension,
                           std::exception_ptr previous = nullptr);
};

} // namespace core
} // namespace extmgr

#endif // EXTMGR_CORE_EXCEPTIONS_HPP
