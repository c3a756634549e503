#ifndef EXTMGR_CORE_FILESYSTEM_HPP
#define EXTMGR_CORE_FILESYSTEM_HPP

#include <string>

namespace extmgr {
namespace core {

/**
 * @brief Directory-level filesystem operations used by the managers.
 *
 * Every failing operation throws FilesystemError.
 */
class FilesystemOperator {
public:
    virtual ~FilesystemOperator() = default;

    /**
     * @brief Renames @p source to @p destination. Fails if the destination exists.
     */
    virtual void rename(const std::string& source, const std::string& destination) = 0;

    /**
     * @brief Removes a file or a directory tree. Removing a missing path is a no-op.
     */
    virtual void remove(const std::string& path) = 0;

    /**
     * @brief Recursively copies a directory tree.
     */
    virtual void copy(const std::string& source, const std::string& destination) = 0;

    virtual bool exists(const std::string& path) const = 0;
};

/**
 * @brief FilesystemOperator backed by std::filesystem.
 */
class LocalFilesystem : public FilesystemOperator {
public:
    void rename(const std::string& source, const std::string& destination) override;
    void remove(const std::string& path) override;
    void copy(const std::string& source, const std::string& destination) override;
    bool exists(const std::string& path) const override;
};

} // namespace core
} // namespace extmgr

#endif // EXTMGR_CORE_FILESYSTEM_HPP
