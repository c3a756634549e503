#include "extmgr/core/filesystem.hpp"

#include <filesystem>
#include <system_error>

#include "extmgr/core/exceptions.hpp"

namespace extmgr {
namespace core {

namespace fs = std::filesystem;

namespace {
    // std::filesystem treats "dir/" and "dir" differently for rename
    fs::path normalize(const std::string& path) {
        fs::path p(path);
        if (!p.has_filename() && p.has_parent_path()) {
            p = p.parent_path();
        }
        return p;
    }
}

void LocalFilesystem::rename(const std::string& source, const std::string& destination) {
    const fs::path from = normalize(source);
    const fs::path to = normalize(destination);

    std::error_code ec;
    if (fs::exists(to, ec)) {
        throw FilesystemError("FILESYSTEM_DESTINATION_EXISTS", {from.string(), to.string()});
    }

    fs::rename(from, to, ec);
    if (ec) {
        throw FilesystemError("FILESYSTEM_CANNOT_RENAME", {from.string(), to.string(), ec.message()});
    }
}

void LocalFilesystem::remove(const std::string& path) {
    const fs::path target = normalize(path);

    std::error_code ec;
    fs::remove_all(target, ec);
    if (ec) {
        throw FilesystemError("FILESYSTEM_CANNOT_REMOVE", {target.string(), ec.message()});
    }
}

void LocalFilesystem::copy(const std::string& source, const std::string& destination) {
    const fs::path from = normalize(source);
    const fs::path to = normalize(destination);

    std::error_code ec;
    if (to.has_parent_path()) {
        fs::create_directories(to.parent_path(), ec);
    }
    if (!ec) {
        fs::copy(from, to, fs::copy_options::recursive, ec);
    }
    if (ec) {
        throw FilesystemError("FILESYSTEM_CANNOT_COPY", {from.string(), to.string(), ec.message()});
    }
}

bool LocalFilesystem::exists(const std::string& path) const {
    std::error_code ec;
    return fs::exists(normalize(path), ec);
}

} // namespace core
} // namespace extmgr
