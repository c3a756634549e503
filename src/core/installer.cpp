#include "extmgr/core/installer.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <openssl/evp.h>

#include "extmgr/core/exceptions.hpp"
#include "extmgr/core/extension_registry.hpp"
#include "extmgr/utils/logging.hpp"

namespace extmgr {
namespace core {

namespace fs = std::filesystem;

namespace {
    const char* kStagingSuffix = "__staging__";
    const char* kPreviousSuffix = "__previous__";

    std::string toHex(const unsigned char* data, unsigned int length) {
        std::stringstream ss;
        for (unsigned int i = 0; i < length; i++) {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
        }
        return ss.str();
    }

    std::string trimTrailingSeparator(std::string path) {
        while (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
        return path;
    }
}

LocalRepositoryInstaller::LocalRepositoryInstaller(std::string repository,
                                                   std::string target,
                                                   std::string manifestPath,
                                                   std::string packageType,
                                                   std::string exceptionPrefix,
                                                   std::shared_ptr<FilesystemOperator> filesystem)
    : repository_(std::move(repository))
    , target_(std::move(target))
    , manifestPath_(std::move(manifestPath))
    , packageType_(std::move(packageType))
    , exceptionPrefix_(std::move(exceptionPrefix))
    , filesystem_(std::move(filesystem)) {}

PackageSet LocalRepositoryInstaller::installed_packages() const {
    PackageSet installed;
    for (const auto& [name, entry] : loadManifest()) {
        installed[name] = entry.version;
    }
    return installed;
}

void LocalRepositoryInstaller::install(const PackageSet& packages, IOInterface& io) {
    auto manifest = loadManifest();

    for (const auto& [package, constraint] : packages) {
        Candidate candidate = resolve(package, constraint);

        if (manifest.count(package) == 0 && filesystem_->exists(targetPath(package))) {
            throw ManagerError(exceptionPrefix_, ManagerErrc::InstallFailed,
                               {package, "target directory exists and is not managed"});
        }

        io.write_error(Message("INSTALLING_PACKAGE", {package, candidate.versionText}), true, Verbosity::Normal);
        put(package, candidate, manifest);
    }
}

void LocalRepositoryInstaller::update(const PackageSet& packages, IOInterface& io) {
    auto manifest = loadManifest();

    for (const auto& [package, constraint] : packages) {
        auto it = manifest.find(package);
        if (it == manifest.end()) {
            throw ManagerError(exceptionPrefix_, ManagerErrc::InstallFailed, {package, "not installed"});
        }

        Candidate candidate = resolve(package, constraint);
        if (candidate.versionText == it->second.version) {
            EMLOG_DEBUG("Package " + package + " is already at " + candidate.versionText);
            continue;
        }

        io.write_error(Message("UPDATING_PACKAGE", {package, it->second.version, candidate.versionText}),
                       true, Verbosity::Normal);
        put(package, candidate, manifest);
    }
}

void LocalRepositoryInstaller::remove(const std::vector<std::string>& packages, IOInterface& io) {
    auto manifest = loadManifest();

    for (const auto& package : packages) {
        auto it = manifest.find(package);
        if (it == manifest.end()) {
            throw ManagerError(exceptionPrefix_, ManagerErrc::InstallFailed, {package, "not installed"});
        }

        io.write_error(Message("REMOVING_PACKAGE", {package, it->second.version}), true, Verbosity::Normal);
        try {
            filesystem_->remove(targetPath(package));
        } catch (const FilesystemError& e) {
            throw ManagerError(exceptionPrefix_, ManagerErrc::InstallFailed,
                               {package, e.what()}, std::current_exception());
        }

        manifest.erase(it);
        saveManifest(manifest);
    }
}

std::vector<Version> LocalRepositoryInstaller::available_versions(const std::string& package) const {
    std::vector<Version> versions;
    const fs::path base = fs::path(repository_) / package;

    std::error_code ec;
    if (!fs::is_directory(base, ec)) {
        return versions;
    }
    for (const auto& entry : fs::directory_iterator(base, ec)) {
        if (!entry.is_directory()) continue;
        try {
            versions.push_back(Version::parse(entry.path().filename().string()));
        } catch (const std::invalid_argument&) {
            EMLOG_DEBUG("Ignoring non-version directory " + entry.path().string());
        }
    }
    std::sort(versions.begin(), versions.end());
    return versions;
}

bool LocalRepositoryInstaller::verify(const std::string& package) const {
    auto entry = manifest_entry(package);
    if (!entry) {
        return false;
    }
    std::error_code ec;
    if (!fs::is_directory(targetPath(package), ec)) {
        return false;
    }
    return checksum_tree(targetPath(package)) == entry->checksum;
}

std::optional<ManifestEntry> LocalRepositoryInstaller::manifest_entry(const std::string& package) const {
    auto manifest = loadManifest();
    auto it = manifest.find(package);
    if (it == manifest.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string LocalRepositoryInstaller::checksum_tree(const std::string& directory) {
    const fs::path root = trimTrailingSeparator(directory);

    std::vector<fs::path> files;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            files.push_back(fs::relative(entry.path(), root));
        }
    }
    std::sort(files.begin(), files.end());

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
        throw std::runtime_error("Failed to allocate digest context");
    }
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);

    std::vector<char> buffer(64 * 1024);
    for (const auto& relative : files) {
        const std::string name = relative.generic_string();
        EVP_DigestUpdate(ctx, name.c_str(), name.size() + 1);

        std::ifstream file(root / relative, std::ios::binary);
        if (!file.is_open()) {
            EVP_MD_CTX_free(ctx);
            throw std::runtime_error("Failed to open file for hashing: " + (root / relative).string());
        }
        while (file) {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            if (file.gcount() > 0) {
                EVP_DigestUpdate(ctx, buffer.data(), static_cast<size_t>(file.gcount()));
            }
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    EVP_DigestFinal_ex(ctx, hash, &hashLen);
    EVP_MD_CTX_free(ctx);

    return toHex(hash, hashLen);
}

LocalRepositoryInstaller::Candidate LocalRepositoryInstaller::resolve(const std::string& package,
                                                                      const std::string& constraintText) const {
    VersionConstraint constraint;
    try {
        constraint = VersionConstraint::parse(constraintText);
    } catch (const std::invalid_argument& e) {
        throw ManagerError(exceptionPrefix_, ManagerErrc::InstallFailed, {package, e.what()});
    }

    std::optional<Candidate> best;
    const fs::path base = fs::path(repository_) / package;
    std::error_code ec;
    if (fs::is_directory(base, ec)) {
        for (const auto& entry : fs::directory_iterator(base, ec)) {
            if (!entry.is_directory()) continue;

            Version version;
            try {
                version = Version::parse(entry.path().filename().string());
            } catch (const std::invalid_argument&) {
                continue;
            }
            if (!constraint.matches(version)) continue;
            if (best && !(best->version < version)) continue;

            ExtensionMetadata metadata;
            try {
                std::ifstream file(entry.path() / DirectoryExtensionRegistry::kMetadataFile);
                if (!file.is_open()) continue;
                nlohmann::json data;
                file >> data;
                metadata = ExtensionMetadata::from_json(data);
            } catch (const nlohmann::json::exception& e) {
                EMLOG_WARN("Ignoring " + entry.path().string() + ": " + e.what());
                continue;
            }
            if (metadata.name != package || metadata.type != packageType_) {
                EMLOG_DEBUG("Ignoring " + entry.path().string() + ": not a " + packageType_ + " named " + package);
                continue;
            }

            best = Candidate{version, entry.path().filename().string(), entry.path().string()};
        }
    }

    if (!best) {
        throw ManagerError(exceptionPrefix_, ManagerErrc::PackageNotFound, {package, constraint.toString()});
    }
    return *best;
}

void LocalRepositoryInstaller::put(const std::string& package,
                                   const Candidate& candidate,
                                   std::map<std::string, ManifestEntry>& manifest) {
    const std::string target = trimTrailingSeparator(targetPath(package));
    const std::string staging = target + kStagingSuffix;
    const std::string previous = target + kPreviousSuffix;

    std::string checksum;
    try {
        filesystem_->remove(staging);
        filesystem_->copy(candidate.path, staging);

        checksum = checksum_tree(staging);
        if (checksum != checksum_tree(candidate.path)) {
            throw ManagerError(exceptionPrefix_, ManagerErrc::InstallFailed, {package, "checksum mismatch"});
        }

        if (manifest.count(package) != 0 && filesystem_->exists(target)) {
            filesystem_->remove(previous);
            filesystem_->rename(target, previous);
            try {
                filesystem_->rename(staging, target);
            } catch (const std::exception&) {
                filesystem_->rename(previous, target);
                throw;
            }
            filesystem_->remove(previous);
        } else {
            filesystem_->rename(staging, target);
        }
    } catch (const ManagerError&) {
        discardStaging(staging);
        throw;
    } catch (const std::exception& e) {
        // FilesystemError, fs::filesystem_error and checksum read failures
        discardStaging(staging);
        throw ManagerError(exceptionPrefix_, ManagerErrc::InstallFailed,
                           {package, e.what()}, std::current_exception());
    }

    manifest[package] = ManifestEntry{candidate.versionText, checksum};
    saveManifest(manifest);
    EMLOG_INFO("Installed " + package + " " + candidate.versionText);
}

void LocalRepositoryInstaller::discardStaging(const std::string& staging) {
    try {
        filesystem_->remove(staging);
    } catch (const FilesystemError& e) {
        EMLOG_WARN("Cannot remove staging directory " + staging + ": " + e.what());
    }
}

std::string LocalRepositoryInstaller::targetPath(const std::string& package) const {
    return (fs::path(target_) / package).string() + "/";
}

std::map<std::string, ManifestEntry> LocalRepositoryInstaller::loadManifest() const {
    std::map<std::string, ManifestEntry> manifest;

    std::error_code ec;
    if (!fs::exists(manifestPath_, ec)) {
        return manifest;
    }

    try {
        std::ifstream file(manifestPath_);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open for reading");
        }
        nlohmann::json data;
        file >> data;
        for (const auto& [name, entry] : data.at("packages").items()) {
            manifest[name] = ManifestEntry{
                entry.at("version").get<std::string>(),
                entry.value("checksum", std::string())
            };
        }
    } catch (const std::exception& e) {
        throw ManagerError(exceptionPrefix_, ManagerErrc::InstallFailed, {manifestPath_, e.what()});
    }
    return manifest;
}

void LocalRepositoryInstaller::saveManifest(const std::map<std::string, ManifestEntry>& manifest) const {
    nlohmann::json data;
    data["packages"] = nlohmann::json::object();
    for (const auto& [name, entry] : manifest) {
        data["packages"][name] = {{"version", entry.version}, {"checksum", entry.checksum}};
    }

    const fs::path target(manifestPath_);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }

    std::ofstream file(manifestPath_);
    if (!file.is_open()) {
        throw ManagerError(exceptionPrefix_, ManagerErrc::InstallFailed, {manifestPath_, "cannot open for writing"});
    }
    file << data.dump(2);
}

} // namespace core
} // namespace extmgr
