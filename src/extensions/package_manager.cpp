#include "extmgr/extensions/package_manager.hpp"

#include "extmgr/core/exceptions.hpp"
#include "extmgr/utils/logging.hpp"

namespace extmgr {
namespace extensions {

using core::ManagerErrc;
using core::ManagerError;
using core::Verbosity;

PackageManager::PackageManager(std::shared_ptr<core::Installer> installer,
                               std::string packageType,
                               std::string exceptionPrefix)
    : installer_(std::move(installer))
    , packageType_(std::move(packageType))
    , exceptionPrefix_(std::move(exceptionPrefix)) {}

BatchContext PackageManager::install(const PackageSet& requested, core::IOInterface& io) {
    const PackageSet packages = normalize_version(requested);
    const PackageSet managed = managed_packages();

    std::vector<std::string> alreadyManaged;
    for (const auto& [package, constraint] : packages) {
        if (managed.count(package) != 0) {
            alreadyManaged.push_back(package);
        }
    }
    if (!alreadyManaged.empty()) {
        throw ManagerError(exceptionPrefix_, ManagerErrc::AlreadyInstalled, {join_ids(alreadyManaged)});
    }

    BatchContext context;
    pre_install(packages, io, context);

    EMLOG_DEBUG("Installing " + join_ids(keys(packages)));
    io.write_error("INSTALLING_PACKAGES", true, Verbosity::Quiet);
    installer_->install(packages, io);

    post_install(packages, io, context);
    return context;
}

BatchContext PackageManager::update(const PackageSet& requested, core::IOInterface& io) {
    const PackageSet packages = normalize_version(requested);
    const PackageSet managed = managed_packages();

    std::vector<std::string> notManaged;
    for (const auto& [package, constraint] : packages) {
        if (managed.count(package) == 0) {
            notManaged.push_back(package);
        }
    }
    if (!notManaged.empty()) {
        throw ManagerError(exceptionPrefix_, ManagerErrc::NotManaged, {join_ids(notManaged)});
    }

    BatchContext context;
    pre_update(packages, io, context);

    EMLOG_DEBUG("Updating " + join_ids(keys(packages)));
    io.write_error("UPDATING_PACKAGES", true, Verbosity::Quiet);
    installer_->update(packages, io);

    post_update(packages, io, context);
    return context;
}

BatchContext PackageManager::remove(const PackageSet& requested, core::IOInterface& io) {
    const PackageSet packages = normalize_version(requested);
    const PackageSet managed = managed_packages();

    std::vector<std::string> notManaged;
    for (const auto& [package, constraint] : packages) {
        if (managed.count(package) == 0) {
            notManaged.push_back(package);
        }
    }
    if (!notManaged.empty()) {
        throw ManagerError(exceptionPrefix_, ManagerErrc::NotManaged, {join_ids(notManaged)});
    }

    BatchContext context;
    pre_remove(packages, io, context);

    EMLOG_DEBUG("Removing " + join_ids(keys(packages)));
    io.write_error("REMOVING_PACKAGES", true, Verbosity::Quiet);
    installer_->remove(keys(packages), io);

    post_remove(packages, io, context);
    return context;
}

void PackageManager::start_managing(const std::string& package, core::IOInterface&) {
    throw ManagerError(exceptionPrefix_, ManagerErrc::NotSupported, {package});
}

bool PackageManager::is_managed(const std::string& package) const {
    return managed_packages().count(package) != 0;
}

PackageSet PackageManager::managed_packages() const {
    return installer_->installed_packages();
}

PackageSet PackageManager::normalize_version(const PackageSet& packages) const {
    PackageSet normalized;
    for (const auto& [key, value] : packages) {
        std::string package = key;
        std::string constraint = value;

        auto colon = key.find(':');
        if (colon != std::string::npos) {
            package = key.substr(0, colon);
            if (constraint.empty() || constraint == "*") {
                constraint = key.substr(colon + 1);
            }
        }
        if (constraint.empty()) {
            constraint = "*";
        }
        normalized[package] = constraint;
    }
    return normalized;
}

PackageSet PackageManager::parse_requests(const std::vector<std::string>& requests) {
    PackageSet packages;
    for (const auto& request : requests) {
        auto colon = request.find(':');
        if (colon == std::string::npos) {
            packages[request] = "*";
        } else {
            packages[request.substr(0, colon)] = request.substr(colon + 1);
        }
    }
    return packages;
}

void PackageManager::pre_install(const PackageSet&, core::IOInterface&, BatchContext&) {}
void PackageManager::post_install(const PackageSet&, core::IOInterface&, BatchContext&) {}
void PackageManager::pre_update(const PackageSet&, core::IOInterface&, BatchContext&) {}
void PackageManager::post_update(const PackageSet&, core::IOInterface&, BatchContext&) {}
void PackageManager::pre_remove(const PackageSet&, core::IOInterface&, BatchContext&) {}
void PackageManager::post_remove(const PackageSet&, core::IOInterface&, BatchContext&) {}

std::string PackageManager::join_ids(const std::vector<std::string>& ids) {
    std::string joined;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) joined += '|';
        joined += ids[i];
    }
    return joined;
}

std::vector<std::string> PackageManager::keys(const PackageSet& packages) {
    std::vector<std::string> ids;
    ids.reserve(packages.size());
    for (const auto& [package, constraint] : packages) {
        ids.push_back(package);
    }
    return ids;
}

} // namespace extensions
} // namespace extmgr
