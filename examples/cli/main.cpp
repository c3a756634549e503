#include "extmgr/core/exceptions.hpp"
#include "extmgr/core/extension_registry.hpp"
#include "extmgr/core/filesystem.hpp"
#include "extmgr/core/installer.hpp"
#include "extmgr/core/manager_config.hpp"
#include "extmgr/extensions/extension_manager.hpp"
#include "extmgr/utils/logging.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace extmgr;

namespace {

void printUsage() {
    std::cout << "Usage: extmgr [--config FILE] [-v|-q] <command> [arguments]\n"
              << "\n"
              << "Commands:\n"
              << "  list                          List extensions found on disk\n"
              << "  install <pkg[:constraint]>... Install packages\n"
              << "  update <pkg[:constraint]>...  Update managed packages\n"
              << "  remove <pkg>...               Remove managed packages\n"
              << "  manage <pkg>                  Put a manually installed extension under management\n";
}

void flush(core::BufferedIO& io) {
    for (const auto& line : io.lines()) {
        std::cout << line << "\n";
    }
    io.clear();
}

void printFailures(const extensions::BatchContext& context, const core::MessageCatalog& catalog) {
    for (const auto& failure : context.failures) {
        std::cerr << "warning: " << failure.package << ": "
                  << catalog.translate(failure.messageKey, failure.parameters) << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = "extmgr.json";
    std::optional<core::Verbosity> verbosityOverride;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "-v") {
            verbosityOverride = core::Verbosity::Verbose;
        } else if (arg == "-q") {
            verbosityOverride = core::Verbosity::Quiet;
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        printUsage();
        return 1;
    }

    core::ManagerConfig config;
    auto loaded = core::load_config(configPath);
    if (loaded) {
        config = loaded.value();
    } else if (configPath != "extmgr.json") {
        std::cerr << "error: " << loaded.error() << "\n";
        return 1;
    }
    if (verbosityOverride) {
        config.verbosity = *verbosityOverride;
    }

    try {
        utils::configure_logging(config.logging);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "error: cannot configure logging: " << e.what() << "\n";
        return 1;
    }

    auto catalog = core::MessageCatalog::defaults();
    if (!config.messagesPath.empty()) {
        auto merged = catalog.merge_file(config.messagesPath);
        if (!merged) {
            std::cerr << "warning: " << merged.error() << "\n";
        }
    }
    core::BufferedIO io(catalog, config.verbosity);

    core::Version hostVersion;
    try {
        hostVersion = core::Version::parse(config.hostVersion);
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: host_version: " << e.what() << "\n";
        return 1;
    }

    auto filesystem = std::make_shared<core::LocalFilesystem>();
    auto registry = std::make_shared<core::DirectoryExtensionRegistry>(
        config.extensionsRoot, config.statePath, hostVersion);
    auto installer = std::make_shared<core::LocalRepositoryInstaller>(
        config.repositoryPath, config.extensionsRoot, config.manifestPath,
        config.packageType, config.exceptionPrefix, filesystem);
    extensions::ExtensionManager manager(installer, registry, filesystem,
                                         config.packageType, config.exceptionPrefix,
                                         config.backupSuffix);

    const std::string command = args[0];
    const std::vector<std::string> operands(args.begin() + 1, args.end());

    try {
        if (command == "list") {
            const auto managed = manager.managed_packages();
            for (const auto& [id, metadata] : registry->all_available()) {
                std::cout << id << " " << metadata.version
                          << (registry->is_enabled(id) ? " enabled" : " disabled")
                          << (managed.count(id) ? " managed" : " manual") << "\n";
            }
            return 0;
        }

        if (operands.empty()) {
            printUsage();
            return 1;
        }

        const auto packages = extensions::PackageManager::parse_requests(operands);
        if (command == "install") {
            auto context = manager.install(packages, io);
            flush(io);
            printFailures(context, catalog);
        } else if (command == "update") {
            auto context = manager.update(packages, io);
            flush(io);
            printFailures(context, catalog);
        } else if (command == "remove") {
            auto context = manager.remove(packages, io);
            flush(io);
            printFailures(context, catalog);
        } else if (command == "manage") {
            if (operands.size() != 1) {
                printUsage();
                return 1;
            }
            manager.start_managing(operands[0], io);
            flush(io);
        } else {
            printUsage();
            return 1;
        }
    } catch (const core::ManagedWithError& e) {
        flush(io);
        std::cerr << "warning: " << catalog.translate(e.message_key(), e.parameters()) << "\n";
        return 2;
    } catch (const core::Exception& e) {
        flush(io);
        std::cerr << "error: " << catalog.translate(e.message_key(), e.parameters()) << "\n";
        if (e.previous()) {
            std::cerr << "  caused by: " << e.previous_message() << "\n";
        }
        return 1;
    } catch (const std::exception& e) {
        flush(io);
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
