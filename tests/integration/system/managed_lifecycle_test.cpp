#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "extmgr/core/exceptions.hpp"
#include "extmgr/core/extension_registry.hpp"
#include "extmgr/core/filesystem.hpp"
#include "extmgr/core/installer.hpp"
#include "extmgr/extensions/extension_manager.hpp"

using namespace extmgr;
using namespace extmgr::extensions;
namespace fs = std::filesystem;

namespace {

// Local filesystem whose remove() fails for one path
class FailingRemoveFilesystem : public core::LocalFilesystem {
public:
    void remove(const std::string& path) override {
        if (!failPath_.empty() && path == failPath_) {
            throw core::FilesystemError("FILESYSTEM_CANNOT_REMOVE", {path, "permission denied"});
        }
        core::LocalFilesystem::remove(path);
    }

    void fail_on(const std::string& path) { failPath_ = path; }

private:
    std::string failPath_;
};

std::string readFile(const fs::path& path) {
    std::ifstream file(path);
    std::string content;
    file >> content;
    return content;
}

} // namespace

class ManagedLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / (std::string("extmgr_lifecycle_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(testDir_);
        root_ = testDir_ / "ext";
        repository_ = testDir_ / "repository";
        fs::create_directories(root_);
        fs::create_directories(repository_);

        registry_ = std::make_shared<core::DirectoryExtensionRegistry>(
            root_.string(), (testDir_ / "state.json").string(), core::Version(3, 3, 0));
        installer_ = std::make_shared<core::LocalRepositoryInstaller>(
            repository_.string(), root_.string(), (root_ / ".installed.json").string(),
            "extension", "EXTENSIONS_", std::make_shared<core::LocalFilesystem>());
        filesystem_ = std::make_shared<FailingRemoveFilesystem>();
        manager_ = std::make_unique<ExtensionManager>(installer_, registry_, filesystem_, "extension", "EXTENSIONS_");
    }

    void TearDown() override {
        fs::remove_all(testDir_);
    }

    static void writeExtension(const fs::path& dir, const std::string& name, const std::string& version,
                               const std::string& payload, const std::string& requires_ = "*") {
        fs::create_directories(dir);
        core::ExtensionMetadata metadata;
        metadata.name = name;
        metadata.version = version;
        metadata.hostRequirement = requires_;
        std::ofstream(dir / core::DirectoryExtensionRegistry::kMetadataFile) << metadata.to_json().dump();
        std::ofstream(dir / "main.txt") << payload;
    }

    // Copy placed by hand in the extensions directory
    void installManually(const std::string& name, const std::string& version) {
        writeExtension(root_ / name, name, version, "manual");
    }

    void publish(const std::string& name, const std::string& version, const std::string& requires_ = "*") {
        writeExtension(repository_ / name / version, name, version, "packaged-" + version, requires_);
    }

    fs::path testDir_;
    fs::path root_;
    fs::path repository_;
    std::shared_ptr<core::DirectoryExtensionRegistry> registry_;
    std::shared_ptr<core::LocalRepositoryInstaller> installer_;
    std::shared_ptr<FailingRemoveFilesystem> filesystem_;
    std::unique_ptr<ExtensionManager> manager_;
    core::BufferedIO io_{core::MessageCatalog::defaults(), core::Verbosity::Debug};
};

TEST_F(ManagedLifecycleTest, InstallOverManualCopyIsRefused) {
    installManually("vendor/foo", "0.9.0");
    publish("vendor/foo", "1.0.0");

    try {
        manager_->install({{"vendor/foo", "*"}}, io_);
        FAIL() << "installed over a manual copy";
    } catch (const core::ManagerError& e) {
        EXPECT_EQ(e.code(), core::ManagerErrc::AlreadyInstalledManually);
    }
    EXPECT_TRUE(manager_->managed_packages().empty());
    EXPECT_EQ(readFile(root_ / "vendor/foo/main.txt"), "manual");
}

TEST_F(ManagedLifecycleTest, StartManagingEnabledExtension) {
    installManually("vendor/foo", "0.9.0");
    registry_->enable("vendor/foo");
    publish("vendor/foo", "1.0.0");

    manager_->start_managing("vendor/foo", io_);

    EXPECT_TRUE(manager_->is_managed("vendor/foo"));
    EXPECT_TRUE(registry_->is_enabled("vendor/foo"));
    EXPECT_EQ(registry_->enabled_version("vendor/foo"), "1.0.0");
    EXPECT_EQ(readFile(root_ / "vendor/foo/main.txt"), "packaged-1.0.0");
    EXPECT_FALSE(fs::exists(manager_->backup_path("vendor/foo")));
    EXPECT_TRUE(installer_->verify("vendor/foo"));

    try {
        manager_->start_managing("vendor/foo", io_);
        FAIL() << "managed the same extension twice";
    } catch (const core::ManagerError& e) {
        EXPECT_EQ(e.code(), core::ManagerErrc::AlreadyManaged);
    }
}

TEST_F(ManagedLifecycleTest, FailedInstallRestoresManualCopy) {
    installManually("vendor/foo", "0.9.0");
    registry_->enable("vendor/foo");

    try {
        manager_->start_managing("vendor/foo", io_);
        FAIL() << "managed an extension missing from the repository";
    } catch (const core::ManagerError& e) {
        EXPECT_EQ(e.code(), core::ManagerErrc::CannotManageInstallError);
    }

    EXPECT_FALSE(manager_->is_managed("vendor/foo"));
    EXPECT_TRUE(registry_->is_available("vendor/foo"));
    EXPECT_EQ(readFile(root_ / "vendor/foo/main.txt"), "manual");
    EXPECT_FALSE(fs::exists(manager_->backup_path("vendor/foo")));
    EXPECT_TRUE(registry_->is_enabled("vendor/foo"));
    EXPECT_EQ(registry_->enabled_version("vendor/foo"), "0.9.0");
}

TEST_F(ManagedLifecycleTest, FailedInstallKeepsDisabledExtensionDisabled) {
    installManually("vendor/foo", "0.9.0");

    EXPECT_THROW(manager_->start_managing("vendor/foo", io_), core::ManagerError);

    EXPECT_TRUE(registry_->is_available("vendor/foo"));
    EXPECT_FALSE(registry_->is_enabled("vendor/foo"));
}

TEST_F(ManagedLifecycleTest, CleanupFailureLeavesBackupOnDisk) {
    installManually("vendor/foo", "0.9.0");
    registry_->enable("vendor/foo");
    publish("vendor/foo", "1.0.0");
    const std::string backup = manager_->backup_path("vendor/foo");
    filesystem_->fail_on(backup);

    try {
        manager_->start_managing("vendor/foo", io_);
        FAIL() << "cleanup failure was not reported";
    } catch (const core::ManagedWithCleanError& e) {
        EXPECT_EQ(e.backup_path(), backup);
    }

    EXPECT_TRUE(manager_->is_managed("vendor/foo"));
    EXPECT_EQ(readFile(root_ / "vendor/foo/main.txt"), "packaged-1.0.0");
    EXPECT_EQ(readFile(fs::path(backup) / "main.txt"), "manual");
    EXPECT_EQ(registry_->all_available().count("vendor/foo__backup__"), 0u);
}

TEST_F(ManagedLifecycleTest, UpdateKeepsEnabledStateDespiteFailures) {
    publish("vendor/a", "1.0.0");
    publish("vendor/b", "1.0.0");
    publish("vendor/c", "1.0.0");
    manager_->install({{"vendor/a", "*"}, {"vendor/b", "*"}, {"vendor/c", "*"}}, io_);
    registry_->enable("vendor/a");
    registry_->enable("vendor/c");

    publish("vendor/a", "1.1.0", "<3.0");
    publish("vendor/b", "1.1.0");
    publish("vendor/c", "1.1.0");
    auto context = manager_->update({{"vendor/a", "*"}, {"vendor/b", "*"}, {"vendor/c", "*"}}, io_);

    EXPECT_EQ(context.enabledExtensions, (std::vector<std::string>{"vendor/a", "vendor/c"}));
    ASSERT_EQ(context.failures.size(), 1u);
    EXPECT_EQ(context.failures[0].package, "vendor/a");
    EXPECT_EQ(context.failures[0].messageKey, "EXTENSION_NOT_ENABLEABLE");

    EXPECT_FALSE(registry_->is_enabled("vendor/a"));
    EXPECT_FALSE(registry_->is_enabled("vendor/b"));
    EXPECT_TRUE(registry_->is_enabled("vendor/c"));
    EXPECT_EQ(manager_->managed_packages().at("vendor/c"), "1.1.0");
}

TEST_F(ManagedLifecycleTest, RemoveValidatesBeforeTouchingAnything) {
    publish("vendor/a", "1.0.0");
    manager_->install({{"vendor/a", "*"}}, io_);
    registry_->enable("vendor/a");

    try {
        manager_->remove({{"vendor/a", "*"}, {"vendor/missing", "*"}}, io_);
        FAIL() << "removed with a missing extension in the batch";
    } catch (const core::ManagerError& e) {
        EXPECT_EQ(e.code(), core::ManagerErrc::NotInstalled);
        EXPECT_EQ(e.parameters().at(0), "vendor/missing");
    }
    EXPECT_TRUE(registry_->is_enabled("vendor/a"));
    EXPECT_TRUE(manager_->is_managed("vendor/a"));

    EXPECT_TRUE(manager_->remove({{"vendor/a", "*"}}, io_).ok());
    EXPECT_FALSE(registry_->is_enabled("vendor/a"));
    EXPECT_FALSE(registry_->is_available("vendor/a"));
    EXPECT_FALSE(manager_->is_managed("vendor/a"));
}
