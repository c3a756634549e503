#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "extmgr/core/exceptions.hpp"
#include "extmgr/core/mock_collaborators.hpp"
#include "extmgr/extensions/extension_manager.hpp"

using namespace extmgr;
using namespace extmgr::extensions;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

namespace {
    core::ExtensionMap availableMap(std::initializer_list<std::string> ids) {
        core::ExtensionMap map;
        for (const auto& id : ids) {
            core::ExtensionMetadata metadata;
            metadata.name = id;
            metadata.version = "1.0.0";
            map.emplace(id, metadata);
        }
        return map;
    }
}

class ExtensionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        installer_ = std::make_shared<NiceMock<core::MockInstaller>>();
        registry_ = std::make_shared<NiceMock<core::MockExtensionRegistry>>();
        filesystem_ = std::make_shared<StrictMock<core::MockFilesystem>>();
        manager_ = std::make_unique<ExtensionManager>(installer_, registry_, filesystem_, "extension", "EXTENSIONS_");
    }

    std::shared_ptr<NiceMock<core::MockInstaller>> installer_;
    std::shared_ptr<NiceMock<core::MockExtensionRegistry>> registry_;
    std::shared_ptr<StrictMock<core::MockFilesystem>> filesystem_;
    std::unique_ptr<ExtensionManager> manager_;
    core::BufferedIO io_{core::MessageCatalog::defaults(), core::Verbosity::Verbose};
};

TEST_F(ExtensionManagerTest, InstallRefusesManuallyInstalledExtensions) {
    ON_CALL(*registry_, all_available()).WillByDefault(Return(availableMap({"vendor/a", "vendor/c"})));
    EXPECT_CALL(*installer_, install(_, _)).Times(0);

    try {
        manager_->install({{"vendor/a", "*"}, {"vendor/b", "*"}, {"vendor/c", "*"}}, io_);
        FAIL() << "installed over manually installed extensions";
    } catch (const core::ManagerError& e) {
        EXPECT_EQ(e.code(), core::ManagerErrc::AlreadyInstalledManually);
        EXPECT_EQ(e.parameters().at(0), "vendor/a|vendor/c");
    }
}

TEST_F(ExtensionManagerTest, InstallOfNewExtensionReachesInstaller) {
    ON_CALL(*registry_, all_available()).WillByDefault(Return(availableMap({"vendor/other"})));
    EXPECT_CALL(*installer_, install(core::PackageSet{{"vendor/a", "*"}}, _));

    EXPECT_TRUE(manager_->install({{"vendor/a", ""}}, io_).ok());
}

TEST_F(ExtensionManagerTest, UpdateReenablesPreviouslyEnabledExtensions) {
    ON_CALL(*installer_, installed_packages()).WillByDefault(Return(core::PackageSet{
        {"vendor/a", "1.0.0"}, {"vendor/b", "1.0.0"}, {"vendor/c", "1.0.0"}}));
    ON_CALL(*registry_, is_enabled("vendor/a")).WillByDefault(Return(true));
    ON_CALL(*registry_, is_enabled("vendor/b")).WillByDefault(Return(false));
    ON_CALL(*registry_, is_enabled("vendor/c")).WillByDefault(Return(true));

    {
        ::testing::InSequence sequence;
        EXPECT_CALL(*registry_, disable("vendor/a"));
        EXPECT_CALL(*registry_, disable("vendor/c"));
        EXPECT_CALL(*installer_, update(_, _));
        EXPECT_CALL(*registry_, enable("vendor/a"));
        EXPECT_CALL(*registry_, enable("vendor/c"));
    }
    EXPECT_CALL(*registry_, disable("vendor/b")).Times(0);
    EXPECT_CALL(*registry_, enable("vendor/b")).Times(0);

    auto context = manager_->update({{"vendor/a", "*"}, {"vendor/b", "*"}, {"vendor/c", "*"}}, io_);
    EXPECT_THAT(context.enabledExtensions, ElementsAre("vendor/a", "vendor/c"));
    EXPECT_TRUE(context.ok());
    EXPECT_EQ(io_.lines().front(), "Disabling extensions...");
}

TEST_F(ExtensionManagerTest, UpdateContinuesPastEnableFailures) {
    ON_CALL(*installer_, installed_packages()).WillByDefault(Return(core::PackageSet{
        {"vendor/a", "1.0.0"}, {"vendor/b", "1.0.0"}}));
    ON_CALL(*registry_, is_enabled(_)).WillByDefault(Return(true));
    EXPECT_CALL(*registry_, enable("vendor/a"))
        .WillOnce(Throw(core::ExtensionError("EXTENSION_NOT_ENABLEABLE", {"vendor/a", "<1.0", "3.3.0"})));
    EXPECT_CALL(*registry_, enable("vendor/b"));

    auto context = manager_->update({{"vendor/a", "*"}, {"vendor/b", "*"}}, io_);

    ASSERT_EQ(context.failures.size(), 1u);
    EXPECT_EQ(context.failures[0].package, "vendor/a");
    EXPECT_EQ(context.failures[0].messageKey, "EXTENSION_NOT_ENABLEABLE");
    EXPECT_NE(io_.output().find("The extension vendor/a requires version <1.0, found 3.3.0."), std::string::npos);
}

TEST_F(ExtensionManagerTest, UpdateContinuesPastDisableFailures) {
    ON_CALL(*installer_, installed_packages()).WillByDefault(Return(core::PackageSet{
        {"vendor/a", "1.0.0"}, {"vendor/b", "1.0.0"}}));
    ON_CALL(*registry_, is_enabled(_)).WillByDefault(Return(true));
    EXPECT_CALL(*registry_, disable("vendor/a")).WillOnce(Throw(std::runtime_error("state locked")));
    EXPECT_CALL(*registry_, disable("vendor/b"));
    EXPECT_CALL(*installer_, update(_, _));

    auto context = manager_->update({{"vendor/a", "*"}, {"vendor/b", "*"}}, io_);

    EXPECT_THAT(context.enabledExtensions, ElementsAre("vendor/a", "vendor/b"));
    ASSERT_EQ(context.failures.size(), 1u);
    EXPECT_EQ(context.failures[0].messageKey, "state locked");
}

TEST_F(ExtensionManagerTest, UpdateOfUnmanagedExtensionTouchesNothing) {
    EXPECT_CALL(*registry_, is_enabled(_)).Times(0);
    EXPECT_CALL(*registry_, disable(_)).Times(0);
    EXPECT_THROW(manager_->update({{"vendor/a", "*"}}, io_), core::ManagerError);
}

TEST_F(ExtensionManagerTest, RemoveRequiresExtensionsOnDisk) {
    ON_CALL(*installer_, installed_packages()).WillByDefault(Return(core::PackageSet{
        {"vendor/a", "1.0.0"}, {"vendor/b", "1.0.0"}}));
    ON_CALL(*registry_, all_available()).WillByDefault(Return(availableMap({"vendor/a"})));
    EXPECT_CALL(*registry_, disable(_)).Times(0);
    EXPECT_CALL(*installer_, remove(_, _)).Times(0);

    try {
        manager_->remove({{"vendor/a", "*"}, {"vendor/b", "*"}}, io_);
        FAIL() << "removed an extension that is not on disk";
    } catch (const core::ManagerError& e) {
        EXPECT_EQ(e.code(), core::ManagerErrc::NotInstalled);
        EXPECT_EQ(e.parameters().at(0), "vendor/b");
    }
}

TEST_F(ExtensionManagerTest, RemoveDisablesEnabledExtensionsFirst) {
    ON_CALL(*installer_, installed_packages()).WillByDefault(Return(core::PackageSet{
        {"vendor/a", "1.0.0"}, {"vendor/b", "1.0.0"}}));
    ON_CALL(*registry_, all_available()).WillByDefault(Return(availableMap({"vendor/a", "vendor/b"})));
    ON_CALL(*registry_, is_enabled("vendor/a")).WillByDefault(Return(true));

    {
        ::testing::InSequence sequence;
        EXPECT_CALL(*registry_, disable("vendor/a"));
        EXPECT_CALL(*installer_, remove(ElementsAre("vendor/a", "vendor/b"), _));
    }
    EXPECT_CALL(*registry_, disable("vendor/b")).Times(0);

    EXPECT_TRUE(manager_->remove({{"vendor/a", "*"}, {"vendor/b", "*"}}, io_).ok());
}

TEST_F(ExtensionManagerTest, RemoveContinuesPastDisableFailures) {
    ON_CALL(*installer_, installed_packages()).WillByDefault(Return(core::PackageSet{
        {"vendor/a", "1.0.0"}, {"vendor/b", "1.0.0"}}));
    ON_CALL(*registry_, all_available()).WillByDefault(Return(availableMap({"vendor/a", "vendor/b"})));
    ON_CALL(*registry_, is_enabled(_)).WillByDefault(Return(true));
    EXPECT_CALL(*registry_, disable("vendor/a"))
        .WillOnce(Throw(core::ExtensionError("EXTENSION_STATE_ERROR", {"state.json", "read-only"})));
    EXPECT_CALL(*registry_, disable("vendor/b"));
    EXPECT_CALL(*installer_, remove(ElementsAre("vendor/a", "vendor/b"), _));

    auto context = manager_->remove({{"vendor/a", "*"}, {"vendor/b", "*"}}, io_);

    ASSERT_EQ(context.failures.size(), 1u);
    EXPECT_EQ(context.failures[0].package, "vendor/a");
    EXPECT_EQ(context.failures[0].messageKey, "EXTENSION_STATE_ERROR");
    EXPECT_NE(io_.output().find("The extension state file state.json could not be used: read-only"),
              std::string::npos);
}

TEST_F(ExtensionManagerTest, BackupPathAppendsSuffix) {
    ON_CALL(*registry_, get_extension_path("vendor/a", _)).WillByDefault(Return("/srv/ext/vendor/a/"));
    EXPECT_EQ(manager_->backup_path("vendor/a"), "/srv/ext/vendor/a__backup__");

    ExtensionManager custom(installer_, registry_, filesystem_, "extension", "EXTENSIONS_", ".bak");
    EXPECT_EQ(custom.backup_path("vendor/a"), "/srv/ext/vendor/a.bak");
}
