#pragma once

#include <gmock/gmock.h>
#include "extmgr/core/extension_registry.hpp"
#include "extmgr/core/filesystem.hpp"
#include "extmgr/core/installer.hpp"
#include "extmgr/core/io_interface.hpp"

namespace extmgr {
namespace core {

class MockExtensionRegistry : public ExtensionRegistry {
public:
    MOCK_METHOD(ExtensionMap, all_available, (), (const, override));
    MOCK_METHOD(bool, is_available, (const std::string& id), (const, override));
    MOCK_METHOD(bool, is_enabled, (const std::string& id), (const, override));
    MOCK_METHOD(void, enable, (const std::string& id), (override));
    MOCK_METHOD(void, enabling, (const std::string& id), (override));
    MOCK_METHOD(void, disable, (const std::string& id), (override));
    MOCK_METHOD(std::string, get_extension_path, (const std::string& id, bool mustExist), (const, override));
};

class MockFilesystem : public FilesystemOperator {
public:
    MOCK_METHOD(void, rename, (const std::string& source, const std::string& destination), (override));
    MOCK_METHOD(void, remove, (const std::string& path), (override));
    MOCK_METHOD(void, copy, (const std::string& source, const std::string& destination), (override));
    MOCK_METHOD(bool, exists, (const std::string& path), (const, override));
};

class MockInstaller : public Installer {
public:
    MOCK_METHOD(PackageSet, installed_packages, (), (const, override));
    MOCK_METHOD(void, install, (const PackageSet& packages, IOInterface& io), (override));
    MOCK_METHOD(void, update, (const PackageSet& packages, IOInterface& io), (override));
    MOCK_METHOD(void, remove, (const std::vector<std::string>& packages, IOInterface& io), (override));
};

class MockIO : public IOInterface {
public:
    MOCK_METHOD(void, write_error, (const Message& message, bool newline, Verbosity verbosity), (override));
    MOCK_METHOD(Verbosity, verbosity, (), (const, override));
};

} // namespace core
} // namespace extmgr
