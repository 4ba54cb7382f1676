#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/installer/appimage_installer.hpp"
#include "../../src/installer/disk_image_installer.hpp"
#include "../../src/installer/manual_installer.hpp"
#include "../support/fake_runner.hpp"

#ifndef _WIN32
    #include <pwd.h>
    #include <unistd.h>
#endif

using namespace Porter::Installer;
using Porter::Core::ErrorKind;
using Porter::Resolver::Artifact::ArtifactFormat;
using Porter::Testing::FakeRunner;
using Porter::Testing::scratch_dir;
using Porter::Testing::simulate_disk_image;
using Porter::Testing::touch;

class InstallerTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = scratch_dir(::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(base_);
        artifact_ = base_ / "downloads" / "artifact.bin";
        touch(artifact_, "browser-image");
    }

    void TearDown() override { fs::remove_all(base_); }

    fs::path   base_;
    fs::path   artifact_;
    FakeRunner runner_;
};

TEST_F(InstallerTest, DiskImageInstallsBundle) {
    simulate_disk_image(runner_);
    InstallRoot        root(base_);
    DiskImageInstaller installer(runner_);

    auto outcome = installer.install(artifact_, root);
    ASSERT_TRUE(outcome.status.success) << outcome.status.error;
    ASSERT_TRUE(outcome.executable.has_value());
    EXPECT_EQ(outcome.executable->string(), (base_ / "BrowserOS.app" / "Contents" / "MacOS" / "BrowserOS").string());
    EXPECT_TRUE(fs::exists(*outcome.executable));
    EXPECT_FALSE(fs::exists(root.mount_dir()));

    auto hdiutil = runner_.calls_to("hdiutil");
    ASSERT_EQ(hdiutil.size(), 2u);
    EXPECT_EQ(hdiutil[0].args,
              (std::vector<std::string>{"attach", "-nobrowse", "-quiet", "-mountpoint",
                                        root.mount_dir().string(), artifact_.string()}));
    EXPECT_EQ(hdiutil[1].args,
              (std::vector<std::string>{"detach", root.mount_dir().string(), "-quiet"}));
}

TEST_F(InstallerTest, DiskImageClearsStaleMountFirst) {
    simulate_disk_image(runner_);
    InstallRoot root(base_);
    touch(root.mount_dir() / "leftover" / "file");
    runner_.handlers["hdiutil"] = [inner = runner_.handlers["hdiutil"], &root](const auto& c) {
        if (c.args.at(0) == "attach")
            EXPECT_FALSE(fs::exists(root.mount_dir() / "leftover"));
        return inner(c);
    };

    DiskImageInstaller installer(runner_);
    auto               outcome = installer.install(artifact_, root);
    ASSERT_TRUE(outcome.status.success) << outcome.status.error;

    auto hdiutil = runner_.calls_to("hdiutil");
    ASSERT_GE(hdiutil.size(), 2u);
    EXPECT_EQ(hdiutil[0].args,
              (std::vector<std::string>{"detach", root.mount_dir().string(), "-force"}));
    EXPECT_EQ(hdiutil[1].args.at(0), "attach");
}

TEST_F(InstallerTest, DiskImageToleratesFailingStaleDetach) {
    simulate_disk_image(runner_);
    InstallRoot root(base_);
    fs::create_directories(root.mount_dir());
    runner_.handlers["hdiutil"] = [inner = runner_.handlers["hdiutil"]](const auto& c) {
        if (c.args.at(0) == "detach" && c.args.back() == "-force")
            return FakeRunner::exited(1);
        return inner(c);
    };

    DiskImageInstaller installer(runner_);
    EXPECT_TRUE(installer.install(artifact_, root).status.success);
}

TEST_F(InstallerTest, DiskImageMountFailureRemovesStaging) {
    runner_.exit_codes["hdiutil"] = 1;
    InstallRoot        root(base_);
    DiskImageInstaller installer(runner_);

    auto outcome = installer.install(artifact_, root);
    EXPECT_FALSE(outcome.status.success);
    EXPECT_EQ(outcome.status.kind, ErrorKind::MountFailure);
    EXPECT_FALSE(outcome.executable.has_value());
    EXPECT_FALSE(fs::exists(root.mount_dir()));
    EXPECT_EQ(runner_.count("cp"), 0u);
}

TEST_F(InstallerTest, DiskImageMissingBundleCleansUp) {
    simulate_disk_image(runner_, false);
    InstallRoot        root(base_);
    DiskImageInstaller installer(runner_);

    auto outcome = installer.install(artifact_, root);
    EXPECT_EQ(outcome.status.kind, ErrorKind::BundleNotFound);
    EXPECT_FALSE(fs::exists(root.mount_dir()));
    EXPECT_EQ(runner_.calls_to("hdiutil").back().args.at(0), "detach");
}

TEST_F(InstallerTest, DiskImageCopyFailureCleansUp) {
    simulate_disk_image(runner_);
    runner_.handlers.erase("cp");
    runner_.exit_codes["cp"] = 1;
    InstallRoot        root(base_);
    DiskImageInstaller installer(runner_);

    auto outcome = installer.install(artifact_, root);
    EXPECT_EQ(outcome.status.kind, ErrorKind::CopyFailure);
    EXPECT_FALSE(fs::exists(root.mount_dir()));
}

TEST_F(InstallerTest, DiskImageMissingExecutable) {
    simulate_disk_image(runner_, true, false);
    InstallRoot        root(base_);
    DiskImageInstaller installer(runner_);

    auto outcome = installer.install(artifact_, root);
    EXPECT_EQ(outcome.status.kind, ErrorKind::ExecutableNotFound);
    EXPECT_NE(outcome.status.error.find("Contents"), std::string::npos);
    EXPECT_FALSE(fs::exists(root.mount_dir()));
}

TEST_F(InstallerTest, DiskImageReplacesPreviousBundle) {
    simulate_disk_image(runner_);
    InstallRoot root(base_);
    touch(root.app_bundle_dir() / "stale-marker");

    DiskImageInstaller installer(runner_);
    ASSERT_TRUE(installer.install(artifact_, root).status.success);
    EXPECT_FALSE(fs::exists(root.app_bundle_dir() / "stale-marker"));
}

TEST_F(InstallerTest, AppImageCopiesAndMarksExecutable) {
    InstallRoot       root(base_);
    AppImageInstaller installer(runner_);

    auto outcome = installer.install(artifact_, root);
    ASSERT_TRUE(outcome.status.success) << outcome.status.error;
    EXPECT_EQ(outcome.executable->string(), (base_ / "bin" / "BrowserOS").string());

    std::ifstream in(*outcome.executable, std::ios::binary);
    std::string   content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "browser-image");

    auto chmod = runner_.calls_to("chmod");
    ASSERT_EQ(chmod.size(), 1u);
    EXPECT_EQ(chmod[0].args, (std::vector<std::string>{"+x", (base_ / "bin" / "BrowserOS").string()}));
}

TEST_F(InstallerTest, AppImageOverwritesPreviousCopy) {
    InstallRoot root(base_);
    touch(root.bin_dir() / "BrowserOS", "old");

    AppImageInstaller installer(runner_);
    auto              outcome = installer.install(artifact_, root);
    ASSERT_TRUE(outcome.status.success);

    std::ifstream in(*outcome.executable, std::ios::binary);
    std::string   content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "browser-image");
}

TEST_F(InstallerTest, AppImageChmodFailure) {
    runner_.exit_codes["chmod"] = 1;
    InstallRoot       root(base_);
    AppImageInstaller installer(runner_);

    auto outcome = installer.install(artifact_, root);
    EXPECT_EQ(outcome.status.kind, ErrorKind::PermissionChangeFailure);
    EXPECT_FALSE(outcome.executable.has_value());
}

TEST_F(InstallerTest, AppImageMissingArtifact) {
    InstallRoot       root(base_);
    AppImageInstaller installer(runner_);

    auto outcome = installer.install(base_ / "nope.AppImage", root);
    EXPECT_EQ(outcome.status.kind, ErrorKind::CopyFailure);
    EXPECT_EQ(runner_.count("chmod"), 0u);
}

TEST_F(InstallerTest, ManualInstallerDefers) {
    ManualInstaller windows(OsClass::Windows);
    auto            outcome = windows.install(artifact_, InstallRoot(base_));
    EXPECT_TRUE(outcome.status.success);
    EXPECT_FALSE(outcome.executable.has_value());
    EXPECT_TRUE(runner_.calls.empty());

    auto lines = windows.follow_up_instructions();
    ASSERT_FALSE(lines.empty());
    EXPECT_NE(lines.back().find("AGENT_BROWSER_EXECUTABLE_PATH=C:\\Program Files\\BrowserOS\\BrowserOS.exe"),
              std::string::npos);

    EXPECT_TRUE(ManualInstaller(OsClass::Other).follow_up_instructions().empty());
}

TEST(PlatformInstallerFactoryTest, SelectsVariantByArtifactFormat) {
    FakeRunner runner;
    EXPECT_NE(dynamic_cast<DiskImageInstaller*>(
                  make_platform_installer(ArtifactFormat::DiskImage, OsClass::MacOS, runner).get()),
              nullptr);
    EXPECT_NE(dynamic_cast<AppImageInstaller*>(
                  make_platform_installer(ArtifactFormat::AppImage, OsClass::Linux, runner).get()),
              nullptr);

    auto manual = make_platform_installer(ArtifactFormat::Installer, OsClass::Windows, runner);
    ASSERT_NE(dynamic_cast<ManualInstaller*>(manual.get()), nullptr);
    EXPECT_FALSE(manual->follow_up_instructions().empty());
}

TEST(InstallRootTest, LayoutAndIdempotentCreation) {
    fs::path base = scratch_dir("install_root_layout");
    fs::remove_all(base);
    InstallRoot root(base);

    EXPECT_EQ(root.downloads_dir().string(), (base / "downloads").string());
    EXPECT_EQ(root.mount_dir().string(), (base / "mount").string());
    EXPECT_EQ(root.app_bundle_dir().string(), (base / "BrowserOS.app").string());
    EXPECT_EQ(root.bin_dir().string(), (base / "bin").string());

    EXPECT_TRUE(InstallRoot::ensure_directory(root.downloads_dir()).success);
    EXPECT_TRUE(InstallRoot::ensure_directory(root.downloads_dir()).success);

    touch(base / "blocker");
    auto status = InstallRoot::ensure_directory(base / "blocker");
    EXPECT_EQ(status.kind, ErrorKind::DirectoryCreationFailure);

    fs::remove_all(base);
}

TEST(InstallRootTest, DefaultsUnderHome) {
    auto root = InstallRoot::for_current_user();
    EXPECT_EQ(root.base().filename().string(), ".browseros");
}

#ifndef _WIN32
TEST(InstallRootTest, FallsBackToPasswdHomeWithoutHomeVariable) {
    const passwd* entry = getpwuid(geteuid());
    if (!entry || !entry->pw_dir || !*entry->pw_dir)
        GTEST_SKIP() << "no passwd entry for the current user";
    const fs::path expected = fs::path(entry->pw_dir) / ".browseros";

    const char*       saved     = std::getenv("HOME");
    const std::string saved_home = saved ? saved : "";
    unsetenv("HOME");
    auto root = InstallRoot::for_current_user();
    if (saved)
        setenv("HOME", saved_home.c_str(), 1);

    EXPECT_EQ(root.base().string(), expected.string());
}
#endif
