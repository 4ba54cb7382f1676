#include "disk_image_installer.hpp"
#include <system_error>

#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"

namespace Porter {
namespace Installer {

using namespace Porter::Core;
using Porter::System::Process::Command;
using Porter::System::Process::CommandResult;

namespace {

std::string describe(const CommandResult& result) {
    if (!result.started)
        return result.error;
    return "exit status: " + std::to_string(result.exit_code);
}

// Detaches and removes the mount directory when the copy phase ends, on
// every path out of it.
class MountGuard {
public:
    MountGuard(CommandRunner& runner, fs::path mount_dir)
        : runner_(runner), mount_dir_(std::move(mount_dir)) {}

    ~MountGuard() {
        auto detach = runner_.run(Command{"hdiutil", {"detach", mount_dir_.string(), "-quiet"}, true});
        if (!detach.success())
            Logger::debug("hdiutil detach " + mount_dir_.string() + " failed: " + describe(detach));

        std::error_code ec;
        fs::remove_all(mount_dir_, ec);
        if (ec)
            Logger::warn("Failed to remove mount directory " + mount_dir_.string() + ": " + ec.message());
    }

    MountGuard(const MountGuard&)            = delete;
    MountGuard& operator=(const MountGuard&) = delete;

private:
    CommandRunner& runner_;
    fs::path       mount_dir_;
};

}  // namespace

DiskImageInstaller::DiskImageInstaller(CommandRunner& runner) : runner_(runner) {}

InstallOutcome DiskImageInstaller::install(const fs::path& artifact, const InstallRoot& root) {
    auto prepared = InstallRoot::ensure_directory(root.base());
    if (!prepared) {
        return InstallOutcome::failed(prepared.kind, "Failed to prepare BrowserOS directory "
                                                         + root.base().string() + ": " + prepared.error);
    }

    const fs::path mount_dir = root.mount_dir();
    clear_stale_mount(mount_dir);

    auto staged = InstallRoot::ensure_directory(mount_dir);
    if (!staged) {
        return InstallOutcome::failed(staged.kind, "Failed to create mount directory "
                                                       + mount_dir.string() + ": " + staged.error);
    }

    auto attach = runner_.run(Command{
        "hdiutil",
        {"attach", "-nobrowse", "-quiet", "-mountpoint", mount_dir.string(), artifact.string()},
        false});
    if (!attach.success()) {
        std::error_code ec;
        fs::remove_all(mount_dir, ec);
        return InstallOutcome::failed(ErrorKind::MountFailure,
                                      "Failed to mount BrowserOS DMG " + artifact.string() + " ("
                                          + describe(attach) + ")");
    }

    MountGuard guard(runner_, mount_dir);
    return copy_bundle(mount_dir, root);
}

void DiskImageInstaller::clear_stale_mount(const fs::path& mount_dir) {
    std::error_code ec;
    if (!fs::exists(mount_dir, ec))
        return;

    Logger::debug("Removing stale mount directory " + mount_dir.string());

    // A previous run may already have detached it; failure here is expected.
    auto detach = runner_.run(Command{"hdiutil", {"detach", mount_dir.string(), "-force"}, true});
    if (!detach.success())
        Logger::debug("Stale detach of " + mount_dir.string() + " failed: " + describe(detach));

    fs::remove_all(mount_dir, ec);
    if (ec)
        Logger::warn("Failed to remove stale mount directory " + mount_dir.string() + ": " + ec.message());
}

InstallOutcome DiskImageInstaller::copy_bundle(const fs::path& mount_dir, const InstallRoot& root) {
    std::error_code ec;

    const fs::path bundle_in_image = mount_dir / Constants::APP_BUNDLE;
    if (!fs::exists(bundle_in_image, ec)) {
        return InstallOutcome::failed(ErrorKind::BundleNotFound,
                                      std::string(Constants::APP_BUNDLE)
                                          + " not found in mounted DMG: " + mount_dir.string());
    }

    const fs::path target = root.app_bundle_dir();
    if (fs::exists(target, ec)) {
        fs::remove_all(target, ec);
        if (ec) {
            return InstallOutcome::failed(ErrorKind::CopyFailure,
                                          "Failed to remove previous " + std::string(Constants::APP_BUNDLE)
                                              + " at " + target.string() + ": " + ec.message());
        }
    }

    auto copy = runner_.run(Command{"cp", {"-R", bundle_in_image.string(), target.string()}, false});
    if (!copy.success()) {
        return InstallOutcome::failed(ErrorKind::CopyFailure,
                                      "Failed to copy " + std::string(Constants::APP_BUNDLE)
                                          + " from DMG to " + target.string() + " (" + describe(copy) + ")");
    }

    const fs::path executable = target / "Contents" / "MacOS" / Constants::BROWSER_NAME;
    if (!fs::exists(executable, ec)) {
        return InstallOutcome::failed(ErrorKind::ExecutableNotFound,
                                      "Installed BrowserOS executable not found: " + executable.string());
    }

    return InstallOutcome::installed(executable);
}

}  // namespace Installer
}  // namespace Porter
