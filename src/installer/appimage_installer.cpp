#include "appimage_installer.hpp"
#include <system_error>

#include "../core/types/constants.hpp"

namespace Porter {
namespace Installer {

using namespace Porter::Core;
using Porter::System::Process::Command;

AppImageInstaller::AppImageInstaller(CommandRunner& runner) : runner_(runner) {}

InstallOutcome AppImageInstaller::install(const fs::path& artifact, const InstallRoot& root) {
    const fs::path bin_dir = root.bin_dir();
    auto           created = InstallRoot::ensure_directory(bin_dir);
    if (!created) {
        return InstallOutcome::failed(created.kind, "Failed to create BrowserOS bin directory "
                                                        + bin_dir.string() + ": " + created.error);
    }

    const fs::path  executable = bin_dir / Constants::BROWSER_NAME;
    std::error_code ec;
    fs::copy_file(artifact, executable, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return InstallOutcome::failed(ErrorKind::CopyFailure, "Failed to install BrowserOS AppImage to "
                                                                  + executable.string() + ": " + ec.message());
    }

    auto chmod = runner_.run(Command{"chmod", {"+x", executable.string()}, false});
    if (!chmod.started) {
        return InstallOutcome::failed(ErrorKind::PermissionChangeFailure,
                                      "Failed to run chmod +x on " + executable.string() + ": " + chmod.error);
    }
    if (chmod.exit_code != 0) {
        return InstallOutcome::failed(ErrorKind::PermissionChangeFailure,
                                      "Failed to mark BrowserOS executable as runnable: " + executable.string());
    }

    return InstallOutcome::installed(executable);
}

}  // namespace Installer
}  // namespace Porter
