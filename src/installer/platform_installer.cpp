#include "platform_installer.hpp"
#include "appimage_installer.hpp"
#include "disk_image_installer.hpp"
#include "manual_installer.hpp"

namespace Porter {
namespace Installer {

std::unique_ptr<PlatformInstaller> make_platform_installer(ArtifactFormat format, OsClass os,
                                                           CommandRunner& runner) {
    switch (format) {
        case ArtifactFormat::DiskImage:
            return std::make_unique<DiskImageInstaller>(runner);
        case ArtifactFormat::AppImage:
            return std::make_unique<AppImageInstaller>(runner);
        case ArtifactFormat::Installer:
            break;
    }
    return std::make_unique<ManualInstaller>(os);
}

}  // namespace Installer
}  // namespace Porter
