#pragma once
#include "platform_installer.hpp"

namespace Porter {
namespace Installer {

// macOS: attach the .dmg at <root>/mount, copy BrowserOS.app next to it,
// detach. The mount directory never outlives install().
class DiskImageInstaller : public PlatformInstaller {
public:
    explicit DiskImageInstaller(CommandRunner& runner);

    InstallOutcome install(const fs::path& artifact, const InstallRoot& root) override;

private:
    void           clear_stale_mount(const fs::path& mount_dir);
    InstallOutcome copy_bundle(const fs::path& mount_dir, const InstallRoot& root);

    CommandRunner& runner_;
};

}  // namespace Installer
}  // namespace Porter
