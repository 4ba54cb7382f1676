#pragma once
#include "platform_installer.hpp"

namespace Porter {
namespace Installer {

// Linux: the AppImage is the program. Copy it to <root>/bin and chmod +x.
class AppImageInstaller : public PlatformInstaller {
public:
    explicit AppImageInstaller(CommandRunner& runner);

    InstallOutcome install(const fs::path& artifact, const InstallRoot& root) override;

private:
    CommandRunner& runner_;
};

}  // namespace Installer
}  // namespace Porter
