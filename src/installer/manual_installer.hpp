#pragma once
#include "platform_installer.hpp"

namespace Porter {
namespace Installer {

// Windows and unmodeled systems: nothing is unpacked. The user runs the
// downloaded artifact by hand.
class ManualInstaller : public PlatformInstaller {
public:
    explicit ManualInstaller(OsClass os);

    InstallOutcome           install(const fs::path& artifact, const InstallRoot& root) override;
    std::vector<std::string> follow_up_instructions() const override;

private:
    OsClass os_;
};

}  // namespace Installer
}  // namespace Porter
