#include "manual_installer.hpp"
#include "../core/types/constants.hpp"

namespace Porter {
namespace Installer {

using namespace Porter::Core;

ManualInstaller::ManualInstaller(OsClass os) : os_(os) {}

InstallOutcome ManualInstaller::install(const fs::path&, const InstallRoot&) {
    return InstallOutcome::deferred();
}

std::vector<std::string> ManualInstaller::follow_up_instructions() const {
    if (os_ != OsClass::Windows)
        return {};
    return {"",
            "Run the downloaded installer, then set:",
            std::string("  set ") + Constants::EXECUTABLE_ENV_VAR + "="
                + Constants::WINDOWS_DEFAULT_EXECUTABLE};
}

}  // namespace Installer
}  // namespace Porter
