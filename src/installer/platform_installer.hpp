#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../core/types/status.hpp"
#include "../resolver/artifact/artifact_resolver.hpp"
#include "../system/platform/platform.hpp"
#include "../system/process/command_runner.hpp"
#include "install_root.hpp"

namespace Porter {
namespace Installer {

using Porter::Resolver::Artifact::ArtifactFormat;
using Porter::System::Platform::OsClass;
using Porter::System::Process::CommandRunner;

struct InstallOutcome {
    Core::Status            status;
    std::optional<fs::path> executable;

    static InstallOutcome installed(fs::path executable) {
        return InstallOutcome{Core::Status::ok(), std::move(executable)};
    }
    static InstallOutcome deferred() { return InstallOutcome{Core::Status::ok(), std::nullopt}; }
    static InstallOutcome failed(Core::ErrorKind kind, std::string message) {
        return InstallOutcome{Core::Status::fail(kind, std::move(message)), std::nullopt};
    }
};

// Turns a downloaded artifact into something runnable on one OS family.
class PlatformInstaller {
public:
    virtual ~PlatformInstaller() = default;

    virtual InstallOutcome install(const fs::path& artifact, const InstallRoot& root) = 0;

    // Lines printed when no executable path can be reported.
    virtual std::vector<std::string> follow_up_instructions() const { return {}; }
};

// Picks the installer for the artifact's packaging; `os` only shapes the
// follow-up text of the manual variant.
std::unique_ptr<PlatformInstaller> make_platform_installer(ArtifactFormat format, OsClass os,
                                                           CommandRunner& runner);

}  // namespace Installer
}  // namespace Porter
