#pragma once
#include <optional>
#include <string>
#include <vector>

#include "../../core/types/status.hpp"
#include "../../system/platform/platform.hpp"
#include "../../system/process/command_runner.hpp"
#include "../../system/process/tool_prober.hpp"

namespace Porter {
namespace Resolver {
namespace Dependency {

using Porter::System::Platform::OsClass;
using Porter::System::Process::CommandRunner;
using Porter::System::Process::ToolProber;

enum class PackageManager { AptGet, Dnf, Yum, None };

const char* to_string(PackageManager manager);

struct PackageManagerProfile {
    PackageManager           manager = PackageManager::None;
    std::vector<std::string> packages;

    // apt-get refreshes its index first; dnf and yum install directly.
    // With elevate, every manager invocation is prefixed by sudo.
    std::string install_command(bool elevate = true) const;
};

class DependencyResolver {
public:
    struct Candidate {
        PackageManager           manager;
        std::vector<std::string> packages;
    };

    DependencyResolver(const ToolProber& prober, CommandRunner& runner);

    // Empty result means no supported manager (or a non-Linux host).
    std::optional<PackageManagerProfile> resolve(OsClass os) const;

    // Runs the install command through sh. A failure is reported as
    // DependencyInstallPartialFailure, which callers treat as a warning.
    Core::Status install(const PackageManagerProfile& profile, bool elevate = true) const;

    static const std::vector<Candidate>& candidates();

    static constexpr const char* LEGACY_AUDIO_PACKAGE  = "libasound2";
    static constexpr const char* RENAMED_AUDIO_PACKAGE = "libasound2t64";

private:
    bool apt_package_exists(const std::string& package) const;

    const ToolProber& prober_;
    CommandRunner&    runner_;
};

}  // namespace Dependency
}  // namespace Resolver
}  // namespace Porter
