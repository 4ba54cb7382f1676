#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "../../core/types/constants.hpp"
#include "../../core/types/status.hpp"
#include "../../installer/install_root.hpp"
#include "../../installer/platform_installer.hpp"
#include "../../system/platform/platform.hpp"
#include "../../system/process/command_runner.hpp"
#include "../../system/process/tool_prober.hpp"

namespace Porter {
namespace Engine {

using namespace Porter::Core;
using Porter::Installer::InstallRoot;
using Porter::Installer::PlatformInstaller;
using Porter::System::Platform::PlatformKey;
using Porter::System::Process::CommandRunner;
using Porter::System::Process::ToolProber;

namespace fs = std::filesystem;

struct InstallOptions {
    bool        with_deps = false;
    fs::path    install_root;  // empty: InstallRoot::for_current_user()
    std::string version          = Constants::BROWSER_VERSION;
    std::string base_url         = Constants::RELEASE_BASE_URL;
    int         download_retries = Constants::DEFAULT_DOWNLOAD_RETRIES;
    bool        elevate          = true;  // prefix package manager commands with sudo
};

struct InstallResult {
    fs::path                downloaded_artifact;
    std::optional<fs::path> installed_executable;
};

// Runs one install: dependencies (Linux), artifact resolution, download,
// platform install, report. Returns the process exit code; all fatal
// diagnostics are printed here.
class Orchestrator {
public:
    Orchestrator(InstallOptions options, PlatformKey host, CommandRunner& runner);

    int run();

    const std::optional<InstallResult>& result() const { return result_; }

private:
    bool install_dependencies();
    void report(const InstallResult& result, const PlatformInstaller& installer) const;
    void print_dependency_hint() const;
    int  fail(const std::string& message) const;
    int  fail(const Status& status) const;

    InstallOptions               options_;
    PlatformKey                  host_;
    CommandRunner&               runner_;
    ToolProber                   prober_;
    InstallRoot                  root_;
    std::optional<InstallResult> result_;
};

}  // namespace Engine
}  // namespace Porter
