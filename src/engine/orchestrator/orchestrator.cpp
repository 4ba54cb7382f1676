#include "orchestrator.hpp"
#include <utility>

#include "../../core/logger/logger.hpp"
#include "../../fetch/downloader.hpp"
#include "../../resolver/artifact/artifact_resolver.hpp"
#include "../../resolver/dependency/dependency_resolver.hpp"

namespace Porter {
namespace Engine {

using Porter::Fetch::Downloader;
using Porter::Installer::make_platform_installer;
using Porter::Resolver::Artifact::ArtifactResolver;
using Porter::Resolver::Dependency::DependencyResolver;
using Porter::System::Platform::OsClass;
using Porter::System::Platform::to_string;

namespace {

InstallRoot make_root(const fs::path& configured) {
    if (configured.empty())
        return InstallRoot::for_current_user();
    return InstallRoot(configured);
}

std::string with_deps_command() {
    return std::string(Constants::PROGRAM_NAME) + " install --with-deps";
}

}  // namespace

Orchestrator::Orchestrator(InstallOptions options, PlatformKey host, CommandRunner& runner)
    : options_(std::move(options)),
      host_(std::move(host)),
      runner_(runner),
      prober_(runner),
      root_(make_root(options_.install_root)) {}

int Orchestrator::run() {
    result_.reset();
    const bool is_linux = host_.os == OsClass::Linux;
    Logger::debug(std::string("Host platform: ") + to_string(host_.os) + " / " + to_string(host_.arch));

    if (is_linux) {
        if (options_.with_deps) {
            if (!install_dependencies())
                return Constants::EXIT_CODE_FAILURE;
        } else {
            Logger::warn("Linux detected. If browser fails to launch, run:");
            Logger::print("  " + with_deps_command());
            Logger::print();
        }
    }

    ArtifactResolver resolver(options_.version, options_.base_url);
    auto             artifact = resolver.resolve(host_);
    if (!artifact) {
        return fail("Unsupported platform for BrowserOS install: " + host_.os_name + " / "
                    + host_.arch_name);
    }

    const fs::path downloads = root_.downloads_dir();
    auto           created   = InstallRoot::ensure_directory(downloads);
    if (!created) {
        return fail(Status::fail(created.kind, "Failed to create download directory "
                                                   + downloads.string() + ": " + created.error));
    }

    const fs::path download_path = downloads / artifact->file_name;
    Logger::info("Downloading BrowserOS " + options_.version + "...");

    Downloader downloader(prober_, runner_, host_.os, options_.download_retries);
    auto       downloaded = downloader.download(artifact->download_url, download_path);
    if (!downloaded)
        return fail(downloaded);

    auto installer = make_platform_installer(artifact->format, host_.os, runner_);
    auto outcome   = installer->install(download_path, root_);
    if (!outcome.status)
        return fail(outcome.status);

    result_ = InstallResult{download_path, outcome.executable};
    report(*result_, *installer);

    if (is_linux && !options_.with_deps)
        print_dependency_hint();

    return Constants::EXIT_CODE_OK;
}

bool Orchestrator::install_dependencies() {
    Logger::info("Installing system dependencies...");

    DependencyResolver dependencies(prober_, runner_);
    auto               profile = dependencies.resolve(host_.os);
    if (!profile) {
        // Fatal for the whole run, not only for the dependency step.
        Logger::error("No supported package manager found (apt-get, dnf, or yum)");
        return false;
    }

    auto installed = dependencies.install(*profile, options_.elevate);
    if (installed) {
        Logger::success("System dependencies installed");
    } else {
        Logger::warn(installed.error);
    }
    return true;
}

void Orchestrator::report(const InstallResult& result, const PlatformInstaller& installer) const {
    Logger::success("BrowserOS package downloaded");
    Logger::print("  " + result.downloaded_artifact.string());

    if (result.installed_executable) {
        const std::string path = result.installed_executable->string();
        Logger::success("BrowserOS executable ready:");
        Logger::print("  " + path);
        Logger::print();
        Logger::print("Set this in your shell:");
        Logger::print(std::string("  export ") + Constants::EXECUTABLE_ENV_VAR + "=\"" + path + "\"");
        return;
    }

    for (const auto& line : installer.follow_up_instructions())
        Logger::print(line);
}

void Orchestrator::print_dependency_hint() const {
    Logger::print();
    Logger::print("Note: If BrowserOS fails to start due to missing shared libraries, run:");
    Logger::print("  " + with_deps_command());
}

int Orchestrator::fail(const std::string& message) const {
    Logger::error(message);
    return Constants::EXIT_CODE_FAILURE;
}

int Orchestrator::fail(const Status& status) const {
    Logger::debug(std::string("Failure kind: ") + to_string(status.kind));
    return fail(status.error);
}

}  // namespace Engine
}  // namespace Porter
