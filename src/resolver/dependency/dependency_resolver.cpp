#include "dependency_resolver.hpp"
#include <algorithm>

#include "../../core/logger/logger.hpp"

namespace Porter {
namespace Resolver {
namespace Dependency {

using namespace Porter::Core;
using Porter::System::Process::Command;

namespace {

const std::vector<std::string>& apt_packages() {
    static const std::vector<std::string> packages = {
        "libxcb-shm0",  "libx11-xcb1",      "libx11-6",          "libxcb1",
        "libxext6",     "libxrandr2",       "libxcomposite1",    "libxcursor1",
        "libxdamage1",  "libxfixes3",       "libxi6",            "libgtk-3-0",
        "libpangocairo-1.0-0", "libpango-1.0-0", "libatk1.0-0",  "libcairo-gobject2",
        "libcairo2",    "libgdk-pixbuf-2.0-0", "libxrender1",    "libasound2",
        "libfreetype6", "libfontconfig1",   "libdbus-1-3",       "libnss3",
        "libnspr4",     "libatk-bridge2.0-0", "libdrm2",         "libxkbcommon0",
        "libatspi2.0-0", "libcups2",        "libxshmfence1",     "libgbm1"};
    return packages;
}

const std::vector<std::string>& dnf_packages() {
    static const std::vector<std::string> packages = {
        "nss",        "nspr",         "atk",        "at-spi2-atk",   "cups-libs",  "libdrm",
        "libXcomposite", "libXdamage", "libXrandr", "mesa-libgbm",   "pango",      "alsa-lib",
        "libxkbcommon", "libxcb",     "libX11-xcb", "libX11",        "libXext",    "libXcursor",
        "libXfixes",  "libXi",        "gtk3",       "cairo-gobject"};
    return packages;
}

const std::vector<std::string>& yum_packages() {
    static const std::vector<std::string> packages = {
        "nss",           "nspr",       "atk",       "at-spi2-atk", "cups-libs", "libdrm",
        "libXcomposite", "libXdamage", "libXrandr", "mesa-libgbm", "pango",     "alsa-lib",
        "libxkbcommon"};
    return packages;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i)
            out += sep;
        out += items[i];
    }
    return out;
}

}  // namespace

const char* to_string(PackageManager manager) {
    switch (manager) {
        case PackageManager::AptGet: return "apt-get";
        case PackageManager::Dnf:    return "dnf";
        case PackageManager::Yum:    return "yum";
        case PackageManager::None:   return "none";
    }
    return "none";
}

std::string PackageManagerProfile::install_command(bool elevate) const {
    const std::string sudo     = elevate ? "sudo " : "";
    const std::string name     = to_string(manager);
    const std::string packages = join(this->packages, " ");

    if (manager == PackageManager::AptGet) {
        return sudo + name + " update && " + sudo + name + " install -y " + packages;
    }
    return sudo + name + " install -y " + packages;
}

DependencyResolver::DependencyResolver(const ToolProber& prober, CommandRunner& runner)
    : prober_(prober), runner_(runner) {}

const std::vector<DependencyResolver::Candidate>& DependencyResolver::candidates() {
    static const std::vector<Candidate> list = {
        {PackageManager::AptGet, apt_packages()},
        {PackageManager::Dnf, dnf_packages()},
        {PackageManager::Yum, yum_packages()},
    };
    return list;
}

std::optional<PackageManagerProfile> DependencyResolver::resolve(OsClass os) const {
    if (os != OsClass::Linux)
        return std::nullopt;

    for (const auto& candidate : candidates()) {
        if (!prober_.exists(to_string(candidate.manager)))
            continue;

        PackageManagerProfile profile;
        profile.manager  = candidate.manager;
        profile.packages = candidate.packages;

        // Newer Debian/Ubuntu releases ship the ALSA library as libasound2t64.
        if (candidate.manager == PackageManager::AptGet
            && apt_package_exists(RENAMED_AUDIO_PACKAGE)) {
            std::replace(profile.packages.begin(), profile.packages.end(),
                         std::string(LEGACY_AUDIO_PACKAGE), std::string(RENAMED_AUDIO_PACKAGE));
        }

        Logger::debug(std::string("Selected package manager: ") + to_string(profile.manager));
        return profile;
    }
    return std::nullopt;
}

Status DependencyResolver::install(const PackageManagerProfile& profile, bool elevate) const {
    const std::string command_line = profile.install_command(elevate);
    Logger::print("Running: " + command_line);

    auto result = runner_.run(Command{"sh", {"-c", command_line}, false});
    if (!result.started) {
        return Status::fail(ErrorKind::DependencyInstallPartialFailure,
                            "Could not run install command: " + result.error);
    }
    if (result.exit_code != 0) {
        return Status::fail(ErrorKind::DependencyInstallPartialFailure,
                            "Failed to install some dependencies. You may need to run manually "
                            "with sudo.");
    }
    return Status::ok();
}

bool DependencyResolver::apt_package_exists(const std::string& package) const {
    return runner_.run(Command{"apt-cache", {"show", package}, true}).success();
}

}  // namespace Dependency
}  // namespace Resolver
}  // namespace Porter
