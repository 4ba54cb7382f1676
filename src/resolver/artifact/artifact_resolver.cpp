#include "artifact_resolver.hpp"

namespace Porter {
namespace Resolver {
namespace Artifact {

namespace {

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/')
        url.pop_back();
    return url;
}

ArtifactDescriptor make_descriptor(const std::string& base_url,
                                   const std::string& version,
                                   const std::string& segment,
                                   const std::string& suffix,
                                   ArtifactFormat     format) {
    ArtifactDescriptor d;
    d.file_name    = std::string(Core::Constants::BROWSER_NAME) + "_v" + version + "_" + suffix;
    d.download_url = base_url + "/" + version + "/" + segment + "/" + d.file_name;
    d.format       = format;
    return d;
}

}  // namespace

ArtifactResolver::ArtifactResolver(const std::string& version, const std::string& base_url)
    : table_(build_table(version, trim_trailing_slash(base_url))) {}

std::vector<ArtifactResolver::Entry> ArtifactResolver::build_table(const std::string& version,
                                                                   const std::string& base_url) {
    const auto dmg = ArtifactFormat::DiskImage;
    return {
        {OsClass::MacOS, ArchClass::Arm64, make_descriptor(base_url, version, "macos", "arm64.dmg", dmg)},
        {OsClass::MacOS, ArchClass::X64, make_descriptor(base_url, version, "macos", "x64.dmg", dmg)},
        {OsClass::MacOS, std::nullopt, make_descriptor(base_url, version, "macos", "universal.dmg", dmg)},
        {OsClass::Windows, std::nullopt,
         make_descriptor(base_url, version, "win", "x64_installer.exe", ArtifactFormat::Installer)},
        {OsClass::Linux, std::nullopt,
         make_descriptor(base_url, version, "linux", "x64.AppImage", ArtifactFormat::AppImage)},
    };
}

std::optional<ArtifactDescriptor> ArtifactResolver::resolve(const PlatformKey& key) const {
    for (const auto& entry : table_) {
        if (entry.os != key.os)
            continue;
        if (entry.arch && *entry.arch != key.arch)
            continue;
        return entry.descriptor;
    }
    return std::nullopt;
}

}  // namespace Artifact
}  // namespace Resolver
}  // namespace Porter
