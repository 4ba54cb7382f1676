#pragma once
#include <string>

namespace Porter {
namespace System {
namespace Platform {

enum class OsClass { MacOS, Windows, Linux, Other };

enum class ArchClass { Arm64, X64, Other };

// Host identity, read once at startup. The raw names are kept for messages.
struct PlatformKey {
    OsClass     os   = OsClass::Other;
    ArchClass   arch = ArchClass::Other;
    std::string os_name;
    std::string arch_name;
};

OsClass     classify_os(const std::string& os_name);
ArchClass   classify_arch(const std::string& arch_name);
PlatformKey make_platform_key(const std::string& os_name, const std::string& arch_name);

PlatformKey detect_host();

// True when running as root; package manager commands then skip sudo.
bool is_elevated();

const char* to_string(OsClass os);
const char* to_string(ArchClass arch);

}  // namespace Platform
}  // namespace System
}  // namespace Porter
