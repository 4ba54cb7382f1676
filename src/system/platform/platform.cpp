#include "platform.hpp"
#include <algorithm>
#include <cctype>

#ifdef _WIN32
    #include <windows.h>
#else
    #include <sys/utsname.h>
    #include <unistd.h>
#endif

namespace Porter {
namespace System {
namespace Platform {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const char* host_os_name() {
#if defined(__APPLE__)
    return "macos";
#elif defined(_WIN32)
    return "windows";
#elif defined(__linux__)
    return "linux";
#elif defined(__FreeBSD__)
    return "freebsd";
#elif defined(__OpenBSD__)
    return "openbsd";
#elif defined(__NetBSD__)
    return "netbsd";
#else
    return "unknown";
#endif
}

std::string compiled_arch_name() {
#if defined(__aarch64__) || defined(_M_ARM64)
    return "aarch64";
#elif defined(__x86_64__) || defined(_M_X64)
    return "x86_64";
#elif defined(__riscv) && (__riscv_xlen == 64)
    return "riscv64";
#elif defined(__i386__) || defined(_M_IX86)
    return "x86";
#else
    return "unknown";
#endif
}

std::string host_arch_name() {
#ifdef _WIN32
    SYSTEM_INFO info;
    GetNativeSystemInfo(&info);
    switch (info.wProcessorArchitecture) {
        case PROCESSOR_ARCHITECTURE_AMD64: return "x86_64";
        case PROCESSOR_ARCHITECTURE_ARM64: return "aarch64";
        case PROCESSOR_ARCHITECTURE_INTEL: return "x86";
        default:                           return compiled_arch_name();
    }
#else
    struct utsname buf;
    if (uname(&buf) != 0)
        return compiled_arch_name();
    return buf.machine;
#endif
}

}  // namespace

OsClass classify_os(const std::string& os_name) {
    const std::string name = lower(os_name);
    if (name == "macos" || name == "darwin" || name == "osx")
        return OsClass::MacOS;
    if (name == "windows" || name == "win32" || name == "win")
        return OsClass::Windows;
    if (name == "linux")
        return OsClass::Linux;
    return OsClass::Other;
}

ArchClass classify_arch(const std::string& arch_name) {
    const std::string name = lower(arch_name);
    if (name == "aarch64" || name == "arm64")
        return ArchClass::Arm64;
    if (name == "x86_64" || name == "amd64" || name == "x64")
        return ArchClass::X64;
    return ArchClass::Other;
}

PlatformKey make_platform_key(const std::string& os_name, const std::string& arch_name) {
    PlatformKey key;
    key.os        = classify_os(os_name);
    key.arch      = classify_arch(arch_name);
    key.os_name   = os_name;
    key.arch_name = arch_name;
    return key;
}

PlatformKey detect_host() {
    return make_platform_key(host_os_name(), host_arch_name());
}

bool is_elevated() {
#ifdef _WIN32
    return false;
#else
    return geteuid() == 0;
#endif
}

const char* to_string(OsClass os) {
    switch (os) {
        case OsClass::MacOS:   return "macos";
        case OsClass::Windows: return "windows";
        case OsClass::Linux:   return "linux";
        case OsClass::Other:   return "other";
    }
    return "other";
}

const char* to_string(ArchClass arch) {
    switch (arch) {
        case ArchClass::Arm64: return "arm64";
        case ArchClass::X64:   return "x64";
        case ArchClass::Other: return "other";
    }
    return "other";
}

}  // namespace Platform
}  // namespace System
}  // namespace Porter
