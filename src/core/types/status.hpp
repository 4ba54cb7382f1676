#pragma once
#include <string>
#include <utility>

namespace Porter {
namespace Core {

enum class ErrorKind {
    None,
    UnsupportedPlatform,
    UnsupportedPackageManager,
    DependencyInstallPartialFailure,
    DirectoryCreationFailure,
    NoFetchToolAvailable,
    DownloadCommandFailure,
    MountFailure,
    BundleNotFound,
    CopyFailure,
    ExecutableNotFound,
    PermissionChangeFailure
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                            return "none";
        case ErrorKind::UnsupportedPlatform:             return "unsupported-platform";
        case ErrorKind::UnsupportedPackageManager:       return "unsupported-package-manager";
        case ErrorKind::DependencyInstallPartialFailure: return "dependency-install-partial-failure";
        case ErrorKind::DirectoryCreationFailure:        return "directory-creation-failure";
        case ErrorKind::NoFetchToolAvailable:            return "no-fetch-tool-available";
        case ErrorKind::DownloadCommandFailure:          return "download-command-failure";
        case ErrorKind::MountFailure:                    return "mount-failure";
        case ErrorKind::BundleNotFound:                  return "bundle-not-found";
        case ErrorKind::CopyFailure:                     return "copy-failure";
        case ErrorKind::ExecutableNotFound:              return "executable-not-found";
        case ErrorKind::PermissionChangeFailure:         return "permission-change-failure";
    }
    return "unknown";
}

// Outcome of a fallible pipeline step. Steps never exit the process; the
// orchestrator decides what is fatal.
struct Status {
    bool        success = true;
    ErrorKind   kind    = ErrorKind::None;
    std::string error;

    static Status ok() { return Status{}; }

    static Status fail(ErrorKind kind, std::string message) {
        return Status{false, kind, std::move(message)};
    }

    explicit operator bool() const { return success; }
};

}  // namespace Core
}  // namespace Porter
