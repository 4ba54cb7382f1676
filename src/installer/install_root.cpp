#include "install_root.hpp"
#include <cstdlib>
#include <system_error>
#include <utility>

#include "../core/types/constants.hpp"

#ifndef _WIN32
    #include <pwd.h>
    #include <unistd.h>
#endif

namespace Porter {
namespace Installer {

using namespace Porter::Core;

namespace {

fs::path home_directory() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (home && *home)
        return fs::path(home);

#ifndef _WIN32
    const passwd* entry = getpwuid(geteuid());
    if (entry && entry->pw_dir && *entry->pw_dir)
        return fs::path(entry->pw_dir);
#endif

    std::error_code ec;
    fs::path        tmp = fs::temp_directory_path(ec);
    return ec ? fs::current_path(ec) : tmp;
}

}  // namespace

InstallRoot::InstallRoot(fs::path base) : base_(std::move(base)) {}

InstallRoot InstallRoot::for_current_user() {
    return InstallRoot(home_directory() / Constants::INSTALL_DIR_NAME);
}

fs::path InstallRoot::downloads_dir() const {
    return base_ / Constants::DOWNLOADS_DIR;
}

fs::path InstallRoot::mount_dir() const {
    return base_ / Constants::MOUNT_DIR;
}

fs::path InstallRoot::app_bundle_dir() const {
    return base_ / Constants::APP_BUNDLE;
}

fs::path InstallRoot::bin_dir() const {
    return base_ / Constants::BIN_DIR;
}

Status InstallRoot::ensure_directory(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return Status::fail(ErrorKind::DirectoryCreationFailure, ec.message());
    }
    if (!fs::is_directory(path, ec)) {
        return Status::fail(ErrorKind::DirectoryCreationFailure, "path exists but is not a directory");
    }
    return Status::ok();
}

}  // namespace Installer
}  // namespace Porter
