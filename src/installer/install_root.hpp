#pragma once
#include <filesystem>

#include "../core/types/status.hpp"

namespace Porter {
namespace Installer {

namespace fs = std::filesystem;

// The only tree the installer writes to. Directories are created on demand.
class InstallRoot {
public:
    explicit InstallRoot(fs::path base);

    // $HOME/.browseros (the passwd entry when HOME is unset), or
    // <temp>/.browseros when no home directory is known.
    static InstallRoot for_current_user();

    const fs::path& base() const { return base_; }
    fs::path        downloads_dir() const;
    fs::path        mount_dir() const;
    fs::path        app_bundle_dir() const;
    fs::path        bin_dir() const;

    // Succeeds when the directory already exists.
    static Core::Status ensure_directory(const fs::path& path);

private:
    fs::path base_;
};

}  // namespace Installer
}  // namespace Porter
