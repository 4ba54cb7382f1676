#pragma once
#include <string>

#include "../types/constants.hpp"

namespace Porter {
namespace Core {

struct Config {
    std::string command;  // "install" when the subcommand was given
    bool        show_version = false;

    bool        with_deps = false;
    std::string config_path;
    std::string install_root;  // empty: $HOME/.browseros
    std::string browser_version  = Constants::BROWSER_VERSION;
    std::string base_url         = Constants::RELEASE_BASE_URL;
    int         download_retries = Constants::DEFAULT_DOWNLOAD_RETRIES;
    bool        quiet            = false;
    bool        verbose          = false;

    int log_level() const;

    static Config parse(int argc, char* argv[]);
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Porter
