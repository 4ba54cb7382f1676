#include "config.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

#include "../logger/logger.hpp"


namespace Porter {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["install_root"])
            config.install_root = yaml["install_root"].as<std::string>();
        if (yaml["browser_version"])
            config.browser_version = yaml["browser_version"].as<std::string>();
        if (yaml["version"])
            config.browser_version = yaml["version"].as<std::string>();
        if (yaml["base_url"])
            config.base_url = yaml["base_url"].as<std::string>();
        if (yaml["download_retries"])
            config.download_retries = yaml["download_retries"].as<int>();
        if (yaml["with_deps"])
            config.with_deps = yaml["with_deps"].as<bool>();
        if (yaml["quiet"])
            config.quiet = yaml["quiet"].as<bool>();
        if (yaml["verbose"])
            config.verbose = yaml["verbose"].as<bool>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }

    if (config.download_retries < 0)
        throw std::runtime_error("Error parsing config file: download_retries must not be negative");
    if (config.browser_version.empty())
        throw std::runtime_error("Error parsing config file: browser_version must not be empty");
}

int Config::log_level() const {
    if (quiet)
        return LogLevel::LOG_QUIET;
    if (verbose)
        return LogLevel::LOG_VERBOSE;
    return LogLevel::LOG_ALL;
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Porter - BrowserOS installer"};
    app.require_subcommand(0, 1);

    app.add_flag("--version", config.show_version, "Print the porter version and exit");

    CLI::App* install = app.add_subcommand("install", "Download and install BrowserOS");
    install->add_flag("--with-deps", config.with_deps,
                      "Install system shared-library dependencies (Linux only)");
    install->add_option("--config", config.config_path, "Path to YAML configuration file");
    install->add_option("--install-root", config.install_root, "Install directory (default ~/.browseros)");
    install->add_option("--browser-version", config.browser_version, "BrowserOS release to install");
    install->add_option("--base-url", config.base_url, "Release download base URL");
    install->add_option("--download-retries", config.download_retries, "Retries passed to curl")
        ->check(CLI::NonNegativeNumber);
    install->add_flag("-q,--quiet", config.quiet, "Only print warnings, errors and the final report");
    install->add_flag("-v,--verbose", config.verbose, "Print every external command");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    if (install->parsed())
        config.command = "install";

    return config;
}

}  // namespace Core
}  // namespace Porter
