#include <exception>
#include <iostream>

#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "core/types/constants.hpp"
#include "engine/orchestrator/orchestrator.hpp"
#include "system/platform/platform.hpp"
#include "system/process/command_runner.hpp"

namespace {

using namespace Porter;

int run_install(const Core::Config& config) {
    Engine::InstallOptions options;
    options.with_deps        = config.with_deps;
    options.install_root     = config.install_root;
    options.version          = config.browser_version;
    options.base_url         = config.base_url;
    options.download_retries = config.download_retries;
    options.elevate          = !System::Platform::is_elevated();

    const auto host = System::Platform::detect_host();
    Core::Logger::debug("Host platform: " + host.os_name + " / " + host.arch_name);

    System::Process::ProcessRunner runner;
    Engine::Orchestrator           orchestrator(options, host, runner);
    return orchestrator.run();
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = Porter::Core::Config::parse(argc, argv);
        Porter::Core::Logger::set_level(config.log_level());

        if (config.show_version) {
            std::cout << Porter::Core::Constants::PROGRAM_NAME << " "
                      << Porter::Core::Constants::VERSION << std::endl;
            return Porter::Core::Constants::EXIT_CODE_OK;
        }

        if (config.command != "install") {
            Porter::Core::Logger::error("No command given. Run: "
                                        + std::string(Porter::Core::Constants::PROGRAM_NAME)
                                        + " install [--with-deps]");
            return Porter::Core::Constants::EXIT_CODE_FAILURE;
        }

        return run_install(config);
    } catch (const std::exception& e) {
        Porter::Core::Logger::error(e.what());
        return Porter::Core::Constants::EXIT_CODE_FAILURE;
    }
}
