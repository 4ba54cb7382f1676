#include "downloader.hpp"
#include "../core/logger/logger.hpp"

namespace Porter {
namespace Fetch {

using namespace Porter::Core;

namespace {

// Single-quoted PowerShell literal; an embedded quote is written twice.
std::string ps_literal(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'')
            quoted += '\'';
        quoted += c;
    }
    return quoted + "'";
}

Command powershell_command(const std::string& url, const std::filesystem::path& output, int) {
    std::string script = "$ProgressPreference='SilentlyContinue'; Invoke-WebRequest -Uri "
                         + ps_literal(url) + " -OutFile " + ps_literal(output.string());
    return Command{"powershell", {"-NoProfile", "-NonInteractive", "-Command", script}, false};
}

Command curl_command(const std::string& url, const std::filesystem::path& output, int retries) {
    return Command{
        "curl", {"-fL", "--retry", std::to_string(retries), "-o", output.string(), url}, false};
}

Command wget_command(const std::string& url, const std::filesystem::path& output, int) {
    return Command{"wget", {"-O", output.string(), url}, false};
}

}  // namespace

Downloader::Downloader(const ToolProber& prober, CommandRunner& runner, OsClass os, int retries)
    : prober_(prober), runner_(runner), os_(os), retries_(retries) {}

std::vector<FetchTool> Downloader::candidates_for(OsClass os) {
    if (os == OsClass::Windows) {
        return {{"powershell", &powershell_command}};
    }
    return {{"curl", &curl_command}, {"wget", &wget_command}};
}

Status Downloader::download(const std::string& url, const std::filesystem::path& output) const {
    for (const auto& tool : candidates_for(os_)) {
        if (!prober_.exists(tool.name))
            continue;

        Command command = tool.build(url, output, retries_);
        Logger::debug("Fetching with " + tool.name + ": " + command.display());

        auto result = runner_.run(command);
        if (!result.started) {
            return Status::fail(ErrorKind::DownloadCommandFailure,
                                "Failed to run " + tool.name + ": " + result.error);
        }
        if (result.exit_code != 0) {
            return Status::fail(ErrorKind::DownloadCommandFailure,
                                "Download failed for " + url
                                    + " (exit status: " + std::to_string(result.exit_code) + ")");
        }
        return Status::ok();
    }

    if (os_ == OsClass::Windows) {
        return Status::fail(ErrorKind::NoFetchToolAvailable, "PowerShell is not available in PATH");
    }
    return Status::fail(ErrorKind::NoFetchToolAvailable,
                        "Neither curl nor wget is available in PATH");
}

}  // namespace Fetch
}  // namespace Porter
