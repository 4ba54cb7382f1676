#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "../core/types/constants.hpp"
#include "../core/types/status.hpp"
#include "../system/platform/platform.hpp"
#include "../system/process/command_runner.hpp"
#include "../system/process/tool_prober.hpp"

namespace Porter {
namespace Fetch {

using Porter::System::Platform::OsClass;
using Porter::System::Process::Command;
using Porter::System::Process::CommandRunner;
using Porter::System::Process::ToolProber;

// One external fetch tool. The first candidate whose tool is on PATH wins.
struct FetchTool {
    std::string name;
    Command (*build)(const std::string& url, const std::filesystem::path& output, int retries);
};

class Downloader {
public:
    Downloader(const ToolProber& prober,
               CommandRunner&    runner,
               OsClass           os,
               int               retries = Core::Constants::DEFAULT_DOWNLOAD_RETRIES);

    Core::Status download(const std::string& url, const std::filesystem::path& output) const;

    static std::vector<FetchTool> candidates_for(OsClass os);

private:
    const ToolProber& prober_;
    CommandRunner&    runner_;
    OsClass           os_;
    int               retries_;
};

}  // namespace Fetch
}  // namespace Porter
