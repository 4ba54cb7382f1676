#include "tool_prober.hpp"

namespace Porter {
namespace System {
namespace Process {

ToolProber::ToolProber(CommandRunner& runner) : runner_(runner) {}

bool ToolProber::exists(const std::string& command_name) const {
    Command probe;
#ifdef _WIN32
    probe.program = "where";
#else
    probe.program = "which";
#endif
    probe.args  = {command_name};
    probe.quiet = true;
    return runner_.run(probe).success();
}

}  // namespace Process
}  // namespace System
}  // namespace Porter
