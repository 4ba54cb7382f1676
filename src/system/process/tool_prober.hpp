#pragma once
#include <string>
#include "command_runner.hpp"

namespace Porter {
namespace System {
namespace Process {

// Answers "is <name> on PATH?" with the platform locator (which/where).
// A locator that cannot run counts as "not found".
class ToolProber {
public:
    explicit ToolProber(CommandRunner& runner);

    bool exists(const std::string& command_name) const;

private:
    CommandRunner& runner_;
};

}  // namespace Process
}  // namespace System
}  // namespace Porter
