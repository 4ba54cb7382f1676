#pragma once
#include <string>
#include <vector>

namespace Porter {
namespace System {
namespace Process {

struct Command {
    std::string              program;
    std::vector<std::string> args;
    bool                     quiet = false;  // discard stdout/stderr of the child

    std::string display() const;
};

struct CommandResult {
    bool        started   = false;
    int         exit_code = -1;
    std::string error;

    bool success() const { return started && exit_code == 0; }
};

// Every external tool goes through this seam; tests substitute a recording fake.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const Command& command) = 0;
};

// Runs the command as a child process and blocks until it exits.
class ProcessRunner : public CommandRunner {
public:
    CommandResult run(const Command& command) override;
};

}  // namespace Process
}  // namespace System
}  // namespace Porter
