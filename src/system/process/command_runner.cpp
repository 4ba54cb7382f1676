#include "command_runner.hpp"
#include "../../core/logger/logger.hpp"
#include <cerrno>
#include <cstring>

#ifdef _WIN32
    #include <windows.h>
#else
    #include <fcntl.h>
    #include <sys/types.h>
    #include <sys/wait.h>
    #include <unistd.h>
#endif

namespace Porter {
namespace System {
namespace Process {

using namespace Porter::Core;

namespace {

// Quotes an argument so CommandLineToArgvW splits it back unchanged:
// backslashes are literal unless they precede a quote or the closing quote.
std::string quote_if_needed(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"'") == std::string::npos)
        return arg;

    std::string quoted = "\"";
    std::size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
        } else {
            quoted.append(backslashes, '\\');
        }
        backslashes = 0;
        quoted += c;
    }
    quoted.append(backslashes * 2, '\\');
    return quoted + "\"";
}

}  // namespace

std::string Command::display() const {
    std::string line = quote_if_needed(program);
    for (const auto& arg : args) {
        line += " " + quote_if_needed(arg);
    }
    return line;
}

#ifdef _WIN32

CommandResult ProcessRunner::run(const Command& command) {
    Logger::debug("Exec: " + command.display());

    CommandResult result;
    std::string   command_line = command.display();

    STARTUPINFOA si;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);

    HANDLE null_handle = INVALID_HANDLE_VALUE;
    if (command.quiet) {
        SECURITY_ATTRIBUTES sa;
        sa.nLength              = sizeof(sa);
        sa.lpSecurityDescriptor = NULL;
        sa.bInheritHandle       = TRUE;
        null_handle = CreateFileA("NUL", GENERIC_WRITE, FILE_SHARE_WRITE, &sa, OPEN_EXISTING, 0, NULL);
        if (null_handle != INVALID_HANDLE_VALUE) {
            si.dwFlags |= STARTF_USESTDHANDLES;
            si.hStdInput  = GetStdHandle(STD_INPUT_HANDLE);
            si.hStdOutput = null_handle;
            si.hStdError  = null_handle;
        }
    }

    PROCESS_INFORMATION pi;
    ZeroMemory(&pi, sizeof(pi));

    BOOL created = CreateProcessA(NULL, const_cast<char*>(command_line.c_str()), NULL, NULL,
                                  command.quiet ? TRUE : FALSE, 0, NULL, NULL, &si, &pi);
    if (null_handle != INVALID_HANDLE_VALUE)
        CloseHandle(null_handle);

    if (!created) {
        result.error = "CreateProcess failed with error " + std::to_string(GetLastError());
        return result;
    }

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD code = 1;
    GetExitCodeProcess(pi.hProcess, &code);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);

    result.started   = true;
    result.exit_code = static_cast<int>(code);
    return result;
}

#else

CommandResult ProcessRunner::run(const Command& command) {
    Logger::debug("Exec: " + command.display());

    CommandResult result;

    // The child writes its errno here if exec fails; the pipe closes on a
    // successful exec, so an empty read means the program started.
    int err_pipe[2];
    if (pipe(err_pipe) != 0) {
        result.error = std::strerror(errno);
        return result;
    }
    fcntl(err_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(err_pipe[1], F_SETFD, FD_CLOEXEC);

    std::vector<const char*> argv;
    argv.push_back(command.program.c_str());
    for (const auto& arg : command.args)
        argv.push_back(arg.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::strerror(errno);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        close(err_pipe[0]);
        if (command.quiet) {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
        }
        execvp(command.program.c_str(), const_cast<char* const*>(argv.data()));
        int exec_errno = errno;
        ssize_t ignored = write(err_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    close(err_pipe[1]);
    int     exec_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.error = std::strerror(errno);
            return result;
        }
    }

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.error = std::strerror(exec_errno);
        return result;
    }

    result.started = true;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.error     = "terminated by signal " + std::to_string(WTERMSIG(status));
    }
    return result;
}

#endif

}  // namespace Process
}  // namespace System
}  // namespace Porter
