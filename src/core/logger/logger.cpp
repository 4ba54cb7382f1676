#include "logger.hpp"
#include <iostream>

#ifdef _WIN32
    #include <io.h>
    #define PORTER_ISATTY _isatty
    #define PORTER_STDOUT_FD 1
    #define PORTER_STDERR_FD 2
#else
    #include <unistd.h>
    #define PORTER_ISATTY isatty
    #define PORTER_STDOUT_FD STDOUT_FILENO
    #define PORTER_STDERR_FD STDERR_FILENO
#endif

namespace Porter {
namespace Core {

int Logger::level_ = LogLevel::LOG_ALL;

std::mutex Logger::mutex_;

namespace {
    const std::string RESET  = "\033[0m";
    const std::string RED    = "\033[31m";
    const std::string GREEN  = "\033[32m";
    const std::string YELLOW = "\033[33m";
    const std::string BLUE   = "\033[34m";
    const std::string GREY   = "\033[90m";

    void write_line(std::ostream& stream, int fd, const std::string& color,
                    const std::string& prefix, const std::string& message) {
        if (PORTER_ISATTY(fd)) {
            stream << color << prefix << RESET << message << std::endl;
        } else {
            stream << prefix << message << std::endl;
        }
    }
}

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::debug(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_DEBUG) {
        write_line(std::cout, PORTER_STDOUT_FD, GREY, "[DEBUG] ", message);
    }
}

void Logger::info(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_INFO) {
        write_line(std::cout, PORTER_STDOUT_FD, BLUE, "[INFO] ", message);
    }
}

void Logger::success(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_SUCCESS) {
        write_line(std::cout, PORTER_STDOUT_FD, GREEN, "[SUCCESS] ", message);
    }
}

void Logger::warn(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_WARN) {
        write_line(std::cerr, PORTER_STDERR_FD, YELLOW, "[WARN] ", message);
    }
}

void Logger::error(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_ERROR) {
        write_line(std::cerr, PORTER_STDERR_FD, RED, "[ERROR] ", message);
    }
}

void Logger::print(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ != LogLevel::LOG_NONE) {
        std::cout << message << std::endl;
    }
}

}  // namespace Core
}  // namespace Porter
