/**
 * PlatformUtils.cpp
 *
 * POSIX system utilities.
 */

#include "PlatformUtils.hpp"

#include <cerrno>
#include <cstdlib>
#include <iostream>

#include <unistd.h>
#include <termios.h>
#include <sys/wait.h>

namespace gas::utils {

// -- Process management --

int PlatformUtils::runProcess(const std::vector<std::string>& args,
                              const std::map<std::string, std::string>& extraEnv) {
    if (args.empty()) return -1;

    pid_t pid = fork();
    if (pid < 0) return -1;

    if (pid == 0) {
        // Child process
        for (const auto& [name, value] : extraEnv) {
            setenv(name.c_str(), value.c_str(), 1);
        }

        std::vector<char*> argv;
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execvp(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// -- File associations --

bool PlatformUtils::openUrl(const std::string& url) {
#ifdef __APPLE__
    return runProcess({"open", url}) == 0;
#else
    return runProcess({"xdg-open", url}) == 0;
#endif
}

// -- Environment --

std::optional<std::string> PlatformUtils::getEnv(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) return std::string(val);
    return std::nullopt;
}

// -- Terminal --

bool PlatformUtils::isInteractive(int fd) {
    return isatty(fd) == 1;
}

std::optional<std::string> PlatformUtils::readLine(bool hideInput) {
    termios saved{};
    bool restore = false;

    if (hideInput && isInteractive(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved) == 0) {
        termios silent = saved;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        restore = tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
    }

    std::string line;
    bool ok = static_cast<bool>(std::getline(std::cin, line));

    if (restore) {
        tcsetattr(STDIN_FILENO, TCSANOW, &saved);
        std::cerr << std::endl;
    }

    if (!ok) return std::nullopt;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

} // namespace gas::utils
