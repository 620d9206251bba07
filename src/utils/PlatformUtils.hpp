// gas - Platform Utilities
// Process, terminal and environment helpers

#pragma once

#include <map>
#include <string>
#include <vector>
#include <optional>

namespace gas::utils {

/**
 * @brief Platform-specific utilities
 */
class PlatformUtils {
public:
    // Process management

    /**
     * @brief Run a program and wait for it
     * @param args argv of the child, args[0] is looked up in PATH
     * @param extraEnv Variables added to the child's environment only
     * @return Child exit code, 128+N if killed by signal N, -1 if it could not be started
     */
    static int runProcess(const std::vector<std::string>& args,
                          const std::map<std::string, std::string>& extraEnv = {});


    // File associations
    static bool openUrl(const std::string& url);

    // Environment
    static std::optional<std::string> getEnv(const std::string& name);

    // Terminal
    static bool isInteractive(int fd);
    static std::optional<std::string> readLine(bool hideInput);
};

} // namespace gas::utils
