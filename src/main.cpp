/**
 * gas - Git Account Switcher
 *
 * Main entry point for the command line tool.
 * Selects the Git account for each credential request from the directory
 * the request comes from.
 *
 * @version 0.3.0
 * @license MIT
 */

#include <memory>
#include <iostream>
#include <csignal>
#include <signal.h>
#include <string>
#include <vector>

#include "core/Application.hpp"
#include "core/Logger.hpp"
#include "utils/PathUtils.hpp"

// Global application instance for signal handling
std::unique_ptr<gas::core::Application> g_app;

/**
 * Signal handler for interrupting a device login
 */
void signalHandler(int) {
    if (g_app) {
        g_app->cancel();
    }
}

/**
 * Setup signal handlers for graceful shutdown
 *
 * Without SA_RESTART a blocked secret prompt fails with EINTR.
 */
void setupSignalHandlers() {
    struct sigaction action{};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    // Parse command line arguments
    gas::core::StartupOptions options;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (!command.empty()) {
            args.push_back(arg);
        } else if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            gas::core::Application::printUsage(std::cout);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << gas::core::Application::getName() << " "
                      << gas::core::Application::getVersion() << std::endl;
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "gas: unknown option '" << arg << "'" << std::endl;
            return 2;
        } else {
            command = arg;
        }
    }

    if (command.empty()) {
        gas::core::Application::printUsage(std::cerr);
        return 2;
    }

    options.helperMode = command == "get" || command == "store" || command == "erase";

    try {
        g_app = std::make_unique<gas::core::Application>(gas::utils::PathUtils::getConfigDir());

        if (!g_app->initialize(options)) {
            std::cerr << "gas: initialization failed, see " << gas::utils::PathUtils::getLogsPath().string() << std::endl;
            return 1;
        }

        setupSignalHandlers();

        int status = g_app->run(command, args);
        g_app.reset();
        return status;

    } catch (const std::exception& e) {
        gas::core::Logger::instance().critical("Unhandled exception: {}", e.what());
        std::cerr << "gas: " << e.what() << std::endl;
        return 1;
    }
}
