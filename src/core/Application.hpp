#pragma once

/**
 * Application.hpp
 *
 * Wires configuration, logging, the vault and the account subsystems
 * together and dispatches command-line commands.
 */

#include "auth/Clock.hpp"

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace gas::utils { class HttpTransport; }

namespace gas::core::auth {
class SecretVault;
class TokenStorage;
class DeviceFlowClient;
}

namespace gas::core::accounts {
class StateFile;
class AccountStore;
class RuleResolver;
class AccountManager;
}

namespace gas::core::credential {
class ResolutionChain;
class CredentialHandler;
}

namespace gas::core {

/**
 * Options taken from the command line before the command name
 */
struct StartupOptions {
    bool debug{false};
    bool helperMode{false};     // invoked by git as a credential helper
};

/**
 * Main application class
 *
 * Owns every subsystem for the lifetime of one command.
 */
class Application {
public:
    /**
     * Constructor using the platform vault and a cpr client
     * @param configDir Directory holding config.json, state.json and logs
     */
    explicit Application(std::filesystem::path configDir);

    /**
     * Constructor with injected backends
     * @param configDir Directory holding config.json, state.json and logs
     * @param vault Secret store, the platform vault when null
     * @param http HTTP transport, a cpr client when null
     */
    Application(std::filesystem::path configDir,
                std::unique_ptr<auth::SecretVault> vault,
                std::unique_ptr<utils::HttpTransport> http);

    ~Application();

    // Disable copy and move
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Load configuration, start logging and build the subsystems
     * @param options Startup options
     * @return true if initialization successful
     */
    bool initialize(const StartupOptions& options);

    /**
     * Run one command
     * @param command Command name
     * @param args Arguments after the command name
     * @return Process exit code
     */
    int run(const std::string& command, const std::vector<std::string>& args);

    /**
     * Interrupt a running device flow; safe to call from a signal handler
     */
    void cancel() { m_cancel.cancel(); }

    static std::string getVersion() { return "0.3.0"; }
    static std::string getName() { return "gas"; }

    static void printUsage(std::ostream& out);

private:
    int cmdHelper(const std::string& verb);
    int cmdAdd(const std::vector<std::string>& args);
    int cmdRemove(const std::vector<std::string>& args);
    int cmdUse(const std::vector<std::string>& args);
    int cmdDefault(const std::vector<std::string>& args);
    int cmdList();
    int cmdWith(const std::vector<std::string>& args);
    int cmdSetup();

    void loadConfiguration(bool writeDefaults);

private:
    std::filesystem::path m_configDir;
    auth::CancellationToken m_cancel;
    auth::SystemClock m_clock;

    std::unique_ptr<auth::SecretVault> m_vault;
    std::unique_ptr<utils::HttpTransport> m_http;
    std::unique_ptr<auth::TokenStorage> m_tokens;
    std::unique_ptr<auth::DeviceFlowClient> m_deviceFlow;
    std::unique_ptr<accounts::StateFile> m_state;
    std::unique_ptr<accounts::AccountStore> m_accounts;
    std::unique_ptr<accounts::RuleResolver> m_rules;
    std::unique_ptr<accounts::AccountManager> m_manager;
    std::unique_ptr<credential::ResolutionChain> m_chain;
    std::unique_ptr<credential::CredentialHandler> m_handler;

    bool m_initialized{false};
};

} // namespace gas::core
