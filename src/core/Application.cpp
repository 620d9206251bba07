/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "accounts/AccountManager.hpp"
#include "accounts/AccountStore.hpp"
#include "accounts/RuleResolver.hpp"
#include "accounts/StateFile.hpp"
#include "auth/DeviceFlow.hpp"
#include "auth/LibSecretVault.hpp"
#include "auth/TokenStorage.hpp"
#include "credential/CredentialHandler.hpp"
#include "credential/OverrideContext.hpp"
#include "credential/ResolutionChain.hpp"
#include "../utils/FileUtils.hpp"
#include "../utils/HttpClient.hpp"
#include "../utils/PlatformUtils.hpp"

#include <iostream>
#include <optional>
#include <unistd.h>

namespace gas::core {

namespace fs = std::filesystem;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_INTERRUPTED = 130;

int usageError(const std::string& message) {
    std::cerr << "gas: " << message << "\n"
              << "Run 'gas --help' for usage." << std::endl;
    return EXIT_USAGE;
}

/**
 * Take the value following a flag
 * @return false if the flag is the last argument
 */
bool takeValue(const std::vector<std::string>& args, size_t& i, std::string& value) {
    if (i + 1 >= args.size()) {
        return false;
    }
    value = args[++i];
    return true;
}

} // namespace

Application::Application(fs::path configDir)
    : Application(std::move(configDir), nullptr, nullptr) {
}

Application::Application(fs::path configDir,
                         std::unique_ptr<auth::SecretVault> vault,
                         std::unique_ptr<utils::HttpTransport> http)
    : m_configDir(std::move(configDir))
    , m_vault(std::move(vault))
    , m_http(std::move(http)) {
}

Application::~Application() {
    Logger::instance().flush();
}

void Application::printUsage(std::ostream& out) {
    out << "gas - Git Account Switcher\n"
        << "\nUsage: gas [options] <command> [arguments]\n"
        << "\nCommands:\n"
        << "  add <name> [--host H] [--username U] [--token|--password]\n"
        << "                       Register an account (device login unless a secret is given on stdin)\n"
        << "  remove <name>        Remove an account, its directory rules and its secret\n"
        << "  use <name> [--path DIR]\n"
        << "                       Use the account for DIR (default: current directory)\n"
        << "  default <name>       Use the account where no directory rule matches\n"
        << "  list                 Show accounts and directory rules\n"
        << "  with <name> [--] <command...>\n"
        << "                       Run one command as the account\n"
        << "  setup                Register gas as git's credential helper\n"
        << "  get | store | erase  Credential helper verbs, called by git\n"
        << "\nOptions:\n"
        << "  -d, --debug    Enable debug output on stderr\n"
        << "  -h, --help     Show this help message\n"
        << "  -v, --version  Show version information\n";
}

void Application::loadConfiguration(bool writeDefaults) {
    auto& config = Config::instance();
    auto configPath = m_configDir / "config.json";

    config.setDefaults();

    if (fs::exists(configPath)) {
        if (!config.load(configPath.string())) {
            std::cerr << "gas: ignoring unreadable " << configPath.string() << std::endl;
        }
    } else if (writeDefaults) {
        config.save(configPath.string());
    }
}

bool Application::initialize(const StartupOptions& options) {
    if (m_initialized) {
        return true;
    }

    loadConfiguration(!options.helperMode);

    auto& config = Config::instance();

    LoggerOptions logOptions;
    logOptions.consoleLevel = options.debug
        ? LogLevel::Debug
        : Logger::parseLevel(config.get<std::string>("logging.level", "warn"));
    if (config.get<bool>("logging.file", true)) {
        logOptions.logDir = (m_configDir / "logs").string();
    }
    logOptions.maxFileSize = static_cast<size_t>(config.get<int>("logging.maxSizeMb", 5)) * 1024 * 1024;
    logOptions.maxFiles = static_cast<size_t>(config.get<int>("logging.maxFiles", 3));
    Logger::instance().initialize(logOptions);

    LOG_DEBUG("gas {} starting (config {}, helper {})", getVersion(), m_configDir.string(), options.helperMode);

    try {
        if (!m_vault) {
            m_vault = std::make_unique<auth::LibSecretVault>(config.get<std::string>("vault.service", "gas"));
        }

        if (!m_http) {
            utils::HttpOptions httpDefaults;
            httpDefaults.timeoutSeconds = config.get<int>("oauth.timeoutSeconds", 30);
            httpDefaults.userAgent = getName() + "/" + getVersion();
            m_http = std::make_unique<utils::HttpClient>(httpDefaults);
        }

        auth::DeviceFlowEndpoints endpoints;
        endpoints.clientId = config.get<std::string>("oauth.clientId", endpoints.clientId);
        endpoints.scope = config.get<std::string>("oauth.scope", endpoints.scope);
        endpoints.deviceCodeUrl = config.get<std::string>("oauth.deviceCodeUrl", endpoints.deviceCodeUrl);
        endpoints.tokenUrl = config.get<std::string>("oauth.tokenUrl", endpoints.tokenUrl);
        endpoints.userUrl = config.get<std::string>("oauth.userUrl", endpoints.userUrl);
        endpoints.timeoutSeconds = config.get<int>("oauth.timeoutSeconds", endpoints.timeoutSeconds);

        utils::LockPolicy lockPolicy;
        lockPolicy.retries = config.get<int>("lock.retries", lockPolicy.retries);
        lockPolicy.backoff = std::chrono::milliseconds(config.get<int>("lock.backoffMs", 25));
        lockPolicy.maxBackoff = std::chrono::milliseconds(config.get<int>("lock.maxBackoffMs", 500));

        m_tokens = std::make_unique<auth::TokenStorage>(*m_vault, config.get<std::string>("vault.service", "gas"));
        m_deviceFlow = std::make_unique<auth::DeviceFlowClient>(*m_http, m_clock, endpoints);
        m_state = std::make_unique<accounts::StateFile>(m_configDir / "state.json", lockPolicy);
        m_accounts = std::make_unique<accounts::AccountStore>(*m_state, *m_tokens);
        m_rules = std::make_unique<accounts::RuleResolver>(*m_state, config.get<bool>("paths.caseInsensitive", false));
        m_manager = std::make_unique<accounts::AccountManager>(*m_accounts, *m_rules, *m_tokens, *m_deviceFlow);
        m_chain = credential::ResolutionChain::standard(
            credential::OverrideContext::fromEnvironment(), *m_rules, *m_accounts);
        m_handler = std::make_unique<credential::CredentialHandler>(
            *m_chain, *m_accounts, *m_tokens, *m_manager, m_clock);

    } catch (const std::exception& e) {
        LOG_CRITICAL("Failed to initialize: {}", e.what());
        return false;
    }

    m_initialized = true;
    return true;
}

int Application::run(const std::string& command, const std::vector<std::string>& args) {
    if (!m_initialized) {
        LOG_ERROR("Application not initialized");
        return EXIT_ERROR;
    }

    try {
        if (command == "get" || command == "store" || command == "erase") return cmdHelper(command);
        if (command == "add") return cmdAdd(args);
        if (command == "remove") return cmdRemove(args);
        if (command == "use") return cmdUse(args);
        if (command == "default") return cmdDefault(args);
        if (command == "list") return cmdList();
        if (command == "with") return cmdWith(args);
        if (command == "setup") return cmdSetup();
        return usageError("unknown command '" + command + "'");

    } catch (const GasError& e) {
        LOG_DEBUG("{} failed with {} error", command, errorKindName(e.kind()));
        std::cerr << "gas: " << e.what() << std::endl;
        return e.kind() == ErrorKind::Cancelled ? EXIT_INTERRUPTED : EXIT_ERROR;

    } catch (const std::exception& e) {
        LOG_CRITICAL("Unhandled exception in {}: {}", command, e.what());
        std::cerr << "gas: " << e.what() << std::endl;
        return EXIT_ERROR;
    }
}

int Application::cmdHelper(const std::string& verb) {
    auto parsed = credential::parseVerb(verb);
    if (!parsed) {
        return EXIT_USAGE;
    }

    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) {
        LOG_ERROR("Cannot determine working directory: {}", ec.message());
        return EXIT_ERROR;
    }

    return m_handler->run(*parsed, std::cin, std::cout, cwd);
}

int Application::cmdAdd(const std::vector<std::string>& args) {
    if (args.empty()) {
        return usageError("add: missing account name");
    }

    std::string nickname = args[0];
    std::string host = Config::instance().get<std::string>("oauth.host", "github.com");
    std::string username;
    std::optional<models::AuthKind> secretKind;

    for (size_t i = 1; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--host") {
            if (!takeValue(args, i, host)) return usageError("add: --host needs a value");
        } else if (arg == "--username") {
            if (!takeValue(args, i, username)) return usageError("add: --username needs a value");
        } else if (arg == "--token") {
            secretKind = models::AuthKind::PersonalAccessToken;
        } else if (arg == "--password") {
            secretKind = models::AuthKind::StaticPassword;
        } else {
            return usageError("add: unknown option '" + arg + "'");
        }
    }

    models::Account account;

    if (secretKind) {
        if (utils::PlatformUtils::isInteractive(STDIN_FILENO)) {
            std::cerr << (*secretKind == models::AuthKind::StaticPassword ? "Password" : "Token")
                      << " for " << nickname << ": " << std::flush;
        }
        auto secret = utils::PlatformUtils::readLine(true);
        if (m_cancel.isCancelled()) {
            throw GasError(ErrorKind::Cancelled, "add: cancelled");
        }
        if (!secret || secret->empty()) {
            return usageError("add: no secret given on stdin");
        }
        account = m_manager->addSecretAccount(nickname, host, username, *secret, *secretKind);

    } else {
        auto showCode = [](const auth::DeviceAuthorization& authorization) {
            std::cerr << "First copy your one-time code: " << authorization.userCode << "\n"
                      << "Then open " << authorization.verificationUri << " and enter it.\n";
            if (utils::PlatformUtils::isInteractive(STDERR_FILENO)
                && !utils::PlatformUtils::openUrl(authorization.verificationUri)) {
                LOG_DEBUG("Could not open a browser for {}", authorization.verificationUri);
            }
            std::cerr << "Waiting for authorization (Ctrl+C to cancel)..." << std::endl;
        };
        account = m_manager->addOAuthAccount(nickname, host, username, showCode, m_cancel);
    }

    std::cerr << "Account '" << account.nickname << "' registered as " << account.username
              << " on " << account.host << "." << std::endl;
    return EXIT_OK;
}

int Application::cmdRemove(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usageError("remove: expected exactly one account name");
    }

    if (!m_manager->removeAccount(args[0])) {
        std::cerr << "gas: no account named '" << args[0] << "'" << std::endl;
        return EXIT_ERROR;
    }

    std::cerr << "Account '" << args[0] << "' removed." << std::endl;
    return EXIT_OK;
}

int Application::cmdUse(const std::vector<std::string>& args) {
    if (args.empty()) {
        return usageError("use: missing account name");
    }

    fs::path directory;
    for (size_t i = 1; i < args.size(); ++i) {
        std::string value;
        if (args[i] == "--path" && takeValue(args, i, value)) {
            directory = value;
        } else {
            return usageError("use: unexpected argument '" + args[i] + "'");
        }
    }

    if (directory.empty()) {
        directory = fs::current_path();
    }

    auto rule = m_manager->useDirectory(args[0], directory);
    std::cerr << "Directory " << rule.prefix << " now uses '" << rule.nickname << "'." << std::endl;
    return EXIT_OK;
}

int Application::cmdDefault(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usageError("default: expected exactly one account name");
    }

    m_manager->setDefaultAccount(args[0]);
    std::cerr << "Default account is now '" << args[0] << "'." << std::endl;
    return EXIT_OK;
}

int Application::cmdList() {
    auto accounts = m_accounts->list();
    auto defaultAccount = m_accounts->defaultAccount();

    std::cout << "--- Accounts ---\n";
    if (accounts.empty()) {
        std::cout << "(none)\n";
    }
    for (const auto& account : accounts) {
        bool isDefault = defaultAccount && *defaultAccount == account.nickname;
        std::cout << account.nickname << (isDefault ? " *" : "") << ": "
                  << account.username << "@" << account.host
                  << " (" << models::authKindLabel(account.kind) << ")\n";
    }

    auto rules = m_rules->rules();
    if (!rules.empty()) {
        std::cout << "--- Directories ---\n";
        for (const auto& rule : rules) {
            std::cout << rule.prefix << " -> " << rule.nickname << "\n";
        }
    }

    std::cout.flush();
    return EXIT_OK;
}

int Application::cmdWith(const std::vector<std::string>& args) {
    if (args.empty()) {
        return usageError("with: missing account name");
    }

    size_t first = 1;
    if (first < args.size() && args[first] == "--") {
        ++first;
    }
    if (first >= args.size()) {
        return usageError("with: missing command");
    }

    if (!m_accounts->get(args[0])) {
        throw GasError(ErrorKind::NotFound, "no account named '" + args[0] + "'");
    }

    std::vector<std::string> command(args.begin() + static_cast<std::ptrdiff_t>(first), args.end());
    LOG_DEBUG("Running {} as {}", command.front(), args[0]);

    int status = utils::PlatformUtils::runProcess(command, credential::OverrideContext::childEnvironment(args[0]));
    if (status < 0) {
        std::cerr << "gas: could not start '" << command.front() << "'" << std::endl;
        return EXIT_ERROR;
    }
    return status;
}

int Application::cmdSetup() {
    auto executable = utils::FileUtils::getExecutablePath();
    if (executable.empty()) {
        throw GasError(ErrorKind::Config, "cannot determine the path of the gas executable");
    }

    // 5 means there was nothing to unset
    int unset = utils::PlatformUtils::runProcess({"git", "config", "--global", "--unset-all", "credential.helper"});
    if (unset != 0 && unset != 5) {
        std::cerr << "gas: git config --unset-all failed with status " << unset << std::endl;
        return EXIT_ERROR;
    }

    const std::vector<std::string> helpers = {"", "!\"" + executable + "\""};
    for (const auto& helper : helpers) {
        int status = utils::PlatformUtils::runProcess(
            {"git", "config", "--global", "--add", "credential.helper", helper});
        if (status != 0) {
            std::cerr << "gas: git config --add failed with status " << status << std::endl;
            return EXIT_ERROR;
        }
    }

    LOG_INFO("Registered {} as credential helper", executable);
    std::cerr << "gas is now git's credential helper." << std::endl;
    return EXIT_OK;
}

} // namespace gas::core
