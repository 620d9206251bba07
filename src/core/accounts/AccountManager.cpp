/**
 * AccountManager.cpp
 *
 * Account management implementation.
 */

#include "AccountManager.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <cctype>

namespace gas::core::accounts {

using utils::StringUtils;

AccountManager::AccountManager(AccountStore& accounts,
                               RuleResolver& rules,
                               auth::TokenStorage& tokens,
                               auth::DeviceFlowClient& deviceFlow)
    : m_accounts(accounts)
    , m_rules(rules)
    , m_tokens(tokens)
    , m_deviceFlow(deviceFlow) {
}

bool AccountManager::isValidNickname(const std::string& nickname) {
    if (nickname.empty() || nickname.size() > 64) {
        return false;
    }
    return std::all_of(nickname.begin(), nickname.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '@';
    });
}

models::Account AccountManager::addOAuthAccount(const std::string& nickname,
                                                const std::string& host,
                                                const std::string& username,
                                                const DeviceCodeCallback& onDeviceCode,
                                                const auth::CancellationToken& cancel) {
    if (!isValidNickname(nickname)) {
        throw GasError(ErrorKind::Config, "invalid account name '" + nickname + "'");
    }

    auto authorization = m_deviceFlow.start();
    if (!authorization) {
        throw GasError(ErrorKind::Network, m_deviceFlow.getLastError());
    }

    if (onDeviceCode) {
        onDeviceCode(*authorization);
    }

    auto outcome = m_deviceFlow.poll(*authorization, cancel);

    switch (outcome.state) {
        case auth::DeviceFlowState::Approved:
            break;
        case auth::DeviceFlowState::Denied:
            throw GasError(ErrorKind::AuthDenied, outcome.error);
        case auth::DeviceFlowState::Expired:
            throw GasError(ErrorKind::AuthExpired, outcome.error);
        case auth::DeviceFlowState::Cancelled:
            throw GasError(ErrorKind::Cancelled, outcome.error);
        default:
            throw GasError(ErrorKind::Network, outcome.error);
    }

    if (!outcome.token) {
        throw GasError(ErrorKind::Network, "provider approved the request without issuing a token");
    }

    models::Account account;
    account.nickname = nickname;
    account.host = StringUtils::toLower(host);
    account.kind = models::AuthKind::OAuthToken;
    account.username = username;

    if (account.username.empty()) {
        auto login = m_deviceFlow.fetchUsername(outcome.token->secret);
        if (!login) {
            throw GasError(ErrorKind::Network, m_deviceFlow.getLastError());
        }
        account.username = *login;
    }

    commit(account, *outcome.token);
    return account;
}

models::Account AccountManager::addSecretAccount(const std::string& nickname,
                                                 const std::string& host,
                                                 const std::string& username,
                                                 const std::string& secret,
                                                 models::AuthKind kind) {
    if (!isValidNickname(nickname)) {
        throw GasError(ErrorKind::Config, "invalid account name '" + nickname + "'");
    }
    if (secret.empty()) {
        throw GasError(ErrorKind::Config, "empty secret for account '" + nickname + "'");
    }

    models::Account account;
    account.nickname = nickname;
    account.host = StringUtils::toLower(host);
    account.kind = kind;
    account.username = username;

    if (account.username.empty()) {
        if (kind != models::AuthKind::PersonalAccessToken) {
            throw GasError(ErrorKind::Config, "a username is required for password accounts");
        }
        auto login = m_deviceFlow.fetchUsername(secret);
        if (!login) {
            throw GasError(ErrorKind::Network, m_deviceFlow.getLastError());
        }
        account.username = *login;
    }

    models::Token token;
    token.secret = secret;

    commit(account, token);
    return account;
}

void AccountManager::commit(const models::Account& account, const models::Token& token) {
    auto previous = m_tokens.getToken(account.nickname);

    m_tokens.storeToken(account.nickname, token);

    try {
        m_accounts.put(account);
    } catch (const GasError& e) {
        LOG_ERROR("Saving account {} failed, restoring its previous secret: {}", account.nickname, e.what());
        if (previous) {
            m_tokens.storeToken(account.nickname, *previous);
        } else {
            m_tokens.removeToken(account.nickname);
        }
        throw;
    }
}

bool AccountManager::removeAccount(const std::string& nickname) {
    return m_accounts.remove(nickname);
}

models::DirectoryRule AccountManager::useDirectory(const std::string& nickname, const std::filesystem::path& directory) {
    return m_rules.setRule(directory, nickname);
}

void AccountManager::setDefaultAccount(const std::string& nickname) {
    m_accounts.setDefault(nickname);
    LOG_INFO("Default account is now {}", nickname);
}

models::Token AccountManager::ensureFresh(const models::Account& account, models::Token token,
                                          std::chrono::system_clock::time_point now) {
    if (!token.isExpired(now)) {
        return token;
    }

    if (account.kind != models::AuthKind::OAuthToken || !token.canRefresh()) {
        throw GasError(ErrorKind::AuthExpired,
                       "token for '" + account.nickname + "' has expired; run 'gas add " + account.nickname + "' again");
    }

    models::Token result;

    // Parallel helpers may hold the same expired token; the first one to get
    // the lock refreshes, the others pick up what it stored.
    m_accounts.withAccountLock(account.nickname, [&]() {
        auto stored = m_tokens.getToken(account.nickname);
        if (stored && !stored->isExpired(now)) {
            LOG_DEBUG("Token for {} was refreshed by another process", account.nickname);
            result = *stored;
            return;
        }

        const auto& refreshToken = stored && stored->canRefresh() ? stored->refreshToken : token.refreshToken;

        LOG_INFO("Refreshing expired token for {}", account.nickname);

        auto refreshed = m_deviceFlow.refresh(refreshToken);
        if (!refreshed) {
            throw GasError(ErrorKind::AuthExpired,
                           "token for '" + account.nickname + "' could not be refreshed: " + m_deviceFlow.getLastError());
        }

        m_tokens.storeToken(account.nickname, *refreshed);
        result = *refreshed;
    });

    return result;
}

} // namespace gas::core::accounts
