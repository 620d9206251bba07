#pragma once

/**
 * AccountManager.hpp
 *
 * Operator-facing account operations: adding accounts through the device
 * flow or a supplied secret, removing them, binding directories and keeping
 * OAuth tokens fresh.
 */

#include "AccountStore.hpp"
#include "RuleResolver.hpp"
#include "../auth/DeviceFlow.hpp"
#include "../auth/TokenStorage.hpp"

#include <functional>
#include <optional>
#include <string>

namespace gas::core::accounts {

/**
 * Device code presentation callback
 */
using DeviceCodeCallback = std::function<void(const auth::DeviceAuthorization& authorization)>;

/**
 * AccountManager - multi-account management
 *
 * Features:
 * - Device flow and static secret accounts
 * - Secret written before metadata, rolled back if metadata cannot be saved
 * - Token refresh for expired OAuth accounts
 */
class AccountManager {
public:
    AccountManager(AccountStore& accounts,
                   RuleResolver& rules,
                   auth::TokenStorage& tokens,
                   auth::DeviceFlowClient& deviceFlow);

    AccountManager(const AccountManager&) = delete;
    AccountManager& operator=(const AccountManager&) = delete;

    /**
     * Add or replace an account through the device flow
     * @param nickname Account nickname
     * @param host Git host the account belongs to
     * @param username Login name, looked up from the provider when empty
     * @param onDeviceCode Called once with the code to show the operator
     * @param cancel Operator interrupt
     * @return The stored account
     * @throws GasError AuthDenied, AuthExpired, Cancelled, Network or Vault
     */
    models::Account addOAuthAccount(const std::string& nickname,
                                    const std::string& host,
                                    const std::string& username,
                                    const DeviceCodeCallback& onDeviceCode,
                                    const auth::CancellationToken& cancel);

    /**
     * Add or replace an account with a personal access token or password
     * @param nickname Account nickname
     * @param host Git host the account belongs to
     * @param username Login name; for tokens it is looked up when empty
     * @param secret Token or password
     * @param kind PersonalAccessToken or StaticPassword
     * @return The stored account
     */
    models::Account addSecretAccount(const std::string& nickname,
                                     const std::string& host,
                                     const std::string& username,
                                     const std::string& secret,
                                     models::AuthKind kind);

    /**
     * Remove an account
     * @param nickname Account nickname
     * @return true if removed
     */
    bool removeAccount(const std::string& nickname);

    /**
     * Bind a directory to an account
     */
    models::DirectoryRule useDirectory(const std::string& nickname, const std::filesystem::path& directory);

    /**
     * Set the account used when no directory rule matches
     */
    void setDefaultAccount(const std::string& nickname);

    /**
     * Return a usable token, refreshing an expired OAuth token
     * @param account Account the token belongs to
     * @param token Token read from the vault
     * @param now Current time
     * @return The token, or its refreshed replacement (already stored)
     * @throws GasError(AuthExpired) if the token expired and cannot be refreshed
     */
    models::Token ensureFresh(const models::Account& account, models::Token token,
                              std::chrono::system_clock::time_point now);

    /**
     * Validate a nickname
     * @return true if usable as an account name and vault key suffix
     */
    static bool isValidNickname(const std::string& nickname);

private:
    /**
     * Store secret then metadata, undoing the secret if metadata fails
     */
    void commit(const models::Account& account, const models::Token& token);

private:
    AccountStore& m_accounts;
    RuleResolver& m_rules;
    auth::TokenStorage& m_tokens;
    auth::DeviceFlowClient& m_deviceFlow;
};

} // namespace gas::core::accounts
