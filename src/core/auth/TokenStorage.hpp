#pragma once

/**
 * TokenStorage.hpp
 *
 * Per-account token persistence on top of a SecretVault.
 * Plain secrets are stored verbatim. Tokens carrying a refresh token or an
 * expiry are stored as a versioned JSON blob.
 */

#include "SecretVault.hpp"
#include "../../models/Account.hpp"

#include <string>
#include <optional>

namespace gas::core::auth {

/**
 * TokenStorage - credential storage keyed by account nickname
 *
 * Features:
 * - Keys namespaced as "<service>:<nickname>"
 * - Refresh token and expiry kept alongside the secret
 * - No plaintext fallback; vault failures propagate as VaultError
 */
class TokenStorage {
public:
    /**
     * Constructor
     * @param vault Backend holding the blobs
     * @param service Namespace prefix of every key
     */
    TokenStorage(SecretVault& vault, std::string service);

    /**
     * Store a token, replacing any previous one
     * @param nickname Account nickname
     * @param token Token to store
     * @throws VaultError if the backend rejected the write
     */
    void storeToken(const std::string& nickname, const models::Token& token);

    /**
     * Retrieve a stored token
     * @param nickname Account nickname
     * @return Token if found
     * @throws VaultError if the backend could not be queried
     */
    std::optional<models::Token> getToken(const std::string& nickname) const;

    /**
     * Remove a stored token
     * @param nickname Account nickname
     * @return true if a token was removed
     */
    bool removeToken(const std::string& nickname);

    /**
     * Check if a token exists
     * @param nickname Account nickname
     * @return true if exists
     */
    bool hasToken(const std::string& nickname) const;

    /**
     * Vault key for an account
     * @param nickname Account nickname
     * @return Namespaced key
     */
    std::string keyFor(const std::string& nickname) const;

    /**
     * Serialize a token to its vault payload
     * @throws VaultError if a blob cannot be encoded
     */
    static std::string encode(const models::Token& token);

    /**
     * Parse a vault payload; anything that is not a blob is a bare secret
     */
    static models::Token decode(const std::string& payload);

private:
    SecretVault& m_vault;
    std::string m_service;

    static constexpr int BLOB_VERSION = 1;
};

} // namespace gas::core::auth
