/**
 * TokenStorage.cpp
 *
 * Token blob encoding and vault access.
 */

#include "TokenStorage.hpp"
#include "../Logger.hpp"

#include <nlohmann/json.hpp>
#include <utility>

namespace gas::core::auth {

using json = nlohmann::json;

TokenStorage::TokenStorage(SecretVault& vault, std::string service)
    : m_vault(vault)
    , m_service(std::move(service)) {
}

std::string TokenStorage::keyFor(const std::string& nickname) const {
    return m_service + ":" + nickname;
}

void TokenStorage::storeToken(const std::string& nickname, const models::Token& token) {
    m_vault.put(keyFor(nickname), encode(token));
    LOG_DEBUG("Stored token for {} in {}", nickname, m_vault.backendName());
}

std::optional<models::Token> TokenStorage::getToken(const std::string& nickname) const {
    auto payload = m_vault.get(keyFor(nickname));
    if (!payload) {
        return std::nullopt;
    }
    return decode(*payload);
}

bool TokenStorage::removeToken(const std::string& nickname) {
    bool removed = m_vault.remove(keyFor(nickname));
    if (removed) {
        LOG_DEBUG("Removed token for {}", nickname);
    }
    return removed;
}

bool TokenStorage::hasToken(const std::string& nickname) const {
    return getToken(nickname).has_value();
}

std::string TokenStorage::encode(const models::Token& token) {
    // Secrets without metadata are stored verbatim, byte for byte
    if (token.refreshToken.empty() && !token.expiresAt) {
        return token.secret;
    }

    json blob = {
        {"v", BLOB_VERSION},
        {"secret", token.secret}
    };

    if (!token.refreshToken.empty()) {
        blob["refresh_token"] = token.refreshToken;
    }

    if (token.expiresAt) {
        blob["expires_at"] = std::chrono::duration_cast<std::chrono::seconds>(
            token.expiresAt->time_since_epoch()).count();
    }

    try {
        return blob.dump();
    } catch (const json::exception& e) {
        throw VaultError(std::string("cannot encode token: ") + e.what());
    }
}

models::Token TokenStorage::decode(const std::string& payload) {
    models::Token token;

    json blob = json::parse(payload, nullptr, false);
    if (blob.is_discarded() || !blob.is_object() || !blob.contains("v")
        || !blob.contains("secret") || !blob["secret"].is_string()) {
        token.secret = payload;
        return token;
    }

    token.secret = blob["secret"].get<std::string>();
    token.refreshToken = blob.value("refresh_token", "");

    if (blob.contains("expires_at") && blob["expires_at"].is_number_integer()) {
        token.expiresAt = std::chrono::system_clock::time_point(
            std::chrono::seconds(blob["expires_at"].get<int64_t>()));
    }

    return token;
}

} // namespace gas::core::auth
