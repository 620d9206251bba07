#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

namespace gas::models {

using json = nlohmann::json;

enum class AuthKind {
    OAuthToken,
    PersonalAccessToken,
    StaticPassword
};

NLOHMANN_JSON_SERIALIZE_ENUM(AuthKind, {
    {AuthKind::OAuthToken, "oauth"},
    {AuthKind::PersonalAccessToken, "pat"},
    {AuthKind::StaticPassword, "password"},
})

// Public account metadata. Secrets are kept in the vault only.
struct Account {
    std::string nickname;
    std::string host;
    std::string username;
    AuthKind kind{AuthKind::OAuthToken};

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Account, nickname, host, username, kind)
};

struct DirectoryRule {
    std::string prefix;     // normalized absolute path
    std::string nickname;
    uint64_t sequence{0};   // write order, used only to break ties

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(DirectoryRule, prefix, nickname, sequence)
};

struct Token {
    std::string secret;
    std::string refreshToken;
    std::optional<std::chrono::system_clock::time_point> expiresAt;

    bool isExpired(std::chrono::system_clock::time_point now) const {
        return expiresAt && now >= *expiresAt;
    }

    bool canRefresh() const {
        return !refreshToken.empty();
    }
};

inline const char* authKindLabel(AuthKind kind) {
    switch (kind) {
        case AuthKind::OAuthToken:          return "oauth";
        case AuthKind::PersonalAccessToken: return "token";
        case AuthKind::StaticPassword:      return "password";
        default:                            return "unknown";
    }
}

} // namespace gas::models
