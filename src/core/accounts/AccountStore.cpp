/**
 * AccountStore.cpp
 *
 * Account table operations.
 */

#include "AccountStore.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"

#include <algorithm>

namespace gas::core::accounts {

AccountStore::AccountStore(StateFile& state, auth::TokenStorage& tokens)
    : m_state(state)
    , m_tokens(tokens) {
}

std::optional<models::Account> AccountStore::get(const std::string& nickname) const {
    auto snapshot = m_state.load();
    if (const auto* account = snapshot.findAccount(nickname)) {
        return *account;
    }
    return std::nullopt;
}

void AccountStore::put(const models::Account& account) {
    m_state.update([&](StateSnapshot& snapshot) {
        if (auto* existing = snapshot.findAccount(account.nickname)) {
            *existing = account;
        } else {
            snapshot.accounts.push_back(account);
        }

        if (!snapshot.defaultAccount) {
            snapshot.defaultAccount = account.nickname;
        }
    });

    LOG_INFO("Saved account {}", account.nickname);
}

bool AccountStore::remove(const std::string& nickname) {
    bool existed = false;

    m_state.update([&](StateSnapshot& snapshot) {
        auto before = snapshot.accounts.size();
        snapshot.accounts.erase(
            std::remove_if(snapshot.accounts.begin(), snapshot.accounts.end(),
                [&](const models::Account& account) { return account.nickname == nickname; }),
            snapshot.accounts.end());
        existed = snapshot.accounts.size() != before;

        snapshot.rules.erase(
            std::remove_if(snapshot.rules.begin(), snapshot.rules.end(),
                [&](const models::DirectoryRule& rule) { return rule.nickname == nickname; }),
            snapshot.rules.end());

        if (snapshot.defaultAccount == nickname) {
            snapshot.defaultAccount.reset();
        }
    });

    // The vault entry is dropped only once no record references it
    bool hadSecret = m_tokens.removeToken(nickname);

    if (existed) {
        LOG_INFO("Removed account {}", nickname);
    } else if (hadSecret) {
        LOG_WARN("Removed orphaned secret for {}", nickname);
    }

    return existed || hadSecret;
}

std::vector<models::Account> AccountStore::list() const {
    return m_state.load().accounts;
}

std::optional<std::string> AccountStore::defaultAccount() const {
    return m_state.load().defaultAccount;
}

void AccountStore::setDefault(const std::string& nickname) {
    m_state.update([&](StateSnapshot& snapshot) {
        if (!snapshot.findAccount(nickname)) {
            throw GasError(ErrorKind::NotFound, "no account named '" + nickname + "'");
        }
        snapshot.defaultAccount = nickname;
    });
}

} // namespace gas::core::accounts
