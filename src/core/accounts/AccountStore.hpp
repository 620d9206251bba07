#pragma once

/**
 * AccountStore.hpp
 *
 * Account metadata keyed by nickname. Secrets are owned by TokenStorage;
 * removing an account cascades to its directory rules, the default
 * selection and its vault entry.
 */

#include "StateFile.hpp"
#include "../auth/TokenStorage.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gas::core::accounts {

/**
 * AccountStore - CRUD over the persisted account table
 */
class AccountStore {
public:
    /**
     * Constructor
     * @param state Persisted table
     * @param tokens Vault access used by the remove cascade
     */
    AccountStore(StateFile& state, auth::TokenStorage& tokens);

    /**
     * Get account by nickname
     * @param nickname Account nickname
     * @return Account if found
     */
    std::optional<models::Account> get(const std::string& nickname) const;

    /**
     * Insert or fully replace an account
     *
     * A replaced account keeps its position in list(). The first account
     * ever stored becomes the default.
     *
     * @param account Account record
     */
    void put(const models::Account& account);

    /**
     * Remove an account with its rules, default selection and secret
     * @param nickname Account nickname
     * @return true if the account or a leftover secret for it existed
     */
    bool remove(const std::string& nickname);

    /**
     * Get all accounts in insertion order
     * @return Vector of accounts
     */
    std::vector<models::Account> list() const;

    /**
     * Get the default account nickname
     */
    std::optional<std::string> defaultAccount() const;

    /**
     * Set the default account
     * @param nickname Account nickname
     * @throws GasError(NotFound) if no such account
     */
    void setDefault(const std::string& nickname);

    /**
     * Serialize work on one account's secret across processes
     * @throws GasError(Lock) if another process holds the lock too long
     */
    void withAccountLock(const std::string& nickname, const std::function<void()>& action) {
        m_state.withAccountLock(nickname, action);
    }

private:
    StateFile& m_state;
    auth::TokenStorage& m_tokens;
};

} // namespace gas::core::accounts
