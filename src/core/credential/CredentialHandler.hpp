#pragma once

/**
 * CredentialHandler.hpp
 *
 * Entry point for "gas get|store|erase" as invoked by Git.
 * The answer is written to the output stream only after every step has
 * succeeded; diagnostics go to the logger, never to the output stream.
 */

#include "GitCredential.hpp"
#include "ResolutionChain.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace gas::core::auth {
class Clock;
class TokenStorage;
}

namespace gas::core::accounts {
class AccountStore;
class AccountManager;
}

namespace gas::core::credential {

/**
 * Username and secret to hand to Git
 */
struct ResolvedCredential {
    std::string nickname;
    std::string username;
    std::string password;
};

/**
 * CredentialHandler - credential-helper verbs
 */
class CredentialHandler {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_FAILURE_STATUS = 1;
    static constexpr int EXIT_PROTOCOL = 2;
    static constexpr int EXIT_CANCELLED = 130;

    CredentialHandler(const ResolutionChain& chain,
                      const accounts::AccountStore& accounts,
                      const auth::TokenStorage& tokens,
                      accounts::AccountManager& manager,
                      auth::Clock& clock);

    /**
     * Handle one helper invocation
     * @param verb Verb from the command line
     * @param in Request stream from Git
     * @param out Answer stream to Git
     * @param cwd Working directory of the invoking repository
     * @return Process exit code
     */
    int run(HelperVerb verb, std::istream& in, std::ostream& out, const std::filesystem::path& cwd);

    /**
     * Resolve the credential for a parsed request
     * @return Credential, nullopt if no account applies
     * @throws GasError on vault, expiry or refresh failures
     */
    std::optional<ResolvedCredential> resolve(const CredentialRequest& request, const std::filesystem::path& cwd);

private:
    int handleGet(std::istream& in, std::ostream& out, const std::filesystem::path& cwd);

private:
    const ResolutionChain& m_chain;
    const accounts::AccountStore& m_accounts;
    const auth::TokenStorage& m_tokens;
    accounts::AccountManager& m_manager;
    auth::Clock& m_clock;
};

} // namespace gas::core::credential
