/**
 * CredentialHandler.cpp
 *
 * Credential-helper verb dispatch.
 */

#include "CredentialHandler.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../accounts/AccountManager.hpp"
#include "../accounts/AccountStore.hpp"
#include "../auth/Clock.hpp"
#include "../auth/TokenStorage.hpp"
#include "../../utils/StringUtils.hpp"

#include <istream>
#include <ostream>

namespace gas::core::credential {

CredentialHandler::CredentialHandler(const ResolutionChain& chain,
                                     const accounts::AccountStore& accounts,
                                     const auth::TokenStorage& tokens,
                                     accounts::AccountManager& manager,
                                     auth::Clock& clock)
    : m_chain(chain)
    , m_accounts(accounts)
    , m_tokens(tokens)
    , m_manager(manager)
    , m_clock(clock) {
}

int CredentialHandler::run(HelperVerb verb, std::istream& in, std::ostream& out, const std::filesystem::path& cwd) {
    switch (verb) {
        case HelperVerb::Get:
            return handleGet(in, out, cwd);
        case HelperVerb::Store:
        case HelperVerb::Erase:
            // Accounts change only through explicit commands
            GitCredential::drain(in);
            LOG_DEBUG("Ignoring credential {} request", verb == HelperVerb::Store ? "store" : "erase");
            return EXIT_OK;
        default:
            return EXIT_PROTOCOL;
    }
}

int CredentialHandler::handleGet(std::istream& in, std::ostream& out, const std::filesystem::path& cwd) {
    try {
        auto request = GitCredential::parse(in);
        auto credential = resolve(request, cwd);
        if (!credential) {
            return EXIT_OK;
        }

        std::string answer = GitCredential::format(credential->username, credential->password);
        out << answer;
        out.flush();
        return EXIT_OK;

    } catch (const GasError& e) {
        switch (e.kind()) {
            case ErrorKind::NotFound:
                LOG_WARN("{}", e.what());
                return EXIT_OK;
            case ErrorKind::Protocol:
                LOG_ERROR("Malformed request from git: {}", e.what());
                return EXIT_PROTOCOL;
            case ErrorKind::Cancelled:
                return EXIT_CANCELLED;
            default:
                LOG_ERROR("Credential lookup failed ({}): {}", errorKindName(e.kind()), e.what());
                return EXIT_FAILURE_STATUS;
        }
    }
}

std::optional<ResolvedCredential> CredentialHandler::resolve(const CredentialRequest& request,
                                                             const std::filesystem::path& cwd) {
    auto resolution = m_chain.resolve(ResolutionRequest{cwd, request.host});
    if (!resolution) {
        LOG_DEBUG("No account for {} in {}", request.host, cwd.string());
        return std::nullopt;
    }

    auto account = m_accounts.get(resolution->nickname);
    if (!account) {
        throw GasError(ErrorKind::NotFound,
                       "account '" + resolution->nickname + "' selected by " + resolution->source + " does not exist");
    }

    if (!account->host.empty() && !utils::StringUtils::equalsIgnoreCase(account->host, request.host)) {
        LOG_DEBUG("Account {} is for {}, not {}", account->nickname, account->host, request.host);
        return std::nullopt;
    }

    auto token = m_tokens.getToken(account->nickname);
    if (!token) {
        throw GasError(ErrorKind::NotFound, "no secret stored for account '" + account->nickname + "'");
    }

    auto fresh = m_manager.ensureFresh(*account, std::move(*token), m_clock.now());

    return ResolvedCredential{account->nickname, account->username, fresh.secret};
}

} // namespace gas::core::credential
