#pragma once

/**
 * Errors.hpp
 *
 * Error taxonomy shared by the credential engine.
 * Absence is reported with std::optional; failures are thrown as GasError.
 */

#include <stdexcept>
#include <string>

namespace gas::core {

/**
 * Error classification
 */
enum class ErrorKind {
    NotFound,     // nickname, rule or secret absent
    Vault,        // OS secret store failure
    AuthDenied,   // device flow denied by the operator
    AuthExpired,  // device code or token expired
    Protocol,     // malformed credential-helper input
    Lock,         // state file lock could not be acquired
    Network,      // HTTP transport or payload failure
    Config,       // unreadable state or settings
    Cancelled     // operator interrupt
};

/**
 * Get a short name for an error kind
 * @param kind Error kind
 * @return Name used in diagnostics
 */
inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:    return "not-found";
        case ErrorKind::Vault:       return "vault";
        case ErrorKind::AuthDenied:  return "auth-denied";
        case ErrorKind::AuthExpired: return "auth-expired";
        case ErrorKind::Protocol:    return "protocol";
        case ErrorKind::Lock:        return "lock";
        case ErrorKind::Network:     return "network";
        case ErrorKind::Config:      return "config";
        case ErrorKind::Cancelled:   return "cancelled";
        default:                     return "unknown";
    }
}

/**
 * GasError - exception carrying an ErrorKind
 */
class GasError : public std::runtime_error {
public:
    GasError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

} // namespace gas::core
