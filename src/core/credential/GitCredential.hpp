#pragma once

/**
 * GitCredential.hpp
 *
 * Git credential-helper wire format: "key=value" lines terminated by a
 * blank line or end of input.
 */

#include <istream>
#include <optional>
#include <string>

namespace gas::core::credential {

/**
 * A credential request as sent by Git
 */
struct CredentialRequest {
    std::string protocol;
    std::string host;
    std::string path;
    std::string username;
    std::optional<std::string> password;   // present on store/erase only
};

/**
 * Helper verbs Git invokes
 */
enum class HelperVerb {
    Get,
    Store,
    Erase
};

std::optional<HelperVerb> parseVerb(const std::string& verb);

/**
 * GitCredential - protocol codec
 */
class GitCredential {
public:
    /**
     * Read one request
     *
     * Unknown keys are ignored; "url=" fills protocol, host and path.
     *
     * @param in Request stream
     * @return Parsed request
     * @throws GasError(Protocol) on a line without '=' or a missing host
     */
    static CredentialRequest parse(std::istream& in);

    /**
     * Format the credential answer for Git
     * @throws GasError(Protocol) if a value would break the line framing
     */
    static std::string format(const std::string& username, const std::string& password);

    /**
     * Consume the rest of a request without interpreting it
     */
    static void drain(std::istream& in);

private:
    static void applyUrl(CredentialRequest& request, const std::string& url);
};

} // namespace gas::core::credential
