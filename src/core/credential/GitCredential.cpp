/**
 * GitCredential.cpp
 *
 * Credential-helper protocol parsing and formatting.
 */

#include "GitCredential.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"

namespace gas::core::credential {

std::optional<HelperVerb> parseVerb(const std::string& verb) {
    if (verb == "get") return HelperVerb::Get;
    if (verb == "store") return HelperVerb::Store;
    if (verb == "erase") return HelperVerb::Erase;
    return std::nullopt;
}

CredentialRequest GitCredential::parse(std::istream& in) {
    CredentialRequest request;
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }

        auto separator = line.find('=');
        if (separator == std::string::npos) {
            throw GasError(ErrorKind::Protocol, "malformed credential line (no '=')");
        }

        std::string key = line.substr(0, separator);
        std::string value = line.substr(separator + 1);

        if (key == "protocol") {
            request.protocol = value;
        } else if (key == "host") {
            request.host = value;
        } else if (key == "path") {
            request.path = value;
        } else if (key == "username") {
            request.username = value;
        } else if (key == "password") {
            request.password = value;
        } else if (key == "url") {
            applyUrl(request, value);
        } else {
            LOG_TRACE("Ignoring credential attribute {}", key);
        }
    }

    if (request.host.empty()) {
        throw GasError(ErrorKind::Protocol, "credential request has no host");
    }

    return request;
}

void GitCredential::applyUrl(CredentialRequest& request, const std::string& url) {
    auto scheme = url.find("://");
    if (scheme == std::string::npos) {
        throw GasError(ErrorKind::Protocol, "malformed url attribute");
    }

    request.protocol = url.substr(0, scheme);
    std::string rest = url.substr(scheme + 3);

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    request.path = slash == std::string::npos ? "" : rest.substr(slash + 1);

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        request.username = authority.substr(0, authority.find(':') < at ? authority.find(':') : at);
        authority = authority.substr(at + 1);
    }
    request.host = authority;
}

std::string GitCredential::format(const std::string& username, const std::string& password) {
    auto framingSafe = [](const std::string& value) {
        return value.find('\n') == std::string::npos && value.find('\0') == std::string::npos;
    };
    if (!framingSafe(username) || !framingSafe(password)) {
        throw GasError(ErrorKind::Protocol, "credential contains a line break");
    }

    return "username=" + username + "\npassword=" + password + "\n\n";
}

void GitCredential::drain(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") {
            break;
        }
    }
}

} // namespace gas::core::credential
