#pragma once

/**
 * SecretVault.hpp
 *
 * Narrow interface over an OS secret store.
 * Implementations must make put/remove atomic from the caller's view and
 * must never fall back to a plaintext file when the backend fails.
 */

#include <optional>
#include <string>

#include "../Errors.hpp"

namespace gas::core::auth {

/**
 * VaultError - secret store backend failure
 */
class VaultError : public GasError {
public:
    explicit VaultError(const std::string& message)
        : GasError(ErrorKind::Vault, message) {}
};

/**
 * SecretVault - get/put/remove of opaque secrets by key
 */
class SecretVault {
public:
    virtual ~SecretVault() = default;

    /**
     * Store a secret, replacing any previous value
     * @param key Namespaced key
     * @param secret Opaque payload, may contain any byte
     * @throws VaultError if the backend rejected the write
     */
    virtual void put(const std::string& key, const std::string& secret) = 0;

    /**
     * Retrieve a secret
     * @param key Namespaced key
     * @return Payload, or nullopt if no such key
     * @throws VaultError if the backend could not be queried
     */
    virtual std::optional<std::string> get(const std::string& key) const = 0;

    /**
     * Delete a secret
     * @param key Namespaced key
     * @return false if no such key
     * @throws VaultError if the backend could not be modified
     */
    virtual bool remove(const std::string& key) = 0;

    /**
     * Backend name for diagnostics
     */
    virtual std::string backendName() const = 0;
};

} // namespace gas::core::auth
