#pragma once

/**
 * LibSecretVault.hpp
 *
 * SecretVault backed by the freedesktop Secret Service (GNOME Keyring,
 * KWallet) through libsecret.
 */

#include "SecretVault.hpp"

#include <string>

namespace gas::core::auth {

/**
 * LibSecretVault - Secret Service implementation
 *
 * Items are stored under the schema "io.github.gas.Credential" with two
 * attributes: "service" (the configured namespace) and "key".
 */
class LibSecretVault : public SecretVault {
public:
    /**
     * Constructor
     * @param service Value of the "service" attribute on every item
     */
    explicit LibSecretVault(std::string service);

    void put(const std::string& key, const std::string& secret) override;
    std::optional<std::string> get(const std::string& key) const override;
    bool remove(const std::string& key) override;
    std::string backendName() const override { return "libsecret"; }

private:
    std::string m_service;

    static constexpr const char* SCHEMA_NAME = "io.github.gas.Credential";
};

} // namespace gas::core::auth
