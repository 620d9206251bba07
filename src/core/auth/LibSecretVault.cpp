/**
 * LibSecretVault.cpp
 *
 * libsecret implementation of the secret vault.
 */

#include "LibSecretVault.hpp"
#include "../Logger.hpp"

#include <libsecret/secret.h>

#include <utility>

namespace gas::core::auth {

namespace {

const SecretSchema* credentialSchema() {
    static const SecretSchema schema = {
        "io.github.gas.Credential",
        SECRET_SCHEMA_NONE,
        {
            {"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {"key", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {nullptr, SecretSchemaAttributeType(0)}
        }
    };
    return &schema;
}

// Takes ownership of a GError and turns it into a message
std::string takeMessage(GError* error) {
    if (!error) {
        return "unknown Secret Service error";
    }
    std::string message = error->message ? error->message : "unknown Secret Service error";
    g_error_free(error);
    return message;
}

} // namespace

LibSecretVault::LibSecretVault(std::string service)
    : m_service(std::move(service)) {
}

void LibSecretVault::put(const std::string& key, const std::string& secret) {
    std::string label = m_service + ": " + key;
    SecretValue* value = secret_value_new(secret.data(),
                                          static_cast<gssize>(secret.size()),
                                          "application/octet-stream");

    GError* error = nullptr;
    gboolean stored = secret_password_store_binary_sync(
        credentialSchema(), SECRET_COLLECTION_DEFAULT, label.c_str(), value,
        nullptr, &error,
        "service", m_service.c_str(),
        "key", key.c_str(),
        nullptr);

    secret_value_unref(value);

    if (!stored) {
        auto message = takeMessage(error);
        LOG_ERROR("Secret Service write failed for {}: {}", key, message);
        throw VaultError("cannot store secret '" + key + "': " + message);
    }

    LOG_DEBUG("Stored secret {} in Secret Service", key);
}

std::optional<std::string> LibSecretVault::get(const std::string& key) const {
    GError* error = nullptr;
    SecretValue* value = secret_password_lookup_binary_sync(
        credentialSchema(), nullptr, &error,
        "service", m_service.c_str(),
        "key", key.c_str(),
        nullptr);

    if (error) {
        if (value) secret_value_unref(value);
        auto message = takeMessage(error);
        LOG_ERROR("Secret Service lookup failed for {}: {}", key, message);
        throw VaultError("cannot read secret '" + key + "': " + message);
    }

    if (!value) {
        return std::nullopt;
    }

    gsize length = 0;
    const gchar* data = secret_value_get(value, &length);
    std::string secret(data ? data : "", data ? length : 0);
    secret_value_unref(value);

    return secret;
}

bool LibSecretVault::remove(const std::string& key) {
    GError* error = nullptr;
    gboolean removed = secret_password_clear_sync(
        credentialSchema(), nullptr, &error,
        "service", m_service.c_str(),
        "key", key.c_str(),
        nullptr);

    if (error) {
        auto message = takeMessage(error);
        LOG_ERROR("Secret Service delete failed for {}: {}", key, message);
        throw VaultError("cannot delete secret '" + key + "': " + message);
    }

    return removed == TRUE;
}

} // namespace gas::core::auth
