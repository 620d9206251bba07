#pragma once

/**
 * DeviceFlow.hpp
 *
 * OAuth2 device authorization grant (RFC 8628) against a Git host.
 * The polling loop is driven by an injected Clock so it can run without
 * real delays, and stops as soon as a CancellationToken is raised.
 */

#include "Clock.hpp"
#include "../../models/Account.hpp"
#include "../../utils/HttpClient.hpp"

#include <string>
#include <optional>
#include <chrono>

namespace gas::core::auth {

/**
 * Provider endpoints and client registration
 */
struct DeviceFlowEndpoints {
    std::string clientId{"Ov23li6WaAMnOZW2RXsa"};
    std::string scope{"repo read:user"};
    std::string deviceCodeUrl{"https://github.com/login/device/code"};
    std::string tokenUrl{"https://github.com/login/oauth/access_token"};
    std::string userUrl{"https://api.github.com/user"};
    int timeoutSeconds{30};
};

/**
 * Device code for user authentication
 */
struct DeviceAuthorization {
    std::string deviceCode;
    std::string userCode;
    std::string verificationUri;
    std::chrono::system_clock::time_point expiresAt;
    std::chrono::seconds pollInterval{5};
};

/**
 * Device flow states
 */
enum class DeviceFlowState {
    Start,
    AwaitingAuthorization,
    Approved,
    Denied,
    Expired,
    Cancelled,
    Failed
};

const char* deviceFlowStateName(DeviceFlowState state);

/**
 * Terminal result of a polling run
 */
struct DeviceFlowOutcome {
    DeviceFlowState state{DeviceFlowState::Failed};
    std::optional<models::Token> token;     // set only when Approved
    std::string error;

    bool isApproved() const { return state == DeviceFlowState::Approved && token.has_value(); }
};

/**
 * DeviceFlowClient - device code authentication
 *
 * Authentication flow:
 * 1. Get device code from the provider
 * 2. User enters code at the verification page
 * 3. Poll for the OAuth token
 * 4. Look up the login name of the token's owner
 */
class DeviceFlowClient {
public:
    static constexpr const char* DEVICE_GRANT_TYPE = "urn:ietf:params:oauth:grant-type:device_code";
    static constexpr std::chrono::seconds SLOW_DOWN_STEP{5};
    static constexpr std::chrono::seconds DEFAULT_POLL_INTERVAL{5};
    static constexpr std::chrono::seconds MIN_POLL_INTERVAL{1};

    /**
     * Constructor
     * @param http Transport for all requests
     * @param clock Time source and sleep
     * @param endpoints Provider configuration
     */
    DeviceFlowClient(utils::HttpTransport& http, Clock& clock, DeviceFlowEndpoints endpoints = {});

    /**
     * Request a device/user code pair
     * @return Authorization to present and poll with, nullopt on failure (see getLastError)
     */
    std::optional<DeviceAuthorization> start();

    /**
     * Poll the token endpoint until a terminal state
     * @param authorization Result of start()
     * @param cancel Checked before every request and during every sleep
     * @return Terminal outcome
     */
    DeviceFlowOutcome poll(const DeviceAuthorization& authorization, const CancellationToken& cancel);

    /**
     * Exchange a refresh token for a new access token
     * @param refreshToken Refresh token to use
     * @return New token, nullopt on failure
     */
    std::optional<models::Token> refresh(const std::string& refreshToken);

    /**
     * Get the login name of a token's owner
     * @param accessToken OAuth or personal access token
     * @return Login name if the provider answered
     */
    std::optional<std::string> fetchUsername(const std::string& accessToken);

    DeviceFlowState state() const { return m_state; }

    /**
     * Get last error message
     * @return Error message
     */
    std::string getLastError() const { return m_lastError; }

private:
    /**
     * Build a token from a successful token-endpoint body
     */
    models::Token parseToken(const nlohmann::json& body) const;

    DeviceFlowOutcome finish(DeviceFlowState state, std::string error);

    utils::HttpOptions requestOptions() const;

private:
    utils::HttpTransport& m_http;
    Clock& m_clock;
    DeviceFlowEndpoints m_endpoints;
    DeviceFlowState m_state{DeviceFlowState::Start};
    std::string m_lastError;
};

} // namespace gas::core::auth
