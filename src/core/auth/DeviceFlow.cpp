/**
 * DeviceFlow.cpp
 *
 * Implementation of the OAuth2 device authorization grant.
 */

#include "DeviceFlow.hpp"
#include "../Logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <utility>

namespace gas::core::auth {

using json = nlohmann::json;

const char* deviceFlowStateName(DeviceFlowState state) {
    switch (state) {
        case DeviceFlowState::Start:                 return "start";
        case DeviceFlowState::AwaitingAuthorization: return "awaiting-authorization";
        case DeviceFlowState::Approved:              return "approved";
        case DeviceFlowState::Denied:                return "denied";
        case DeviceFlowState::Expired:               return "expired";
        case DeviceFlowState::Cancelled:             return "cancelled";
        case DeviceFlowState::Failed:                return "failed";
        default:                                     return "unknown";
    }
}

DeviceFlowClient::DeviceFlowClient(utils::HttpTransport& http, Clock& clock, DeviceFlowEndpoints endpoints)
    : m_http(http)
    , m_clock(clock)
    , m_endpoints(std::move(endpoints)) {
}

utils::HttpOptions DeviceFlowClient::requestOptions() const {
    utils::HttpOptions options;
    options.headers["Accept"] = "application/json";
    options.timeoutSeconds = m_endpoints.timeoutSeconds;
    return options;
}

std::optional<DeviceAuthorization> DeviceFlowClient::start() {
    m_state = DeviceFlowState::Start;
    m_lastError.clear();

    auto response = m_http.postForm(
        m_endpoints.deviceCodeUrl,
        {
            {"client_id", m_endpoints.clientId},
            {"scope", m_endpoints.scope}
        },
        requestOptions()
    );

    if (response.isTransportError()) {
        m_lastError = "Device code request failed: " + response.error;
        return std::nullopt;
    }

    if (!response.isSuccess()) {
        m_lastError = "Failed to get device code: HTTP " + std::to_string(response.statusCode);
        return std::nullopt;
    }

    try {
        auto body = json::parse(response.body);

        if (body.contains("error")) {
            m_lastError = "Device code error: " + body.value("error_description", body["error"].get<std::string>());
            return std::nullopt;
        }

        DeviceAuthorization authorization;
        authorization.deviceCode = body.at("device_code").get<std::string>();
        authorization.userCode = body.at("user_code").get<std::string>();
        authorization.verificationUri = body.at("verification_uri").get<std::string>();
        authorization.expiresAt = m_clock.now() + std::chrono::seconds(body.at("expires_in").get<int64_t>());
        authorization.pollInterval = DEFAULT_POLL_INTERVAL;
        if (body.contains("interval") && body["interval"].is_number_integer()) {
            authorization.pollInterval = std::max(std::chrono::seconds(body["interval"].get<int64_t>()),
                                                  MIN_POLL_INTERVAL);
        }

        m_state = DeviceFlowState::AwaitingAuthorization;
        LOG_DEBUG("Device code issued, user code {} at {}", authorization.userCode, authorization.verificationUri);
        return authorization;

    } catch (const json::exception& e) {
        m_lastError = std::string("Malformed device code response: ") + e.what();
        return std::nullopt;
    }
}

DeviceFlowOutcome DeviceFlowClient::poll(const DeviceAuthorization& authorization, const CancellationToken& cancel) {
    m_state = DeviceFlowState::AwaitingAuthorization;
    m_lastError.clear();

    auto interval = authorization.pollInterval;

    while (true) {
        if (cancel.isCancelled()) {
            return finish(DeviceFlowState::Cancelled, "Authentication cancelled");
        }

        if (m_clock.now() > authorization.expiresAt) {
            return finish(DeviceFlowState::Expired, "Device code expired");
        }

        if (!m_clock.sleepFor(interval, cancel)) {
            return finish(DeviceFlowState::Cancelled, "Authentication cancelled");
        }

        if (m_clock.now() > authorization.expiresAt) {
            return finish(DeviceFlowState::Expired, "Device code expired");
        }

        auto response = m_http.postForm(
            m_endpoints.tokenUrl,
            {
                {"client_id", m_endpoints.clientId},
                {"device_code", authorization.deviceCode},
                {"grant_type", DEVICE_GRANT_TYPE}
            },
            requestOptions()
        );

        if (response.isTransportError()) {
            return finish(DeviceFlowState::Failed, "Token polling error: " + response.error);
        }

        json body = json::parse(response.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            return finish(DeviceFlowState::Failed,
                          "Token polling error: HTTP " + std::to_string(response.statusCode) + " with non-JSON body");
        }

        if (body.contains("access_token")) {
            try {
                DeviceFlowOutcome outcome = finish(DeviceFlowState::Approved, "");
                outcome.token = parseToken(body);
                return outcome;
            } catch (const json::exception& e) {
                return finish(DeviceFlowState::Failed, std::string("Malformed token response: ") + e.what());
            }
        }

        std::string error = body.contains("error") && body["error"].is_string()
            ? body["error"].get<std::string>() : "";

        if (error == "authorization_pending") {
            LOG_TRACE("Authorization pending, next poll in {}s", interval.count());
            continue;
        }

        if (error == "slow_down") {
            std::chrono::seconds requested{0};
            if (body.contains("interval") && body["interval"].is_number_integer()) {
                requested = std::chrono::seconds(body["interval"].get<int64_t>());
            }
            interval = requested > interval ? requested : interval + SLOW_DOWN_STEP;
            LOG_DEBUG("Provider asked to slow down, interval is now {}s", interval.count());
            continue;
        }

        if (error == "access_denied" || error == "authorization_declined") {
            return finish(DeviceFlowState::Denied, "Authorization was denied");
        }

        if (error == "expired_token") {
            return finish(DeviceFlowState::Expired, "Device code expired");
        }

        if (error.empty()) {
            return finish(DeviceFlowState::Failed,
                          "Unexpected token response: HTTP " + std::to_string(response.statusCode));
        }

        if (body.contains("error_description") && body["error_description"].is_string()) {
            return finish(DeviceFlowState::Failed, error + ": " + body["error_description"].get<std::string>());
        }
        return finish(DeviceFlowState::Failed, error);
    }
}

std::optional<models::Token> DeviceFlowClient::refresh(const std::string& refreshToken) {
    m_lastError.clear();

    auto response = m_http.postForm(
        m_endpoints.tokenUrl,
        {
            {"client_id", m_endpoints.clientId},
            {"grant_type", "refresh_token"},
            {"refresh_token", refreshToken}
        },
        requestOptions()
    );

    if (response.isTransportError()) {
        m_lastError = "Token refresh failed: " + response.error;
        return std::nullopt;
    }

    if (!response.isSuccess()) {
        m_lastError = "Token refresh failed: HTTP " + std::to_string(response.statusCode);
        return std::nullopt;
    }

    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("access_token")) {
        std::string error = body.is_object() && body.contains("error") && body["error"].is_string()
            ? body["error"].get<std::string>() : "";
        m_lastError = "Token refresh failed" + (error.empty() ? std::string{} : ": " + error);
        return std::nullopt;
    }

    try {
        auto token = parseToken(body);
        // Providers may omit a new refresh token when the old one stays valid
        if (token.refreshToken.empty()) {
            token.refreshToken = refreshToken;
        }
        return token;
    } catch (const json::exception& e) {
        m_lastError = std::string("Token refresh error: ") + e.what();
        return std::nullopt;
    }
}

std::optional<std::string> DeviceFlowClient::fetchUsername(const std::string& accessToken) {
    m_lastError.clear();

    auto options = requestOptions();
    options.headers["Authorization"] = "token " + accessToken;

    auto response = m_http.get(m_endpoints.userUrl, options);

    if (!response.isSuccess()) {
        m_lastError = response.isTransportError()
            ? "User lookup failed: " + response.error
            : "User lookup failed: HTTP " + std::to_string(response.statusCode);
        return std::nullopt;
    }

    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("login") || !body["login"].is_string()) {
        m_lastError = "User lookup returned no login name";
        return std::nullopt;
    }

    return body["login"].get<std::string>();
}

models::Token DeviceFlowClient::parseToken(const json& body) const {
    models::Token token;
    token.secret = body.at("access_token").get<std::string>();
    token.refreshToken = body.value("refresh_token", "");

    if (body.contains("expires_in") && body["expires_in"].is_number_integer()) {
        token.expiresAt = m_clock.now() + std::chrono::seconds(body["expires_in"].get<int64_t>());
    }

    return token;
}

DeviceFlowOutcome DeviceFlowClient::finish(DeviceFlowState state, std::string error) {
    m_state = state;
    m_lastError = error;

    if (state == DeviceFlowState::Approved) {
        LOG_INFO("Device authorization approved");
    } else {
        LOG_DEBUG("Device flow ended in state {}: {}", deviceFlowStateName(state), error);
    }

    DeviceFlowOutcome outcome;
    outcome.state = state;
    outcome.error = std::move(error);
    return outcome;
}

} // namespace gas::core::auth
