/**
 * HttpClient.cpp
 *
 * HTTP client implementation using cpr (which wraps libcurl).
 */

#include "HttpClient.hpp"

#include <cpr/cpr.h>
#include <utility>

namespace gas::utils {

namespace {

cpr::Header toHeader(const HttpOptions& options) {
    cpr::Header headers;
    for (const auto& [key, value] : options.headers) headers[key] = value;
    return headers;
}

HttpResponse toResponse(const cpr::Response& response) {
    HttpResponse result;
    result.statusCode = static_cast<int>(response.status_code);
    result.body = response.text;
    if (response.error) {
        result.statusCode = 0;
        result.error = response.error.message;
    }
    return result;
}

} // namespace

HttpClient::HttpClient(HttpOptions defaults) : m_defaults(std::move(defaults)) {}

HttpOptions HttpClient::merge(const HttpOptions& options) const {
    HttpOptions merged = m_defaults;
    for (const auto& [key, value] : options.headers) merged.headers[key] = value;
    if (options.timeoutSeconds > 0) merged.timeoutSeconds = options.timeoutSeconds;
    if (!options.userAgent.empty()) merged.userAgent = options.userAgent;
    if (merged.timeoutSeconds <= 0) merged.timeoutSeconds = 30;
    return merged;
}

HttpResponse HttpClient::get(const std::string& url, const HttpOptions& options) {
    auto opts = merge(options);
    cpr::Response response = cpr::Get(
        cpr::Url{url},
        toHeader(opts),
        cpr::Timeout{opts.timeoutSeconds * 1000},
        cpr::UserAgent{opts.userAgent}
    );
    return toResponse(response);
}

HttpResponse HttpClient::postForm(const std::string& url,
                                  const std::map<std::string, std::string>& fields,
                                  const HttpOptions& options) {
    auto opts = merge(options);

    cpr::Payload payload{};
    for (const auto& [key, value] : fields) {
        payload.Add(cpr::Pair{key, value});
    }

    cpr::Response response = cpr::Post(
        cpr::Url{url},
        payload,
        toHeader(opts),
        cpr::Timeout{opts.timeoutSeconds * 1000},
        cpr::UserAgent{opts.userAgent}
    );
    return toResponse(response);
}

} // namespace gas::utils
