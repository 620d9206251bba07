// gas - HTTP Client
// Synchronous HTTP client using cpr

#pragma once

#include <string>
#include <map>

namespace gas::utils {

/**
 * @brief HTTP response structure
 */
struct HttpResponse {
    int statusCode{0};
    std::string body;
    std::string error;      // transport error, empty when a response arrived

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }

    bool isTransportError() const { return statusCode == 0; }
};

/**
 * @brief HTTP request options
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    int timeoutSeconds{30};
    std::string userAgent{"gas/0.3.0"};
};

/**
 * @brief Transport seam used by the OAuth client
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse get(const std::string& url, const HttpOptions& options = {}) = 0;
    virtual HttpResponse postForm(const std::string& url,
                                  const std::map<std::string, std::string>& fields,
                                  const HttpOptions& options = {}) = 0;
};

/**
 * @brief cpr-backed transport
 */
class HttpClient : public HttpTransport {
public:
    HttpClient() = default;
    explicit HttpClient(HttpOptions defaults);

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse get(const std::string& url, const HttpOptions& options = {}) override;
    HttpResponse postForm(const std::string& url,
                          const std::map<std::string, std::string>& fields,
                          const HttpOptions& options = {}) override;

private:
    HttpOptions merge(const HttpOptions& options) const;

    HttpOptions m_defaults;
};

} // namespace gas::utils
