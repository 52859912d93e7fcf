/**
 * @file HttpClient.hpp
 * @brief Abstract HTTP GET transport used by ResilientFetcher
 */

#pragma once

#include <string>
#include <vector>

namespace geoenrich {

/**
 * @brief Per-request transport options
 */
struct HttpRequestOptions {
    int timeout_seconds = 15;
    std::string user_agent = "GeoEnrich/1.0";
    std::vector<std::string> headers = {"Accept: application/json"};
};

/**
 * @brief Raw HTTP response; status_code is 0 when no status was received
 */
struct HttpResponse {
    long status_code = 0;
    std::string body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

/**
 * @brief Blocking HTTP transport
 *
 * Implementations throw NetworkError when no response could be obtained
 * (DNS failure, refused connection, expired timeout). Non-2xx responses are
 * returned, not thrown. Implementations must be safe to call concurrently.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, const HttpRequestOptions& options) = 0;
};

} // namespace geoenrich
