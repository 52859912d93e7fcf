/**
 * @file CurlHttpClient.hpp
 * @brief libcurl implementation of HttpClient
 */

#pragma once

#include "HttpClient.hpp"
#include "Logger.hpp"

namespace geoenrich {

/**
 * @brief HttpClient backed by a fresh curl easy handle per request
 *
 * A handle per request keeps concurrent orchestrator tasks independent;
 * libcurl global state is initialized once per process.
 */
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override = default;

    HttpResponse get(const std::string& url, const HttpRequestOptions& options) override;

private:
    Logger logger_;
};

} // namespace geoenrich
