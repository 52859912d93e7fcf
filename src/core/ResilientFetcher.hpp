/**
 * @file ResilientFetcher.hpp
 * @brief HTTP JSON fetching with ordered endpoint fallback
 */

#pragma once

#include "HttpClient.hpp"
#include "Logger.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace geoenrich {

/**
 * @brief One way of reaching a URL: directly or through a relay
 */
struct FetchStrategy {
    enum class Style {
        DIRECT,  // the URL as given
        PREFIX,  // base + url
        WRAP     // base + url_encode(url)
    };

    Style style = Style::DIRECT;
    std::string base;

    static FetchStrategy direct() { return {Style::DIRECT, ""}; }
    static FetchStrategy prefix(const std::string& base) { return {Style::PREFIX, base}; }
    static FetchStrategy wrap(const std::string& base) { return {Style::WRAP, base}; }

    /**
     * @brief Build the request URL for this strategy
     */
    std::string apply(const std::string& url) const;

    std::string describe() const;
};

/**
 * @brief Fetch configuration
 */
struct FetchOptions {
    int timeout_seconds = 15;
    std::chrono::milliseconds retry_delay{200};
    std::string user_agent = "GeoEnrich/1.0";
    std::vector<FetchStrategy> proxies = {
        FetchStrategy::prefix("https://cors.isomorphic-git.org/"),
        FetchStrategy::wrap("https://api.allorigins.win/raw?url=")
    };
    bool use_proxies = true;
};

/**
 * @brief Requests a JSON document, falling back through relay endpoints
 *
 * The direct URL is tried first, then each configured proxy in order, with
 * a fixed delay between attempts. A response counts as success only when its
 * status is 2xx, its body is not an HTML page and it parses as JSON. Nothing
 * is cached. Thread safe as long as the HttpClient is.
 */
class ResilientFetcher {
public:
    ResilientFetcher(std::shared_ptr<HttpClient> client, FetchOptions options = {});

    /**
     * @brief Fetch and parse a JSON document
     * @throws NetworkError or ParseError from the last attempt when all fail
     */
    nlohmann::json fetch_json(const std::string& url) const;

    /**
     * @brief Request URLs in attempt order
     */
    std::vector<std::string> candidate_urls(const std::string& url) const;

    const FetchOptions& options() const { return options_; }

    /**
     * @brief Percent-encode everything except RFC 3986 unreserved characters
     */
    static std::string url_encode(const std::string& value);

    /**
     * @brief True if the body starts (after whitespace) with an HTML document marker
     */
    static bool looks_like_html(const std::string& body);

private:
    std::shared_ptr<HttpClient> client_;
    FetchOptions options_;
    Logger logger_;

    nlohmann::json attempt(const std::string& request_url) const;
};

} // namespace geoenrich
