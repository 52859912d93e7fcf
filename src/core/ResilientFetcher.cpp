/**
 * @file ResilientFetcher.cpp
 * @brief Implementation of the endpoint-fallback JSON fetcher
 */

#include "ResilientFetcher.hpp"
#include "EnrichmentErrors.hpp"
#include <algorithm>
#include <cctype>
#include <exception>
#include <iomanip>
#include <sstream>
#include <thread>

namespace geoenrich {

std::string FetchStrategy::apply(const std::string& url) const {
    switch (style) {
        case Style::DIRECT: return url;
        case Style::PREFIX: return base + url;
        case Style::WRAP:   return base + ResilientFetcher::url_encode(url);
    }
    return url;
}

std::string FetchStrategy::describe() const {
    switch (style) {
        case Style::DIRECT: return "direct";
        case Style::PREFIX: return "prefix proxy " + base;
        case Style::WRAP:   return "wrap proxy " + base;
    }
    return "unknown";
}

ResilientFetcher::ResilientFetcher(std::shared_ptr<HttpClient> client, FetchOptions options)
    : client_(std::move(client)), options_(std::move(options)), logger_("ResilientFetcher") {
}

std::vector<std::string> ResilientFetcher::candidate_urls(const std::string& url) const {
    std::vector<std::string> urls;
    urls.push_back(url);
    if (options_.use_proxies) {
        for (const auto& proxy : options_.proxies) {
            urls.push_back(proxy.apply(url));
        }
    }
    return urls;
}

nlohmann::json ResilientFetcher::fetch_json(const std::string& url) const {
    const auto urls = candidate_urls(url);
    std::exception_ptr last_error;

    for (size_t i = 0; i < urls.size(); ++i) {
        if (i > 0 && options_.retry_delay.count() > 0) {
            std::this_thread::sleep_for(options_.retry_delay);
        }

        try {
            nlohmann::json body = attempt(urls[i]);
            if (i > 0) {
                logger_.detailed("Succeeded on attempt " + std::to_string(i + 1) +
                                 " of " + std::to_string(urls.size()));
            }
            return body;
        } catch (const EnrichmentError& e) {
            logger_.warning("Attempt " + std::to_string(i + 1) + "/" +
                            std::to_string(urls.size()) + " failed: " + e.what());
            last_error = std::current_exception();
        }
    }

    logger_.error("All " + std::to_string(urls.size()) + " endpoints failed for " + url);
    std::rethrow_exception(last_error);
}

nlohmann::json ResilientFetcher::attempt(const std::string& request_url) const {
    HttpRequestOptions request;
    request.timeout_seconds = options_.timeout_seconds;
    request.user_agent = options_.user_agent;

    logger_.debug("GET " + request_url);
    HttpResponse response = client_->get(request_url, request);

    if (!response.is_success()) {
        throw NetworkError("HTTP " + std::to_string(response.status_code) +
                           " from " + request_url, response.status_code);
    }

    if (looks_like_html(response.body)) {
        throw ParseError("received HTML instead of JSON from " + request_url);
    }

    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(std::string(e.what()) + " (" + request_url + ")");
    }
}

std::string ResilientFetcher::url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(uc);
        }
    }

    return escaped.str();
}

bool ResilientFetcher::looks_like_html(const std::string& body) {
    const auto first = body.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return false;
    }

    std::string head = body.substr(first, 16);
    std::transform(head.begin(), head.end(), head.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return head.rfind("<html", 0) == 0 || head.rfind("<!doctype", 0) == 0;
}

} // namespace geoenrich
