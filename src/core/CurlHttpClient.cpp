/**
 * @file CurlHttpClient.cpp
 * @brief Implementation of the libcurl HTTP transport
 */

#include "CurlHttpClient.hpp"
#include "EnrichmentErrors.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace geoenrich {

namespace {

// Callback for CURL to write response data
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

struct CurlEasyDeleter {
    void operator()(CURL* handle) const {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

std::once_flag curl_init_flag;

} // namespace

CurlHttpClient::CurlHttpClient()
    : logger_("CurlHttpClient") {
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

HttpResponse CurlHttpClient::get(const std::string& url, const HttpRequestOptions& options) {
    CurlEasyPtr curl(curl_easy_init());
    if (!curl) {
        throw NetworkError("failed to initialize CURL handle");
    }

    HttpResponse response;

    CurlSlistPtr header_list;
    for (const auto& header : options.headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
        if (!appended) {
            throw NetworkError("failed to build request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(options.timeout_seconds));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);  // required for timeouts off the main thread
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    logger_.debug("GET " + url);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw NetworkError(std::string(curl_easy_strerror(res)) + " (" + url + ")");
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    logger_.trace("HTTP " + std::to_string(response.status_code) + ", " +
                  std::to_string(response.body.size()) + " bytes from " + url);

    return response;
}

} // namespace geoenrich
