/**
 * @file MockHttpClient.hpp
 * @brief gmock HttpClient plus canned responses
 */

#pragma once

#include <gmock/gmock.h>

#include "core/HttpClient.hpp"

#include <string>

namespace geoenrich {
namespace test {

class MockHttpClient : public HttpClient {
public:
    MOCK_METHOD(HttpResponse, get, (const std::string& url, const HttpRequestOptions& options), (override));
};

inline HttpResponse ok_json(const std::string& body) {
    return HttpResponse{200, body};
}

inline HttpResponse status(long code, const std::string& body = "") {
    return HttpResponse{code, body};
}

} // namespace test
} // namespace geoenrich
