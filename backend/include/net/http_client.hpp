#pragma once

#include "core/error.hpp"

#include <chrono>
#include <string>

namespace candlecast::net {

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @class HttpClient
 * @brief Blocking libcurl client. Non-2xx responses come back as errors:
 * 429 and 5xx as ErrorCode::Unavailable, other 4xx as Invalid or NotFound.
 */
class HttpClient {
public:
    HttpClient();

    core::Expected<HttpResponse> get(const std::string& url, std::chrono::seconds timeout) const;
    core::Expected<HttpResponse> post_json(const std::string& url, const std::string& body,
                                           std::chrono::seconds timeout) const;

    static std::string url_encode(const std::string& value);

private:
    core::Expected<HttpResponse> perform(const std::string& url, const std::string* body,
                                         std::chrono::seconds timeout) const;
};

} // namespace candlecast::net
