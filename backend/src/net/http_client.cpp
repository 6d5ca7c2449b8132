#include "net/http_client.hpp"

#include <curl/curl.h>

#include <cctype>
#include <cstdio>
#include <mutex>

namespace candlecast::net {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

core::ErrorCode classify_curl(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT: return core::ErrorCode::Timeout;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING: return core::ErrorCode::Unavailable;
        default: return core::ErrorCode::Io;
    }
}

core::ErrorCode classify_http(long status) {
    if (status == 429 || status >= 500) return core::ErrorCode::Unavailable;
    if (status == 404) return core::ErrorCode::NotFound;
    return core::ErrorCode::Invalid;
}

} // namespace

HttpClient::HttpClient() {
    static std::once_flag init_flag;
    std::call_once(init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

core::Expected<HttpResponse> HttpClient::get(const std::string& url, std::chrono::seconds timeout) const {
    return perform(url, nullptr, timeout);
}

core::Expected<HttpResponse> HttpClient::post_json(const std::string& url, const std::string& body,
                                                   std::chrono::seconds timeout) const {
    return perform(url, &body, timeout);
}

core::Expected<HttpResponse> HttpClient::perform(const std::string& url, const std::string* body,
                                                 std::chrono::seconds timeout) const {
    CURL* curl_handle = curl_easy_init();
    if (!curl_handle) return core::make_error(core::ErrorCode::NoMem, "curl_easy_init failed");

    HttpResponse response;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_handle, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }
    curl_easy_setopt(curl_handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_handle, CURLOPT_FOLLOWLOCATION, 1L);

    const CURLcode result = curl_easy_perform(curl_handle);
    curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &response.status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl_handle);

    if (result != CURLE_OK) {
        return core::make_error(classify_curl(result),
                                std::string(body ? "POST " : "GET ") + url + ": " + curl_easy_strerror(result));
    }
    if (response.status < 200 || response.status >= 300) {
        std::string snippet = response.body.substr(0, 200);
        return core::make_error(classify_http(response.status),
                                "HTTP " + std::to_string(response.status) + " from " + url + ": " + snippet);
    }
    return response;
}

std::string HttpClient::url_encode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

} // namespace candlecast::net
