// Copyright (c) 2026 changcheng967. All rights reserved.

#include <pavtv/core/http_session.hpp>
#include <curl/curl.h>
#include <cctype>
#include <utility>

namespace pavtv::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// Header callback, stores lower-cased names
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<std::vector<std::uint8_t>*>(userdata);
    if (!body) return 0;

    std::size_t total = size * nitems;
    body->insert(body->end(),
                 reinterpret_cast<const std::uint8_t*>(ptr),
                 reinterpret_cast<const std::uint8_t*>(ptr) + total);
    return total;
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(ClientConfig config)
    : config_(std::move(config)) {}

std::expected<HttpResponse, TransportFailure>
HttpSession::perform(const HttpRequest& request) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(TransportFailure{"curl_easy_init failed"});
    }

    HttpResponse response{};
    char error_buffer[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl.ptr, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(config_.request_timeout.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.ptr, CURLOPT_ACCEPT_ENCODING, "");

    if (request.method == HttpMethod::post) {
        curl_easy_setopt(curl.ptr, CURLOPT_POST, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(curl.ptr, CURLOPT_POSTFIELDSIZE, 0L);
    }

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &response.body);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        std::string reason = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(result);
        return std::unexpected(TransportFailure{std::move(reason)});
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    return response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace pavtv::core
