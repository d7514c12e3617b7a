// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <pavtv/core/config.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pavtv::core {

enum class HttpMethod : std::uint8_t {
    get,
    post,   // Empty body
};

struct HttpRequest {
    HttpMethod method{HttpMethod::get};
    std::string url;
};

struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;   // Lower-case names
    std::vector<std::uint8_t> body;

    [[nodiscard]] bool ok() const noexcept { return status_code >= 200 && status_code < 300; }

    [[nodiscard]] std::optional<std::string_view> header(std::string_view lower_name) const noexcept {
        auto it = headers.find(std::string(lower_name));
        if (it == headers.end()) return std::nullopt;
        return std::string_view(it->second);
    }

    [[nodiscard]] std::string_view text() const noexcept {
        return {reinterpret_cast<const char*>(body.data()), body.size()};
    }
};

// Connection-level failure: no HTTP status was received
struct TransportFailure {
    std::string reason;
};

// Performs one HTTP exchange. Implementations must be safe to call from
// several threads at once.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    [[nodiscard]] virtual std::expected<HttpResponse, TransportFailure>
    perform(const HttpRequest& request) = 0;
};

// libcurl transport. One easy handle per request, no shared state.
class HttpSession final : public HttpTransport {
public:
    explicit HttpSession(ClientConfig config = {});

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<HttpResponse, TransportFailure>
    perform(const HttpRequest& request) override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    ClientConfig config_;
};

} // namespace pavtv::core
