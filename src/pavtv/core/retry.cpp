// Copyright (c) 2026 changcheng967. All rights reserved.

#include <pavtv/core/retry.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>

namespace pavtv::core {

namespace {

const char* method_name(HttpMethod method) noexcept {
    return method == HttpMethod::post ? "POST" : "GET";
}

} // namespace

std::expected<HttpResponse, Error>
request_with_retry(HttpTransport& transport,
                   const HttpRequest& request,
                   const RetryPolicy& policy,
                   const SleepFn& sleep) {
    const std::uint32_t max_attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;

    for (std::uint32_t attempt = 1;; ++attempt) {
        spdlog::debug("{} {} (attempt {}/{})", method_name(request.method), request.url, attempt, max_attempts);

        auto response = transport.perform(request);
        if (response) {
            if (response->ok()) {
                return std::move(*response);
            }
            Error err(ReplayErrc::server_error,
                std::string(method_name(request.method)) + " " + request.url
                + " failed with status: " + std::to_string(response->status_code));
            err.http_status = response->status_code;
            return std::unexpected(std::move(err));
        }

        if (attempt >= max_attempts) {
            Error err(ReplayErrc::network_error,
                std::string(method_name(request.method)) + " " + request.url
                + " failed after " + std::to_string(attempt) + " attempts: " + response.error().reason);
            err.attempts = static_cast<int>(attempt);
            return std::unexpected(std::move(err));
        }

        const auto delay = policy.delay_for(attempt);
        spdlog::debug("{} {} failed ({}), retrying in {} ms",
                      method_name(request.method), request.url, response.error().reason, delay.count());
        if (sleep) {
            sleep(delay);
        } else {
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace pavtv::core
