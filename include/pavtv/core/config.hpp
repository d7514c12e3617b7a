// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace pavtv::core {

constexpr const char* DEFAULT_SERVER = "https://tv.vankrupt.net";
constexpr const char* USER_AGENT = "pavtv/0.1";

constexpr std::int64_t DISCOVERY_PAGE_SIZE = 100;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 10;
constexpr std::uint32_t REQUEST_TIMEOUT_SEC = 30;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::uint32_t RETRY_ATTEMPTS = 5;
constexpr std::chrono::milliseconds RETRY_BASE_DELAY{2000};
constexpr std::uint32_t RETRY_BACKOFF_FACTOR = 2;

constexpr std::uint32_t FETCH_WORKERS = 8;                 // Parallel stream chunk fetches

// Backoff schedule for transport failures
struct RetryPolicy {
    std::uint32_t max_attempts{RETRY_ATTEMPTS};
    std::chrono::milliseconds base_delay{RETRY_BASE_DELAY};
    std::uint32_t factor{RETRY_BACKOFF_FACTOR};

    // Delay after the given failed attempt (1-based): base * factor^(attempt-1)
    [[nodiscard]] std::chrono::milliseconds delay_for(std::uint32_t attempt) const noexcept {
        auto delay = base_delay;
        for (std::uint32_t i = 1; i < attempt; ++i) {
            delay *= factor;
        }
        return delay;
    }
};

// Runtime configuration of a ReplayClient
struct ClientConfig {
    std::string server{DEFAULT_SERVER};
    std::chrono::seconds request_timeout{REQUEST_TIMEOUT_SEC};
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};
    RetryPolicy retry;
    std::uint32_t fetch_workers{FETCH_WORKERS};
    std::string user_agent{USER_AGENT};
};

} // namespace pavtv::core
