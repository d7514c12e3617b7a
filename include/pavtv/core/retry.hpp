// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <pavtv/core/config.hpp>
#include <pavtv/core/error.hpp>
#include <pavtv/core/http_session.hpp>
#include <chrono>
#include <expected>
#include <functional>

namespace pavtv::core {

using SleepFn = std::function<void(std::chrono::milliseconds)>;

// Perform a request, retrying transport failures with exponential backoff.
// A response with a non-2xx status is returned as server_error without retry.
// Exhausting the policy yields network_error with the attempt count.
[[nodiscard]] std::expected<HttpResponse, Error>
request_with_retry(HttpTransport& transport,
                   const HttpRequest& request,
                   const RetryPolicy& policy,
                   const SleepFn& sleep = {});

} // namespace pavtv::core
