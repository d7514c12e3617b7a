// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <pavtv/core/error.hpp>
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace pavtv::core {

// Run task(i) for every i in [0, count) on at most `workers` threads.
// Results come back ordered by i whatever order the tasks finish in.
// After the first failure no new indices are started; the failure with the
// lowest index among those that ran is returned.
template<typename T, typename Task>
[[nodiscard]] std::expected<std::vector<T>, Error>
fan_out(std::size_t count, std::uint32_t workers, Task&& task) {
    if (count == 0) {
        return std::vector<T>{};
    }

    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    std::mutex mutex;
    std::vector<std::pair<std::size_t, T>> completed;
    std::optional<std::pair<std::size_t, Error>> first_error;
    completed.reserve(count);

    auto worker = [&] {
        while (!failed.load(std::memory_order_acquire)) {
            const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= count) {
                return;
            }

            std::expected<T, Error> result = task(i);

            std::lock_guard<std::mutex> lock(mutex);
            if (result) {
                completed.emplace_back(i, std::move(*result));
            } else {
                if (!first_error || i < first_error->first) {
                    first_error.emplace(i, std::move(result.error()));
                }
                failed.store(true, std::memory_order_release);
            }
        }
    };

    {
        const std::size_t thread_count = std::min<std::size_t>(std::max<std::uint32_t>(workers, 1), count);
        std::vector<std::jthread> threads;
        threads.reserve(thread_count);
        for (std::size_t t = 0; t < thread_count; ++t) {
            threads.emplace_back(worker);
        }
    } // Joined here

    if (first_error) {
        return std::unexpected(std::move(first_error->second));
    }

    std::sort(completed.begin(), completed.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<T> results;
    results.reserve(completed.size());
    for (auto& entry : completed) {
        results.push_back(std::move(entry.second));
    }
    return results;
}

} // namespace pavtv::core
