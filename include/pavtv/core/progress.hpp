// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <functional>

namespace pavtv::core {

struct ProgressCounters {
    std::size_t current{0};
    std::size_t max{0};

    // current/max, 0.0 when max is 0
    [[nodiscard]] double progress() const noexcept {
        if (max == 0) return 0.0;
        return static_cast<double>(current) / static_cast<double>(max);
    }
};

// Network pipeline: files fetched, then container parts built
struct OnlineProgress {
    ProgressCounters download;
    ProgressCounters build;
};

// Local-disk pipeline
struct LocalProgress {
    ProgressCounters header;
    ProgressCounters data_chunks;
    ProgressCounters event_chunks;        // Pavlov group
    ProgressCounters checkpoint_chunks;
};

using OnlineProgressCallback = std::function<void(const OnlineProgress&)>;
using LocalProgressCallback = std::function<void(const LocalProgress&)>;

} // namespace pavtv::core
