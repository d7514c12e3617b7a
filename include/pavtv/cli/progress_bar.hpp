// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pavtv::cli {

// Single-line progress bar for CLI
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    // Redraw for current/total steps; no-op while total is 0
    void update(std::uint64_t current, std::uint64_t total) noexcept;

    // Draw the final state and end the line
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }

    [[nodiscard]] static std::string render_bar(double percent, int width = 30);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);

private:
    std::string label_;
    std::uint64_t last_current_{0};
    std::uint64_t last_total_{0};
    int last_percent_{-1};
    bool finished_{false};
};

} // namespace pavtv::cli
