// Copyright (c) 2026 changcheng967. All rights reserved.

#include <pavtv/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace pavtv::cli {

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t total) noexcept {
    if (total == 0) return;

    double percent = static_cast<double>(current) * 100.0 / static_cast<double>(total);
    percent = std::clamp(percent, 0.0, 100.0);

    // Only redraw on a new whole percent or a new step count
    const int pct_int = static_cast<int>(percent);
    if (pct_int == last_percent_ && current == last_current_ && total == last_total_) return;

    last_percent_ = pct_int;
    last_current_ = current;
    last_total_ = total;

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);

    line += " ";
    if (pct_int < 100) line += " ";
    if (pct_int < 10) line += " ";
    line += std::to_string(pct_int) + "%";

    line += " (";
    line += std::to_string(current);
    line += "/";
    line += std::to_string(total);
    line += ")";

    // Clear rest of line
    line += std::string(10, ' ');

    std::cout << line << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    if (last_total_ != 0) {
        last_percent_ = -1;
        update(last_total_, last_total_);
    }
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent, int width) {
    const int filled = static_cast<int>(std::round(width * std::clamp(percent, 0.0, 100.0) / 100.0));
    const int empty = width - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(empty), ' ');
    bar += ']';
    return bar;
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    std::ostringstream ss;
    if (bytes >= GB) {
        ss << std::fixed << std::setprecision(2) << (static_cast<double>(bytes) / GB) << " GB";
    } else if (bytes >= MB) {
        ss << std::fixed << std::setprecision(1) << (static_cast<double>(bytes) / MB) << " MB";
    } else if (bytes >= KB) {
        ss << std::fixed << std::setprecision(0) << (static_cast<double>(bytes) / KB) << " KB";
    } else {
        ss << bytes << " B";
    }
    return ss.str();
}

} // namespace pavtv::cli
