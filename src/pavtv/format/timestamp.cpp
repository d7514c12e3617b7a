// Copyright (c) 2026 changcheng967. All rights reserved.

#include <pavtv/format/timestamp.hpp>
#include <charconv>
#include <chrono>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>

namespace pavtv::format {

using core::Error;
using core::ReplayErrc;

namespace chrono = std::chrono;

namespace {

// Range of Unix milliseconds whose tick value fits an int64
constexpr std::int64_t MAX_MILLIS =
    (std::numeric_limits<std::int64_t>::max() - TICKS_EPOCH_OFFSET) / TICKS_PER_MILLISECOND;
constexpr std::int64_t MIN_MILLIS =
    (std::numeric_limits<std::int64_t>::min() + TICKS_EPOCH_OFFSET) / TICKS_PER_MILLISECOND;

class Cursor {
public:
    explicit Cursor(std::string_view s) noexcept : s_(s) {}

    // Fixed-width decimal field
    std::optional<int> digits(std::size_t n) noexcept {
        if (s_.size() - pos_ < n) return std::nullopt;
        int value = 0;
        for (std::size_t i = 0; i < n; ++i) {
            char c = s_[pos_ + i];
            if (c < '0' || c > '9') return std::nullopt;
            value = value * 10 + (c - '0');
        }
        pos_ += n;
        return value;
    }

    bool expect(char c) noexcept {
        if (pos_ < s_.size() && s_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    [[nodiscard]] std::optional<char> peek() const noexcept {
        if (pos_ < s_.size()) return s_[pos_];
        return std::nullopt;
    }

    void skip() noexcept { ++pos_; }
    [[nodiscard]] bool done() const noexcept { return pos_ == s_.size(); }

private:
    std::string_view s_;
    std::size_t pos_{0};
};

bool is_digit(std::optional<char> c) noexcept {
    return c && *c >= '0' && *c <= '9';
}

// YYYY-MM-DD(T|t| )HH:MM:SS[.fraction](Z|z|+HH:MM|-HH:MM)
std::optional<Timestamp> parse_rfc3339(std::string_view text) noexcept {
    Cursor cur(text);

    auto year = cur.digits(4);
    if (!year || !cur.expect('-')) return std::nullopt;
    auto month = cur.digits(2);
    if (!month || !cur.expect('-')) return std::nullopt;
    auto day = cur.digits(2);
    if (!day) return std::nullopt;
    if (!cur.expect('T') && !cur.expect('t') && !cur.expect(' ')) return std::nullopt;
    auto hour = cur.digits(2);
    if (!hour || !cur.expect(':')) return std::nullopt;
    auto minute = cur.digits(2);
    if (!minute || !cur.expect(':')) return std::nullopt;
    auto second = cur.digits(2);
    if (!second) return std::nullopt;

    int millis = 0;
    if (cur.expect('.')) {
        if (!is_digit(cur.peek())) return std::nullopt;
        int scale = 100;
        while (is_digit(cur.peek())) {
            millis += (*cur.peek() - '0') * scale;
            scale /= 10;
            cur.skip();
        }
    }

    int offset = 0;
    if (cur.expect('Z') || cur.expect('z')) {
        offset = 0;
    } else {
        int sign = 0;
        if (cur.expect('+')) sign = 1;
        else if (cur.expect('-')) sign = -1;
        else return std::nullopt;
        auto oh = cur.digits(2);
        if (!oh || !cur.expect(':')) return std::nullopt;
        auto om = cur.digits(2);
        if (!om || *oh > 23 || *om > 59) return std::nullopt;
        offset = sign * (*oh * 60 + *om);
    }

    if (!cur.done()) return std::nullopt;

    const chrono::year_month_day ymd{
        chrono::year{*year},
        chrono::month{static_cast<unsigned>(*month)},
        chrono::day{static_cast<unsigned>(*day)}};
    if (!ymd.ok() || *hour > 23 || *minute > 59 || *second > 59) return std::nullopt;

    const std::int64_t days = chrono::sys_days{ymd}.time_since_epoch().count();
    const std::int64_t local_seconds = days * 86'400 + *hour * 3'600 + *minute * 60 + *second;
    const std::int64_t utc_seconds = local_seconds - static_cast<std::int64_t>(offset) * 60;

    return Timestamp{utc_seconds * 1'000 + millis, offset};
}

} // namespace

std::expected<Timestamp, Error> parse_created(std::string_view text) {
    if (auto ts = parse_rfc3339(text)) {
        return *ts;
    }

    // Some metadata sources return epoch seconds instead of ISO timestamps
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }
    std::int64_t seconds = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), seconds);
    if (digits.empty() || ec != std::errc{} || end != digits.data() + digits.size()) {
        return std::unexpected(Error(ReplayErrc::format_error,
            "Invalid timestamp '" + std::string(text) + "'"));
    }
    if (seconds > MAX_MILLIS / 1'000 || seconds < MIN_MILLIS / 1'000) {
        return std::unexpected(Error(ReplayErrc::format_error,
            "Timestamp out of range: " + std::string(text)));
    }
    return Timestamp{seconds * 1'000, 0};
}

std::string format_created(const Timestamp& ts) {
    const chrono::sys_time<chrono::milliseconds> local{
        chrono::milliseconds{ts.unix_millis + static_cast<std::int64_t>(ts.offset_minutes) * 60'000}};
    const auto day_start = chrono::floor<chrono::days>(local);
    const chrono::year_month_day ymd{day_start};
    const chrono::hh_mm_ss tod{chrono::floor<chrono::seconds>(local - day_start)};

    std::ostringstream ss;
    ss << std::setfill('0')
       << std::setw(4) << static_cast<int>(ymd.year()) << '.'
       << std::setw(2) << static_cast<unsigned>(ymd.month()) << '.'
       << std::setw(2) << static_cast<unsigned>(ymd.day()) << '-'
       << std::setw(2) << tod.hours().count() << '.'
       << std::setw(2) << tod.minutes().count() << '.'
       << std::setw(2) << tod.seconds().count();
    return ss.str();
}

} // namespace pavtv::format
