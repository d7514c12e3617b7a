// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace pavtv::core {

enum class ReplayErrc {
    success = 0,
    invalid_input,
    not_found,
    precondition_failed,
    network_error,
    server_error,
    parse_error,
    io_error,
    format_error,
};

namespace detail {

struct ReplayErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "pavtv::replay";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<ReplayErrc>(ev)) {
            case ReplayErrc::success:             return "Success";
            case ReplayErrc::invalid_input:       return "Invalid input";
            case ReplayErrc::not_found:           return "Replay not found";
            case ReplayErrc::precondition_failed: return "Replay not ready";
            case ReplayErrc::network_error:       return "Network error";
            case ReplayErrc::server_error:        return "Server error";
            case ReplayErrc::parse_error:         return "Parse error";
            case ReplayErrc::io_error:            return "I/O error";
            case ReplayErrc::format_error:        return "Format error";
            default:                              return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ReplayErrcCategory& replay_errc_category() noexcept {
    static detail::ReplayErrcCategory category;
    return category;
}

inline std::error_code make_error_code(ReplayErrc e) noexcept {
    return {static_cast<int>(e), replay_errc_category()};
}

// Error value carried through every std::expected in the library.
// `detail` holds the context (URL, attempts, sizes, paths) shown to the user.
struct Error {
    std::error_code code;
    std::string detail;
    int http_status{0};   // Set for server_error
    int attempts{0};      // Set for network_error

    Error() = default;
    Error(ReplayErrc e, std::string d)
        : code(make_error_code(e)), detail(std::move(d)) {}

    [[nodiscard]] bool is(ReplayErrc e) const noexcept { return code == make_error_code(e); }

    [[nodiscard]] std::string message() const {
        if (detail.empty()) return code.message();
        return code.message() + ": " + detail;
    }
};

} // namespace pavtv::core

namespace std {

template<>
struct is_error_code_enum<pavtv::core::ReplayErrc> : true_type {};

} // namespace std
