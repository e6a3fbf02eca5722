/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <fmt/format.h>
#include <string>
#include <string_view>

namespace ddrop::bridge {

    /// Error codes for bridge operations. None of them is fatal; callers log and drop.
    enum class ErrorCode {
        SUCCESS = 0,

        // Location resolution (100-199)
        EMPTY_LOCATION = 100,
        MISSING_SCHEME = 101,
        UNSUPPORTED_SCHEME = 102,
        REMOTE_HOST = 103,
        NOT_ABSOLUTE = 104,
        QUERY_OR_FRAGMENT = 105,
        BAD_ESCAPE = 106,
        FORBIDDEN_CHARACTER = 107,

        // Protocol (200-299)
        MALFORMED_PAYLOAD = 200,
    };

    constexpr std::string_view error_code_to_string(ErrorCode code) {
        switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::EMPTY_LOCATION: return "Empty location";
        case ErrorCode::MISSING_SCHEME: return "Missing URI scheme";
        case ErrorCode::UNSUPPORTED_SCHEME: return "Unsupported URI scheme";
        case ErrorCode::REMOTE_HOST: return "Remote host";
        case ErrorCode::NOT_ABSOLUTE: return "Path not absolute";
        case ErrorCode::QUERY_OR_FRAGMENT: return "Query or fragment present";
        case ErrorCode::BAD_ESCAPE: return "Malformed percent escape";
        case ErrorCode::FORBIDDEN_CHARACTER: return "Forbidden character";
        case ErrorCode::MALFORMED_PAYLOAD: return "Malformed payload";
        default: return "Unknown error";
        }
    }

    struct Error {
        ErrorCode code;
        std::string message;

        Error(ErrorCode c, std::string msg)
            : code(c),
              message(std::move(msg)) {}

        [[nodiscard]] std::string format() const {
            return fmt::format("[{}] {}", error_code_to_string(code), message);
        }

        [[nodiscard]] bool is(ErrorCode c) const { return code == c; }

        [[nodiscard]] bool is_resolution_error() const {
            const int c = static_cast<int>(code);
            return c >= 100 && c < 200;
        }
    };

    template <typename T>
    using Result = std::expected<T, Error>;

    inline std::unexpected<Error> make_error(ErrorCode code, std::string message) {
        return std::unexpected(Error{code, std::move(message)});
    }

} // namespace ddrop::bridge
