/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "bridge/file_resolver.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <algorithm>
#include <cctype>

namespace ddrop::bridge {

    namespace {

        bool iequals(std::string_view a, std::string_view b) {
            return std::ranges::equal(a, b, [](const char x, const char y) {
                return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
            });
        }

        // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
        bool is_valid_scheme(std::string_view scheme) {
            if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front())))
                return false;
            return std::ranges::all_of(scheme, [](const char c) {
                return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
            });
        }

        int hex_value(const char c) {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        Result<std::string> percent_decode(std::string_view encoded) {
            std::string decoded;
            decoded.reserve(encoded.size());
            for (size_t i = 0; i < encoded.size(); ++i) {
                if (encoded[i] != '%') {
                    decoded.push_back(encoded[i]);
                    continue;
                }
                if (i + 2 >= encoded.size())
                    return make_error(ErrorCode::BAD_ESCAPE, "truncated escape");
                const int hi = hex_value(encoded[i + 1]);
                const int lo = hex_value(encoded[i + 2]);
                if (hi < 0 || lo < 0)
                    return make_error(ErrorCode::BAD_ESCAPE,
                                      fmt::format("invalid escape '%{}{}'", encoded[i + 1], encoded[i + 2]));
                const char value = static_cast<char>((hi << 4) | lo);
                if (value == '\0' || value == '/')
                    return make_error(ErrorCode::FORBIDDEN_CHARACTER, "encoded NUL or '/' in path");
                decoded.push_back(value);
                i += 2;
            }
            return decoded;
        }

    } // namespace

    Result<FileReference> resolve_location(std::string_view location) {
        if (location.empty())
            return make_error(ErrorCode::EMPTY_LOCATION, "empty string");

        const auto colon = location.find(':');
        if (colon == std::string_view::npos || !is_valid_scheme(location.substr(0, colon)))
            return make_error(ErrorCode::MISSING_SCHEME, "not a URI");

        const auto scheme = location.substr(0, colon);
        if (!iequals(scheme, "file"))
            return make_error(ErrorCode::UNSUPPORTED_SCHEME, fmt::format("scheme '{}'", scheme));

        auto rest = location.substr(colon + 1);
        if (rest.find_first_of("?#") != std::string_view::npos)
            return make_error(ErrorCode::QUERY_OR_FRAGMENT, "file URIs carry a path only");

        if (rest.starts_with("//")) {
            rest.remove_prefix(2);
            const auto slash = rest.find('/');
            const auto authority = rest.substr(0, slash);
            if (!authority.empty() && !iequals(authority, "localhost"))
                return make_error(ErrorCode::REMOTE_HOST, fmt::format("host '{}'", authority));
            if (slash == std::string_view::npos)
                return make_error(ErrorCode::NOT_ABSOLUTE, "no path");
            rest = rest.substr(slash);
        }

        if (!rest.starts_with('/'))
            return make_error(ErrorCode::NOT_ABSOLUTE, "relative path");

        auto decoded = percent_decode(rest);
        if (!decoded)
            return std::unexpected(decoded.error());

        std::string& utf8 = *decoded;
#ifdef _WIN32
        // "/C:/dir" -> "C:/dir"
        if (utf8.size() >= 3 && std::isalpha(static_cast<unsigned char>(utf8[1])) && utf8[2] == ':')
            utf8.erase(0, 1);
#endif

        return FileReference{
            .path = core::utf8_to_path(utf8).lexically_normal(),
            .uri = std::string(location)};
    }

    DropBatch resolve_locations(const std::vector<std::string>& locations, size_t* rejected) {
        DropBatch batch;
        batch.reserve(locations.size());

        for (const auto& location : locations) {
            auto ref = resolve_location(location);
            if (!ref) {
                LOG_DEBUG("Skipping location '{}': {}", location, ref.error().format());
                if (rejected)
                    ++*rejected;
                continue;
            }
            batch.push_back(std::move(*ref));
        }

        LOG_TRACE("Resolved {} of {} location(s)", batch.size(), locations.size());
        return batch;
    }

} // namespace ddrop::bridge
