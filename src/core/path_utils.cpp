/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/path_utils.hpp"

namespace ddrop::core {

    namespace {

        bool is_unreserved(const unsigned char c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                   c == '-' || c == '.' || c == '_' || c == '~';
        }

    } // namespace

    std::string percent_encode_path(std::string_view utf8_path) {
        constexpr char HEX[] = "0123456789ABCDEF";

        std::string out;
        out.reserve(utf8_path.size());
        for (const char ch : utf8_path) {
            const auto c = static_cast<unsigned char>(ch);
            if (is_unreserved(c) || c == '/') {
                out.push_back(ch);
            } else {
                out.push_back('%');
                out.push_back(HEX[c >> 4]);
                out.push_back(HEX[c & 0x0F]);
            }
        }
        return out;
    }

    std::string path_to_file_uri(const std::filesystem::path& path) {
        std::error_code ec;
        std::filesystem::path absolute = path.is_absolute() ? path : std::filesystem::absolute(path, ec);
        if (ec)
            absolute = path;

        std::string utf8 = path_to_utf8(absolute.lexically_normal());
#ifdef _WIN32
        for (auto& c : utf8) {
            if (c == '\\')
                c = '/';
        }
        // Drive letter paths keep their colon: file:///C:/dir
        if (utf8.size() >= 2 && utf8[1] == ':') {
            return "file:///" + utf8.substr(0, 2) + percent_encode_path(utf8.substr(2));
        }
#endif
        return "file://" + percent_encode_path(utf8);
    }

} // namespace ddrop::core
