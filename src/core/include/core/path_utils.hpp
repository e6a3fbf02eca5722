/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#ifdef _WIN32
#include <windows.h>
#endif

namespace ddrop::core {

    /**
     * @brief Convert filesystem path to a UTF-8 string
     *
     * On Windows, std::filesystem::path::string() returns a string in the system codepage,
     * not UTF-8. On Linux/Mac, the native encoding is already UTF-8.
     */
    inline std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
        const std::wstring wstr = p.wstring();
        if (wstr.empty()) {
            return std::string();
        }

        const int size_needed = WideCharToMultiByte(CP_UTF8, 0, wstr.c_str(),
                                                    static_cast<int>(wstr.size()),
                                                    nullptr, 0, nullptr, nullptr);
        if (size_needed <= 0) {
            return std::string();
        }

        std::string utf8_str(size_needed, 0);
        const int converted = WideCharToMultiByte(CP_UTF8, 0, wstr.c_str(),
                                                  static_cast<int>(wstr.size()),
                                                  &utf8_str[0], size_needed, nullptr, nullptr);
        if (converted <= 0) {
            return std::string();
        }
        utf8_str.resize(converted);
        return utf8_str;
#else
        return p.string();
#endif
    }

    /**
     * @brief Convert a UTF-8 string to a filesystem path
     *
     * Decoded file URIs are UTF-8; on Windows they must go through a wide string first.
     */
    inline std::filesystem::path utf8_to_path(const std::string& utf8_str) {
#ifdef _WIN32
        if (utf8_str.empty()) {
            return std::filesystem::path();
        }

        const int size_needed = MultiByteToWideChar(CP_UTF8, 0, utf8_str.c_str(),
                                                    static_cast<int>(utf8_str.size()),
                                                    nullptr, 0);
        if (size_needed <= 0) {
            return std::filesystem::path();
        }

        std::wstring wstr(size_needed, 0);
        const int converted = MultiByteToWideChar(CP_UTF8, 0, utf8_str.c_str(),
                                                  static_cast<int>(utf8_str.size()),
                                                  &wstr[0], size_needed);
        if (converted <= 0) {
            return std::filesystem::path();
        }
        wstr.resize(converted);
        return std::filesystem::path(wstr);
#else
        return std::filesystem::path(utf8_str);
#endif
    }

    /**
     * @brief Percent-encode a UTF-8 path for use in a URI path component
     *
     * Unreserved characters and '/' pass through; everything else, including
     * every byte of a multi-byte sequence, becomes %XX (upper-case hex).
     */
    std::string percent_encode_path(std::string_view utf8_path);

    /**
     * @brief Build a file:// URI from an absolute local path
     *
     * "/tmp/a b.png" -> "file:///tmp/a%20b.png". On Windows "C:\x" -> "file:///C:/x".
     * Relative paths are made absolute against the current directory first.
     */
    std::string path_to_file_uri(const std::filesystem::path& path);

} // namespace ddrop::core
