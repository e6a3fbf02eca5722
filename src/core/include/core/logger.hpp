/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <atomic>
#include <cstdint>
#include <fmt/format.h>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace ddrop::core {

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Performance = 3,
        Warn = 4,
        Error = 5,
        Critical = 6,
        Off = 7
    };

    enum class LogModule : uint8_t {
        Core = 0,
        Bridge = 1,
        Protocol = 2,
        Resolver = 3,
        Native = 4,
        App = 5,
        Unknown = 6,
        Count = 7
    };

    // Accepts trace/debug/info/perf/warn/error/critical/off (and a few aliases)
    [[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view level_str);

    [[nodiscard]] std::string_view log_level_name(LogLevel level);

    // Derives the module from the source path of a call site
    [[nodiscard]] LogModule module_from_path(std::string_view file_path);

    // Glob match with '*' wildcards, used by the log filter
    [[nodiscard]] bool matches_filter(std::string_view text, std::string_view pattern);

    class Logger {
    public:
        static Logger& get();

        void init(LogLevel console_level = LogLevel::Info,
                  const std::string& log_file = "",
                  const std::string& filter_pattern = "");

        // Log a pre-formatted message (called by macros)
        void log(LogLevel level, const std::source_location& loc, std::string_view msg);

        void set_level(LogLevel level);
        [[nodiscard]] LogLevel level() const {
            return static_cast<LogLevel>(global_level_.load(std::memory_order_relaxed));
        }
        void flush();

        bool is_enabled(LogLevel level) const {
            return static_cast<uint8_t>(level) >= global_level_.load(std::memory_order_relaxed);
        }

        void log_internal(LogLevel level, const std::source_location& loc, const std::string& msg) {
            if (static_cast<uint8_t>(level) < global_level_.load(std::memory_order_relaxed))
                return;
            log(level, loc, msg);
        }

        // Fast path: the level check runs before any formatting.
        template <typename... Args>
        void log_internal(LogLevel level, const std::source_location& loc,
                          fmt::format_string<Args...> fmt, Args&&... args) {
            if (static_cast<uint8_t>(level) < global_level_.load(std::memory_order_relaxed))
                return;

            log(level, loc, fmt::format(fmt, std::forward<Args>(args)...));
        }

    private:
        Logger();
        ~Logger();
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        struct Impl;
        std::unique_ptr<Impl> impl_;

        std::atomic<uint8_t> global_level_{static_cast<uint8_t>(LogLevel::Info)};
    };

} // namespace ddrop::core

// Global macros
#define LOG_TRACE(...) \
    ::ddrop::core::Logger::get().log_internal(::ddrop::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(...) \
    ::ddrop::core::Logger::get().log_internal(::ddrop::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(...) \
    ::ddrop::core::Logger::get().log_internal(::ddrop::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...) \
    ::ddrop::core::Logger::get().log_internal(::ddrop::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(...) \
    ::ddrop::core::Logger::get().log_internal(::ddrop::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)
