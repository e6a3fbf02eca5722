/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <algorithm>
#include <array>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace ddrop::core {

    namespace {

        constexpr std::array<std::string_view, static_cast<size_t>(LogModule::Count)> MODULE_NAMES = {
            "core", "bridge", "protocol", "resolver", "native", "app", "?"};

        spdlog::level::level_enum to_spdlog(const LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Performance: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            }
            return spdlog::level::info;
        }

        std::string_view basename(std::string_view path) {
            const auto pos = path.find_last_of("/\\");
            return pos == std::string_view::npos ? path : path.substr(pos + 1);
        }

    } // namespace

    std::optional<LogLevel> parse_log_level(std::string_view level_str) {
        if (level_str == "trace")
            return LogLevel::Trace;
        if (level_str == "debug")
            return LogLevel::Debug;
        if (level_str == "info")
            return LogLevel::Info;
        if (level_str == "perf" || level_str == "performance")
            return LogLevel::Performance;
        if (level_str == "warn" || level_str == "warning")
            return LogLevel::Warn;
        if (level_str == "error")
            return LogLevel::Error;
        if (level_str == "critical")
            return LogLevel::Critical;
        if (level_str == "off")
            return LogLevel::Off;
        return std::nullopt;
    }

    std::string_view log_level_name(const LogLevel level) {
        switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Performance: return "perf";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
        }
        return "info";
    }

    LogModule module_from_path(std::string_view file_path) {
        if (file_path.find("protocol_codec") != std::string_view::npos)
            return LogModule::Protocol;
        if (file_path.find("file_resolver") != std::string_view::npos)
            return LogModule::Resolver;

        const auto in_dir = [&](std::string_view dir) {
            return file_path.find(std::string("/") + std::string(dir) + "/") != std::string_view::npos ||
                   file_path.find(std::string("\\") + std::string(dir) + "\\") != std::string_view::npos;
        };
        if (in_dir("bridge"))
            return LogModule::Bridge;
        if (in_dir("native"))
            return LogModule::Native;
        if (in_dir("app"))
            return LogModule::App;
        if (in_dir("core"))
            return LogModule::Core;
        return LogModule::Unknown;
    }

    bool matches_filter(std::string_view text, std::string_view pattern) {
        if (pattern.empty())
            return true;

        // Iterative glob with single-star backtracking
        size_t t = 0, p = 0;
        size_t star = std::string_view::npos, mark = 0;
        while (t < text.size()) {
            if (p < pattern.size() && pattern[p] != '*' && pattern[p] == text[t]) {
                ++t;
                ++p;
            } else if (p < pattern.size() && pattern[p] == '*') {
                star = p++;
                mark = t;
            } else if (star != std::string_view::npos) {
                p = star + 1;
                t = ++mark;
            } else {
                return false;
            }
        }
        while (p < pattern.size() && pattern[p] == '*')
            ++p;
        return p == pattern.size();
    }

    struct Logger::Impl {
        std::shared_ptr<spdlog::logger> logger;
        std::string filter_pattern;
        std::mutex mutex;
    };

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    Logger::Logger()
        : impl_(std::make_unique<Impl>()) {}

    Logger::~Logger() {
        if (impl_ && impl_->logger)
            impl_->logger->flush();
    }

    void Logger::init(const LogLevel console_level, const std::string& log_file, const std::string& filter_pattern) {
        const std::lock_guard lock(impl_->mutex);

        std::vector<spdlog::sink_ptr> sinks;
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        std::string file_error;
        if (!log_file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }

        impl_->logger = std::make_shared<spdlog::logger>("ddrop", sinks.begin(), sinks.end());
        impl_->logger->set_level(spdlog::level::trace);
        impl_->logger->flush_on(spdlog::level::warn);
        if (!file_error.empty())
            impl_->logger->warn("[core] Cannot open log file '{}': {}", log_file, file_error);
        impl_->filter_pattern = filter_pattern;

        global_level_.store(static_cast<uint8_t>(console_level), std::memory_order_relaxed);
    }

    void Logger::log(const LogLevel level, const std::source_location& loc, std::string_view msg) {
        const auto module = module_from_path(loc.file_name());
        const auto idx = static_cast<size_t>(module);

        const std::lock_guard lock(impl_->mutex);
        if (!impl_->filter_pattern.empty() && !matches_filter(msg, impl_->filter_pattern))
            return;

        if (!impl_->logger) {
            // Not initialized yet: fall back to the spdlog default logger
            spdlog::default_logger_raw()->log(to_spdlog(level), "[{}] {}", MODULE_NAMES[idx], msg);
            return;
        }

        if (level <= LogLevel::Debug) {
            impl_->logger->log(to_spdlog(level), "[{}] {}:{} {}", MODULE_NAMES[idx],
                               basename(loc.file_name()), loc.line(), msg);
            return;
        }
        impl_->logger->log(to_spdlog(level), "[{}] {}", MODULE_NAMES[idx], msg);
    }

    void Logger::set_level(const LogLevel level) {
        global_level_.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
    }

    void Logger::flush() {
        const std::lock_guard lock(impl_->mutex);
        if (impl_->logger)
            impl_->logger->flush();
    }

} // namespace ddrop::core
