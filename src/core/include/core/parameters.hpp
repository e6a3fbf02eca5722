/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace ddrop::core {
    namespace param {

        inline constexpr const char* DEFAULT_CHANNEL_NAME = "desktop_drop_test";

        struct LoggingParameters {
            std::optional<std::string> level; // trace, debug, info, perf, warn, error, critical, off
            std::string file;                 // Empty = console only
            std::string filter;               // Glob on the message text, e.g. "*dropped*"

            // Unset level falls back to `fallback` (the LOG_LEVEL environment, then info)
            [[nodiscard]] LogLevel log_level(LogLevel fallback = LogLevel::Info) const;

            nlohmann::json to_json() const;
            static LoggingParameters from_json(const nlohmann::json& j);
        };

        struct WindowParameters {
            std::string title = "Drop files here";
            int width = 640;
            int height = 480;

            nlohmann::json to_json() const;
            static WindowParameters from_json(const nlohmann::json& j);
        };

        struct BridgeParameters {
            std::string channel_name = DEFAULT_CHANNEL_NAME; // Must match the native side exactly
            bool forward_positions = true;                   // Forward "updated" positions to listeners
            LoggingParameters logging;
            WindowParameters window;

            nlohmann::json to_json() const;
            // Throws std::invalid_argument naming the offending key
            static BridgeParameters from_json(const nlohmann::json& j);
        };

        // Missing keys keep their defaults; unknown keys are ignored
        std::expected<BridgeParameters, std::string> read_bridge_params_from_json(const std::filesystem::path& path);

        std::expected<void, std::string> save_bridge_params_to_json(
            const BridgeParameters& params,
            const std::filesystem::path& output_path);

    } // namespace param
} // namespace ddrop::core
