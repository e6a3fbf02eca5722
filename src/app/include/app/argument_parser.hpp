/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ddrop::app {

    struct HelpMode {};

    struct RunMode {
        core::param::BridgeParameters params;
        // Headless: replay a recorded trace instead of opening a window
        std::optional<std::filesystem::path> replay_path;
    };

    using ParsedArgs = std::variant<HelpMode, RunMode>;

    // Loads --config first, then applies command line overrides. Initializes the
    // logger (LOG_LEVEL environment variable < config < -v/-q < --log-level).
    std::expected<ParsedArgs, std::string> parse_args(const std::vector<std::string>& args);
    std::expected<ParsedArgs, std::string> parse_args(int argc, const char* const argv[]);

} // namespace ddrop::app
