/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "app/argument_parser.hpp"
#include "bridge/drop_bridge.hpp"
#include "bridge/protocol_codec.hpp"
#include "core/parameters.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ddrop::app {

    // One recorded boundary call. An absent channel means "the configured one".
    struct TraceEntry {
        std::optional<std::string> channel;
        bridge::MethodCall call;
    };

    // Trace file: [{"method": "entered"}, {"method": "dropped", "arguments": ["file:///a"]}, ...]
    std::expected<std::vector<TraceEntry>, std::string> read_trace(const std::filesystem::path& path);

    // Posts every recorded call through a fresh messenger into a bridge built from
    // `params`, with the monitor attached. Returns the bridge counters after the pump.
    std::expected<bridge::BridgeStats, std::string> replay_trace(const std::filesystem::path& path,
                                                                 const core::param::BridgeParameters& params);

    // --replay entry point: no window, no SDL. Returns the process exit code.
    int run_headless(const RunMode& mode);

} // namespace ddrop::app
