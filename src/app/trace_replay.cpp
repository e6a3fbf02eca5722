/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/trace_replay.hpp"
#include "app/monitor.hpp"
#include "bridge/channel_messenger.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <fmt/format.h>
#include <fstream>
#include <nlohmann/json.hpp>

namespace ddrop::app {

    std::expected<std::vector<TraceEntry>, std::string> read_trace(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file) {
            return std::unexpected(fmt::format("Cannot open trace: {}", core::path_to_utf8(path)));
        }

        nlohmann::json json;
        try {
            json = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            return std::unexpected(fmt::format("JSON parse error in {}: {}", core::path_to_utf8(path), e.what()));
        }

        if (!json.is_array()) {
            return std::unexpected("Trace must be a JSON array of calls");
        }

        std::vector<TraceEntry> entries;
        entries.reserve(json.size());
        for (size_t i = 0; i < json.size(); ++i) {
            const auto& item = json[i];
            if (!item.is_object() || !item.contains("method") || !item["method"].is_string()) {
                return std::unexpected(fmt::format("Trace entry {} needs a string \"method\"", i));
            }

            TraceEntry entry;
            entry.call.method = item["method"].get<std::string>();
            if (item.contains("arguments"))
                entry.call.arguments = item["arguments"];
            if (item.contains("channel")) {
                if (!item["channel"].is_string())
                    return std::unexpected(fmt::format("Trace entry {}: \"channel\" must be a string", i));
                entry.channel = item["channel"].get<std::string>();
            }
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    std::expected<bridge::BridgeStats, std::string> replay_trace(const std::filesystem::path& path,
                                                                 const core::param::BridgeParameters& params) {
        auto trace = read_trace(path);
        if (!trace)
            return std::unexpected(trace.error());
        LOG_INFO("Replaying {} call(s) from {}", trace->size(), core::path_to_utf8(path));

        bridge::ChannelMessenger messenger;
        bridge::DropBridge bridge(bridge::BridgeOptions::from(params));
        bridge.attach(messenger);
        attach_monitor(bridge);

        for (auto& entry : *trace) {
            messenger.post(entry.channel.value_or(params.channel_name), std::move(entry.call));
        }
        messenger.pump();

        const auto stats = bridge.stats();
        bridge.close();
        return stats;
    }

    int run_headless(const RunMode& mode) {
        if (!mode.replay_path) {
            LOG_ERROR("No trace given to replay");
            return 1;
        }

        const auto stats = replay_trace(*mode.replay_path, mode.params);
        if (!stats) {
            LOG_ERROR("Failed to load trace: {}", stats.error());
            return 1;
        }
        log_stats(*stats);
        return 0;
    }

} // namespace ddrop::app
