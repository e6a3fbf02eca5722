/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/monitor.hpp"
#include "core/logger.hpp"

namespace ddrop::app {

    void attach_monitor(bridge::DropBridge& bridge) {
        bridge.hoverState().subscribe([](const bool hovering) {
            LOG_INFO("{}", hovering ? "Drag entered" : "Drag left");
        });

        bridge.dropStream().subscribe(
            [](const bridge::DropBatch& batch) {
                if (batch.empty()) {
                    LOG_WARN("Drop contained no usable files");
                    return;
                }
                for (const auto& file : batch) {
                    LOG_INFO("Dropped: {}", file.utf8());
                }
            },
            [] { LOG_DEBUG("Drop stream closed"); });

        bridge.addPositionListener([](const bridge::DropPosition& pos) {
            LOG_TRACE("Drag at ({:.0f}, {:.0f})", pos.x, pos.y);
        });
    }

    void log_stats(const bridge::BridgeStats& stats) {
        LOG_INFO("{} message(s), {} batch(es) published, {} discarded, {} location(s) rejected",
                 stats.messages_handled, stats.batches_published, stats.batches_discarded,
                 stats.locations_rejected);
        if (stats.subscriber_failures > 0) {
            LOG_WARN("{} subscriber failure(s)", stats.subscriber_failures);
        }
    }

} // namespace ddrop::app
