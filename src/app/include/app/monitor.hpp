/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "bridge/drop_bridge.hpp"

namespace ddrop::app {

    // Logs every hover change, dropped file and (at trace level) drag position
    void attach_monitor(bridge::DropBridge& bridge);

    void log_stats(const bridge::BridgeStats& stats);

} // namespace ddrop::app
