/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "bridge/drag_message.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace ddrop::bridge {

    namespace method {
        inline constexpr std::string_view ENTERED = "entered";
        inline constexpr std::string_view EXITED = "exited";
        inline constexpr std::string_view UPDATED = "updated";
        inline constexpr std::string_view DROPPED = "dropped";
    } // namespace method

    // One inbound call on the boundary channel: a method name plus its argument payload
    struct MethodCall {
        std::string method;
        nlohmann::json arguments;
    };

    // Never fails. Unknown methods decode to drag::Ignored; a malformed "dropped"
    // payload decodes to an empty drag::Dropped; a malformed "updated" payload
    // decodes to drag::Updated without a position.
    [[nodiscard]] DragMessage decode(const MethodCall& call);

    // Inverse of decode(), used by native adapters to speak the protocol
    [[nodiscard]] MethodCall encode(const DragMessage& message);

} // namespace ddrop::bridge
