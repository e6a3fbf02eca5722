/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "bridge/drag_message.hpp"
#include "bridge/drop_stream.hpp"
#include "bridge/hover_state.hpp"
#include "bridge/observer_list.hpp"
#include "bridge/protocol_codec.hpp"
#include "core/parameters.hpp"
#include <functional>
#include <string>

namespace ddrop::bridge {

    class ChannelMessenger;

    struct BridgeOptions {
        std::string channel_name = core::param::DEFAULT_CHANNEL_NAME;
        bool forward_positions = true;

        static BridgeOptions from(const core::param::BridgeParameters& params) {
            return BridgeOptions{.channel_name = params.channel_name,
                                 .forward_positions = params.forward_positions};
        }
    };

    struct BridgeStats {
        size_t messages_handled = 0;
        size_t messages_ignored = 0;    // Unknown methods
        size_t batches_published = 0;   // Reached at least one subscriber
        size_t batches_discarded = 0;   // Nobody was subscribed
        size_t locations_rejected = 0;  // Dropped by the resolver
        size_t subscriber_failures = 0; // Observer, consumer or listener threw
    };

    // Routes drag protocol messages to the hover state, the drop stream and the
    // position listeners. One instance per application, owned by the caller and
    // passed by reference to whoever consumes it.
    //
    // The native side has already accepted the drag by the time a message
    // arrives: the bridge only reports, it never negotiates.
    class DropBridge {
    public:
        using PositionListener = std::function<void(const DropPosition& position)>;

        explicit DropBridge(BridgeOptions options = {});
        ~DropBridge();

        DropBridge(const DropBridge&) = delete;
        DropBridge& operator=(const DropBridge&) = delete;

        // One call per native event, on the application loop. Never throws;
        // ignored once the bridge is closed.
        void handle(const DragMessage& message) noexcept;
        void handleMethodCall(const MethodCall& call) noexcept;

        // Registers handleMethodCall() on options().channel_name. The messenger
        // must outlive the attachment; close() and the destructor detach.
        void attach(ChannelMessenger& messenger);
        void detach();

        // Detaches, closes the drop stream, releases hover observers and
        // position listeners. Safe to call more than once.
        void close();

        [[nodiscard]] bool isClosed() const { return closed_; }
        [[nodiscard]] bool isHovering() const { return hover_.get(); }

        [[nodiscard]] HoverState& hoverState() { return hover_; }
        [[nodiscard]] const HoverState& hoverState() const { return hover_; }
        [[nodiscard]] DropStream& dropStream() { return drops_; }
        [[nodiscard]] const DropStream& dropStream() const { return drops_; }

        // Receives drag::Updated positions when forwarding is enabled
        SubscriptionId addPositionListener(PositionListener listener);
        bool removePositionListener(SubscriptionId id);

        [[nodiscard]] const BridgeStats& stats() const { return stats_; }
        [[nodiscard]] const BridgeOptions& options() const { return options_; }

    private:
        void onEntered();
        void onExited();
        void onUpdated(const drag::Updated& message);
        void onDropped(const drag::Dropped& message);

        BridgeOptions options_;
        HoverState hover_;
        DropStream drops_;
        ObserverList<const DropPosition&> position_listeners_;
        BridgeStats stats_;

        ChannelMessenger* messenger_ = nullptr;
        bool closed_ = false;
    };

} // namespace ddrop::bridge
