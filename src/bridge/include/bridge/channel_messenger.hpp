/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "bridge/protocol_codec.hpp"
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ddrop::bridge {

    // The native/application boundary: named channels plus a FIFO of pending calls.
    //
    // The native side post()s from its callbacks (any thread). The application
    // loop calls pump(), which runs the channel handlers on the loop thread in
    // posting order. A call on a channel nobody handles is dropped silently.
    class ChannelMessenger {
    public:
        using Handler = std::function<void(const MethodCall& call)>;

        ChannelMessenger() = default;
        ChannelMessenger(const ChannelMessenger&) = delete;
        ChannelMessenger& operator=(const ChannelMessenger&) = delete;

        // Replaces any previous handler for the channel
        void setHandler(const std::string& channel, Handler handler);
        bool removeHandler(const std::string& channel);
        [[nodiscard]] bool hasHandler(const std::string& channel) const;

        // Thread-safe
        void post(std::string channel, MethodCall call);

        // Loop thread only. Returns the number of calls delivered to a handler.
        size_t pump();

        [[nodiscard]] size_t pending() const;

    private:
        struct Envelope {
            std::string channel;
            MethodCall call;
        };

        mutable std::mutex queue_mutex_;
        std::deque<Envelope> queue_;
        std::unordered_map<std::string, Handler> handlers_;
    };

} // namespace ddrop::bridge
