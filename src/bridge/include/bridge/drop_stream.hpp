/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "bridge/file_reference.hpp"
#include "bridge/observer_list.hpp"
#include <functional>
#include <utility>
#include <vector>

namespace ddrop::bridge {

    class DropBridge;

    // Broadcast channel of dropped-file batches.
    //
    // No buffering and no replay: a batch published while nobody listens is
    // discarded, and a subscriber only sees batches published after it joined.
    // After close() the stream is inert: publish() does nothing and subscribe()
    // hands back an already-closed subscription.
    class DropStream {
    public:
        using Consumer = std::function<void(const DropBatch& batch)>;
        using CloseHandler = std::function<void()>;

        struct Subscription {
            SubscriptionId id = INVALID_SUBSCRIPTION;

            // True for a subscription handed out by a closed stream
            [[nodiscard]] bool isClosed() const { return id == INVALID_SUBSCRIPTION; }
        };

        DropStream() = default;
        DropStream(const DropStream&) = delete;
        DropStream& operator=(const DropStream&) = delete;

        // on_close runs once when the stream closes, or immediately if it already is
        Subscription subscribe(Consumer consumer, CloseHandler on_close = {});
        bool unsubscribe(const Subscription& subscription);

        // Idempotent
        void close();

        [[nodiscard]] bool isClosed() const { return closed_; }
        [[nodiscard]] bool isActive(const Subscription& subscription) const;
        [[nodiscard]] size_t subscriberCount() const { return consumers_.size(); }

    private:
        friend class DropBridge;

        NotifyResult publish(const DropBatch& batch);

        ObserverList<const DropBatch&> consumers_;
        std::vector<std::pair<SubscriptionId, CloseHandler>> close_handlers_;
        bool closed_ = false;
    };

} // namespace ddrop::bridge
