/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "bridge/observer_list.hpp"
#include <functional>

namespace ddrop::bridge {

    class DropBridge;

    // Observable "a drag is over the window" flag. Only DropBridge writes it.
    // Observers run synchronously, in subscription order, once per value change.
    class HoverState {
    public:
        using Observer = std::function<void(bool hovering)>;

        HoverState() = default;
        HoverState(const HoverState&) = delete;
        HoverState& operator=(const HoverState&) = delete;

        [[nodiscard]] bool get() const { return hovering_; }

        // Returns INVALID_SUBSCRIPTION for an empty observer
        SubscriptionId subscribe(Observer observer);
        bool unsubscribe(SubscriptionId id);

        // Releases every observer
        void clear();

        [[nodiscard]] size_t observerCount() const { return observers_.size(); }

    private:
        friend class DropBridge;

        // Returns the notification outcome; nothing is notified when the value is unchanged
        NotifyResult set(bool hovering);

        bool hovering_ = false;
        ObserverList<bool> observers_;
    };

} // namespace ddrop::bridge
