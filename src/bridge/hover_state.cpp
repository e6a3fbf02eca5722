/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "bridge/hover_state.hpp"
#include "core/logger.hpp"

namespace ddrop::bridge {

    SubscriptionId HoverState::subscribe(Observer observer) {
        return observers_.add(std::move(observer));
    }

    bool HoverState::unsubscribe(const SubscriptionId id) {
        return observers_.remove(id);
    }

    void HoverState::clear() {
        observers_.clear();
    }

    NotifyResult HoverState::set(const bool hovering) {
        if (hovering_ == hovering)
            return {};

        hovering_ = hovering;
        LOG_DEBUG("Hover state -> {}", hovering);
        return observers_.notify(hovering);
    }

} // namespace ddrop::bridge
