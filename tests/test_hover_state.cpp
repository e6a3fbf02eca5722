/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

// Hover flag as seen through the bridge that owns it.

#include "bridge/drop_bridge.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace ddrop::bridge {

    TEST(HoverState, StartsFalse) {
        DropBridge bridge;
        EXPECT_FALSE(bridge.isHovering());
        EXPECT_FALSE(bridge.hoverState().get());
        EXPECT_EQ(bridge.hoverState().observerCount(), 0u);
    }

    TEST(HoverState, FollowsEnterAndExit) {
        DropBridge bridge;
        bridge.handle(drag::Entered{});
        EXPECT_TRUE(bridge.isHovering());
        bridge.handle(drag::Exited{});
        EXPECT_FALSE(bridge.isHovering());
    }

    TEST(HoverState, NotifiesOnlyOnChange) {
        DropBridge bridge;
        std::vector<bool> seen;
        bridge.hoverState().subscribe([&](const bool hovering) { seen.push_back(hovering); });

        bridge.handle(drag::Entered{});
        bridge.handle(drag::Entered{});
        bridge.handle(drag::Updated{});
        bridge.handle(drag::Exited{});
        bridge.handle(drag::Exited{});

        EXPECT_EQ(seen, (std::vector<bool>{true, false}));
    }

    TEST(HoverState, ExitWithoutEnterIsSilent) {
        DropBridge bridge;
        int calls = 0;
        bridge.hoverState().subscribe([&](bool) { ++calls; });
        bridge.handle(drag::Exited{});
        EXPECT_EQ(calls, 0);
        EXPECT_FALSE(bridge.isHovering());
    }

    TEST(HoverState, ObserversRunInSubscriptionOrder) {
        DropBridge bridge;
        std::vector<int> order;
        bridge.hoverState().subscribe([&](bool) { order.push_back(1); });
        bridge.hoverState().subscribe([&](bool) { order.push_back(2); });
        bridge.hoverState().subscribe([&](bool) { order.push_back(3); });

        bridge.handle(drag::Entered{});
        EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    }

    TEST(HoverState, UnsubscribedObserverStopsReceiving) {
        DropBridge bridge;
        int calls = 0;
        const auto id = bridge.hoverState().subscribe([&](bool) { ++calls; });

        bridge.handle(drag::Entered{});
        EXPECT_TRUE(bridge.hoverState().unsubscribe(id));
        EXPECT_FALSE(bridge.hoverState().unsubscribe(id));
        bridge.handle(drag::Exited{});

        EXPECT_EQ(calls, 1);
    }

    TEST(HoverState, EmptyObserverIsRejected) {
        DropBridge bridge;
        EXPECT_EQ(bridge.hoverState().subscribe({}), INVALID_SUBSCRIPTION);
        EXPECT_EQ(bridge.hoverState().observerCount(), 0u);
    }

    TEST(HoverState, ThrowingObserverDoesNotBlockOthers) {
        DropBridge bridge;
        bool second_called = false;
        bridge.hoverState().subscribe([](bool) { throw std::runtime_error("observer failure"); });
        bridge.hoverState().subscribe([&](bool) { second_called = true; });

        bridge.handle(drag::Entered{});

        EXPECT_TRUE(second_called);
        EXPECT_TRUE(bridge.isHovering());
        EXPECT_EQ(bridge.stats().subscriber_failures, 1u);
    }

    // ---------------------------------------------------------------------------
    // Tests: re-entrant subscription changes during a notification
    // ---------------------------------------------------------------------------

    TEST(HoverState, ObserverAddedDuringNotifyWaitsForNextChange) {
        DropBridge bridge;
        std::vector<bool> late;
        bool added = false;
        bridge.hoverState().subscribe([&](bool) {
            if (added)
                return;
            added = true;
            bridge.hoverState().subscribe([&](const bool hovering) { late.push_back(hovering); });
        });

        bridge.handle(drag::Entered{});
        EXPECT_TRUE(late.empty());
        bridge.handle(drag::Exited{});
        EXPECT_EQ(late, (std::vector<bool>{false}));
    }

    TEST(HoverState, ObserverRemovedDuringNotifyIsSkipped) {
        DropBridge bridge;
        int second_calls = 0;
        SubscriptionId second = INVALID_SUBSCRIPTION;
        bridge.hoverState().subscribe([&](bool) { bridge.hoverState().unsubscribe(second); });
        second = bridge.hoverState().subscribe([&](bool) { ++second_calls; });

        bridge.handle(drag::Entered{});
        EXPECT_EQ(second_calls, 0);
        EXPECT_EQ(bridge.hoverState().observerCount(), 1u);
    }

    TEST(HoverState, ObserverMayUnsubscribeItself) {
        DropBridge bridge;
        int calls = 0;
        SubscriptionId self = INVALID_SUBSCRIPTION;
        self = bridge.hoverState().subscribe([&](bool) {
            ++calls;
            bridge.hoverState().unsubscribe(self);
        });

        bridge.handle(drag::Entered{});
        bridge.handle(drag::Exited{});
        EXPECT_EQ(calls, 1);
    }

} // namespace ddrop::bridge
