/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "bridge/channel_messenger.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>

namespace ddrop::bridge {

    static MethodCall named(std::string method) {
        return MethodCall{.method = std::move(method), .arguments = nullptr};
    }

    TEST(ChannelMessenger, DeliversInPostingOrder) {
        ChannelMessenger messenger;
        std::vector<std::string> seen;
        messenger.setHandler("ch", [&](const MethodCall& call) { seen.push_back(call.method); });

        messenger.post("ch", named("a"));
        messenger.post("ch", named("b"));
        messenger.post("ch", named("c"));
        EXPECT_EQ(messenger.pending(), 3u);

        EXPECT_EQ(messenger.pump(), 3u);
        EXPECT_EQ(seen, (std::vector<std::string>{"a", "b", "c"}));
        EXPECT_EQ(messenger.pending(), 0u);
    }

    TEST(ChannelMessenger, NothingRunsBeforePump) {
        ChannelMessenger messenger;
        int calls = 0;
        messenger.setHandler("ch", [&](const MethodCall&) { ++calls; });
        messenger.post("ch", named("a"));
        EXPECT_EQ(calls, 0);
        messenger.pump();
        EXPECT_EQ(calls, 1);
    }

    TEST(ChannelMessenger, UnhandledChannelIsDropped) {
        ChannelMessenger messenger;
        messenger.post("nobody", named("a"));
        EXPECT_EQ(messenger.pump(), 0u);
        EXPECT_EQ(messenger.pending(), 0u);
    }

    TEST(ChannelMessenger, SetHandlerReplacesPrevious) {
        ChannelMessenger messenger;
        int first = 0, second = 0;
        messenger.setHandler("ch", [&](const MethodCall&) { ++first; });
        messenger.setHandler("ch", [&](const MethodCall&) { ++second; });

        messenger.post("ch", named("a"));
        messenger.pump();
        EXPECT_EQ(first, 0);
        EXPECT_EQ(second, 1);
    }

    TEST(ChannelMessenger, NullHandlerRemoves) {
        ChannelMessenger messenger;
        messenger.setHandler("ch", [](const MethodCall&) {});
        messenger.setHandler("ch", nullptr);
        EXPECT_FALSE(messenger.hasHandler("ch"));
        EXPECT_FALSE(messenger.removeHandler("ch"));
    }

    TEST(ChannelMessenger, HandlerMayRemoveItselfMidPump) {
        ChannelMessenger messenger;
        int calls = 0;
        messenger.setHandler("ch", [&](const MethodCall&) {
            ++calls;
            messenger.removeHandler("ch");
        });

        messenger.post("ch", named("a"));
        messenger.post("ch", named("b"));
        EXPECT_EQ(messenger.pump(), 1u);
        EXPECT_EQ(calls, 1);
    }

    TEST(ChannelMessenger, CallsPostedDuringPumpWaitForNextPump) {
        ChannelMessenger messenger;
        std::vector<std::string> seen;
        messenger.setHandler("ch", [&](const MethodCall& call) {
            seen.push_back(call.method);
            if (call.method == "a")
                messenger.post("ch", named("later"));
        });

        messenger.post("ch", named("a"));
        EXPECT_EQ(messenger.pump(), 1u);
        EXPECT_EQ(messenger.pending(), 1u);
        EXPECT_EQ(messenger.pump(), 1u);
        EXPECT_EQ(seen, (std::vector<std::string>{"a", "later"}));
    }

    TEST(ChannelMessenger, ThrowingHandlerDoesNotStopPump) {
        ChannelMessenger messenger;
        std::vector<std::string> seen;
        messenger.setHandler("ch", [&](const MethodCall& call) {
            if (call.method == "bad")
                throw std::runtime_error("handler failure");
            seen.push_back(call.method);
        });

        messenger.post("ch", named("bad"));
        messenger.post("ch", named("good"));
        EXPECT_EQ(messenger.pump(), 1u);
        EXPECT_EQ(seen, (std::vector<std::string>{"good"}));
    }

    TEST(ChannelMessenger, PostFromOtherThreads) {
        ChannelMessenger messenger;
        size_t calls = 0;
        messenger.setHandler("ch", [&](const MethodCall&) { ++calls; });

        constexpr int THREADS = 4;
        constexpr int PER_THREAD = 250;
        std::vector<std::thread> threads;
        for (int t = 0; t < THREADS; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < PER_THREAD; ++i)
                    messenger.post("ch", named("updated"));
            });
        }
        for (auto& thread : threads)
            thread.join();

        EXPECT_EQ(messenger.pump(), static_cast<size_t>(THREADS * PER_THREAD));
        EXPECT_EQ(calls, static_cast<size_t>(THREADS * PER_THREAD));
    }

} // namespace ddrop::bridge
