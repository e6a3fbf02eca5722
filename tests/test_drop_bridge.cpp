/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

// End-to-end drag sessions through the channel, the way a native adapter drives them.

#include "bridge/channel_messenger.hpp"
#include "bridge/drop_bridge.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace ddrop::bridge {

    namespace {

        // Records everything a consumer of the bridge can observe
        struct Recorder {
            std::vector<bool> hover;
            std::vector<DropBatch> batches;
            std::vector<DropPosition> positions;

            void attach(DropBridge& bridge) {
                bridge.hoverState().subscribe([this](const bool h) { hover.push_back(h); });
                bridge.dropStream().subscribe([this](const DropBatch& b) { batches.push_back(b); });
                bridge.addPositionListener([this](const DropPosition& p) { positions.push_back(p); });
            }
        };

        class DropBridgeTest : public ::testing::Test {
        protected:
            void SetUp() override {
                bridge.attach(messenger);
                recorder.attach(bridge);
            }

            void send(std::string method, nlohmann::json args = nullptr) {
                messenger.post(core::param::DEFAULT_CHANNEL_NAME,
                               MethodCall{.method = std::move(method), .arguments = std::move(args)});
            }

            ChannelMessenger messenger;
            DropBridge bridge;
            Recorder recorder;
        };

    } // namespace

    // ---------------------------------------------------------------------------
    // Tests: full sessions
    // ---------------------------------------------------------------------------

    TEST_F(DropBridgeTest, DragAndDropSession) {
        send("entered");
        send("updated", {10, 20});
        send("dropped", {"file:///tmp/a.png", "file:///tmp/b.png"});
        EXPECT_EQ(messenger.pump(), 3u);

        EXPECT_EQ(recorder.hover, (std::vector<bool>{true, false}));
        ASSERT_EQ(recorder.positions.size(), 1u);
        EXPECT_EQ(recorder.positions[0], (DropPosition{.x = 10, .y = 20}));

        ASSERT_EQ(recorder.batches.size(), 1u);
        ASSERT_EQ(recorder.batches[0].size(), 2u);
        EXPECT_EQ(recorder.batches[0][0].utf8(), "/tmp/a.png");
        EXPECT_EQ(recorder.batches[0][1].utf8(), "/tmp/b.png");
        EXPECT_FALSE(bridge.isHovering());
    }

    TEST_F(DropBridgeTest, DropWithOneBadLocation) {
        send("entered");
        send("updated", {10, 5});
        send("dropped", {"file:///a.txt", "not-a-uri", "file:///b.txt"});
        messenger.pump();

        EXPECT_EQ(recorder.hover, (std::vector<bool>{true, false}));
        ASSERT_EQ(recorder.batches.size(), 1u);
        ASSERT_EQ(recorder.batches[0].size(), 2u);
        EXPECT_EQ(recorder.batches[0][0].filename(), "a.txt");
        EXPECT_EQ(recorder.batches[0][1].filename(), "b.txt");
    }

    TEST_F(DropBridgeTest, DuplicateEnterThenExit) {
        send("entered");
        send("entered");
        send("exited");
        messenger.pump();

        EXPECT_EQ(recorder.hover, (std::vector<bool>{true, false}));
        EXPECT_TRUE(recorder.batches.empty());
    }

    TEST_F(DropBridgeTest, DragCancelledSession) {
        send("entered");
        send("updated", {1, 1});
        send("updated", {2, 2});
        send("exited");
        messenger.pump();

        EXPECT_EQ(recorder.hover, (std::vector<bool>{true, false}));
        EXPECT_EQ(recorder.positions.size(), 2u);
        EXPECT_TRUE(recorder.batches.empty());
        EXPECT_EQ(bridge.stats().batches_published, 0u);
    }

    TEST_F(DropBridgeTest, DropWithoutEnterStillPublishes) {
        send("dropped", {"file:///x"});
        messenger.pump();

        EXPECT_TRUE(recorder.hover.empty());
        ASSERT_EQ(recorder.batches.size(), 1u);
        EXPECT_EQ(recorder.batches[0][0].utf8(), "/x");
    }

    TEST_F(DropBridgeTest, MixedLocationsKeepValidOnes) {
        send("dropped", {"file:///one", "not-a-uri", "https://a/b", "file:///two"});
        messenger.pump();

        ASSERT_EQ(recorder.batches.size(), 1u);
        ASSERT_EQ(recorder.batches[0].size(), 2u);
        EXPECT_EQ(recorder.batches[0][0].filename(), "one");
        EXPECT_EQ(recorder.batches[0][1].filename(), "two");
        EXPECT_EQ(bridge.stats().locations_rejected, 2u);
    }

    TEST_F(DropBridgeTest, MalformedDropPublishesEmptyBatchAndClearsHover) {
        send("entered");
        send("dropped", "file:///not-a-list");
        messenger.pump();

        ASSERT_EQ(recorder.batches.size(), 1u);
        EXPECT_TRUE(recorder.batches[0].empty());
        EXPECT_FALSE(bridge.isHovering());
    }

    TEST_F(DropBridgeTest, UnknownMethodChangesNothing) {
        send("entered");
        send("concludeDragOperation", {1});
        messenger.pump();

        EXPECT_TRUE(bridge.isHovering());
        EXPECT_EQ(recorder.hover, (std::vector<bool>{true}));
        EXPECT_EQ(bridge.stats().messages_ignored, 1u);
        EXPECT_EQ(bridge.stats().messages_handled, 2u);
    }

    TEST_F(DropBridgeTest, OtherChannelsAreNotDelivered) {
        messenger.post("some_other_plugin", MethodCall{.method = "entered", .arguments = nullptr});
        EXPECT_EQ(messenger.pump(), 0u);
        EXPECT_FALSE(bridge.isHovering());
    }

    TEST_F(DropBridgeTest, PositionWithoutCoordinatesIsNotForwarded) {
        send("entered");
        send("updated", nullptr);
        messenger.pump();
        EXPECT_TRUE(recorder.positions.empty());
    }

    // ---------------------------------------------------------------------------
    // Tests: options
    // ---------------------------------------------------------------------------

    TEST(DropBridge, PositionForwardingCanBeDisabled) {
        DropBridge bridge(BridgeOptions{.channel_name = core::param::DEFAULT_CHANNEL_NAME, .forward_positions = false});
        int calls = 0;
        bridge.addPositionListener([&](const DropPosition&) { ++calls; });

        bridge.handle(drag::Updated{.position = DropPosition{.x = 1, .y = 2}});
        EXPECT_EQ(calls, 0);
    }

    TEST(DropBridge, CustomChannelName) {
        ChannelMessenger messenger;
        DropBridge bridge(BridgeOptions{.channel_name = "my_drop"});
        bridge.attach(messenger);
        EXPECT_TRUE(messenger.hasHandler("my_drop"));
        EXPECT_FALSE(messenger.hasHandler(core::param::DEFAULT_CHANNEL_NAME));

        messenger.post(core::param::DEFAULT_CHANNEL_NAME, MethodCall{.method = "entered", .arguments = nullptr});
        messenger.post("my_drop", MethodCall{.method = "entered", .arguments = nullptr});
        EXPECT_EQ(messenger.pump(), 1u);
        EXPECT_TRUE(bridge.isHovering());
    }

    TEST(DropBridge, OptionsFromParameters) {
        core::param::BridgeParameters params;
        params.channel_name = "custom";
        params.forward_positions = false;

        const auto options = BridgeOptions::from(params);
        EXPECT_EQ(options.channel_name, "custom");
        EXPECT_FALSE(options.forward_positions);
    }

    TEST(DropBridge, ThrowingPositionListenerIsCounted) {
        DropBridge bridge;
        bridge.addPositionListener([](const DropPosition&) { throw std::runtime_error("listener failure"); });
        EXPECT_NO_THROW(bridge.handle(drag::Updated{.position = DropPosition{}}));
        EXPECT_EQ(bridge.stats().subscriber_failures, 1u);
    }

    TEST(DropBridge, RemovedPositionListenerStopsReceiving) {
        DropBridge bridge;
        int calls = 0;
        const auto id = bridge.addPositionListener([&](const DropPosition&) { ++calls; });
        bridge.handle(drag::Updated{.position = DropPosition{}});
        EXPECT_TRUE(bridge.removePositionListener(id));
        bridge.handle(drag::Updated{.position = DropPosition{}});
        EXPECT_EQ(calls, 1);
    }

    // ---------------------------------------------------------------------------
    // Tests: lifecycle
    // ---------------------------------------------------------------------------

    TEST(DropBridge, CloseDetachesAndClosesStream) {
        ChannelMessenger messenger;
        DropBridge bridge;
        bridge.attach(messenger);

        bool stream_closed = false;
        bridge.dropStream().subscribe([](const DropBatch&) {}, [&] { stream_closed = true; });

        bridge.close();
        EXPECT_TRUE(bridge.isClosed());
        EXPECT_TRUE(stream_closed);
        EXPECT_TRUE(bridge.dropStream().isClosed());
        EXPECT_FALSE(messenger.hasHandler(core::param::DEFAULT_CHANNEL_NAME));
        EXPECT_EQ(bridge.hoverState().observerCount(), 0u);

        EXPECT_NO_THROW(bridge.close());
    }

    TEST(DropBridge, ClosedBridgeIgnoresMessages) {
        DropBridge bridge;
        bridge.close();

        bridge.handle(drag::Entered{});
        bridge.handle(drag::Dropped{.locations = {"file:///a"}});

        EXPECT_FALSE(bridge.isHovering());
        EXPECT_EQ(bridge.stats().messages_handled, 0u);
        EXPECT_EQ(bridge.addPositionListener([](const DropPosition&) {}), INVALID_SUBSCRIPTION);
    }

    TEST(DropBridge, DestructorDetachesFromMessenger) {
        ChannelMessenger messenger;
        {
            DropBridge bridge;
            bridge.attach(messenger);
            EXPECT_TRUE(messenger.hasHandler(core::param::DEFAULT_CHANNEL_NAME));
        }
        EXPECT_FALSE(messenger.hasHandler(core::param::DEFAULT_CHANNEL_NAME));

        messenger.post(core::param::DEFAULT_CHANNEL_NAME, MethodCall{.method = "entered", .arguments = nullptr});
        EXPECT_EQ(messenger.pump(), 0u);
    }

    TEST(DropBridge, ConsumerMayCloseBridgeDuringDrop) {
        DropBridge bridge;
        int calls = 0;
        bridge.dropStream().subscribe([&](const DropBatch&) {
            ++calls;
            bridge.close();
        });

        bridge.handle(drag::Entered{});
        bridge.handle(drag::Dropped{.locations = {"file:///a"}});
        bridge.handle(drag::Dropped{.locations = {"file:///b"}});

        EXPECT_EQ(calls, 1);
        EXPECT_TRUE(bridge.isClosed());
    }

} // namespace ddrop::bridge
