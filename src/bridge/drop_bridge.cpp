/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "bridge/drop_bridge.hpp"
#include "bridge/channel_messenger.hpp"
#include "bridge/file_resolver.hpp"
#include "core/logger.hpp"

namespace ddrop::bridge {

    DropBridge::DropBridge(BridgeOptions options)
        : options_(std::move(options)) {}

    DropBridge::~DropBridge() {
        close();
    }

    void DropBridge::handle(const DragMessage& message) noexcept {
        if (closed_) {
            LOG_TRACE("Bridge closed, ignoring '{}'", message_name(message));
            return;
        }

        try {
            ++stats_.messages_handled;
            std::visit(Overloaded{
                           [this](const drag::Ignored&) { ++stats_.messages_ignored; },
                           [this](const drag::Entered&) { onEntered(); },
                           [this](const drag::Exited&) { onExited(); },
                           [this](const drag::Updated& m) { onUpdated(m); },
                           [this](const drag::Dropped& m) { onDropped(m); },
                       },
                       message);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to handle '{}': {}", message_name(message), e.what());
        } catch (...) {
            LOG_ERROR("Failed to handle '{}': non-standard exception", message_name(message));
        }
    }

    void DropBridge::handleMethodCall(const MethodCall& call) noexcept {
        try {
            handle(decode(call));
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to decode '{}': {}", call.method, e.what());
        } catch (...) {
            LOG_ERROR("Failed to decode '{}': non-standard exception", call.method);
        }
    }

    void DropBridge::attach(ChannelMessenger& messenger) {
        if (closed_) {
            LOG_WARN("Cannot attach a closed bridge");
            return;
        }
        detach();
        messenger_ = &messenger;
        messenger_->setHandler(options_.channel_name,
                               [this](const MethodCall& call) { handleMethodCall(call); });
        LOG_DEBUG("Bridge attached to channel '{}'", options_.channel_name);
    }

    void DropBridge::detach() {
        if (!messenger_)
            return;
        messenger_->removeHandler(options_.channel_name);
        messenger_ = nullptr;
    }

    void DropBridge::close() {
        if (closed_)
            return;
        closed_ = true;

        detach();
        drops_.close();
        hover_.clear();
        position_listeners_.clear();
        LOG_DEBUG("Bridge closed after {} message(s)", stats_.messages_handled);
    }

    SubscriptionId DropBridge::addPositionListener(PositionListener listener) {
        if (closed_)
            return INVALID_SUBSCRIPTION;
        return position_listeners_.add(std::move(listener));
    }

    bool DropBridge::removePositionListener(const SubscriptionId id) {
        return position_listeners_.remove(id);
    }

    void DropBridge::onEntered() {
        stats_.subscriber_failures += hover_.set(true).failed;
    }

    void DropBridge::onExited() {
        stats_.subscriber_failures += hover_.set(false).failed;
    }

    void DropBridge::onUpdated(const drag::Updated& message) {
        if (!options_.forward_positions || !message.position)
            return;
        stats_.subscriber_failures += position_listeners_.notify(*message.position).failed;
    }

    void DropBridge::onDropped(const drag::Dropped& message) {
        const auto batch = resolve_locations(message.locations, &stats_.locations_rejected);
        LOG_INFO("Dropped {} file(s) ({} location(s) received)", batch.size(), message.locations.size());

        if (drops_.subscriberCount() == 0) {
            ++stats_.batches_discarded;
        } else {
            const auto result = drops_.publish(batch);
            stats_.subscriber_failures += result.failed;
            ++stats_.batches_published;
        }

        stats_.subscriber_failures += hover_.set(false).failed;
    }

} // namespace ddrop::bridge
