/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "bridge/channel_messenger.hpp"
#include "core/logger.hpp"

namespace ddrop::bridge {

    void ChannelMessenger::setHandler(const std::string& channel, Handler handler) {
        if (!handler) {
            removeHandler(channel);
            return;
        }
        handlers_[channel] = std::move(handler);
        LOG_DEBUG("Handler registered on channel '{}'", channel);
    }

    bool ChannelMessenger::removeHandler(const std::string& channel) {
        return handlers_.erase(channel) > 0;
    }

    bool ChannelMessenger::hasHandler(const std::string& channel) const {
        return handlers_.contains(channel);
    }

    void ChannelMessenger::post(std::string channel, MethodCall call) {
        std::lock_guard lock(queue_mutex_);
        queue_.push_back(Envelope{.channel = std::move(channel), .call = std::move(call)});
    }

    size_t ChannelMessenger::pump() {
        std::deque<Envelope> batch;
        {
            std::lock_guard lock(queue_mutex_);
            batch.swap(queue_);
        }

        size_t delivered = 0;
        for (const auto& envelope : batch) {
            // Looked up per call: a handler may detach itself mid-pump
            const auto it = handlers_.find(envelope.channel);
            if (it == handlers_.end()) {
                LOG_TRACE("No handler on channel '{}', dropping '{}'", envelope.channel, envelope.call.method);
                continue;
            }

            const Handler handler = it->second;
            try {
                handler(envelope.call);
                ++delivered;
            } catch (const std::exception& e) {
                LOG_ERROR("Handler on channel '{}' threw for '{}': {}", envelope.channel, envelope.call.method, e.what());
            } catch (...) {
                LOG_ERROR("Handler on channel '{}' threw a non-standard exception", envelope.channel);
            }
        }
        return delivered;
    }

    size_t ChannelMessenger::pending() const {
        std::lock_guard lock(queue_mutex_);
        return queue_.size();
    }

} // namespace ddrop::bridge
