/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "bridge/drop_stream.hpp"
#include "core/logger.hpp"
#include <algorithm>

namespace ddrop::bridge {

    namespace {

        void run_close_handler(const DropStream::CloseHandler& handler) {
            if (!handler)
                return;
            try {
                handler();
            } catch (const std::exception& e) {
                LOG_ERROR("Drop stream close handler threw: {}", e.what());
            } catch (...) {
                LOG_ERROR("Drop stream close handler threw a non-standard exception");
            }
        }

    } // namespace

    DropStream::Subscription DropStream::subscribe(Consumer consumer, CloseHandler on_close) {
        if (closed_) {
            LOG_DEBUG("Subscribe on closed drop stream");
            run_close_handler(on_close);
            return {};
        }

        const auto id = consumers_.add(std::move(consumer));
        if (id == INVALID_SUBSCRIPTION) {
            LOG_WARN("Ignoring drop stream subscription without a consumer");
            return {};
        }
        if (on_close)
            close_handlers_.emplace_back(id, std::move(on_close));
        return Subscription{.id = id};
    }

    bool DropStream::unsubscribe(const Subscription& subscription) {
        if (subscription.isClosed())
            return false;
        std::erase_if(close_handlers_, [&](const auto& entry) { return entry.first == subscription.id; });
        return consumers_.remove(subscription.id);
    }

    bool DropStream::isActive(const Subscription& subscription) const {
        return !closed_ && !subscription.isClosed() && consumers_.contains(subscription.id);
    }

    void DropStream::close() {
        if (closed_)
            return;
        closed_ = true;

        auto handlers = std::move(close_handlers_);
        close_handlers_.clear();
        consumers_.clear();

        LOG_DEBUG("Drop stream closed ({} close handler(s))", handlers.size());
        for (const auto& [id, handler] : handlers)
            run_close_handler(handler);
    }

    NotifyResult DropStream::publish(const DropBatch& batch) {
        if (closed_) {
            LOG_TRACE("Publish on closed drop stream ignored");
            return {};
        }
        if (consumers_.empty()) {
            LOG_DEBUG("No drop subscribers, discarding batch of {} file(s)", batch.size());
            return {};
        }
        return consumers_.notify(batch);
    }

} // namespace ddrop::bridge
