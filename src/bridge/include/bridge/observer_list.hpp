/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"
#include <algorithm>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <vector>

namespace ddrop::bridge {

    using SubscriptionId = std::uint64_t;
    inline constexpr SubscriptionId INVALID_SUBSCRIPTION = 0;

    struct NotifyResult {
        size_t delivered = 0;
        size_t failed = 0;
    };

    // Subscriber registry shared by the hover state, the drop stream and the
    // position listeners. Single-threaded: add/remove/notify run on the event loop.
    //
    // notify() iterates over a snapshot: callbacks added during a notification are
    // first called on the next one; callbacks removed during a notification are
    // skipped if their turn has not come yet. A throwing callback is logged and
    // counted, the remaining callbacks still run.
    template <typename... Args>
    class ObserverList {
    public:
        using Callback = std::function<void(Args...)>;

        SubscriptionId add(Callback callback) {
            if (!callback)
                return INVALID_SUBSCRIPTION;
            auto entry = std::make_shared<Entry>();
            entry->id = next_id_++;
            entry->callback = std::move(callback);
            entries_.push_back(entry);
            return entry->id;
        }

        bool remove(const SubscriptionId id) {
            const auto it = std::ranges::find_if(entries_, [id](const auto& e) { return e->id == id; });
            if (it == entries_.end())
                return false;
            (*it)->active = false;
            entries_.erase(it);
            return true;
        }

        void clear() {
            for (auto& entry : entries_)
                entry->active = false;
            entries_.clear();
        }

        [[nodiscard]] size_t size() const { return entries_.size(); }
        [[nodiscard]] bool empty() const { return entries_.empty(); }

        [[nodiscard]] bool contains(const SubscriptionId id) const {
            return std::ranges::any_of(entries_, [id](const auto& e) { return e->id == id; });
        }

        NotifyResult notify(Args... args) {
            NotifyResult result;
            const auto snapshot = entries_;
            for (const auto& entry : snapshot) {
                if (!entry->active)
                    continue;
                try {
                    entry->callback(args...);
                    ++result.delivered;
                } catch (const std::exception& e) {
                    LOG_ERROR("Subscriber {} threw: {}", entry->id, e.what());
                    ++result.failed;
                } catch (...) {
                    LOG_ERROR("Subscriber {} threw a non-standard exception", entry->id);
                    ++result.failed;
                }
            }
            return result;
        }

    private:
        struct Entry {
            SubscriptionId id = INVALID_SUBSCRIPTION;
            Callback callback;
            bool active = true;
        };

        std::vector<std::shared_ptr<Entry>> entries_;
        SubscriptionId next_id_ = 1;
    };

} // namespace ddrop::bridge
