/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "bridge/drag_message.hpp"
#include <SDL3/SDL_events.h>
#include <cstdint>
#include <string>
#include <vector>

struct SDL_Window;

namespace ddrop::bridge {
    class ChannelMessenger;
}

namespace ddrop::native {

    // Native drag source for SDL3 windows. Turns SDL drop events into protocol
    // calls posted on the boundary channel:
    //
    //   SDL_EVENT_DROP_BEGIN     -> "entered"
    //   SDL_EVENT_DROP_POSITION  -> "updated" [x, y]
    //   SDL_EVENT_DROP_FILE      -> buffered as a file:// URI
    //   SDL_EVENT_DROP_COMPLETE  -> "dropped" [uris], or "exited" when nothing was buffered
    //
    // SDL reports a drag that leaves the window as a DROP_COMPLETE without files.
    class SdlDragSource {
    public:
        SdlDragSource(bridge::ChannelMessenger& messenger, std::string channel);
        ~SdlDragSource();

        SdlDragSource(const SdlDragSource&) = delete;
        SdlDragSource& operator=(const SdlDragSource&) = delete;

        // Enables SDL drop events and restricts handling to this window.
        // Returns false if the window has no id.
        bool init(SDL_Window* window);

        // Posts "exited" if a drag is still in flight
        void shutdown();

        // 0 accepts drop events of every window
        void setWindowId(std::uint32_t window_id) { window_id_ = window_id; }

        // Returns true if the event was a drop event for our window
        bool handleEvent(const SDL_Event& event);

        [[nodiscard]] bool isDragActive() const { return drag_active_; }
        [[nodiscard]] size_t pendingFileCount() const { return pending_uris_.size(); }

    private:
        void post(const bridge::DragMessage& message);
        void beginIfNeeded();

        bridge::ChannelMessenger& messenger_;
        std::string channel_;
        std::uint32_t window_id_ = 0;
        bool drag_active_ = false;
        std::vector<std::string> pending_uris_;
    };

} // namespace ddrop::native
