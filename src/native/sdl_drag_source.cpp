/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "native/sdl_drag_source.hpp"
#include "bridge/channel_messenger.hpp"
#include "bridge/protocol_codec.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <SDL3/SDL.h>

namespace ddrop::native {

    SdlDragSource::SdlDragSource(bridge::ChannelMessenger& messenger, std::string channel)
        : messenger_(messenger),
          channel_(std::move(channel)) {}

    SdlDragSource::~SdlDragSource() {
        shutdown();
    }

    bool SdlDragSource::init(SDL_Window* window) {
        const SDL_WindowID id = window ? SDL_GetWindowID(window) : 0;
        if (id == 0) {
            LOG_ERROR("Failed to get SDL window id: {}", SDL_GetError());
            return false;
        }
        window_id_ = id;

        SDL_SetEventEnabled(SDL_EVENT_DROP_BEGIN, true);
        SDL_SetEventEnabled(SDL_EVENT_DROP_POSITION, true);
        SDL_SetEventEnabled(SDL_EVENT_DROP_FILE, true);
        SDL_SetEventEnabled(SDL_EVENT_DROP_COMPLETE, true);

        LOG_DEBUG("SDL drag source initialized for window {} on channel '{}'", window_id_, channel_);
        return true;
    }

    void SdlDragSource::shutdown() {
        if (drag_active_) {
            post(bridge::drag::Exited{});
            drag_active_ = false;
        }
        pending_uris_.clear();
    }

    bool SdlDragSource::handleEvent(const SDL_Event& event) {
        switch (event.type) {
        case SDL_EVENT_DROP_BEGIN:
        case SDL_EVENT_DROP_POSITION:
        case SDL_EVENT_DROP_FILE:
        case SDL_EVENT_DROP_TEXT:
        case SDL_EVENT_DROP_COMPLETE:
            break;
        default:
            return false;
        }

        if (window_id_ != 0 && event.drop.windowID != window_id_)
            return false;

        switch (event.type) {
        case SDL_EVENT_DROP_BEGIN:
            beginIfNeeded();
            break;

        case SDL_EVENT_DROP_POSITION:
            beginIfNeeded();
            post(bridge::drag::Updated{
                .position = bridge::DropPosition{.x = static_cast<double>(event.drop.x),
                                                 .y = static_cast<double>(event.drop.y)}});
            break;

        case SDL_EVENT_DROP_FILE:
            beginIfNeeded();
            if (event.drop.data) {
                pending_uris_.push_back(core::path_to_file_uri(core::utf8_to_path(event.drop.data)));
            }
            break;

        case SDL_EVENT_DROP_TEXT:
            LOG_DEBUG("Ignoring text drop");
            break;

        case SDL_EVENT_DROP_COMPLETE:
            if (!pending_uris_.empty()) {
                LOG_DEBUG("Drop complete with {} file(s)", pending_uris_.size());
                post(bridge::drag::Dropped{.locations = std::move(pending_uris_)});
                pending_uris_.clear();
            } else if (drag_active_) {
                post(bridge::drag::Exited{});
            }
            drag_active_ = false;
            break;

        default:
            break;
        }
        return true;
    }

    void SdlDragSource::beginIfNeeded() {
        if (drag_active_)
            return;
        drag_active_ = true;
        post(bridge::drag::Entered{});
    }

    void SdlDragSource::post(const bridge::DragMessage& message) {
        messenger_.post(channel_, bridge::encode(message));
    }

} // namespace ddrop::native
