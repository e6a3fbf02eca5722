/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "app/trace_replay.hpp"
#include "core/logger.hpp"

#ifdef DDROP_WITH_SDL
#include "app/monitor.hpp"
#include "bridge/channel_messenger.hpp"
#include "bridge/drop_bridge.hpp"
#include "native/sdl_drag_source.hpp"

#include <SDL3/SDL.h>
#endif

namespace ddrop::app {

#ifdef DDROP_WITH_SDL
    namespace {

        constexpr Uint32 FRAME_DELAY_MS = 16;

        int runGui(const RunMode& mode) {
            if (!SDL_Init(SDL_INIT_VIDEO)) {
                LOG_ERROR("SDL_Init failed: {}", SDL_GetError());
                return 1;
            }

            SDL_Window* const window = SDL_CreateWindow(mode.params.window.title.c_str(),
                                                        mode.params.window.width,
                                                        mode.params.window.height,
                                                        SDL_WINDOW_RESIZABLE);
            if (!window) {
                LOG_ERROR("Failed to create window: {}", SDL_GetError());
                SDL_Quit();
                return 1;
            }

            int exit_code = 0;
            {
                bridge::ChannelMessenger messenger;
                bridge::DropBridge bridge(bridge::BridgeOptions::from(mode.params));
                bridge.attach(messenger);
                attach_monitor(bridge);

                const std::string idle_title = mode.params.window.title;
                bridge.hoverState().subscribe([window, idle_title](const bool hovering) {
                    SDL_SetWindowTitle(window, hovering ? "Release to drop" : idle_title.c_str());
                });

                native::SdlDragSource source(messenger, mode.params.channel_name);
                if (!source.init(window)) {
                    exit_code = 1;
                } else {
                    LOG_INFO("Waiting for drops on channel '{}'", mode.params.channel_name);

                    bool running = true;
                    while (running) {
                        SDL_Event event;
                        while (SDL_PollEvent(&event)) {
                            if (event.type == SDL_EVENT_QUIT ||
                                event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED) {
                                running = false;
                                continue;
                            }
                            source.handleEvent(event);
                        }
                        messenger.pump();
                        SDL_Delay(FRAME_DELAY_MS);
                    }

                    source.shutdown();
                    messenger.pump();
                }

                log_stats(bridge.stats());
                bridge.close();
            }

            SDL_DestroyWindow(window);
            SDL_Quit();
            return exit_code;
        }

    } // namespace
#endif

    int Application::run(const RunMode& mode) {
        if (mode.replay_path) {
            return run_headless(mode);
        }
#ifdef DDROP_WITH_SDL
        return runGui(mode);
#else
        LOG_ERROR("Built without SDL3: only --replay is available");
        return 1;
#endif
    }

} // namespace ddrop::app
