/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ddrop::bridge {

    // Window-local pointer position, origin at the top-left corner
    struct DropPosition {
        double x = 0.0;
        double y = 0.0;

        bool operator==(const DropPosition&) const = default;
    };

    namespace drag {

        // Drag entered the window bounds
        struct Entered {
            bool operator==(const Entered&) const = default;
        };

        // Drag left the window bounds without dropping
        struct Exited {
            bool operator==(const Exited&) const = default;
        };

        // Pointer moved while dragging; fired at pointer-move frequency
        struct Updated {
            std::optional<DropPosition> position;
            bool operator==(const Updated&) const = default;
        };

        // Drop committed; locations are URI strings in the order the source sent them
        struct Dropped {
            std::vector<std::string> locations;
            bool operator==(const Dropped&) const = default;
        };

        // Method name the codec did not recognize; handled as a no-op
        struct Ignored {
            std::string method;
            bool operator==(const Ignored&) const = default;
        };

    } // namespace drag

    using DragMessage = std::variant<drag::Ignored, drag::Entered, drag::Exited, drag::Updated, drag::Dropped>;

    template <class... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };

    [[nodiscard]] inline std::string_view message_name(const DragMessage& message) {
        return std::visit(Overloaded{
                              [](const drag::Ignored&) { return std::string_view{"ignored"}; },
                              [](const drag::Entered&) { return std::string_view{"entered"}; },
                              [](const drag::Exited&) { return std::string_view{"exited"}; },
                              [](const drag::Updated&) { return std::string_view{"updated"}; },
                              [](const drag::Dropped&) { return std::string_view{"dropped"}; },
                          },
                          message);
    }

} // namespace ddrop::bridge
