/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "bridge/protocol_codec.hpp"
#include "bridge/error.hpp"
#include "core/logger.hpp"

namespace ddrop::bridge {

    namespace {

        Result<DropPosition> decode_position(const nlohmann::json& args) {
            if (!args.is_array() || args.size() != 2)
                return make_error(ErrorCode::MALFORMED_PAYLOAD, "expected [x, y]");
            if (!args[0].is_number() || !args[1].is_number())
                return make_error(ErrorCode::MALFORMED_PAYLOAD, "position components must be numbers");
            return DropPosition{.x = args[0].get<double>(), .y = args[1].get<double>()};
        }

        Result<std::vector<std::string>> decode_locations(const nlohmann::json& args) {
            if (!args.is_array())
                return make_error(ErrorCode::MALFORMED_PAYLOAD,
                                  std::string("expected a list of strings, got ") + args.type_name());

            std::vector<std::string> locations;
            locations.reserve(args.size());
            for (size_t i = 0; i < args.size(); ++i) {
                if (!args[i].is_string())
                    return make_error(ErrorCode::MALFORMED_PAYLOAD,
                                      fmt::format("element {} is a {}, not a string", i, args[i].type_name()));
                locations.push_back(args[i].get<std::string>());
            }
            return locations;
        }

    } // namespace

    DragMessage decode(const MethodCall& call) {
        if (call.method == method::ENTERED)
            return drag::Entered{};

        if (call.method == method::EXITED)
            return drag::Exited{};

        if (call.method == method::UPDATED) {
            auto position = decode_position(call.arguments);
            if (!position) {
                LOG_TRACE("updated: {}", position.error().format());
                return drag::Updated{};
            }
            return drag::Updated{.position = *position};
        }

        if (call.method == method::DROPPED) {
            auto locations = decode_locations(call.arguments);
            if (!locations) {
                LOG_DEBUG("dropped: {}", locations.error().format());
                return drag::Dropped{};
            }
            return drag::Dropped{.locations = std::move(*locations)};
        }

        LOG_DEBUG("Ignoring unknown method '{}'", call.method);
        return drag::Ignored{.method = call.method};
    }

    MethodCall encode(const DragMessage& message) {
        return std::visit(Overloaded{
                              [](const drag::Ignored& m) {
                                  return MethodCall{.method = m.method, .arguments = nullptr};
                              },
                              [](const drag::Entered&) {
                                  return MethodCall{.method = std::string(method::ENTERED), .arguments = nullptr};
                              },
                              [](const drag::Exited&) {
                                  return MethodCall{.method = std::string(method::EXITED), .arguments = nullptr};
                              },
                              [](const drag::Updated& m) {
                                  nlohmann::json args = nullptr;
                                  if (m.position)
                                      args = nlohmann::json::array({m.position->x, m.position->y});
                                  return MethodCall{.method = std::string(method::UPDATED), .arguments = std::move(args)};
                              },
                              [](const drag::Dropped& m) {
                                  return MethodCall{.method = std::string(method::DROPPED),
                                                    .arguments = nlohmann::json(m.locations)};
                              },
                          },
                          message);
    }

} // namespace ddrop::bridge
