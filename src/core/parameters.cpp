/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <fmt/format.h>
#include <cstdint>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace ddrop::core {
    namespace param {
        namespace {
            std::expected<nlohmann::json, std::string> read_json_file(const std::filesystem::path& path) {
                if (!std::filesystem::exists(path)) {
                    return std::unexpected(fmt::format("Config file not found: {}", path_to_utf8(path)));
                }

                std::ifstream file(path);
                if (!file) {
                    return std::unexpected(fmt::format("Cannot open config: {}", path_to_utf8(path)));
                }

                try {
                    std::stringstream buffer;
                    buffer << file.rdbuf();
                    return nlohmann::json::parse(buffer.str());
                } catch (const nlohmann::json::parse_error& e) {
                    return std::unexpected(fmt::format("JSON parse error in {}: {}", path_to_utf8(path), e.what()));
                }
            }

            void read_string(const nlohmann::json& j, const char* key, std::string& out) {
                if (!j.contains(key))
                    return;
                if (!j[key].is_string())
                    throw std::invalid_argument(fmt::format("'{}' must be a string", key));
                out = j[key].get<std::string>();
            }

            void read_bool(const nlohmann::json& j, const char* key, bool& out) {
                if (!j.contains(key))
                    return;
                if (!j[key].is_boolean())
                    throw std::invalid_argument(fmt::format("'{}' must be a boolean", key));
                out = j[key].get<bool>();
            }

            void read_positive_int(const nlohmann::json& j, const char* key, int& out) {
                if (!j.contains(key))
                    return;
                const auto& value = j[key];
                // Unsigned values above INT64_MAX read back negative and are rejected too
                if (!value.is_number_integer() || value.get<std::int64_t>() <= 0 ||
                    value.get<std::int64_t>() > std::numeric_limits<int>::max())
                    throw std::invalid_argument(fmt::format("'{}' must be a positive integer", key));
                out = static_cast<int>(value.get<std::int64_t>());
            }

            const nlohmann::json& section(const nlohmann::json& j, const char* key) {
                static const nlohmann::json EMPTY = nlohmann::json::object();
                if (!j.contains(key))
                    return EMPTY;
                if (!j[key].is_object())
                    throw std::invalid_argument(fmt::format("'{}' must be an object", key));
                return j[key];
            }
        } // namespace

        LogLevel LoggingParameters::log_level(const LogLevel fallback) const {
            if (!level)
                return fallback;
            return parse_log_level(*level).value_or(fallback);
        }

        nlohmann::json LoggingParameters::to_json() const {
            nlohmann::json j;
            if (level)
                j["level"] = *level;
            j["file"] = file;
            j["filter"] = filter;
            return j;
        }

        LoggingParameters LoggingParameters::from_json(const nlohmann::json& j) {
            LoggingParameters params;
            if (j.contains("level")) {
                std::string level;
                read_string(j, "level", level);
                if (!parse_log_level(level)) {
                    throw std::invalid_argument(fmt::format("'level' has unknown value '{}'", level));
                }
                params.level = std::move(level);
            }
            read_string(j, "file", params.file);
            read_string(j, "filter", params.filter);
            return params;
        }

        nlohmann::json WindowParameters::to_json() const {
            nlohmann::json j;
            j["title"] = title;
            j["width"] = width;
            j["height"] = height;
            return j;
        }

        WindowParameters WindowParameters::from_json(const nlohmann::json& j) {
            WindowParameters params;
            read_string(j, "title", params.title);
            read_positive_int(j, "width", params.width);
            read_positive_int(j, "height", params.height);
            return params;
        }

        nlohmann::json BridgeParameters::to_json() const {
            nlohmann::json j;
            j["channel_name"] = channel_name;
            j["forward_positions"] = forward_positions;
            j["logging"] = logging.to_json();
            j["window"] = window.to_json();
            return j;
        }

        BridgeParameters BridgeParameters::from_json(const nlohmann::json& j) {
            if (!j.is_object())
                throw std::invalid_argument("config root must be an object");

            BridgeParameters params;
            read_string(j, "channel_name", params.channel_name);
            if (params.channel_name.empty())
                throw std::invalid_argument("'channel_name' must not be empty");
            read_bool(j, "forward_positions", params.forward_positions);
            params.logging = LoggingParameters::from_json(section(j, "logging"));
            params.window = WindowParameters::from_json(section(j, "window"));
            return params;
        }

        std::expected<BridgeParameters, std::string> read_bridge_params_from_json(const std::filesystem::path& path) {
            auto json_result = read_json_file(path);
            if (!json_result) {
                return std::unexpected(json_result.error());
            }

            try {
                auto params = BridgeParameters::from_json(*json_result);
                LOG_DEBUG("Loaded config: {}", path_to_utf8(path));
                return params;
            } catch (const std::exception& e) {
                return std::unexpected(fmt::format("Invalid config {}: {}", path_to_utf8(path), e.what()));
            }
        }

        std::expected<void, std::string> save_bridge_params_to_json(
            const BridgeParameters& params,
            const std::filesystem::path& output_path) {
            try {
                if (output_path.has_parent_path()) {
                    std::filesystem::create_directories(output_path.parent_path());
                }

                std::ofstream file(output_path);
                if (!file) {
                    return std::unexpected(fmt::format("Cannot write: {}", path_to_utf8(output_path)));
                }

                file << params.to_json().dump(4);
                LOG_INFO("Saved config: {}", path_to_utf8(output_path));
                return {};
            } catch (const std::exception& e) {
                return std::unexpected(fmt::format("Error saving bridge parameters: {}", e.what()));
            }
        }

    } // namespace param
} // namespace ddrop::core
