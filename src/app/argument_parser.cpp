/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/argument_parser.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <args.hxx>
#include <cstdlib>
#include <fmt/format.h>

namespace ddrop::app {

    std::expected<ParsedArgs, std::string> parse_args(const std::vector<std::string>& args) {
        if (args.empty())
            return std::unexpected("Missing program name");

        ::args::ArgumentParser parser(
            "DeskDrop drop monitor: logs files dragged onto its window.\n",
            "\nEXAMPLES:\n"
            "drop_monitor\n"
            "drop_monitor --config drop.json -v\n"
            "drop_monitor --replay session.json\n"
            "\n"
            "ENVIRONMENT:\n"
            "LOG_LEVEL -- Set log level (trace/debug/info/perf/warn/error)\n");
        parser.helpParams.width = 120;

        ::args::HelpFlag help(parser, "help", "Display help menu", {'h', "help"});

        ::args::Group bridge_group(parser, "BRIDGE:");
        ::args::ValueFlag<std::string> config_file(bridge_group, "config_file", "Config file (json)", {"config"});
        ::args::ValueFlag<std::string> channel(bridge_group, "name", "Boundary channel name (default: desktop_drop_test)", {"channel"});
        ::args::Flag no_positions(bridge_group, "no_positions", "Do not forward drag positions", {"no-positions"});
        ::args::ValueFlag<std::string> replay(bridge_group, "path", "Replay a recorded trace headless (json)", {"replay"});

        ::args::Group window_group(parser, "WINDOW:");
        ::args::ValueFlag<std::string> title(window_group, "title", "Window title", {"title"});

        ::args::Group logging_group(parser, "LOGGING:");
        ::args::ValueFlag<std::string> log_level(logging_group, "level", "Log level: trace, debug, info, perf, warn, error, critical, off", {"log-level"});
        ::args::ValueFlag<std::string> log_file(logging_group, "path", "Also write the log to a file", {"log-file"});
        ::args::ValueFlag<std::string> log_filter(logging_group, "pattern", "Only log messages matching a glob, e.g. \"*dropped*\"", {"log-filter"});
        ::args::Flag verbose(logging_group, "verbose", "Debug logging", {'v', "verbose"});
        ::args::Flag quiet(logging_group, "quiet", "Errors only", {'q', "quiet"});

        try {
            parser.Prog(args.front());
            parser.ParseArgs(std::vector<std::string>(args.begin() + 1, args.end()));
        } catch (const ::args::Help&) {
            fmt::print("{}", parser.Help());
            return HelpMode{};
        } catch (const ::args::ParseError& e) {
            return std::unexpected(fmt::format("Parse error: {}\n{}", e.what(), parser.Help()));
        }

        RunMode mode;
        auto& params = mode.params;

        if (config_file) {
            auto loaded = core::param::read_bridge_params_from_json(core::utf8_to_path(::args::get(config_file)));
            if (!loaded)
                return std::unexpected(loaded.error());
            params = std::move(*loaded);
        }

        if (channel) {
            const auto& name = ::args::get(channel);
            if (name.empty())
                return std::unexpected("--channel must not be empty");
            params.channel_name = name;
        }
        if (no_positions)
            params.forward_positions = false;
        if (title)
            params.window.title = ::args::get(title);
        if (replay)
            mode.replay_path = core::utf8_to_path(::args::get(replay));

        // Initialize logger: LOG_LEVEL < config logging.level < -v/-q < --log-level
        {
            auto level = core::LogLevel::Info;
            if (const char* env_level = std::getenv("LOG_LEVEL")) {
                level = core::parse_log_level(env_level).value_or(level);
            }
            level = params.logging.log_level(level);
            if (verbose)
                level = core::LogLevel::Debug;
            if (quiet)
                level = core::LogLevel::Error;
            if (log_level) {
                const auto parsed = core::parse_log_level(::args::get(log_level));
                if (!parsed)
                    return std::unexpected(fmt::format("Unknown log level '{}'", ::args::get(log_level)));
                level = *parsed;
            }
            if (log_file)
                params.logging.file = ::args::get(log_file);
            if (log_filter)
                params.logging.filter = ::args::get(log_filter);
            params.logging.level = std::string(core::log_level_name(level));

            core::Logger::get().init(level, params.logging.file, params.logging.filter);

            LOG_DEBUG("Logger initialized with level: {}", core::log_level_name(level));
            if (!params.logging.filter.empty())
                LOG_DEBUG("Log filter: {}", params.logging.filter);
            if (!params.logging.file.empty())
                LOG_DEBUG("Logging to file: {}", params.logging.file);
        }

        return mode;
    }

    std::expected<ParsedArgs, std::string> parse_args(const int argc, const char* const argv[]) {
        return parse_args(std::vector<std::string>(argv, argv + argc));
    }

} // namespace ddrop::app
