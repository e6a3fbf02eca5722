/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "app/argument_parser.hpp"
#include "core/logger.hpp"
#include <fmt/format.h>

int main(int argc, char* argv[]) {
    auto parsed = ddrop::app::parse_args(argc, argv);
    if (!parsed) {
        fmt::print(stderr, "{}\n", parsed.error());
        return 1;
    }

    if (std::holds_alternative<ddrop::app::HelpMode>(*parsed)) {
        return 0;
    }

    ddrop::app::Application app;
    const int result = app.run(std::get<ddrop::app::RunMode>(*parsed));
    ddrop::core::Logger::get().flush();
    return result;
}
