/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "app/argument_parser.hpp"

namespace ddrop::app {

    class Application {
    public:
        int run(const RunMode& mode);
    };

} // namespace ddrop::app
