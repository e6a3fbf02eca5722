/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/path_utils.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace ddrop::bridge {

    // A dropped item resolved to a local path. The file is not required to exist.
    struct FileReference {
        std::filesystem::path path;
        std::string uri; // Location string as received from the native side

        [[nodiscard]] std::string filename() const { return core::path_to_utf8(path.filename()); }
        [[nodiscard]] std::string utf8() const { return core::path_to_utf8(path); }

        bool operator==(const FileReference&) const = default;
    };

    // One batch per drop, in the order the native side listed the items
    using DropBatch = std::vector<FileReference>;

} // namespace ddrop::bridge
