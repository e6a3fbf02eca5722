/* SPDX-FileCopyrightText: 2025 DeskDrop Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "bridge/error.hpp"
#include "bridge/file_reference.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace ddrop::bridge {

    /**
     * @brief Parse one location string into a file reference
     *
     * Accepts file URIs only: "file:///abs/path", "file://localhost/abs/path" and
     * "file:/abs/path". The scheme is case-insensitive, percent escapes are decoded.
     * Rejected: other schemes, remote hosts, relative paths, query or fragment,
     * malformed escapes, an encoded NUL or '/'.
     */
    [[nodiscard]] Result<FileReference> resolve_location(std::string_view location);

    /**
     * @brief Resolve a whole drop
     *
     * Invalid entries are omitted, survivors keep their relative order. Never fails:
     * empty or all-invalid input yields an empty batch.
     *
     * @param rejected Optional counter, incremented once per omitted entry
     */
    [[nodiscard]] DropBatch resolve_locations(const std::vector<std::string>& locations,
                                              size_t* rejected = nullptr);

} // namespace ddrop::bridge
