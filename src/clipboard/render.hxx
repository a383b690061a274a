/**
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "clipboard/entry.hxx"

namespace clipboard
{
struct render_options final
{
    bool color{true};
    // reference point for relative modification times
    std::chrono::system_clock::time_point now{std::chrono::system_clock::now()};
};

/**
 * @brief Format entries as an aligned table, one line per entry.
 *
 * Each row is "<index>: <path> <details>", the index column is right
 * aligned and the path column padded to the longest path, symlinks are shown
 * as "path -> target". Rows use the original path. A missing original path
 * is shown with "(file not found)".
 */
[[nodiscard]] std::string render(const std::vector<entry>& entries,
                                 const render_options& options = {}) noexcept;
} // namespace clipboard
