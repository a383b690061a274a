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

#include <cstdint>

namespace clipboard
{
enum class mode : std::uint8_t
{
    copy,
    move,
};

/**
 * One cut item. Paths are absolute and stored as plain strings so the
 * on disk format stays a flat JSON object.
 */
struct entry final
{
    std::string original_path;
    std::string current_path;
    std::string timestamp; // RFC3339, UTC
};

struct clipboard_data final
{
    std::vector<entry> entries;
};

[[nodiscard]] std::string make_timestamp(const std::chrono::system_clock::time_point& time =
                                             std::chrono::system_clock::now()) noexcept;
} // namespace clipboard
