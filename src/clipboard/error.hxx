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

#include <system_error>

#include <cstdint>

namespace clipboard
{
enum class error_code : std::uint8_t
{
    none,
    not_found,
    permission_denied,
    empty_clipboard,
    stale_entry,
    invalid_index,
    parse_error,
    write_failure,
};

const std::error_category& error_category() noexcept;

inline std::error_code
make_error_code(clipboard::error_code e) noexcept
{
    return {static_cast<int>(e), clipboard::error_category()};
}
} // namespace clipboard

template<>
struct std::is_error_code_enum<clipboard::error_code> : std::true_type
{
};
