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

#include <cstdint>

namespace utils
{
/**
 * @brief SI units, one decimal, e.g. "1.2 KB"
 */
[[nodiscard]] std::string format_file_size(std::uint64_t size_in_bytes) noexcept;

/**
 * @brief "now", "3 minutes ago", "2 days from now"
 */
[[nodiscard]] std::string
format_relative_time(const std::chrono::system_clock::time_point& time,
                     const std::chrono::system_clock::time_point& now =
                         std::chrono::system_clock::now()) noexcept;
} // namespace utils
