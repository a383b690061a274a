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

#include <chrono>
#include <format>
#include <string>

#include "clipboard/entry.hxx"

std::string
clipboard::make_timestamp(const std::chrono::system_clock::time_point& time) noexcept
{
    return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(time));
}
