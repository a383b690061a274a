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

#include <expected>
#include <filesystem>
#include <string>

#include <cstdint>

namespace commandline
{
enum class command : std::uint8_t
{
    none, // help or version was shown
    cut,
    paste,
    list,
    clear,
};

struct opts final
{
    commandline::command command{command::none};
    std::filesystem::path path;      // cut
    bool persist{false};             // paste
    std::filesystem::path clipboard; // empty, use the default store
};

std::expected<opts, std::string> run(int argc, char* argv[]) noexcept;
} // namespace commandline
