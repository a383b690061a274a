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

#include <filesystem>
#include <format>
#include <string>
#include <unordered_map>

#include <cstdint>

#include <magic_enum/magic_enum.hpp>

#include <spdlog/spdlog.h>

namespace logger
{
enum class domain : std::uint8_t
{
    basic,
    store,
    clipboard,
    vfs,
};

void initialize(const std::unordered_map<std::string, std::string>& options,
                const std::filesystem::path& logfile = "") noexcept;

template<domain d = domain::basic, typename... Args>
void
trace(std::format_string<Args...> fmt, Args&&... args) noexcept
{
    spdlog::get(magic_enum::enum_name(d).data())
        ->trace(std::format(fmt, std::forward<Args>(args)...));
}

template<domain d = domain::basic, typename... Args>
void
debug(std::format_string<Args...> fmt, Args&&... args) noexcept
{
    spdlog::get(magic_enum::enum_name(d).data())
        ->debug(std::format(fmt, std::forward<Args>(args)...));
}

template<domain d = domain::basic, typename... Args>
void
info(std::format_string<Args...> fmt, Args&&... args) noexcept
{
    spdlog::get(magic_enum::enum_name(d).data())
        ->info(std::format(fmt, std::forward<Args>(args)...));
}

template<domain d = domain::basic, typename... Args>
void
warn(std::format_string<Args...> fmt, Args&&... args) noexcept
{
    spdlog::get(magic_enum::enum_name(d).data())
        ->warn(std::format(fmt, std::forward<Args>(args)...));
}

template<domain d = domain::basic, typename... Args>
void
error(std::format_string<Args...> fmt, Args&&... args) noexcept
{
    spdlog::get(magic_enum::enum_name(d).data())
        ->error(std::format(fmt, std::forward<Args>(args)...));
}
} // namespace logger
