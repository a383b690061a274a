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

#include <array>
#include <chrono>
#include <format>
#include <string>
#include <string_view>

#include <cstdint>

#include <ztd/ztd.hxx>

#include "utils/format.hxx"

std::string
utils::format_file_size(std::uint64_t size_in_bytes) noexcept
{
    return ztd::format_filesize(u64(size_in_bytes), ztd::base::si, 1);
}

using namespace std::chrono_literals;

namespace
{
struct time_unit final
{
    std::chrono::seconds limit;
    std::chrono::seconds divisor;
    std::string_view singular;
};

constexpr auto minute = std::chrono::seconds(60);
constexpr auto hour = std::chrono::seconds(3600);
constexpr auto day = std::chrono::seconds(86400);
constexpr auto week = day * 7;
constexpr auto month = day * 30;
constexpr auto year = day * 365;

// the first unit whose limit is above the elapsed time is used
constexpr std::array<time_unit, 8> units{{
    {2s, 1s, "1 second"},
    {minute, 1s, "1 second"},
    {minute * 2, minute, "1 minute"},
    {hour, minute, "1 minute"},
    {hour * 2, hour, "1 hour"},
    {day, hour, "1 hour"},
    {day * 2, day, "1 day"},
    {week, day, "1 day"},
}};
} // namespace

std::string
utils::format_relative_time(const std::chrono::system_clock::time_point& time,
                            const std::chrono::system_clock::time_point& now) noexcept
{
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - time);
    const auto suffix = elapsed < 0s ? "from now" : "ago";
    const auto delta = elapsed < 0s ? -elapsed : elapsed;

    if (delta < 1s)
    {
        return "now";
    }

    const auto format_unit = [&](std::chrono::seconds divisor, std::string_view singular)
    {
        const auto count = delta / divisor;
        if (count <= 1)
        {
            return std::format("{} {}", singular, suffix);
        }
        return std::format("{} {}s {}", count, singular.substr(2), suffix);
    };

    for (const auto& unit : units)
    {
        if (delta < unit.limit)
        {
            return format_unit(unit.divisor, unit.singular);
        }
    }

    if (delta < month)
    {
        return format_unit(week, "1 week");
    }
    if (delta < year)
    {
        return format_unit(month, "1 month");
    }
    return format_unit(year, "1 year");
}
