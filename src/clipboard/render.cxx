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

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <cstddef>

#include <fmt/color.h>
#include <fmt/format.h>

#include "clipboard/entry.hxx"
#include "clipboard/render.hxx"

#include "utils/format.hxx"

namespace
{
enum class row_type
{
    file,
    directory,
    symlink,
    missing,
};

struct row final
{
    row_type type;
    std::string path;
    std::string details;
};

row
make_row(const clipboard::entry& entry, const clipboard::render_options& options) noexcept
{
    const std::filesystem::path path = entry.original_path;

    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec || !std::filesystem::exists(status))
    {
        return {row_type::missing, entry.original_path, "(file not found)"};
    }

    if (std::filesystem::is_directory(status))
    {
        return {row_type::directory, entry.original_path, "(directory)"};
    }

    if (std::filesystem::is_symlink(status))
    {
        const auto target = std::filesystem::read_symlink(path, ec);
        if (ec)
        {
            return {row_type::symlink,
                    std::format("{} -> (broken)", entry.original_path),
                    "(symlink)"};
        }
        return {row_type::symlink,
                std::format("{} -> {}", entry.original_path, target.string()),
                "(symlink)"};
    }

    const auto size = std::filesystem::file_size(path, ec);
    const auto size_str = ec ? std::string("?") : utils::format_file_size(size);

    const auto mtime = std::filesystem::last_write_time(path, ec);
    const auto mtime_str =
        ec ? std::string("?")
           : utils::format_relative_time(
                 std::chrono::clock_cast<std::chrono::system_clock>(mtime),
                 options.now);

    return {row_type::file, entry.original_path, std::format("({}, {})", size_str, mtime_str)};
}

fmt::text_style
style_for(row_type type) noexcept
{
    switch (type)
    {
        case row_type::directory:
            return fmt::fg(fmt::terminal_color::blue) | fmt::emphasis::bold;
        case row_type::symlink:
            return fmt::fg(fmt::terminal_color::bright_cyan);
        case row_type::missing:
            return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::strikethrough;
        case row_type::file:
        default:
            return fmt::fg(fmt::terminal_color::bright_white);
    }
}

std::string
styled(const std::string_view text, const fmt::text_style& style, bool color) noexcept
{
    if (!color)
    {
        return std::string(text);
    }
    return fmt::format(style, "{}", text);
}
} // namespace

std::string
clipboard::render(const std::vector<entry>& entries, const render_options& options) noexcept
{
    if (entries.empty())
    {
        return "Clipboard is empty\n";
    }

    std::vector<row> rows;
    rows.reserve(entries.size());
    for (const auto& entry : entries)
    {
        rows.push_back(make_row(entry, options));
    }

    // +1 for the trailing ':'
    const auto index_width = std::to_string(entries.size()).size() + 1;

    std::size_t path_width = 0;
    for (const auto& r : rows)
    {
        path_width = std::max(path_width, r.path.size());
    }

    const auto dim = fmt::fg(fmt::terminal_color::bright_black);

    std::string buffer;
    for (std::size_t i = 0; i < rows.size(); ++i)
    {
        const auto& r = rows[i];
        const auto index = std::format("{:>{}}", std::format("{}:", i), index_width);
        const auto path = std::format("{:<{}}", r.path, path_width);

        buffer.append(std::format("{} {} {}\n",
                                  styled(index, dim, options.color),
                                  styled(path, style_for(r.type), options.color),
                                  styled(r.details, dim, options.color)));
    }

    return buffer;
}
