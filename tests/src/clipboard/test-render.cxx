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
#include <filesystem>
#include <format>
#include <sstream>
#include <string>
#include <vector>

#include <doctest/doctest.h>

#include "clipboard/entry.hxx"
#include "clipboard/render.hxx"

#include "utils/format.hxx"

#include "test-utils.hxx"

namespace
{
clipboard::entry
make_entry(const std::filesystem::path& path)
{
    return {path.string(), path.string(), "2024-01-01T00:00:00Z"};
}

std::vector<std::string>
split_lines(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream stream(text);
    for (std::string line; std::getline(stream, line);)
    {
        lines.push_back(line);
    }
    return lines;
}
} // namespace

TEST_SUITE("clipboard::render" * doctest::description(""))
{
    TEST_CASE("empty clipboard")
    {
        CHECK_EQ(clipboard::render({}), "Clipboard is empty\n");
        CHECK_EQ(clipboard::render({}, {.color = false}), "Clipboard is empty\n");
    }

    TEST_CASE("missing path")
    {
        const std::vector<clipboard::entry> entries{make_entry("/nonexistent/cx/path")};

        const auto output = clipboard::render(entries, {.color = false});
        CHECK_EQ(output, "0: /nonexistent/cx/path (file not found)\n");
    }

    TEST_CASE("alignment")
    {
        SUBCASE("path column")
        {
            const std::vector<clipboard::entry> entries{
                make_entry("/nonexistent/a"),
                make_entry("/nonexistent/abcd"),
            };

            const auto lines = split_lines(clipboard::render(entries, {.color = false}));
            REQUIRE_EQ(lines.size(), 2);
            CHECK_EQ(lines[0], "0: /nonexistent/a    (file not found)");
            CHECK_EQ(lines[1], "1: /nonexistent/abcd (file not found)");
        }

        SUBCASE("index column")
        {
            std::vector<clipboard::entry> entries;
            for (int i = 0; i < 11; ++i)
            {
                entries.push_back(make_entry(std::format("/nonexistent/{:02}", i)));
            }

            const auto lines = split_lines(clipboard::render(entries, {.color = false}));
            REQUIRE_EQ(lines.size(), 11);
            CHECK_EQ(lines[0], " 0: /nonexistent/00 (file not found)");
            CHECK_EQ(lines[9], " 9: /nonexistent/09 (file not found)");
            CHECK_EQ(lines[10], "10: /nonexistent/10 (file not found)");
        }
    }

    TEST_CASE("directory")
    {
        const auto root = test::make_directory("render-directory");
        const auto dir = root / "config";
        std::filesystem::create_directories(dir);

        const auto output = clipboard::render({make_entry(dir)}, {.color = false});
        CHECK_EQ(output, std::format("0: {} (directory)\n", dir.string()));

        std::filesystem::remove_all(root);
    }

    TEST_CASE("file")
    {
        const auto root = test::make_directory("render-file");
        const auto file = root / "file1.txt";
        test::write_file(file, "This is file 1");

        const auto mtime = std::chrono::clock_cast<std::chrono::system_clock>(
            std::filesystem::last_write_time(file));

        const clipboard::render_options options{.color = false,
                                                .now = mtime + std::chrono::hours(2)};

        const auto output = clipboard::render({make_entry(file)}, options);
        CHECK_EQ(output,
                 std::format("0: {} ({}, 2 hours ago)\n",
                             file.string(),
                             utils::format_file_size(14)));

        std::filesystem::remove_all(root);
    }

    TEST_CASE("symlink")
    {
        const auto root = test::make_directory("render-symlink");
        test::write_file(root / "file1.txt", "This is file 1");

        SUBCASE("valid target")
        {
            const auto link = root / "link";
            std::filesystem::create_symlink("file1.txt", link);

            const auto output = clipboard::render({make_entry(link)}, {.color = false});
            CHECK_EQ(output, std::format("0: {} -> file1.txt (symlink)\n", link.string()));
        }

        SUBCASE("broken target")
        {
            const auto link = root / "broken";
            std::filesystem::create_symlink("nowhere", link);

            const auto output = clipboard::render({make_entry(link)}, {.color = false});
            CHECK_EQ(output, std::format("0: {} -> nowhere (symlink)\n", link.string()));
        }

        std::filesystem::remove_all(root);
    }

    TEST_CASE("rows use the original path")
    {
        const auto root = test::make_directory("render-original");
        const auto copied = root / "copied.txt";
        test::write_file(copied, "content");

        const clipboard::entry entry{"/nonexistent/original.txt",
                                     copied.string(),
                                     "2024-01-01T00:00:00Z"};

        const auto output = clipboard::render({entry}, {.color = false});
        CHECK_EQ(output, "0: /nonexistent/original.txt (file not found)\n");

        std::filesystem::remove_all(root);
    }

    TEST_CASE("color")
    {
        const std::vector<clipboard::entry> entries{make_entry("/nonexistent/a")};

        const auto colored = clipboard::render(entries, {.color = true});
        const auto plain = clipboard::render(entries, {.color = false});

        CHECK(colored.contains("\x1b["));
        CHECK(colored.contains("/nonexistent/a"));
        CHECK_FALSE(plain.contains("\x1b["));
    }
}
