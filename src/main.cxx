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

#include <expected>
#include <filesystem>
#include <print>
#include <system_error>

#include <cstdio>
#include <cstdlib>

#include <unistd.h>

#include "clipboard/clipboard.hxx"
#include "clipboard/render.hxx"
#include "clipboard/store.hxx"

#include "commandline/commandline.hxx"

static int
report(const std::error_code& ec) noexcept
{
    std::println(stderr, "Error: {}", ec.message());
    return EXIT_FAILURE;
}

static int
report(const std::error_code& ec, const std::filesystem::path& path) noexcept
{
    std::println(stderr, "Error: {}: {}", ec.message(), path.string());
    return EXIT_FAILURE;
}

int
main(int argc, char* argv[])
{
    const auto opts = commandline::run(argc, argv);
    if (!opts)
    {
        std::println(stderr, "{}", opts.error());
        return EXIT_FAILURE;
    }

    const auto store = opts->clipboard.empty() ? clipboard::store::create()
                                               : clipboard::store(opts->clipboard);

    switch (opts->command)
    {
        case commandline::command::none:
        {
            return EXIT_SUCCESS;
        }
        case commandline::command::cut:
        {
            const auto result = clipboard::cut(store, opts->path);
            if (!result)
            {
                return report(result.error(), opts->path);
            }
            std::println("Cut: {}", result->string());
            return EXIT_SUCCESS;
        }
        case commandline::command::paste:
        {
            const auto mode = opts->persist ? clipboard::mode::copy : clipboard::mode::move;
            const auto result = clipboard::paste(store, mode);
            if (!result)
            {
                return report(result.error());
            }
            std::println("{}: {} -> {}",
                         result->mode == clipboard::mode::copy ? "Copied" : "Moved",
                         result->source.string(),
                         result->destination.string());
            return EXIT_SUCCESS;
        }
        case commandline::command::list:
        {
            const auto entries = clipboard::list(store);
            if (!entries)
            {
                return report(entries.error(), store.path());
            }
            std::print("{}",
                       clipboard::render(*entries, {.color = isatty(STDOUT_FILENO) == 1}));
            return EXIT_SUCCESS;
        }
        case commandline::command::clear:
        {
            const auto result = clipboard::clear(store);
            if (!result)
            {
                return report(result.error(), store.path());
            }
            std::println("Clipboard cleared");
            return EXIT_SUCCESS;
        }
    }

    return EXIT_FAILURE;
}
