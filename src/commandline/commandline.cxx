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
#include <expected>
#include <filesystem>
#include <format>
#include <memory>
#include <print>
#include <string>
#include <unordered_map>
#include <vector>

#include <cstdlib>

#include <magic_enum/magic_enum.hpp>

#include <CLI/CLI.hpp>

#include <spdlog/spdlog.h>

#include "commandline/commandline.hxx"

#include "logger.hxx"
#include "package.hxx"

struct opts_data final
{
    std::filesystem::path path;
    bool persist{false};
    std::filesystem::path clipboard;

    std::vector<std::string> raw_log_levels;
    std::unordered_map<std::string, std::string> log_levels;
    std::filesystem::path logfile;

    bool version{false};
};

static void
run_commandline(const std::shared_ptr<opts_data>& opt) noexcept
{
    if (opt->version)
    {
        std::println("{} {}", cx::package.name_fancy, cx::package.version);
        std::exit(EXIT_SUCCESS);
    }

    logger::initialize(opt->log_levels, opt->logfile);
}

static void
setup_commandline(CLI::App& app, const std::shared_ptr<opts_data>& opt) noexcept
{
    app.add_option("--clipboard", opt->clipboard, "path to the clipboard file")
        ->expected(1)
        ->check(
            [](const std::filesystem::path& input)
            {
                if (std::filesystem::is_directory(input))
                {
                    return std::format("Clipboard path must be a file: {}", input.string());
                }

                // Validate pass
                return std::string();
            });

    app.add_option("--loglevel", opt->raw_log_levels, "Set the loglevel. Format: domain=level")
        ->check(
            [&opt](const std::string& value)
            {
                constexpr auto log_levels = magic_enum::enum_names<spdlog::level::level_enum>();
                constexpr auto valid_domains = magic_enum::enum_names<logger::domain>();

                const auto pos = value.find('=');
                if (pos == std::string::npos)
                {
                    return std::string("Must be in format domain=level");
                }

                const auto domain = value.substr(0, pos);
                if (!std::ranges::contains(valid_domains, domain))
                {
                    return std::format("Invalid domain: {}", domain);
                }

                const auto level = value.substr(pos + 1);
                if (!std::ranges::contains(log_levels, level))
                {
                    return std::format("Invalid log level: {}", level);
                }

                opt->log_levels.insert({domain, level});

                return std::string();
            });

    app.add_option("--logfile", opt->logfile, "absolute path to the logfile")
        ->expected(1)
        ->check(
            [](const std::filesystem::path& input)
            {
                if (input.is_absolute())
                {
                    return std::string();
                }
                return std::format("Logfile path must be absolute: {}", input.string());
            });

    app.add_flag("-v,--version", opt->version, "Show version information");

    // cx <path>
    app.add_option("path", opt->path, "file or directory to cut")->expected(0, 1);

    // global options are also accepted after a subcommand
    app.fallthrough();

    auto* paste = app.add_subcommand("paste", "Paste the most recent clipboard entry");
    paste->add_flag("-p,--persist", opt->persist, "keep entry in clipboard after paste");

    auto* list = app.add_subcommand("list", "List clipboard contents");
    list->alias("ls");
    list->alias("l");

    auto* clear = app.add_subcommand("clear", "Clear clipboard contents");
    clear->alias("c");

    app.require_subcommand(0, 1);

    app.callback([opt]() { run_commandline(opt); });
}

std::expected<commandline::opts, std::string>
commandline::run(int argc, char* argv[]) noexcept
{
    CLI::App app{std::string(cx::package.description), std::string(cx::package.name)};

    auto opt = std::make_shared<opts_data>();
    setup_commandline(app, opt);

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        if (e.get_exit_code() == static_cast<int>(CLI::ExitCodes::Success))
        {
            // --help
            (void)app.exit(e);
            return commandline::opts{};
        }
        return std::unexpected{std::format("{}\nRun with --help for more information.",
                                           e.what())};
    }

    auto command = commandline::command::none;
    if (app.got_subcommand("paste"))
    {
        command = commandline::command::paste;
    }
    else if (app.got_subcommand("list"))
    {
        command = commandline::command::list;
    }
    else if (app.got_subcommand("clear"))
    {
        command = commandline::command::clear;
    }
    else if (!opt->path.empty())
    {
        command = commandline::command::cut;
    }
    else
    {
        std::print("{}", app.help());
    }

    return commandline::opts{.command = command,
                             .path = opt->path,
                             .persist = opt->persist,
                             .clipboard = opt->clipboard};
}
