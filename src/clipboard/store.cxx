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
#include <string>
#include <system_error>

#include <glaze/glaze.hpp>

#include "clipboard/entry.hxx"
#include "clipboard/error.hxx"
#include "clipboard/store.hxx"

#include "vfs/user-dirs.hxx"

#include "logger.hxx"
#include "package.hxx"

clipboard::store::store(const std::filesystem::path& path) noexcept : file_(path) {}

clipboard::store
clipboard::store::create() noexcept
{
    return store(vfs::user::home() / cx::package.store_filename);
}

const std::filesystem::path&
clipboard::store::path() const noexcept
{
    return file_;
}

std::expected<std::filesystem::path, std::error_code>
clipboard::store::ensure() const noexcept
{
    std::error_code ec;
    if (std::filesystem::exists(file_, ec))
    {
        return file_;
    }

    const auto parent = file_.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec))
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            logger::error<logger::domain::store>("Failed to create store directory: {} {}",
                                                 parent.string(),
                                                 ec.message());
            return std::unexpected(ec);
        }
    }

    logger::debug<logger::domain::store>("creating empty store: {}", file_.string());

    const auto result = write(clipboard_data{});
    if (!result)
    {
        return std::unexpected(result.error());
    }

    return file_;
}

std::expected<clipboard::clipboard_data, std::error_code>
clipboard::store::read() const noexcept
{
    const auto path = ensure();
    if (!path)
    {
        return std::unexpected(path.error());
    }

    clipboard_data data{};
    std::string buffer;
    const auto ec = glz::read_file_json<
        glz::opts{.error_on_unknown_keys = false, .error_on_missing_keys = true}>(data,
                                                                                  file_.c_str(),
                                                                                  buffer);
    if (ec)
    {
        logger::error<logger::domain::store>("Failed to load store {}: {}",
                                             file_.string(),
                                             glz::format_error(ec, buffer));
        return std::unexpected(clipboard::error_code::parse_error);
    }

    logger::trace<logger::domain::store>("read {} entries from {}",
                                         data.entries.size(),
                                         file_.string());

    return data;
}

std::expected<void, std::error_code>
clipboard::store::write(const clipboard_data& data) const noexcept
{
    std::string buffer;
    const auto ec =
        glz::write_file_json<glz::opts{.prettify = true, .indentation_width = 2}>(data,
                                                                                  file_.c_str(),
                                                                                  buffer);
    if (ec)
    {
        logger::error<logger::domain::store>("Failed to write store {}: {}",
                                             file_.string(),
                                             glz::format_error(ec, buffer));
        return std::unexpected(clipboard::error_code::write_failure);
    }

    logger::trace<logger::domain::store>("wrote {} entries to {}",
                                         data.entries.size(),
                                         file_.string());

    return {};
}
