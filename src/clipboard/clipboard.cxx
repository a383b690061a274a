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
#include <system_error>
#include <utility>
#include <vector>

#include <cstddef>

#include "clipboard/clipboard.hxx"
#include "clipboard/entry.hxx"
#include "clipboard/error.hxx"
#include "clipboard/store.hxx"

#include "vfs/utils/file-ops.hxx"

#include "utils/permissions.hxx"

#include "logger.hxx"

namespace
{
bool
path_exists(const std::filesystem::path& path) noexcept
{
    // lstat, a broken symlink is still something that can be pasted
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

std::expected<std::filesystem::path, std::error_code>
working_directory() noexcept
{
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec)
    {
        logger::error<logger::domain::clipboard>("Failed to get working directory: {}",
                                                 ec.message());
        return std::unexpected(ec);
    }
    return cwd;
}

std::expected<clipboard::paste_result, std::error_code>
paste_entry(const clipboard::store& store, clipboard::clipboard_data& data, std::size_t index,
            clipboard::mode mode, const std::filesystem::path& directory) noexcept
{
    if (index >= data.entries.size())
    {
        logger::error<logger::domain::clipboard>("invalid clipboard index: {}", index);
        return std::unexpected(clipboard::error_code::invalid_index);
    }

    auto& entry = data.entries[index];
    const std::filesystem::path source = entry.current_path;
    if (!path_exists(source))
    {
        logger::error<logger::domain::clipboard>("source path no longer exists: {}",
                                                 source.string());
        return std::unexpected(clipboard::error_code::stale_entry);
    }

    const auto destination = directory / source.filename();

    const auto result = mode == clipboard::mode::copy ? vfs::utils::copy(source, destination)
                                                      : vfs::utils::move(source, destination);
    if (!result)
    {
        if (!path_exists(source))
        {
            // removed after the staleness check
            return std::unexpected(clipboard::error_code::not_found);
        }
        return std::unexpected(result.error());
    }

    if (mode == clipboard::mode::copy)
    {
        entry.current_path = destination.string();
    }
    else
    {
        data.entries.erase(data.entries.begin() + static_cast<std::ptrdiff_t>(index));
    }

    const auto written = store.write(data);
    if (!written)
    {
        return std::unexpected(written.error());
    }

    logger::info<logger::domain::clipboard>("{}: {} -> {}",
                                            mode == clipboard::mode::copy ? "copied" : "moved",
                                            source.string(),
                                            destination.string());

    return clipboard::paste_result{.source = source, .destination = destination, .mode = mode};
}
} // namespace

std::expected<std::filesystem::path, std::error_code>
clipboard::cut(const store& store, const std::filesystem::path& path) noexcept
{
    std::error_code ec;
    auto abs_path = std::filesystem::absolute(path, ec).lexically_normal();
    if (ec)
    {
        return std::unexpected(ec);
    }
    // "dir/" normalizes to "dir/", drop the empty last element
    if (!abs_path.has_filename() && abs_path.has_relative_path())
    {
        abs_path = abs_path.parent_path();
    }

    // ENOENT and ENOTDIR both report file_type::not_found
    const auto status = std::filesystem::symlink_status(abs_path, ec);
    if (status.type() == std::filesystem::file_type::not_found)
    {
        logger::error<logger::domain::clipboard>("no such file or directory: {}",
                                                 abs_path.string());
        return std::unexpected(clipboard::error_code::not_found);
    }
    if (ec)
    {
        logger::error<logger::domain::clipboard>("Accessing {}: {}",
                                                 abs_path.string(),
                                                 ec.message());
        return std::unexpected(ec);
    }

    // allow cutting broken symlinks
    if (!std::filesystem::is_symlink(status) && !utils::has_read_permission(abs_path))
    {
        logger::error<logger::domain::clipboard>("no read permission for {}", abs_path.string());
        return std::unexpected(clipboard::error_code::permission_denied);
    }

    auto data = store.read();
    if (!data)
    {
        return std::unexpected(data.error());
    }

    data->entries.push_back({.original_path = abs_path.string(),
                             .current_path = abs_path.string(),
                             .timestamp = clipboard::make_timestamp()});

    const auto written = store.write(*data);
    if (!written)
    {
        return std::unexpected(written.error());
    }

    logger::info<logger::domain::clipboard>("cut: {}", abs_path.string());

    return abs_path;
}

std::expected<clipboard::paste_result, std::error_code>
clipboard::paste(const store& store, clipboard::mode mode) noexcept
{
    const auto cwd = working_directory();
    if (!cwd)
    {
        return std::unexpected(cwd.error());
    }
    return clipboard::paste(store, mode, *cwd);
}

std::expected<clipboard::paste_result, std::error_code>
clipboard::paste(const store& store, clipboard::mode mode,
                 const std::filesystem::path& directory) noexcept
{
    auto data = store.read();
    if (!data)
    {
        return std::unexpected(data.error());
    }

    if (data->entries.empty())
    {
        logger::error<logger::domain::clipboard>("clipboard is empty");
        return std::unexpected(clipboard::error_code::empty_clipboard);
    }

    return paste_entry(store, *data, data->entries.size() - 1, mode, directory);
}

std::expected<clipboard::paste_result, std::error_code>
clipboard::paste_at(const store& store, std::size_t index, clipboard::mode mode) noexcept
{
    const auto cwd = working_directory();
    if (!cwd)
    {
        return std::unexpected(cwd.error());
    }
    return clipboard::paste_at(store, index, mode, *cwd);
}

std::expected<clipboard::paste_result, std::error_code>
clipboard::paste_at(const store& store, std::size_t index, clipboard::mode mode,
                    const std::filesystem::path& directory) noexcept
{
    auto data = store.read();
    if (!data)
    {
        return std::unexpected(data.error());
    }

    return paste_entry(store, *data, index, mode, directory);
}

std::expected<void, std::error_code>
clipboard::remove(const store& store, std::size_t index) noexcept
{
    auto data = store.read();
    if (!data)
    {
        return std::unexpected(data.error());
    }

    if (index >= data->entries.size())
    {
        logger::error<logger::domain::clipboard>("invalid clipboard index: {}", index);
        return std::unexpected(clipboard::error_code::invalid_index);
    }

    data->entries.erase(data->entries.begin() + static_cast<std::ptrdiff_t>(index));

    return store.write(*data);
}

std::expected<std::vector<clipboard::entry>, std::error_code>
clipboard::list(const store& store) noexcept
{
    auto data = store.read();
    if (!data)
    {
        return std::unexpected(data.error());
    }

    return std::move(data->entries);
}

std::expected<void, std::error_code>
clipboard::clear(const store& store) noexcept
{
    // no read, a corrupt store can still be cleared
    const auto result = store.write(clipboard_data{});
    if (!result)
    {
        return result;
    }

    logger::info<logger::domain::clipboard>("cleared {}", store.path().string());

    return {};
}
