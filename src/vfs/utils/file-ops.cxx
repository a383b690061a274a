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
#include <system_error>

#include "vfs/utils/file-ops.hxx"

#include "logger.hxx"

namespace
{
bool
is_dest_in_src(const std::filesystem::path& source,
               const std::filesystem::path& destination) noexcept
{
    std::error_code ec;
    if (!std::filesystem::is_directory(std::filesystem::symlink_status(source, ec)))
    {
        return false;
    }

    const auto src = std::filesystem::weakly_canonical(source, ec);
    if (ec)
    {
        return false;
    }
    const auto dest = std::filesystem::weakly_canonical(destination, ec);
    if (ec)
    {
        return false;
    }

    // also true when both are the same directory
    const auto [src_it, dest_it] = std::mismatch(src.begin(), src.end(), dest.begin(), dest.end());
    return src_it == src.end();
}

std::expected<void, std::error_code>
do_copy(const std::filesystem::path& source, const std::filesystem::path& destination,
        bool top_level) noexcept;

std::expected<void, std::error_code>
do_copy_directory(const std::filesystem::path& source, const std::filesystem::path& destination,
                  bool top_level) noexcept
{
    std::error_code ec;
    const auto source_status = std::filesystem::status(source, ec);
    if (ec)
    {
        logger::error<logger::domain::vfs>("Accessing {}: {}", source.string(), ec.message());
        return std::unexpected(ec);
    }

    std::filesystem::create_directories(destination, ec);
    if (ec)
    {
        logger::error<logger::domain::vfs>("Creating Dir {}: {}",
                                           destination.string(),
                                           ec.message());
        return std::unexpected(ec);
    }

    for (auto it = std::filesystem::directory_iterator(source, ec);
         !ec && it != std::filesystem::directory_iterator();
         it.increment(ec))
    {
        const auto filename = it->path().filename();
        const auto result = do_copy(source / filename, destination / filename, false);
        if (!result)
        {
            logger::error<logger::domain::vfs>("File Copy failed {} -> {}",
                                               (source / filename).string(),
                                               (destination / filename).string());
            return result;
        }
    }
    if (ec)
    {
        logger::error<logger::domain::vfs>("Reading Dir {}: {}", source.string(), ec.message());
        return std::unexpected(ec);
    }

    // applied after the children are copied so a read only source still copies.
    // nested directories keep the default creation mode.
    if (top_level)
    {
        std::filesystem::permissions(destination, source_status.permissions(), ec);
        if (ec)
        {
            logger::error<logger::domain::vfs>("Chmod {}: {}", destination.string(), ec.message());
            return std::unexpected(ec);
        }
    }

    return {};
}

std::expected<void, std::error_code>
do_copy(const std::filesystem::path& source, const std::filesystem::path& destination,
        bool top_level) noexcept
{
    std::error_code ec;
    const auto file_status = std::filesystem::symlink_status(source, ec);
    if (ec)
    {
        logger::error<logger::domain::vfs>("Accessing {}: {}", source.string(), ec.message());
        return std::unexpected(ec);
    }

    if (std::filesystem::is_symlink(file_status))
    {
        return vfs::utils::copy_symlink(source, destination);
    }
    else if (std::filesystem::is_directory(file_status))
    {
        return do_copy_directory(source, destination, top_level);
    }
    else
    {
        return vfs::utils::copy_file(source, destination);
    }
}
} // namespace

std::expected<void, std::error_code>
vfs::utils::copy(const std::filesystem::path& source,
                 const std::filesystem::path& destination) noexcept
{
    logger::trace<logger::domain::vfs>("copy: {} -> {}", source.string(), destination.string());

    if (is_dest_in_src(source, destination))
    {
        logger::error<logger::domain::vfs>("Destination is inside the source directory: {} -> {}",
                                           source.string(),
                                           destination.string());
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    return do_copy(source, destination, true);
}

std::expected<void, std::error_code>
vfs::utils::copy_file(const std::filesystem::path& source,
                      const std::filesystem::path& destination) noexcept
{
    std::error_code ec;

    // if dest is a symlink, delete it first to prevent overwriting target
    if (std::filesystem::is_symlink(std::filesystem::symlink_status(destination, ec)))
    {
        std::filesystem::remove(destination, ec);
        if (ec)
        {
            logger::error<logger::domain::vfs>("Removing {}: {}",
                                               destination.string(),
                                               ec.message());
            return std::unexpected(ec);
        }
    }

    std::filesystem::copy_file(source,
                               destination,
                               std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec)
    {
        logger::error<logger::domain::vfs>("Copying {} -> {}: {}",
                                           source.string(),
                                           destination.string(),
                                           ec.message());
        return std::unexpected(ec);
    }

    const auto source_status = std::filesystem::status(source, ec);
    if (!ec)
    {
        std::filesystem::permissions(destination, source_status.permissions(), ec);
    }
    if (ec)
    {
        logger::error<logger::domain::vfs>("Chmod {}: {}", destination.string(), ec.message());
        return std::unexpected(ec);
    }

    return {};
}

std::expected<void, std::error_code>
vfs::utils::copy_directory(const std::filesystem::path& source,
                           const std::filesystem::path& destination) noexcept
{
    return do_copy_directory(source, destination, true);
}

std::expected<void, std::error_code>
vfs::utils::copy_symlink(const std::filesystem::path& source,
                         const std::filesystem::path& destination) noexcept
{
    std::error_code ec;
    const auto target = std::filesystem::read_symlink(source, ec);
    if (ec)
    {
        logger::error<logger::domain::vfs>("Reading Link {}: {}", source.string(), ec.message());
        return std::unexpected(ec);
    }

    // delete it first to prevent exists error
    const auto dest_status = std::filesystem::symlink_status(destination, ec);
    if (std::filesystem::exists(dest_status) && !std::filesystem::is_directory(dest_status))
    {
        std::filesystem::remove(destination, ec);
        if (ec)
        {
            logger::error<logger::domain::vfs>("Removing {}: {}",
                                               destination.string(),
                                               ec.message());
            return std::unexpected(ec);
        }
    }

    std::filesystem::create_symlink(target, destination, ec);
    if (ec)
    {
        logger::error<logger::domain::vfs>("Creating Link {}: {}",
                                           destination.string(),
                                           ec.message());
        return std::unexpected(ec);
    }

    return {};
}

std::expected<void, std::error_code>
vfs::utils::move(const std::filesystem::path& source,
                 const std::filesystem::path& destination) noexcept
{
    logger::trace<logger::domain::vfs>("move: {} -> {}", source.string(), destination.string());

    std::error_code ec;
    std::filesystem::rename(source, destination, ec);
    if (ec)
    {
        logger::error<logger::domain::vfs>("Renaming {} -> {}: {}",
                                           source.string(),
                                           destination.string(),
                                           ec.message());
        return std::unexpected(ec);
    }

    return {};
}
