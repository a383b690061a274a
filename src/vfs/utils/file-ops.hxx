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
#include <system_error>

namespace vfs::utils
{
/**
 * @brief Copy a file, directory or symlink.
 *
 * - symlink, recreated with the same target, the target is not followed
 * - directory, copied recursively and merged into an existing destination,
 *   only the top level directory keeps the source permission bits
 * - everything else, byte copy that keeps the source permission bits
 *
 * The copy stops at the first failure, anything copied so far is left in
 * place.
 */
[[nodiscard]] std::expected<void, std::error_code>
copy(const std::filesystem::path& source, const std::filesystem::path& destination) noexcept;

[[nodiscard]] std::expected<void, std::error_code>
copy_file(const std::filesystem::path& source, const std::filesystem::path& destination) noexcept;

[[nodiscard]] std::expected<void, std::error_code>
copy_directory(const std::filesystem::path& source,
               const std::filesystem::path& destination) noexcept;

[[nodiscard]] std::expected<void, std::error_code>
copy_symlink(const std::filesystem::path& source,
             const std::filesystem::path& destination) noexcept;

/**
 * @brief rename(2), cross device moves fail with EXDEV
 */
[[nodiscard]] std::expected<void, std::error_code>
move(const std::filesystem::path& source, const std::filesystem::path& destination) noexcept;
} // namespace vfs::utils
