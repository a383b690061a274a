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
#include <vector>

#include <cstddef>

#include "clipboard/entry.hxx"
#include "clipboard/store.hxx"

namespace clipboard
{
struct paste_result final
{
    std::filesystem::path source;
    std::filesystem::path destination;
    clipboard::mode mode;
};

/**
 * @brief Record a path, nothing on disk is touched.
 *
 * @return the absolute path that was recorded
 */
[[nodiscard]] std::expected<std::filesystem::path, std::error_code>
cut(const store& store, const std::filesystem::path& path) noexcept;

/**
 * @brief Paste the most recent entry into the current directory, or into
 * directory.
 *
 * move, the item is renamed into place and the entry is removed.
 * copy, the item is copied and the entry now points at the copy.
 */
[[nodiscard]] std::expected<paste_result, std::error_code> paste(const store& store,
                                                                 clipboard::mode mode) noexcept;
[[nodiscard]] std::expected<paste_result, std::error_code>
paste(const store& store, clipboard::mode mode, const std::filesystem::path& directory) noexcept;

[[nodiscard]] std::expected<paste_result, std::error_code>
paste_at(const store& store, std::size_t index, clipboard::mode mode) noexcept;
[[nodiscard]] std::expected<paste_result, std::error_code>
paste_at(const store& store, std::size_t index, clipboard::mode mode,
         const std::filesystem::path& directory) noexcept;

[[nodiscard]] std::expected<void, std::error_code> remove(const store& store,
                                                          std::size_t index) noexcept;

[[nodiscard]] std::expected<std::vector<entry>, std::error_code>
list(const store& store) noexcept;

[[nodiscard]] std::expected<void, std::error_code> clear(const store& store) noexcept;
} // namespace clipboard
