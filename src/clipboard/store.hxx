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

#include "clipboard/entry.hxx"

namespace clipboard
{
/**
 * @brief Handle to the persisted clipboard.
 *
 * The store file is the single source of truth. Every operation reads the
 * whole file and, when it mutates anything, writes the whole file back.
 * There is no locking, concurrent invocations against the same file can
 * lose updates.
 */
class store final
{
  public:
    explicit store(const std::filesystem::path& path) noexcept;

    /**
     * @brief store at the default location, $HOME/.cx_clipboard.json
     */
    [[nodiscard]] static store create() noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept;

    /**
     * @brief Create the store with an empty clipboard if it does not exist.
     *
     * @return the store path
     */
    [[nodiscard]] std::expected<std::filesystem::path, std::error_code> ensure() const noexcept;

    [[nodiscard]] std::expected<clipboard_data, std::error_code> read() const noexcept;

    [[nodiscard]] std::expected<void, std::error_code>
    write(const clipboard_data& data) const noexcept;

  private:
    std::filesystem::path file_;
};
} // namespace clipboard
