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

#include <string>

#include <system_error>

#include "clipboard/error.hxx"

const std::error_category&
clipboard::error_category() noexcept
{
    struct category final : std::error_category
    {
        const char*
        name() const noexcept override final
        {
            return "clipboard::error_category()";
        }

        std::string
        message(int c) const override final
        {
            switch (static_cast<clipboard::error_code>(c))
            {
                case clipboard::error_code::none:
                    return "no error";
                case clipboard::error_code::not_found:
                    return "no such file or directory";
                case clipboard::error_code::permission_denied:
                    return "no read permission";
                case clipboard::error_code::empty_clipboard:
                    return "clipboard is empty";
                case clipboard::error_code::stale_entry:
                    return "source path no longer exists";
                case clipboard::error_code::invalid_index:
                    return "invalid clipboard index";
                case clipboard::error_code::parse_error:
                    return "clipboard store parse error";
                case clipboard::error_code::write_failure:
                    return "clipboard store write failure";
                default:
                    return "unknown error";
            }
        }
    };
    static const category instance{};
    return instance;
}
