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
#include <string_view>

#include <format>

#include <filesystem>

#include <system_error>

#include <cerrno>

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "utils.hxx"

bool
have_rw_access(const std::filesystem::path& path) noexcept
{
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec)
    {
        return false;
    }

    return ((status.permissions() & std::filesystem::perms::owner_read) !=
                std::filesystem::perms::none &&
            (status.permissions() & std::filesystem::perms::owner_write) !=
                std::filesystem::perms::none) ||

           ((status.permissions() & std::filesystem::perms::group_read) !=
                std::filesystem::perms::none &&
            (status.permissions() & std::filesystem::perms::group_write) !=
                std::filesystem::perms::none) ||

           ((status.permissions() & std::filesystem::perms::others_read) !=
                std::filesystem::perms::none &&
            (status.permissions() & std::filesystem::perms::others_write) !=
                std::filesystem::perms::none);
}

const split_basename_extension_data
split_basename_extension(const std::filesystem::path& filename) noexcept
{
    std::error_code ec;
    if (std::filesystem::is_directory(filename, ec))
    {
        return {filename.string()};
    }

    // Find the last dot in the filename
    const auto dot_pos = filename.string().find_last_of('.');

    // Check if the dot is not at the beginning or end of the filename
    if (dot_pos != std::string::npos && dot_pos != 0 && dot_pos != filename.string().length() - 1)
    {
        const auto split = ztd::rpartition(filename.string(), ".");

        // Check if the extension is a compressed tar archive
        if (ztd::endswith(split[0], ".tar"))
        {
            // Find the second last dot in the filename
            const auto split_second = ztd::rpartition(split[0], ".");

            return {split_second[0], std::format("{}.{}", split_second[2], split[2]), true};
        }
        else
        {
            // Return the basename and the extension
            return {split[0], split[2]};
        }
    }

    // No valid extension found, return the whole filename as the basename
    return {filename.string()};
}

static bool
path_exists(const std::filesystem::path& path) noexcept
{
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

const std::filesystem::path
unique_path(const std::filesystem::path& path,
            const std::set<std::filesystem::path>& reserved) noexcept
{
    const auto is_taken = [&reserved](const std::filesystem::path& check_path)
    { return reserved.contains(check_path) || path_exists(check_path); };

    if (!is_taken(path))
    {
        return path;
    }

    const auto parent = path.parent_path();

    // only split the last component, a dot in a parent dir is not an extension
    split_basename_extension_data parts{path.filename().string()};
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec))
    {
        parts = split_basename_extension(path.filename());
    }

    for (usize i = 1; true; ++i)
    {
        const std::string name = parts.extension.empty()
                                     ? std::format("{}_{}", parts.basename, i)
                                     : std::format("{}_{}.{}", parts.basename, i, parts.extension);
        const auto check_path = parent / name;
        if (!is_taken(check_path))
        {
            return check_path;
        }
    }
}

bool
is_path_inside(const std::filesystem::path& path, const std::filesystem::path& dir) noexcept
{
    std::error_code ec;
    const auto real_path = std::filesystem::weakly_canonical(path, ec);
    if (ec)
    {
        return false;
    }
    const auto real_dir = std::filesystem::weakly_canonical(dir, ec);
    if (ec)
    {
        return false;
    }

    // Need to have the + '/' to avoid matching './new2' against './new'
    return ztd::startswith(real_path.string() + '/', real_dir.string() + '/');
}

bool
is_transient_error(i32 errnox) noexcept
{
    switch (errnox)
    {
        case EAGAIN:
#if EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
        case EBUSY:
        case EINTR:
        case ETIMEDOUT:
        case ENOLCK:
            return true;
        default:
            return false;
    }
}
