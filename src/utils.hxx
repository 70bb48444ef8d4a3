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

#include <string>
#include <string_view>

#include <filesystem>

#include <set>

#include <ztd/ztd.hxx>

struct split_basename_extension_data
{
    std::string basename{};
    std::string extension{};
    bool is_multipart_extension{false};
};

/**
 * Split a filename into its basename and extension,
 * unlike using std::filesystem::path::filename/std::filesystem::path::extension
 * this will support multi part extensions such as .tar.gz,.tar.zst,etc..
 * will not set an extension if the filename is a directory.
 */
const split_basename_extension_data
split_basename_extension(const std::filesystem::path& filename) noexcept;

/**
 * First of 'path', 'name_1.ext', 'name_2.ext', ... that does not exist
 * and is not in 'reserved'. Broken symlinks count as existing.
 */
const std::filesystem::path unique_path(const std::filesystem::path& path,
                                        const std::set<std::filesystem::path>& reserved = {}) noexcept;

bool have_rw_access(const std::filesystem::path& path) noexcept;

// 'path' is 'dir' or somewhere below it, both must exist
bool is_path_inside(const std::filesystem::path& path, const std::filesystem::path& dir) noexcept;

// errno values that may clear up if the same operation is tried again
bool is_transient_error(i32 errnox) noexcept;
