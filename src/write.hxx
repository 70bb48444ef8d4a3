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

#include <format>

#include <filesystem>

#include <fstream>

#include <system_error>

#include <unistd.h>

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

// The data is written next to 'path' and renamed over it,
// readers never see a half written file.
template<class T>
bool
write_file(const std::filesystem::path& path, const T& data)
{
    const auto tmp_path =
        path.parent_path() / std::format(".{}.{}.tmp", path.filename().string(), getpid());

    std::ofstream file(tmp_path);
    if (!file.is_open())
    {
        ztd::logger::error("Failed to open file: {}", tmp_path.string());
        return false;
    }

    file << data;

    if (file.fail())
    {
        ztd::logger::error("Failed to write file: {}", tmp_path.string());
        file.close();
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return false;
    }

    file.close();

    if (file.fail())
    {
        ztd::logger::error("Failed to close file: {}", tmp_path.string());
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec)
    {
        ztd::logger::error("Failed to replace file: {} {}", path.string(), ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }

    return true;
}
