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

#include <format>

#include <filesystem>

#include <memory>

#include "vfs/vfs-user-dirs.hxx"

const vfs::user_dirs_t vfs::user_dirs = std::make_unique<VFSUserDirs>();

const std::filesystem::path
VFSUserDirs::trash_dir() const noexcept
{
    return this->user_data / "Trash";
}

const std::filesystem::path
VFSUserDirs::config_file() const noexcept
{
    return this->program_config / std::format("{}.toml", PACKAGE_NAME);
}
