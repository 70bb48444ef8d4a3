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

#include <filesystem>

#include <memory>

#include <glibmm.h>

struct VFSUserDirs
{
  public:
    // $XDG_DATA_HOME/Trash
    const std::filesystem::path trash_dir() const noexcept;

    // $XDG_CONFIG_HOME/taskfm/taskfm.toml
    const std::filesystem::path config_file() const noexcept;

  private:
    // User
    const std::filesystem::path user_data{Glib::get_user_data_dir()};
    const std::filesystem::path user_config{Glib::get_user_config_dir()};

    // Program config dir
    const std::filesystem::path program_config{this->user_config / PACKAGE_NAME};
};

namespace vfs
{
    using user_dirs_t = std::unique_ptr<VFSUserDirs>;

    const extern user_dirs_t user_dirs;
} // namespace vfs
