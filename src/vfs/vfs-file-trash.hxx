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

#include <map>

#include <memory>

#include <mutex>

#include <system_error>

#include <ztd/ztd.hxx>

// trash directories. There might be several on a system:
//
// One in $XDG_DATA_HOME/Trash or ~/.local/share/Trash
// if $XDG_DATA_HOME is not set
//
// Every mountpoint will get a trash directory at $TOPLEVEL/.Trash-$UID.
class VFSTrashDir
{
  public:
    VFSTrashDir(const std::filesystem::path& path) noexcept;
    ~VFSTrashDir() = default;

    const std::filesystem::path& path() const noexcept;

    // Get a unique name for use within the trash directory
    const std::string unique_name(const std::filesystem::path& path) const noexcept;

    // Create the trash directory and subdirectories if they do not exist.
    bool create_trash_dir(std::error_code& ec) const noexcept;

    // Create a .trashinfo file for a file or directory 'path'
    bool create_trash_info(const std::filesystem::path& path,
                           const std::string_view target_name) const noexcept;
    void remove_trash_info(const std::string_view target_name) const noexcept;

    // Move a file or directory into the trash directory
    bool move(const std::filesystem::path& path, const std::string_view target_name,
              std::error_code& ec) const noexcept;

  private:
    static const std::string create_trash_date(const std::time_t time) noexcept;

    // Create a directory if it does not exist
    static bool check_dir_exists(const std::filesystem::path& dir, std::error_code& ec) noexcept;

    // the full path for this trash directory
    std::filesystem::path trash_path_{};
    // the path of the "files" subdirectory of this trash dir
    std::filesystem::path files_path_{};
    // the path of the "info" subdirectory of this trash dir
    std::filesystem::path info_path_{};
};

// This class implements some of the XDG Trash specification:
//
// https://standards.freedesktop.org/trash-spec/trashspec-1.0.html
class VFSTrash
{
  public:
    // 'home_trash' is used for every path on the same mount as it
    explicit VFSTrash(const std::filesystem::path& home_trash) noexcept;
    ~VFSTrash() = default;

    VFSTrash(const VFSTrash&) = delete;
    VFSTrash& operator=(const VFSTrash&) = delete;

    // Move a file or directory into the trash.
    // Trash directories themselves are refused with EPERM.
    bool trash(const std::filesystem::path& path, std::error_code& ec) noexcept;

    // True if 'path' is a trash dir or one of its files/info subdirectories
    static bool is_trash_dir(const std::filesystem::path& path) noexcept;

  private:
    // return the mount point id for the file or directory
    static u64 mount_id(const std::filesystem::path& path) noexcept;

    // Find the toplevel directory (mount point) for the device that 'path' is on.
    static const std::filesystem::path toplevel(const std::filesystem::path& path) noexcept;

    // Return the trash dir to use for 'path'.
    std::shared_ptr<VFSTrashDir> trash_dir(const std::filesystem::path& path) noexcept;

    std::filesystem::path home_trash_;

    // Data Members
    std::map<u64, std::shared_ptr<VFSTrashDir>> trash_dirs_;
    std::mutex mutex_;

}; // class VFSTrash
