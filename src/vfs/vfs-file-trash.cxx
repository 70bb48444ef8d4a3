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

#include <memory>

#include <mutex>

#include <chrono>

#include <system_error>

#include <cerrno>

#include <unistd.h>

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "write.hxx"
#include "utils.hxx"

#include "vfs/vfs-file-trash.hxx"

VFSTrash::VFSTrash(const std::filesystem::path& home_trash) noexcept : home_trash_(home_trash)
{
    // the home trash may not exist yet, use the mount it will be created on
    std::filesystem::path existing = home_trash;
    std::error_code ec;
    while (!std::filesystem::exists(existing, ec) && existing.has_parent_path() &&
           existing != existing.parent_path())
    {
        existing = existing.parent_path();
    }

    const auto home_id = mount_id(existing);
    this->trash_dirs_[home_id] = std::make_shared<VFSTrashDir>(home_trash);
}

u64
VFSTrash::mount_id(const std::filesystem::path& path) noexcept
{
    return ztd::statx(path, ztd::statx::symlink::no_follow).mount_id();
}

const std::filesystem::path
VFSTrash::toplevel(const std::filesystem::path& path) noexcept
{
    const auto id = mount_id(path);

    std::filesystem::path mount_path = path;
    std::filesystem::path last_path;

    // walk up the path until it gets to the root of the device
    while (mount_id(mount_path) == id)
    {
        last_path = mount_path;
        if (mount_path == mount_path.parent_path())
        {
            break;
        }
        mount_path = mount_path.parent_path();
    }

    return last_path;
}

std::shared_ptr<VFSTrashDir>
VFSTrash::trash_dir(const std::filesystem::path& path) noexcept
{
    const auto id = mount_id(path.parent_path());

    if (this->trash_dirs_.contains(id))
    {
        return this->trash_dirs_[id];
    }

    // path on another device, cannot use $HOME trashcan
    const std::filesystem::path top_dir = toplevel(path.parent_path());
    const std::filesystem::path trash_path =
        std::format("{}/.Trash-{}", top_dir.string(), getuid());

    ztd::logger::debug("Using trash dir {} for {}", trash_path.string(), path.string());

    auto trash_dir = std::make_shared<VFSTrashDir>(trash_path);
    this->trash_dirs_[id] = trash_dir;

    return trash_dir;
}

bool
VFSTrash::is_trash_dir(const std::filesystem::path& path) noexcept
{
    const std::string check = path.lexically_normal().string();
    if (!ztd::contains(check, "Trash"))
    {
        return false;
    }

    const std::string user_trash = std::format("/.Trash-{}", getuid());
    for (const std::string_view trash : {std::string_view("/Trash"), std::string_view(user_trash)})
    {
        if (check.ends_with(trash) || check.ends_with(std::format("{}/files", trash)) ||
            check.ends_with(std::format("{}/info", trash)))
        {
            return true;
        }
    }
    return false;
}

bool
VFSTrash::trash(const std::filesystem::path& path, std::error_code& ec) noexcept
{
    ec.clear();

    if (is_trash_dir(path))
    {
        ztd::logger::warn("Refusing to trash the Trash Dir: {}", path.string());
        ec = std::make_error_code(std::errc::operation_not_permitted);
        return false;
    }

    // unique_name() and move() must not interleave between tasks
    std::scoped_lock lock(this->mutex_);

    const auto trash_dir = this->trash_dir(path);
    if (!trash_dir)
    {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return false;
    }

    if (!trash_dir->create_trash_dir(ec))
    {
        return false;
    }

    const std::string target_name = trash_dir->unique_name(path);
    if (!trash_dir->create_trash_info(path, target_name))
    {
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }
    if (!trash_dir->move(path, target_name, ec))
    {
        trash_dir->remove_trash_info(target_name);
        return false;
    }

    ztd::logger::debug("moved to trash: {}", path.string());

    return true;
}

VFSTrashDir::VFSTrashDir(const std::filesystem::path& path) noexcept
{
    this->trash_path_ = path;
    this->files_path_ = this->trash_path_ / "files";
    this->info_path_ = this->trash_path_ / "info";
}

const std::filesystem::path&
VFSTrashDir::path() const noexcept
{
    return this->trash_path_;
}

// an entry that cannot be checked counts as free, creating it will report the error
static bool
name_in_use(const std::filesystem::path& path) noexcept
{
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

const std::string
VFSTrashDir::unique_name(const std::filesystem::path& path) const noexcept
{
    const std::string filename = path.filename();

    if (!name_in_use(this->files_path_ / filename) &&
        !name_in_use(this->info_path_ / std::format("{}.trashinfo", filename)))
    {
        return filename;
    }

    // foo.tar.gz -> foo_1.tar.gz
    const auto parts = split_basename_extension(filename);
    for (usize i = 1; true; ++i)
    {
        const std::string check_filename =
            parts.extension.empty() ? std::format("{}_{}", parts.basename, i)
                                    : std::format("{}_{}.{}", parts.basename, i, parts.extension);
        if (!name_in_use(this->files_path_ / check_filename) &&
            !name_in_use(this->info_path_ / std::format("{}.trashinfo", check_filename)))
        {
            return check_filename;
        }
    }
}

bool
VFSTrashDir::check_dir_exists(const std::filesystem::path& path, std::error_code& ec) noexcept
{
    if (std::filesystem::is_directory(path, ec))
    {
        return true;
    }

    std::filesystem::create_directories(path, ec);
    if (ec)
    {
        ztd::logger::error("Failed to create trash dir {}: {}", path.string(), ec.message());
        return false;
    }
    std::filesystem::permissions(path, std::filesystem::perms::owner_all, ec);
    return !ec;
}

bool
VFSTrashDir::create_trash_dir(std::error_code& ec) const noexcept
{
    return this->check_dir_exists(this->trash_path_, ec) &&
           this->check_dir_exists(this->files_path_, ec) &&
           this->check_dir_exists(this->info_path_, ec);
}

const std::string
VFSTrashDir::create_trash_date(const std::time_t time) noexcept
{
    const auto point = std::chrono::system_clock::from_time_t(time);

    const auto date = std::chrono::floor<std::chrono::days>(point);

    const auto midnight = point - std::chrono::floor<std::chrono::days>(point);
    const auto hours = std::chrono::duration_cast<std::chrono::hours>(midnight);
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(midnight - hours);
    const auto seconds =
        std::chrono::duration_cast<std::chrono::seconds>(midnight - hours - minutes);

    return std::format("{0:%Y-%m-%d}T{1:%H}:{2:%M}:{3:%S}", date, hours, minutes, seconds);
}

bool
VFSTrashDir::create_trash_info(const std::filesystem::path& path,
                               const std::string_view target_name) const noexcept
{
    const auto trash_info = this->info_path_ / std::format("{}.trashinfo", target_name);

    const auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const auto iso_time = create_trash_date(time);

    const std::string trash_info_content =
        std::format("[Trash Info]\nPath={}\nDeletionDate={}\n", path.string(), iso_time);

    return write_file(trash_info, trash_info_content);
}

void
VFSTrashDir::remove_trash_info(const std::string_view target_name) const noexcept
{
    std::error_code ec;
    std::filesystem::remove(this->info_path_ / std::format("{}.trashinfo", target_name), ec);
}

bool
VFSTrashDir::move(const std::filesystem::path& path, const std::string_view target_name,
                  std::error_code& ec) const noexcept
{
    const auto target_path = this->files_path_ / target_name;

    std::filesystem::rename(path, target_path, ec);
    if (ec)
    {
        ztd::logger::error("Failed to move {} to the trash: {}", path.string(), ec.message());
        return false;
    }
    return true;
}
