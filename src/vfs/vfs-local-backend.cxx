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

#include <vector>

#include <optional>

#include <mutex>

#include <algorithm>

#include <system_error>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <stdio.h>
#include <utime.h>
#include <sys/stat.h>
#include <unistd.h>

#include <magic_enum.hpp>

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "utils.hxx"

#include "vfs/vfs-local-backend.hxx"

// closes the descriptor when it goes out of scope
struct scoped_fd
{
    explicit scoped_fd(i32 fd) noexcept : fd(fd)
    {
    }

    ~scoped_fd()
    {
        if (this->fd >= 0)
        {
            close(this->fd);
        }
    }

    scoped_fd(const scoped_fd&) = delete;
    scoped_fd& operator=(const scoped_fd&) = delete;

    i32 fd;
};

void
vfs_task_error(i32 errnox, const std::string_view action, const std::filesystem::path& path)
{
    const std::string msg =
        std::format("{} '{}': {}", action, path.string(), std::strerror(errnox));

    if (is_transient_error(errnox))
    {
        throw VFSTaskRetryableError(msg, errnox);
    }
    throw VFSTaskFatalError(msg, errnox);
}

u64
vfs_total_size(const std::filesystem::path& path) noexcept
{
    const auto file_stat = ztd::statx(path, ztd::statx::symlink::no_follow);
    if (!file_stat)
    {
        return 0;
    }

    // Do not follow symlinks
    if (file_stat.is_symlink())
    {
        return 0;
    }
    if (!file_stat.is_directory())
    {
        return file_stat.is_regular_file() ? file_stat.size() : 0;
    }

    u64 size = 0;
    std::error_code ec;
    for (const auto& file : std::filesystem::directory_iterator(path, ec))
    {
        size += vfs_total_size(file.path());
    }
    return size;
}

// directory entries in name order, plans are reproducible
static const std::vector<std::filesystem::path>
list_dir(const std::filesystem::path& path)
{
    std::vector<std::filesystem::path> entries;

    std::error_code ec;
    for (const auto& file : std::filesystem::directory_iterator(path, ec))
    {
        entries.emplace_back(file.path());
    }
    if (ec)
    {
        vfs_task_error(ec.value(), "Reading Dir", path);
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

static bool
path_exists(const std::filesystem::path& path) noexcept
{
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

vfs::local_backend::local_backend(u64 chunk_size, const std::filesystem::path& home_trash)
    : chunk_size_(chunk_size == 0 ? 8 * MiB : chunk_size), trash_(home_trash)
{
}

u64
vfs::local_backend::chunk_size() const noexcept
{
    return this->chunk_size_;
}

std::vector<vfs::file_task_unit>
vfs::local_backend::plan(vfs::file_task_type type, const vfs::file_task_path& path,
                         const vfs::file_task_options& options,
                         vfs::file_task_claims& claims)
{
    const auto source = std::filesystem::absolute(path.source).lexically_normal();
    const auto target = path.target.empty()
                            ? path.target
                            : std::filesystem::absolute(path.target).lexically_normal();

    std::vector<vfs::file_task_unit> units;
    switch (type)
    {
        case vfs::file_task_type::copy:
            units = this->plan_copy(source, target, options, claims);
            break;
        case vfs::file_task_type::move:
            units = this->plan_move(source, target, options, claims);
            break;
        case vfs::file_task_type::DELETE:
            units = this->plan_delete(source);
            break;
        case vfs::file_task_type::trash:
            units = this->plan_trash(source);
            break;
        case vfs::file_task_type::link:
            units = this->plan_link(source, target, options, claims);
            break;
    }

    ztd::logger::debug("planned {} {}: {} units",
                       vfs::file_task_type_name(type),
                       source.string(),
                       units.size());

    return units;
}

std::optional<std::filesystem::path>
vfs::local_backend::resolve_target(const std::filesystem::path& source,
                                   const std::filesystem::path& target,
                                   vfs::file_task_overwrite_mode mode,
                                   const vfs::file_task_claims& claims, bool& replace) const
{
    replace = false;

    const bool claimed = claims.contains(target);
    if (!claimed && !path_exists(target))
    {
        return target;
    }

    std::error_code ec;
    if (source == target || std::filesystem::equivalent(source, target, ec))
    {
        if (mode == vfs::file_task_overwrite_mode::auto_rename)
        {
            return unique_path(target, claims);
        }
        throw VFSTaskFatalError(
            std::format("Source and destination are the same file '{}'", target.string()),
            EINVAL);
    }

    switch (mode)
    {
        case vfs::file_task_overwrite_mode::fail:
            if (claimed)
            {
                throw VFSTaskFatalError(
                    std::format("Destination used twice in one task '{}'", target.string()),
                    EEXIST);
            }
            throw VFSTaskFatalError(std::format("Destination exists '{}'", target.string()),
                                    EEXIST);
        case vfs::file_task_overwrite_mode::skip:
            ztd::logger::info("Skipping existing '{}'", target.string());
            return std::nullopt;
        case vfs::file_task_overwrite_mode::overwrite:
            replace = true;
            return target;
        case vfs::file_task_overwrite_mode::auto_rename:
            return unique_path(target, claims);
    }
    return std::nullopt;
}

void
vfs::local_backend::check_dest_in_src(const std::filesystem::path& source,
                                      const std::filesystem::path& target) const
{
    if (!is_path_inside(target, source))
    {
        return;
    }

    // source is contained in destination dir
    throw VFSTaskFatalError(std::format("Destination directory '{}' is contained in source '{}'",
                                        target.string(),
                                        source.string()),
                            EINVAL);
}

/////////////////////////////////////////////////////////////////////////////////////////
// planning

std::vector<vfs::file_task_unit>
vfs::local_backend::plan_copy(const std::filesystem::path& source,
                              const std::filesystem::path& target,
                              const vfs::file_task_options& options,
                              vfs::file_task_claims& claims)
{
    const auto file_stat = ztd::statx(source, ztd::statx::symlink::no_follow);
    if (!file_stat)
    {
        vfs_task_error(errno, "Accessing", source);
    }

    bool replace = false;
    const auto actual_target =
        this->resolve_target(source, target, options.overwrite_mode, claims, replace);
    if (!actual_target)
    {
        return {};
    }

    if (file_stat.is_directory())
    {
        this->check_dest_in_src(source, actual_target.value());
    }

    std::vector<vfs::file_task_unit> units;
    this->plan_copy_tree(source, actual_target.value(), replace, units);
    claims.insert(actual_target.value());
    return units;
}

void
vfs::local_backend::plan_copy_tree(const std::filesystem::path& source,
                                   const std::filesystem::path& target, bool replace,
                                   std::vector<vfs::file_task_unit>& units)
{
    const auto file_stat = ztd::statx(source, ztd::statx::symlink::no_follow);
    if (!file_stat)
    {
        vfs_task_error(errno, "Accessing", source);
    }

    if (file_stat.is_symlink())
    {
        std::error_code ec;
        const auto link_target = std::filesystem::read_symlink(source, ec);
        if (ec)
        {
            vfs_task_error(ec.value(), "Reading Link", source);
        }

        units.push_back({.type = vfs::file_task_unit_type::copy_symlink,
                         .source = source,
                         .target = target,
                         .items = 1,
                         .replace = replace,
                         .link_target = link_target});
    }
    else if (file_stat.is_directory())
    {
        units.push_back({.type = vfs::file_task_unit_type::make_dir,
                         .source = source,
                         .target = target,
                         .items = 1,
                         .replace = replace});

        // merging into a directory replaces the entries it has when they are copied,
        // it may be created by an earlier path of the same task
        for (const auto& sub_src_file : list_dir(source))
        {
            this->plan_copy_tree(sub_src_file, target / sub_src_file.filename(), replace, units);
        }

        units.push_back({.type = vfs::file_task_unit_type::finish_dir,
                         .source = source,
                         .target = target});
    }
    else if (file_stat.is_regular_file())
    {
        this->plan_copy_file(source, target, file_stat.size(), replace, units);
    }
    else
    {
        ztd::logger::warn("Not copying special file '{}'", source.string());
    }
}

void
vfs::local_backend::plan_copy_file(const std::filesystem::path& source,
                                   const std::filesystem::path& target, u64 size, bool replace,
                                   std::vector<vfs::file_task_unit>& units) const
{
    if (size == 0)
    {
        units.push_back({.type = vfs::file_task_unit_type::copy_chunk,
                         .source = source,
                         .target = target,
                         .items = 1,
                         .replace = replace});
        return;
    }

    for (u64 offset = 0; offset < size; offset += this->chunk_size_)
    {
        const u64 length = std::min(this->chunk_size_, size - offset);
        const bool last_chunk = offset + length >= size;

        units.push_back({.type = vfs::file_task_unit_type::copy_chunk,
                         .source = source,
                         .target = target,
                         .offset = offset,
                         .file_size = size,
                         .length = length,
                         .items = last_chunk ? 1u : 0u,
                         .replace = replace && offset == 0});
    }
}

std::vector<vfs::file_task_unit>
vfs::local_backend::plan_move(const std::filesystem::path& source,
                              const std::filesystem::path& target,
                              const vfs::file_task_options& options,
                              vfs::file_task_claims& claims)
{
    const auto src_stat = ztd::statx(source, ztd::statx::symlink::no_follow);
    if (!src_stat)
    {
        vfs_task_error(errno, "Accessing", source);
    }
    const auto dest_stat = ztd::statx(target.parent_path());
    if (!dest_stat)
    {
        vfs_task_error(errno, "Accessing", target.parent_path());
    }

    bool replace = false;
    const auto actual_target =
        this->resolve_target(source, target, options.overwrite_mode, claims, replace);
    if (!actual_target)
    {
        return {};
    }

    if (src_stat.is_directory())
    {
        this->check_dest_in_src(source, actual_target.value());
    }

    std::vector<vfs::file_task_unit> units;

    /* Not on the same device */
    if (src_stat.dev() != dest_stat.dev())
    {
        ztd::logger::debug("not on the same dev: {}", source.string());

        this->plan_copy_tree(source, actual_target.value(), replace, units);

        // Move files to different device: Need to delete source files
        if (src_stat.is_directory())
        {
            units.push_back({.type = vfs::file_task_unit_type::cleanup_dir, .source = source});
        }
        else
        {
            units.push_back({.type = vfs::file_task_unit_type::remove, .source = source});
        }
        claims.insert(actual_target.value());
        return units;
    }

    this->plan_move_tree(source, actual_target.value(), replace, units);
    claims.insert(actual_target.value());
    return units;
}

void
vfs::local_backend::plan_move_tree(const std::filesystem::path& source,
                                   const std::filesystem::path& target, bool replace,
                                   std::vector<vfs::file_task_unit>& units)
{
    std::error_code ec;
    const bool merge = replace &&
                       std::filesystem::is_directory(std::filesystem::symlink_status(source, ec)) &&
                       std::filesystem::is_directory(std::filesystem::symlink_status(target, ec));

    if (!merge)
    {
        units.push_back({.type = vfs::file_task_unit_type::rename,
                         .source = source,
                         .target = target,
                         .length = vfs_total_size(source),
                         .items = 1,
                         .replace = replace});
        return;
    }

    // moving a directory onto a directory that exists
    for (const auto& sub_src_file : list_dir(source))
    {
        const auto sub_dest_file = target / sub_src_file.filename();
        this->plan_move_tree(sub_src_file, sub_dest_file, path_exists(sub_dest_file), units);
    }

    // remove moved src dir, empty by now
    units.push_back({.type = vfs::file_task_unit_type::remove_dir, .source = source, .items = 1});
}

std::vector<vfs::file_task_unit>
vfs::local_backend::plan_delete(const std::filesystem::path& source)
{
    const auto file_stat = ztd::statx(source, ztd::statx::symlink::no_follow);
    if (!file_stat)
    {
        vfs_task_error(errno, "Accessing", source);
    }

    std::vector<vfs::file_task_unit> units;
    this->plan_delete_tree(source, units);
    return units;
}

void
vfs::local_backend::plan_delete_tree(const std::filesystem::path& source,
                                     std::vector<vfs::file_task_unit>& units)
{
    const auto file_stat = ztd::statx(source, ztd::statx::symlink::no_follow);
    if (!file_stat)
    {
        vfs_task_error(errno, "Accessing", source);
    }

    if (file_stat.is_directory() && !file_stat.is_symlink())
    {
        for (const auto& sub_src_file : list_dir(source))
        {
            this->plan_delete_tree(sub_src_file, units);
        }
        units.push_back({.type = vfs::file_task_unit_type::remove_dir, .source = source, .items = 1});
        return;
    }

    units.push_back({.type = vfs::file_task_unit_type::remove,
                     .source = source,
                     .length = file_stat.is_regular_file() ? file_stat.size() : 0,
                     .items = 1});
}

std::vector<vfs::file_task_unit>
vfs::local_backend::plan_trash(const std::filesystem::path& source)
{
    const auto file_stat = ztd::statx(source, ztd::statx::symlink::no_follow);
    if (!file_stat)
    {
        vfs_task_error(errno, "Accessing", source);
    }

    if (VFSTrash::is_trash_dir(source))
    {
        throw VFSTaskFatalError(std::format("Refusing to trash the Trash Dir '{}'", source.string()),
                                EPERM);
    }

    if (!have_rw_access(source))
    {
        throw VFSTaskFatalError(
            std::format("Trashing failed missing RW permissions '{}'", source.string()),
            EACCES);
    }

    return {{.type = vfs::file_task_unit_type::trash,
             .source = source,
             .length = vfs_total_size(source),
             .items = 1}};
}

std::vector<vfs::file_task_unit>
vfs::local_backend::plan_link(const std::filesystem::path& source,
                              const std::filesystem::path& target,
                              const vfs::file_task_options& options,
                              vfs::file_task_claims& claims)
{
    // MOD allow link to broken symlink
    if (!path_exists(source))
    {
        vfs_task_error(ENOENT, "Accessing", source);
    }

    bool replace = false;
    const auto actual_target =
        this->resolve_target(source, target, options.overwrite_mode, claims, replace);
    if (!actual_target)
    {
        return {};
    }

    std::filesystem::path link_target = source;
    if (options.relative_links)
    {
        const auto relative = source.lexically_relative(actual_target->parent_path());
        if (!relative.empty())
        {
            link_target = relative;
        }
    }

    claims.insert(actual_target.value());
    return {{.type = vfs::file_task_unit_type::symlink,
             .source = source,
             .target = actual_target.value(),
             .items = 1,
             .replace = replace,
             .link_target = link_target}};
}

/////////////////////////////////////////////////////////////////////////////////////////
// execution

vfs::file_task_unit_result
vfs::local_backend::execute_unit(const vfs::file_task_unit& unit)
{
    // ztd::logger::trace("unit {} {} -> {}", magic_enum::enum_name(unit.type), unit.source.string(), unit.target.string());

    switch (unit.type)
    {
        case vfs::file_task_unit_type::make_dir:
            return this->do_make_dir(unit);
        case vfs::file_task_unit_type::copy_chunk:
            return this->do_copy_chunk(unit);
        case vfs::file_task_unit_type::copy_symlink:
            return this->do_copy_symlink(unit);
        case vfs::file_task_unit_type::finish_dir:
            return this->do_finish_dir(unit);
        case vfs::file_task_unit_type::rename:
            return this->do_rename(unit);
        case vfs::file_task_unit_type::remove:
            return this->do_remove(unit);
        case vfs::file_task_unit_type::remove_dir:
            return this->do_remove_dir(unit);
        case vfs::file_task_unit_type::cleanup_dir:
            return this->do_cleanup_dir(unit);
        case vfs::file_task_unit_type::trash:
            return this->do_trash(unit);
        case vfs::file_task_unit_type::symlink:
            return this->do_symlink(unit);
    }

    throw VFSTaskFatalError(
        std::format("Unknown unit type {}", magic_enum::enum_integer(unit.type)));
}

bool
vfs::local_backend::rollback(const vfs::file_task_unit& unit) noexcept
{
    if (unit.type != vfs::file_task_unit_type::copy_chunk)
    {
        return false;
    }

    {
        // never remove a file another task or user created
        std::scoped_lock lock(this->partial_mutex_);
        if (this->partial_.erase(unit.target) == 0)
        {
            return false;
        }
    }

    std::error_code ec;
    const bool removed = std::filesystem::remove(unit.target, ec);
    if (ec)
    {
        ztd::logger::warn("Failed to remove partial file '{}': {}", unit.target.string(), ec.message());
        return false;
    }
    if (removed)
    {
        ztd::logger::info("Removed partial file '{}'", unit.target.string());
    }
    return removed;
}

vfs::file_task_unit_result
vfs::local_backend::do_make_dir(const vfs::file_task_unit& unit)
{
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(unit.target, ec);
    if (unit.replace && std::filesystem::is_directory(status))
    {
        // merge
        return {0, unit.items};
    }

    if (std::filesystem::exists(status))
    {
        if (!unit.replace)
        {
            vfs_task_error(EEXIST, "Creating Dir", unit.target);
        }
        std::filesystem::remove(unit.target, ec);
        if (ec)
        {
            vfs_task_error(ec.value(), "Removing", unit.target);
        }
    }

    std::filesystem::create_directory(unit.target, ec);
    if (ec)
    {
        vfs_task_error(ec.value(), "Creating Dir", unit.target);
    }
    // real permissions are restored by finish_dir
    std::filesystem::permissions(unit.target, std::filesystem::perms::owner_all, ec);
    if (ec)
    {
        vfs_task_error(ec.value(), "Setting Mode", unit.target);
    }

    return {0, unit.items};
}

vfs::file_task_unit_result
vfs::local_backend::do_copy_chunk(const vfs::file_task_unit& unit)
{
    const auto file_stat = ztd::statx(unit.source, ztd::statx::symlink::no_follow);
    if (!file_stat)
    {
        vfs_task_error(errno, "Accessing", unit.source);
    }

    // MOD if dest is a symlink, delete it first to prevent overwriting target!
    if (unit.offset == 0 && unit.replace && std::filesystem::is_symlink(unit.target))
    {
        std::error_code ec;
        std::filesystem::remove(unit.target, ec);
        if (ec)
        {
            vfs_task_error(ec.value(), "Removing", unit.target);
        }
    }

    const scoped_fd rfd(open(unit.source.c_str(), O_RDONLY | O_CLOEXEC));
    if (rfd.fd < 0)
    {
        vfs_task_error(errno, "Accessing", unit.source);
    }

    // the first chunk creates the file, the others write into it at their offset
    i32 flags = O_WRONLY | O_CLOEXEC;
    if (unit.offset == 0)
    {
        flags |= O_CREAT;

        std::scoped_lock lock(this->partial_mutex_);
        if (unit.replace || this->partial_.contains(unit.target))
        {
            // replacing, or a retry of a first chunk that already created the file
            flags |= O_TRUNC;
        }
        else
        {
            flags |= O_EXCL;
        }
    }
    const scoped_fd wfd(open(unit.target.c_str(), flags, file_stat.mode() | S_IWUSR));
    if (wfd.fd < 0)
    {
        vfs_task_error(errno, "Creating", unit.target);
    }
    if (unit.offset == 0)
    {
        std::scoped_lock lock(this->partial_mutex_);
        this->partial_.insert(unit.target);
    }

    std::vector<char> buffer(std::min(unit.length, 64 * KiB));
    u64 copied = 0;
    while (copied < unit.length)
    {
        const usize want = std::min(static_cast<u64>(buffer.size()), unit.length - copied);
        const isize rsize =
            pread(rfd.fd, buffer.data(), want, static_cast<off_t>(unit.offset + copied));
        if (rsize < 0)
        {
            vfs_task_error(errno, "Reading", unit.source);
        }
        if (rsize == 0)
        {
            // the source shrank since it was planned
            break;
        }

        isize written = 0;
        while (written < rsize)
        {
            const isize wsize = pwrite(wfd.fd,
                                       buffer.data() + written,
                                       static_cast<usize>(rsize - written),
                                       static_cast<off_t>(unit.offset + copied + written));
            if (wsize < 0)
            {
                vfs_task_error(errno, "Writing", unit.target);
            }
            written += wsize;
        }
        copied += static_cast<u64>(rsize);
    }

    if (unit.offset + unit.length >= unit.file_size)
    {
        // last chunk, file is complete
        if (fchmod(wfd.fd, file_stat.mode()) != 0)
        {
            vfs_task_error(errno, "Setting Mode", unit.target);
        }

        struct utimbuf times;
        times.actime = file_stat.atime().tv_sec;
        times.modtime = file_stat.mtime().tv_sec;
        if (utime(unit.target.c_str(), &times) != 0)
        {
            vfs_task_error(errno, "Setting Times", unit.target);
        }

        std::scoped_lock lock(this->partial_mutex_);
        this->partial_.erase(unit.target);
    }

    return {copied, unit.items};
}

vfs::file_task_unit_result
vfs::local_backend::do_copy_symlink(const vfs::file_task_unit& unit)
{
    return this->do_symlink(unit);
}

vfs::file_task_unit_result
vfs::local_backend::do_finish_dir(const vfs::file_task_unit& unit)
{
    const auto file_stat = ztd::statx(unit.source, ztd::statx::symlink::no_follow);
    if (!file_stat)
    {
        vfs_task_error(errno, "Accessing", unit.source);
    }

    if (chmod(unit.target.c_str(), file_stat.mode()) != 0)
    {
        vfs_task_error(errno, "Setting Mode", unit.target);
    }

    struct utimbuf times;
    times.actime = file_stat.atime().tv_sec;
    times.modtime = file_stat.mtime().tv_sec;
    if (utime(unit.target.c_str(), &times) != 0)
    {
        vfs_task_error(errno, "Setting Times", unit.target);
    }

    return {0, unit.items};
}

vfs::file_task_unit_result
vfs::local_backend::do_rename(const vfs::file_task_unit& unit)
{
    std::error_code ec;

    if (unit.replace)
    {
        // rename() replaces files but not a file with a directory
        const auto status = std::filesystem::symlink_status(unit.target, ec);
        if (std::filesystem::exists(status) && !std::filesystem::is_directory(status))
        {
            std::filesystem::remove(unit.target, ec);
            if (ec)
            {
                vfs_task_error(ec.value(), "Removing", unit.target);
            }
        }
        std::filesystem::rename(unit.source, unit.target, ec);
    }
    // fails if the target appeared after planning
    else if (renameat2(AT_FDCWD,
                       unit.source.c_str(),
                       AT_FDCWD,
                       unit.target.c_str(),
                       RENAME_NOREPLACE) != 0)
    {
        const i32 errnox = errno;
        if (errnox != EINVAL)
        {
            ec.assign(errnox, std::generic_category());
        }
        else if (path_exists(unit.target))
        {
            ec.assign(EEXIST, std::generic_category());
        }
        else
        {
            // filesystem without RENAME_NOREPLACE
            std::filesystem::rename(unit.source, unit.target, ec);
        }
    }
    if (!ec)
    {
        return {unit.length, unit.items};
    }
    if (ec.value() != EXDEV)
    {
        vfs_task_error(ec.value(), "Renaming", unit.source);
    }

    // MOD Invalid cross-device link (st_dev not always accurate test)
    // so now redo move as copy
    ztd::logger::debug("rename crossed devices, copying '{}'", unit.source.string());

    auto copy_options =
        std::filesystem::copy_options::recursive | std::filesystem::copy_options::copy_symlinks;
    if (unit.replace)
    {
        copy_options |= std::filesystem::copy_options::overwrite_existing;
    }

    if (!unit.replace && path_exists(unit.target))
    {
        vfs_task_error(EEXIST, "Copying", unit.target);
    }

    ec.clear();
    std::filesystem::copy(unit.source, unit.target, copy_options, ec);
    if (ec)
    {
        vfs_task_error(ec.value(), "Copying", unit.source);
    }
    std::filesystem::remove_all(unit.source, ec);
    if (ec)
    {
        vfs_task_error(ec.value(), "Removing", unit.source);
    }

    return {unit.length, unit.items};
}

vfs::file_task_unit_result
vfs::local_backend::do_remove(const vfs::file_task_unit& unit)
{
    std::error_code ec;
    std::filesystem::remove(unit.source, ec);
    if (ec && ec.value() != ENOENT)
    {
        vfs_task_error(ec.value(), "Removing", unit.source);
    }
    return {unit.length, unit.items};
}

vfs::file_task_unit_result
vfs::local_backend::do_remove_dir(const vfs::file_task_unit& unit)
{
    // only ever called on a directory whose entries were removed by earlier units
    std::error_code ec;
    std::filesystem::remove(unit.source, ec);
    if (ec && ec.value() != ENOENT)
    {
        vfs_task_error(ec.value(), "Removing", unit.source);
    }
    return {unit.length, unit.items};
}

vfs::file_task_unit_result
vfs::local_backend::do_cleanup_dir(const vfs::file_task_unit& unit)
{
    std::error_code ec;
    std::filesystem::remove_all(unit.source, ec);
    if (ec)
    {
        ztd::logger::warn("Failed to remove '{}' after copying it: {}",
                          unit.source.string(),
                          ec.message());
    }
    return {unit.length, unit.items};
}

vfs::file_task_unit_result
vfs::local_backend::do_trash(const vfs::file_task_unit& unit)
{
    std::error_code ec;
    if (!this->trash_.trash(unit.source, ec))
    {
        vfs_task_error(ec ? ec.value() : EIO, "Trashing", unit.source);
    }
    return {unit.length, unit.items};
}

vfs::file_task_unit_result
vfs::local_backend::do_symlink(const vfs::file_task_unit& unit)
{
    std::error_code ec;

    // MOD if dest exists, delete it first to prevent exists error
    if (unit.replace && path_exists(unit.target))
    {
        std::filesystem::remove(unit.target, ec);
        if (ec)
        {
            vfs_task_error(ec.value(), "Removing", unit.target);
        }
    }

    std::filesystem::create_symlink(unit.link_target, unit.target, ec);
    if (ec)
    {
        vfs_task_error(ec.value(), "Creating Link", unit.target);
    }

    return {0, unit.items};
}
