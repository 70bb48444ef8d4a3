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

#include <string_view>

#include <filesystem>

#include <vector>

#include <optional>

#include <memory>

#include <mutex>

#include <set>

#include <ztd/ztd.hxx>

#include "vfs/vfs-file-task.hxx"
#include "vfs/vfs-file-backend.hxx"
#include "vfs/vfs-file-trash.hxx"

namespace vfs
{
    /**
     * POSIX filesystem backend.
     *
     * Regular files are copied in chunk_size pieces with pread/pwrite so a
     * retried chunk starts again at its own offset. Overwrite handling is
     * resolved while planning. Execution never replaces an entry the plan
     * did not mark for replacement, a target that appeared since fails with EEXIST.
     */
    class local_backend : public file_task_backend
    {
      public:
        local_backend(u64 chunk_size, const std::filesystem::path& home_trash);
        ~local_backend() override = default;

        std::vector<file_task_unit> plan(file_task_type type, const file_task_path& path,
                                         const file_task_options& options,
                                         file_task_claims& claims) override;

        file_task_unit_result execute_unit(const file_task_unit& unit) override;

        // removes a partially copied file, only one this backend created
        bool rollback(const file_task_unit& unit) noexcept override;

        [[nodiscard]] u64 chunk_size() const noexcept;

      private:
        std::vector<file_task_unit> plan_copy(const std::filesystem::path& source,
                                              const std::filesystem::path& target,
                                              const file_task_options& options,
                                              file_task_claims& claims);
        std::vector<file_task_unit> plan_move(const std::filesystem::path& source,
                                              const std::filesystem::path& target,
                                              const file_task_options& options,
                                              file_task_claims& claims);
        std::vector<file_task_unit> plan_delete(const std::filesystem::path& source);
        std::vector<file_task_unit> plan_trash(const std::filesystem::path& source);
        std::vector<file_task_unit> plan_link(const std::filesystem::path& source,
                                              const std::filesystem::path& target,
                                              const file_task_options& options,
                                              file_task_claims& claims);

        void plan_copy_tree(const std::filesystem::path& source,
                            const std::filesystem::path& target, bool replace,
                            std::vector<file_task_unit>& units);
        void plan_copy_file(const std::filesystem::path& source,
                            const std::filesystem::path& target, u64 size, bool replace,
                            std::vector<file_task_unit>& units) const;
        void plan_move_tree(const std::filesystem::path& source,
                            const std::filesystem::path& target, bool replace,
                            std::vector<file_task_unit>& units);
        void plan_delete_tree(const std::filesystem::path& source,
                              std::vector<file_task_unit>& units);

        // nullopt if the entry is skipped, throws if it may not be written.
        // a claimed target counts as existing, the caller claims the result
        std::optional<std::filesystem::path>
        resolve_target(const std::filesystem::path& source, const std::filesystem::path& target,
                       file_task_overwrite_mode mode, const file_task_claims& claims,
                       bool& replace) const;

        void check_dest_in_src(const std::filesystem::path& source,
                               const std::filesystem::path& target) const;

        file_task_unit_result do_make_dir(const file_task_unit& unit);
        file_task_unit_result do_copy_chunk(const file_task_unit& unit);
        file_task_unit_result do_copy_symlink(const file_task_unit& unit);
        file_task_unit_result do_finish_dir(const file_task_unit& unit);
        file_task_unit_result do_rename(const file_task_unit& unit);
        file_task_unit_result do_remove(const file_task_unit& unit);
        file_task_unit_result do_remove_dir(const file_task_unit& unit);
        file_task_unit_result do_cleanup_dir(const file_task_unit& unit);
        file_task_unit_result do_trash(const file_task_unit& unit);
        file_task_unit_result do_symlink(const file_task_unit& unit);

        u64 chunk_size_;
        VFSTrash trash_;

        // files opened by a first chunk whose last chunk has not run yet
        std::mutex partial_mutex_;
        std::set<std::filesystem::path> partial_;
    };
} // namespace vfs

namespace vfs
{
    using local_backend_t = std::shared_ptr<local_backend>;
}

// Bytes in regular files at or below 'path', symlinks are not followed
u64 vfs_total_size(const std::filesystem::path& path) noexcept;

// Throws VFSTaskRetryableError or VFSTaskFatalError depending on 'errnox'
[[noreturn]] void vfs_task_error(i32 errnox, const std::string_view action,
                                 const std::filesystem::path& path);
