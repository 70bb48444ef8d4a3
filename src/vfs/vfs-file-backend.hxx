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

#include <vector>

#include <set>

#include <memory>

#include <exception>

#include <ztd/ztd.hxx>

#include "vfs/vfs-file-task.hxx"

class VFSTaskException : virtual public std::exception
{
  protected:
    std::string error_message;
    i32 error_code;

  public:
    explicit VFSTaskException(const std::string_view msg, i32 errnox = 0)
        : error_message(msg), error_code(errnox)
    {
    }

    virtual ~VFSTaskException() throw()
    {
    }

    virtual const char*
    what() const throw()
    {
        return error_message.data();
    }

    // errno, 0 if the error did not come from a syscall
    i32
    code() const noexcept
    {
        return error_code;
    }
};

// The same unit can be attempted again
class VFSTaskRetryableError : public VFSTaskException
{
  public:
    using VFSTaskException::VFSTaskException;
};

// Fails the task
class VFSTaskFatalError : public VFSTaskException
{
  public:
    using VFSTaskException::VFSTaskException;
};

// A request the scheduler will not accept
class VFSTaskValidationError : public VFSTaskException
{
  public:
    using VFSTaskException::VFSTaskException;
};

namespace vfs
{
    enum class file_task_unit_type
    {
        make_dir,
        copy_chunk,
        copy_symlink,
        finish_dir,
        rename,
        remove,
        remove_dir,
        cleanup_dir,
        trash,
        symlink,
    };

    struct file_task_unit
    {
        file_task_unit_type type;
        std::filesystem::path source{};
        std::filesystem::path target{};

        // copy_chunk only
        u64 offset{0};
        u64 file_size{0};

        // planned contribution to the task totals
        u64 length{0};
        u64 items{0};

        // an existing target is replaced
        bool replace{false};
        // symlink only, the contents of the new link
        std::filesystem::path link_target{};
    };

    struct file_task_unit_result
    {
        u64 bytes{0};
        u64 items{0};
    };

    // targets given to earlier paths of the same task
    using file_task_claims = std::set<std::filesystem::path>;

    /**
     * Everything a worker needs from the filesystem.
     * plan() and execute_unit() are called from worker threads,
     * implementations must be safe to call concurrently for different tasks.
     */
    class file_task_backend
    {
      public:
        virtual ~file_task_backend() = default;

        // Expand one path pair into the units needed to process it, the
        // resolved target is added to 'claims' and no later path may reuse it.
        // may throw VFSTaskRetryableError or VFSTaskFatalError
        virtual std::vector<file_task_unit> plan(file_task_type type,
                                                 const file_task_path& path,
                                                 const file_task_options& options,
                                                 file_task_claims& claims) = 0;

        // may throw VFSTaskRetryableError or VFSTaskFatalError
        virtual file_task_unit_result execute_unit(const file_task_unit& unit) = 0;

        // Undo a partially executed unit, false if nothing was done
        virtual bool
        rollback(const file_task_unit&) noexcept
        {
            return false;
        }
    };

    using file_task_backend_t = std::shared_ptr<file_task_backend>;
} // namespace vfs
