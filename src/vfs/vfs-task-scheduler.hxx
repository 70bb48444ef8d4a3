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

#include <vector>
#include <map>

#include <optional>

#include <memory>

#include <chrono>

#include <atomic>
#include <condition_variable>
#include <mutex>

#include <ztd/ztd.hxx>

#include "types.hxx"

#include "vfs/vfs-file-task.hxx"
#include "vfs/vfs-file-backend.hxx"
#include "vfs/vfs-task-config.hxx"
#include "vfs/vfs-task-queue.hxx"
#include "vfs/vfs-task-progress.hxx"
#include "vfs/vfs-task-pool.hxx"

namespace vfs
{
    /**
     * Owns the queue, one worker pool per task type and the progress
     * aggregator. All methods are safe to call from any thread.
     */
    class task_scheduler
    {
      public:
        task_scheduler(const scheduler_config& config, const file_task_backend_t& backend);
        ~task_scheduler();

        task_scheduler(const task_scheduler&) = delete;
        task_scheduler& operator=(const task_scheduler&) = delete;

        // throws VFSTaskValidationError, never touches the filesystem
        task_id_t submit(const file_task_request& request);

        // all of these are no-ops for unknown or finished tasks
        void cancel(task_id_t id) noexcept;
        void pause(task_id_t id) noexcept;
        void resume(task_id_t id) noexcept;
        bool promote(task_id_t id) noexcept;
        void cancel_all() noexcept;

        [[nodiscard]] task_subscription_t subscribe() noexcept;
        [[nodiscard]] progress_summary summary() const noexcept;

        // every retained task in id order
        [[nodiscard]] std::vector<file_task_snapshot> snapshot() const noexcept;
        [[nodiscard]] std::optional<file_task_snapshot> get(task_id_t id) const noexcept;

        // drop finished tasks
        bool evict(task_id_t id) noexcept;
        usize clear_finished() noexcept;

        // true once every retained task is finished
        bool wait_idle(std::chrono::milliseconds timeout) noexcept;

        /**
         * Stop accepting tasks, cancel the pending ones, give the running
         * ones grace_period to finish, cancel what is left and wait for
         * every worker to exit.
         */
        void shutdown() noexcept;

        // called from the worker threads
        void task_finished(const file_task& task) noexcept;

      private:
        void validate(const file_task_request& request) const;
        [[nodiscard]] file_task find(task_id_t id) const noexcept;
        // caller holds mutex_
        [[nodiscard]] bool all_finished() const noexcept;
        void collect_garbage() noexcept;

        const scheduler_config config_;
        file_task_backend_t backend_;

        task_progress progress_;
        task_queue queue_;
        std::map<file_task_type, task_pool_t> pools_;

        std::map<task_id_t, file_task> tasks_;
        mutable std::mutex mutex_;
        std::condition_variable idle_cond_;

        std::atomic<task_id_t> next_id_{1};
        bool accepting_{true};

        std::mutex shutdown_mutex_;
        bool stopped_{false};
    };
} // namespace vfs
