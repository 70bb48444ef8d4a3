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

#include <memory>

#include <sigc++/sigc++.h>

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "signals.hxx"

#include "vfs/vfs-file-task.hxx"
#include "vfs/vfs-file-backend.hxx"
#include "vfs/vfs-task-config.hxx"
#include "vfs/vfs-task-queue.hxx"
#include "vfs/vfs-task-progress.hxx"
#include "vfs/vfs-task-worker.hxx"

namespace vfs
{
    // The workers of one task type
    class task_pool
    {
      public:
        task_pool(file_task_type type, task_queue& queue, const file_task_backend_t& backend,
                  task_progress& progress);
        ~task_pool();

        task_pool(const task_pool&) = delete;
        task_pool& operator=(const task_pool&) = delete;

        // start config.concurrency workers
        void run(const pool_config& config);
        void stop() noexcept;
        // returns once every worker thread exited
        void join() noexcept;

      private:
        file_task_type type_;
        task_queue& queue_;
        file_task_backend_t backend_;
        task_progress& progress_;

        std::vector<task_worker_t> workers_;

        // Signals
      public:
        // Signals Add Event
        template<taskfm::signal evt>
        typename std::enable_if<evt == taskfm::signal::task_finish, void>::type
        add_event(task_worker::evt_task_finish_t fun, vfs::task_scheduler* scheduler)
        {
            // ztd::logger::trace("Signal Connect   : taskfm::signal::task_finish");
            // workers started later are connected in run()
            this->evt_task_finish = fun;
            this->evt_data_scheduler = scheduler;
            for (const auto& worker : this->workers_)
            {
                worker->add_event<evt>(fun, scheduler);
            }
        }

      private:
        // Signal data
        task_worker::evt_task_finish_t* evt_task_finish{nullptr};
        vfs::task_scheduler* evt_data_scheduler{nullptr};
    };

    using task_pool_t = std::unique_ptr<task_pool>;
} // namespace vfs
