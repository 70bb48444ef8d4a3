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

#include <thread>
#include <atomic>
#include <stop_token>

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

namespace vfs
{
    class task_scheduler;

    /**
     * One executor thread for one task type.
     *
     * Takes a task from the queue, plans it, runs its units one at a time
     * and publishes a progress event after each unit. Cancel and pause
     * requests are only looked at between units.
     */
    struct task_worker
    {
        task_worker(u32 number, file_task_type type, const pool_config& config,
                    task_queue& queue, const file_task_backend_t& backend,
                    task_progress& progress);
        ~task_worker();

        task_worker(const task_worker&) = delete;
        task_worker& operator=(const task_worker&) = delete;

        void run();
        // the current task is finished first, no new task is taken
        void stop() noexcept;
        void join() noexcept;

      private:
        void loop(std::stop_token stoken) noexcept;
        void execute(const file_task& task);

        // false if the task was canceled
        bool checkpoint(const file_task& task);

        void finish(const file_task& task, file_task_state state);
        // a canceled task, 'last_unit' completed
        void rollback(const file_task_unit* last_unit) noexcept;
        // the unit threw
        void rollback_failed(const file_task_unit& unit) noexcept;
        void publish(const file_task& task) noexcept;

        u32 number_;
        file_task_type type_;
        pool_config config_;

        task_queue& queue_;
        file_task_backend_t backend_;
        task_progress& progress_;

        std::jthread thread_;
        std::atomic<bool> running_{false};

        // Signals
      public:
        // Signals function types
        using evt_task_finish_t = void(vfs::file_task, vfs::task_scheduler*);

        // Signals Add Event
        template<taskfm::signal evt>
        typename std::enable_if<evt == taskfm::signal::task_finish, sigc::connection>::type
        add_event(evt_task_finish_t fun, vfs::task_scheduler* scheduler)
        {
            // ztd::logger::trace("Signal Connect   : taskfm::signal::task_finish");
            this->evt_data_scheduler = scheduler;
            return this->evt_task_finish.connect(sigc::ptr_fun(fun));
        }

        // Signals Run Event
        template<taskfm::signal evt>
        typename std::enable_if<evt == taskfm::signal::task_finish, void>::type
        run_event(const vfs::file_task& task)
        {
            // ztd::logger::trace("Signal Execute   : taskfm::signal::task_finish");
            this->evt_task_finish.emit(task, this->evt_data_scheduler);
        }

        // Signals
      private:
        // Signal types
        sigc::signal<evt_task_finish_t> evt_task_finish;

      private:
        // Signal data
        vfs::task_scheduler* evt_data_scheduler{nullptr};
    };

    using task_worker_t = std::unique_ptr<task_worker>;
} // namespace vfs
