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
#include <unordered_map>

#include <optional>

#include <condition_variable>
#include <mutex>
#include <stop_token>

#include <ztd/ztd.hxx>

#include "types.hxx"

#include "vfs/vfs-file-task.hxx"

namespace vfs
{
    /**
     * Pending tasks, one ordered partition per task type.
     *
     * A task leaves the queue in exactly one of two ways: dequeue() hands it
     * to a worker (pending -> running) or remove()/close() cancel it
     * (pending -> canceled). Both happen under the queue lock so they can
     * not race for the same task.
     */
    class task_queue
    {
      public:
        task_queue();
        ~task_queue() = default;

        task_queue(const task_queue&) = delete;
        task_queue& operator=(const task_queue&) = delete;

        // false for a duplicate id or a closed queue
        bool enqueue(const file_task& task) noexcept;

        // Blocks until a task of 'type' is available,
        // nullopt once the queue is closed or 'stoken' is stopped
        std::optional<file_task> dequeue(file_task_type type, std::stop_token stoken);
        std::optional<file_task> try_dequeue(file_task_type type) noexcept;

        // true if the task was pending and is now canceled,
        // a dispatched task only gets its cancel flag set
        bool remove(task_id_t id) noexcept;

        // the worker is done with a dispatched task
        void complete(task_id_t id) noexcept;

        // move to the front of its partition
        bool promote(task_id_t id) noexcept;
        bool set_priority(task_id_t id, i32 priority) noexcept;

        // pending tasks in dispatch order, then dispatched tasks
        [[nodiscard]] std::vector<file_task> peek_all() const noexcept;

        [[nodiscard]] usize pending_count(file_task_type type) const noexcept;
        [[nodiscard]] usize dispatched_count() const noexcept;

        // Cancels and returns every pending task, dequeue() returns nullopt from now on
        std::vector<file_task> close() noexcept;
        [[nodiscard]] bool is_closed() const noexcept;

      private:
        // higher priority first, then submission order
        struct order_key
        {
            i32 priority;
            task_id_t id;

            bool
            operator<(const order_key& other) const noexcept
            {
                if (this->priority != other.priority)
                {
                    return this->priority > other.priority;
                }
                return this->id < other.id;
            }
        };

        struct partition
        {
            std::map<order_key, file_task> pending{};
            std::condition_variable_any cond{};
        };

        struct index_entry
        {
            file_task_type type;
            order_key key;
        };

        // caller holds mutex_
        std::optional<file_task> take_front(partition& part) noexcept;
        bool rekey(task_id_t id, i32 priority) noexcept;

        mutable std::mutex mutex_;
        std::map<file_task_type, partition> partitions_;
        std::unordered_map<task_id_t, index_entry> index_;
        std::unordered_map<task_id_t, file_task> dispatched_;
        bool closed_{false};
    };
} // namespace vfs
