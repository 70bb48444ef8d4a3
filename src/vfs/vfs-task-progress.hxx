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

#include <array>
#include <deque>
#include <vector>
#include <unordered_map>

#include <utility>

#include <optional>

#include <memory>

#include <chrono>

#include <condition_variable>
#include <mutex>

#include <magic_enum.hpp>

#include <ztd/ztd.hxx>

#include "types.hxx"

#include "vfs/vfs-file-task.hxx"

namespace vfs
{
    struct progress_summary
    {
        // non-terminal tasks only, totals only from tasks that know theirs
        u64 processed_bytes{0};
        u64 total_bytes{0};
        u64 processed_items{0};
        u64 total_items{0};
        // non-terminal tasks that have not been planned yet
        u32 unknown_totals{0};

        // every retained task
        std::array<u32, magic_enum::enum_count<file_task_state>()> by_state{};

        f64 bytes_per_second{0.0};
        std::optional<std::chrono::seconds> eta{std::nullopt};

        [[nodiscard]] u32 count(file_task_state state) const noexcept;
        // pending + running + paused
        [[nodiscard]] u32 active() const noexcept;
        // 0 to 100
        [[nodiscard]] f64 percent() const noexcept;
    };

    /**
     * One subscriber's view of the progress events.
     *
     * Only the latest undelivered event of a task is kept. A task is queued
     * once in arrival order and later events replace the queued one, so a
     * slow reader holds at most one event per task and never misses the
     * terminal event, which is always the last event of a task.
     */
    class task_subscription
    {
      public:
        task_subscription() = default;
        ~task_subscription() = default;

        task_subscription(const task_subscription&) = delete;
        task_subscription& operator=(const task_subscription&) = delete;

        // nullopt on timeout, or once closed and drained
        std::optional<progress_event> next(std::chrono::milliseconds timeout);
        std::optional<progress_event> try_next() noexcept;

        [[nodiscard]] progress_summary summary() const noexcept;

        [[nodiscard]] usize pending() const noexcept;
        [[nodiscard]] bool is_closed() const noexcept;
        void close() noexcept;

        void push(const progress_event& event, const progress_summary& summary) noexcept;

      private:
        std::optional<progress_event> pop() noexcept;

        mutable std::mutex mutex_;
        std::condition_variable cond_;

        std::deque<task_id_t> order_;
        std::unordered_map<task_id_t, progress_event> latest_;
        progress_summary summary_{};
        bool closed_{false};
    };

    using task_subscription_t = std::shared_ptr<task_subscription>;

    /**
     * Aggregates the progress events of every task and fans them out.
     * Each event is folded into the running summary in O(1) by
     * subtracting the previous event of the same task.
     */
    class task_progress
    {
      public:
        task_progress() = default;
        ~task_progress() = default;

        task_progress(const task_progress&) = delete;
        task_progress& operator=(const task_progress&) = delete;

        void publish(const progress_event& event) noexcept;

        // drop an evicted task from the summary
        void forget(task_id_t id) noexcept;

        [[nodiscard]] progress_summary summary() const noexcept;

        // seeded with the last event of every known task
        [[nodiscard]] task_subscription_t subscribe() noexcept;

        void close_all() noexcept;

        // throughput window and sample rate
        static constexpr std::chrono::seconds window{5};
        static constexpr std::chrono::milliseconds sample_interval{100};

      private:
        void add(const progress_event& event, i32 sign) noexcept;
        void sample(std::chrono::steady_clock::time_point now) noexcept;
        [[nodiscard]] progress_summary build_summary(std::chrono::steady_clock::time_point now) const noexcept;

        mutable std::mutex mutex_;

        std::unordered_map<task_id_t, progress_event> last_;

        // running sums over last_
        u64 processed_bytes_{0};
        u64 total_bytes_{0};
        u64 processed_items_{0};
        u64 total_items_{0};
        u32 unknown_totals_{0};
        std::array<u32, magic_enum::enum_count<file_task_state>()> by_state_{};

        // every byte ever reported, for throughput
        u64 bytes_done_{0};
        std::deque<std::pair<std::chrono::steady_clock::time_point, u64>> samples_;

        std::vector<std::weak_ptr<task_subscription>> subscribers_;
    };
} // namespace vfs
