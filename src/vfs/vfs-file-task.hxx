/**
 * Copyright (C) 2005 Hong Jen Yee (PCMan) <pcman.tw@gmail.com>
 *
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

#include <optional>

#include <memory>

#include <chrono>

#include <atomic>
#include <condition_variable>
#include <mutex>

#include <ztd/ztd.hxx>

#include "types.hxx"

namespace vfs
{
    enum class file_task_type
    {
        move,
        copy,
        trash,
        DELETE,
        link,
    };

    enum class file_task_state
    {
        pending,
        running,
        paused,
        succeeded,
        failed,
        canceled,
    };

    enum class file_task_overwrite_mode
    {
        fail,        // Destination exists is a fatal error
        overwrite,   // Replace files, merge directories
        skip,        // Leave existing destinations alone
        auto_rename, // Assign a new unique name
    };

    struct file_task_path
    {
        std::filesystem::path source{};
        std::filesystem::path target{}; // empty for delete and trash
    };

    struct file_task_options
    {
        file_task_overwrite_mode overwrite_mode{file_task_overwrite_mode::fail};
        bool relative_links{false};
    };

    struct file_task_request
    {
        file_task_type type;
        std::vector<file_task_path> paths{};
        file_task_options options{};
        i32 priority{0};
    };

    struct file_task_progress
    {
        u64 processed_bytes{0};
        std::optional<u64> total_bytes{std::nullopt}; // unknown until planned
        u64 processed_items{0};
        std::optional<u64> total_items{std::nullopt};

        bool operator==(const file_task_progress&) const = default;
    };

    struct file_task_error
    {
        i32 errnox{0};
        std::string message{};
        // the unit that failed
        std::filesystem::path source{};
        std::filesystem::path target{};
    };

    // What subscribers see, one per state change or processed unit
    struct progress_event
    {
        task_id_t id{INVALID_TASK};
        file_task_type type;
        file_task_state state;
        file_task_progress progress{};
        std::optional<file_task_error> error{std::nullopt};
    };

    struct file_task_snapshot
    {
        task_id_t id{INVALID_TASK};
        file_task_type type;
        std::string name{};
        file_task_state state;
        file_task_progress progress{};
        std::optional<file_task_error> error{std::nullopt};
        i32 priority{0};
        u32 retries{0};
        std::chrono::system_clock::time_point submitted_at{};
    };

    [[nodiscard]] bool is_terminal(file_task_state state) noexcept;
    [[nodiscard]] bool is_valid_transition(file_task_state from, file_task_state to) noexcept;

    [[nodiscard]] const std::string_view file_task_type_name(file_task_type type) noexcept;
    [[nodiscard]] std::optional<file_task_type>
    file_task_type_from_name(const std::string_view name) noexcept;
} // namespace vfs

class VFSFileTask
{
  public:
    VFSFileTask() = delete;
    VFSFileTask(task_id_t id, const vfs::file_task_request& request);
    ~VFSFileTask() = default;

    VFSFileTask(const VFSFileTask&) = delete;
    VFSFileTask& operator=(const VFSFileTask&) = delete;

    [[nodiscard]] task_id_t id() const noexcept;
    [[nodiscard]] vfs::file_task_type type() const noexcept;
    [[nodiscard]] const std::vector<vfs::file_task_path>& paths() const noexcept;
    [[nodiscard]] const vfs::file_task_options& options() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept;

    [[nodiscard]] i32 priority() const noexcept;
    void priority(i32 priority) noexcept;

    [[nodiscard]] vfs::file_task_state state() const noexcept;
    // false if the state machine does not allow the transition
    bool set_state(vfs::file_task_state state) noexcept;

    [[nodiscard]] vfs::file_task_progress progress() const noexcept;
    // totals only ever grow
    void revise_totals(u64 total_bytes, u64 total_items) noexcept;
    void add_progress(u64 bytes, u64 items) noexcept;
    // on success the processed counters are raised to the totals
    void settle_progress() noexcept;

    [[nodiscard]] std::optional<vfs::file_task_error> error() const noexcept;
    void set_error(const vfs::file_task_error& error) noexcept;

    void add_retry() noexcept;

    [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> finished_at() const noexcept;

    void request_cancel() noexcept;
    [[nodiscard]] bool is_cancel_requested() const noexcept;
    // sleeps up to 'timeout', true if the task was canceled
    bool wait_for_cancel(std::chrono::milliseconds timeout) noexcept;

    void request_pause() noexcept;
    // withdraws a pause request, wakes a worker waiting in wait_for_resume()
    void request_resume() noexcept;
    [[nodiscard]] bool is_pause_requested() const noexcept;

    // Called by the executing worker while paused, returns once resumed or canceled
    void wait_for_resume() noexcept;

    [[nodiscard]] vfs::progress_event event() const noexcept;
    [[nodiscard]] vfs::file_task_snapshot snapshot() const noexcept;

  private:
    const task_id_t id_;
    const vfs::file_task_type type_;
    const std::vector<vfs::file_task_path> paths_;
    const vfs::file_task_options options_;
    const std::string name_;
    const std::chrono::system_clock::time_point submitted_at_;

    i32 priority_{0};

    vfs::file_task_state state_{vfs::file_task_state::pending};
    vfs::file_task_progress progress_{};
    std::optional<vfs::file_task_error> error_{std::nullopt};
    u32 retries_{0};
    std::optional<std::chrono::steady_clock::time_point> finished_at_{std::nullopt};

    std::atomic<bool> cancel_{false};
    std::atomic<bool> pause_{false};

    // one mutator at a time per task record
    mutable std::mutex mutex_;
    std::condition_variable pause_cond_;
};

namespace vfs
{
    using file_task = std::shared_ptr<VFSFileTask>;
}

vfs::file_task vfs_task_new(task_id_t id, const vfs::file_task_request& request);
