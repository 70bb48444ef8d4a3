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

#include <memory>

#include <chrono>

#include <mutex>

#include <algorithm>

#include <magic_enum.hpp>

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "vfs/vfs-file-task.hxx"

bool
vfs::is_terminal(vfs::file_task_state state) noexcept
{
    return (state == vfs::file_task_state::succeeded || state == vfs::file_task_state::failed ||
            state == vfs::file_task_state::canceled);
}

bool
vfs::is_valid_transition(vfs::file_task_state from, vfs::file_task_state to) noexcept
{
    switch (from)
    {
        case vfs::file_task_state::pending:
            return (to == vfs::file_task_state::running || to == vfs::file_task_state::canceled);
        case vfs::file_task_state::running:
            return (to == vfs::file_task_state::paused || to == vfs::file_task_state::succeeded ||
                    to == vfs::file_task_state::failed || to == vfs::file_task_state::canceled);
        case vfs::file_task_state::paused:
            // a canceled pause goes through running first
            return to == vfs::file_task_state::running;
        case vfs::file_task_state::succeeded:
        case vfs::file_task_state::failed:
        case vfs::file_task_state::canceled:
            return false;
    }
    return false;
}

const std::string_view
vfs::file_task_type_name(vfs::file_task_type type) noexcept
{
    switch (type)
    {
        case vfs::file_task_type::move:
            return "move";
        case vfs::file_task_type::copy:
            return "copy";
        case vfs::file_task_type::trash:
            return "trash";
        case vfs::file_task_type::DELETE:
            return "delete";
        case vfs::file_task_type::link:
            return "link";
    }
    return "unknown";
}

std::optional<vfs::file_task_type>
vfs::file_task_type_from_name(const std::string_view name) noexcept
{
    for (const auto type : magic_enum::enum_values<vfs::file_task_type>())
    {
        if (vfs::file_task_type_name(type) == name)
        {
            return type;
        }
    }
    return std::nullopt;
}

static const std::string
create_task_name(const vfs::file_task_request& request)
{
    std::string action;
    switch (request.type)
    {
        case vfs::file_task_type::move:
            action = "Move";
            break;
        case vfs::file_task_type::copy:
            action = "Copy";
            break;
        case vfs::file_task_type::trash:
            action = "Trash";
            break;
        case vfs::file_task_type::DELETE:
            action = "Delete";
            break;
        case vfs::file_task_type::link:
            action = "Link";
            break;
    }

    if (request.paths.empty())
    {
        return action;
    }

    const auto& first = request.paths.front();
    const std::string what = request.paths.size() == 1
                                 ? first.source.filename().string()
                                 : std::format("{} items", request.paths.size());

    if (first.target.empty())
    {
        return std::format("{} {}", action, what);
    }
    return std::format("{} {} -> {}", action, what, first.target.parent_path().string());
}

vfs::file_task
vfs_task_new(task_id_t id, const vfs::file_task_request& request)
{
    return std::make_shared<VFSFileTask>(id, request);
}

VFSFileTask::VFSFileTask(task_id_t id, const vfs::file_task_request& request)
    : id_(id), type_(request.type), paths_(request.paths), options_(request.options),
      name_(create_task_name(request)), submitted_at_(std::chrono::system_clock::now()),
      priority_(request.priority)
{
}

task_id_t
VFSFileTask::id() const noexcept
{
    return this->id_;
}

vfs::file_task_type
VFSFileTask::type() const noexcept
{
    return this->type_;
}

const std::vector<vfs::file_task_path>&
VFSFileTask::paths() const noexcept
{
    return this->paths_;
}

const vfs::file_task_options&
VFSFileTask::options() const noexcept
{
    return this->options_;
}

const std::string&
VFSFileTask::name() const noexcept
{
    return this->name_;
}

i32
VFSFileTask::priority() const noexcept
{
    std::scoped_lock lock(this->mutex_);
    return this->priority_;
}

void
VFSFileTask::priority(i32 priority) noexcept
{
    std::scoped_lock lock(this->mutex_);
    this->priority_ = priority;
}

vfs::file_task_state
VFSFileTask::state() const noexcept
{
    std::scoped_lock lock(this->mutex_);
    return this->state_;
}

bool
VFSFileTask::set_state(vfs::file_task_state state) noexcept
{
    std::scoped_lock lock(this->mutex_);
    if (!vfs::is_valid_transition(this->state_, state))
    {
        ztd::logger::warn("Task {}: rejected state change {} -> {}",
                          this->id_,
                          magic_enum::enum_name(this->state_),
                          magic_enum::enum_name(state));
        return false;
    }

    // ztd::logger::trace("Task {}: {} -> {}", this->id_, magic_enum::enum_name(this->state_), magic_enum::enum_name(state));
    this->state_ = state;
    if (vfs::is_terminal(state))
    {
        this->finished_at_ = std::chrono::steady_clock::now();
    }
    return true;
}

vfs::file_task_progress
VFSFileTask::progress() const noexcept
{
    std::scoped_lock lock(this->mutex_);
    return this->progress_;
}

void
VFSFileTask::revise_totals(u64 total_bytes, u64 total_items) noexcept
{
    std::scoped_lock lock(this->mutex_);
    this->progress_.total_bytes =
        std::max({this->progress_.total_bytes.value_or(0), total_bytes, this->progress_.processed_bytes});
    this->progress_.total_items =
        std::max({this->progress_.total_items.value_or(0), total_items, this->progress_.processed_items});
}

void
VFSFileTask::add_progress(u64 bytes, u64 items) noexcept
{
    std::scoped_lock lock(this->mutex_);
    this->progress_.processed_bytes += bytes;
    this->progress_.processed_items += items;

    // a file grew since it was sized, revise the total before anyone sees the overshoot
    if (this->progress_.total_bytes &&
        this->progress_.processed_bytes > this->progress_.total_bytes.value())
    {
        this->progress_.total_bytes = this->progress_.processed_bytes;
    }
    if (this->progress_.total_items &&
        this->progress_.processed_items > this->progress_.total_items.value())
    {
        this->progress_.total_items = this->progress_.processed_items;
    }
}

void
VFSFileTask::settle_progress() noexcept
{
    std::scoped_lock lock(this->mutex_);
    if (!this->progress_.total_bytes || !this->progress_.total_items)
    {
        this->progress_.total_bytes = this->progress_.processed_bytes;
        this->progress_.total_items = this->progress_.processed_items;
        return;
    }
    this->progress_.processed_bytes =
        std::max(this->progress_.processed_bytes, this->progress_.total_bytes.value());
    this->progress_.processed_items =
        std::max(this->progress_.processed_items, this->progress_.total_items.value());
}

std::optional<vfs::file_task_error>
VFSFileTask::error() const noexcept
{
    std::scoped_lock lock(this->mutex_);
    return this->error_;
}

void
VFSFileTask::set_error(const vfs::file_task_error& error) noexcept
{
    std::scoped_lock lock(this->mutex_);
    this->error_ = error;
}

void
VFSFileTask::add_retry() noexcept
{
    std::scoped_lock lock(this->mutex_);
    this->retries_ += 1;
}

std::optional<std::chrono::steady_clock::time_point>
VFSFileTask::finished_at() const noexcept
{
    std::scoped_lock lock(this->mutex_);
    return this->finished_at_;
}

void
VFSFileTask::request_cancel() noexcept
{
    {
        std::scoped_lock lock(this->mutex_);
        this->cancel_ = true;
    }
    this->pause_cond_.notify_all();
}

bool
VFSFileTask::is_cancel_requested() const noexcept
{
    return this->cancel_;
}

bool
VFSFileTask::wait_for_cancel(std::chrono::milliseconds timeout) noexcept
{
    std::unique_lock lock(this->mutex_);
    return this->pause_cond_.wait_for(lock, timeout, [this] { return this->cancel_.load(); });
}

void
VFSFileTask::request_pause() noexcept
{
    std::scoped_lock lock(this->mutex_);
    this->pause_ = true;
}

void
VFSFileTask::request_resume() noexcept
{
    {
        std::scoped_lock lock(this->mutex_);
        this->pause_ = false;
    }
    this->pause_cond_.notify_all();
}

bool
VFSFileTask::is_pause_requested() const noexcept
{
    return this->pause_;
}

void
VFSFileTask::wait_for_resume() noexcept
{
    std::unique_lock lock(this->mutex_);
    this->pause_cond_.wait(lock, [this] { return !this->pause_ || this->cancel_; });
}

vfs::progress_event
VFSFileTask::event() const noexcept
{
    std::scoped_lock lock(this->mutex_);
    return {this->id_, this->type_, this->state_, this->progress_, this->error_};
}

vfs::file_task_snapshot
VFSFileTask::snapshot() const noexcept
{
    std::scoped_lock lock(this->mutex_);
    return {this->id_,
            this->type_,
            this->name_,
            this->state_,
            this->progress_,
            this->error_,
            this->priority_,
            this->retries_,
            this->submitted_at_};
}
