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

#include <format>

#include <vector>
#include <map>

#include <optional>

#include <memory>

#include <algorithm>
#include <utility>

#include <chrono>

#include <mutex>

#include <magic_enum.hpp>

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "vfs/vfs-task-scheduler.hxx"

static void
on_task_finish(vfs::file_task task, vfs::task_scheduler* scheduler)
{
    scheduler->task_finished(task);
}

vfs::task_scheduler::task_scheduler(const vfs::scheduler_config& config,
                                    const vfs::file_task_backend_t& backend)
    : config_(config), backend_(backend)
{
    if (!this->backend_)
    {
        throw VFSTaskValidationError("The task scheduler needs a backend");
    }

    for (const auto type : magic_enum::enum_values<vfs::file_task_type>())
    {
        const auto pool_config = this->config_.pool(type);
        if (pool_config.concurrency == 0)
        {
            ztd::logger::info("{} tasks are disabled", vfs::file_task_type_name(type));
            continue;
        }

        auto pool = std::make_unique<vfs::task_pool>(type, this->queue_, this->backend_, this->progress_);
        pool->add_event<taskfm::signal::task_finish>(on_task_finish, this);
        pool->run(pool_config);
        this->pools_.emplace(type, std::move(pool));
    }
}

vfs::task_scheduler::~task_scheduler()
{
    this->shutdown();
    this->progress_.close_all();
}

void
vfs::task_scheduler::validate(const vfs::file_task_request& request) const
{
    if (!this->accepting_)
    {
        throw VFSTaskValidationError("The task scheduler is shutting down");
    }

    const auto type_name = vfs::file_task_type_name(request.type);

    if (request.paths.empty())
    {
        throw VFSTaskValidationError(std::format("No paths given for {} task", type_name));
    }

    const bool needs_target = request.type == vfs::file_task_type::copy ||
                              request.type == vfs::file_task_type::move ||
                              request.type == vfs::file_task_type::link;
    for (const auto& path : request.paths)
    {
        if (path.source.empty())
        {
            throw VFSTaskValidationError(std::format("Empty source path in {} task", type_name));
        }
        if (needs_target && path.target.empty())
        {
            throw VFSTaskValidationError(
                std::format("{} task needs a target for '{}'", type_name, path.source.string()));
        }
    }

    if (!this->pools_.contains(request.type))
    {
        throw VFSTaskValidationError(std::format("No workers for {} tasks", type_name));
    }
}

task_id_t
vfs::task_scheduler::submit(const vfs::file_task_request& request)
{
    std::scoped_lock lock(this->mutex_);

    this->validate(request);

    const task_id_t id = this->next_id_++;
    auto task = vfs_task_new(id, request);
    this->tasks_.emplace(id, task);

    // subscribers see pending before a worker can publish running
    this->progress_.publish(task->event());
    if (!this->queue_.enqueue(task))
    {
        this->tasks_.erase(id);
        this->progress_.forget(id);
        throw VFSTaskValidationError(std::format("Task {} could not be queued", id));
    }

    ztd::logger::info("Task {} submitted: {}", id, task->name());

    return id;
}

vfs::file_task
vfs::task_scheduler::find(task_id_t id) const noexcept
{
    std::scoped_lock lock(this->mutex_);

    const auto it = this->tasks_.find(id);
    if (it == this->tasks_.cend())
    {
        return nullptr;
    }
    return it->second;
}

void
vfs::task_scheduler::cancel(task_id_t id) noexcept
{
    const auto task = this->find(id);
    if (!task || vfs::is_terminal(task->state()))
    {
        return;
    }

    if (this->queue_.remove(id))
    {
        // never reached a worker
        this->progress_.publish(task->event());
        ztd::logger::info("Task {} canceled before it started", id);
        this->task_finished(task);
        return;
    }

    ztd::logger::info("Task {} cancel requested", id);
}

void
vfs::task_scheduler::pause(task_id_t id) noexcept
{
    const auto task = this->find(id);
    if (!task || task->state() != vfs::file_task_state::running)
    {
        return;
    }

    task->request_pause();
    ztd::logger::info("Task {} pause requested", id);
}

void
vfs::task_scheduler::resume(task_id_t id) noexcept
{
    const auto task = this->find(id);
    if (!task)
    {
        return;
    }

    // also withdraws a pause the worker has not reached yet
    if (task->state() == vfs::file_task_state::paused || task->is_pause_requested())
    {
        task->request_resume();
        ztd::logger::info("Task {} resume requested", id);
    }
}

bool
vfs::task_scheduler::promote(task_id_t id) noexcept
{
    return this->queue_.promote(id);
}

void
vfs::task_scheduler::cancel_all() noexcept
{
    std::vector<task_id_t> ids;
    {
        std::scoped_lock lock(this->mutex_);
        for (const auto& [id, task] : this->tasks_)
        {
            if (!vfs::is_terminal(task->state()))
            {
                ids.push_back(id);
            }
        }
    }

    for (const auto id : ids)
    {
        this->cancel(id);
    }
}

vfs::task_subscription_t
vfs::task_scheduler::subscribe() noexcept
{
    return this->progress_.subscribe();
}

vfs::progress_summary
vfs::task_scheduler::summary() const noexcept
{
    return this->progress_.summary();
}

std::vector<vfs::file_task_snapshot>
vfs::task_scheduler::snapshot() const noexcept
{
    std::scoped_lock lock(this->mutex_);

    std::vector<vfs::file_task_snapshot> snapshots;
    snapshots.reserve(this->tasks_.size());
    for (const auto& [id, task] : this->tasks_)
    {
        snapshots.emplace_back(task->snapshot());
    }
    return snapshots;
}

std::optional<vfs::file_task_snapshot>
vfs::task_scheduler::get(task_id_t id) const noexcept
{
    const auto task = this->find(id);
    if (!task)
    {
        return std::nullopt;
    }
    return task->snapshot();
}

bool
vfs::task_scheduler::evict(task_id_t id) noexcept
{
    std::scoped_lock lock(this->mutex_);

    const auto it = this->tasks_.find(id);
    if (it == this->tasks_.cend() || !vfs::is_terminal(it->second->state()))
    {
        return false;
    }

    this->tasks_.erase(it);
    this->progress_.forget(id);
    return true;
}

usize
vfs::task_scheduler::clear_finished() noexcept
{
    std::scoped_lock lock(this->mutex_);

    const auto count = std::erase_if(this->tasks_,
                                     [this](const auto& item)
                                     {
                                         const auto& [id, task] = item;
                                         if (!vfs::is_terminal(task->state()))
                                         {
                                             return false;
                                         }
                                         this->progress_.forget(id);
                                         return true;
                                     });

    ztd::logger::debug("Cleared {} finished tasks", count);

    return count;
}

bool
vfs::task_scheduler::all_finished() const noexcept
{
    return std::ranges::all_of(this->tasks_,
                               [](const auto& item) { return vfs::is_terminal(item.second->state()); });
}

bool
vfs::task_scheduler::wait_idle(std::chrono::milliseconds timeout) noexcept
{
    std::unique_lock lock(this->mutex_);
    return this->idle_cond_.wait_for(lock, timeout, [this] { return this->all_finished(); });
}

void
vfs::task_scheduler::collect_garbage() noexcept
{
    std::scoped_lock lock(this->mutex_);

    const auto now = std::chrono::steady_clock::now();

    std::vector<std::pair<std::chrono::steady_clock::time_point, task_id_t>> finished;
    for (const auto& [id, task] : this->tasks_)
    {
        const auto finished_at = task->finished_at();
        if (finished_at)
        {
            finished.emplace_back(finished_at.value(), id);
        }
    }
    // oldest first
    std::ranges::sort(finished);

    usize retained = finished.size();
    for (const auto& [finished_at, id] : finished)
    {
        const bool expired = now - finished_at > this->config_.retain_duration;
        const bool excess = retained > this->config_.retain_finished;
        if (!expired && !excess)
        {
            continue;
        }

        this->tasks_.erase(id);
        this->progress_.forget(id);
        retained -= 1;

        ztd::logger::debug("Task {} evicted", id);
    }
}

void
vfs::task_scheduler::task_finished(const vfs::file_task&) noexcept
{
    this->collect_garbage();
    this->idle_cond_.notify_all();
}

void
vfs::task_scheduler::shutdown() noexcept
{
    std::scoped_lock shutdown_lock(this->shutdown_mutex_);
    if (this->stopped_)
    {
        return;
    }

    {
        std::scoped_lock lock(this->mutex_);
        this->accepting_ = false;
    }

    ztd::logger::info("Task scheduler shutting down");

    for (const auto& task : this->queue_.close())
    {
        this->progress_.publish(task->event());
    }

    {
        std::unique_lock lock(this->mutex_);
        const bool idle = this->idle_cond_.wait_for(lock,
                                                    this->config_.grace_period,
                                                    [this] { return this->all_finished(); });
        if (!idle)
        {
            ztd::logger::warn("Canceling tasks still running after {}ms",
                              this->config_.grace_period.count());
            for (const auto& [id, task] : this->tasks_)
            {
                if (!vfs::is_terminal(task->state()))
                {
                    task->request_cancel();
                }
            }
        }
    }

    for (const auto& [type, pool] : this->pools_)
    {
        pool->stop();
    }
    for (const auto& [type, pool] : this->pools_)
    {
        pool->join();
    }

    this->collect_garbage();
    this->stopped_ = true;

    ztd::logger::info("Task scheduler stopped");
}
