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

#include <vector>
#include <map>

#include <optional>

#include <algorithm>
#include <limits>

#include <utility>

#include <mutex>
#include <stop_token>

#include <magic_enum.hpp>

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "vfs/vfs-task-queue.hxx"

vfs::task_queue::task_queue()
{
    for (const auto type : magic_enum::enum_values<vfs::file_task_type>())
    {
        this->partitions_.try_emplace(type);
    }
}

bool
vfs::task_queue::enqueue(const vfs::file_task& task) noexcept
{
    std::scoped_lock lock(this->mutex_);

    if (this->closed_)
    {
        ztd::logger::warn("Task {}: queue is closed", task->id());
        return false;
    }
    if (this->index_.contains(task->id()) || this->dispatched_.contains(task->id()))
    {
        ztd::logger::error("Task {}: already queued", task->id());
        return false;
    }

    const order_key key{task->priority(), task->id()};
    auto& part = this->partitions_.at(task->type());
    part.pending.emplace(key, task);
    this->index_.emplace(task->id(), index_entry{task->type(), key});

    // ztd::logger::trace("Task {}: queued as {}", task->id(), vfs::file_task_type_name(task->type()));

    part.cond.notify_one();
    return true;
}

std::optional<vfs::file_task>
vfs::task_queue::take_front(vfs::task_queue::partition& part) noexcept
{
    if (part.pending.empty())
    {
        return std::nullopt;
    }

    const auto it = part.pending.begin();
    auto task = it->second;
    part.pending.erase(it);
    this->index_.erase(task->id());

    // ownership passes to the worker here
    task->set_state(vfs::file_task_state::running);
    this->dispatched_.emplace(task->id(), task);

    ztd::logger::trace("Task {}: dispatched", task->id());

    return task;
}

std::optional<vfs::file_task>
vfs::task_queue::dequeue(vfs::file_task_type type, std::stop_token stoken)
{
    std::unique_lock lock(this->mutex_);
    auto& part = this->partitions_.at(type);

    const bool ready = part.cond.wait(lock,
                                      stoken,
                                      [this, &part] { return this->closed_ || !part.pending.empty(); });
    if (!ready || this->closed_)
    {
        return std::nullopt;
    }

    return this->take_front(part);
}

std::optional<vfs::file_task>
vfs::task_queue::try_dequeue(vfs::file_task_type type) noexcept
{
    std::scoped_lock lock(this->mutex_);
    if (this->closed_)
    {
        return std::nullopt;
    }
    return this->take_front(this->partitions_.at(type));
}

bool
vfs::task_queue::remove(task_id_t id) noexcept
{
    std::scoped_lock lock(this->mutex_);

    if (this->dispatched_.contains(id))
    {
        this->dispatched_.at(id)->request_cancel();
        return false;
    }

    const auto entry = this->index_.find(id);
    if (entry == this->index_.cend())
    {
        return false;
    }

    auto& part = this->partitions_.at(entry->second.type);
    const auto it = part.pending.find(entry->second.key);
    auto task = it->second;
    part.pending.erase(it);
    this->index_.erase(entry);

    task->request_cancel();
    task->set_state(vfs::file_task_state::canceled);

    ztd::logger::trace("Task {}: removed from queue", id);

    return true;
}

void
vfs::task_queue::complete(task_id_t id) noexcept
{
    std::scoped_lock lock(this->mutex_);
    this->dispatched_.erase(id);
}

bool
vfs::task_queue::rekey(task_id_t id, i32 priority) noexcept
{
    const auto entry = this->index_.find(id);
    if (entry == this->index_.cend())
    {
        return false;
    }

    auto& part = this->partitions_.at(entry->second.type);
    auto node = part.pending.extract(entry->second.key);

    const order_key key{priority, id};
    node.key() = key;
    node.mapped()->priority(priority);
    part.pending.insert(std::move(node));
    entry->second.key = key;

    return true;
}

bool
vfs::task_queue::promote(task_id_t id) noexcept
{
    std::scoped_lock lock(this->mutex_);

    const auto entry = this->index_.find(id);
    if (entry == this->index_.cend())
    {
        return false;
    }

    const auto& part = this->partitions_.at(entry->second.type);
    // the first key has the highest priority
    const i32 highest = part.pending.begin()->first.priority;
    if (part.pending.begin()->first.id == id)
    {
        return true;
    }

    const i32 priority = highest == std::numeric_limits<i32>::max() ? highest : highest + 1;
    return this->rekey(id, priority);
}

bool
vfs::task_queue::set_priority(task_id_t id, i32 priority) noexcept
{
    std::scoped_lock lock(this->mutex_);

    if (this->dispatched_.contains(id))
    {
        this->dispatched_.at(id)->priority(priority);
        return true;
    }
    return this->rekey(id, priority);
}

std::vector<vfs::file_task>
vfs::task_queue::peek_all() const noexcept
{
    std::scoped_lock lock(this->mutex_);

    std::vector<vfs::file_task> tasks;
    tasks.reserve(this->index_.size() + this->dispatched_.size());

    for (const auto& [type, part] : this->partitions_)
    {
        for (const auto& [key, task] : part.pending)
        {
            tasks.emplace_back(task);
        }
    }

    std::vector<vfs::file_task> running;
    running.reserve(this->dispatched_.size());
    for (const auto& [id, task] : this->dispatched_)
    {
        running.emplace_back(task);
    }
    std::ranges::sort(running, {}, [](const vfs::file_task& task) { return task->id(); });
    tasks.insert(tasks.cend(), running.cbegin(), running.cend());

    return tasks;
}

usize
vfs::task_queue::pending_count(vfs::file_task_type type) const noexcept
{
    std::scoped_lock lock(this->mutex_);
    return this->partitions_.at(type).pending.size();
}

usize
vfs::task_queue::dispatched_count() const noexcept
{
    std::scoped_lock lock(this->mutex_);
    return this->dispatched_.size();
}

std::vector<vfs::file_task>
vfs::task_queue::close() noexcept
{
    std::scoped_lock lock(this->mutex_);

    std::vector<vfs::file_task> canceled;
    if (this->closed_)
    {
        return canceled;
    }
    this->closed_ = true;

    for (auto& [type, part] : this->partitions_)
    {
        for (const auto& [key, task] : part.pending)
        {
            task->request_cancel();
            task->set_state(vfs::file_task_state::canceled);
            canceled.emplace_back(task);
        }
        part.pending.clear();
        part.cond.notify_all();
    }
    this->index_.clear();

    ztd::logger::debug("Task queue closed, {} pending tasks canceled", canceled.size());

    return canceled;
}

bool
vfs::task_queue::is_closed() const noexcept
{
    std::scoped_lock lock(this->mutex_);
    return this->closed_;
}
