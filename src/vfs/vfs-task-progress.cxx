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

#include <optional>

#include <memory>

#include <algorithm>
#include <cmath>

#include <chrono>

#include <mutex>

#include <magic_enum.hpp>

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "vfs/vfs-task-progress.hxx"

u32
vfs::progress_summary::count(vfs::file_task_state state) const noexcept
{
    return this->by_state[magic_enum::enum_index(state).value()];
}

u32
vfs::progress_summary::active() const noexcept
{
    return this->count(vfs::file_task_state::pending) +
           this->count(vfs::file_task_state::running) + this->count(vfs::file_task_state::paused);
}

f64
vfs::progress_summary::percent() const noexcept
{
    if (this->total_bytes != 0)
    {
        return 100.0 * static_cast<f64>(std::min(this->processed_bytes, this->total_bytes)) /
               static_cast<f64>(this->total_bytes);
    }
    // nothing to copy, links and empty files
    if (this->total_items != 0)
    {
        return 100.0 * static_cast<f64>(std::min(this->processed_items, this->total_items)) /
               static_cast<f64>(this->total_items);
    }
    return 0.0;
}

/////////////////////////////////////////////////////////////////////////////////////////
// task_subscription

void
vfs::task_subscription::push(const vfs::progress_event& event,
                             const vfs::progress_summary& summary) noexcept
{
    {
        std::scoped_lock lock(this->mutex_);
        if (this->closed_)
        {
            return;
        }

        this->summary_ = summary;

        const auto it = this->latest_.find(event.id);
        if (it != this->latest_.cend())
        {
            // coalesce, keep the queue position
            it->second = event;
        }
        else
        {
            this->order_.push_back(event.id);
            this->latest_.emplace(event.id, event);
        }
    }
    this->cond_.notify_all();
}

std::optional<vfs::progress_event>
vfs::task_subscription::pop() noexcept
{
    if (this->order_.empty())
    {
        return std::nullopt;
    }

    const auto id = this->order_.front();
    this->order_.pop_front();

    auto node = this->latest_.extract(id);
    return node.mapped();
}

std::optional<vfs::progress_event>
vfs::task_subscription::next(std::chrono::milliseconds timeout)
{
    std::unique_lock lock(this->mutex_);
    this->cond_.wait_for(lock, timeout, [this] { return !this->order_.empty() || this->closed_; });
    return this->pop();
}

std::optional<vfs::progress_event>
vfs::task_subscription::try_next() noexcept
{
    std::scoped_lock lock(this->mutex_);
    return this->pop();
}

vfs::progress_summary
vfs::task_subscription::summary() const noexcept
{
    std::scoped_lock lock(this->mutex_);
    return this->summary_;
}

usize
vfs::task_subscription::pending() const noexcept
{
    std::scoped_lock lock(this->mutex_);
    return this->order_.size();
}

bool
vfs::task_subscription::is_closed() const noexcept
{
    std::scoped_lock lock(this->mutex_);
    return this->closed_;
}

void
vfs::task_subscription::close() noexcept
{
    {
        std::scoped_lock lock(this->mutex_);
        this->closed_ = true;
    }
    this->cond_.notify_all();
}

/////////////////////////////////////////////////////////////////////////////////////////
// task_progress

static void
adjust(u64& sum, u64 value, i32 sign) noexcept
{
    if (sign > 0)
    {
        sum += value;
    }
    else
    {
        sum -= value;
    }
}

void
vfs::task_progress::add(const vfs::progress_event& event, i32 sign) noexcept
{
    auto& state_count = this->by_state_[magic_enum::enum_index(event.state).value()];
    state_count = sign > 0 ? state_count + 1 : state_count - 1;

    if (vfs::is_terminal(event.state))
    {
        return;
    }

    const auto& progress = event.progress;
    adjust(this->processed_bytes_, progress.processed_bytes, sign);
    adjust(this->processed_items_, progress.processed_items, sign);

    if (!progress.total_bytes || !progress.total_items)
    {
        this->unknown_totals_ = sign > 0 ? this->unknown_totals_ + 1 : this->unknown_totals_ - 1;
    }
    if (progress.total_bytes)
    {
        adjust(this->total_bytes_, progress.total_bytes.value(), sign);
    }
    if (progress.total_items)
    {
        adjust(this->total_items_, progress.total_items.value(), sign);
    }
}

void
vfs::task_progress::sample(std::chrono::steady_clock::time_point now) noexcept
{
    if (this->samples_.empty() || now - this->samples_.back().first >= sample_interval)
    {
        this->samples_.emplace_back(now, this->bytes_done_);
    }

    while (this->samples_.size() > 1 && now - this->samples_.front().first > window)
    {
        this->samples_.pop_front();
    }
}

vfs::progress_summary
vfs::task_progress::build_summary(std::chrono::steady_clock::time_point now) const noexcept
{
    vfs::progress_summary summary;
    summary.processed_bytes = this->processed_bytes_;
    summary.total_bytes = this->total_bytes_;
    summary.processed_items = this->processed_items_;
    summary.total_items = this->total_items_;
    summary.unknown_totals = this->unknown_totals_;
    summary.by_state = this->by_state_;

    // oldest sample still inside the window
    const auto oldest = std::ranges::find_if(this->samples_,
                                             [now](const auto& sample)
                                             { return now - sample.first <= window; });
    if (oldest != this->samples_.cend())
    {
        const std::chrono::duration<f64> elapsed = now - oldest->first;
        if (elapsed.count() > 0.0)
        {
            summary.bytes_per_second =
                static_cast<f64>(this->bytes_done_ - oldest->second) / elapsed.count();
        }
    }

    if (summary.bytes_per_second > 0.0 && summary.unknown_totals == 0 && summary.active() != 0)
    {
        const u64 remaining = summary.total_bytes > summary.processed_bytes
                                  ? summary.total_bytes - summary.processed_bytes
                                  : 0;
        summary.eta = std::chrono::seconds(static_cast<i64>(
            std::ceil(static_cast<f64>(remaining) / summary.bytes_per_second)));
    }

    return summary;
}

void
vfs::task_progress::publish(const vfs::progress_event& event) noexcept
{
    const auto now = std::chrono::steady_clock::now();

    std::scoped_lock lock(this->mutex_);

    const auto it = this->last_.find(event.id);
    if (it != this->last_.cend())
    {
        if (event.progress.processed_bytes > it->second.progress.processed_bytes)
        {
            this->bytes_done_ += event.progress.processed_bytes - it->second.progress.processed_bytes;
        }
        this->add(it->second, -1);
        it->second = event;
    }
    else
    {
        this->bytes_done_ += event.progress.processed_bytes;
        this->last_.emplace(event.id, event);
    }
    this->add(event, 1);

    this->sample(now);
    const auto summary = this->build_summary(now);

    // delivered under the lock, every subscriber sees one global event order
    std::erase_if(this->subscribers_,
                  [&event, &summary](const std::weak_ptr<vfs::task_subscription>& weak)
                  {
                      const auto subscriber = weak.lock();
                      if (!subscriber)
                      {
                          return true;
                      }
                      subscriber->push(event, summary);
                      return false;
                  });
}

void
vfs::task_progress::forget(task_id_t id) noexcept
{
    std::scoped_lock lock(this->mutex_);

    const auto it = this->last_.find(id);
    if (it == this->last_.cend())
    {
        return;
    }
    this->add(it->second, -1);
    this->last_.erase(it);
}

vfs::progress_summary
vfs::task_progress::summary() const noexcept
{
    std::scoped_lock lock(this->mutex_);
    return this->build_summary(std::chrono::steady_clock::now());
}

vfs::task_subscription_t
vfs::task_progress::subscribe() noexcept
{
    auto subscription = std::make_shared<vfs::task_subscription>();

    std::scoped_lock lock(this->mutex_);

    std::vector<task_id_t> ids;
    ids.reserve(this->last_.size());
    for (const auto& [id, event] : this->last_)
    {
        ids.push_back(id);
    }
    std::ranges::sort(ids);

    const auto summary = this->build_summary(std::chrono::steady_clock::now());
    for (const auto id : ids)
    {
        subscription->push(this->last_.at(id), summary);
    }

    this->subscribers_.emplace_back(subscription);

    ztd::logger::debug("New progress subscriber, {} tasks", ids.size());

    return subscription;
}

void
vfs::task_progress::close_all() noexcept
{
    std::scoped_lock lock(this->mutex_);

    for (const auto& weak : this->subscribers_)
    {
        const auto subscriber = weak.lock();
        if (subscriber)
        {
            subscriber->close();
        }
    }
    this->subscribers_.clear();
}
