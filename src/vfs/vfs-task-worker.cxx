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

#include <filesystem>

#include <thread>
#include <stop_token>

#include <vector>

#include <iterator>

#include <memory>

#include <chrono>

#include <exception>

#include <magic_enum.hpp>

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "vfs/vfs-task-worker.hxx"

vfs::task_worker::task_worker(u32 number, vfs::file_task_type type,
                              const vfs::pool_config& config, vfs::task_queue& queue,
                              const vfs::file_task_backend_t& backend,
                              vfs::task_progress& progress)
    : number_(number), type_(type), config_(config), queue_(queue), backend_(backend),
      progress_(progress)
{
}

vfs::task_worker::~task_worker()
{
    this->stop();
    this->join();
}

void
vfs::task_worker::run()
{
    if (this->running_)
    {
        return;
    }

    this->running_ = true;
    this->thread_ = std::jthread([this](std::stop_token stoken) { this->loop(stoken); });
}

void
vfs::task_worker::stop() noexcept
{
    if (!this->thread_.joinable())
    {
        return;
    }
    this->thread_.request_stop();
}

void
vfs::task_worker::join() noexcept
{
    if (!this->thread_.joinable())
    {
        return;
    }
    this->thread_.join();
    this->running_ = false;
}

void
vfs::task_worker::loop(std::stop_token stoken) noexcept
{
    ztd::logger::debug("{} worker {} started", vfs::file_task_type_name(this->type_), this->number_);

    while (!stoken.stop_requested())
    {
        const auto task = this->queue_.dequeue(this->type_, stoken);
        if (!task)
        {
            break;
        }

        try
        {
            this->execute(task.value());
        }
        catch (const std::exception& e)
        {
            ztd::logger::error("Task {}: {}", task.value()->id(), e.what());
            task.value()->set_error({.message = e.what()});
            if (!vfs::is_terminal(task.value()->state()))
            {
                this->finish(task.value(), vfs::file_task_state::failed);
            }
        }
    }

    ztd::logger::debug("{} worker {} stopped", vfs::file_task_type_name(this->type_), this->number_);
}

void
vfs::task_worker::publish(const vfs::file_task& task) noexcept
{
    this->progress_.publish(task->event());
}

enum class attempt_result
{
    done,
    failed,
    canceled,
};

/**
 * Runs 'func' until it succeeds, throws a non retryable error or the
 * retry budget is spent. On failure the error is recorded on the task.
 * A cancel request ends the retries.
 */
template<typename F>
static attempt_result
run_with_retry(const vfs::file_task& task, const vfs::pool_config& config,
               const std::filesystem::path& source, const std::filesystem::path& target, F&& func)
{
    for (u32 attempt = 0; true; ++attempt)
    {
        try
        {
            func();
            return attempt_result::done;
        }
        catch (const VFSTaskRetryableError& e)
        {
            if (attempt >= config.retry_budget)
            {
                ztd::logger::error("Task {}: giving up after {} attempts: {}",
                                   task->id(),
                                   attempt + 1,
                                   e.what());
                task->set_error({e.code(), e.what(), source, target});
                return attempt_result::failed;
            }

            ztd::logger::warn("Task {}: retry {}/{}: {}",
                              task->id(),
                              attempt + 1,
                              config.retry_budget,
                              e.what());
            if (task->wait_for_cancel(config.retry_delay))
            {
                ztd::logger::info("Task {}: canceled while waiting to retry", task->id());
                return attempt_result::canceled;
            }
            task->add_retry();
        }
        catch (const VFSTaskException& e)
        {
            ztd::logger::error("Task {}: {}", task->id(), e.what());
            task->set_error({e.code(), e.what(), source, target});
            return attempt_result::failed;
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            ztd::logger::error("Task {}: {}", task->id(), e.what());
            task->set_error({e.code().value(), e.what(), source, target});
            return attempt_result::failed;
        }
        catch (const std::exception& e)
        {
            ztd::logger::error("Task {}: {}", task->id(), e.what());
            task->set_error({0, e.what(), source, target});
            return attempt_result::failed;
        }
    }
}

bool
vfs::task_worker::checkpoint(const vfs::file_task& task)
{
    if (task->is_cancel_requested())
    {
        return false;
    }

    if (!task->is_pause_requested())
    {
        return true;
    }

    if (task->set_state(vfs::file_task_state::paused))
    {
        ztd::logger::info("Task {} paused", task->id());
        this->publish(task);
    }

    task->wait_for_resume();

    // a canceled pause goes through running too
    task->set_state(vfs::file_task_state::running);
    this->publish(task);
    if (task->is_cancel_requested())
    {
        return false;
    }

    ztd::logger::info("Task {} resumed", task->id());
    return true;
}

void
vfs::task_worker::rollback(const vfs::file_task_unit* last_unit) noexcept
{
    if (last_unit == nullptr || last_unit->type != vfs::file_task_unit_type::copy_chunk)
    {
        return;
    }

    // the file was left half written
    if (last_unit->offset + last_unit->length < last_unit->file_size)
    {
        this->backend_->rollback(*last_unit);
    }
}

void
vfs::task_worker::rollback_failed(const vfs::file_task_unit& unit) noexcept
{
    // the chunk may have written part of its range before it threw
    if (unit.type == vfs::file_task_unit_type::copy_chunk)
    {
        this->backend_->rollback(unit);
    }
}

void
vfs::task_worker::finish(const vfs::file_task& task, vfs::file_task_state state)
{
    if (state == vfs::file_task_state::succeeded)
    {
        task->settle_progress();
    }

    task->set_state(state);
    this->publish(task);
    this->queue_.complete(task->id());

    const auto progress = task->progress();
    ztd::logger::info("Task {} {}: {} ({} bytes, {} items)",
                      task->id(),
                      magic_enum::enum_name(state),
                      task->name(),
                      progress.processed_bytes,
                      progress.processed_items);

    this->run_event<taskfm::signal::task_finish>(task);
}

void
vfs::task_worker::execute(const vfs::file_task& task)
{
    // the queue already moved the task to running
    ztd::logger::info("Task {} started: {}", task->id(), task->name());
    this->publish(task);

    // sizing pass
    std::vector<vfs::file_task_unit> units;
    vfs::file_task_claims claims;
    for (const auto& path : task->paths())
    {
        if (!this->checkpoint(task))
        {
            this->finish(task, vfs::file_task_state::canceled);
            return;
        }

        std::vector<vfs::file_task_unit> planned;
        const auto result = run_with_retry(
            task,
            this->config_,
            path.source,
            path.target,
            [&] { planned = this->backend_->plan(task->type(), path, task->options(), claims); });
        if (result != attempt_result::done)
        {
            this->finish(task,
                         result == attempt_result::canceled ? vfs::file_task_state::canceled
                                                            : vfs::file_task_state::failed);
            return;
        }

        units.insert(units.cend(),
                     std::make_move_iterator(planned.begin()),
                     std::make_move_iterator(planned.end()));
    }

    u64 total_bytes = 0;
    u64 total_items = 0;
    for (const auto& unit : units)
    {
        total_bytes += unit.length;
        total_items += unit.items;
    }
    task->revise_totals(total_bytes, total_items);
    this->publish(task);

    ztd::logger::debug("Task {}: {} units, {} bytes, {} items",
                       task->id(),
                       units.size(),
                       total_bytes,
                       total_items);

    const vfs::file_task_unit* last_unit = nullptr;
    for (const auto& unit : units)
    {
        if (!this->checkpoint(task))
        {
            this->rollback(last_unit);
            this->finish(task, vfs::file_task_state::canceled);
            return;
        }

        vfs::file_task_unit_result result;
        const auto attempt = run_with_retry(task,
                                            this->config_,
                                            unit.source,
                                            unit.target,
                                            [&] { result = this->backend_->execute_unit(unit); });
        if (attempt != attempt_result::done)
        {
            this->rollback_failed(unit);
            this->finish(task,
                         attempt == attempt_result::canceled ? vfs::file_task_state::canceled
                                                             : vfs::file_task_state::failed);
            return;
        }
        last_unit = &unit;

        task->add_progress(result.bytes, result.items);
        this->publish(task);
    }

    // a cancel that arrived during the last unit still wins
    if (task->is_cancel_requested())
    {
        this->finish(task, vfs::file_task_state::canceled);
        return;
    }

    this->finish(task, vfs::file_task_state::succeeded);
}
