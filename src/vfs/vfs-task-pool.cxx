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

#include <memory>

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "vfs/vfs-task-pool.hxx"

vfs::task_pool::task_pool(vfs::file_task_type type, vfs::task_queue& queue,
                          const vfs::file_task_backend_t& backend, vfs::task_progress& progress)
    : type_(type), queue_(queue), backend_(backend), progress_(progress)
{
}

vfs::task_pool::~task_pool()
{
    this->stop();
    this->join();
}

void
vfs::task_pool::run(const vfs::pool_config& config)
{
    if (!this->workers_.empty())
    {
        return;
    }

    for (u32 i = 0; i < config.concurrency; ++i)
    {
        auto worker = std::make_unique<vfs::task_worker>(i,
                                                         this->type_,
                                                         config,
                                                         this->queue_,
                                                         this->backend_,
                                                         this->progress_);
        if (this->evt_task_finish)
        {
            worker->add_event<taskfm::signal::task_finish>(this->evt_task_finish,
                                                          this->evt_data_scheduler);
        }
        worker->run();
        this->workers_.emplace_back(std::move(worker));
    }

    ztd::logger::info("Started {} {} workers", this->workers_.size(), vfs::file_task_type_name(this->type_));
}

void
vfs::task_pool::stop() noexcept
{
    for (const auto& worker : this->workers_)
    {
        worker->stop();
    }
}

void
vfs::task_pool::join() noexcept
{
    for (const auto& worker : this->workers_)
    {
        worker->join();
    }
}
