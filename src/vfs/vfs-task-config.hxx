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

#include <map>

#include <chrono>

#include <ztd/ztd.hxx>

#include "types.hxx"

#include "vfs/vfs-file-task.hxx"

namespace vfs
{
    struct pool_config
    {
        // 0 disables the kind, submissions are rejected
        u32 concurrency{1};
        // retries after the first attempt of a unit
        u32 retry_budget{3};
        std::chrono::milliseconds retry_delay{250};
    };

    struct scheduler_config
    {
        std::map<file_task_type, pool_config> pools{};

        // how long shutdown() lets running tasks finish before canceling them
        std::chrono::milliseconds grace_period{5000};

        // finished tasks kept for the UI
        u32 retain_finished{64};
        std::chrono::seconds retain_duration{300};

        // local backend copy chunk
        u64 chunk_size{8 * MiB};

        static const scheduler_config defaults() noexcept;

        // the pool config for 'type', defaults if the kind is missing
        const pool_config pool(file_task_type type) const noexcept;
    };
} // namespace vfs
