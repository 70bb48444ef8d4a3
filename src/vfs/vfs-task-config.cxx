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

#include <map>

#include <chrono>

#include <ztd/ztd.hxx>

#include "vfs/vfs-task-config.hxx"

const vfs::scheduler_config
vfs::scheduler_config::defaults() noexcept
{
    vfs::scheduler_config config;

    // trash goes through one directory per mount, keep it serial
    config.pools[vfs::file_task_type::copy] = {.concurrency = 2};
    config.pools[vfs::file_task_type::move] = {.concurrency = 2};
    config.pools[vfs::file_task_type::DELETE] = {.concurrency = 2};
    config.pools[vfs::file_task_type::trash] = {.concurrency = 1};
    config.pools[vfs::file_task_type::link] = {.concurrency = 4};

    return config;
}

const vfs::pool_config
vfs::scheduler_config::pool(vfs::file_task_type type) const noexcept
{
    const auto it = this->pools.find(type);
    if (it == this->pools.cend())
    {
        return vfs::scheduler_config::defaults().pools.at(type);
    }
    return it->second;
}
