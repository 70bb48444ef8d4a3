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

#include <system_error>

#include <magic_enum.hpp>

#include <toml.hpp> // toml11

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "write.hxx"

#include "vfs/vfs-file-task.hxx"
#include "vfs/vfs-task-config.hxx"

#include "settings/config-save.hxx"
#include "settings/disk-format.hxx"

static const toml::table
pack_pools(const vfs::scheduler_config& config)
{
    // the whole toml::value has to get created in one go,
    // construct a table that toml::value can then consume.
    toml::table pools;

    for (const auto type : magic_enum::enum_values<vfs::file_task_type>())
    {
        const auto pool = config.pool(type);
        pools.insert({std::string(vfs::file_task_type_name(type)),
                      toml::value{
                          {TOML_KEY_CONCURRENCY, pool.concurrency},
                          {TOML_KEY_RETRY_BUDGET, pool.retry_budget},
                          {TOML_KEY_RETRY_DELAY, pool.retry_delay.count()},
                      }});
    }

    return pools;
}

bool
save_scheduler_config(const std::filesystem::path& path, const vfs::scheduler_config& config)
{
    const toml::value toml_data = toml::value{
        {TOML_SECTION_VERSION,
         toml::value{
             {TOML_KEY_VERSION, CONFIG_FILE_VERSION},
         }},

        {TOML_SECTION_SCHEDULER,
         toml::value{
             {TOML_KEY_GRACE_PERIOD, config.grace_period.count()},
             {TOML_KEY_RETAIN_FINISHED, config.retain_finished},
             {TOML_KEY_RETAIN_SECONDS, config.retain_duration.count()},
             {TOML_KEY_CHUNK_SIZE, config.chunk_size},
         }},

        {TOML_SECTION_POOL, toml::value(pack_pools(config))},
    };

    const auto parent = path.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent))
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            ztd::logger::error("Failed to create config dir '{}': {}", parent.string(), ec.message());
            return false;
        }
    }

    return write_file(path, toml_data);
}
