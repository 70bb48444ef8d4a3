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

#include <format>

#include <filesystem>

#include <chrono>

#include <stdexcept>

#include <toml.hpp> // toml11

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "vfs/vfs-file-task.hxx"
#include "vfs/vfs-task-config.hxx"

#include "settings/config-load.hxx"
#include "settings/disk-format.hxx"

static u64
get_config_file_version(const toml::value& tbl)
{
    if (!tbl.contains(TOML_SECTION_VERSION))
    {
        ztd::logger::error("config missing TOML section [{}]", TOML_SECTION_VERSION);
        return 0;
    }

    const auto& version = toml::find(tbl, TOML_SECTION_VERSION);

    const auto config_version = toml::find<u64>(version, TOML_KEY_VERSION);
    return config_version;
}

static void
config_parse_scheduler(const toml::value& tbl, u64 version, vfs::scheduler_config& config)
{
    (void)version;

    if (!tbl.contains(TOML_SECTION_SCHEDULER))
    {
        return;
    }

    const auto& section = toml::find(tbl, TOML_SECTION_SCHEDULER);

    if (section.contains(TOML_KEY_GRACE_PERIOD))
    {
        const auto grace_period = toml::find<u64>(section, TOML_KEY_GRACE_PERIOD);
        config.grace_period = std::chrono::milliseconds(grace_period);
    }

    if (section.contains(TOML_KEY_RETAIN_FINISHED))
    {
        const auto retain_finished = toml::find<u32>(section, TOML_KEY_RETAIN_FINISHED);
        config.retain_finished = retain_finished;
    }

    if (section.contains(TOML_KEY_RETAIN_SECONDS))
    {
        const auto retain_seconds = toml::find<u64>(section, TOML_KEY_RETAIN_SECONDS);
        config.retain_duration = std::chrono::seconds(retain_seconds);
    }

    if (section.contains(TOML_KEY_CHUNK_SIZE))
    {
        const auto chunk_size = toml::find<u64>(section, TOML_KEY_CHUNK_SIZE);
        if (chunk_size == 0)
        {
            ztd::logger::error("config [{}] {} must be positive",
                               TOML_SECTION_SCHEDULER,
                               TOML_KEY_CHUNK_SIZE);
        }
        else
        {
            config.chunk_size = chunk_size;
        }
    }
}

static void
config_parse_pool(const toml::value& section, vfs::pool_config& pool)
{
    if (section.contains(TOML_KEY_CONCURRENCY))
    {
        pool.concurrency = toml::find<u32>(section, TOML_KEY_CONCURRENCY);
    }

    if (section.contains(TOML_KEY_RETRY_BUDGET))
    {
        pool.retry_budget = toml::find<u32>(section, TOML_KEY_RETRY_BUDGET);
    }

    if (section.contains(TOML_KEY_RETRY_DELAY))
    {
        const auto retry_delay = toml::find<u64>(section, TOML_KEY_RETRY_DELAY);
        pool.retry_delay = std::chrono::milliseconds(retry_delay);
    }
}

static void
config_parse_pools(const toml::value& tbl, u64 version, vfs::scheduler_config& config)
{
    (void)version;

    if (!tbl.contains(TOML_SECTION_POOL))
    {
        return;
    }

    // loop over all of [Pool.kind]
    for (const auto& [toml_name, toml_section] : toml::find<toml::table>(tbl, TOML_SECTION_POOL))
    {
        const std::string name = toml_name.data();

        const auto type = vfs::file_task_type_from_name(name);
        if (!type)
        {
            ztd::logger::error("config unknown task type [{}.{}]", TOML_SECTION_POOL, name);
            continue;
        }

        auto pool = config.pool(type.value());
        config_parse_pool(toml_section, pool);
        config.pools[type.value()] = pool;
    }
}

const vfs::scheduler_config
load_scheduler_config(const std::filesystem::path& path)
{
    const auto defaults = vfs::scheduler_config::defaults();

    if (!std::filesystem::exists(path))
    {
        ztd::logger::info("No config file at '{}', using defaults", path.string());
        return defaults;
    }

    // parse into a copy, a broken file must not leave a half applied config
    auto config = defaults;
    try
    {
        const auto tbl = toml::parse(path);

        const u64 version = get_config_file_version(tbl);
        if (version > CONFIG_FILE_VERSION)
        {
            ztd::logger::warn("Config file version {} is newer than {}", version, CONFIG_FILE_VERSION);
        }

        config_parse_scheduler(tbl, version, config);
        config_parse_pools(tbl, version, config);
    }
    catch (const toml::syntax_error& e)
    {
        ztd::logger::error("Config file parsing failed: {}", e.what());
        return defaults;
    }
    catch (const toml::type_error& e)
    {
        ztd::logger::error("Config file has a bad value: {}", e.what());
        return defaults;
    }
    catch (const std::runtime_error& e)
    {
        // unreadable file
        ztd::logger::error("Config file loading failed: {}", e.what());
        return defaults;
    }

    ztd::logger::info("Loaded config file '{}'", path.string());

    return config;
}
