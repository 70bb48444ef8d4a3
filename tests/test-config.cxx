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

#include <fstream>

#include <chrono>

#include <gtest/gtest.h>

#include "vfs/vfs-file-task.hxx"
#include "vfs/vfs-task-config.hxx"

#include "settings/config-load.hxx"
#include "settings/config-save.hxx"

#include "test-helpers.hxx"

using namespace std::chrono_literals;

static void
write_config(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream file(path);
    file << content;
}

static void
expect_defaults(const vfs::scheduler_config& config)
{
    const auto defaults = vfs::scheduler_config::defaults();
    EXPECT_EQ(config.grace_period, defaults.grace_period);
    EXPECT_EQ(config.retain_finished, defaults.retain_finished);
    EXPECT_EQ(config.retain_duration, defaults.retain_duration);
    EXPECT_EQ(config.chunk_size, defaults.chunk_size);
    for (const auto& [type, pool] : defaults.pools)
    {
        EXPECT_EQ(config.pool(type).concurrency, pool.concurrency);
        EXPECT_EQ(config.pool(type).retry_budget, pool.retry_budget);
        EXPECT_EQ(config.pool(type).retry_delay, pool.retry_delay);
    }
}

TEST(config, defaults)
{
    const auto config = vfs::scheduler_config::defaults();
    EXPECT_EQ(config.pools.size(), 5u);
    EXPECT_EQ(config.pool(vfs::file_task_type::trash).concurrency, 1u);
    EXPECT_GT(config.chunk_size, 0u);

    // a kind missing from the map falls back to its default
    vfs::scheduler_config empty;
    EXPECT_EQ(empty.pool(vfs::file_task_type::link).concurrency,
              config.pool(vfs::file_task_type::link).concurrency);
}

TEST(config, missing_file)
{
    test::temp_dir tmp;
    expect_defaults(load_scheduler_config(tmp / "missing.toml"));
}

TEST(config, load)
{
    test::temp_dir tmp;
    write_config(tmp / "taskfm.toml", R"toml(
[Version]
version = 1

[Scheduler]
grace_period_ms = 1500
retain_finished = 10
retain_seconds = 60
chunk_size = 4096

[Pool.copy]
concurrency = 4
retry_budget = 1

[Pool.delete]
concurrency = 0
retry_delay_ms = 10
)toml");

    const auto config = load_scheduler_config(tmp / "taskfm.toml");
    EXPECT_EQ(config.grace_period, 1500ms);
    EXPECT_EQ(config.retain_finished, 10u);
    EXPECT_EQ(config.retain_duration, 60s);
    EXPECT_EQ(config.chunk_size, 4096u);

    const auto copy = config.pool(vfs::file_task_type::copy);
    EXPECT_EQ(copy.concurrency, 4u);
    EXPECT_EQ(copy.retry_budget, 1u);
    EXPECT_EQ(copy.retry_delay, vfs::pool_config{}.retry_delay);

    const auto del = config.pool(vfs::file_task_type::DELETE);
    EXPECT_EQ(del.concurrency, 0u);
    EXPECT_EQ(del.retry_delay, 10ms);

    // untouched kinds keep their defaults
    EXPECT_EQ(config.pool(vfs::file_task_type::trash).concurrency,
              vfs::scheduler_config::defaults().pool(vfs::file_task_type::trash).concurrency);
}

TEST(config, partial_file)
{
    test::temp_dir tmp;
    write_config(tmp / "taskfm.toml", "[Scheduler]\nretain_finished = 3\n");

    const auto config = load_scheduler_config(tmp / "taskfm.toml");
    EXPECT_EQ(config.retain_finished, 3u);
    EXPECT_EQ(config.grace_period, vfs::scheduler_config::defaults().grace_period);
}

TEST(config, syntax_error)
{
    test::temp_dir tmp;
    write_config(tmp / "taskfm.toml", "[Scheduler]\nretain_finished = = 3\n");

    expect_defaults(load_scheduler_config(tmp / "taskfm.toml"));
}

TEST(config, type_error)
{
    test::temp_dir tmp;
    // nothing from a broken file is applied
    write_config(tmp / "taskfm.toml",
                 "[Scheduler]\nretain_finished = 3\n\n[Pool.copy]\nconcurrency = \"many\"\n");

    expect_defaults(load_scheduler_config(tmp / "taskfm.toml"));
}

TEST(config, zero_chunk_size)
{
    test::temp_dir tmp;
    write_config(tmp / "taskfm.toml", "[Scheduler]\nchunk_size = 0\n");

    const auto config = load_scheduler_config(tmp / "taskfm.toml");
    EXPECT_EQ(config.chunk_size, vfs::scheduler_config::defaults().chunk_size);
}

TEST(config, unknown_kind)
{
    test::temp_dir tmp;
    write_config(tmp / "taskfm.toml",
                 "[Pool.shred]\nconcurrency = 9\n\n[Pool.link]\nconcurrency = 7\n");

    const auto config = load_scheduler_config(tmp / "taskfm.toml");
    EXPECT_EQ(config.pool(vfs::file_task_type::link).concurrency, 7u);
    EXPECT_EQ(config.pools.size(), 5u);
}

TEST(config, save_and_load)
{
    test::temp_dir tmp;

    auto config = vfs::scheduler_config::defaults();
    config.grace_period = 250ms;
    config.retain_finished = 2;
    config.retain_duration = 30s;
    config.chunk_size = 1024;
    config.pools[vfs::file_task_type::move] = {.concurrency = 3, .retry_budget = 0, .retry_delay = 5ms};

    // parent directories are created
    const auto path = tmp / "config/taskfm/taskfm.toml";
    ASSERT_TRUE(save_scheduler_config(path, config));

    const auto loaded = load_scheduler_config(path);
    EXPECT_EQ(loaded.grace_period, 250ms);
    EXPECT_EQ(loaded.retain_finished, 2u);
    EXPECT_EQ(loaded.retain_duration, 30s);
    EXPECT_EQ(loaded.chunk_size, 1024u);

    const auto move = loaded.pool(vfs::file_task_type::move);
    EXPECT_EQ(move.concurrency, 3u);
    EXPECT_EQ(move.retry_budget, 0u);
    EXPECT_EQ(move.retry_delay, 5ms);

    EXPECT_EQ(loaded.pool(vfs::file_task_type::copy).concurrency,
              config.pool(vfs::file_task_type::copy).concurrency);
}
