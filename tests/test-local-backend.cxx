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

#include <fstream>
#include <sstream>

#include <chrono>

#include <vector>

#include <cerrno>

#include <sys/stat.h>

#include <gtest/gtest.h>

#include "vfs/vfs-file-task.hxx"
#include "vfs/vfs-file-backend.hxx"
#include "vfs/vfs-local-backend.hxx"

#include "test-helpers.hxx"

using unit_type = vfs::file_task_unit_type;
using overwrite = vfs::file_task_overwrite_mode;

static void
write_text(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream file(path);
    file << content;
}

static const std::string
read_text(const std::filesystem::path& path)
{
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

class local_backend_test : public ::testing::Test
{
  protected:
    void
    SetUp() override
    {
        std::filesystem::create_directories(this->tmp / "src");
        std::filesystem::create_directories(this->tmp / "dst");
    }

    std::vector<vfs::file_task_unit>
    plan(vfs::file_task_type type, const vfs::file_task_path& path,
         const vfs::file_task_options& options = {})
    {
        vfs::file_task_claims claims;
        return this->backend.plan(type, path, options, claims);
    }

    // plan every source into 'dest_dir' before executing anything, the way a worker runs a task
    void
    run_batch(vfs::file_task_type type, const std::vector<std::filesystem::path>& sources,
              const std::filesystem::path& dest_dir, overwrite mode)
    {
        const vfs::file_task_options options{.overwrite_mode = mode};
        vfs::file_task_claims claims;
        std::vector<vfs::file_task_unit> units;
        for (const auto& source : sources)
        {
            const auto planned =
                this->backend.plan(type, {source, dest_dir / source.filename()}, options, claims);
            units.insert(units.cend(), planned.cbegin(), planned.cend());
        }
        for (const auto& unit : units)
        {
            this->backend.execute_unit(unit);
        }
    }

    // plan and execute every unit, the way a worker does
    vfs::file_task_unit_result
    run(vfs::file_task_type type, const std::filesystem::path& source,
        const std::filesystem::path& target = {}, overwrite mode = overwrite::fail,
        bool relative = false)
    {
        const vfs::file_task_options options{.overwrite_mode = mode, .relative_links = relative};
        vfs::file_task_unit_result total;
        for (const auto& unit : this->plan(type, {source, target}, options))
        {
            const auto result = this->backend.execute_unit(unit);
            total.bytes += result.bytes;
            total.items += result.items;
        }
        return total;
    }

    test::temp_dir tmp;
    vfs::local_backend backend{4, this->tmp / "Trash"};
};

TEST_F(local_backend_test, plan_copy_chunks)
{
    write_text(this->tmp / "src/a.txt", "0123456789");

    const auto units = this->plan(vfs::file_task_type::copy,
                                          {this->tmp / "src/a.txt", this->tmp / "dst/a.txt"},
                                          {});
    ASSERT_EQ(units.size(), 3u);
    EXPECT_EQ(units[0].type, unit_type::copy_chunk);
    EXPECT_EQ(units[0].offset, 0u);
    EXPECT_EQ(units[0].length, 4u);
    EXPECT_EQ(units[0].items, 0u);
    EXPECT_EQ(units[1].offset, 4u);
    EXPECT_EQ(units[2].offset, 8u);
    EXPECT_EQ(units[2].length, 2u);
    EXPECT_EQ(units[2].items, 1u);
    for (const auto& unit : units)
    {
        EXPECT_EQ(unit.file_size, 10u);
    }
}

TEST_F(local_backend_test, copy_file)
{
    write_text(this->tmp / "src/a.txt", "0123456789");
    std::filesystem::permissions(this->tmp / "src/a.txt",
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write |
                                     std::filesystem::perms::owner_exec);

    const auto result = this->run(vfs::file_task_type::copy,
                                  this->tmp / "src/a.txt",
                                  this->tmp / "dst/a.txt");
    EXPECT_EQ(result.bytes, 10u);
    EXPECT_EQ(result.items, 1u);

    EXPECT_EQ(read_text(this->tmp / "dst/a.txt"), "0123456789");
    EXPECT_EQ(read_text(this->tmp / "src/a.txt"), "0123456789");
    EXPECT_EQ(std::filesystem::status(this->tmp / "dst/a.txt").permissions(),
              std::filesystem::status(this->tmp / "src/a.txt").permissions());
    // times are restored with second precision
    EXPECT_EQ(std::chrono::floor<std::chrono::seconds>(
                  std::filesystem::last_write_time(this->tmp / "dst/a.txt")),
              std::chrono::floor<std::chrono::seconds>(
                  std::filesystem::last_write_time(this->tmp / "src/a.txt")));
}

TEST_F(local_backend_test, copy_empty_file)
{
    write_text(this->tmp / "src/empty", "");

    const auto result =
        this->run(vfs::file_task_type::copy, this->tmp / "src/empty", this->tmp / "dst/empty");
    EXPECT_EQ(result.bytes, 0u);
    EXPECT_EQ(result.items, 1u);
    EXPECT_TRUE(std::filesystem::is_regular_file(this->tmp / "dst/empty"));
}

TEST_F(local_backend_test, copy_tree)
{
    std::filesystem::create_directories(this->tmp / "src/dir/sub");
    write_text(this->tmp / "src/dir/a", "aaaaa");
    write_text(this->tmp / "src/dir/sub/b", "bb");
    std::filesystem::create_symlink("a", this->tmp / "src/dir/link");

    const auto result =
        this->run(vfs::file_task_type::copy, this->tmp / "src/dir", this->tmp / "dst/dir");
    // symlinks are copied as links and add no bytes
    EXPECT_EQ(result.bytes, 7u);
    // dir, a, link, sub, b
    EXPECT_EQ(result.items, 5u);

    EXPECT_EQ(read_text(this->tmp / "dst/dir/a"), "aaaaa");
    EXPECT_EQ(read_text(this->tmp / "dst/dir/sub/b"), "bb");
    ASSERT_TRUE(std::filesystem::is_symlink(this->tmp / "dst/dir/link"));
    EXPECT_EQ(std::filesystem::read_symlink(this->tmp / "dst/dir/link").string(), "a");
}

TEST_F(local_backend_test, copy_skips_special_files)
{
    std::filesystem::create_directories(this->tmp / "src/dir");
    ASSERT_EQ(mkfifo((this->tmp / "src/dir/fifo").c_str(), 0600), 0);
    write_text(this->tmp / "src/dir/a", "a");

    this->run(vfs::file_task_type::copy, this->tmp / "src/dir", this->tmp / "dst/dir");
    EXPECT_TRUE(std::filesystem::exists(this->tmp / "dst/dir/a"));
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(this->tmp / "dst/dir/fifo")));
}

TEST_F(local_backend_test, copy_into_itself)
{
    std::filesystem::create_directories(this->tmp / "src/dir");

    try
    {
        this->plan(vfs::file_task_type::copy,
                           {this->tmp / "src/dir", this->tmp / "src/dir/inner"},
                           {});
        FAIL() << "copying a directory into itself was planned";
    }
    catch (const VFSTaskFatalError& e)
    {
        EXPECT_EQ(e.code(), EINVAL);
    }
}

TEST_F(local_backend_test, missing_source)
{
    try
    {
        this->plan(vfs::file_task_type::copy,
                           {this->tmp / "src/nope", this->tmp / "dst/nope"},
                           {});
        FAIL() << "a missing source was planned";
    }
    catch (const VFSTaskFatalError& e)
    {
        EXPECT_EQ(e.code(), ENOENT);
    }
}

TEST_F(local_backend_test, overwrite_mode_fail)
{
    write_text(this->tmp / "src/a", "new");
    write_text(this->tmp / "dst/a", "old");

    try
    {
        this->plan(vfs::file_task_type::copy, {this->tmp / "src/a", this->tmp / "dst/a"}, {});
        FAIL() << "an existing destination was planned";
    }
    catch (const VFSTaskFatalError& e)
    {
        EXPECT_EQ(e.code(), EEXIST);
    }
    EXPECT_EQ(read_text(this->tmp / "dst/a"), "old");
}

TEST_F(local_backend_test, overwrite_mode_skip)
{
    write_text(this->tmp / "src/a", "new");
    write_text(this->tmp / "dst/a", "old");

    const auto units = this->plan(vfs::file_task_type::copy,
                                          {this->tmp / "src/a", this->tmp / "dst/a"},
                                          {.overwrite_mode = overwrite::skip});
    EXPECT_TRUE(units.empty());
    EXPECT_EQ(read_text(this->tmp / "dst/a"), "old");
}

TEST_F(local_backend_test, overwrite_mode_overwrite)
{
    write_text(this->tmp / "src/a", "new");
    write_text(this->tmp / "dst/a", "much older content");

    this->run(vfs::file_task_type::copy, this->tmp / "src/a", this->tmp / "dst/a", overwrite::overwrite);
    EXPECT_EQ(read_text(this->tmp / "dst/a"), "new");
}

TEST_F(local_backend_test, overwrite_does_not_follow_symlink)
{
    write_text(this->tmp / "src/a", "new");
    write_text(this->tmp / "victim", "keep");
    std::filesystem::create_symlink(this->tmp / "victim", this->tmp / "dst/a");

    this->run(vfs::file_task_type::copy, this->tmp / "src/a", this->tmp / "dst/a", overwrite::overwrite);
    EXPECT_FALSE(std::filesystem::is_symlink(this->tmp / "dst/a"));
    EXPECT_EQ(read_text(this->tmp / "dst/a"), "new");
    EXPECT_EQ(read_text(this->tmp / "victim"), "keep");
}

TEST_F(local_backend_test, overwrite_merges_directories)
{
    std::filesystem::create_directories(this->tmp / "src/dir");
    std::filesystem::create_directories(this->tmp / "dst/dir");
    write_text(this->tmp / "src/dir/a", "new");
    write_text(this->tmp / "dst/dir/a", "old");
    write_text(this->tmp / "dst/dir/b", "other");

    this->run(vfs::file_task_type::copy, this->tmp / "src/dir", this->tmp / "dst/dir", overwrite::overwrite);
    EXPECT_EQ(read_text(this->tmp / "dst/dir/a"), "new");
    EXPECT_EQ(read_text(this->tmp / "dst/dir/b"), "other");
}

TEST_F(local_backend_test, overwrite_mode_auto_rename)
{
    write_text(this->tmp / "src/a.txt", "new");
    write_text(this->tmp / "dst/a.txt", "old");

    this->run(vfs::file_task_type::copy,
              this->tmp / "src/a.txt",
              this->tmp / "dst/a.txt",
              overwrite::auto_rename);
    EXPECT_EQ(read_text(this->tmp / "dst/a.txt"), "old");
    EXPECT_EQ(read_text(this->tmp / "dst/a_1.txt"), "new");
}

TEST_F(local_backend_test, copy_same_name_twice_fails)
{
    std::filesystem::create_directories(this->tmp / "x");
    std::filesystem::create_directories(this->tmp / "y");
    write_text(this->tmp / "x/a.txt", "from x");
    write_text(this->tmp / "y/a.txt", "from y");

    try
    {
        this->run_batch(vfs::file_task_type::copy,
                        {this->tmp / "x/a.txt", this->tmp / "y/a.txt"},
                        this->tmp / "dst",
                        overwrite::fail);
        FAIL() << "two sources were planned onto one destination";
    }
    catch (const VFSTaskFatalError& e)
    {
        EXPECT_EQ(e.code(), EEXIST);
    }
    // rejected before anything was written
    EXPECT_FALSE(std::filesystem::exists(this->tmp / "dst/a.txt"));
}

TEST_F(local_backend_test, copy_same_name_twice_auto_rename)
{
    std::filesystem::create_directories(this->tmp / "x");
    std::filesystem::create_directories(this->tmp / "y");
    write_text(this->tmp / "x/a.txt", "from x");
    write_text(this->tmp / "y/a.txt", "from y");

    this->run_batch(vfs::file_task_type::copy,
                    {this->tmp / "x/a.txt", this->tmp / "y/a.txt"},
                    this->tmp / "dst",
                    overwrite::auto_rename);
    EXPECT_EQ(read_text(this->tmp / "dst/a.txt"), "from x");
    EXPECT_EQ(read_text(this->tmp / "dst/a_1.txt"), "from y");

    // a name already on disk and a name taken in the batch are both avoided
    this->run_batch(vfs::file_task_type::copy,
                    {this->tmp / "x/a.txt", this->tmp / "y/a.txt"},
                    this->tmp / "dst",
                    overwrite::auto_rename);
    EXPECT_EQ(read_text(this->tmp / "dst/a_2.txt"), "from x");
    EXPECT_EQ(read_text(this->tmp / "dst/a_3.txt"), "from y");
}

TEST_F(local_backend_test, copy_same_name_twice_skip)
{
    std::filesystem::create_directories(this->tmp / "x");
    std::filesystem::create_directories(this->tmp / "y");
    write_text(this->tmp / "x/a.txt", "from x");
    write_text(this->tmp / "y/a.txt", "from y");

    this->run_batch(vfs::file_task_type::copy,
                    {this->tmp / "x/a.txt", this->tmp / "y/a.txt"},
                    this->tmp / "dst",
                    overwrite::skip);
    EXPECT_EQ(read_text(this->tmp / "dst/a.txt"), "from x");
    EXPECT_FALSE(std::filesystem::exists(this->tmp / "dst/a_1.txt"));
}

TEST_F(local_backend_test, move_same_name_twice)
{
    std::filesystem::create_directories(this->tmp / "x");
    std::filesystem::create_directories(this->tmp / "y");
    write_text(this->tmp / "x/a.txt", "from x");
    write_text(this->tmp / "y/a.txt", "from y");

    EXPECT_THROW(this->run_batch(vfs::file_task_type::move,
                                 {this->tmp / "x/a.txt", this->tmp / "y/a.txt"},
                                 this->tmp / "dst",
                                 overwrite::fail),
                 VFSTaskFatalError);
    EXPECT_TRUE(std::filesystem::exists(this->tmp / "x/a.txt"));
    EXPECT_TRUE(std::filesystem::exists(this->tmp / "y/a.txt"));
    EXPECT_FALSE(std::filesystem::exists(this->tmp / "dst/a.txt"));

    this->run_batch(vfs::file_task_type::move,
                    {this->tmp / "x/a.txt", this->tmp / "y/a.txt"},
                    this->tmp / "dst",
                    overwrite::auto_rename);
    EXPECT_FALSE(std::filesystem::exists(this->tmp / "x/a.txt"));
    EXPECT_FALSE(std::filesystem::exists(this->tmp / "y/a.txt"));
    EXPECT_EQ(read_text(this->tmp / "dst/a.txt"), "from x");
    EXPECT_EQ(read_text(this->tmp / "dst/a_1.txt"), "from y");
}

TEST_F(local_backend_test, copy_refuses_target_created_after_planning)
{
    write_text(this->tmp / "src/a", "0123456789");

    const auto units =
        this->plan(vfs::file_task_type::copy, {this->tmp / "src/a", this->tmp / "dst/a"});
    ASSERT_EQ(units.size(), 3u);
    write_text(this->tmp / "dst/a", "someone else");

    try
    {
        this->backend.execute_unit(units[0]);
        FAIL() << "an entry created after planning was replaced";
    }
    catch (const VFSTaskFatalError& e)
    {
        EXPECT_EQ(e.code(), EEXIST);
    }

    // not ours to remove
    EXPECT_FALSE(this->backend.rollback(units[0]));
    EXPECT_EQ(read_text(this->tmp / "dst/a"), "someone else");
}

TEST_F(local_backend_test, move_refuses_target_created_after_planning)
{
    write_text(this->tmp / "src/a", "new");

    const auto units =
        this->plan(vfs::file_task_type::move, {this->tmp / "src/a", this->tmp / "dst/a"});
    ASSERT_EQ(units.size(), 1u);
    write_text(this->tmp / "dst/a", "someone else");

    try
    {
        this->backend.execute_unit(units[0]);
        FAIL() << "an entry created after planning was replaced";
    }
    catch (const VFSTaskFatalError& e)
    {
        EXPECT_EQ(e.code(), EEXIST);
    }
    EXPECT_EQ(read_text(this->tmp / "src/a"), "new");
    EXPECT_EQ(read_text(this->tmp / "dst/a"), "someone else");
}

TEST_F(local_backend_test, copy_onto_itself_renames)
{
    write_text(this->tmp / "src/a.txt", "same");

    EXPECT_THROW(this->plan(vfs::file_task_type::copy,
                                    {this->tmp / "src/a.txt", this->tmp / "src/a.txt"},
                                    {.overwrite_mode = overwrite::overwrite}),
                 VFSTaskFatalError);

    this->run(vfs::file_task_type::copy,
              this->tmp / "src/a.txt",
              this->tmp / "src/a.txt",
              overwrite::auto_rename);
    EXPECT_EQ(read_text(this->tmp / "src/a_1.txt"), "same");
}

TEST_F(local_backend_test, move_same_device)
{
    std::filesystem::create_directories(this->tmp / "src/dir");
    write_text(this->tmp / "src/dir/a", "12345");

    const auto units = this->plan(vfs::file_task_type::move,
                                          {this->tmp / "src/dir", this->tmp / "dst/dir"},
                                          {});
    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0].type, unit_type::rename);
    EXPECT_EQ(units[0].length, 5u);

    const auto result = this->backend.execute_unit(units[0]);
    EXPECT_EQ(result.bytes, 5u);
    EXPECT_FALSE(std::filesystem::exists(this->tmp / "src/dir"));
    EXPECT_EQ(read_text(this->tmp / "dst/dir/a"), "12345");
}

TEST_F(local_backend_test, move_merges_directories)
{
    std::filesystem::create_directories(this->tmp / "src/dir");
    std::filesystem::create_directories(this->tmp / "dst/dir");
    write_text(this->tmp / "src/dir/a", "new");
    write_text(this->tmp / "dst/dir/a", "old");
    write_text(this->tmp / "dst/dir/b", "other");

    this->run(vfs::file_task_type::move, this->tmp / "src/dir", this->tmp / "dst/dir", overwrite::overwrite);
    EXPECT_FALSE(std::filesystem::exists(this->tmp / "src/dir"));
    EXPECT_EQ(read_text(this->tmp / "dst/dir/a"), "new");
    EXPECT_EQ(read_text(this->tmp / "dst/dir/b"), "other");
}

TEST_F(local_backend_test, delete_tree)
{
    std::filesystem::create_directories(this->tmp / "src/dir/sub");
    write_text(this->tmp / "src/dir/a", "aaa");
    write_text(this->tmp / "src/dir/sub/b", "b");

    const auto units = this->plan(vfs::file_task_type::DELETE, {this->tmp / "src/dir", {}}, {});
    ASSERT_EQ(units.size(), 4u);
    // children before their directory
    EXPECT_EQ(units.back().type, unit_type::remove_dir);
    EXPECT_EQ(units.back().source.string(), (this->tmp / "src/dir").string());

    u64 bytes = 0;
    for (const auto& unit : units)
    {
        bytes += this->backend.execute_unit(unit).bytes;
    }
    EXPECT_EQ(bytes, 4u);
    EXPECT_FALSE(std::filesystem::exists(this->tmp / "src/dir"));
}

TEST_F(local_backend_test, delete_does_not_follow_symlinks)
{
    std::filesystem::create_directories(this->tmp / "keep");
    write_text(this->tmp / "keep/a", "a");
    std::filesystem::create_directory_symlink(this->tmp / "keep", this->tmp / "src/link");

    this->run(vfs::file_task_type::DELETE, this->tmp / "src/link");
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(this->tmp / "src/link")));
    EXPECT_TRUE(std::filesystem::exists(this->tmp / "keep/a"));
}

TEST_F(local_backend_test, link_absolute)
{
    write_text(this->tmp / "src/a", "a");

    this->run(vfs::file_task_type::link, this->tmp / "src/a", this->tmp / "dst/a");
    ASSERT_TRUE(std::filesystem::is_symlink(this->tmp / "dst/a"));
    EXPECT_EQ(std::filesystem::read_symlink(this->tmp / "dst/a").string(), (this->tmp / "src/a").string());
}

TEST_F(local_backend_test, link_relative)
{
    write_text(this->tmp / "src/a", "a");

    this->run(vfs::file_task_type::link, this->tmp / "src/a", this->tmp / "dst/a", overwrite::fail, true);
    ASSERT_TRUE(std::filesystem::is_symlink(this->tmp / "dst/a"));
    EXPECT_EQ(std::filesystem::read_symlink(this->tmp / "dst/a").string(), "../src/a");
    EXPECT_EQ(read_text(this->tmp / "dst/a"), "a");
}

TEST_F(local_backend_test, trash)
{
    write_text(this->tmp / "src/a.txt", "first");

    const auto result = this->run(vfs::file_task_type::trash, this->tmp / "src/a.txt");
    EXPECT_EQ(result.bytes, 5u);
    EXPECT_FALSE(std::filesystem::exists(this->tmp / "src/a.txt"));
    EXPECT_EQ(read_text(this->tmp / "Trash/files/a.txt"), "first");

    const auto info = read_text(this->tmp / "Trash/info/a.txt.trashinfo");
    EXPECT_TRUE(info.starts_with("[Trash Info]\n"));
    EXPECT_NE(info.find(std::format("Path={}", (this->tmp / "src/a.txt").string())), std::string::npos);
    EXPECT_NE(info.find("DeletionDate="), std::string::npos);

    // a second file with the same name gets a new one
    write_text(this->tmp / "src/a.txt", "second");
    this->run(vfs::file_task_type::trash, this->tmp / "src/a.txt");
    EXPECT_EQ(read_text(this->tmp / "Trash/files/a_1.txt"), "second");
    EXPECT_TRUE(std::filesystem::exists(this->tmp / "Trash/info/a_1.txt.trashinfo"));
}

TEST_F(local_backend_test, trash_refuses_trash_dir)
{
    std::filesystem::create_directories(this->tmp / "Trash/files");

    try
    {
        this->plan(vfs::file_task_type::trash, {this->tmp / "Trash", {}}, {});
        FAIL() << "trashing the trash was planned";
    }
    catch (const VFSTaskFatalError& e)
    {
        EXPECT_EQ(e.code(), EPERM);
    }
}

TEST_F(local_backend_test, rollback_removes_partial_file)
{
    write_text(this->tmp / "src/a", "0123456789");

    const auto units = this->plan(vfs::file_task_type::copy,
                                          {this->tmp / "src/a", this->tmp / "dst/a"},
                                          {});
    ASSERT_EQ(units.size(), 3u);
    this->backend.execute_unit(units[0]);
    EXPECT_EQ(read_text(this->tmp / "dst/a"), "0123");

    // a retried first chunk starts the file again
    this->backend.execute_unit(units[0]);
    this->backend.execute_unit(units[1]);
    EXPECT_EQ(read_text(this->tmp / "dst/a"), "01234567");

    EXPECT_TRUE(this->backend.rollback(units[1]));
    EXPECT_FALSE(std::filesystem::exists(this->tmp / "dst/a"));
    EXPECT_FALSE(this->backend.rollback(units[1]));

    // only copies can be rolled back
    EXPECT_FALSE(this->backend.rollback({.type = unit_type::remove, .source = this->tmp / "src/a"}));
    EXPECT_TRUE(std::filesystem::exists(this->tmp / "src/a"));
}

TEST(local_backend, total_size)
{
    test::temp_dir tmp;
    std::filesystem::create_directories(tmp / "dir/sub");
    write_text(tmp / "dir/a", "12");
    write_text(tmp / "dir/sub/b", "345");
    std::filesystem::create_symlink(tmp / "dir/a", tmp / "dir/link");

    EXPECT_EQ(vfs_total_size(tmp / "dir"), 5u);
    EXPECT_EQ(vfs_total_size(tmp / "dir/link"), 0u);
    EXPECT_EQ(vfs_total_size(tmp / "missing"), 0u);
}

TEST(local_backend, task_errors)
{
    EXPECT_THROW(vfs_task_error(EBUSY, "Writing", "/a"), VFSTaskRetryableError);
    EXPECT_THROW(vfs_task_error(ENOSPC, "Writing", "/a"), VFSTaskFatalError);

    try
    {
        vfs_task_error(EACCES, "Reading", "/a");
    }
    catch (const VFSTaskException& e)
    {
        EXPECT_EQ(e.code(), EACCES);
        EXPECT_EQ(std::string(e.what()), "Reading '/a': Permission denied");
    }
}
