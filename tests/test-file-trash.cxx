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

#include <system_error>

#include <unistd.h>

#include <gtest/gtest.h>

#include "vfs/vfs-file-trash.hxx"

#include "test-helpers.hxx"

static void
touch(const std::filesystem::path& path)
{
    std::ofstream file(path);
    file << path.filename().string();
}

TEST(file_trash, is_trash_dir)
{
    EXPECT_TRUE(VFSTrash::is_trash_dir("/home/user/.local/share/Trash"));
    EXPECT_TRUE(VFSTrash::is_trash_dir("/home/user/.local/share/Trash/files"));
    EXPECT_TRUE(VFSTrash::is_trash_dir("/home/user/.local/share/Trash/info"));
    EXPECT_TRUE(VFSTrash::is_trash_dir(std::format("/mnt/usb/.Trash-{}", getuid())));
    EXPECT_TRUE(VFSTrash::is_trash_dir(std::format("/mnt/usb/.Trash-{}/files", getuid())));

    EXPECT_FALSE(VFSTrash::is_trash_dir("/home/user/Trash-notes.txt"));
    EXPECT_FALSE(VFSTrash::is_trash_dir("/home/user/.local/share/Trash/files/a.txt"));
    EXPECT_FALSE(VFSTrash::is_trash_dir("/home/user"));
}

TEST(file_trash, trash_file)
{
    test::temp_dir tmp;
    VFSTrash trash(tmp / "Trash");

    touch(tmp / "a.txt");

    std::error_code ec;
    ASSERT_TRUE(trash.trash(tmp / "a.txt", ec)) << ec.message();
    EXPECT_FALSE(ec);

    EXPECT_FALSE(std::filesystem::exists(tmp / "a.txt"));
    EXPECT_TRUE(std::filesystem::is_regular_file(tmp / "Trash/files/a.txt"));

    std::ifstream info_file(tmp / "Trash/info/a.txt.trashinfo");
    std::stringstream info;
    info << info_file.rdbuf();
    EXPECT_TRUE(info.str().starts_with(
        std::format("[Trash Info]\nPath={}\nDeletionDate=", (tmp / "a.txt").string())));
}

TEST(file_trash, trash_dir)
{
    test::temp_dir tmp;
    VFSTrash trash(tmp / "Trash");

    std::filesystem::create_directories(tmp / "dir/sub");
    touch(tmp / "dir/sub/a");

    std::error_code ec;
    ASSERT_TRUE(trash.trash(tmp / "dir", ec)) << ec.message();
    EXPECT_TRUE(std::filesystem::is_regular_file(tmp / "Trash/files/dir/sub/a"));
    EXPECT_TRUE(std::filesystem::exists(tmp / "Trash/info/dir.trashinfo"));
}

TEST(file_trash, unique_names)
{
    test::temp_dir tmp;
    VFSTrash trash(tmp / "Trash");

    std::error_code ec;
    for (const auto name : {"a.tar.gz", "a.tar.gz", "a.tar.gz", "b", "b"})
    {
        touch(tmp / name);
        ASSERT_TRUE(trash.trash(tmp / name, ec)) << ec.message();
    }

    EXPECT_TRUE(std::filesystem::exists(tmp / "Trash/files/a.tar.gz"));
    EXPECT_TRUE(std::filesystem::exists(tmp / "Trash/files/a_1.tar.gz"));
    EXPECT_TRUE(std::filesystem::exists(tmp / "Trash/files/a_2.tar.gz"));
    EXPECT_TRUE(std::filesystem::exists(tmp / "Trash/info/a_2.tar.gz.trashinfo"));
    EXPECT_TRUE(std::filesystem::exists(tmp / "Trash/files/b"));
    EXPECT_TRUE(std::filesystem::exists(tmp / "Trash/files/b_1"));
}

TEST(file_trash, refuses_trash_dir)
{
    test::temp_dir tmp;
    VFSTrash trash(tmp / "Trash");

    std::filesystem::create_directories(tmp / "Trash/files");

    std::error_code ec;
    EXPECT_FALSE(trash.trash(tmp / "Trash", ec));
    EXPECT_TRUE(ec == std::errc::operation_not_permitted);
    EXPECT_FALSE(trash.trash(tmp / "Trash/files", ec));
    EXPECT_TRUE(std::filesystem::is_directory(tmp / "Trash/files"));
}

TEST(file_trash, missing_file)
{
    test::temp_dir tmp;
    VFSTrash trash(tmp / "Trash");

    std::error_code ec;
    EXPECT_FALSE(trash.trash(tmp / "missing", ec));
    EXPECT_TRUE(ec);
    // no info file is left behind for a failed move
    EXPECT_FALSE(std::filesystem::exists(tmp / "Trash/info/missing.trashinfo"));
}

TEST(file_trash, unusable_paths_are_reported)
{
    test::temp_dir tmp;

    // a component longer than NAME_MAX cannot even be checked
    const std::string long_name(300, 'x');
    VFSTrash broken(tmp / long_name / "Trash");

    touch(tmp / "a");
    std::error_code ec;
    EXPECT_FALSE(broken.trash(tmp / "a", ec));
    EXPECT_TRUE(ec);
    EXPECT_TRUE(std::filesystem::exists(tmp / "a"));

    // fits in files/ but not as an info file
    VFSTrash trash(tmp / "Trash");
    const std::string name(250, 'n');
    touch(tmp / name);
    EXPECT_FALSE(trash.trash(tmp / name, ec));
    EXPECT_TRUE(ec);
    EXPECT_TRUE(std::filesystem::exists(tmp / name));
    EXPECT_FALSE(std::filesystem::exists(tmp / "Trash/files" / name));
}
