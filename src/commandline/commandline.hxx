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

#include <string>

#include <filesystem>

#include <vector>

#include <optional>

#include <memory>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "types.hxx"

#include "vfs/vfs-file-task.hxx"

struct commandline_opt_data
{
    // set by the subcommand that ran
    std::optional<vfs::file_task_type> type{std::nullopt};

    // SRC... DEST for copy, move and link, PATH... otherwise
    std::vector<std::filesystem::path> paths{};

    bool overwrite{false};
    bool skip{false};
    bool rename{false};
    bool relative{false};
    i32 priority{0};

    bool json{false};

    std::filesystem::path config_file{};
    std::filesystem::path dump_config{};

    bool version{false};
};

using commandline_opt_data_t = std::shared_ptr<commandline_opt_data>;

void setup_commandline(CLI::App& app, const commandline_opt_data_t& opt);

/**
 * Build the task request for the subcommand that ran.
 *
 * The last path of copy, move and link is the destination. With a
 * single source that is not an existing directory it is the full target
 * path, otherwise every source keeps its name inside it.
 *
 * Throws VFSTaskValidationError.
 */
const vfs::file_task_request make_file_task_request(const commandline_opt_data_t& opt);

const nlohmann::json progress_event_json(const vfs::progress_event& event);
const std::string progress_event_line(const vfs::progress_event& event);
