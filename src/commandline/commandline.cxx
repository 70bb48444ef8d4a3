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

#include <vector>
#include <span>

#include <memory>

#include <CLI/CLI.hpp>

#include <magic_enum.hpp>

#include <nlohmann/json.hpp>

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "vfs/vfs-file-task.hxx"
#include "vfs/vfs-file-backend.hxx"

#include "commandline/commandline.hxx"

static void
setup_subcommand_task(CLI::App& app, const commandline_opt_data_t& opt, vfs::file_task_type type,
                      const std::string& description)
{
    const bool has_dest = type == vfs::file_task_type::copy || type == vfs::file_task_type::move ||
                          type == vfs::file_task_type::link;

    CLI::App* sub = app.add_subcommand(std::string(vfs::file_task_type_name(type)), description);

    if (has_dest)
    {
        sub->add_option("paths", opt->paths, "SRC... DEST")->required()->expected(2, -1);
    }
    else
    {
        sub->add_option("paths", opt->paths, "PATH...")->required()->expected(1, -1);
    }

    if (type == vfs::file_task_type::link)
    {
        sub->add_flag("-r,--relative", opt->relative, "Create relative symlinks");
    }

    sub->add_option("-P,--priority", opt->priority, "Queue priority, higher runs first");

    sub->callback([opt, type]() { opt->type = type; });
}

void
setup_commandline(CLI::App& app, const commandline_opt_data_t& opt)
{
    // clang-format off
    app.add_option("-c,--config", opt->config_file, "Use this configuration file")->expected(1);
    app.add_option("--dump-config", opt->dump_config, "Write the active configuration to FILE")->expected(1);
    app.add_flag("--json", opt->json, "Print progress as one JSON object per line");
    app.add_flag("-v,--version", opt->version, "Show version information");

    auto* overwrite = app.add_flag("--overwrite", opt->overwrite, "Replace existing files, merge directories");
    auto* skip = app.add_flag("--skip", opt->skip, "Leave existing files alone");
    auto* rename = app.add_flag("--rename", opt->rename, "Give new files a unique name");
    // clang-format on
    overwrite->excludes(skip)->excludes(rename);
    skip->excludes(rename);

    setup_subcommand_task(app, opt, vfs::file_task_type::copy, "Copy SRC... to DEST");
    setup_subcommand_task(app, opt, vfs::file_task_type::move, "Move SRC... to DEST");
    setup_subcommand_task(app, opt, vfs::file_task_type::link, "Symlink SRC... in DEST");
    setup_subcommand_task(app, opt, vfs::file_task_type::DELETE, "Delete PATH... permanently");
    setup_subcommand_task(app, opt, vfs::file_task_type::trash, "Move PATH... to the trash");

    app.require_subcommand(0, 1);
    // common options may follow the subcommand
    app.fallthrough();
}

const vfs::file_task_request
make_file_task_request(const commandline_opt_data_t& opt)
{
    if (!opt->type)
    {
        throw VFSTaskValidationError("No task given");
    }

    vfs::file_task_request request{.type = opt->type.value()};
    request.priority = opt->priority;
    request.options.relative_links = opt->relative;

    if (opt->overwrite)
    {
        request.options.overwrite_mode = vfs::file_task_overwrite_mode::overwrite;
    }
    else if (opt->skip)
    {
        request.options.overwrite_mode = vfs::file_task_overwrite_mode::skip;
    }
    else if (opt->rename)
    {
        request.options.overwrite_mode = vfs::file_task_overwrite_mode::auto_rename;
    }

    switch (request.type)
    {
        case vfs::file_task_type::copy:
        case vfs::file_task_type::move:
        case vfs::file_task_type::link:
        {
            if (opt->paths.size() < 2)
            {
                throw VFSTaskValidationError(std::format("{} needs SRC... DEST",
                                                         vfs::file_task_type_name(request.type)));
            }

            const auto& dest = opt->paths.back();
            const auto sources = std::span(opt->paths).first(opt->paths.size() - 1);

            const bool into_dir = sources.size() > 1 || std::filesystem::is_directory(dest);
            if (sources.size() > 1 && !std::filesystem::is_directory(dest))
            {
                throw VFSTaskValidationError(
                    std::format("Target '{}' is not a directory", dest.string()));
            }

            for (const auto& source : sources)
            {
                auto filename = source.filename();
                if (filename.empty())
                { // trailing slash
                    filename = source.parent_path().filename();
                }
                const auto target = into_dir ? dest / filename : dest;
                request.paths.push_back({.source = source, .target = target});
            }
            break;
        }
        case vfs::file_task_type::DELETE:
        case vfs::file_task_type::trash:
        {
            for (const auto& path : opt->paths)
            {
                request.paths.push_back({.source = path});
            }
            break;
        }
    }

    return request;
}

const nlohmann::json
progress_event_json(const vfs::progress_event& event)
{
    nlohmann::json json;
    json["id"] = event.id;
    json["type"] = std::string(vfs::file_task_type_name(event.type));
    json["state"] = std::string(magic_enum::enum_name(event.state));
    json["processed_bytes"] = event.progress.processed_bytes;
    json["processed_items"] = event.progress.processed_items;
    // unknown totals are null
    json["total_bytes"] = nullptr;
    if (event.progress.total_bytes)
    {
        json["total_bytes"] = event.progress.total_bytes.value();
    }
    json["total_items"] = nullptr;
    if (event.progress.total_items)
    {
        json["total_items"] = event.progress.total_items.value();
    }
    if (event.error)
    {
        const auto& error = event.error.value();
        json["error"] = {
            {"errno", error.errnox},
            {"message", error.message},
            {"source", error.source.string()},
            {"target", error.target.string()},
        };
    }
    return json;
}

const std::string
progress_event_line(const vfs::progress_event& event)
{
    std::string totals = "?";
    if (event.progress.total_bytes && event.progress.total_items)
    {
        totals = std::format("{} bytes, {} items",
                             event.progress.total_bytes.value(),
                             event.progress.total_items.value());
    }

    auto line = std::format("[{}] {} {}: {} bytes, {} items of {}",
                            event.id,
                            vfs::file_task_type_name(event.type),
                            magic_enum::enum_name(event.state),
                            event.progress.processed_bytes,
                            event.progress.processed_items,
                            totals);
    if (event.error)
    {
        line.append(std::format(" ({})", event.error.value().message));
    }
    return line;
}
