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

#include <memory>

#include <chrono>

#include <atomic>

#include <locale>

#include <csignal>

#include <CLI/CLI.hpp>

#include <fmt/format.h>

#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>

#include "types.hxx"

#include "vfs/vfs-file-task.hxx"
#include "vfs/vfs-file-backend.hxx"
#include "vfs/vfs-local-backend.hxx"
#include "vfs/vfs-task-config.hxx"
#include "vfs/vfs-task-scheduler.hxx"
#include "vfs/vfs-user-dirs.hxx"

#include "settings/config-load.hxx"
#include "settings/config-save.hxx"

#include "commandline/commandline.hxx"

inline constexpr i32 EXIT_VALIDATION{2};

static std::atomic<bool> interrupted{false};

static void
on_interrupt(int signal)
{
    (void)signal;
    interrupted = true;
}

static vfs::file_task_state
follow_task(vfs::task_scheduler& scheduler, const vfs::task_subscription_t& subscription,
            task_id_t id, bool json)
{
    bool canceling = false;
    while (true)
    {
        if (interrupted && !canceling)
        {
            ztd::logger::info("Interrupted, canceling task {}", id);
            scheduler.cancel(id);
            canceling = true;
        }

        const auto event = subscription->next(std::chrono::milliseconds(100));
        if (!event)
        {
            if (subscription->is_closed())
            {
                return vfs::file_task_state::canceled;
            }
            continue;
        }

        if (event->id != id)
        {
            continue;
        }

        if (json)
        {
            fmt::print("{}\n", progress_event_json(event.value()).dump());
        }
        else
        {
            fmt::print("{}\n", progress_event_line(event.value()));
        }

        if (vfs::is_terminal(event->state))
        {
            return event->state;
        }
    }
}

int
main(int argc, char* argv[])
{
    // set locale to system default
    std::locale::global(std::locale(""));

    // logging init
    ztd::Logger->initialize();

    // CLI11
    CLI::App app{PACKAGE_NAME_FANCY, "Queued file operations with live progress"};

    auto opt = std::make_shared<commandline_opt_data>();
    setup_commandline(app, opt);

    CLI11_PARSE(app, argc, argv);

    if (opt->version)
    {
        fmt::print("{} {}\n", PACKAGE_NAME_FANCY, PACKAGE_VERSION);
        return EXIT_SUCCESS;
    }

    const auto config_file =
        opt->config_file.empty() ? vfs::user_dirs->config_file() : opt->config_file;
    const auto config = load_scheduler_config(config_file);

    if (!opt->dump_config.empty())
    {
        if (!save_scheduler_config(opt->dump_config, config))
        {
            return EXIT_FAILURE;
        }
        if (!opt->type)
        {
            return EXIT_SUCCESS;
        }
    }

    if (!opt->type)
    {
        fmt::print("{}\n", app.help());
        return EXIT_VALIDATION;
    }

    vfs::file_task_request request;
    try
    {
        request = make_file_task_request(opt);
    }
    catch (const VFSTaskValidationError& e)
    {
        ztd::logger::error("{}", e.what());
        return EXIT_VALIDATION;
    }

    const auto backend =
        std::make_shared<vfs::local_backend>(config.chunk_size, vfs::user_dirs->trash_dir());
    vfs::task_scheduler scheduler(config, backend);

    const auto subscription = scheduler.subscribe();

    task_id_t id = INVALID_TASK;
    try
    {
        id = scheduler.submit(request);
    }
    catch (const VFSTaskValidationError& e)
    {
        ztd::logger::error("{}", e.what());
        return EXIT_VALIDATION;
    }

    std::signal(SIGINT, on_interrupt);

    const auto state = follow_task(scheduler, subscription, id, opt->json);

    scheduler.shutdown();

    if (state != vfs::file_task_state::succeeded)
    {
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
