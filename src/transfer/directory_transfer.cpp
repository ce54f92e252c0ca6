/*
 * Copyright (C) Canonical, Ltd.
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; version 3.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#include <kubecp/exceptions/transfer_exceptions.h>
#include <kubecp/format.h>
#include <kubecp/logging/log.h>
#include <kubecp/transfer/directory_transfer.h>
#include <kubecp/utils.h>

#include <sstream>
#include <system_error>

namespace kc = kubecp;
namespace kcl = kubecp::logging;

namespace
{
constexpr auto category = "directory transfer";
constexpr auto mkdir_script = "mkdir -p -- \"$1\"";
} // namespace

kc::DirectoryTransfer::DirectoryTransfer(RemoteExecutor& executor,
                                         RemoteProbe& probe,
                                         FileTransfer& files,
                                         const kcl::Logger& logger)
    : executor{executor}, probe{probe}, files{files}, logger{logger}, enumerator{executor, logger}
{
}

void kc::DirectoryTransfer::download(const TransferRequest& request)
{
    const auto root = kc::utils::trim_trailing_slashes(request.remote_path);
    if (!probe.exists(request.target, root, request.remote_exec_args))
        throw NotFoundError{"{}:{}: No such file or directory", request.target, root};

    const auto plan = tree_mapper::plan_download(
        request, enumerator.enumerate_remote(request.target, root, request.remote_exec_args));
    kcl::debug(logger, category, "{}:{}: {} directories, {} files", request.target, root,
               plan.directories_to_create.size(), plan.leaf_transfers.size());

    create_local_directories(plan);

    for (const auto& leaf : plan.leaf_transfers)
        files.receive(leaf);
}

void kc::DirectoryTransfer::upload(const TransferRequest& request)
{
    std::error_code err;
    if (!fs::exists(request.local_path, err))
        throw NotFoundError{"{}: No such file or directory", request.local_path.string()};

    const auto plan = tree_mapper::plan_upload(request, enumerator.enumerate_local(request.local_path));
    kcl::debug(logger, category, "{}: {} directories, {} files", request.local_path.string(),
               plan.directories_to_create.size(), plan.leaf_transfers.size());

    create_remote_directories(request, plan);

    for (const auto& leaf : plan.leaf_transfers)
        files.send(leaf);
}

void kc::DirectoryTransfer::create_local_directories(const DirectoryPlan& plan)
{
    for (const auto& dir : plan.directories_to_create)
    {
        std::error_code err;
        fs::create_directories(dir, err);
        if (err)
            throw DirectoryCreateError{"cannot create directory {}: {}", dir, err.message()};

        kcl::trace(logger, category, "created {}", dir);
    }
}

void kc::DirectoryTransfer::create_remote_directories(const TransferRequest& request, const DirectoryPlan& plan)
{
    for (const auto& dir : plan.directories_to_create)
    {
        std::ostringstream discarded;
        const auto result = executor.run({request.target, request.remote_exec_args, mkdir_script, {dir}}, discarded);

        if (result.completed_successfully())
        {
            kcl::trace(logger, category, "created {}:{}", request.target, dir);
            continue;
        }

        if (!result.state.error && result.state.exit_code)
            throw DirectoryCreateError{"cannot create directory {}:{}: {}", request.target, dir, result.describe()};

        throw TransportError{"cannot create directory {}:{}: {}", request.target, dir, result.describe()};
    }
}
