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
#include <kubecp/transfer/transfer_engine.h>

#include <system_error>

namespace kc = kubecp;
namespace kcl = kubecp::logging;

namespace
{
constexpr auto category = "engine";
} // namespace

kc::TransferEngine::TransferEngine(RemoteExecutor& executor, const kcl::Logger& logger)
    : logger{logger},
      probe{executor, logger},
      files{executor, probe, logger},
      directories{executor, probe, files, logger}
{
}

void kc::TransferEngine::execute(Direction direction, const TransferRequest& request)
{
    kcl::debug(logger, category, "{} {}:{} <-> {} (recursive: {})", as_string(direction), request.target,
               request.remote_path, request.local_path.string(), request.recursive);

    switch (direction)
    {
    case Direction::Download:
        return download(request);
    case Direction::Upload:
        return upload(request);
    case Direction::Invalid:
        break;
    }

    throw InvalidDirectionError{"cannot transfer in an invalid direction"};
}

void kc::TransferEngine::download(const TransferRequest& request)
{
    // A missing path fails to read as well, so only a Directory answer needs the existence check
    switch (probe.classify(request.target, request.remote_path, request.remote_exec_args))
    {
    case RemoteEntryKind::File:
        return files.download_file(request);
    case RemoteEntryKind::Directory:
        if (!probe.exists(request.target, request.remote_path, request.remote_exec_args))
            throw NotFoundError{"{}:{}: No such file or directory", request.target, request.remote_path};
        if (!request.recursive)
            throw RecursionRequiredError{"{}:{} is a directory: use --recursive to copy it", request.target,
                                         request.remote_path};
        return directories.download(request);
    case RemoteEntryKind::Unknown:
        break;
    }

    throw TransferError{fmt::format("cannot tell what {}:{} is", request.target, request.remote_path)};
}

void kc::TransferEngine::upload(const TransferRequest& request)
{
    std::error_code err;
    if (!fs::is_directory(request.local_path, err))
        return files.upload_file(request);

    if (!request.recursive)
        throw RecursionRequiredError{"{} is a directory: use --recursive to copy it", request.local_path.string()};

    directories.upload(request);
}
