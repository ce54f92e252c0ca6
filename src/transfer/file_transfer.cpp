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
#include <kubecp/transfer/file_transfer.h>
#include <kubecp/utils.h>

#include <QFile>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace kc = kubecp;
namespace kcl = kubecp::logging;

namespace
{
constexpr auto category = "file transfer";
constexpr auto read_script = "exec cat -- \"$1\"";
constexpr auto write_script = "tee -- \"$1\" > /dev/null";

bool names_remote_directory(const std::string& remote_path)
{
    return remote_path.empty() || remote_path == "." || remote_path.back() == '/';
}

std::string remote_name(const kc::TransferRequest& request)
{
    return fmt::format("{}:{}", request.target, request.remote_path);
}
} // namespace

kc::FileTransfer::FileTransfer(RemoteExecutor& executor, RemoteProbe& probe, const kcl::Logger& logger)
    : executor{executor}, probe{probe}, logger{logger}
{
}

void kc::FileTransfer::download_file(const TransferRequest& request)
{
    if (!probe.exists(request.target, request.remote_path, request.remote_exec_args))
        throw NotFoundError{"{}: No such file or directory", remote_name(request)};

    receive(with_local_target(request));
}

void kc::FileTransfer::upload_file(const TransferRequest& request)
{
    std::error_code err;
    if (!fs::exists(request.local_path, err))
        throw NotFoundError{"{}: No such file or directory", request.local_path.string()};

    send(with_remote_target(request));
}

kc::TransferRequest kc::FileTransfer::with_local_target(const TransferRequest& request) const
{
    std::error_code err;
    if (request.local_path != "." && !fs::is_directory(request.local_path, err))
        return request;

    auto resolved = request;
    resolved.local_path /= kc::utils::posix_basename(request.remote_path);
    kcl::trace(logger, category, "local destination {} resolved to {}", request.local_path.string(),
               resolved.local_path.string());

    return resolved;
}

kc::TransferRequest kc::FileTransfer::with_remote_target(const TransferRequest& request) const
{
    if (!names_remote_directory(request.remote_path))
        return request;

    auto resolved = request;
    resolved.remote_path = kc::utils::posix_join(request.remote_path, request.local_path.filename().string());
    kcl::trace(logger, category, "remote destination {} resolved to {}", request.remote_path,
               resolved.remote_path);

    return resolved;
}

void kc::FileTransfer::receive(const TransferRequest& request)
{
    kcl::info(logger, category, "{} -> {}", remote_name(request), request.local_path.string());

    std::ofstream out{request.local_path, std::ios::binary | std::ios::trunc};
    if (!out)
        throw LocalIOError{"cannot open {} for writing: {}", request.local_path.string(), std::strerror(errno)};

    const auto result =
        executor.run({request.target, request.remote_exec_args, read_script, {request.remote_path}}, out);
    ensure_success(result, fmt::format("read {}", remote_name(request)));

    out.close();
    if (!out)
        throw LocalIOError{"failed to write {}: {}", request.local_path.string(), std::strerror(errno)};
}

void kc::FileTransfer::send(const TransferRequest& request)
{
    kcl::info(logger, category, "{} -> {}", request.local_path.string(), remote_name(request));

    QFile file{QString::fromStdString(request.local_path.string())};
    if (!file.open(QIODevice::ReadOnly))
        throw LocalIOError{"cannot open {} for reading: {}", request.local_path.string(), file.errorString()};

    const auto contents = file.readAll();
    if (file.error() != QFileDevice::NoError)
        throw LocalIOError{"failed to read {}: {}", request.local_path.string(), file.errorString()};

    const auto result =
        executor.feed({request.target, request.remote_exec_args, write_script, {request.remote_path}}, contents);
    ensure_success(result, fmt::format("write {}", remote_name(request)));
}
