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

#ifndef KUBECP_FILE_TRANSFER_H
#define KUBECP_FILE_TRANSFER_H

#include <kubecp/disabled_copy_move.h>
#include <kubecp/logging/logger.h>
#include <kubecp/remote/remote_executor.h>
#include <kubecp/remote/remote_probe.h>
#include <kubecp/transfer/transfer_request.h>

namespace kubecp
{

class FileTransfer : private DisabledCopyMove
{
public:
    FileTransfer(RemoteExecutor& executor, RemoteProbe& probe, const logging::Logger& logger);

    // Probe the remote path, then receive it. Throws NotFoundError without touching the local side if absent.
    void download_file(const TransferRequest& request);
    // Check the local path, then send it. Throws NotFoundError without running anything remotely if absent.
    void upload_file(const TransferRequest& request);

    // Where a download really lands: "." or an existing directory get the remote base name appended
    TransferRequest with_local_target(const TransferRequest& request) const;
    // Where an upload really lands: ".", "" or a trailing '/' get the local file name appended
    TransferRequest with_remote_target(const TransferRequest& request) const;

    // Stream exactly request.remote_path into exactly request.local_path, truncating it
    void receive(const TransferRequest& request);
    // Read request.local_path fully and write it to exactly request.remote_path
    void send(const TransferRequest& request);

private:
    RemoteExecutor& executor;
    RemoteProbe& probe;
    const logging::Logger& logger;
};

} // namespace kubecp

#endif // KUBECP_FILE_TRANSFER_H
