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

#ifndef KUBECP_TRANSFER_ENGINE_H
#define KUBECP_TRANSFER_ENGINE_H

#include <kubecp/disabled_copy_move.h>
#include <kubecp/logging/logger.h>
#include <kubecp/remote/remote_executor.h>
#include <kubecp/remote/remote_probe.h>
#include <kubecp/transfer/direction.h>
#include <kubecp/transfer/directory_transfer.h>
#include <kubecp/transfer/file_transfer.h>

namespace kubecp
{

class TransferEngine : private DisabledCopyMove
{
public:
    TransferEngine(RemoteExecutor& executor, const logging::Logger& logger);

    void execute(Direction direction, const TransferRequest& request);

    void download(const TransferRequest& request);
    void upload(const TransferRequest& request);

private:
    const logging::Logger& logger;
    RemoteProbe probe;
    FileTransfer files;
    DirectoryTransfer directories;
};

} // namespace kubecp

#endif // KUBECP_TRANSFER_ENGINE_H
