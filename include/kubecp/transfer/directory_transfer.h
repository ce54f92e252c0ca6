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

#ifndef KUBECP_DIRECTORY_TRANSFER_H
#define KUBECP_DIRECTORY_TRANSFER_H

#include <kubecp/disabled_copy_move.h>
#include <kubecp/logging/logger.h>
#include <kubecp/remote/remote_executor.h>
#include <kubecp/remote/remote_probe.h>
#include <kubecp/transfer/file_transfer.h>
#include <kubecp/transfer/transfer_request.h>
#include <kubecp/transfer/tree_enumerator.h>
#include <kubecp/transfer/tree_mapper.h>

namespace kubecp
{

/*
 * Enumerate -> plan -> create directories -> transfer each file.
 *
 * Every directory is created before the first file is written. The first failure of any step ends the
 * transfer: nothing after it is attempted and the error propagates as is.
 */
class DirectoryTransfer : private DisabledCopyMove
{
public:
    DirectoryTransfer(RemoteExecutor& executor,
                      RemoteProbe& probe,
                      FileTransfer& files,
                      const logging::Logger& logger);

    void download(const TransferRequest& request);
    void upload(const TransferRequest& request);

private:
    void create_local_directories(const DirectoryPlan& plan);
    void create_remote_directories(const TransferRequest& request, const DirectoryPlan& plan);

    RemoteExecutor& executor;
    RemoteProbe& probe;
    FileTransfer& files;
    const logging::Logger& logger;
    TreeEnumerator enumerator;
};

} // namespace kubecp

#endif // KUBECP_DIRECTORY_TRANSFER_H
