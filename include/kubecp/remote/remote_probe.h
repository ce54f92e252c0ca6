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

#ifndef KUBECP_REMOTE_PROBE_H
#define KUBECP_REMOTE_PROBE_H

#include <kubecp/disabled_copy_move.h>
#include <kubecp/logging/logger.h>
#include <kubecp/remote/remote_executor.h>

#include <string>

namespace kubecp
{

enum class RemoteEntryKind
{
    Unknown,
    File,
    Directory
};

/*
 * RemoteProbe - finds out what a remote path is without any helper binary in the container.
 *
 * There is nothing to stat() with, so existence is checked with a POSIX test expression and the kind is
 * inferred from whether `cat` can read the path. A path that exists but cannot be read is therefore
 * reported as a Directory. Transport problems are never folded into either answer: they throw
 * TransportError.
 */
class RemoteProbe : private DisabledCopyMove
{
public:
    RemoteProbe(RemoteExecutor& executor, const logging::Logger& logger);

    bool exists(const std::string& target, const std::string& path, const std::string& exec_args);
    RemoteEntryKind classify(const std::string& target, const std::string& path, const std::string& exec_args);

private:
    RemoteExecutor& executor;
    const logging::Logger& logger;
};

} // namespace kubecp

#endif // KUBECP_REMOTE_PROBE_H
