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

#ifndef KUBECP_REMOTE_EXECUTOR_H
#define KUBECP_REMOTE_EXECUTOR_H

#include <kubecp/process/process.h>

#include <QByteArray>

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kubecp
{

// A shell script to run inside a remote execution target. Paths go in script_args and are seen by the script
// as "$1", "$2", ... so they never need quoting.
struct RemoteCommand
{
    std::string target;
    std::string exec_args;
    std::string script;
    std::vector<std::string> script_args;
};

struct RemoteResult
{
    bool completed_successfully() const
    {
        return state.completed_successfully();
    }

    // True only if the command ran to completion and returned exactly this status
    bool exited_with(int status) const
    {
        return !state.error && state.exit_code && state.exit_code.value() == status;
    }

    // Failure message followed by whatever the remote side printed on stderr
    std::string describe() const;

    ProcessState state;
    QByteArray standard_error;
};

// Throws RemoteCommandError if the command ran and returned non-zero, TransportError if it could not run at all.
// action describes the attempt for the message, e.g. "read pod:/etc/hosts".
void ensure_success(const RemoteResult& result, const std::string& action);

// The only way the transfer engine reaches a remote target.
class RemoteExecutor
{
public:
    using UPtr = std::unique_ptr<RemoteExecutor>;

    virtual ~RemoteExecutor() = default;

    // Runs the command and writes everything it prints on stdout into out, chunk by chunk, as it arrives.
    // Throws LocalIOError if out stops accepting data; the remote process is killed in that case.
    virtual RemoteResult run(const RemoteCommand& command, std::ostream& out) = 0;

    // Runs the command with input on its stdin. Its stdout is discarded.
    virtual RemoteResult feed(const RemoteCommand& command, const QByteArray& input) = 0;
};
} // namespace kubecp

#endif // KUBECP_REMOTE_EXECUTOR_H
