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

#ifndef KUBECP_KUBECTL_EXECUTOR_H
#define KUBECP_KUBECTL_EXECUTOR_H

#include <kubecp/logging/logger.h>
#include <kubecp/process/process.h>
#include <kubecp/remote/remote_executor.h>

#include <QString>

namespace kubecp
{

class KubectlExecutor : public RemoteExecutor
{
public:
    // Uses $KUBECP_KUBECTL if set, plain "kubectl" from PATH otherwise
    explicit KubectlExecutor(const logging::Logger& logger);
    KubectlExecutor(const QString& kubectl, const logging::Logger& logger);

    RemoteResult run(const RemoteCommand& command, std::ostream& out) override;
    RemoteResult feed(const RemoteCommand& command, const QByteArray& input) override;

    const QString& kubectl() const;

protected:
    virtual Process::UPtr launch(const RemoteCommand& command, bool attach_stdin) const;

private:
    const QString kubectl_program;
    const logging::Logger& logger;
};

} // namespace kubecp

#endif // KUBECP_KUBECTL_EXECUTOR_H
