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

#include <kubecp/constants.h>
#include <kubecp/remote/kubectl_process_spec.h>

#include <QProcess>

namespace kc = kubecp;
namespace kcl = kubecp::logging;

kc::KubectlProcessSpec::KubectlProcessSpec(const QString& kubectl, const RemoteCommand& command, bool attach_stdin)
    : kubectl{kubectl}, command{command}, attach_stdin{attach_stdin}
{
}

QString kc::KubectlProcessSpec::program() const
{
    return kubectl;
}

QStringList kc::KubectlProcessSpec::arguments() const
{
    QStringList args{"exec"};
    if (attach_stdin)
        args << "-i";

    args << QProcess::splitCommand(QString::fromStdString(command.exec_args));
    args << QString::fromStdString(command.target) << "--";
    args << kc::remote_shell << "-c" << QString::fromStdString(command.script) << kc::remote_shell;

    for (const auto& arg : command.script_args)
        args << QString::fromStdString(arg);

    return args;
}

// Failures are reported through exceptions carrying the remote stderr, the live copy is only for debugging
kcl::Level kc::KubectlProcessSpec::error_log_level() const
{
    return kcl::Level::debug;
}
