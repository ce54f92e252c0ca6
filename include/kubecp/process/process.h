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

#ifndef KUBECP_PROCESS_H
#define KUBECP_PROCESS_H

#include <kubecp/disabled_copy_move.h>

#include <QByteArray>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <memory>
#include <optional>

namespace kubecp
{

struct ProcessState
{
    bool completed_successfully() const
    {
        return !error && exit_code && exit_code.value() == 0;
    }

    QString failure_message() const
    {
        if (error)
            return error->message;
        if (exit_code && exit_code.value() != 0)
            return QStringLiteral("Process returned exit code: %1").arg(exit_code.value());
        return QString();
    }

    std::optional<int> exit_code; // not set if the process failed to start or crashed

    struct Error
    {
        QProcess::ProcessError state; // FailedToStart (file not found / resource error), Crashed,
                                      // Timedout, ReadError, WriteError, UnknownError
        QString message;
    };

    std::optional<Error> error;
};

// Synchronous view of a child process. Every blocking call takes a timeout in msecs, -1 meaning no timeout.
class Process : private DisabledCopyMove
{
public:
    using UPtr = std::unique_ptr<Process>;

    virtual ~Process() = default;

    virtual QString program() const = 0;
    virtual QStringList arguments() const = 0;
    virtual qint64 process_id() const = 0;

    virtual void start() = 0;
    virtual void kill() = 0;

    virtual bool wait_for_started(int msecs = 30000) = 0;  // false if the process fails to start
    virtual bool wait_for_finished(int msecs = 30000) = 0; // false on timeout, or if the process never started
    virtual bool wait_for_ready_read(int msecs = 30000) = 0;

    virtual bool running() const = 0;
    virtual ProcessState process_state() const = 0;
    virtual QString error_string() const = 0;

    virtual QByteArray read_all_standard_output() = 0;
    virtual QByteArray read_all_standard_error() = 0;

    virtual qint64 write(const QByteArray& data) = 0;
    virtual void close_write_channel() = 0;
};
} // namespace kubecp

#endif // KUBECP_PROCESS_H
