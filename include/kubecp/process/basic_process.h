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

#ifndef KUBECP_BASIC_PROCESS_H
#define KUBECP_BASIC_PROCESS_H

#include <kubecp/logging/logger.h>
#include <kubecp/process/process.h>
#include <kubecp/process/process_spec.h>

#include <QProcess>

#include <memory>

namespace kubecp
{

// BasicProcess implements the Process interface on top of QProcess. The child's stderr is forwarded to the
// logger at the ProcessSpec's error_log_level while it stays readable for the caller.
class BasicProcess : public Process
{
public:
    BasicProcess(std::shared_ptr<ProcessSpec> spec, const logging::Logger& logger);
    ~BasicProcess() override;

    QString program() const override;
    QStringList arguments() const override;
    qint64 process_id() const override;

    void start() override;
    void kill() override;

    bool wait_for_started(int msecs = 30000) override;
    bool wait_for_finished(int msecs = 30000) override;
    bool wait_for_ready_read(int msecs = 30000) override;

    bool running() const override;
    ProcessState process_state() const override;
    QString error_string() const override;

    QByteArray read_all_standard_output() override;
    QByteArray read_all_standard_error() override;

    qint64 write(const QByteArray& data) override;
    void close_write_channel() override;

protected:
    const std::shared_ptr<ProcessSpec> process_spec;
    const logging::Logger& logger;
    QProcess process;

private:
    void handle_started();
    void forward_standard_error();
    qint64 pid = 0;
};

} // namespace kubecp

#endif // KUBECP_BASIC_PROCESS_H
