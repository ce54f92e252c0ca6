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
#include <kubecp/format.h>
#include <kubecp/logging/log.h>
#include <kubecp/process/basic_process.h>
#include <kubecp/utils.h>

#include <string>
#include <vector>

namespace kc = kubecp;
namespace kcl = kubecp::logging;

namespace
{
std::vector<std::string> to_std_strings(const QString& program, const QStringList& arguments)
{
    std::vector<std::string> ret{program.toStdString()};
    for (const auto& arg : arguments)
        ret.push_back(arg.toStdString());

    return ret;
}
} // namespace

kc::BasicProcess::BasicProcess(std::shared_ptr<kc::ProcessSpec> spec, const kcl::Logger& logger)
    : process_spec{std::move(spec)}, logger{logger}
{
    QObject::connect(&process, &QProcess::started, &process, [this]() { handle_started(); });
    QObject::connect(&process, &QProcess::readyReadStandardError, &process, [this]() { forward_standard_error(); });

    process.setProgram(process_spec->program());
    process.setArguments(process_spec->arguments());
    process.setProcessEnvironment(process_spec->environment());
    if (!process_spec->working_directory().isNull())
        process.setWorkingDirectory(process_spec->working_directory());
}

kc::BasicProcess::~BasicProcess()
{
    if (running())
    {
        process.kill();
        process.waitForFinished(kc::process_kill_timeout);
    }
}

QString kc::BasicProcess::program() const
{
    return process.program();
}

QStringList kc::BasicProcess::arguments() const
{
    return process.arguments();
}

qint64 kc::BasicProcess::process_id() const
{
    return pid;
}

void kc::BasicProcess::start()
{
    process.start();
}

void kc::BasicProcess::kill()
{
    process.kill();
}

bool kc::BasicProcess::wait_for_started(int msecs)
{
    return process.waitForStarted(msecs);
}

bool kc::BasicProcess::wait_for_finished(int msecs)
{
    return process.waitForFinished(msecs);
}

bool kc::BasicProcess::wait_for_ready_read(int msecs)
{
    return process.waitForReadyRead(msecs);
}

kc::ProcessState kc::BasicProcess::process_state() const
{
    kc::ProcessState state;

    if (process.error() != QProcess::ProcessError::UnknownError)
    {
        state.error = kc::ProcessState::Error{process.error(), error_string()};
    }
    else if (process.state() != QProcess::Running && process.exitStatus() == QProcess::NormalExit)
    {
        state.exit_code = process.exitCode();
    }

    return state;
}

QString kc::BasicProcess::error_string() const
{
    return QString{"program: %1; error: %2"}.arg(process_spec->program(), process.errorString());
}

bool kc::BasicProcess::running() const
{
    return process.state() != QProcess::NotRunning;
}

QByteArray kc::BasicProcess::read_all_standard_output()
{
    return process.readAllStandardOutput();
}

QByteArray kc::BasicProcess::read_all_standard_error()
{
    return process.readAllStandardError();
}

qint64 kc::BasicProcess::write(const QByteArray& data)
{
    return process.write(data);
}

void kc::BasicProcess::close_write_channel()
{
    process.closeWriteChannel();
}

void kc::BasicProcess::handle_started()
{
    pid = process.processId(); // save this, so we know it even after finished
    kcl::debug(logger, process_spec->program().toStdString(), "[{}] started: {}", pid,
               kc::utils::to_cmd(to_std_strings(process_spec->program(), process_spec->arguments()),
                                 kc::utils::QuoteType::quote_every_arg));
}

void kc::BasicProcess::forward_standard_error()
{
    // Reading would take the data away from the caller, so peek instead. This is what
    // QProcess::readAllStandardError() does, with the read replaced by a peek.
    auto original = process.readChannel();
    process.setReadChannel(QProcess::StandardError);
    QByteArray data = process.peek(process.bytesAvailable());
    process.setReadChannel(original);

    kcl::log(logger, process_spec->error_log_level(), process_spec->program().toStdString(),
             kc::utils::trim_end(data.toStdString()));
}
