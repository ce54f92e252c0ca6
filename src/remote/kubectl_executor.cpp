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
#include <kubecp/exceptions/transfer_exceptions.h>
#include <kubecp/logging/log.h>
#include <kubecp/process/basic_process.h>
#include <kubecp/remote/kubectl_executor.h>
#include <kubecp/remote/kubectl_process_spec.h>

#include <scope_guard.hpp>

#include <QtGlobal>

#include <cerrno>
#include <cstring>
#include <ostream>

namespace kc = kubecp;
namespace kcl = kubecp::logging;

namespace
{
constexpr auto category = "kubectl";

QString kubectl_from_environment()
{
    auto kubectl = qEnvironmentVariable(kc::kubectl_env_var);
    return kubectl.isEmpty() ? QString{kc::default_kubectl} : kubectl;
}

void write_chunk(std::ostream& out, const QByteArray& chunk)
{
    if (chunk.isEmpty())
        return;

    out.write(chunk.constData(), chunk.size());
    if (!out)
        throw kc::LocalIOError{"failed to write {} bytes locally: {}", chunk.size(), std::strerror(errno)};
}

// Kills and reaps the process unless it has already been waited for
auto make_reaper(kc::Process& process)
{
    return sg::make_scope_guard([&process]() noexcept {
        if (process.running())
        {
            process.kill();
            process.wait_for_finished(kc::process_kill_timeout);
        }
    });
}
} // namespace

kc::KubectlExecutor::KubectlExecutor(const kcl::Logger& logger) : KubectlExecutor{kubectl_from_environment(), logger}
{
}

kc::KubectlExecutor::KubectlExecutor(const QString& kubectl, const kcl::Logger& logger)
    : kubectl_program{kubectl}, logger{logger}
{
}

kc::RemoteResult kc::KubectlExecutor::run(const RemoteCommand& command, std::ostream& out)
{
    auto process = launch(command, /* attach_stdin = */ false);
    auto reaper = make_reaper(*process);

    process->start();
    if (!process->wait_for_started(kc::process_start_timeout))
        return RemoteResult{process->process_state(), process->read_all_standard_error()};

    process->close_write_channel();

    while (process->wait_for_ready_read(kc::no_timeout))
        write_chunk(out, process->read_all_standard_output());

    process->wait_for_finished(kc::no_timeout);
    write_chunk(out, process->read_all_standard_output());

    return RemoteResult{process->process_state(), process->read_all_standard_error()};
}

kc::RemoteResult kc::KubectlExecutor::feed(const RemoteCommand& command, const QByteArray& input)
{
    auto process = launch(command, /* attach_stdin = */ true);
    auto reaper = make_reaper(*process);

    process->start();
    if (!process->wait_for_started(kc::process_start_timeout))
        return RemoteResult{process->process_state(), process->read_all_standard_error()};

    if (process->write(input) != input.size())
        throw TransportError{"could not send {} bytes to {}: {}", input.size(), command.target,
                             process->error_string()};

    process->close_write_channel();
    process->wait_for_finished(kc::no_timeout);
    process->read_all_standard_output();

    kcl::trace(logger, category, "sent {} bytes to {}", input.size(), command.target);

    return RemoteResult{process->process_state(), process->read_all_standard_error()};
}

const QString& kc::KubectlExecutor::kubectl() const
{
    return kubectl_program;
}

kc::Process::UPtr kc::KubectlExecutor::launch(const RemoteCommand& command, bool attach_stdin) const
{
    auto spec = std::make_shared<KubectlProcessSpec>(kubectl_program, command, attach_stdin);
    kcl::trace(logger, category, "script for {}: {}", command.target, command.script);

    return std::make_unique<BasicProcess>(std::move(spec), logger);
}
