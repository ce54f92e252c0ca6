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

#include <kubecp/exceptions/transfer_exceptions.h>
#include <kubecp/format.h>
#include <kubecp/remote/remote_executor.h>
#include <kubecp/utils.h>

namespace kc = kubecp;

std::string kc::RemoteResult::describe() const
{
    auto message = state.failure_message().toStdString();
    auto details = kc::utils::trim_end(standard_error.toStdString());

    if (details.empty())
        return message;

    return fmt::format("{}: {}", message, details);
}

void kc::ensure_success(const RemoteResult& result, const std::string& action)
{
    if (result.completed_successfully())
        return;

    if (!result.state.error && result.state.exit_code)
        throw RemoteCommandError{fmt::format("failed to {}: {}", action, result.describe()),
                                 result.state.exit_code.value()};

    throw TransportError{"failed to {}: {}", action, result.describe()};
}
