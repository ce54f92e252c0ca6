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
#include <kubecp/remote/remote_probe.h>

#include <fmt/format.h>

#include <sstream>

namespace kc = kubecp;
namespace kcl = kubecp::logging;

namespace
{
constexpr auto category = "probe";

std::string exists_script()
{
    return fmt::format("[ -f \"$1\" ] || [ -d \"$1\" ] || exit {}", kc::remote_absent_status);
}

std::string classify_script()
{
    return fmt::format("cat -- \"$1\" > /dev/null 2>&1 || exit {}", kc::remote_not_a_file_status);
}
} // namespace

kc::RemoteProbe::RemoteProbe(RemoteExecutor& executor, const kcl::Logger& logger)
    : executor{executor}, logger{logger}
{
}

bool kc::RemoteProbe::exists(const std::string& target, const std::string& path, const std::string& exec_args)
{
    std::ostringstream discarded;
    const auto result = executor.run({target, exec_args, exists_script(), {path}}, discarded);

    if (result.completed_successfully())
        return true;

    if (result.exited_with(kc::remote_absent_status))
    {
        kcl::debug(logger, category, "{}:{} does not exist", target, path);
        return false;
    }

    throw TransportError{"cannot check {}:{}: {}", target, path, result.describe()};
}

kc::RemoteEntryKind kc::RemoteProbe::classify(const std::string& target,
                                              const std::string& path,
                                              const std::string& exec_args)
{
    std::ostringstream discarded;
    const auto result = executor.run({target, exec_args, classify_script(), {path}}, discarded);

    if (result.completed_successfully())
        return RemoteEntryKind::File;

    if (result.exited_with(kc::remote_not_a_file_status))
    {
        kcl::debug(logger, category, "{}:{} cannot be read as a file, treating it as a directory", target, path);
        return RemoteEntryKind::Directory;
    }

    throw TransportError{"cannot classify {}:{}: {}", target, path, result.describe()};
}
