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

#ifndef KUBECP_CONSTANTS_H
#define KUBECP_CONSTANTS_H

#include <chrono>

using namespace std::chrono_literals;

namespace kubecp
{
constexpr auto client_name = "kubecp";

constexpr auto kubectl_env_var = "KUBECP_KUBECTL";
constexpr auto default_kubectl = "kubectl";
constexpr auto remote_shell = "sh";

constexpr auto process_start_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(30s).count();
constexpr auto process_kill_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(5s).count();
constexpr auto no_timeout = -1;

// Exit statuses the remote probe scripts reserve for themselves. Anything else coming back from kubectl is a
// transport problem. Both are taken from sysexits.h so they do not collide with kubectl's own status 1.
constexpr auto remote_absent_status = 66;     // EX_NOINPUT
constexpr auto remote_not_a_file_status = 65; // EX_DATAERR
} // namespace kubecp

#endif // KUBECP_CONSTANTS_H
