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

#ifndef KUBECP_TRANSFER_REQUEST_H
#define KUBECP_TRANSFER_REQUEST_H

#include <filesystem>
#include <string>

namespace kubecp
{
namespace fs = std::filesystem;

// Everything one copy needs. Directory transfers derive one of these per leaf instead of changing their own.
struct TransferRequest
{
    std::string target;
    std::string remote_path;
    fs::path local_path;
    std::string remote_exec_args;
    bool recursive{false};
};

} // namespace kubecp

#endif // KUBECP_TRANSFER_REQUEST_H
