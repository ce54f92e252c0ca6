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

#ifndef KUBECP_DIRECTION_H
#define KUBECP_DIRECTION_H

#include <kubecp/transfer/path_spec.h>
#include <kubecp/transfer/transfer_request.h>

#include <string>
#include <string_view>

namespace kubecp
{

enum class Direction
{
    Download, // remote to local
    Upload,   // local to remote
    Invalid
};

std::string_view as_string(Direction direction) noexcept;

Direction resolve_direction(const PathSpec& source, const PathSpec& destination) noexcept;

/**
 * Resolve the direction of a copy and build the request describing it.
 *
 * @param [in] source Parsed source argument
 * @param [in] destination Parsed destination argument
 * @param [in] remote_exec_args Arguments for the remote execution command, passed through untouched
 * @param [in] recursive Whether directories may be copied
 * @throw InvalidDirectionError if both or neither paths name a target, or the target name is empty
 */
TransferRequest make_transfer_request(const PathSpec& source,
                                      const PathSpec& destination,
                                      const std::string& remote_exec_args,
                                      bool recursive);

} // namespace kubecp

#endif // KUBECP_DIRECTION_H
