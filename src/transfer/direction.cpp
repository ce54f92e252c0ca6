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
#include <kubecp/transfer/direction.h>

namespace kc = kubecp;

std::string_view kc::as_string(Direction direction) noexcept
{
    switch (direction)
    {
    case Direction::Download:
        return "download";
    case Direction::Upload:
        return "upload";
    case Direction::Invalid:
        break;
    }
    return "invalid";
}

kc::Direction kc::resolve_direction(const PathSpec& source, const PathSpec& destination) noexcept
{
    if (source.qualified() && !destination.qualified())
        return Direction::Download;

    if (destination.qualified() && !source.qualified())
        return Direction::Upload;

    return Direction::Invalid;
}

kc::TransferRequest kc::make_transfer_request(const PathSpec& source,
                                              const PathSpec& destination,
                                              const std::string& remote_exec_args,
                                              bool recursive)
{
    if (source.qualified() && destination.qualified())
        throw InvalidDirectionError{"cannot copy between two remote targets"};

    const auto direction = resolve_direction(source, destination);
    if (direction == Direction::Invalid)
        throw InvalidDirectionError{"a target is needed: use <target>:<path> for the source or the destination"};

    const auto& remote = direction == Direction::Download ? source : destination;
    const auto& local = direction == Direction::Download ? destination : source;

    if (remote.target->empty())
        throw InvalidDirectionError{"missing target name in \":{}\"", remote.path};

    if (local.path.empty())
        throw InvalidDirectionError{"the local path cannot be empty"};

    return TransferRequest{*remote.target, remote.path.empty() ? std::string{"."} : remote.path, local.path,
                           remote_exec_args, recursive};
}
