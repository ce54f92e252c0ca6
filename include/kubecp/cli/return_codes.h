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

#ifndef KUBECP_RETURN_CODES_H
#define KUBECP_RETURN_CODES_H

namespace kubecp
{
enum class ParseCode
{
    Ok,
    CommandLineError,
    HelpRequested,
    VersionRequested
};

// Every failure, command line errors included, exits with the same status
enum ReturnCode
{
    Ok = 0,
    CommandFail = 1
};
} // namespace kubecp

#endif // KUBECP_RETURN_CODES_H
