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

#ifndef KUBECP_TRANSFER_EXCEPTIONS_H
#define KUBECP_TRANSFER_EXCEPTIONS_H

#include <kubecp/exceptions/formatted_exception_base.h>

#include <stdexcept>
#include <string>

namespace kubecp
{
class TransferError : public std::runtime_error
{
public:
    explicit TransferError(const std::string& what_arg) : runtime_error(what_arg)
    {
    }
};

// Source/destination pair that names two targets, or none
struct InvalidDirectionError : public FormattedExceptionBase<TransferError>
{
    using FormattedExceptionBase<TransferError>::FormattedExceptionBase;
};

// A remote path, or the local source of an upload, does not exist
struct NotFoundError : public FormattedExceptionBase<TransferError>
{
    using FormattedExceptionBase<TransferError>::FormattedExceptionBase;
};

// kubectl could not be run, crashed, or returned something the probes do not reserve
struct TransportError : public FormattedExceptionBase<TransferError>
{
    using FormattedExceptionBase<TransferError>::FormattedExceptionBase;
};

struct LocalIOError : public FormattedExceptionBase<TransferError>
{
    using FormattedExceptionBase<TransferError>::FormattedExceptionBase;
};

struct DirectoryCreateError : public FormattedExceptionBase<TransferError>
{
    using FormattedExceptionBase<TransferError>::FormattedExceptionBase;
};

// Directory given as source while recursive mode is off
struct RecursionRequiredError : public FormattedExceptionBase<TransferError>
{
    using FormattedExceptionBase<TransferError>::FormattedExceptionBase;
};

class RemoteCommandError : public TransferError
{
public:
    RemoteCommandError(const std::string& what_arg, int exit_code) : TransferError{what_arg}, ec{exit_code}
    {
    }

    int exit_code() const
    {
        return ec;
    }

private:
    int ec;
};
} // namespace kubecp

#endif // KUBECP_TRANSFER_EXCEPTIONS_H
