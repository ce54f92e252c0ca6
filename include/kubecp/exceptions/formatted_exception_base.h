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

#ifndef KUBECP_FORMATTED_EXCEPTION_BASE_H
#define KUBECP_FORMATTED_EXCEPTION_BASE_H

#include <kubecp/format.h>

#include <stdexcept>
#include <string>
#include <type_traits>

namespace kubecp
{

/**
 * Exception base type that builds its message with fmt.
 *
 * Derived exceptions inherit the constructors, e.g.
 * @code
 *  struct NotFoundError : FormattedExceptionBase<TransferError> { using FormattedExceptionBase::FormattedExceptionBase; };
 *  throw NotFoundError{"{} not found", path};
 * @endcode
 *
 * @tparam BaseExceptionType Must derive from std::exception and be constructible from a std::string.
 */
template <typename BaseExceptionType = std::runtime_error>
struct FormattedExceptionBase : public BaseExceptionType
{
    static_assert(std::is_constructible<BaseExceptionType, std::string>::value,
                  "BaseExceptionType must be constructible with (std::string)");
    static_assert(std::is_base_of<std::exception, BaseExceptionType>::value,
                  "BaseExceptionType must derive from std::exception");

    template <typename... Args>
    FormattedExceptionBase(fmt::format_string<Args...> fmt, Args&&... args)
        : BaseExceptionType(failsafe_format(fmt, std::forward<Args>(args)...))
    {
    }

private:
    // Throwing from an exception constructor would end in std::terminate, so a broken format string is
    // reported inside the message instead.
    template <typename... Args>
    static std::string failsafe_format(fmt::format_string<Args...> fmt, Args&&... args)
    try
    {
        return fmt::format(fmt, std::forward<Args>(args)...);
    }
    catch (const std::exception& e)
    {
        std::string msg{"[Error while formatting the exception string]"};
        msg += "\nFormat string: `";
        msg.append(fmt.get().data(), fmt.get().size());
        msg += "`\nFormat error: `";
        msg += e.what();
        msg += '`';
        return msg;
    }
};

} // namespace kubecp

#endif // KUBECP_FORMATTED_EXCEPTION_BASE_H
