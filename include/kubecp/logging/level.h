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

#ifndef KUBECP_LEVEL_H
#define KUBECP_LEVEL_H

#include <optional>
#include <string_view>
#include <type_traits>

namespace kubecp
{
namespace logging
{

/**
 * The level of a log entry, in decreasing order of severity.
 */
enum class Level : int
{
    error = 0,   /**< A failure that prevents the requested copy from completing. The run exits with 1. */
    warning = 1, /**< Something that probably does not match what the user intended, without stopping the copy. */
    info = 2,    /**< Progress the user may want to follow: which files and directories are being copied. */
    debug = 3,   /**< Details useful for troubleshooting, such as the kubectl invocations. */
    trace = 4    /**< Chatty details like remote stderr chunks and per-entry path mapping. */
};

constexpr std::string_view as_string(const Level& l) noexcept
{
    switch (l)
    {
    case Level::debug:
        return "debug";
    case Level::error:
        return "error";
    case Level::info:
        return "info";
    case Level::warning:
        return "warning";
    case Level::trace:
        return "trace";
    }
    return "unknown";
}

constexpr auto enum_type(Level e) noexcept
{
    return static_cast<std::underlying_type_t<Level>>(e);
}

constexpr Level level_from(std::underlying_type_t<Level> in)
{
    return static_cast<Level>(in);
}

// Inverse of as_string, used to read the --verbosity option
std::optional<Level> level_from(std::string_view name);

constexpr bool operator<(Level a, Level b) noexcept
{
    return enum_type(a) < enum_type(b);
}

constexpr bool operator>(Level a, Level b) noexcept
{
    return enum_type(a) > enum_type(b);
}

constexpr bool operator<=(Level a, Level b) noexcept
{
    return enum_type(a) <= enum_type(b);
}

constexpr bool operator>=(Level a, Level b) noexcept
{
    return enum_type(a) >= enum_type(b);
}
} // namespace logging
} // namespace kubecp

#endif // KUBECP_LEVEL_H
