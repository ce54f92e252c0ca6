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

#ifndef KUBECP_LOG_H
#define KUBECP_LOG_H

#include <kubecp/format.h>
#include <kubecp/logging/level.h>
#include <kubecp/logging/logger.h>

#include <string_view>
#include <utility>

namespace kubecp
{
namespace logging
{

/**
 * Log an already formatted message through @p logger.
 *
 * Messages below the logger's level are dropped here, so callers do not need to check first.
 */
void log(const Logger& logger, Level level, std::string_view category, std::string_view message);

/**
 * Log with formatting support.
 *
 * Formatting only happens when the logger would actually emit the entry.
 *
 * @tparam Args Format argument types
 * @param logger The logger handle owned by the caller
 * @param level Log level
 * @param category Log category
 * @param fmt Format string
 * @param args Format arguments
 */
template <typename... Args>
void log(const Logger& logger,
         Level level,
         std::string_view category,
         fmt::format_string<Args...> fmt,
         Args&&... args)
{
    if (logger.enabled_for(level))
        logger.log(level, category, fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(const Logger& logger, std::string_view category, fmt::format_string<Args...> fmt, Args&&... args)
{
    logging::log(logger, Level::error, category, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(const Logger& logger, std::string_view category, fmt::format_string<Args...> fmt, Args&&... args)
{
    logging::log(logger, Level::warning, category, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(const Logger& logger, std::string_view category, fmt::format_string<Args...> fmt, Args&&... args)
{
    logging::log(logger, Level::info, category, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(const Logger& logger, std::string_view category, fmt::format_string<Args...> fmt, Args&&... args)
{
    logging::log(logger, Level::debug, category, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(const Logger& logger, std::string_view category, fmt::format_string<Args...> fmt, Args&&... args)
{
    logging::log(logger, Level::trace, category, fmt, std::forward<Args>(args)...);
}

} // namespace logging
} // namespace kubecp
#endif // KUBECP_LOG_H
