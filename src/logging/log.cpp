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

#include <kubecp/logging/log.h>

#include <array>

namespace kcl = kubecp::logging;

void kcl::log(const Logger& logger, Level level, std::string_view category, std::string_view message)
{
    if (logger.enabled_for(level))
        logger.log(level, category, message);
}

std::optional<kcl::Level> kcl::level_from(std::string_view name)
{
    constexpr std::array<Level, 5> levels{Level::error, Level::warning, Level::info, Level::debug, Level::trace};

    for (const auto level : levels)
    {
        if (as_string(level) == name)
            return level;
    }

    return std::nullopt;
}
