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

#ifndef KUBECP_STANDARD_LOGGER_H
#define KUBECP_STANDARD_LOGGER_H

#include <kubecp/logging/logger.h>

#include <iosfwd>

namespace kubecp
{
namespace logging
{
class StandardLogger : public Logger
{
public:
    /**
     * Construct a StandardLogger writing to stderr.
     *
     * @param [in] level Level of the logger. Log calls less severe than this are filtered out.
     */
    StandardLogger(Level level);

    /**
     * Construct a StandardLogger writing to an arbitrary stream.
     *
     * @param [in] level Level of the logger. Log calls less severe than this are filtered out.
     * @param [in] target ostream to write the output to
     */
    StandardLogger(Level level, std::ostream& target);

    void log(Level level, std::string_view category, std::string_view message) const override;

private:
    std::ostream& target;
};
} // namespace logging
} // namespace kubecp
#endif // KUBECP_STANDARD_LOGGER_H
