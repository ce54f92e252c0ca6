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

#ifndef KUBECP_ARGPARSER_H
#define KUBECP_ARGPARSER_H

#include <kubecp/cli/return_codes.h>
#include <kubecp/logging/level.h>

#include <QtCore/QCommandLineOption>
#include <QtCore/QCommandLineParser>

#include <ostream>

namespace kubecp
{
class ArgParser
{
    // Note: We are using camelCase here for methods since this class mimics the QCommandLineParser class

public:
    ArgParser(const QStringList& arguments, std::ostream& cout, std::ostream& cerr);

    void setApplicationDescription(const QString& description);

    ParseCode parse();
    ReturnCode returnCodeFrom(ParseCode parse_code) const;

    QString source() const;
    QString destination() const;
    QString execArguments() const;
    bool isRecursive() const;

    logging::Level verbosityLevel() const;

    QString helpText() const;

private:
    const QStringList arguments;
    QCommandLineParser parser;

    logging::Level verbosity_level{logging::Level::error};

    std::ostream& cout;
    std::ostream& cerr;
};
} // namespace kubecp
#endif // KUBECP_ARGPARSER_H
