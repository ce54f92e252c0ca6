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

#include <kubecp/cli/argparser.h>
#include <kubecp/format.h>

/*
 * ArgParser - a wrapping of a QCommandLineParser for the single command kubecp offers. It registers the
 * options, validates the two positional paths and works out the requested verbosity, which is honoured even
 * when the rest of the command line is wrong.
 */

namespace kc = kubecp;
namespace kcl = kubecp::logging;

namespace
{
const QStringList help_option_names{"h", "help"};

QCommandLineOption verbosity_option()
{
    return QCommandLineOption{{"v", "verbosity"},
                              "Logging verbosity: one of error, warning, info, debug or trace. Defaults to error.",
                              "level",
                              "error"};
}
} // namespace

kc::ArgParser::ArgParser(const QStringList& arguments, std::ostream& cout, std::ostream& cerr)
    : arguments(arguments), cout(cout), cerr(cerr)
{
}

void kc::ArgParser::setApplicationDescription(const QString& description)
{
    parser.setApplicationDescription(description);
}

kc::ParseCode kc::ArgParser::parse()
{
    QCommandLineOption help_option(help_option_names, "Display this help");
    QCommandLineOption version_option({"V", "version"}, "Show version details");
    QCommandLineOption exec_args_option(
        {"a", "arguments"},
        "Arguments passed to kubectl exec before the target, e.g. \"-n <namespace> -c <container>\"",
        "arguments");
    QCommandLineOption recursive_option({"r", "recursive"}, "Copy directories recursively");
    const auto verbosity = verbosity_option();

    parser.addOption(help_option);
    parser.addOption(version_option);
    parser.addOption(exec_args_option);
    parser.addOption(recursive_option);
    parser.addOption(verbosity);

    parser.addPositionalArgument("source", "The path to copy from, <target>:<path> for a remote one", "<source>");
    parser.addPositionalArgument("destination", "The path to copy to, <target>:<path> for a remote one",
                                 "<destination>");

    const bool parser_result = parser.parse(arguments);

    if (parser.isSet(verbosity))
    {
        const auto level = kcl::level_from(parser.value(verbosity).toStdString());
        if (!level)
        {
            cerr << fmt::format("Invalid verbosity level: \"{}\"\n", parser.value(verbosity));
            return ParseCode::CommandLineError;
        }
        verbosity_level = *level;
    }

    if (!parser_result)
    {
        cerr << qUtf8Printable(parser.errorText()) << '\n';
        return ParseCode::CommandLineError;
    }

    if (parser.isSet(help_option))
    {
        cout << qUtf8Printable(helpText());
        return ParseCode::HelpRequested;
    }

    if (parser.isSet(version_option))
        return ParseCode::VersionRequested;

    if (parser.positionalArguments().size() != 2)
    {
        cerr << "Need a source and a destination\n\n";
        cerr << qUtf8Printable(helpText());
        return ParseCode::CommandLineError;
    }

    return ParseCode::Ok;
}

kc::ReturnCode kc::ArgParser::returnCodeFrom(ParseCode parse_code) const
{
    switch (parse_code)
    {
    case ParseCode::CommandLineError:
        return ReturnCode::CommandFail;
    default:
        return ReturnCode::Ok;
    }
}

QString kc::ArgParser::source() const
{
    return parser.positionalArguments().value(0);
}

QString kc::ArgParser::destination() const
{
    return parser.positionalArguments().value(1);
}

QString kc::ArgParser::execArguments() const
{
    return parser.value("arguments");
}

bool kc::ArgParser::isRecursive() const
{
    return parser.isSet("recursive");
}

kcl::Level kc::ArgParser::verbosityLevel() const
{
    return verbosity_level;
}

QString kc::ArgParser::helpText() const
{
    return parser.helpText();
}
