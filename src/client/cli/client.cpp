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

#include "client.h"

#include <kubecp/cli/argparser.h>
#include <kubecp/constants.h>
#include <kubecp/exceptions/transfer_exceptions.h>
#include <kubecp/logging/log.h>
#include <kubecp/logging/standard_logger.h>
#include <kubecp/remote/kubectl_executor.h>
#include <kubecp/transfer/direction.h>
#include <kubecp/transfer/path_spec.h>
#include <kubecp/transfer/transfer_engine.h>
#include <kubecp/version.h>

namespace kc = kubecp;
namespace kcl = kubecp::logging;

namespace
{
kc::RemoteExecutor::UPtr make_kubectl_executor(const kcl::Logger& logger)
{
    return std::make_unique<kc::KubectlExecutor>(logger);
}
} // namespace

kc::Client::Client(ClientConfig& config)
    : cout{config.cout},
      cerr{config.cerr},
      make_executor{config.make_executor}
{
    if (!make_executor)
        make_executor = make_kubectl_executor;
}

int kc::Client::run(const QStringList& arguments)
{
    QString description("Copy files and directories to and from containers.\n\n"
                        "Exactly one of <source> and <destination> names a target, as <target>:<path>.\n"
                        "Everything runs through kubectl exec: the container only needs a POSIX shell,\n"
                        "cat, tee, find and mkdir.");

    ArgParser parser(arguments, cout, cerr);
    parser.setApplicationDescription(description);

    const auto parse_status = parser.parse();

    // try to respect requested verbosity, even if parsing failed
    kcl::StandardLogger logger{parser.verbosityLevel(), cerr};

    if (parse_status == ParseCode::VersionRequested)
    {
        cout << fmt::format("{} {}\nbuilt {}\n", kc::client_name, kc::version_string, kc::build_date);
        return ReturnCode::Ok;
    }

    if (parse_status != ParseCode::Ok)
        return parser.returnCodeFrom(parse_status);

    try
    {
        const auto source = parse_path_spec(parser.source().toStdString());
        const auto destination = parse_path_spec(parser.destination().toStdString());
        const auto request = make_transfer_request(source, destination, parser.execArguments().toStdString(),
                                                   parser.isRecursive());

        auto executor = make_executor(logger);
        TransferEngine engine{*executor, logger};
        engine.execute(resolve_direction(source, destination), request);
    }
    catch (const TransferError& e)
    {
        kcl::error(logger, kc::client_name, "{}", e.what());
        return ReturnCode::CommandFail;
    }

    return ReturnCode::Ok;
}
