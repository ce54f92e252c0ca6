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

#include <kubecp/constants.h>
#include <kubecp/logging/standard_logger.h>
#include <kubecp/top_catch_all.h>

#include <QCoreApplication>

#include <iostream>

namespace kc = kubecp;
namespace kcl = kubecp::logging;

namespace
{
int main_impl(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(kc::client_name);

    kc::ClientConfig config{std::cout, std::cerr, {}};
    kc::Client client{config};

    return client.run(QCoreApplication::arguments());
}
} // namespace

int main(int argc, char* argv[])
{
    const kcl::StandardLogger logger{kcl::Level::error};
    return kc::top_catch_all(logger, kc::client_name, /* fallback_return = */ EXIT_FAILURE, main_impl, argc, argv);
}
