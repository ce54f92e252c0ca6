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

#ifndef KUBECP_CLIENT_H
#define KUBECP_CLIENT_H

#include <kubecp/logging/logger.h>
#include <kubecp/remote/remote_executor.h>

#include <QStringList>

#include <functional>
#include <ostream>

namespace kubecp
{
struct ClientConfig
{
    std::ostream& cout;
    std::ostream& cerr;
    // Builds the transport once the logger exists. A KubectlExecutor is used when not set.
    std::function<RemoteExecutor::UPtr(const logging::Logger&)> make_executor;
};

class Client
{
public:
    explicit Client(ClientConfig& config);
    virtual ~Client() = default;
    int run(const QStringList& arguments);

private:
    std::ostream& cout;
    std::ostream& cerr;
    std::function<RemoteExecutor::UPtr(const logging::Logger&)> make_executor;
};
} // namespace kubecp

#endif // KUBECP_CLIENT_H
