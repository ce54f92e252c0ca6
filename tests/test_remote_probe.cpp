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

#include "common.h"
#include "mock_logger.h"
#include "mock_remote_executor.h"

#include <kubecp/exceptions/transfer_exceptions.h>
#include <kubecp/remote/remote_probe.h>

namespace kc = kubecp;
namespace kcl = kubecp::logging;
namespace kct = kubecp::test;

using namespace testing;

namespace
{
struct RemoteProbe : public Test
{
    NiceMock<kct::MockLogger> logger;
    StrictMock<kct::MockRemoteExecutor> executor;
    kc::RemoteProbe probe{executor, logger};
};

TEST_F(RemoteProbe, existsRunsTestExpressionAgainstTarget)
{
    EXPECT_CALL(executor,
                run(AllOf(Field(&kc::RemoteCommand::target, Eq("pod")),
                          Field(&kc::RemoteCommand::exec_args, Eq("-n ns")),
                          kct::remote_command(kct::exists_probe, Eq("/tmp/file.txt"))),
                    _))
        .WillOnce(Return(kct::remote_success()));

    EXPECT_TRUE(probe.exists("pod", "/tmp/file.txt", "-n ns"));
}

TEST_F(RemoteProbe, existsIsFalseOnReservedStatus)
{
    EXPECT_CALL(executor, run(kct::remote_command(kct::exists_probe), _))
        .WillOnce(Return(kct::exit_status(kc::remote_absent_status)));

    EXPECT_FALSE(probe.exists("pod", "/missing", ""));
}

TEST_F(RemoteProbe, existsThrowsOnOtherStatus)
{
    EXPECT_CALL(executor, run(_, _))
        .WillOnce(Return(kct::exit_status(1, "error: pods \"pod\" not found")));

    KC_EXPECT_THROW_THAT(probe.exists("pod", "/tmp/file.txt", ""),
                         kc::TransportError,
                         kct::match_what(HasSubstr("pods \"pod\" not found")));
}

TEST_F(RemoteProbe, existsThrowsWhenKubectlCannotRun)
{
    EXPECT_CALL(executor, run(_, _)).WillOnce(Return(kct::process_error()));

    EXPECT_THROW(probe.exists("pod", "/tmp/file.txt", ""), kc::TransportError);
}

TEST_F(RemoteProbe, classifiesReadableAsFile)
{
    EXPECT_CALL(executor, run(kct::remote_command(kct::classify_probe, Eq("/tmp/file.txt")), _))
        .WillOnce(Return(kct::remote_success()));

    EXPECT_EQ(probe.classify("pod", "/tmp/file.txt", ""), kc::RemoteEntryKind::File);
}

TEST_F(RemoteProbe, classifiesUnreadableAsDirectory)
{
    EXPECT_CALL(executor, run(kct::remote_command(kct::classify_probe), _))
        .WillOnce(Return(kct::exit_status(kc::remote_not_a_file_status)));
    logger.screen_logs(kcl::Level::error);
    logger.expect_log(kcl::Level::debug, "treating it as a directory");

    EXPECT_EQ(probe.classify("pod", "/tmp/dir", ""), kc::RemoteEntryKind::Directory);
}

TEST_F(RemoteProbe, classifyNeverTurnsTransportFailureIntoDirectory)
{
    EXPECT_CALL(executor, run(_, _))
        .WillOnce(Return(kct::exit_status(1)))
        .WillOnce(Return(kct::process_error(QProcess::Crashed, "crashed")));

    EXPECT_THROW(probe.classify("pod", "/tmp/dir", ""), kc::TransportError);
    EXPECT_THROW(probe.classify("pod", "/tmp/dir", ""), kc::TransportError);
}

TEST_F(RemoteProbe, absentStatusFromClassifyIsTransportFailure)
{
    EXPECT_CALL(executor, run(_, _)).WillOnce(Return(kct::exit_status(kc::remote_absent_status)));

    EXPECT_THROW(probe.classify("pod", "/tmp/dir", ""), kc::TransportError);
}
} // namespace
