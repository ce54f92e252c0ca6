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
#include "file_operations.h"
#include "mock_logger.h"
#include "mock_remote_executor.h"
#include "temp_dir.h"

#include <kubecp/exceptions/transfer_exceptions.h>
#include <kubecp/transfer/tree_enumerator.h>

namespace kc = kubecp;
namespace kcl = kubecp::logging;
namespace kct = kubecp::test;
namespace fs = std::filesystem;

using namespace testing;

namespace
{
struct TreeEnumerator : public Test
{
    NiceMock<kct::MockLogger> logger;
    StrictMock<kct::MockRemoteExecutor> executor;
    kc::TreeEnumerator enumerator{executor, logger};
};

TEST_F(TreeEnumerator, remoteListingStartsWithRoot)
{
    EXPECT_CALL(executor, run(kct::remote_command(kct::list_command, Eq("/srv/root")), _))
        .WillOnce(Invoke(kct::write_output("/srv/root/a.txt\n/srv/root/sub/b.txt\n")));

    EXPECT_THAT(enumerator.enumerate_remote("pod", "/srv/root", ""),
                ElementsAre("/srv/root", "/srv/root/a.txt", "/srv/root/sub/b.txt"));
}

TEST_F(TreeEnumerator, remoteListingFollowsSymlinkedRoot)
{
    EXPECT_CALL(executor, run(AllOf(kct::remote_command(kct::list_command, Eq("/srv/link")),
                                    Field(&kc::RemoteCommand::script, HasSubstr("find -H"))),
                              _))
        .WillOnce(Invoke(kct::write_output("/srv/link/a.txt\n")));

    EXPECT_THAT(enumerator.enumerate_remote("pod", "/srv/link", ""), ElementsAre("/srv/link", "/srv/link/a.txt"));
}

TEST_F(TreeEnumerator, remoteRootLosesTrailingSlashes)
{
    EXPECT_CALL(executor, run(kct::remote_command(kct::list_command, Eq("/srv/root")), _))
        .WillOnce(Invoke(kct::write_output("/srv/root/a.txt")));

    EXPECT_THAT(enumerator.enumerate_remote("pod", "/srv/root//", ""), ElementsAre("/srv/root", "/srv/root/a.txt"));
}

TEST_F(TreeEnumerator, emptyRemoteDirectoryIsJustRoot)
{
    EXPECT_CALL(executor, run(_, _)).WillOnce(Invoke(kct::write_output("")));

    EXPECT_THAT(enumerator.enumerate_remote("pod", "/srv/empty", ""), ElementsAre("/srv/empty"));
}

TEST_F(TreeEnumerator, remoteListingPassesExecArgs)
{
    EXPECT_CALL(executor,
                run(AllOf(Field(&kc::RemoteCommand::target, Eq("pod")),
                          Field(&kc::RemoteCommand::exec_args, Eq("--context prod"))),
                    _))
        .WillOnce(Invoke(kct::write_output("")));

    enumerator.enumerate_remote("pod", "/srv", "--context prod");
}

TEST_F(TreeEnumerator, failedRemoteListingThrows)
{
    EXPECT_CALL(executor, run(_, _))
        .WillOnce(Return(kct::exit_status(1, "find: '/srv/root': No such file or directory")))
        .WillOnce(Return(kct::process_error()));

    KC_EXPECT_THROW_THAT(enumerator.enumerate_remote("pod", "/srv/root", ""),
                         kc::RemoteCommandError,
                         kct::match_what(HasSubstr("No such file or directory")));
    EXPECT_THROW(enumerator.enumerate_remote("pod", "/srv/root", ""), kc::TransportError);
}

struct LocalTreeEnumerator : public TreeEnumerator
{
    LocalTreeEnumerator()
    {
        kct::make_file_with_content(root / "a.txt", "a");
        kct::make_file_with_content(root / "sub" / "b.txt", "b");
        fs::create_directories(root / "empty");
    }

    kct::TempDir temp_dir;
    fs::path root{temp_dir.fs_path() / "root"};
};

TEST_F(LocalTreeEnumerator, keepsPlacementAndReadingPaths)
{
    const auto tree = enumerator.enumerate_local(root);

    EXPECT_EQ(tree.root_name, fs::path{"root"});
    ASSERT_EQ(tree.files.size(), 2u);
    EXPECT_EQ(tree.files[0].relative_path, fs::path{"root/a.txt"});
    EXPECT_EQ(tree.files[0].absolute_path, fs::canonical(root / "a.txt"));
    EXPECT_EQ(tree.files[1].relative_path, fs::path{"root/sub/b.txt"});
    EXPECT_EQ(tree.files[1].absolute_path, fs::canonical(root / "sub" / "b.txt"));
}

TEST_F(LocalTreeEnumerator, skipsSymlinks)
{
    fs::create_symlink(root / "a.txt", root / "link.txt");
    logger.screen_logs(kcl::Level::error);
    logger.expect_log(kcl::Level::debug, "link.txt");

    const auto tree = enumerator.enumerate_local(root);

    EXPECT_THAT(tree.files, Each(Field(&kc::LocalTreeEntry::relative_path, Ne(fs::path{"root/link.txt"}))));
    EXPECT_EQ(tree.files.size(), 2u);
}

TEST_F(LocalTreeEnumerator, trailingSlashDoesNotChangeNames)
{
    const auto tree = enumerator.enumerate_local(root.string() + "/");

    EXPECT_EQ(tree.root_name, fs::path{"root"});
    EXPECT_EQ(tree.files[0].relative_path, fs::path{"root/a.txt"});
}

TEST_F(LocalTreeEnumerator, currentDirectoryUsesItsRealName)
{
    kct::CurrentDirScope cwd{QString::fromStdString(root.string())};

    const auto tree = enumerator.enumerate_local(".");

    EXPECT_EQ(tree.root_name, fs::path{"root"});
    EXPECT_EQ(tree.files[1].relative_path, fs::path{"root/sub/b.txt"});
}

TEST_F(LocalTreeEnumerator, symlinkedRootKeepsTypedName)
{
    const auto link = temp_dir.fs_path() / "shortcut";
    fs::create_directory_symlink(root, link);

    const auto tree = enumerator.enumerate_local(link);

    EXPECT_EQ(tree.root_name, fs::path{"shortcut"});
    ASSERT_EQ(tree.files.size(), 2u);
    EXPECT_EQ(tree.files[0].relative_path, fs::path{"shortcut/a.txt"});
    EXPECT_EQ(tree.files[0].absolute_path, fs::canonical(root / "a.txt"));
}

TEST_F(LocalTreeEnumerator, missingRootIsLocalError)
{
    EXPECT_THROW(enumerator.enumerate_local(temp_dir.fs_path() / "missing"), kc::LocalIOError);
}
} // namespace
