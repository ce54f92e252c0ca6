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

#include <kubecp/transfer/path_spec.h>

namespace kc = kubecp;

using namespace testing;

namespace
{
struct PathSpecUnqualified : public TestWithParam<std::string>
{
};

TEST_P(PathSpecUnqualified, hasNoTarget)
{
    const auto spec = kc::parse_path_spec(GetParam());

    EXPECT_FALSE(spec.qualified());
    EXPECT_FALSE(spec.target.has_value());
    EXPECT_EQ(spec.path, GetParam());
}

INSTANTIATE_TEST_SUITE_P(PathSpec,
                         PathSpecUnqualified,
                         Values("file.txt", "/tmp/file.txt", ".", "", "dir/", "./with space/and-dash"));

TEST(PathSpec, splitsTargetAndPath)
{
    EXPECT_EQ(kc::parse_path_spec("pod:/tmp/file.txt"), (kc::PathSpec{"pod", "/tmp/file.txt"}));
}

TEST(PathSpec, keepsFurtherColonsInPath)
{
    const auto spec = kc::parse_path_spec("pod:/data/a:b:c");

    ASSERT_TRUE(spec.qualified());
    EXPECT_EQ(*spec.target, "pod");
    EXPECT_EQ(spec.path, "/data/a:b:c");
}

TEST(PathSpec, emptyTargetIsStillQualified)
{
    EXPECT_EQ(kc::parse_path_spec(":/tmp/x"), (kc::PathSpec{"", "/tmp/x"}));
}

TEST(PathSpec, emptyPathAfterTarget)
{
    EXPECT_EQ(kc::parse_path_spec("pod:"), (kc::PathSpec{"pod", ""}));
}

TEST(PathSpec, doesNotLookAtTheFilesystem)
{
    EXPECT_EQ(kc::parse_path_spec("/surely/does/not/exist"), (kc::PathSpec{std::nullopt, "/surely/does/not/exist"}));
}

TEST(PathSpec, comparesTargetAndPath)
{
    EXPECT_NE((kc::PathSpec{"a", "x"}), (kc::PathSpec{"b", "x"}));
    EXPECT_NE((kc::PathSpec{"a", "x"}), (kc::PathSpec{"a", "y"}));
    EXPECT_NE((kc::PathSpec{std::nullopt, "x"}), (kc::PathSpec{"", "x"}));
}
} // namespace
