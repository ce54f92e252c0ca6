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

#include <kubecp/logging/level.h>
#include <kubecp/logging/log.h>
#include <kubecp/logging/standard_logger.h>

#include <sstream>

namespace kcl = kubecp::logging;

using uut_t = kcl::StandardLogger;

TEST(StandardLoggerTests, callLog)
{
    std::ostringstream mock_stderr;
    uut_t logger{kcl::Level::debug, mock_stderr};
    logger.log(kcl::Level::debug, "cat", "msg");
    ASSERT_THAT(mock_stderr.str(), testing::HasSubstr("[debug] [cat] msg\n"));
}

TEST(StandardLoggerTests, callLogFiltered)
{
    std::ostringstream mock_stderr;
    uut_t logger{kcl::Level::debug, mock_stderr};
    logger.log(kcl::Level::trace, "cat", "msg");
    ASSERT_TRUE(mock_stderr.str().empty());
}

TEST(StandardLoggerTests, formatsThroughHelpers)
{
    std::ostringstream mock_stderr;
    uut_t logger{kcl::Level::warning, mock_stderr};
    kcl::warn(logger, "copy", "{} of {}", 1, "two");
    kcl::info(logger, "copy", "hidden");
    ASSERT_THAT(mock_stderr.str(), testing::EndsWith("[warning] [copy] 1 of two\n"));
}

TEST(StandardLoggerTests, errorsAlwaysPass)
{
    std::ostringstream mock_stderr;
    uut_t logger{kcl::Level::error, mock_stderr};
    kcl::log(logger, kcl::Level::error, "cat", "boom");
    kcl::log(logger, kcl::Level::warning, "cat", "quiet");
    ASSERT_THAT(mock_stderr.str(), testing::HasSubstr("[error] [cat] boom"));
    ASSERT_THAT(mock_stderr.str(), testing::Not(testing::HasSubstr("quiet")));
}

TEST(LevelTests, readsLevelNames)
{
    EXPECT_EQ(kcl::level_from("error"), kcl::Level::error);
    EXPECT_EQ(kcl::level_from("warning"), kcl::Level::warning);
    EXPECT_EQ(kcl::level_from("info"), kcl::Level::info);
    EXPECT_EQ(kcl::level_from("debug"), kcl::Level::debug);
    EXPECT_EQ(kcl::level_from("trace"), kcl::Level::trace);
    EXPECT_EQ(kcl::level_from("warn"), std::nullopt);
    EXPECT_EQ(kcl::level_from(""), std::nullopt);
}
