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

#include <kubecp/exceptions/transfer_exceptions.h>
#include <kubecp/format.h>
#include <kubecp/logging/log.h>
#include <kubecp/transfer/tree_enumerator.h>
#include <kubecp/utils.h>

#include <algorithm>
#include <sstream>

namespace kc = kubecp;
namespace kcl = kubecp::logging;

namespace
{
constexpr auto category = "enumerator";
// -H follows a symlinked root, which classify has already reported as a directory
constexpr auto list_script = "find -H \"$1\" -type f";

bool names_itself(const kc::fs::path& name)
{
    return !name.empty() && name != "." && name != "..";
}
} // namespace

kc::TreeEnumerator::TreeEnumerator(RemoteExecutor& executor, const kcl::Logger& logger)
    : executor{executor}, logger{logger}
{
}

std::vector<std::string> kc::TreeEnumerator::enumerate_remote(const std::string& target,
                                                              const std::string& root,
                                                              const std::string& exec_args)
{
    const auto trimmed_root = kc::utils::trim_trailing_slashes(root);

    std::ostringstream listing;
    const auto result = executor.run({target, exec_args, list_script, {trimmed_root}}, listing);
    ensure_success(result, fmt::format("list {}:{}", target, trimmed_root));

    std::vector<std::string> entries{trimmed_root};
    for (auto& line : kc::utils::split_lines(listing.str()))
    {
        if (!line.empty())
            entries.push_back(std::move(line));
    }

    kcl::debug(logger, category, "found {} files under {}:{}", entries.size() - 1, target, trimmed_root);
    return entries;
}

kc::LocalTree kc::TreeEnumerator::enumerate_local(const fs::path& root) const
{
    const fs::path start{kc::utils::trim_trailing_slashes(root.string())};
    LocalTree tree;
    auto& entries = tree.files;

    try
    {
        // The name as typed, so a symlinked root keeps the link's name. "." and ".." take their real one.
        tree.root_name = names_itself(start.filename()) ? start.filename() : fs::canonical(start).filename();

        for (const auto& entry : fs::recursive_directory_iterator{start})
        {
            if (entry.is_symlink() || !entry.is_regular_file())
            {
                if (!entry.is_directory() || entry.is_symlink())
                    kcl::debug(logger, category, "skipping {}: not a regular file", entry.path().string());
                continue;
            }

            entries.push_back({tree.root_name / entry.path().lexically_relative(start), fs::canonical(entry.path())});
        }
    }
    catch (const fs::filesystem_error& e)
    {
        throw LocalIOError{"cannot list {}: {}", start.string(), e.code().message()};
    }

    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.relative_path < b.relative_path; });

    kcl::debug(logger, category, "found {} files under {}", entries.size(), start.string());
    return tree;
}
