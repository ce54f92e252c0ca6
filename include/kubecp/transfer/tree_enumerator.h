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

#ifndef KUBECP_TREE_ENUMERATOR_H
#define KUBECP_TREE_ENUMERATOR_H

#include <kubecp/logging/logger.h>
#include <kubecp/remote/remote_executor.h>

#include <filesystem>
#include <string>
#include <vector>

namespace kubecp
{
namespace fs = std::filesystem;

struct LocalTreeEntry
{
    fs::path relative_path; // starts with the root directory's own name, e.g. "root/sub/b.txt"
    fs::path absolute_path; // canonical, used to read the bytes
};

struct LocalTree
{
    fs::path root_name;
    std::vector<LocalTreeEntry> files; // sorted by relative_path
};

class TreeEnumerator
{
public:
    TreeEnumerator(RemoteExecutor& executor, const logging::Logger& logger);

    // Every file below root, at any depth, preceded by root itself
    std::vector<std::string> enumerate_remote(const std::string& target,
                                              const std::string& root,
                                              const std::string& exec_args);

    // Every regular file below root. Symlinks and special files are skipped.
    LocalTree enumerate_local(const fs::path& root) const;

private:
    RemoteExecutor& executor;
    const logging::Logger& logger;
};

} // namespace kubecp

#endif // KUBECP_TREE_ENUMERATOR_H
