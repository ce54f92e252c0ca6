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
#include <kubecp/transfer/tree_mapper.h>
#include <kubecp/utils.h>

#include <iterator>

namespace kc = kubecp;
namespace mapper = kubecp::tree_mapper;

namespace
{
// Path of dir below parent, which the enumerated directory must start with
std::string relative_to(const std::string& dir, const std::string& parent)
{
    if (parent == "/")
        return dir.substr(1);

    const auto prefix = parent + '/';
    if (dir.compare(0, prefix.size(), prefix) == 0)
        return dir.substr(prefix.size());

    if (parent == ".")
        return dir;

    throw kc::TransferError{fmt::format("{} is not below {}", dir, parent)};
}

void check_root_name(const std::string& root_name, const std::string& root)
{
    if (root_name.empty() || root_name == "." || root_name == "..")
        throw kc::TransferError{fmt::format("cannot mirror {}: it has no directory name", root)};
}
} // namespace

std::set<std::string> mapper::summarize_directory_structure(const std::vector<std::string>& entries)
{
    std::set<std::string> directories;
    if (entries.empty())
        return directories;

    directories.insert(entries.front());
    for (auto it = std::next(entries.begin()); it != entries.end(); ++it)
        directories.insert(kc::utils::posix_parent(*it));

    return directories;
}

std::string mapper::splice_destination(const std::string& entry,
                                       const std::string& root_name,
                                       const std::string& destination_root)
{
    const auto pos = root_name.empty() ? std::string::npos : entry.find(root_name);
    if (pos == std::string::npos)
        throw kc::TransferError{fmt::format("cannot place {}: \"{}\" is not part of its path", entry, root_name)};

    return kc::utils::posix_join(destination_root, entry.substr(pos));
}

kc::DirectoryPlan mapper::plan_download(const TransferRequest& request, std::vector<std::string> remote_entries)
{
    if (remote_entries.empty())
        throw kc::TransferError{fmt::format("nothing enumerated under {}:{}", request.target, request.remote_path)};

    DirectoryPlan plan;
    plan.entries = std::move(remote_entries);

    const auto& root = plan.entries.front();
    const auto root_name = kc::utils::posix_basename(root);
    const auto source_parent = kc::utils::posix_parent(root);
    check_root_name(root_name, root);

    for (const auto& dir : summarize_directory_structure(plan.entries))
        plan.directories_to_create.insert((request.local_path / relative_to(dir, source_parent)).string());

    for (auto it = std::next(plan.entries.begin()); it != plan.entries.end(); ++it)
    {
        plan.leaf_transfers.push_back(TransferRequest{request.target, *it,
                                                      splice_destination(*it, root_name, request.local_path.string()),
                                                      request.remote_exec_args, false});
    }

    return plan;
}

kc::DirectoryPlan mapper::plan_upload(const TransferRequest& request, const LocalTree& local_tree)
{
    const auto root_name = local_tree.root_name.string();
    check_root_name(root_name, request.local_path.string());

    const auto remote_root = kc::utils::trim_trailing_slashes(request.remote_path);

    DirectoryPlan plan;
    plan.entries.push_back(root_name);
    for (const auto& file : local_tree.files)
        plan.entries.push_back(file.relative_path.generic_string());

    for (const auto& dir : summarize_directory_structure(plan.entries))
        plan.directories_to_create.insert(kc::utils::posix_join(remote_root, dir));

    for (std::size_t i = 0; i < local_tree.files.size(); ++i)
    {
        plan.leaf_transfers.push_back(TransferRequest{request.target,
                                                      splice_destination(plan.entries[i + 1], root_name, remote_root),
                                                      local_tree.files[i].absolute_path, request.remote_exec_args,
                                                      false});
    }

    return plan;
}
