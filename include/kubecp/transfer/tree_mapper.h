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

#ifndef KUBECP_TREE_MAPPER_H
#define KUBECP_TREE_MAPPER_H

#include <kubecp/transfer/transfer_request.h>
#include <kubecp/transfer/tree_enumerator.h>

#include <set>
#include <string>
#include <vector>

namespace kubecp
{

struct DirectoryPlan
{
    std::vector<std::string> entries;             // as enumerated, root first
    std::set<std::string> directories_to_create;  // on the destination side
    std::vector<TransferRequest> leaf_transfers;  // one per file, in enumeration order
};

/*
 * The tree mapper mirrors an enumerated tree onto the destination.
 *
 * Placement relies on the root's base name: the destination of an entry is the suffix of the entry path
 * that starts at the first occurrence of that name, joined under the destination root. When the name also
 * occurs earlier in the path (root "/data/a" puts an "a" inside "data") the first occurrence still wins.
 */
namespace tree_mapper
{
// Distinct parent directories of every entry after the first, plus the first entry (the root) itself
std::set<std::string> summarize_directory_structure(const std::vector<std::string>& entries);

// Suffix of entry starting at root_name, joined under destination_root. Throws TransferError if root_name is
// not part of entry.
std::string splice_destination(const std::string& entry,
                               const std::string& root_name,
                               const std::string& destination_root);

DirectoryPlan plan_download(const TransferRequest& request, std::vector<std::string> remote_entries);
DirectoryPlan plan_upload(const TransferRequest& request, const LocalTree& local_tree);
} // namespace tree_mapper

} // namespace kubecp

#endif // KUBECP_TREE_MAPPER_H
