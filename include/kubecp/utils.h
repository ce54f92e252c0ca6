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

#ifndef KUBECP_UTILS_H
#define KUBECP_UTILS_H

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace kubecp
{
namespace utils
{
enum class QuoteType
{
    no_quotes,
    quote_every_arg
};

// command helpers
std::string to_cmd(const std::vector<std::string>& args, QuoteType type);
std::string escape_for_shell(const std::string& s);

// string helpers
template <typename Str, typename Filter>
Str&& trim_end(Str&& s, Filter&& filter);
template <typename Str>
Str&& trim_end(Str&& s);
std::vector<std::string> split_lines(const std::string& text);

// POSIX path helpers, for paths on the remote side where std::filesystem conventions of the host do not apply
std::string trim_trailing_slashes(std::string path);
std::string posix_basename(const std::string& path);
std::string posix_parent(const std::string& path);
std::string posix_join(const std::string& base, const std::string& leaf);
} // namespace utils
} // namespace kubecp

namespace kubecp::utils::detail
{
// see https://en.cppreference.com/w/cpp/string/byte/isspace#Notes
inline constexpr auto is_space = [](unsigned char c) { return std::isspace(c); };
} // namespace kubecp::utils::detail

template <typename Str, typename Filter>
Str&& kubecp::utils::trim_end(Str&& s, Filter&& filter)
{
    auto rev_it = std::find_if_not(s.rbegin(), s.rend(), std::forward<Filter>(filter));
    s.erase(rev_it.base(), s.end());
    return std::forward<Str>(s);
}

template <typename Str>
Str&& kubecp::utils::trim_end(Str&& s)
{
    return trim_end(std::forward<Str>(s), detail::is_space);
}

#endif // KUBECP_UTILS_H
