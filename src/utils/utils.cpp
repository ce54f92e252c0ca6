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

#include <kubecp/format.h>
#include <kubecp/utils.h>

#include <iterator>
#include <sstream>

namespace kc = kubecp;

std::string kc::utils::to_cmd(const std::vector<std::string>& args, QuoteType quote_type)
{
    if (args.empty())
        return "";

    fmt::memory_buffer buf;
    for (auto const& arg : args)
    {
        fmt::format_to(std::back_inserter(buf), "{0} ",
                       quote_type == QuoteType::no_quotes ? arg : escape_for_shell(arg));
    }

    // Remove the last space inserted
    auto cmd = fmt::to_string(buf);
    cmd.pop_back();
    return cmd;
}

// Escape all characters which need to be escaped in the shell.
std::string kc::utils::escape_for_shell(const std::string& in)
{
    // An empty argument only survives the shell when quoted.
    if (in.empty())
    {
        return "\'\'";
    }

    std::string ret;

    std::back_insert_iterator<std::string> ret_insert = std::back_inserter(ret);

    for (char c : in)
    {
        if ('\n' == c) // newline
        {
            *ret_insert++ = '"';  // double quotes
            *ret_insert++ = '\n'; // newline
            *ret_insert++ = '"';  // double quotes
        }
        else
        {
            // If the character is in one of these code ranges, then it must be escaped.
            if (c < 0x25 || c > 0x7a || (c > 0x25 && c < 0x2b) || (c > 0x5a && c < 0x5f) || 0x2c == c || 0x3b == c ||
                0x3c == c || 0x3e == c || 0x3f == c || 0x60 == c)
            {
                *ret_insert++ = '\\'; // backslash
            }

            *ret_insert++ = c;
        }
    }

    return ret;
}

std::vector<std::string> kc::utils::split_lines(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream stream{text};

    for (std::string line; std::getline(stream, line);)
        lines.push_back(std::move(line));

    return lines;
}

std::string kc::utils::trim_trailing_slashes(std::string path)
{
    if (path.find_first_not_of('/') == std::string::npos)
        return path.empty() ? path : "/";

    return trim_end(std::move(path), [](char c) { return c == '/'; });
}

std::string kc::utils::posix_basename(const std::string& path)
{
    const auto trimmed = trim_trailing_slashes(path);
    if (trimmed == "/")
        return "";

    const auto pos = trimmed.rfind('/');
    return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

std::string kc::utils::posix_parent(const std::string& path)
{
    const auto trimmed = trim_trailing_slashes(path);
    const auto pos = trimmed.rfind('/');

    if (pos == std::string::npos)
        return ".";
    if (pos == 0)
        return "/";

    return trim_trailing_slashes(trimmed.substr(0, pos));
}

std::string kc::utils::posix_join(const std::string& base, const std::string& leaf)
{
    if (base.empty() || base == ".")
        return leaf;
    if (leaf.empty())
        return base;
    if (base.back() == '/')
        return base + leaf;

    return fmt::format("{}/{}", base, leaf);
}
