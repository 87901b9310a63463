/*
 * This file is part of TweakGuard.
 *
 * Copyright (c) 2025 Ian Anthony R. Tancinco
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "config_store.h"
#include <algorithm>
#include <cctype>

static std::string CanonicalRoot(const std::string& root)
{
    std::string upper = root;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "HKLM" || upper == "HKEY_LOCAL_MACHINE")  return "HKLM";
    if (upper == "HKCU" || upper == "HKEY_CURRENT_USER")   return "HKCU";
    if (upper == "HKCR" || upper == "HKEY_CLASSES_ROOT")   return "HKCR";
    if (upper == "HKU"  || upper == "HKEY_USERS")          return "HKU";
    if (upper == "HKCC" || upper == "HKEY_CURRENT_CONFIG") return "HKCC";
    return "";
}

std::string NormalizePath(const std::string& path)
{
    std::string p = path;
    std::replace(p.begin(), p.end(), '/', '\\');

    size_t first = p.find_first_not_of('\\');
    if (first == std::string::npos) return "";
    size_t last = p.find_last_not_of('\\');
    p = p.substr(first, last - first + 1);

    size_t sep = p.find('\\');
    std::string root = CanonicalRoot(p.substr(0, sep));
    if (root.empty()) return p;
    return sep == std::string::npos ? root : root + p.substr(sep);
}

Status SplitRootPath(const std::string& path, std::string& root, std::string& subPath)
{
    std::string normalized = NormalizePath(path);
    size_t sep = normalized.find('\\');

    root = CanonicalRoot(normalized.substr(0, sep));
    if (root.empty())
    {
        return Status::Error(ErrorKind::InvalidArgument, "unknown registry root in path: " + path);
    }
    subPath = (sep == std::string::npos) ? std::string() : normalized.substr(sep + 1);
    return Status::Ok();
}

std::string JoinPath(const std::string& parent, const std::string& child)
{
    if (parent.empty()) return child;
    if (child.empty()) return parent;
    return parent + "\\" + child;
}
