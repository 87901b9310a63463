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

#include "memory_config_store.h"
#include "utils.h"
#include <algorithm>
#include <set>

static bool IsAtOrBelow(const std::string& lowered, const std::string& prefix)
{
    if (lowered == prefix) return true;
    return lowered.size() > prefix.size() &&
           lowered.compare(0, prefix.size(), prefix) == 0 &&
           lowered[prefix.size()] == '\\';
}

Status MemoryConfigStore::Resolve(const std::string& path, std::string& display, std::string& lowered) const
{
    std::string root, sub;
    Status s = SplitRootPath(path, root, sub);
    if (!s.ok()) return s;

    display = JoinPath(root, sub);
    lowered = AsciiLowerCopy(display);
    return Status::Ok();
}

Status MemoryConfigStore::CheckAccess(const std::string& lowered, bool forWrite) const
{
    for (const auto& p : m_protected)
    {
        if (IsAtOrBelow(lowered, p.prefix) && (forWrite || p.denyReads))
        {
            return Status::Error(ErrorKind::PermissionDenied, "access denied: " + lowered);
        }
    }
    return Status::Ok();
}

void MemoryConfigStore::EnsureKey(const std::string& display)
{
    // Create every ancestor so enumeration sees the full chain
    size_t pos = 0;
    while (true)
    {
        pos = display.find('\\', pos);
        std::string segment = (pos == std::string::npos) ? display : display.substr(0, pos);
        std::string lowered = AsciiLowerCopy(segment);
        if (m_keys.find(lowered) == m_keys.end())
        {
            Node node;
            node.displayPath = segment;
            m_keys.emplace(lowered, std::move(node));
        }
        if (pos == std::string::npos) break;
        ++pos;
    }
}

ReadResult MemoryConfigStore::Read(const std::string& path, const std::string& name)
{
    std::lock_guard lock(m_mutex);
    ReadResult result;

    std::string display, lowered;
    result.status = Resolve(path, display, lowered);
    if (!result.status.ok()) return result;

    result.status = CheckAccess(lowered, false);
    if (!result.status.ok()) return result;

    auto key = m_keys.find(lowered);
    if (key == m_keys.end()) return result;

    auto value = key->second.values.find(AsciiLowerCopy(name));
    if (value == key->second.values.end()) return result;

    result.value = value->second.second;
    result.existed = true;
    return result;
}

Status MemoryConfigStore::Write(const std::string& path, const std::string& name, const ConfigValue& value)
{
    if (value.IsAbsent())
    {
        return Status::Error(ErrorKind::InvalidArgument, "cannot write an absent value to " + path + "\\" + name);
    }

    std::lock_guard lock(m_mutex);
    std::string display, lowered;
    Status s = Resolve(path, display, lowered);
    if (!s.ok()) return s;

    s = CheckAccess(lowered, true);
    if (!s.ok()) return s;

    EnsureKey(display);
    m_keys[lowered].values[AsciiLowerCopy(name)] = std::make_pair(name, value);
    ++m_mutations;
    return Status::Ok();
}

Status MemoryConfigStore::Delete(const std::string& path, const std::string& name)
{
    std::lock_guard lock(m_mutex);
    std::string display, lowered;
    Status s = Resolve(path, display, lowered);
    if (!s.ok()) return s;

    s = CheckAccess(lowered, true);
    if (!s.ok()) return s;

    auto key = m_keys.find(lowered);
    if (key == m_keys.end()) return Status::Ok();

    if (key->second.values.erase(AsciiLowerCopy(name)) > 0) ++m_mutations;
    return Status::Ok();
}

Status MemoryConfigStore::EnumerateChildren(const std::string& path, std::vector<std::string>& children)
{
    std::lock_guard lock(m_mutex);
    children.clear();

    std::string display, lowered;
    Status s = Resolve(path, display, lowered);
    if (!s.ok()) return s;

    s = CheckAccess(lowered, false);
    if (!s.ok()) return s;

    if (m_keys.find(lowered) == m_keys.end())
    {
        return Status::Error(ErrorKind::NotFound, "key not found: " + display);
    }

    std::set<std::string> seen;
    for (const auto& [keyPath, node] : m_keys)
    {
        if (keyPath.size() <= lowered.size() + 1 || !IsAtOrBelow(keyPath, lowered)) continue;

        std::string rest = node.displayPath.substr(lowered.size() + 1);
        std::string child = rest.substr(0, rest.find('\\'));
        if (seen.insert(AsciiLowerCopy(child)).second)
        {
            children.push_back(child);
        }
    }
    return Status::Ok();
}

Status MemoryConfigStore::EnumerateValues(const std::string& path, std::vector<std::string>& names)
{
    std::lock_guard lock(m_mutex);
    names.clear();

    std::string display, lowered;
    Status s = Resolve(path, display, lowered);
    if (!s.ok()) return s;

    s = CheckAccess(lowered, false);
    if (!s.ok()) return s;

    auto key = m_keys.find(lowered);
    if (key == m_keys.end())
    {
        return Status::Error(ErrorKind::NotFound, "key not found: " + display);
    }

    for (const auto& [lowerName, entry] : key->second.values)
    {
        names.push_back(entry.first);
    }
    return Status::Ok();
}

Status MemoryConfigStore::CreateKey(const std::string& path)
{
    std::lock_guard lock(m_mutex);
    std::string display, lowered;
    Status s = Resolve(path, display, lowered);
    if (!s.ok()) return s;

    s = CheckAccess(lowered, true);
    if (!s.ok()) return s;

    EnsureKey(display);
    return Status::Ok();
}

void MemoryConfigStore::Protect(const std::string& path, bool denyReads)
{
    std::lock_guard lock(m_mutex);
    std::string display, lowered;
    if (!Resolve(path, display, lowered).ok()) return;

    Unprotect(path);
    m_protected.push_back({lowered, denyReads});
}

void MemoryConfigStore::Unprotect(const std::string& path)
{
    std::string display, lowered;
    if (!Resolve(path, display, lowered).ok()) return;

    m_protected.erase(std::remove_if(m_protected.begin(), m_protected.end(),
                                     [&](const Protection& p) { return p.prefix == lowered; }),
                      m_protected.end());
}

size_t MemoryConfigStore::MutationCount() const
{
    std::lock_guard lock(m_mutex);
    return m_mutations;
}
