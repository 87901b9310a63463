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

#ifndef TWEAKGUARD_MEMORY_CONFIG_STORE_H
#define TWEAKGUARD_MEMORY_CONFIG_STORE_H

#include "config_store.h"
#include <map>
#include <mutex>
#include <string>
#include <vector>

// In-process hierarchical store with registry semantics: case-insensitive
// keys and names, five roots, writes create intermediate keys.
// Backs --simulate runs and the test suite.
class MemoryConfigStore : public ConfigValueStore
{
public:
    ReadResult Read(const std::string& path, const std::string& name) override;
    Status Write(const std::string& path, const std::string& name, const ConfigValue& value) override;
    Status Delete(const std::string& path, const std::string& name) override;
    Status EnumerateChildren(const std::string& path, std::vector<std::string>& children) override;
    Status EnumerateValues(const std::string& path, std::vector<std::string>& names) override;

    // Creates an (empty) key and its ancestors
    Status CreateKey(const std::string& path);

    // Writes and deletes at or below path fail with PermissionDenied.
    // With denyReads, reads and enumeration fail too (key ACL without read access).
    void Protect(const std::string& path, bool denyReads = false);
    void Unprotect(const std::string& path);

    // Number of successful Write/Delete calls that changed something
    size_t MutationCount() const;

private:
    struct Node
    {
        std::string displayPath;
        // lowercase name -> (display name, value)
        std::map<std::string, std::pair<std::string, ConfigValue>> values;
    };

    struct Protection
    {
        std::string prefix;   // lowercase normalized path
        bool denyReads;
    };

    Status Resolve(const std::string& path, std::string& display, std::string& lowered) const;
    Status CheckAccess(const std::string& lowered, bool forWrite) const;
    void EnsureKey(const std::string& display);

    mutable std::mutex m_mutex;
    std::map<std::string, Node> m_keys;     // lowercase normalized path -> node
    std::vector<Protection> m_protected;
    size_t m_mutations = 0;
};

#endif // TWEAKGUARD_MEMORY_CONFIG_STORE_H
