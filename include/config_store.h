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

#ifndef TWEAKGUARD_CONFIG_STORE_H
#define TWEAKGUARD_CONFIG_STORE_H

#include "types.h"
#include "config_value.h"
#include <string>
#include <vector>

// (path, name) pair identifying one configuration value.
// path is "ROOT\sub\path", e.g. "HKCU\Control Panel\Mouse".
struct Coordinate
{
    std::string path;
    std::string name;

    // "HKCU\Control Panel\Mouse\MouseSpeed"
    std::string Key() const { return path + "\\" + name; }

    bool operator==(const Coordinate& o) const { return path == o.path && name == o.name; }
    bool operator<(const Coordinate& o) const { return Key() < o.Key(); }
};

struct ReadResult
{
    ConfigValue value;
    bool existed = false;   // false with an ok status means legitimately absent
    Status status;
};

// Hierarchical key/value store with distinct root namespaces
class ConfigValueStore
{
public:
    virtual ~ConfigValueStore() = default;

    virtual ReadResult Read(const std::string& path, const std::string& name) = 0;

    // Creates intermediate path segments. Absent values are rejected; use Delete.
    virtual Status Write(const std::string& path, const std::string& name, const ConfigValue& value) = 0;

    // Succeeds when the value (or its whole key) is already absent
    virtual Status Delete(const std::string& path, const std::string& name) = 0;

    // Child key names (not full paths). NotFound when path does not exist.
    virtual Status EnumerateChildren(const std::string& path, std::vector<std::string>& children) = 0;

    // Value names directly under path. NotFound when path does not exist.
    virtual Status EnumerateValues(const std::string& path, std::vector<std::string>& names) = 0;
};

// Normalizes "/" to "\", trims separators and maps long root names
// (HKEY_CURRENT_USER) to the short form (HKCU).
std::string NormalizePath(const std::string& path);

// "HKLM\SOFTWARE\X" -> ("HKLM", "SOFTWARE\X"). A bare root yields an empty
// sub-path. Fails on an unknown root.
Status SplitRootPath(const std::string& path, std::string& root, std::string& subPath);

std::string JoinPath(const std::string& parent, const std::string& child);

#endif // TWEAKGUARD_CONFIG_STORE_H
