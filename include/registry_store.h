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

#ifndef TWEAKGUARD_REGISTRY_STORE_H
#define TWEAKGUARD_REGISTRY_STORE_H

#ifdef _WIN32

#include "config_store.h"
#include "utils.h"

// ConfigValueStore over the native registry (64-bit view).
// REG_SZ/REG_EXPAND_SZ -> String, REG_DWORD -> Int32, REG_QWORD -> Int64,
// every other type -> Bytes. REG_EXPAND_SZ and non-REG_BINARY byte values
// carry their REG_* code as the value's native type, and Write uses it.
class RegistryConfigStore : public ConfigValueStore
{
public:
    ReadResult Read(const std::string& path, const std::string& name) override;
    Status Write(const std::string& path, const std::string& name, const ConfigValue& value) override;
    Status Delete(const std::string& path, const std::string& name) override;
    Status EnumerateChildren(const std::string& path, std::vector<std::string>& children) override;
    Status EnumerateValues(const std::string& path, std::vector<std::string>& names) override;

private:
    static Status OpenKey(const std::string& path, REGSAM access, bool create, UniqueRegKey& key);
};

#endif // _WIN32

#endif // TWEAKGUARD_REGISTRY_STORE_H
