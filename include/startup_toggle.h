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

#ifndef TWEAKGUARD_STARTUP_TOGGLE_H
#define TWEAKGUARD_STARTUP_TOGGLE_H

#include "config_store.h"
#include "types.h"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

enum class StartupLocation
{
    RegistryUser,      // HKCU ...\Run
    RegistryMachine,   // HKLM ...\Run
    StartupFolder
};

// "registry_hkcu" / "registry_hklm" / "startup_folder"
const char* StartupLocationName(StartupLocation location);

struct StartupItem
{
    std::string name;       // value name, or file name without the .disabled suffix
    std::string command;    // Run value or full file path
    StartupLocation location = StartupLocation::RegistryUser;
    bool enabled = true;
    std::string impact;     // "high" / "medium" / "low" / "unknown"
};

// Enabled <-> Disabled by moving the item: a Run value moves to the
// TweakGuard_Disabled side key beneath its Run key, a startup folder file
// gains or loses the .disabled suffix. No snapshot is involved.
class StartupManager
{
public:
    StartupManager(std::shared_ptr<ConfigValueStore> store, std::filesystem::path startupFolder);

    // %APPDATA%\Microsoft\Windows\Start Menu\Programs\Startup on Windows
    static std::filesystem::path DefaultStartupFolder();

    // Missing sources are skipped; unreadable ones are reported in warnings
    std::vector<StartupItem> ListItems(AggregateError* warnings = nullptr);

    // Toggling to the current state is a no-op success
    Status Disable(const StartupItem& item);
    Status Enable(const StartupItem& item);

    // Looks the item up by name (case-insensitive). NotFound when unknown.
    Status SetEnabled(const std::string& name, bool enabled);

    AggregateError DisableAll(const std::vector<StartupItem>& items);
    AggregateError EnableAll(const std::vector<StartupItem>& items);

    static std::string EstimateImpact(const std::string& command);

private:
    static std::string RunKey(StartupLocation location);
    void ReadRunKey(StartupLocation location, bool enabled, std::vector<StartupItem>& items,
                    AggregateError* warnings);
    void ReadStartupFolder(std::vector<StartupItem>& items, AggregateError* warnings);

    Status MoveValue(const std::string& from, const std::string& to, const std::string& name);
    Status RenameFile(const std::string& name, bool enable);

    std::shared_ptr<ConfigValueStore> m_store;
    std::filesystem::path m_startupFolder;
};

#endif // TWEAKGUARD_STARTUP_TOGGLE_H
