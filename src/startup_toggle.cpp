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

#include "startup_toggle.h"
#include "constants.h"
#include "logger.h"
#include "utils.h"
#include <cstdlib>
#include <unordered_map>

const char* StartupLocationName(StartupLocation location)
{
    switch (location)
    {
    case StartupLocation::RegistryUser:    return "registry_hkcu";
    case StartupLocation::RegistryMachine: return "registry_hklm";
    case StartupLocation::StartupFolder:   return "startup_folder";
    }
    return "registry_hkcu";
}

StartupManager::StartupManager(std::shared_ptr<ConfigValueStore> store, std::filesystem::path startupFolder)
    : m_store(std::move(store)), m_startupFolder(std::move(startupFolder))
{
}

std::filesystem::path StartupManager::DefaultStartupFolder()
{
#ifdef _WIN32
    const char* appData = std::getenv("APPDATA");
    if (appData && *appData)
    {
        return std::filesystem::path(appData) / "Microsoft" / "Windows" / "Start Menu" / "Programs" / "Startup";
    }
#endif
    return GetAppDataPath() / "startup";
}

std::string StartupManager::RunKey(StartupLocation location)
{
    return location == StartupLocation::RegistryMachine ? RUN_KEY_MACHINE : RUN_KEY_USER;
}

// Executable part of a Run command line
static std::string ExtractExePath(const std::string& command)
{
    std::string s = Trim(command);
    if (!s.empty() && s[0] == '"')
    {
        size_t end = s.find('"', 1);
        return end == std::string::npos ? s.substr(1) : s.substr(1, end - 1);
    }

    std::string lower = AsciiLowerCopy(s);
    size_t exe = lower.find(".exe");
    if (exe != std::string::npos) return s.substr(0, exe + 4);
    return s.substr(0, s.find(' '));
}

std::string StartupManager::EstimateImpact(const std::string& command)
{
    static const std::unordered_map<std::string, std::string> KNOWN_IMPACT = {
        {"teams.exe", "high"},       {"msteams.exe", "high"},     {"onedrive.exe", "high"},
        {"slack.exe", "high"},       {"dropbox.exe", "high"},     {"googledrivesync.exe", "high"},
        {"itunes.exe", "high"},      {"msedge.exe", "high"},      {"chrome.exe", "high"},
        {"firefox.exe", "high"},     {"icue.exe", "high"},        {"wallpaperengine.exe", "high"},
        {"spotify.exe", "medium"},   {"discord.exe", "medium"},   {"steam.exe", "medium"},
        {"epicgameslauncher.exe", "medium"}, {"skype.exe", "medium"}, {"zoom.exe", "medium"},
        {"logitechg.exe", "medium"}, {"nordvpn.exe", "medium"},   {"razersynapse.exe", "medium"},
        {"adobearm.exe", "low"},     {"ccleaner.exe", "low"},     {"jusched.exe", "low"},
        {"realtekhdaudiomanager.exe", "low"},
    };

    if (Trim(command).empty()) return "unknown";

    std::string exePath = ExtractExePath(command);
    // Run commands use Windows separators on every host
    std::string exeName = AsciiLowerCopy(exePath.substr(exePath.find_last_of("\\/") + 1));
    auto it = KNOWN_IMPACT.find(exeName);
    if (it != KNOWN_IMPACT.end()) return it->second;

    // Fall back to the binary size
    std::error_code ec;
    auto size = std::filesystem::file_size(exePath, ec);
    if (ec) return "unknown";

    const double sizeMB = static_cast<double>(size) / (1024.0 * 1024.0);
    if (sizeMB > 50) return "high";
    if (sizeMB > 10) return "medium";
    return "low";
}

void StartupManager::ReadRunKey(StartupLocation location, bool enabled, std::vector<StartupItem>& items,
                                AggregateError* warnings)
{
    std::string key = enabled ? RunKey(location) : JoinPath(RunKey(location), DISABLED_SUBKEY);

    std::vector<std::string> names;
    Status s = m_store->EnumerateValues(key, names);
    if (s.kind == ErrorKind::NotFound) return;
    if (!s.ok())
    {
        Log("[STARTUP] Cannot read " + key + ": " + s.ToString());
        if (warnings) warnings->Add(key, s);
        return;
    }

    for (const auto& name : names)
    {
        ReadResult r = m_store->Read(key, name);
        // Run entries are command lines; anything else is not ours to show
        if (!r.status.ok() || !r.existed || r.value.Kind() != ValueKind::String) continue;

        StartupItem item;
        item.name = name;
        item.command = r.value.AsString();
        item.location = location;
        item.enabled = enabled;
        item.impact = EstimateImpact(item.command);
        items.push_back(item);
    }
}

void StartupManager::ReadStartupFolder(std::vector<StartupItem>& items, AggregateError* warnings)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(m_startupFolder, ec)) return;

    std::filesystem::directory_iterator it(m_startupFolder, ec);
    if (ec)
    {
        Log("[STARTUP] Cannot list " + m_startupFolder.string() + ": " + ec.message());
        if (warnings) warnings->Add(m_startupFolder.string(), Status::Error(ErrorKind::IoError, ec.message()));
        return;
    }

    for (const auto& entry : it)
    {
        std::error_code typeEc;
        if (entry.is_directory(typeEc)) continue;

        std::string fileName = entry.path().filename().string();
        bool enabled = !EndsWithIgnoreCase(fileName, DISABLED_FILE_SUFFIX);

        StartupItem item;
        item.name = enabled ? fileName : fileName.substr(0, fileName.size() - (sizeof(DISABLED_FILE_SUFFIX) - 1));
        item.command = entry.path().string();
        item.location = StartupLocation::StartupFolder;
        item.enabled = enabled;
        item.impact = EstimateImpact(item.command);
        items.push_back(item);
    }
}

std::vector<StartupItem> StartupManager::ListItems(AggregateError* warnings)
{
    std::vector<StartupItem> items;
    ReadRunKey(StartupLocation::RegistryUser, true, items, warnings);
    ReadRunKey(StartupLocation::RegistryUser, false, items, warnings);
    ReadRunKey(StartupLocation::RegistryMachine, true, items, warnings);
    ReadRunKey(StartupLocation::RegistryMachine, false, items, warnings);
    ReadStartupFolder(items, warnings);
    return items;
}

Status StartupManager::MoveValue(const std::string& from, const std::string& to, const std::string& name)
{
    ReadResult source = m_store->Read(from, name);
    if (!source.status.ok()) return source.status;
    ReadResult dest = m_store->Read(to, name);
    if (!dest.status.ok()) return dest.status;

    if (!source.existed)
    {
        // Already on the other side
        if (dest.existed) return Status::Ok();
        return Status::Error(ErrorKind::NotFound, "startup item not found: " + name);
    }

    // Both sides hold the name: neither copy is overwritten
    if (dest.existed)
    {
        Log("[STARTUP] " + name + " exists in both " + from + " and " + to + ", leaving both untouched");
        return Status::Error(ErrorKind::InvalidArgument,
            "startup item " + name + " already exists in " + to + "; remove one copy first");
    }

    Status s = m_store->Write(to, name, source.value);
    if (!s.ok()) return s;

    s = m_store->Delete(from, name);
    if (!s.ok())
    {
        // Keep exactly one copy
        Status undo = m_store->Delete(to, name);
        if (!undo.ok())
        {
            Log("[STARTUP] " + name + " now exists in both " + from + " and " + to + ": " + undo.ToString());
        }
        return s;
    }
    return Status::Ok();
}

static Status FromFilesystemError(const std::error_code& ec, const std::string& what)
{
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
        return Status::Error(ErrorKind::PermissionDenied, what + ": " + ec.message());
    if (ec == std::errc::no_such_file_or_directory)
        return Status::Error(ErrorKind::NotFound, what + ": " + ec.message());
    return Status::Error(ErrorKind::IoError, what + ": " + ec.message());
}

Status StartupManager::RenameFile(const std::string& name, bool enable)
{
    const std::filesystem::path active = m_startupFolder / name;
    std::filesystem::path parked = active;
    parked += DISABLED_FILE_SUFFIX;

    const std::filesystem::path& from = enable ? parked : active;
    const std::filesystem::path& to = enable ? active : parked;

    std::error_code ec;
    if (!std::filesystem::exists(from, ec))
    {
        if (std::filesystem::exists(to, ec)) return Status::Ok();
        return Status::Error(ErrorKind::NotFound, "startup item not found: " + name);
    }
    if (std::filesystem::exists(to, ec))
    {
        Log("[STARTUP] " + from.string() + " and " + to.string() + " both exist, leaving both untouched");
        return Status::Error(ErrorKind::InvalidArgument,
            "startup item " + name + " already exists as " + to.string() + "; remove one copy first");
    }

    std::filesystem::rename(from, to, ec);
    if (ec) return FromFilesystemError(ec, "rename " + from.string());
    return Status::Ok();
}

Status StartupManager::Disable(const StartupItem& item)
{
    Status s;
    if (item.location == StartupLocation::StartupFolder)
    {
        s = RenameFile(item.name, false);
    }
    else
    {
        std::string run = RunKey(item.location);
        s = MoveValue(run, JoinPath(run, DISABLED_SUBKEY), item.name);
    }

    Log("[STARTUP] Disable " + item.name + " (" + StartupLocationName(item.location) + "): " + s.ToString());
    return s;
}

Status StartupManager::Enable(const StartupItem& item)
{
    Status s;
    if (item.location == StartupLocation::StartupFolder)
    {
        s = RenameFile(item.name, true);
    }
    else
    {
        std::string run = RunKey(item.location);
        s = MoveValue(JoinPath(run, DISABLED_SUBKEY), run, item.name);
    }

    Log("[STARTUP] Enable " + item.name + " (" + StartupLocationName(item.location) + "): " + s.ToString());
    return s;
}

Status StartupManager::SetEnabled(const std::string& name, bool enabled)
{
    for (const auto& item : ListItems())
    {
        if (EqualsIgnoreCase(item.name, name))
        {
            return enabled ? Enable(item) : Disable(item);
        }
    }
    return Status::Error(ErrorKind::NotFound, "startup item not found: " + name);
}

AggregateError StartupManager::DisableAll(const std::vector<StartupItem>& items)
{
    AggregateError errors;
    for (const auto& item : items)
    {
        errors.Add(std::string(StartupLocationName(item.location)) + ":" + item.name, Disable(item));
    }
    return errors;
}

AggregateError StartupManager::EnableAll(const std::vector<StartupItem>& items)
{
    AggregateError errors;
    for (const auto& item : items)
    {
        errors.Add(std::string(StartupLocationName(item.location)) + ":" + item.name, Enable(item));
    }
    return errors;
}
