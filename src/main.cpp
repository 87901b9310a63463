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

#include "config.h"
#include "constants.h"
#include "logger.h"
#include "memory_config_store.h"
#include "memory_services.h"
#include "startup_toggle.h"
#include "subsystem.h"
#include "utils.h"
#include "version.h"
#include "operation_queue.h"

#ifdef _WIN32
#include "registry_store.h"
#include "services.h"
#endif

#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

constexpr int EXIT_OK = 0;
constexpr int EXIT_WARNINGS = 1;   // completed, some steps failed
constexpr int EXIT_NOT_RUN = 2;    // nothing was changed

CancellationToken g_cancel;

void OnInterrupt(int)
{
    g_cancel.Cancel();
}

struct Backends
{
    std::shared_ptr<ConfigValueStore> store;
    std::shared_ptr<ServiceControl> services;
    std::shared_ptr<PowerSchemeControl> power;
    std::filesystem::path backupDir;
    std::filesystem::path startupFolder;
};

// Plausible machine for --simulate: a few existing values, two network
// interfaces for fan-out, services that the catalog stops, a balanced plan.
Backends MakeSimulatedBackends()
{
    auto store = std::make_shared<MemoryConfigStore>();
    const char MOUSE[] = "HKCU\\Control Panel\\Mouse";
    const char IFACES[] = "HKLM\\SYSTEM\\CurrentControlSet\\Services\\Tcpip\\Parameters\\Interfaces";

    const std::vector<std::pair<Coordinate, ConfigValue>> seed = {
        {{MOUSE, "MouseSpeed"}, ConfigValue::String("1")},
        {{MOUSE, "MouseThreshold1"}, ConfigValue::String("6")},
        {{MOUSE, "MouseThreshold2"}, ConfigValue::String("10")},
        {{"HKCU\\Control Panel\\Keyboard", "KeyboardDelay"}, ConfigValue::String("1")},
        {{"HKCU\\Control Panel\\Keyboard", "KeyboardSpeed"}, ConfigValue::String("31")},
        {{"HKCU\\Control Panel\\Desktop", "SmoothScroll"}, ConfigValue::Int32(1)},
        {{"HKCU\\System\\GameConfigStore", "GameDVR_Enabled"}, ConfigValue::Int32(1)},
        {{RUN_KEY_USER, "Discord"}, ConfigValue::String("\"C:\\Users\\Player\\AppData\\Local\\Discord\\Update.exe\" --processStart Discord.exe")},
        {{RUN_KEY_USER, "Spotify"}, ConfigValue::String("C:\\Users\\Player\\AppData\\Roaming\\Spotify\\Spotify.exe /minimized")},
        {{RUN_KEY_MACHINE, "SecurityHealth"}, ConfigValue::String("%windir%\\system32\\SecurityHealthSystray.exe")},
    };

    for (const auto& [coord, value] : seed)
    {
        Status s = store->Write(coord.path, coord.name, value);
        if (!s.ok()) Log("[SIMULATE] Seed " + coord.Key() + " failed: " + s.ToString());
    }

    for (const char* iface : {"{4d36e972-e325-11ce-bfc1-08002be10318}", "{7a1c3e5f-92b4-4c1a-8f0e-2b6d9e4a1c55}"})
    {
        Status s = store->CreateKey(JoinPath(IFACES, iface));
        if (!s.ok()) Log("[SIMULATE] Seed interface failed: " + s.ToString());
    }

    auto services = std::make_shared<MemoryServiceControl>();
    services->AddService("SysMain", ServiceRunState::Running, ServiceStartType::Automatic);
    services->AddService("WSearch", ServiceRunState::Running, ServiceStartType::Automatic);

    Backends b;
    b.store = store;
    b.services = services;
    b.power = std::make_shared<MemoryPowerSchemeControl>(POWER_SCHEME_BALANCED);
    b.backupDir = GetAppDataPath() / "simulate" / BACKUP_DIRNAME;
    b.startupFolder = GetAppDataPath() / "simulate" / "startup";
    return b;
}

#ifdef _WIN32
Backends MakeSystemBackends(const AppConfig& config)
{
    Backends b;
    b.store = std::make_shared<RegistryConfigStore>();
    b.services = std::make_shared<WindowsServiceControl>(config.serviceTimeoutMs);
    b.power = std::make_shared<WindowsPowerSchemeControl>();
    b.backupDir = GetAppDataPath() / BACKUP_DIRNAME;
    b.startupFolder = StartupManager::DefaultStartupFolder();
    return b;
}
#endif

void PrintUsage()
{
    std::cout <<
        "TweakGuard " << TWEAKGUARD_VERSION_STRING << "\n\n"
        "Usage: tweakguard [--simulate] [--subsystem gaming|privacy] <command>\n\n"
        "Commands:\n"
        "  list                   Show tweaks and whether they are applied\n"
        "  profiles               Show game profiles (gaming only)\n"
        "  apply <id>...          Capture, then apply the given tweaks as one batch\n"
        "  profile <id>           Apply a game profile\n"
        "  restore                Put back everything the last apply captured\n"
        "  status                 Show the saved backup\n"
        "  startup list           Show startup items\n"
        "  startup disable <name> Move a startup item out of the way\n"
        "  startup enable <name>  Move it back\n\n"
        "Options:\n"
        "  --simulate             Run against an in-memory machine\n"
        "  --subsystem <name>     Tweak catalog to use (default: gaming)\n"
        "  --help, -h             Show this help message\n";
}

int ReportApply(const ApplyReport& report)
{
    if (!report.ran)
    {
        std::cerr << "Nothing applied: " << report.status.ToString() << "\n";
        return EXIT_NOT_RUN;
    }

    std::cout << "Applied " << report.applied.size() << " tweak(s), "
              << report.mutationsIssued << " change(s) issued.\n";
    for (const auto& id : report.applied)
        std::cout << "  + " << id << "\n";

    if (!report.warnings.Empty())
        std::cout << "Warnings:\n" << report.warnings.ToString() << "\n";
    if (!report.errors.Empty())
    {
        std::cout << "Completed with " << report.errors.Count() << " failure(s):\n"
                  << report.errors.ToString() << "\n";
        if (report.errors.Contains(ErrorKind::PermissionDenied))
            std::cout << "Some changes need an elevated prompt.\n";
    }
    return report.Clean() ? EXIT_OK : EXIT_WARNINGS;
}

int ReportRestore(const RestoreReport& report)
{
    if (!report.ran)
    {
        std::cerr << "Restore did not run: " << report.status.ToString() << "\n";
        return EXIT_NOT_RUN;
    }
    if (!report.hadBackup)
    {
        std::cout << "No backup available, nothing to restore.\n";
        return EXIT_OK;
    }

    std::cout << "Restored " << report.rewritten << " value(s), removed " << report.deleted
              << ", services " << report.servicesRestored
              << (report.powerRestored ? ", power plan reactivated" : "") << ".\n";
    if (!report.errors.Empty())
    {
        std::cout << "Completed with " << report.errors.Count() << " failure(s):\n"
                  << report.errors.ToString() << "\n";
        return EXIT_WARNINGS;
    }
    return EXIT_OK;
}

int RunStartup(const std::vector<std::string>& args, const Backends& backends)
{
    StartupManager startup(backends.store, backends.startupFolder);
    const std::string action = args.empty() ? "list" : args[0];

    if (action == "list")
    {
        AggregateError warnings;
        auto items = startup.ListItems(&warnings);
        for (const auto& item : items)
        {
            std::cout << (item.enabled ? "[on]  " : "[off] ") << item.name
                      << "  (" << StartupLocationName(item.location) << ", impact " << item.impact << ")\n"
                      << "      " << item.command << "\n";
        }
        if (items.empty()) std::cout << "No startup items.\n";
        if (!warnings.Empty())
        {
            std::cout << "Warnings:\n" << warnings.ToString() << "\n";
            return EXIT_WARNINGS;
        }
        return EXIT_OK;
    }

    if ((action == "disable" || action == "enable") && args.size() == 2)
    {
        Status s = startup.SetEnabled(args[1], action == "enable");
        if (!s.ok())
        {
            std::cerr << action << " " << args[1] << ": " << s.ToString() << "\n";
            return EXIT_NOT_RUN;
        }
        std::cout << args[1] << (action == "enable" ? " enabled.\n" : " disabled.\n");
        return EXIT_OK;
    }

    PrintUsage();
    return EXIT_NOT_RUN;
}

int RunStatus(TweakSubsystem& subsystem)
{
    LoadResult loaded = subsystem.Snapshots().Load();
    std::cout << "Subsystem: " << subsystem.Name() << "\n"
              << "Backup:    " << subsystem.Snapshots().SlotPath().string() << "\n";

    switch (loaded.status)
    {
    case LoadStatus::Loaded:
        std::cout << "Captured:  " << loaded.snapshot.createdAt << "\n"
                  << "Values:    " << loaded.snapshot.entries.size() << "\n"
                  << "Services:  " << loaded.snapshot.serviceStates.size() << "\n"
                  << "Power:     " << (loaded.snapshot.powerPlan.empty() ? "-" : loaded.snapshot.powerPlan) << "\n";
        return EXIT_OK;
    case LoadStatus::NoBackup:
        std::cout << "No backup available.\n";
        return EXIT_OK;
    case LoadStatus::Corrupt:
        std::cout << "Backup is unreadable and will be ignored: " << loaded.error.ToString() << "\n";
        return EXIT_WARNINGS;
    case LoadStatus::Failed:
        std::cerr << "Cannot read backup: " << loaded.error.ToString() << "\n";
        return EXIT_NOT_RUN;
    }
    return EXIT_NOT_RUN;
}

// Apply/restore run off the main thread so Ctrl+C stays responsive
template <typename Fn>
auto RunQueued(Fn fn)
{
    OperationQueue queue;
    queue.Start();
    return queue.Submit(std::move(fn)).get();
}

int Run(int argc, char** argv)
{
    bool simulate = false;
    std::string subsystemName = "gaming";
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            PrintUsage();
            return EXIT_OK;
        }
        else if (arg == "--simulate") simulate = true;
        else if (arg == "--subsystem" && i + 1 < argc) subsystemName = AsciiLowerCopy(argv[++i]);
        else args.push_back(arg);
    }

    if (args.empty())
    {
        PrintUsage();
        return EXIT_NOT_RUN;
    }

#ifndef _WIN32
    if (!simulate)
    {
        std::cerr << "This host has no registry. Use --simulate to run against an in-memory machine.\n";
        return EXIT_NOT_RUN;
    }
#endif

    AppConfig config = LoadConfig(GetConfigPath());
    Log("[MAIN] TweakGuard " + std::string(TWEAKGUARD_VERSION_STRING) + " started" +
        (simulate ? " (simulate)" : ""));

#ifdef _WIN32
    Backends backends = simulate ? MakeSimulatedBackends() : MakeSystemBackends(config);
#else
    Backends backends = MakeSimulatedBackends();
#endif

    const std::string command = args[0];
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "startup")
        return RunStartup(rest, backends);

    TweakCatalog catalog = subsystemName == "privacy" ? TweakCatalog::Privacy()
                         : subsystemName == "gaming"  ? TweakCatalog::Gaming()
                         : throw std::invalid_argument("unknown subsystem: " + subsystemName);

    TweakSubsystem subsystem(std::move(catalog),
                             backends.backupDir / (subsystemName + SNAPSHOT_FILE_SUFFIX),
                             backends.store, backends.services, backends.power, config);

    if (command == "list")
    {
        std::string category;
        for (const auto& t : subsystem.ListTweaks())
        {
            if (t.category != category)
            {
                category = t.category;
                std::cout << "\n[" << category << "]\n";
            }
            std::cout << (t.applied ? "  * " : "    ") << t.id << "  " << t.name << "\n"
                      << "      " << t.description << "\n";
        }
        return EXIT_OK;
    }

    if (command == "profiles")
    {
        if (subsystem.Catalog().Profiles().empty())
            std::cout << "No profiles for " << subsystem.Name() << ".\n";
        for (const auto& p : subsystem.Catalog().Profiles())
        {
            std::cout << p.id << "  " << p.name << " (" << p.tweakIds.size() << " tweaks)\n"
                      << "    " << p.description << "\n";
        }
        return EXIT_OK;
    }

    if (command == "status")
        return RunStatus(subsystem);

    std::signal(SIGINT, OnInterrupt);

    int code = EXIT_NOT_RUN;
    if (command == "apply" && !rest.empty())
        code = ReportApply(RunQueued([&]() { return subsystem.ApplyProfile(rest, &g_cancel); }));
    else if (command == "profile" && rest.size() == 1)
        code = ReportApply(RunQueued([&]() { return subsystem.ApplyGameProfile(rest[0], &g_cancel); }));
    else if (command == "restore")
        code = ReportRestore(RunQueued([&]() { return subsystem.RestoreAll(); }));
    else
    {
        PrintUsage();
        return EXIT_NOT_RUN;
    }

    // A timed-out service call may still change the system; say so before exiting
    const int settleMs = std::max(config.serviceTimeoutMs, config.powerTimeoutMs);
    size_t running = subsystem.SettlePendingCalls(std::chrono::milliseconds(settleMs));
    if (running > 0)
    {
        std::cerr << running << " service or power change(s) are still in progress and may complete after exit.\n";
        Log("[MAIN] Exiting with " + std::to_string(running) + " abandoned call(s) still running");
        code = EXIT_WARNINGS;
    }
    return code;
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        return Run(argc, argv);
    }
    catch (const std::exception& e)
    {
        Log(std::string("[MAIN] Fatal: ") + e.what());
        std::cerr << "tweakguard: " << e.what() << "\n";
        return EXIT_NOT_RUN;
    }
}
