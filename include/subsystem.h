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

#ifndef TWEAKGUARD_SUBSYSTEM_H
#define TWEAKGUARD_SUBSYSTEM_H

#include "config.h"
#include "restore_engine.h"
#include "snapshot_manager.h"
#include "tweak_applier.h"
#include "tweak_catalog.h"
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct TweakListing
{
    std::string id;
    std::string name;
    std::string description;
    std::string category;
    bool applied = false;
};

// One catalog with its own snapshot slot, applier, restore engine and
// session state. Subsystems never share a slot.
class TweakSubsystem
{
public:
    TweakSubsystem(TweakCatalog catalog,
                   std::filesystem::path slotPath,
                   std::shared_ptr<ConfigValueStore> store,
                   std::shared_ptr<ServiceControl> services,
                   std::shared_ptr<PowerSchemeControl> power,
                   const AppConfig& config);

    TweakSubsystem(const TweakSubsystem&) = delete;
    TweakSubsystem& operator=(const TweakSubsystem&) = delete;

    const std::string& Name() const { return m_catalog.Name(); }
    const TweakCatalog& Catalog() const { return m_catalog; }

    std::vector<TweakListing> ListTweaks() const;

    ApplyReport Apply(const std::string& tweakId, const CancellationToken* cancel = nullptr);
    ApplyReport ApplyProfile(const std::vector<std::string>& tweakIds, const CancellationToken* cancel = nullptr);
    ApplyReport ApplyGameProfile(const std::string& profileId, const CancellationToken* cancel = nullptr);
    RestoreReport RestoreAll();

    SessionState State() const { return m_session.Current(); }
    bool HasBackup() const { return m_snapshots.HasBackup(); }
    std::vector<std::string> AppliedTweaks() const { return m_applied.Ids(); }

    SnapshotManager& Snapshots() { return m_snapshots; }

    // Waits for service and power calls that timed out earlier. Returns how
    // many are still running afterwards.
    size_t SettlePendingCalls(std::chrono::milliseconds timeout) { return m_snapshots.InFlight().SettleAll(timeout); }

private:
    TweakCatalog m_catalog;
    AppliedState m_applied;
    SessionStateMachine m_session;
    SnapshotManager m_snapshots;
    TweakApplier m_applier;
    RestoreEngine m_restorer;
};

#endif // TWEAKGUARD_SUBSYSTEM_H
