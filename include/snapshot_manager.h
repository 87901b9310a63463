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

#ifndef TWEAKGUARD_SNAPSHOT_MANAGER_H
#define TWEAKGUARD_SNAPSHOT_MANAGER_H

#include "config.h"
#include "snapshot.h"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Everything a capture should record
struct CaptureRequest
{
    std::vector<Coordinate> coordinates;
    std::vector<std::string> services;
    bool capturePowerPlan = false;
};

enum class LoadStatus
{
    Loaded,
    NoBackup,   // slot file does not exist
    Corrupt,    // unparseable or type-inconsistent; treated like NoBackup
    Failed      // the file exists but could not be read
};

struct LoadResult
{
    LoadStatus status = LoadStatus::NoBackup;
    Snapshot snapshot;
    Status error;       // set for Corrupt and Failed

    // True when there is something restore can act on
    bool Available() const { return status == LoadStatus::Loaded && !snapshot.Empty(); }
};

// Owns one subsystem's snapshot slot: <appdata>/backups/<subsystem>_snapshot.json
class SnapshotManager
{
public:
    SnapshotManager(std::string subsystem,
                    std::filesystem::path slotPath,
                    std::shared_ptr<ConfigValueStore> store,
                    std::shared_ptr<ServiceControl> services,
                    std::shared_ptr<PowerSchemeControl> power,
                    AppConfig config);

    static std::filesystem::path DefaultSlotPath(const std::string& subsystem);

    // Reads the current state of every requested item into a new Snapshot.
    // Never fails as a whole: an unreadable coordinate is recorded as not
    // existing, an unreadable service or power plan is left out; both are
    // reported through warnings. Items already present in carryOver are
    // copied from it instead of being read again.
    Snapshot Capture(const CaptureRequest& request,
                     AggregateError* warnings = nullptr,
                     const Snapshot* carryOver = nullptr);

    // Atomic replace of the slot file
    Status Persist(const Snapshot& snapshot);

    LoadResult Load() const;
    bool HasBackup() const;

    // Removes the slot file. Missing is fine.
    Status Discard();

    const std::string& Subsystem() const { return m_subsystem; }
    const std::filesystem::path& SlotPath() const { return m_slotPath; }

    // Serializes capture/persist/mutate and restore on this slot
    std::mutex& SlotMutex() { return m_slotMutex; }

    // Timed-out service and power calls of this slot that may still land
    InFlightCalls& InFlight() { return m_inFlight; }

private:
    std::string m_subsystem;
    std::filesystem::path m_slotPath;
    std::shared_ptr<ConfigValueStore> m_store;
    std::shared_ptr<ServiceControl> m_services;
    std::shared_ptr<PowerSchemeControl> m_power;
    AppConfig m_config;
    std::mutex m_slotMutex;
    InFlightCalls m_inFlight;
};

#endif // TWEAKGUARD_SNAPSHOT_MANAGER_H
