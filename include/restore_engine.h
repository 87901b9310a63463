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

#ifndef TWEAKGUARD_RESTORE_ENGINE_H
#define TWEAKGUARD_RESTORE_ENGINE_H

#include "config.h"
#include "snapshot_manager.h"
#include "tweak_applier.h"
#include "types.h"
#include <memory>

struct RestoreReport
{
    bool ran = false;           // false only when the snapshot could not be read
    Status status;
    bool hadBackup = false;     // false: nothing to restore, no side effects
    AggregateError errors;
    size_t rewritten = 0;
    size_t deleted = 0;
    size_t servicesRestored = 0;
    bool powerRestored = false;

    bool Clean() const { return ran && errors.Empty(); }
};

// Replays the slot's snapshot backwards: deletes what did not exist,
// rewrites the rest with the original typed value, then services and power.
class RestoreEngine
{
public:
    RestoreEngine(SnapshotManager& snapshots,
                  std::shared_ptr<ConfigValueStore> store,
                  std::shared_ptr<ServiceControl> services,
                  std::shared_ptr<PowerSchemeControl> power,
                  AppliedState& applied,
                  SessionStateMachine& session,
                  AppConfig config);

    // Every entry is attempted regardless of earlier failures. A missing or
    // corrupt snapshot is a successful no-op. Always ends in Idle.
    RestoreReport RestoreAll();

private:
    void RestoreSnapshot(const Snapshot& snapshot, RestoreReport& report);

    SnapshotManager& m_snapshots;
    std::shared_ptr<ConfigValueStore> m_store;
    std::shared_ptr<ServiceControl> m_services;
    std::shared_ptr<PowerSchemeControl> m_power;
    AppliedState& m_applied;
    SessionStateMachine& m_session;
    AppConfig m_config;
};

#endif // TWEAKGUARD_RESTORE_ENGINE_H
