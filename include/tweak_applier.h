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

#ifndef TWEAKGUARD_TWEAK_APPLIER_H
#define TWEAKGUARD_TWEAK_APPLIER_H

#include "config.h"
#include "snapshot_manager.h"
#include "tweak_catalog.h"
#include "types.h"
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Tweak ids applied in this process. Never persisted.
class AppliedState
{
public:
    void Add(const std::string& id);
    bool Contains(const std::string& id) const;
    void Clear();
    bool Empty() const;
    std::vector<std::string> Ids() const;

private:
    mutable std::mutex m_mutex;
    std::set<std::string> m_ids;
};

struct ApplyReport
{
    bool ran = false;                   // false: nothing was mutated, see status
    Status status;                      // hard failure when ran == false
    AggregateError errors;              // per-mutation failures
    AggregateError warnings;            // capture and verification problems
    std::vector<std::string> applied;   // tweaks whose every step succeeded
    size_t mutationsIssued = 0;

    bool Clean() const { return ran && errors.Empty() && warnings.Empty(); }
};

// Capture -> Persist -> Mutate for one or more tweaks of a catalog
class TweakApplier
{
public:
    TweakApplier(const TweakCatalog& catalog,
                 SnapshotManager& snapshots,
                 std::shared_ptr<ConfigValueStore> store,
                 std::shared_ptr<ServiceControl> services,
                 std::shared_ptr<PowerSchemeControl> power,
                 AppliedState& applied,
                 SessionStateMachine& session,
                 AppConfig config);

    ApplyReport Apply(const std::string& tweakId, const CancellationToken* cancel = nullptr);

    // One capture for the union of every tweak's coordinates, taken before
    // the first mutation of the batch.
    ApplyReport ApplyProfile(const std::vector<std::string>& tweakIds, const CancellationToken* cancel = nullptr);

    // Resolves a named profile from the catalog, then ApplyProfile
    ApplyReport ApplyGameProfile(const std::string& profileId, const CancellationToken* cancel = nullptr);

private:
    struct Step
    {
        enum class Kind { Write, Delete, Service, Power } kind;
        size_t tweakIndex;
        Coordinate target;
        ConfigValue value;
        ServiceChange service;
        std::string scheme;

        std::string Name() const;
    };

    // Resolves fan-out targets. Tweaks whose targets cannot be enumerated
    // are reported in errors and added to failed.
    void Expand(const std::vector<const TweakDefinition*>& tweaks,
                std::vector<Step>& steps, AggregateError& errors, std::set<size_t>& failed);
    Status Execute(const Step& step, AggregateError& warnings);

    const TweakCatalog& m_catalog;
    SnapshotManager& m_snapshots;
    std::shared_ptr<ConfigValueStore> m_store;
    std::shared_ptr<ServiceControl> m_services;
    std::shared_ptr<PowerSchemeControl> m_power;
    AppliedState& m_applied;
    SessionStateMachine& m_session;
    AppConfig m_config;
};

#endif // TWEAKGUARD_TWEAK_APPLIER_H
