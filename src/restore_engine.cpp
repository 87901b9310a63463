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

#include "restore_engine.h"
#include "logger.h"

RestoreEngine::RestoreEngine(SnapshotManager& snapshots,
                             std::shared_ptr<ConfigValueStore> store,
                             std::shared_ptr<ServiceControl> services,
                             std::shared_ptr<PowerSchemeControl> power,
                             AppliedState& applied,
                             SessionStateMachine& session,
                             AppConfig config)
    : m_snapshots(snapshots),
      m_store(std::move(store)),
      m_services(std::move(services)),
      m_power(std::move(power)),
      m_applied(applied),
      m_session(session),
      m_config(config)
{
}

void RestoreEngine::RestoreSnapshot(const Snapshot& snapshot, RestoreReport& report)
{
    for (const auto& [key, entry] : snapshot.entries)
    {
        if (!entry.existed)
        {
            Status s = m_store->Delete(entry.path, entry.name);
            if (s.ok() || s.kind == ErrorKind::NotFound)
            {
                ++report.deleted;
            }
            else
            {
                report.errors.Add(key, s);
                Log("[RESTORE] Delete " + key + " failed: " + s.ToString());
            }
            continue;
        }

        // Original tag is written back as-is
        Status s = m_store->Write(entry.path, entry.name, entry.value);
        if (s.ok())
        {
            ++report.rewritten;
        }
        else
        {
            report.errors.Add(key, s);
            Log("[RESTORE] Write " + key + " = " + entry.value.ToDisplayString() + " failed: " + s.ToString());
        }
    }

    const auto serviceTimeout = std::chrono::milliseconds(m_config.serviceTimeoutMs);

    // Start type first so a disabled service can be started again
    if (m_config.restoreStartTypes)
    {
        for (const auto& [service, type] : snapshot.serviceStartTypes)
        {
            Status s = RestoreServiceStartType(m_services, service, type, serviceTimeout,
                                               &m_snapshots.InFlight());
            if (!s.ok())
            {
                report.errors.Add("service:" + service + ":start_type", s);
                Log("[RESTORE] Start type of " + service + " failed: " + s.ToString());
            }
        }
    }
    else if (!snapshot.serviceStartTypes.empty())
    {
        Log("[RESTORE] Snapshot carries start types but restore_start_types is off, leaving them");
    }

    for (const auto& [service, state] : snapshot.serviceStates)
    {
        Status s = RestoreServiceRunState(m_services, service, state, serviceTimeout,
                                          &m_snapshots.InFlight());
        if (s.ok())
        {
            ++report.servicesRestored;
        }
        else
        {
            report.errors.Add("service:" + service, s);
            Log("[RESTORE] Service " + service + " -> " + ServiceRunStateName(state) + " failed: " + s.ToString());
        }
    }

    if (!snapshot.powerPlan.empty())
    {
        Status s = RestoreActivePowerPlan(m_power, snapshot.powerPlan,
                                          std::chrono::milliseconds(m_config.powerTimeoutMs),
                                          &m_snapshots.InFlight());
        if (s.ok())
        {
            report.powerRestored = true;
        }
        else
        {
            report.errors.Add("power", s);
            Log("[RESTORE] Power plan " + snapshot.powerPlan + " failed: " + s.ToString());
        }
    }
}

RestoreReport RestoreEngine::RestoreAll()
{
    RestoreReport report;
    std::lock_guard slot(m_snapshots.SlotMutex());

    LoadResult loaded = m_snapshots.Load();
    if (loaded.status == LoadStatus::Failed)
    {
        report.status = loaded.error;
        Log("[RESTORE] " + m_snapshots.Subsystem() + ": snapshot unreadable, nothing restored: " +
            loaded.error.ToString());
        return report;
    }

    if (!m_session.Transition(SessionState::Restoring))
    {
        report.status = Status::Error(ErrorKind::InvalidArgument,
            std::string("cannot restore while session is ") + SessionStateName(m_session.Current()));
        return report;
    }

    report.ran = true;
    report.hadBackup = loaded.Available();

    if (report.hadBackup)
    {
        Log("[RESTORE] " + m_snapshots.Subsystem() + ": replaying snapshot from " + loaded.snapshot.createdAt);
        RestoreSnapshot(loaded.snapshot, report);
    }
    else
    {
        Log("[RESTORE] " + m_snapshots.Subsystem() + ": no backup available, nothing to do");
    }

    m_applied.Clear();
    m_session.Transition(SessionState::Idle);

    Log("[RESTORE] " + m_snapshots.Subsystem() + ": " + std::to_string(report.rewritten) + " rewritten, " +
        std::to_string(report.deleted) + " deleted, " + std::to_string(report.servicesRestored) +
        " services, " + std::to_string(report.errors.Count()) + " errors");
    return report;
}
