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

#include "snapshot_manager.h"
#include "constants.h"
#include "logger.h"
#include "snapshot_codec.h"
#include "utils.h"
#include <fstream>
#include <iterator>

SnapshotManager::SnapshotManager(std::string subsystem,
                                 std::filesystem::path slotPath,
                                 std::shared_ptr<ConfigValueStore> store,
                                 std::shared_ptr<ServiceControl> services,
                                 std::shared_ptr<PowerSchemeControl> power,
                                 AppConfig config)
    : m_subsystem(std::move(subsystem)),
      m_slotPath(std::move(slotPath)),
      m_store(std::move(store)),
      m_services(std::move(services)),
      m_power(std::move(power)),
      m_config(config)
{
}

std::filesystem::path SnapshotManager::DefaultSlotPath(const std::string& subsystem)
{
    return GetAppDataPath() / BACKUP_DIRNAME / (subsystem + SNAPSHOT_FILE_SUFFIX);
}

Snapshot SnapshotManager::Capture(const CaptureRequest& request,
                                  AggregateError* warnings,
                                  const Snapshot* carryOver)
{
    Snapshot snapshot;
    snapshot.createdAt = CurrentTimestampUtc();
    size_t reused = 0;

    for (const auto& coord : request.coordinates)
    {
        if (carryOver)
        {
            auto it = carryOver->entries.find(coord.Key());
            if (it != carryOver->entries.end())
            {
                snapshot.Record(it->second);
                ++reused;
                continue;
            }
        }

        ConfigEntry entry;
        entry.path = coord.path;
        entry.name = coord.name;

        ReadResult read = m_store->Read(coord.path, coord.name);
        if (read.status.ok())
        {
            entry.existed = read.existed;
            if (read.existed) entry.value = read.value;
        }
        else if (read.status.kind != ErrorKind::NotFound)
        {
            // Recorded as absent: restore then deletes rather than writing a guess
            Log("[SNAPSHOT] " + m_subsystem + ": cannot read " + coord.Key() + " (" +
                read.status.ToString() + "), recording as absent");
            if (warnings) warnings->Add(coord.Key(), read.status);
        }
        snapshot.Record(std::move(entry));
    }

    const auto serviceTimeout = std::chrono::milliseconds(m_config.serviceTimeoutMs);
    for (const auto& service : request.services)
    {
        const std::string step = "service:" + service;
        bool haveState = false;
        bool haveStartType = !m_config.restoreStartTypes;

        if (carryOver)
        {
            auto it = carryOver->serviceStates.find(service);
            if (it != carryOver->serviceStates.end())
            {
                snapshot.serviceStates[service] = it->second;
                haveState = true;
            }
            auto st = carryOver->serviceStartTypes.find(service);
            if (!haveStartType && st != carryOver->serviceStartTypes.end())
            {
                snapshot.serviceStartTypes[service] = st->second;
                haveStartType = true;
            }
        }

        if (!haveState)
        {
            ServiceRunState state;
            Status s = CaptureServiceRunState(m_services, service, serviceTimeout, state, &m_inFlight);
            if (s.ok())
            {
                snapshot.serviceStates[service] = state;
            }
            else
            {
                Log("[SNAPSHOT] " + m_subsystem + ": cannot capture " + step + " (" + s.ToString() + ")");
                if (warnings) warnings->Add(step, s);
            }
        }

        if (!haveStartType)
        {
            ServiceStartType type;
            Status s = CaptureServiceStartType(m_services, service, serviceTimeout, type, &m_inFlight);
            if (s.ok())
            {
                snapshot.serviceStartTypes[service] = type;
            }
            else
            {
                Log("[SNAPSHOT] " + m_subsystem + ": cannot capture start type of " + service + " (" + s.ToString() + ")");
                if (warnings) warnings->Add(step + ":start_type", s);
            }
        }
    }

    if (request.capturePowerPlan)
    {
        if (carryOver && !carryOver->powerPlan.empty())
        {
            snapshot.powerPlan = carryOver->powerPlan;
        }
        else
        {
            std::string scheme;
            Status s = CaptureActivePowerPlan(m_power, std::chrono::milliseconds(m_config.powerTimeoutMs), scheme,
                                              &m_inFlight);
            if (s.ok())
            {
                snapshot.powerPlan = scheme;
            }
            else
            {
                Log("[SNAPSHOT] " + m_subsystem + ": cannot capture power plan (" + s.ToString() + ")");
                if (warnings) warnings->Add("power", s);
            }
        }
    }

    Log("[SNAPSHOT] " + m_subsystem + ": captured " + std::to_string(snapshot.entries.size()) +
        " values (" + std::to_string(reused) + " carried over), " +
        std::to_string(snapshot.serviceStates.size()) + " services" +
        (snapshot.powerPlan.empty() ? "" : ", power plan " + snapshot.powerPlan));
    return snapshot;
}

Status SnapshotManager::Persist(const Snapshot& snapshot)
{
    std::string text;
    try
    {
        text = EncodeSnapshot(snapshot);
    }
    catch (const std::exception& e)
    {
        // Invalid UTF-8 in a captured string makes the encoder throw
        Log(std::string("[SNAPSHOT] Encode failed: ") + e.what());
        return Status::Error(ErrorKind::IoError, std::string("cannot encode snapshot: ") + e.what());
    }

    std::error_code ec;
    if (m_slotPath.has_parent_path()) std::filesystem::create_directories(m_slotPath.parent_path(), ec);
    if (ec)
    {
        return Status::Error(ErrorKind::IoError, "cannot create " + m_slotPath.parent_path().string() + ": " + ec.message());
    }

    std::filesystem::path tmpPath = m_slotPath;
    tmpPath += ".tmp";

    {
        std::ofstream f(tmpPath, std::ios::binary | std::ios::trunc);
        if (!f)
        {
            return Status::Error(ErrorKind::IoError, "cannot open " + tmpPath.string() + " for writing");
        }
        f << text;
        f.flush();
        if (!f)
        {
            f.close();
            std::filesystem::remove(tmpPath, ec);
            return Status::Error(ErrorKind::IoError, "write to " + tmpPath.string() + " failed");
        }
    }

    std::filesystem::rename(tmpPath, m_slotPath, ec);
    if (ec)
    {
        // The previous slot file stays as it was
        Status failed = Status::Error(ErrorKind::IoError, "cannot replace " + m_slotPath.string() + ": " + ec.message());
        Log("[SNAPSHOT] " + m_subsystem + ": rename failed, keeping the existing backup: " + ec.message());
        std::filesystem::remove(tmpPath, ec);
        return failed;
    }

    Log("[SNAPSHOT] " + m_subsystem + ": persisted to " + m_slotPath.string());
    return Status::Ok();
}

LoadResult SnapshotManager::Load() const
{
    LoadResult result;

    std::error_code ec;
    if (!std::filesystem::exists(m_slotPath, ec))
    {
        if (ec)
        {
            result.status = LoadStatus::Failed;
            result.error = Status::Error(ErrorKind::IoError, "cannot stat " + m_slotPath.string() + ": " + ec.message());
            return result;
        }
        result.status = LoadStatus::NoBackup;
        return result;
    }

    std::string text;
    {
        std::ifstream f(m_slotPath, std::ios::binary);
        if (!f)
        {
            result.status = LoadStatus::Failed;
            result.error = Status::Error(ErrorKind::IoError, "cannot open " + m_slotPath.string());
            Log("[SNAPSHOT] " + m_subsystem + ": " + result.error.message);
            return result;
        }
        text.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
        if (f.bad())
        {
            result.status = LoadStatus::Failed;
            result.error = Status::Error(ErrorKind::IoError, "read of " + m_slotPath.string() + " failed");
            return result;
        }
    }

    Status s = DecodeSnapshot(text, result.snapshot);
    if (!s.ok())
    {
        result.status = LoadStatus::Corrupt;
        result.error = s;
        result.snapshot = Snapshot();
        Log("[SNAPSHOT] " + m_subsystem + ": backup is unusable, treating as no backup: " + s.ToString());
        return result;
    }

    result.status = LoadStatus::Loaded;
    return result;
}

bool SnapshotManager::HasBackup() const
{
    return Load().Available();
}

Status SnapshotManager::Discard()
{
    std::error_code ec;
    std::filesystem::remove(m_slotPath, ec);
    if (ec)
    {
        return Status::Error(ErrorKind::IoError, "cannot remove " + m_slotPath.string() + ": " + ec.message());
    }
    Log("[SNAPSHOT] " + m_subsystem + ": slot cleared");
    return Status::Ok();
}
