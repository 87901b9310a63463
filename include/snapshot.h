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

#ifndef TWEAKGUARD_SNAPSHOT_H
#define TWEAKGUARD_SNAPSHOT_H

#include "config_store.h"
#include "service_control.h"
#include <map>
#include <string>

// Prior state of one coordinate. existed == false means restore deletes it;
// value is then Absent and carries no meaning.
struct ConfigEntry
{
    std::string path;
    std::string name;
    ConfigValue value;
    bool existed = false;

    Coordinate Coord() const { return Coordinate{path, name}; }
};

// Point-in-time "before" record for one subsystem slot.
// Always built whole by a capture; never merged into an older one.
struct Snapshot
{
    std::string createdAt;                                  // ISO-8601 UTC
    std::map<std::string, ConfigEntry> entries;             // Coordinate::Key() -> entry
    std::map<std::string, ServiceRunState> serviceStates;
    std::map<std::string, ServiceStartType> serviceStartTypes;
    std::string powerPlan;                                  // empty: not captured

    bool Empty() const
    {
        return entries.empty() && serviceStates.empty() &&
               serviceStartTypes.empty() && powerPlan.empty();
    }

    // Last write wins for a repeated coordinate
    void Record(ConfigEntry entry)
    {
        std::string key = entry.Coord().Key();
        entries[key] = std::move(entry);
    }
};

#endif // TWEAKGUARD_SNAPSHOT_H
