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

#ifndef TWEAKGUARD_TWEAK_CATALOG_H
#define TWEAKGUARD_TWEAK_CATALOG_H

#include "config_store.h"
#include "service_control.h"
#include <string>
#include <vector>

// One desired change. An Absent desired value deletes the coordinate.
// With fanOut set, target.path is a parent key and the change applies to
// target.name under every child key of it.
struct Mutation
{
    Coordinate target;
    ConfigValue desired;
    bool fanOut = false;
};

struct ServiceChange
{
    std::string service;
    ServiceRunState desired = ServiceRunState::Stopped;
};

struct TweakDefinition
{
    std::string id;            // globally unique, stable
    std::string displayName;
    std::string description;
    std::string category;
    std::vector<Mutation> mutations;        // applied in order
    std::vector<ServiceChange> services;
    std::string powerScheme;                // empty: leave the active scheme alone
};

// Named, ordered batch of tweak ids applied as one capture
struct GameProfile
{
    std::string id;
    std::string name;
    std::string description;
    std::vector<std::string> tweakIds;
};

// Immutable tweak registry for one subsystem
class TweakCatalog
{
public:
    // Throws std::invalid_argument for duplicate or empty ids, malformed
    // paths, and profiles naming unknown tweaks.
    TweakCatalog(std::string name, std::vector<TweakDefinition> tweaks,
                 std::vector<GameProfile> profiles = {});

    const std::string& Name() const { return m_name; }
    const std::vector<TweakDefinition>& Tweaks() const { return m_tweaks; }
    const std::vector<GameProfile>& Profiles() const { return m_profiles; }

    // nullptr when unknown
    const TweakDefinition* Find(const std::string& id) const;
    const GameProfile* FindProfile(const std::string& id) const;

    static TweakCatalog Gaming();
    static TweakCatalog Privacy();

private:
    std::string m_name;
    std::vector<TweakDefinition> m_tweaks;
    std::vector<GameProfile> m_profiles;
};

#endif // TWEAKGUARD_TWEAK_CATALOG_H
