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

#include "subsystem.h"

TweakSubsystem::TweakSubsystem(TweakCatalog catalog,
                               std::filesystem::path slotPath,
                               std::shared_ptr<ConfigValueStore> store,
                               std::shared_ptr<ServiceControl> services,
                               std::shared_ptr<PowerSchemeControl> power,
                               const AppConfig& config)
    : m_catalog(std::move(catalog)),
      m_snapshots(m_catalog.Name(), std::move(slotPath), store, services, power, config),
      m_applier(m_catalog, m_snapshots, store, services, power, m_applied, m_session, config),
      m_restorer(m_snapshots, store, services, power, m_applied, m_session, config)
{
}

std::vector<TweakListing> TweakSubsystem::ListTweaks() const
{
    std::vector<TweakListing> list;
    for (const auto& t : m_catalog.Tweaks())
    {
        list.push_back({t.id, t.displayName, t.description, t.category, m_applied.Contains(t.id)});
    }
    return list;
}

ApplyReport TweakSubsystem::Apply(const std::string& tweakId, const CancellationToken* cancel)
{
    return m_applier.Apply(tweakId, cancel);
}

ApplyReport TweakSubsystem::ApplyProfile(const std::vector<std::string>& tweakIds, const CancellationToken* cancel)
{
    return m_applier.ApplyProfile(tweakIds, cancel);
}

ApplyReport TweakSubsystem::ApplyGameProfile(const std::string& profileId, const CancellationToken* cancel)
{
    return m_applier.ApplyGameProfile(profileId, cancel);
}

RestoreReport TweakSubsystem::RestoreAll()
{
    return m_restorer.RestoreAll();
}
