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

#include "tweak_applier.h"
#include "logger.h"

void AppliedState::Add(const std::string& id)
{
    std::lock_guard lock(m_mutex);
    m_ids.insert(id);
}

bool AppliedState::Contains(const std::string& id) const
{
    std::lock_guard lock(m_mutex);
    return m_ids.count(id) != 0;
}

void AppliedState::Clear()
{
    std::lock_guard lock(m_mutex);
    m_ids.clear();
}

bool AppliedState::Empty() const
{
    std::lock_guard lock(m_mutex);
    return m_ids.empty();
}

std::vector<std::string> AppliedState::Ids() const
{
    std::lock_guard lock(m_mutex);
    return std::vector<std::string>(m_ids.begin(), m_ids.end());
}

std::string TweakApplier::Step::Name() const
{
    switch (kind)
    {
    case Kind::Write:
    case Kind::Delete:  return target.Key();
    case Kind::Service: return "service:" + service.service;
    case Kind::Power:   return "power";
    }
    return target.Key();
}

TweakApplier::TweakApplier(const TweakCatalog& catalog,
                           SnapshotManager& snapshots,
                           std::shared_ptr<ConfigValueStore> store,
                           std::shared_ptr<ServiceControl> services,
                           std::shared_ptr<PowerSchemeControl> power,
                           AppliedState& applied,
                           SessionStateMachine& session,
                           AppConfig config)
    : m_catalog(catalog),
      m_snapshots(snapshots),
      m_store(std::move(store)),
      m_services(std::move(services)),
      m_power(std::move(power)),
      m_applied(applied),
      m_session(session),
      m_config(config)
{
}

ApplyReport TweakApplier::Apply(const std::string& tweakId, const CancellationToken* cancel)
{
    return ApplyProfile(std::vector<std::string>{tweakId}, cancel);
}

ApplyReport TweakApplier::ApplyGameProfile(const std::string& profileId, const CancellationToken* cancel)
{
    const GameProfile* profile = m_catalog.FindProfile(profileId);
    if (!profile)
    {
        ApplyReport report;
        report.status = Status::Error(ErrorKind::InvalidArgument, "unknown profile: " + profileId);
        Log("[APPLY] " + report.status.message);
        return report;
    }

    Log("[APPLY] Profile " + profile->id + " (" + std::to_string(profile->tweakIds.size()) + " tweaks)");
    return ApplyProfile(profile->tweakIds, cancel);
}

void TweakApplier::Expand(const std::vector<const TweakDefinition*>& tweaks,
                          std::vector<Step>& steps, AggregateError& errors, std::set<size_t>& failed)
{
    for (size_t i = 0; i < tweaks.size(); ++i)
    {
        const TweakDefinition& t = *tweaks[i];

        for (const auto& m : t.mutations)
        {
            const Step::Kind kind = m.desired.IsAbsent() ? Step::Kind::Delete : Step::Kind::Write;
            if (!m.fanOut)
            {
                steps.push_back(Step{kind, i, m.target, m.desired, {}, ""});
                continue;
            }

            std::vector<std::string> children;
            Status s = m_store->EnumerateChildren(m.target.path, children);
            if (!s.ok())
            {
                errors.Add(m.target.path + "\\*\\" + m.target.name, s);
                failed.insert(i);
                Log("[APPLY] " + t.id + ": cannot enumerate " + m.target.path + ": " + s.ToString());
                continue;
            }

            for (const auto& child : children)
            {
                Coordinate target{JoinPath(m.target.path, child), m.target.name};
                steps.push_back(Step{kind, i, target, m.desired, {}, ""});
            }
        }

        for (const auto& svc : t.services)
        {
            steps.push_back(Step{Step::Kind::Service, i, {}, {}, svc, ""});
        }

        if (!t.powerScheme.empty())
        {
            steps.push_back(Step{Step::Kind::Power, i, {}, {}, {}, t.powerScheme});
        }
    }
}

Status TweakApplier::Execute(const Step& step, AggregateError& warnings)
{
    switch (step.kind)
    {
    case Step::Kind::Write:
    {
        Status s = m_store->Write(step.target.path, step.target.name, step.value);
        if (!s.ok() || !m_config.verifyWrites) return s;

        ReadResult check = m_store->Read(step.target.path, step.target.name);
        if (!check.status.ok() || !check.existed || check.value != step.value)
        {
            std::string seen = !check.status.ok() ? check.status.ToString()
                             : check.existed ? check.value.ToDisplayString() : "absent";
            Log("[APPLY] Verify mismatch on " + step.target.Key() + ": wrote " +
                step.value.ToDisplayString() + ", read back " + seen);
            warnings.Add(step.target.Key(),
                         Status::Error(ErrorKind::IoError, "read back " + seen + " after write"));
        }
        return s;
    }
    case Step::Kind::Delete:
        return m_store->Delete(step.target.path, step.target.name);
    case Step::Kind::Service:
        return RestoreServiceRunState(m_services, step.service.service, step.service.desired,
                                      std::chrono::milliseconds(m_config.serviceTimeoutMs),
                                      &m_snapshots.InFlight());
    case Step::Kind::Power:
        return RestoreActivePowerPlan(m_power, step.scheme,
                                      std::chrono::milliseconds(m_config.powerTimeoutMs),
                                      &m_snapshots.InFlight());
    }
    return Status::Error(ErrorKind::InvalidArgument, "unknown step");
}

ApplyReport TweakApplier::ApplyProfile(const std::vector<std::string>& tweakIds, const CancellationToken* cancel)
{
    ApplyReport report;

    if (tweakIds.empty())
    {
        report.status = Status::Error(ErrorKind::InvalidArgument, "no tweaks requested");
        return report;
    }

    // Resolve everything before touching the system
    std::vector<const TweakDefinition*> tweaks;
    std::set<std::string> seenIds;
    for (const auto& id : tweakIds)
    {
        const TweakDefinition* t = m_catalog.Find(id);
        if (!t)
        {
            report.status = Status::Error(ErrorKind::InvalidArgument,
                                          "unknown tweak id '" + id + "' in " + m_catalog.Name());
            Log("[APPLY] " + report.status.message + ", nothing applied");
            return report;
        }
        if (seenIds.insert(id).second) tweaks.push_back(t);
    }

    std::lock_guard slot(m_snapshots.SlotMutex());

    const SessionState previous = m_session.Current();
    if (!m_session.Transition(SessionState::Capturing))
    {
        report.status = Status::Error(ErrorKind::InvalidArgument,
            std::string("cannot apply while session is ") + SessionStateName(previous));
        return report;
    }
    auto abandon = [&]()
    {
        m_session.Transition(previous == SessionState::Applied ? SessionState::Applied : SessionState::Idle);
    };

    std::vector<Step> steps;
    std::set<size_t> failed;
    Expand(tweaks, steps, report.errors, failed);

    CaptureRequest request;
    std::set<std::string> coordKeys;
    std::set<std::string> serviceNames;
    for (const auto& step : steps)
    {
        switch (step.kind)
        {
        case Step::Kind::Write:
        case Step::Kind::Delete:
            if (coordKeys.insert(step.target.Key()).second) request.coordinates.push_back(step.target);
            break;
        case Step::Kind::Service:
            if (serviceNames.insert(step.service.service).second) request.services.push_back(step.service.service);
            break;
        case Step::Kind::Power:
            request.capturePowerPlan = true;
            break;
        }
    }

    // While a batch is in effect its before-values stay authoritative
    Snapshot active;
    const Snapshot* carryOver = nullptr;
    if (previous == SessionState::Applied)
    {
        LoadResult loaded = m_snapshots.Load();
        if (loaded.status == LoadStatus::Loaded)
        {
            active = std::move(loaded.snapshot);
            carryOver = &active;
        }
    }

    Snapshot snapshot = m_snapshots.Capture(request, &report.warnings, carryOver);

    Status persisted = m_snapshots.Persist(snapshot);
    if (!persisted.ok())
    {
        report.status = persisted;
        Log("[APPLY] Snapshot could not be saved, nothing applied: " + persisted.ToString());
        abandon();
        return report;
    }

    m_session.Transition(SessionState::Mutating);
    report.ran = true;

    for (size_t i = 0; i < steps.size(); ++i)
    {
        const Step& step = steps[i];
        if (cancel && cancel->IsCancelled())
        {
            for (size_t j = i; j < steps.size(); ++j)
            {
                report.errors.Add(steps[j].Name(), Status::Error(ErrorKind::Cancelled, "not issued"));
                failed.insert(steps[j].tweakIndex);
            }
            Log("[APPLY] Cancelled with " + std::to_string(steps.size() - i) + " steps pending");
            break;
        }

        Status s = Execute(step, report.warnings);
        ++report.mutationsIssued;
        if (!s.ok())
        {
            report.errors.Add(step.Name(), s);
            failed.insert(step.tweakIndex);
            Log("[APPLY] " + tweaks[step.tweakIndex]->id + ": " + step.Name() + " failed: " + s.ToString());
        }
    }

    for (size_t i = 0; i < tweaks.size(); ++i)
    {
        if (failed.count(i)) continue;
        m_applied.Add(tweaks[i]->id);
        report.applied.push_back(tweaks[i]->id);
    }

    m_session.Transition(SessionState::Applied);

    Log("[APPLY] " + m_catalog.Name() + ": " + std::to_string(report.applied.size()) + "/" +
        std::to_string(tweaks.size()) + " tweaks applied, " + std::to_string(report.mutationsIssued) +
        " steps issued, " + std::to_string(report.errors.Count()) + " errors");
    return report;
}
