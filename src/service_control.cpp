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

#include "service_control.h"
#include "logger.h"
#include "utils.h"
#include <vector>

const char* ServiceRunStateName(ServiceRunState state)
{
    return state == ServiceRunState::Running ? "running" : "stopped";
}

bool ParseServiceRunState(const std::string& name, ServiceRunState& state)
{
    if (EqualsIgnoreCase(name, "running"))      state = ServiceRunState::Running;
    else if (EqualsIgnoreCase(name, "stopped")) state = ServiceRunState::Stopped;
    else return false;
    return true;
}

const char* ServiceStartTypeName(ServiceStartType type)
{
    switch (type)
    {
    case ServiceStartType::Boot:      return "boot";
    case ServiceStartType::System:    return "system";
    case ServiceStartType::Automatic: return "auto";
    case ServiceStartType::Manual:    return "manual";
    case ServiceStartType::Disabled:  return "disabled";
    }
    return "manual";
}

bool ParseServiceStartType(const std::string& name, ServiceStartType& type)
{
    if (EqualsIgnoreCase(name, "boot"))          type = ServiceStartType::Boot;
    else if (EqualsIgnoreCase(name, "system"))   type = ServiceStartType::System;
    else if (EqualsIgnoreCase(name, "auto"))     type = ServiceStartType::Automatic;
    else if (EqualsIgnoreCase(name, "manual"))   type = ServiceStartType::Manual;
    else if (EqualsIgnoreCase(name, "disabled")) type = ServiceStartType::Disabled;
    else return false;
    return true;
}

void InFlightCalls::Track(const std::string& key, std::shared_future<Status> call)
{
    std::lock_guard lock(m_mutex);
    Reap();
    m_calls.emplace(key, std::move(call));
}

size_t InFlightCalls::Reap()
{
    for (auto it = m_calls.begin(); it != m_calls.end();)
    {
        if (it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
        {
            const Status& late = it->second.get();
            Log("[SERVICE] Abandoned call on " + it->first + " finished: " + late.ToString());
            it = m_calls.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return m_calls.size();
}

Status InFlightCalls::Settle(const std::string& key, std::chrono::milliseconds timeout)
{
    std::vector<std::shared_future<Status>> pending;
    {
        std::lock_guard lock(m_mutex);
        auto range = m_calls.equal_range(key);
        for (auto it = range.first; it != range.second; ++it) pending.push_back(it->second);
    }
    if (pending.empty()) return Status::Ok();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool settled = true;
    for (const auto& call : pending)
    {
        if (call.wait_until(deadline) != std::future_status::ready) settled = false;
    }

    std::lock_guard lock(m_mutex);
    Reap();
    if (!settled)
    {
        Log("[SERVICE] " + key + " still busy with an abandoned call");
        return Status::Error(ErrorKind::Timeout, key + ": an earlier call has not finished after " +
                             std::to_string(timeout.count()) + " ms");
    }
    return Status::Ok();
}

size_t InFlightCalls::SettleAll(std::chrono::milliseconds timeout)
{
    std::vector<std::shared_future<Status>> pending;
    {
        std::lock_guard lock(m_mutex);
        for (const auto& [key, call] : m_calls) pending.push_back(call);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (const auto& call : pending) call.wait_until(deadline);

    std::lock_guard lock(m_mutex);
    return Reap();
}

size_t InFlightCalls::Count() const
{
    std::lock_guard lock(m_mutex);
    return m_calls.size();
}

// Waits out any abandoned call on key, then runs call bounded and tracks it
// if it is abandoned in turn
static Status RunTracked(InFlightCalls* inFlight, const std::string& key,
                         std::function<Status()> call,
                         std::chrono::milliseconds timeout, const std::string& what)
{
    if (!inFlight) return RunBounded(std::move(call), timeout, what);

    Status s = inFlight->Settle(key, timeout);
    if (!s.ok()) return s;

    std::shared_future<Status> abandoned;
    s = RunBounded(std::move(call), timeout, what, &abandoned);
    if (s.kind == ErrorKind::Timeout && abandoned.valid()) inFlight->Track(key, std::move(abandoned));
    return s;
}

Status CaptureServiceRunState(const std::shared_ptr<ServiceControl>& control,
                              const std::string& service,
                              std::chrono::milliseconds timeout,
                              ServiceRunState& state,
                              InFlightCalls* inFlight)
{
    if (!control) return Status::Error(ErrorKind::InvalidArgument, "no service control available");

    // The worker may outlive this frame on timeout, so it writes into shared storage
    auto out = std::make_shared<ServiceRunState>(ServiceRunState::Stopped);
    Status s = RunTracked(inFlight, "service:" + service, [control, service, out]()
    {
        return control->QueryRunState(service, *out);
    }, timeout, "query service " + service);

    if (s.ok()) state = *out;
    return s;
}

Status RestoreServiceRunState(const std::shared_ptr<ServiceControl>& control,
                              const std::string& service,
                              ServiceRunState state,
                              std::chrono::milliseconds timeout,
                              InFlightCalls* inFlight)
{
    if (!control) return Status::Error(ErrorKind::InvalidArgument, "no service control available");

    return RunTracked(inFlight, "service:" + service, [control, service, state]()
    {
        ServiceRunState current = ServiceRunState::Stopped;
        Status s = control->QueryRunState(service, current);
        if (!s.ok()) return s;

        if (current == state)
        {
            Log("[SERVICE] " + service + " already " + ServiceRunStateName(state));
            return Status::Ok();
        }

        s = (state == ServiceRunState::Running) ? control->Start(service) : control->Stop(service);
        if (s.ok())
        {
            Log("[SERVICE] " + service + " -> " + ServiceRunStateName(state));
        }
        return s;
    }, timeout, std::string(state == ServiceRunState::Running ? "start" : "stop") + " service " + service);
}

Status CaptureServiceStartType(const std::shared_ptr<ServiceControl>& control,
                               const std::string& service,
                               std::chrono::milliseconds timeout,
                               ServiceStartType& type,
                               InFlightCalls* inFlight)
{
    if (!control) return Status::Error(ErrorKind::InvalidArgument, "no service control available");

    auto out = std::make_shared<ServiceStartType>(ServiceStartType::Manual);
    Status s = RunTracked(inFlight, "service:" + service, [control, service, out]()
    {
        return control->QueryStartType(service, *out);
    }, timeout, "query start type of " + service);

    if (s.ok()) type = *out;
    return s;
}

Status RestoreServiceStartType(const std::shared_ptr<ServiceControl>& control,
                               const std::string& service,
                               ServiceStartType type,
                               std::chrono::milliseconds timeout,
                               InFlightCalls* inFlight)
{
    if (!control) return Status::Error(ErrorKind::InvalidArgument, "no service control available");

    return RunTracked(inFlight, "service:" + service, [control, service, type]()
    {
        ServiceStartType current = ServiceStartType::Manual;
        Status s = control->QueryStartType(service, current);
        if (!s.ok()) return s;
        if (current == type) return Status::Ok();

        s = control->SetStartType(service, type);
        if (s.ok())
        {
            Log("[SERVICE] " + service + " start type -> " + ServiceStartTypeName(type));
        }
        return s;
    }, timeout, "set start type of " + service);
}

Status CaptureActivePowerPlan(const std::shared_ptr<PowerSchemeControl>& control,
                              std::chrono::milliseconds timeout,
                              std::string& schemeId,
                              InFlightCalls* inFlight)
{
    if (!control) return Status::Error(ErrorKind::InvalidArgument, "no power scheme control available");

    auto out = std::make_shared<std::string>();
    Status s = RunTracked(inFlight, "power", [control, out]()
    {
        return control->GetActiveScheme(*out);
    }, timeout, "query active power scheme");

    if (s.ok()) schemeId = *out;
    return s;
}

Status RestoreActivePowerPlan(const std::shared_ptr<PowerSchemeControl>& control,
                              const std::string& schemeId,
                              std::chrono::milliseconds timeout,
                              InFlightCalls* inFlight)
{
    if (!control) return Status::Error(ErrorKind::InvalidArgument, "no power scheme control available");
    if (schemeId.empty()) return Status::Error(ErrorKind::InvalidArgument, "empty power scheme id");

    return RunTracked(inFlight, "power", [control, schemeId]()
    {
        std::string current;
        Status s = control->GetActiveScheme(current);
        if (s.ok() && EqualsIgnoreCase(current, schemeId)) return Status::Ok();

        s = control->SetActiveScheme(schemeId);
        if (s.ok())
        {
            Log("[POWER] Active scheme -> " + schemeId);
        }
        return s;
    }, timeout, "activate power scheme " + schemeId);
}
