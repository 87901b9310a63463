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

#ifndef TWEAKGUARD_SERVICE_CONTROL_H
#define TWEAKGUARD_SERVICE_CONTROL_H

#include "types.h"
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

enum class ServiceRunState
{
    Running,
    Stopped
};

// Boot-time start type as configured in the SCM
enum class ServiceStartType
{
    Boot,
    System,
    Automatic,
    Manual,
    Disabled
};

// "running" / "stopped"
const char* ServiceRunStateName(ServiceRunState state);
bool ParseServiceRunState(const std::string& name, ServiceRunState& state);

// "boot" / "system" / "auto" / "manual" / "disabled"
const char* ServiceStartTypeName(ServiceStartType type);
bool ParseServiceStartType(const std::string& name, ServiceStartType& type);

// Query/start/stop by service name. Calls may block for seconds.
class ServiceControl
{
public:
    virtual ~ServiceControl() = default;

    // Pending states are reported as the state they are heading to
    virtual Status QueryRunState(const std::string& service, ServiceRunState& state) = 0;

    // Both wait (bounded) for the service to settle
    virtual Status Start(const std::string& service) = 0;
    virtual Status Stop(const std::string& service) = 0;

    virtual Status QueryStartType(const std::string& service, ServiceStartType& type) = 0;
    virtual Status SetStartType(const std::string& service, ServiceStartType type) = 0;
};

// Active power scheme by scheme GUID (lowercase, no braces)
class PowerSchemeControl
{
public:
    virtual ~PowerSchemeControl() = default;

    virtual Status GetActiveScheme(std::string& schemeId) = 0;
    virtual Status SetActiveScheme(const std::string& schemeId) = 0;
};

// Calls that timed out but are still running on their own thread, keyed by
// "service:<name>" or "power". A later call on the same key waits for them
// first so it never races an abandoned Start/Stop.
class InFlightCalls
{
public:
    void Track(const std::string& key, std::shared_future<Status> call);

    // Waits until timeout for earlier calls on key. Timeout if one is still running.
    Status Settle(const std::string& key, std::chrono::milliseconds timeout);

    // Waits until timeout for every tracked call. Returns how many are still running.
    size_t SettleAll(std::chrono::milliseconds timeout);

    size_t Count() const;

private:
    size_t Reap();   // drops finished calls; caller holds m_mutex

    mutable std::mutex m_mutex;
    std::multimap<std::string, std::shared_future<Status>> m_calls;
};

// --------------------------------------------------------------------------
// Bounded wrappers. Each call runs off the caller's thread and gives up
// with Timeout after the given interval; the control object is co-owned by
// the abandoned call so it stays valid until that call returns. With
// inFlight set, an abandoned call is tracked there and waited for by the next
// call on the same service (or power scheme).
// --------------------------------------------------------------------------

Status CaptureServiceRunState(const std::shared_ptr<ServiceControl>& control,
                              const std::string& service,
                              std::chrono::milliseconds timeout,
                              ServiceRunState& state,
                              InFlightCalls* inFlight = nullptr);

// Drives the service to the given state. Already there is a no-op success.
Status RestoreServiceRunState(const std::shared_ptr<ServiceControl>& control,
                              const std::string& service,
                              ServiceRunState state,
                              std::chrono::milliseconds timeout,
                              InFlightCalls* inFlight = nullptr);

Status CaptureServiceStartType(const std::shared_ptr<ServiceControl>& control,
                               const std::string& service,
                               std::chrono::milliseconds timeout,
                               ServiceStartType& type,
                               InFlightCalls* inFlight = nullptr);

Status RestoreServiceStartType(const std::shared_ptr<ServiceControl>& control,
                               const std::string& service,
                               ServiceStartType type,
                               std::chrono::milliseconds timeout,
                               InFlightCalls* inFlight = nullptr);

Status CaptureActivePowerPlan(const std::shared_ptr<PowerSchemeControl>& control,
                              std::chrono::milliseconds timeout,
                              std::string& schemeId,
                              InFlightCalls* inFlight = nullptr);

Status RestoreActivePowerPlan(const std::shared_ptr<PowerSchemeControl>& control,
                              const std::string& schemeId,
                              std::chrono::milliseconds timeout,
                              InFlightCalls* inFlight = nullptr);

#endif // TWEAKGUARD_SERVICE_CONTROL_H
