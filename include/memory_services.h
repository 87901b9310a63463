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

#ifndef TWEAKGUARD_MEMORY_SERVICES_H
#define TWEAKGUARD_MEMORY_SERVICES_H

#include "service_control.h"
#include <map>
#include <mutex>
#include <string>

// Simulated service table for --simulate and tests
class MemoryServiceControl : public ServiceControl
{
public:
    void AddService(const std::string& service, ServiceRunState state,
                    ServiceStartType startType = ServiceStartType::Manual);

    // Every call touching this service returns the given status until cleared
    void Fail(const std::string& service, const Status& status);
    void ClearFailure(const std::string& service);

    // Every call touching this service sleeps first
    void SetDelay(const std::string& service, std::chrono::milliseconds delay);

    bool GetRunState(const std::string& service, ServiceRunState& state) const;
    bool GetStartType(const std::string& service, ServiceStartType& type) const;

    // Successful Start/Stop/SetStartType calls
    size_t ChangeCount() const;

    Status QueryRunState(const std::string& service, ServiceRunState& state) override;
    Status Start(const std::string& service) override;
    Status Stop(const std::string& service) override;
    Status QueryStartType(const std::string& service, ServiceStartType& type) override;
    Status SetStartType(const std::string& service, ServiceStartType type) override;

private:
    struct Entry
    {
        ServiceRunState state = ServiceRunState::Stopped;
        ServiceStartType startType = ServiceStartType::Manual;
        Status failure;
        std::chrono::milliseconds delay{0};
    };

    // Applies injected delay/failure, then locks and looks the service up
    Status Enter(const std::string& service, Entry*& entry, std::unique_lock<std::mutex>& lock);

    mutable std::mutex m_mutex;
    std::map<std::string, Entry> m_services;   // lowercase name
    size_t m_changes = 0;
};

class MemoryPowerSchemeControl : public PowerSchemeControl
{
public:
    explicit MemoryPowerSchemeControl(std::string activeScheme = "");

    void Fail(const Status& status);
    void SetDelay(std::chrono::milliseconds delay);
    std::string Active() const;

    Status GetActiveScheme(std::string& schemeId) override;
    Status SetActiveScheme(const std::string& schemeId) override;

private:
    void Wait() const;

    mutable std::mutex m_mutex;
    std::string m_active;
    Status m_failure;
    std::chrono::milliseconds m_delay{0};
};

#endif // TWEAKGUARD_MEMORY_SERVICES_H
