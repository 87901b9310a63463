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

#include "memory_services.h"
#include "utils.h"
#include <thread>

void MemoryServiceControl::AddService(const std::string& service, ServiceRunState state,
                                      ServiceStartType startType)
{
    std::lock_guard lock(m_mutex);
    Entry& e = m_services[AsciiLowerCopy(service)];
    e.state = state;
    e.startType = startType;
}

void MemoryServiceControl::Fail(const std::string& service, const Status& status)
{
    std::lock_guard lock(m_mutex);
    m_services[AsciiLowerCopy(service)].failure = status;
}

void MemoryServiceControl::ClearFailure(const std::string& service)
{
    std::lock_guard lock(m_mutex);
    auto it = m_services.find(AsciiLowerCopy(service));
    if (it != m_services.end()) it->second.failure = Status::Ok();
}

void MemoryServiceControl::SetDelay(const std::string& service, std::chrono::milliseconds delay)
{
    std::lock_guard lock(m_mutex);
    m_services[AsciiLowerCopy(service)].delay = delay;
}

bool MemoryServiceControl::GetRunState(const std::string& service, ServiceRunState& state) const
{
    std::lock_guard lock(m_mutex);
    auto it = m_services.find(AsciiLowerCopy(service));
    if (it == m_services.end()) return false;
    state = it->second.state;
    return true;
}

bool MemoryServiceControl::GetStartType(const std::string& service, ServiceStartType& type) const
{
    std::lock_guard lock(m_mutex);
    auto it = m_services.find(AsciiLowerCopy(service));
    if (it == m_services.end()) return false;
    type = it->second.startType;
    return true;
}

size_t MemoryServiceControl::ChangeCount() const
{
    std::lock_guard lock(m_mutex);
    return m_changes;
}

Status MemoryServiceControl::Enter(const std::string& service, Entry*& entry,
                                   std::unique_lock<std::mutex>& lock)
{
    std::string key = AsciiLowerCopy(service);
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard peek(m_mutex);
        auto it = m_services.find(key);
        if (it != m_services.end()) delay = it->second.delay;
    }
    if (delay.count() > 0) std::this_thread::sleep_for(delay);

    lock = std::unique_lock<std::mutex>(m_mutex);
    auto it = m_services.find(key);
    if (it == m_services.end())
    {
        return Status::Error(ErrorKind::NotFound, "service does not exist: " + service);
    }
    if (!it->second.failure.ok()) return it->second.failure;

    entry = &it->second;
    return Status::Ok();
}

Status MemoryServiceControl::QueryRunState(const std::string& service, ServiceRunState& state)
{
    Entry* e = nullptr;
    std::unique_lock<std::mutex> lock;
    Status s = Enter(service, e, lock);
    if (!s.ok()) return s;

    state = e->state;
    return Status::Ok();
}

Status MemoryServiceControl::Start(const std::string& service)
{
    Entry* e = nullptr;
    std::unique_lock<std::mutex> lock;
    Status s = Enter(service, e, lock);
    if (!s.ok()) return s;

    if (e->startType == ServiceStartType::Disabled)
    {
        return Status::Error(ErrorKind::InvalidArgument, "service is disabled: " + service);
    }
    e->state = ServiceRunState::Running;
    ++m_changes;
    return Status::Ok();
}

Status MemoryServiceControl::Stop(const std::string& service)
{
    Entry* e = nullptr;
    std::unique_lock<std::mutex> lock;
    Status s = Enter(service, e, lock);
    if (!s.ok()) return s;

    e->state = ServiceRunState::Stopped;
    ++m_changes;
    return Status::Ok();
}

Status MemoryServiceControl::QueryStartType(const std::string& service, ServiceStartType& type)
{
    Entry* e = nullptr;
    std::unique_lock<std::mutex> lock;
    Status s = Enter(service, e, lock);
    if (!s.ok()) return s;

    type = e->startType;
    return Status::Ok();
}

Status MemoryServiceControl::SetStartType(const std::string& service, ServiceStartType type)
{
    Entry* e = nullptr;
    std::unique_lock<std::mutex> lock;
    Status s = Enter(service, e, lock);
    if (!s.ok()) return s;

    e->startType = type;
    ++m_changes;
    return Status::Ok();
}

// --------------------------------------------------------------------------

MemoryPowerSchemeControl::MemoryPowerSchemeControl(std::string activeScheme)
    : m_active(std::move(activeScheme))
{
}

void MemoryPowerSchemeControl::Fail(const Status& status)
{
    std::lock_guard lock(m_mutex);
    m_failure = status;
}

void MemoryPowerSchemeControl::SetDelay(std::chrono::milliseconds delay)
{
    std::lock_guard lock(m_mutex);
    m_delay = delay;
}

std::string MemoryPowerSchemeControl::Active() const
{
    std::lock_guard lock(m_mutex);
    return m_active;
}

void MemoryPowerSchemeControl::Wait() const
{
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard lock(m_mutex);
        delay = m_delay;
    }
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
}

Status MemoryPowerSchemeControl::GetActiveScheme(std::string& schemeId)
{
    Wait();
    std::lock_guard lock(m_mutex);
    if (!m_failure.ok()) return m_failure;
    if (m_active.empty()) return Status::Error(ErrorKind::NotFound, "no active power scheme");

    schemeId = m_active;
    return Status::Ok();
}

Status MemoryPowerSchemeControl::SetActiveScheme(const std::string& schemeId)
{
    Wait();
    std::lock_guard lock(m_mutex);
    if (!m_failure.ok()) return m_failure;

    m_active = AsciiLowerCopy(schemeId);
    return Status::Ok();
}
