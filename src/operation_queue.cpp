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

#include "operation_queue.h"
#include "logger.h"
#include <exception>
#include <string>

void OperationQueue::Start()
{
    std::lock_guard lock(m_mtx);
    if (m_phase != Phase::Idle) return;
    m_phase = Phase::Running;
    m_thread = std::thread(&OperationQueue::Drain, this);
}

void OperationQueue::Shutdown()
{
    {
        std::lock_guard lock(m_mtx);
        if (m_phase == Phase::Running) m_phase = Phase::Draining;
        else if (m_phase == Phase::Idle) m_phase = Phase::Stopped;
    }
    m_wake.notify_all();
    if (m_thread.joinable()) m_thread.join();
}

bool OperationQueue::Post(std::function<void()> op)
{
    {
        std::lock_guard lock(m_mtx);
        if (m_phase != Phase::Running) return false;
        m_ops.push_back(std::move(op));
    }
    m_wake.notify_one();
    return true;
}

size_t OperationQueue::Queued() const
{
    std::lock_guard lock(m_mtx);
    return m_ops.size();
}

void OperationQueue::Drain()
{
    std::unique_lock lock(m_mtx);
    for (;;)
    {
        m_wake.wait(lock, [this] { return !m_ops.empty() || m_phase != Phase::Running; });
        if (m_ops.empty())
        {
            m_phase = Phase::Stopped;
            return;
        }

        std::function<void()> op = std::move(m_ops.front());
        m_ops.pop_front();
        lock.unlock();

        // Submit() wraps its work in a packaged_task, so only Post() callers land here
        try
        {
            op();
        }
        catch (const std::exception& e)
        {
            Log(std::string("[QUEUE] Operation failed: ") + e.what());
        }

        lock.lock();
    }
}
