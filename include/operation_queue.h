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

#ifndef TWEAKGUARD_OPERATION_QUEUE_H
#define TWEAKGUARD_OPERATION_QUEUE_H

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>

// Runs apply/restore operations one at a time on a dedicated thread, in the
// order they were posted. Two operations on one subsystem never interleave.
class OperationQueue
{
public:
    OperationQueue() = default;
    ~OperationQueue() { Shutdown(); }

    OperationQueue(const OperationQueue&)            = delete;
    OperationQueue& operator=(const OperationQueue&) = delete;

    // Spawns the thread. A second call is a no-op.
    void Start();

    // Lets queued operations finish, then joins. Later posts are refused.
    void Shutdown();

    bool Post(std::function<void()> op);

    // Posts fn and returns its eventual result. An exception escaping fn is
    // rethrown by future::get(). The future is invalid when the post was refused.
    template <typename Fn>
    std::future<std::invoke_result_t<Fn>> Submit(Fn fn)
    {
        using Result = std::invoke_result_t<Fn>;
        auto op = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        std::future<Result> result = op->get_future();
        if (!Post([op]() { (*op)(); }))
            return std::future<Result>();
        return result;
    }

    size_t Queued() const;

private:
    enum class Phase { Idle, Running, Draining, Stopped };

    void Drain();

    std::thread                        m_thread;
    mutable std::mutex                 m_mtx;
    std::condition_variable            m_wake;
    std::deque<std::function<void()>>  m_ops;
    Phase                              m_phase = Phase::Idle;
};

#endif // TWEAKGUARD_OPERATION_QUEUE_H
