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

#ifndef TWEAKGUARD_TYPES_H
#define TWEAKGUARD_TYPES_H

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

// --------------------------------------------------------------------------
// ERROR TAXONOMY
// --------------------------------------------------------------------------

enum class ErrorKind
{
    None,
    NotFound,          // Coordinate absent (expected, not user-facing)
    PermissionDenied,  // Needs elevation (user-actionable)
    Corrupt,           // Snapshot file unreadable or malformed
    Timeout,           // External control surface did not answer in time
    TypeMismatch,      // Declared type tag contradicts decoded shape
    InvalidArgument,
    Cancelled,
    IoError
};

const char* ErrorKindName(ErrorKind kind);

// Result of a single backend or engine step.
struct Status
{
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    static Status Ok() { return Status(); }
    static Status Error(ErrorKind kind, std::string message);

    std::string ToString() const;
};

struct StepError
{
    std::string step;   // Coordinate key, "service:<name>" or "power"
    Status status;
};

// Per-step failures collected without aborting the surrounding batch.
class AggregateError
{
public:
    // Ignores successful statuses so callers can pass every result through.
    void Add(const std::string& step, const Status& status);
    void Merge(const AggregateError& other);

    bool Empty() const { return m_errors.empty(); }
    size_t Count() const { return m_errors.size(); }
    bool Contains(ErrorKind kind) const;
    bool ContainsStep(const std::string& step) const;

    const std::vector<StepError>& Errors() const { return m_errors; }

    // One "<step>: <kind>: <message>" line per failure.
    std::string ToString() const;

private:
    std::vector<StepError> m_errors;
};

// --------------------------------------------------------------------------
// SESSION STATE
// --------------------------------------------------------------------------

// Idle -> Capturing -> Mutating -> Applied -> Restoring -> Idle
enum class SessionState
{
    Idle,
    Capturing,
    Mutating,
    Applied,
    Restoring
};

const char* SessionStateName(SessionState state);

class SessionStateMachine
{
public:
    SessionState Current() const { return m_state.load(std::memory_order_acquire); }

    // Returns false (and leaves the state alone) for an illegal transition.
    bool Transition(SessionState next);

private:
    std::atomic<SessionState> m_state{SessionState::Idle};
};

// Cooperative cancellation. Honoured before the next pending mutation only.
class CancellationToken
{
public:
    void Cancel() { m_cancelled.store(true, std::memory_order_release); }
    void Reset() { m_cancelled.store(false, std::memory_order_release); }
    bool IsCancelled() const { return m_cancelled.load(std::memory_order_acquire); }

private:
    std::atomic<bool> m_cancelled{false};
};

#endif // TWEAKGUARD_TYPES_H
