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

#include "types.h"
#include "logger.h"

const char* ErrorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:             return "ok";
    case ErrorKind::NotFound:         return "not found";
    case ErrorKind::PermissionDenied: return "permission denied";
    case ErrorKind::Corrupt:          return "corrupt";
    case ErrorKind::Timeout:          return "timeout";
    case ErrorKind::TypeMismatch:     return "type mismatch";
    case ErrorKind::InvalidArgument:  return "invalid argument";
    case ErrorKind::Cancelled:        return "cancelled";
    case ErrorKind::IoError:          return "i/o error";
    }
    return "unknown";
}

Status Status::Error(ErrorKind kind, std::string message)
{
    Status s;
    s.kind = kind;
    s.message = std::move(message);
    return s;
}

std::string Status::ToString() const
{
    if (ok()) return "ok";
    if (message.empty()) return ErrorKindName(kind);
    return std::string(ErrorKindName(kind)) + ": " + message;
}

void AggregateError::Add(const std::string& step, const Status& status)
{
    if (status.ok()) return;
    m_errors.push_back({step, status});
}

void AggregateError::Merge(const AggregateError& other)
{
    m_errors.insert(m_errors.end(), other.m_errors.begin(), other.m_errors.end());
}

bool AggregateError::Contains(ErrorKind kind) const
{
    for (const auto& e : m_errors)
    {
        if (e.status.kind == kind) return true;
    }
    return false;
}

bool AggregateError::ContainsStep(const std::string& step) const
{
    for (const auto& e : m_errors)
    {
        if (e.step == step) return true;
    }
    return false;
}

std::string AggregateError::ToString() const
{
    std::string out;
    for (const auto& e : m_errors)
    {
        if (!out.empty()) out += "\n";
        out += e.step + ": " + e.status.ToString();
    }
    return out;
}

const char* SessionStateName(SessionState state)
{
    switch (state)
    {
    case SessionState::Idle:      return "idle";
    case SessionState::Capturing: return "capturing";
    case SessionState::Mutating:  return "mutating";
    case SessionState::Applied:   return "applied";
    case SessionState::Restoring: return "restoring";
    }
    return "unknown";
}

static bool IsLegalTransition(SessionState from, SessionState to)
{
    switch (from)
    {
    case SessionState::Idle:
        return to == SessionState::Capturing || to == SessionState::Restoring;
    case SessionState::Capturing:
        // Back to Idle/Applied when the snapshot could not be persisted
        return to == SessionState::Mutating || to == SessionState::Idle ||
               to == SessionState::Applied;
    case SessionState::Mutating:
        return to == SessionState::Applied;
    case SessionState::Applied:
        return to == SessionState::Capturing || to == SessionState::Restoring;
    case SessionState::Restoring:
        return to == SessionState::Idle;
    }
    return false;
}

bool SessionStateMachine::Transition(SessionState next)
{
    SessionState current = m_state.load(std::memory_order_acquire);
    if (!IsLegalTransition(current, next))
    {
        Log(std::string("[SESSION] Illegal transition ") + SessionStateName(current) +
            " -> " + SessionStateName(next));
        return false;
    }
    m_state.store(next, std::memory_order_release);
    return true;
}
