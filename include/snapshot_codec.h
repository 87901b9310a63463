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

#ifndef TWEAKGUARD_SNAPSHOT_CODEC_H
#define TWEAKGUARD_SNAPSHOT_CODEC_H

#include "snapshot.h"
#include <nlohmann/json.hpp>
#include <string>

// Snapshot file layout:
// {
//   "version": 1,
//   "createdAt": "2025-06-01T12:00:00Z",
//   "entries": { "HKCU\\Control Panel\\Mouse\\MouseSpeed":
//                { "path": ..., "name": ..., "type": "string", "value": "1", "existed": true,
//                  "regType": 2 } },
//   "services": { "SysMain": "running" },
//   "serviceStartTypes": { "SysMain": "auto" },
//   "powerPlan": "381b4222-f694-41f0-9685-ff5bb260df2e"
// }
// "type" is authoritative: a value whose JSON shape contradicts it is
// rejected with TypeMismatch, never coerced. The optional "regType" keeps
// the native registry type of a string or bytes value (REG_EXPAND_SZ,
// REG_MULTI_SZ, ...) so restore writes it back unchanged.

nlohmann::json EncodeValue(const ConfigValue& value);
Status DecodeValue(const std::string& type, const nlohmann::json& j, ConfigValue& value);

// Pretty-printed, 2-space indent
std::string EncodeSnapshot(const Snapshot& snapshot);

// Corrupt for unparseable or structurally malformed input, TypeMismatch for
// a value that contradicts its declared type.
Status DecodeSnapshot(const std::string& text, Snapshot& snapshot);

#endif // TWEAKGUARD_SNAPSHOT_CODEC_H
