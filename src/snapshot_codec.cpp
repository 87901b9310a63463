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

#include "snapshot_codec.h"
#include "constants.h"
#include "utils.h"
#include <cstdint>
#include <limits>

using json = nlohmann::json;

json EncodeValue(const ConfigValue& value)
{
    switch (value.Kind())
    {
    case ValueKind::String: return value.AsString();
    case ValueKind::Int32:  return value.AsInt32();
    case ValueKind::Int64:  return value.AsInt64();
    case ValueKind::Bytes:  return BytesToHex(value.AsBytes());
    case ValueKind::Absent: break;
    }
    return nullptr;
}

static Status Mismatch(const std::string& type, const json& j)
{
    return Status::Error(ErrorKind::TypeMismatch,
        "declared type '" + type + "' does not match value " + j.dump());
}

Status DecodeValue(const std::string& type, const json& j, ConfigValue& value)
{
    ValueKind kind;
    if (!ParseValueKind(type, kind))
    {
        return Status::Error(ErrorKind::TypeMismatch, "unknown value type '" + type + "'");
    }

    switch (kind)
    {
    case ValueKind::Absent:
        if (!j.is_null()) return Mismatch(type, j);
        value = ConfigValue::Absent();
        return Status::Ok();

    case ValueKind::String:
        if (!j.is_string()) return Mismatch(type, j);
        value = ConfigValue::String(j.get<std::string>());
        return Status::Ok();

    case ValueKind::Int32:
        // Floats are never truncated into an integer kind
        if (!j.is_number_integer()) return Mismatch(type, j);
        if (j.is_number_unsigned())
        {
            if (j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) return Mismatch(type, j);
        }
        else
        {
            int64_t v = j.get<int64_t>();
            if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) return Mismatch(type, j);
        }
        value = ConfigValue::Int32(static_cast<int32_t>(j.get<int64_t>()));
        return Status::Ok();

    case ValueKind::Int64:
        if (!j.is_number_integer()) return Mismatch(type, j);
        if (j.is_number_unsigned() &&
            j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
        {
            return Mismatch(type, j);
        }
        value = ConfigValue::Int64(j.get<int64_t>());
        return Status::Ok();

    case ValueKind::Bytes:
    {
        if (!j.is_string()) return Mismatch(type, j);
        std::vector<uint8_t> bytes;
        if (!HexToBytes(j.get<std::string>(), bytes)) return Mismatch(type, j);
        value = ConfigValue::Bytes(std::move(bytes));
        return Status::Ok();
    }
    }
    return Mismatch(type, j);
}

std::string EncodeSnapshot(const Snapshot& snapshot)
{
    json root;
    root["version"] = SNAPSHOT_FORMAT_VERSION;
    root["createdAt"] = snapshot.createdAt;

    json entries = json::object();
    for (const auto& [key, entry] : snapshot.entries)
    {
        json e;
        e["path"] = entry.path;
        e["name"] = entry.name;
        e["existed"] = entry.existed;
        if (entry.existed)
        {
            e["type"] = ValueKindName(entry.value.Kind());
            e["value"] = EncodeValue(entry.value);
            if (entry.value.NativeType()) e["regType"] = *entry.value.NativeType();
        }
        else
        {
            e["type"] = ValueKindName(ValueKind::Absent);
            e["value"] = nullptr;
        }
        entries[key] = e;
    }
    root["entries"] = entries;

    json services = json::object();
    for (const auto& [name, state] : snapshot.serviceStates)
    {
        services[name] = ServiceRunStateName(state);
    }
    root["services"] = services;

    if (!snapshot.serviceStartTypes.empty())
    {
        json startTypes = json::object();
        for (const auto& [name, type] : snapshot.serviceStartTypes)
        {
            startTypes[name] = ServiceStartTypeName(type);
        }
        root["serviceStartTypes"] = startTypes;
    }

    root["powerPlan"] = snapshot.powerPlan;
    return root.dump(2);
}

static Status Malformed(const std::string& what)
{
    return Status::Error(ErrorKind::Corrupt, "malformed snapshot: " + what);
}

static Status DecodeEntry(const std::string& key, const json& e, ConfigEntry& entry)
{
    if (!e.is_object()) return Malformed("entry " + key + " is not an object");
    if (!e.contains("path") || !e["path"].is_string()) return Malformed("entry " + key + " has no path");
    if (!e.contains("name") || !e["name"].is_string()) return Malformed("entry " + key + " has no name");
    if (!e.contains("type") || !e["type"].is_string()) return Malformed("entry " + key + " has no type");
    if (!e.contains("existed") || !e["existed"].is_boolean()) return Malformed("entry " + key + " has no existed flag");
    if (!e.contains("value")) return Malformed("entry " + key + " has no value");

    entry.path = e["path"].get<std::string>();
    entry.name = e["name"].get<std::string>();
    entry.existed = e["existed"].get<bool>();

    ConfigValue value;
    Status s = DecodeValue(e["type"].get<std::string>(), e["value"], value);
    if (!s.ok())
    {
        return Status::Error(s.kind, key + ": " + s.message);
    }

    if (entry.existed && value.IsAbsent())
    {
        return Malformed("entry " + key + " existed but carries no value");
    }

    if (e.contains("regType"))
    {
        const json& regType = e["regType"];
        if (!regType.is_number_unsigned() || regType.get<uint64_t>() > std::numeric_limits<uint32_t>::max())
        {
            return Status::Error(ErrorKind::TypeMismatch, key + ": regType " + regType.dump() + " is not a registry type");
        }
        if (value.Kind() != ValueKind::String && value.Kind() != ValueKind::Bytes)
        {
            return Status::Error(ErrorKind::TypeMismatch,
                key + ": regType is only valid for string and bytes values");
        }
        value = value.WithNativeType(static_cast<uint32_t>(regType.get<uint64_t>()));
    }

    // A value recorded for a non-existent coordinate is never restored
    entry.value = entry.existed ? value : ConfigValue::Absent();
    return Status::Ok();
}

Status DecodeSnapshot(const std::string& text, Snapshot& snapshot)
{
    json root;
    try
    {
        root = json::parse(text);
    }
    catch (const json::exception& e)
    {
        return Status::Error(ErrorKind::Corrupt, std::string("snapshot is not valid JSON: ") + e.what());
    }

    if (!root.is_object()) return Malformed("top level is not an object");

    if (root.contains("version"))
    {
        if (!root["version"].is_number_integer()) return Malformed("version is not an integer");
        if (root["version"].get<int64_t>() > SNAPSHOT_FORMAT_VERSION)
        {
            return Malformed("written by a newer format version " + root["version"].dump());
        }
    }

    Snapshot result;
    if (!root.contains("createdAt") || !root["createdAt"].is_string()) return Malformed("no createdAt");
    result.createdAt = root["createdAt"].get<std::string>();

    if (root.contains("entries"))
    {
        const json& entries = root["entries"];
        if (!entries.is_object()) return Malformed("entries is not an object");
        for (const auto& item : entries.items())
        {
            ConfigEntry entry;
            Status s = DecodeEntry(item.key(), item.value(), entry);
            if (!s.ok()) return s;
            result.Record(std::move(entry));
        }
    }

    if (root.contains("services"))
    {
        const json& services = root["services"];
        if (!services.is_object()) return Malformed("services is not an object");
        for (const auto& item : services.items())
        {
            ServiceRunState state;
            if (!item.value().is_string() || !ParseServiceRunState(item.value().get<std::string>(), state))
            {
                return Malformed("service " + item.key() + " has an unknown run state");
            }
            result.serviceStates[item.key()] = state;
        }
    }

    if (root.contains("serviceStartTypes"))
    {
        const json& startTypes = root["serviceStartTypes"];
        if (!startTypes.is_object()) return Malformed("serviceStartTypes is not an object");
        for (const auto& item : startTypes.items())
        {
            ServiceStartType type;
            if (!item.value().is_string() || !ParseServiceStartType(item.value().get<std::string>(), type))
            {
                return Malformed("service " + item.key() + " has an unknown start type");
            }
            result.serviceStartTypes[item.key()] = type;
        }
    }

    if (root.contains("powerPlan") && !root["powerPlan"].is_null())
    {
        if (!root["powerPlan"].is_string()) return Malformed("powerPlan is not a string");
        result.powerPlan = root["powerPlan"].get<std::string>();
    }

    snapshot = std::move(result);
    return Status::Ok();
}
