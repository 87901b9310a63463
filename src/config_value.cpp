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

#include "config_value.h"
#include "utils.h"

const char* ValueKindName(ValueKind kind)
{
    switch (kind)
    {
    case ValueKind::Absent: return "absent";
    case ValueKind::String: return "string";
    case ValueKind::Int32:  return "int32";
    case ValueKind::Int64:  return "int64";
    case ValueKind::Bytes:  return "bytes";
    }
    return "absent";
}

bool ParseValueKind(const std::string& name, ValueKind& kind)
{
    if (name == "absent")      kind = ValueKind::Absent;
    else if (name == "string") kind = ValueKind::String;
    else if (name == "int32")  kind = ValueKind::Int32;
    else if (name == "int64")  kind = ValueKind::Int64;
    else if (name == "bytes")  kind = ValueKind::Bytes;
    else return false;
    return true;
}

ConfigValue ConfigValue::String(std::string value)
{
    ConfigValue v;
    v.m_data = std::move(value);
    return v;
}

ConfigValue ConfigValue::Int32(int32_t value)
{
    ConfigValue v;
    v.m_data = value;
    return v;
}

ConfigValue ConfigValue::Int64(int64_t value)
{
    ConfigValue v;
    v.m_data = value;
    return v;
}

ConfigValue ConfigValue::Bytes(std::vector<uint8_t> value)
{
    ConfigValue v;
    v.m_data = std::move(value);
    return v;
}

ConfigValue ConfigValue::WithNativeType(uint32_t type) const
{
    ConfigValue v = *this;
    v.m_nativeType = type;
    return v;
}

std::string ConfigValue::ToDisplayString() const
{
    std::string text;
    switch (Kind())
    {
    case ValueKind::Absent: return "absent";
    case ValueKind::String: text = "string:\"" + AsString() + "\""; break;
    case ValueKind::Int32:  text = "int32:" + std::to_string(AsInt32()); break;
    case ValueKind::Int64:  text = "int64:" + std::to_string(AsInt64()); break;
    case ValueKind::Bytes:  text = "bytes:" + BytesToHex(AsBytes()); break;
    }
    if (m_nativeType) text += " (native type " + std::to_string(*m_nativeType) + ")";
    return text;
}
