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

#ifndef TWEAKGUARD_CONFIG_VALUE_H
#define TWEAKGUARD_CONFIG_VALUE_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Order matches the ConfigValue variant alternatives
enum class ValueKind
{
    Absent,
    String,
    Int32,
    Int64,
    Bytes
};

// Wire names: "absent", "string", "int32", "int64", "bytes"
const char* ValueKindName(ValueKind kind);
bool ParseValueKind(const std::string& name, ValueKind& kind);

// One configuration value with its type tag carried explicitly.
// A DWORD is held as Int32 and a QWORD as Int64 with the bit pattern intact.
class ConfigValue
{
public:
    ConfigValue() = default; // Absent

    static ConfigValue Absent() { return ConfigValue(); }
    static ConfigValue String(std::string value);
    static ConfigValue Int32(int32_t value);
    static ConfigValue Int64(int64_t value);
    static ConfigValue Bytes(std::vector<uint8_t> value);

    ValueKind Kind() const { return static_cast<ValueKind>(m_data.index()); }
    bool IsAbsent() const { return Kind() == ValueKind::Absent; }

    // Accessors throw std::bad_variant_access on a kind mismatch
    const std::string& AsString() const { return std::get<std::string>(m_data); }
    int32_t AsInt32() const { return std::get<int32_t>(m_data); }
    int64_t AsInt64() const { return std::get<int64_t>(m_data); }
    const std::vector<uint8_t>& AsBytes() const { return std::get<std::vector<uint8_t>>(m_data); }

    // Backend storage type (a REG_* code) when it is not the default for the
    // kind: REG_EXPAND_SZ for a String, anything but REG_BINARY for Bytes.
    // Stores that have no such notion ignore it.
    ConfigValue WithNativeType(uint32_t type) const;
    const std::optional<uint32_t>& NativeType() const { return m_nativeType; }

    // For logs only: "int32:38", "string:\"0\"", "bytes:0a0b"
    std::string ToDisplayString() const;

    bool operator==(const ConfigValue& other) const
    {
        return m_data == other.m_data && m_nativeType == other.m_nativeType;
    }
    bool operator!=(const ConfigValue& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, std::string, int32_t, int64_t, std::vector<uint8_t>> m_data;
    std::optional<uint32_t> m_nativeType;
};

#endif // TWEAKGUARD_CONFIG_VALUE_H
