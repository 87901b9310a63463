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

#ifdef _WIN32

#include "registry_store.h"
#include "logger.h"
#include <cstring>

static HKEY RootHandle(const std::string& root)
{
    if (root == "HKLM") return HKEY_LOCAL_MACHINE;
    if (root == "HKCU") return HKEY_CURRENT_USER;
    if (root == "HKCR") return HKEY_CLASSES_ROOT;
    if (root == "HKU")  return HKEY_USERS;
    if (root == "HKCC") return HKEY_CURRENT_CONFIG;
    return nullptr;
}

static Status FromWin32(LONG rc, const std::string& what)
{
    switch (rc)
    {
    case ERROR_SUCCESS:
        return Status::Ok();
    case ERROR_FILE_NOT_FOUND:
    case ERROR_PATH_NOT_FOUND:
        return Status::Error(ErrorKind::NotFound, what + ": not found");
    case ERROR_ACCESS_DENIED:
        return Status::Error(ErrorKind::PermissionDenied, what + ": access denied (run as administrator)");
    default:
        return Status::Error(ErrorKind::IoError, what + ": error " + std::to_string(rc));
    }
}

Status RegistryConfigStore::OpenKey(const std::string& path, REGSAM access, bool create, UniqueRegKey& key)
{
    std::string root, sub;
    Status s = SplitRootPath(path, root, sub);
    if (!s.ok()) return s;

    HKEY rawKey = nullptr;
    std::wstring wsub = Utf8ToWide(sub);
    LONG rc;
    if (create)
    {
        rc = RegCreateKeyExW(RootHandle(root), wsub.c_str(), 0, nullptr, REG_OPTION_NON_VOLATILE,
                             access | KEY_WOW64_64KEY, nullptr, &rawKey, nullptr);
    }
    else
    {
        rc = RegOpenKeyExW(RootHandle(root), wsub.c_str(), 0, access | KEY_WOW64_64KEY, &rawKey);
    }

    // RAII wrapper takes ownership immediately
    key.reset(rawKey);
    return FromWin32(rc, path);
}

ReadResult RegistryConfigStore::Read(const std::string& path, const std::string& name)
{
    ReadResult result;
    UniqueRegKey key;
    Status s = OpenKey(path, KEY_QUERY_VALUE, false, key);
    if (s.kind == ErrorKind::NotFound) return result;
    if (!s.ok())
    {
        result.status = s;
        return result;
    }

    std::wstring wname = Utf8ToWide(name);
    DWORD type = 0;
    DWORD size = 0;
    LONG rc = RegQueryValueExW(key.get(), wname.c_str(), nullptr, &type, nullptr, &size);
    if (rc == ERROR_FILE_NOT_FOUND) return result;

    std::vector<BYTE> data;
    // The value can grow between the size query and the read
    while (rc == ERROR_SUCCESS || rc == ERROR_MORE_DATA)
    {
        data.resize(size + sizeof(wchar_t));
        DWORD got = size;
        rc = RegQueryValueExW(key.get(), wname.c_str(), nullptr, &type, data.data(), &got);
        if (rc == ERROR_SUCCESS)
        {
            size = got;
            break;
        }
        if (rc != ERROR_MORE_DATA) break;
        size = got;
    }

    if (rc == ERROR_FILE_NOT_FOUND) return result;
    if (rc != ERROR_SUCCESS)
    {
        result.status = FromWin32(rc, path + "\\" + name);
        return result;
    }

    switch (type)
    {
    case REG_SZ:
    case REG_EXPAND_SZ:
    {
        // Registry strings are not guaranteed to be terminated
        std::wstring text(reinterpret_cast<const wchar_t*>(data.data()), size / sizeof(wchar_t));
        while (!text.empty() && text.back() == L'\0') text.pop_back();
        result.value = ConfigValue::String(WideToUtf8(text.c_str()));
        if (type == REG_EXPAND_SZ) result.value = result.value.WithNativeType(REG_EXPAND_SZ);
        break;
    }
    case REG_DWORD:
        if (size != sizeof(DWORD))
        {
            result.status = Status::Error(ErrorKind::TypeMismatch, path + "\\" + name + ": malformed REG_DWORD");
            return result;
        }
        {
            int32_t v = 0;
            std::memcpy(&v, data.data(), sizeof(v));
            result.value = ConfigValue::Int32(v);
        }
        break;
    case REG_QWORD:
        if (size != sizeof(int64_t))
        {
            result.status = Status::Error(ErrorKind::TypeMismatch, path + "\\" + name + ": malformed REG_QWORD");
            return result;
        }
        {
            int64_t v = 0;
            std::memcpy(&v, data.data(), sizeof(v));
            result.value = ConfigValue::Int64(v);
        }
        break;
    default:
        // REG_MULTI_SZ, REG_NONE, REG_DWORD_BIG_ENDIAN, ... keep their type on write-back
        result.value = ConfigValue::Bytes(std::vector<uint8_t>(data.begin(), data.begin() + size));
        if (type != REG_BINARY) result.value = result.value.WithNativeType(type);
        break;
    }

    result.existed = true;
    return result;
}

Status RegistryConfigStore::Write(const std::string& path, const std::string& name, const ConfigValue& value)
{
    if (value.IsAbsent())
    {
        return Status::Error(ErrorKind::InvalidArgument, "cannot write an absent value to " + path + "\\" + name);
    }

    UniqueRegKey key;
    Status s = OpenKey(path, KEY_SET_VALUE, true, key);
    if (!s.ok()) return s;

    std::wstring wname = Utf8ToWide(name);
    LONG rc = ERROR_SUCCESS;
    switch (value.Kind())
    {
    case ValueKind::String:
    {
        std::wstring text = Utf8ToWide(value.AsString());
        DWORD type = (value.NativeType() && *value.NativeType() == REG_EXPAND_SZ) ? REG_EXPAND_SZ : REG_SZ;
        rc = RegSetValueExW(key.get(), wname.c_str(), 0, type,
                            reinterpret_cast<const BYTE*>(text.c_str()),
                            static_cast<DWORD>((text.size() + 1) * sizeof(wchar_t)));
        break;
    }
    case ValueKind::Int32:
    {
        DWORD v = static_cast<DWORD>(value.AsInt32());
        rc = RegSetValueExW(key.get(), wname.c_str(), 0, REG_DWORD,
                            reinterpret_cast<const BYTE*>(&v), sizeof(v));
        break;
    }
    case ValueKind::Int64:
    {
        int64_t v = value.AsInt64();
        rc = RegSetValueExW(key.get(), wname.c_str(), 0, REG_QWORD,
                            reinterpret_cast<const BYTE*>(&v), sizeof(v));
        break;
    }
    case ValueKind::Bytes:
    {
        const std::vector<uint8_t>& bytes = value.AsBytes();
        DWORD type = value.NativeType() ? static_cast<DWORD>(*value.NativeType()) : REG_BINARY;
        rc = RegSetValueExW(key.get(), wname.c_str(), 0, type,
                            bytes.empty() ? nullptr : bytes.data(),
                            static_cast<DWORD>(bytes.size()));
        break;
    }
    case ValueKind::Absent:
        break;
    }

    return FromWin32(rc, path + "\\" + name);
}

Status RegistryConfigStore::Delete(const std::string& path, const std::string& name)
{
    UniqueRegKey key;
    Status s = OpenKey(path, KEY_SET_VALUE, false, key);
    if (s.kind == ErrorKind::NotFound) return Status::Ok();
    if (!s.ok()) return s;

    std::wstring wname = Utf8ToWide(name);
    LONG rc = RegDeleteValueW(key.get(), wname.c_str());
    if (rc == ERROR_FILE_NOT_FOUND) return Status::Ok();
    return FromWin32(rc, path + "\\" + name);
}

Status RegistryConfigStore::EnumerateChildren(const std::string& path, std::vector<std::string>& children)
{
    children.clear();
    UniqueRegKey key;
    Status s = OpenKey(path, KEY_ENUMERATE_SUB_KEYS, false, key);
    if (!s.ok()) return s;

    // Key names are limited to 255 characters
    wchar_t nameBuf[256];
    for (DWORD index = 0;; ++index)
    {
        DWORD len = 256;
        LONG rc = RegEnumKeyExW(key.get(), index, nameBuf, &len, nullptr, nullptr, nullptr, nullptr);
        if (rc == ERROR_NO_MORE_ITEMS) break;
        if (rc != ERROR_SUCCESS) return FromWin32(rc, path);
        children.push_back(WideToUtf8(nameBuf));
    }
    return Status::Ok();
}

Status RegistryConfigStore::EnumerateValues(const std::string& path, std::vector<std::string>& names)
{
    names.clear();
    UniqueRegKey key;
    Status s = OpenKey(path, KEY_QUERY_VALUE, false, key);
    if (!s.ok()) return s;

    // Value names are limited to 16383 characters
    std::vector<wchar_t> nameBuf(16384);
    for (DWORD index = 0;; ++index)
    {
        DWORD len = static_cast<DWORD>(nameBuf.size());
        LONG rc = RegEnumValueW(key.get(), index, nameBuf.data(), &len, nullptr, nullptr, nullptr, nullptr);
        if (rc == ERROR_NO_MORE_ITEMS) break;
        if (rc != ERROR_SUCCESS) return FromWin32(rc, path);
        names.push_back(WideToUtf8(nameBuf.data()));
    }
    return Status::Ok();
}

#endif // _WIN32
