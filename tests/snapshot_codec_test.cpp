#include "snapshot_codec.h"

#include <nlohmann/json.hpp>

#include <cassert>
#include <iostream>
#include <string>

namespace
{

using nlohmann::json;

Status Decode(const std::string& type, const json& j)
{
    ConfigValue ignored;
    return DecodeValue(type, j, ignored);
}

void TestValueEncoding()
{
    assert(EncodeValue(ConfigValue::String("0")) == json("0"));
    assert(EncodeValue(ConfigValue::Int32(-1)) == json(-1));
    assert(EncodeValue(ConfigValue::Int64(1LL << 40)) == json(1LL << 40));
    assert(EncodeValue(ConfigValue::Bytes({0x00, 0x9f})) == json("009f"));
    assert(EncodeValue(ConfigValue::Absent()).is_null());
}

void TestDecodeRejectsContradictions()
{
    assert(Decode("int32", json(3.0)).kind == ErrorKind::TypeMismatch);
    assert(Decode("int32", json(2147483648LL)).kind == ErrorKind::TypeMismatch);
    assert(Decode("int32", json(4294967295ULL)).kind == ErrorKind::TypeMismatch);
    assert(Decode("int32", json("5")).kind == ErrorKind::TypeMismatch);
    assert(Decode("int64", json(18446744073709551615ULL)).kind == ErrorKind::TypeMismatch);
    assert(Decode("int64", json(1.5)).kind == ErrorKind::TypeMismatch);
    assert(Decode("string", json(5)).kind == ErrorKind::TypeMismatch);
    assert(Decode("bytes", json("abc")).kind == ErrorKind::TypeMismatch);
    assert(Decode("bytes", json("zz")).kind == ErrorKind::TypeMismatch);
    assert(Decode("bytes", json(12)).kind == ErrorKind::TypeMismatch);
    assert(Decode("absent", json(0)).kind == ErrorKind::TypeMismatch);
    assert(Decode("dword", json(1)).kind == ErrorKind::TypeMismatch);
}

void TestDecodeAcceptsBoundaries()
{
    ConfigValue v;
    assert(DecodeValue("int32", json(-2147483648LL), v).ok());
    assert(v == ConfigValue::Int32(-2147483647 - 1));

    // An unsigned JSON integer within range is still an int32
    assert(DecodeValue("int32", json(2147483647ULL), v).ok());
    assert(v == ConfigValue::Int32(2147483647));

    assert(DecodeValue("int64", json(-1), v).ok());
    assert(v == ConfigValue::Int64(-1));

    assert(DecodeValue("bytes", json(""), v).ok());
    assert(v == ConfigValue::Bytes({}));

    assert(DecodeValue("absent", json(nullptr), v).ok());
    assert(v.IsAbsent());
}

void TestSnapshotKeepsTypeTags()
{
    Snapshot in;
    in.createdAt = "2025-06-01T12:00:00Z";
    in.Record({"HKCU\\T", "s", ConfigValue::String("text"), true});
    in.Record({"HKCU\\T", "d", ConfigValue::Int32(5), true});
    in.Record({"HKCU\\T", "q", ConfigValue::Int64(5), true});
    in.Record({"HKCU\\T", "b", ConfigValue::Bytes({1, 2, 3}), true});
    in.Record({"HKCU\\T", "gone", ConfigValue::Absent(), false});
    in.serviceStates["SysMain"] = ServiceRunState::Running;
    in.serviceStartTypes["SysMain"] = ServiceStartType::Automatic;
    in.powerPlan = "381b4222-f694-41f0-9685-ff5bb260df2e";

    const std::string text = EncodeSnapshot(in);
    json parsed = json::parse(text);
    assert(parsed["version"] == 1);
    assert(parsed["entries"]["HKCU\\T\\d"]["type"] == "int32");
    assert(parsed["entries"]["HKCU\\T\\q"]["type"] == "int64");
    assert(parsed["entries"]["HKCU\\T\\gone"]["type"] == "absent");
    assert(parsed["entries"]["HKCU\\T\\gone"]["value"].is_null());

    Snapshot out;
    assert(DecodeSnapshot(text, out).ok());
    assert(out.createdAt == in.createdAt);
    assert(out.entries.size() == 5);
    assert(out.entries["HKCU\\T\\d"].value == ConfigValue::Int32(5));
    assert(out.entries["HKCU\\T\\q"].value == ConfigValue::Int64(5));
    assert(out.entries["HKCU\\T\\b"].value == ConfigValue::Bytes({1, 2, 3}));
    assert(!out.entries["HKCU\\T\\gone"].existed);
    assert(out.serviceStates["SysMain"] == ServiceRunState::Running);
    assert(out.serviceStartTypes["SysMain"] == ServiceStartType::Automatic);
    assert(out.powerPlan == in.powerPlan);
}

void TestNativeRegistryTypeIsKept()
{
    Snapshot in;
    in.createdAt = "2025-06-01T12:00:00Z";
    // REG_EXPAND_SZ, REG_MULTI_SZ
    in.Record({"HKCU\\T", "path", ConfigValue::String("%SystemRoot%\\x").WithNativeType(2), true});
    in.Record({"HKCU\\T", "list", ConfigValue::Bytes({0x61, 0x00, 0x00, 0x00}).WithNativeType(7), true});
    in.Record({"HKCU\\T", "plain", ConfigValue::String("x"), true});

    const std::string text = EncodeSnapshot(in);
    json parsed = json::parse(text);
    assert(parsed["entries"]["HKCU\\T\\path"]["regType"] == 2);
    assert(parsed["entries"]["HKCU\\T\\list"]["regType"] == 7);
    assert(!parsed["entries"]["HKCU\\T\\plain"].contains("regType"));

    Snapshot out;
    assert(DecodeSnapshot(text, out).ok());
    assert(out.entries["HKCU\\T\\path"].value == in.entries["HKCU\\T\\path"].value);
    assert(*out.entries["HKCU\\T\\list"].value.NativeType() == 7);
    assert(!out.entries["HKCU\\T\\plain"].value.NativeType());

    Snapshot s;
    assert(DecodeSnapshot(R"({"createdAt": "x", "entries": {"HKCU\\A\\v":
        {"path": "HKCU\\A", "name": "v", "type": "int32", "value": 5, "existed": true, "regType": 4}}})", s).kind
           == ErrorKind::TypeMismatch);
    assert(DecodeSnapshot(R"({"createdAt": "x", "entries": {"HKCU\\A\\v":
        {"path": "HKCU\\A", "name": "v", "type": "string", "value": "a", "existed": true, "regType": -1}}})", s).kind
           == ErrorKind::TypeMismatch);
    assert(DecodeSnapshot(R"({"createdAt": "x", "entries": {"HKCU\\A\\v":
        {"path": "HKCU\\A", "name": "v", "type": "string", "value": "a", "existed": true, "regType": "2"}}})", s).kind
           == ErrorKind::TypeMismatch);
}

void TestMalformedSnapshots()
{
    Snapshot s;
    assert(DecodeSnapshot("", s).kind == ErrorKind::Corrupt);
    assert(DecodeSnapshot("{\"createdAt\": \"2025", s).kind == ErrorKind::Corrupt);
    assert(DecodeSnapshot("[]", s).kind == ErrorKind::Corrupt);
    assert(DecodeSnapshot("{}", s).kind == ErrorKind::Corrupt);
    assert(DecodeSnapshot(R"({"version": 99, "createdAt": "x"})", s).kind == ErrorKind::Corrupt);
    assert(DecodeSnapshot(R"({"createdAt": "x", "entries": []})", s).kind == ErrorKind::Corrupt);
    assert(DecodeSnapshot(R"({"createdAt": "x", "services": {"SysMain": "paused"}})", s).kind == ErrorKind::Corrupt);

    // Existed without a value
    assert(DecodeSnapshot(R"({"createdAt": "x", "entries": {"HKCU\\A\\v":
        {"path": "HKCU\\A", "name": "v", "type": "absent", "value": null, "existed": true}}})", s).kind
           == ErrorKind::Corrupt);

    // Declared int32, stored as a string
    assert(DecodeSnapshot(R"({"createdAt": "x", "entries": {"HKCU\\A\\v":
        {"path": "HKCU\\A", "name": "v", "type": "int32", "value": "5", "existed": true}}})", s).kind
           == ErrorKind::TypeMismatch);
}

void TestAbsentEntryValueIsDropped()
{
    Snapshot s;
    assert(DecodeSnapshot(R"({"createdAt": "x", "entries": {"HKCU\\A\\v":
        {"path": "HKCU\\A", "name": "v", "type": "string", "value": "left over", "existed": false}}})", s).ok());
    assert(!s.entries["HKCU\\A\\v"].existed);
    assert(s.entries["HKCU\\A\\v"].value.IsAbsent());
}

void TestMinimalFileWithoutOptionalFields()
{
    Snapshot s;
    assert(DecodeSnapshot(R"({"createdAt": "2024-01-01T00:00:00Z", "entries": {}, "services": {}, "powerPlan": ""})", s).ok());
    assert(s.Empty());
    assert(s.serviceStartTypes.empty());
}

} // namespace

int main()
{
    TestValueEncoding();
    TestDecodeRejectsContradictions();
    TestDecodeAcceptsBoundaries();
    TestSnapshotKeepsTypeTags();
    TestNativeRegistryTypeIsKept();
    TestMalformedSnapshots();
    TestAbsentEntryValueIsDropped();
    TestMinimalFileWithoutOptionalFields();

    std::cout << "snapshot_codec_test: pass\n";
    return 0;
}
