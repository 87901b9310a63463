#ifndef TWEAKGUARD_TEST_SUPPORT_H
#define TWEAKGUARD_TEST_SUPPORT_H

#include "config.h"
#include "constants.h"
#include "memory_config_store.h"
#include "memory_services.h"
#include "tweak_catalog.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace test
{

// Fresh directory under the system temp dir, removed on destruction
class TempDir
{
public:
    explicit TempDir(const std::string& tag)
    {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() /
                 ("tweakguard_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

// In-memory registry, services and power plan
struct Machine
{
    std::shared_ptr<MemoryConfigStore> store = std::make_shared<MemoryConfigStore>();
    std::shared_ptr<MemoryServiceControl> services = std::make_shared<MemoryServiceControl>();
    std::shared_ptr<MemoryPowerSchemeControl> power = std::make_shared<MemoryPowerSchemeControl>();
};

inline AppConfig FastConfig()
{
    AppConfig cfg;
    cfg.serviceTimeoutMs = 2000;
    cfg.powerTimeoutMs = 2000;
    return cfg;
}

static constexpr char IFACES[] = "HKLM\\SYSTEM\\CurrentControlSet\\Services\\Tcpip\\Parameters\\Interfaces";

inline Mutation Set(const std::string& path, const std::string& name, ConfigValue value)
{
    return Mutation{Coordinate{path, name}, std::move(value), false};
}

// Small catalog with one tweak per engine feature
inline TweakCatalog SampleCatalog()
{
    std::vector<TweakDefinition> tweaks;
    tweaks.push_back({"three_values", "Three Values", "", "test",
                      {Set("HKCU\\Test", "a", ConfigValue::Int32(1)),
                       Set("HKLM\\SOFTWARE\\Locked", "b", ConfigValue::Int32(1)),
                       Set("HKCU\\Test", "c", ConfigValue::Int32(1))}, {}, ""});
    tweaks.push_back({"x_to_one", "X to 1", "", "test",
                      {Set("HKCU\\Shared", "x", ConfigValue::Int32(1))}, {}, ""});
    tweaks.push_back({"x_to_two", "X to 2", "", "test",
                      {Set("HKCU\\Shared", "x", ConfigValue::Int32(2))}, {}, ""});
    tweaks.push_back({"every_kind", "Every Kind", "", "test",
                      {Set("HKCU\\Kinds", "s", ConfigValue::String("tweaked")),
                       Set("HKCU\\Kinds", "d", ConfigValue::Int32(99)),
                       Set("HKCU\\Kinds", "q", ConfigValue::Int32(99)),
                       Set("HKCU\\Kinds", "b", ConfigValue::String("not bytes")),
                       Set("HKCU\\Kinds", "new", ConfigValue::Int64(1))}, {}, ""});
    tweaks.push_back({"nagle", "Nagle", "", "network",
                      {Mutation{Coordinate{IFACES, "TcpAckFrequency"}, ConfigValue::Int32(1), true}}, {}, ""});
    tweaks.push_back({"drop_value", "Drop Value", "", "test",
                      {Set("HKCU\\Test", "legacy", ConfigValue::Absent())}, {}, ""});
    tweaks.push_back({"perf_services", "Performance Services", "", "system",
                      {}, {{"SysMain", ServiceRunState::Stopped}}, POWER_SCHEME_ULTIMATE});

    std::vector<GameProfile> profiles = {
        {"both_x", "Both X", "", {"x_to_one", "x_to_two"}},
    };
    return TweakCatalog("sample", std::move(tweaks), std::move(profiles));
}

} // namespace test

#endif // TWEAKGUARD_TEST_SUPPORT_H
