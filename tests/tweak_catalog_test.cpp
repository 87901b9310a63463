#include "subsystem.h"
#include "test_support.h"
#include "tweak_catalog.h"

#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>

namespace
{

template <typename Fn>
bool Throws(Fn fn)
{
    try
    {
        fn();
    }
    catch (const std::invalid_argument&)
    {
        return true;
    }
    return false;
}

TweakDefinition Simple(const std::string& id, const std::string& path = "HKCU\\T")
{
    return TweakDefinition{id, id, "", "test", {test::Set(path, "v", ConfigValue::Int32(1))}, {}, ""};
}

void TestShippedCatalogsAreConsistent()
{
    TweakCatalog gaming = TweakCatalog::Gaming();
    TweakCatalog privacy = TweakCatalog::Privacy();
    assert(gaming.Name() == "gaming");
    assert(privacy.Name() == "privacy");
    assert(gaming.Tweaks().size() == 18);
    assert(privacy.Tweaks().size() == 11);
    assert(gaming.Profiles().size() == 6);
    assert(privacy.Profiles().empty());

    // Ids never collide, not even across subsystems
    std::set<std::string> ids;
    for (const auto& t : gaming.Tweaks()) assert(ids.insert(t.id).second);
    for (const auto& t : privacy.Tweaks()) assert(ids.insert(t.id).second);

    for (const char* id : {"competitive_fps", "open_world", "moba_strategy", "racing_sim", "casual", "nuclear"})
    {
        const GameProfile* p = gaming.FindProfile(id);
        assert(p && !p->tweakIds.empty());
        for (const auto& tweakId : p->tweakIds) assert(gaming.Find(tweakId));
    }

    const TweakDefinition* nagle = gaming.Find("disable_nagle");
    assert(nagle && nagle->mutations.size() == 2 && nagle->mutations[0].fanOut);
    assert(gaming.Find("ultimate_power_plan")->powerScheme == POWER_SCHEME_ULTIMATE);
    assert(gaming.Find("disable_sysmain")->services.at(0).service == "SysMain");
    assert(privacy.Find("disable_location")->mutations.at(0).desired == ConfigValue::String("Deny"));

    assert(!gaming.Find("disable_telemetry"));
    assert(!gaming.FindProfile("speedrun"));
}

void TestConstructionRejectsBadDefinitions()
{
    assert(Throws([] { TweakCatalog("c", {Simple("a"), Simple("a")}); }));
    assert(Throws([] { TweakCatalog("c", {Simple("")}); }));
    assert(Throws([] { TweakCatalog("c", {Simple("a", "HKXX\\T")}); }));
    assert(Throws([] { TweakCatalog("c", {Simple("a")}, {{"p", "P", "", {"a", "b"}}}); }));
    assert(Throws([] { TweakCatalog("c", {Simple("a")}, {{"p", "P", "", {"a"}}, {"p", "P", "", {"a"}}}); }));
    assert(Throws([]
    {
        TweakDefinition t = Simple("a");
        t.services.push_back({"", ServiceRunState::Stopped});
        TweakCatalog("c", {t});
    }));

    assert(!Throws([] { TweakCatalog("c", {Simple("a"), Simple("b")}, {{"p", "P", "", {"b", "a"}}}); }));
}

void TestNuclearProfileRoundTrip()
{
    test::Machine m;
    test::TempDir dir("nuclear");
    const std::string mouse = "HKCU\\Control Panel\\Mouse";
    assert(m.store->Write(mouse, "MouseSpeed", ConfigValue::String("1")).ok());
    assert(m.store->Write("HKCU\\Control Panel\\Desktop", "SmoothScroll", ConfigValue::Int32(1)).ok());
    assert(m.store->CreateKey(std::string(test::IFACES) + "\\{A}").ok());
    assert(m.store->CreateKey(std::string(test::IFACES) + "\\{B}").ok());
    m.services->AddService("SysMain", ServiceRunState::Running, ServiceStartType::Automatic);
    m.services->AddService("WSearch", ServiceRunState::Running, ServiceStartType::Automatic);
    assert(m.power->SetActiveScheme(POWER_SCHEME_BALANCED).ok());

    TweakSubsystem gaming(TweakCatalog::Gaming(), dir.Path() / "gaming_snapshot.json",
                          m.store, m.services, m.power, test::FastConfig());

    ApplyReport report = gaming.ApplyGameProfile("nuclear");
    assert(report.Clean());
    assert(report.applied.size() == 18);
    assert(m.store->Read(mouse, "MouseSpeed").value == ConfigValue::String("0"));
    assert(m.store->Read(std::string(test::IFACES) + "\\{B}", "TCPNoDelay").value == ConfigValue::Int32(1));
    assert(m.power->Active() == POWER_SCHEME_ULTIMATE);

    // MouseSpeed is set by two tweaks but captured once
    Snapshot snap = gaming.Snapshots().Load().snapshot;
    assert(snap.entries[mouse + "\\MouseSpeed"].value == ConfigValue::String("1"));

    RestoreReport restored = gaming.RestoreAll();
    assert(restored.Clean());
    assert(restored.servicesRestored == 2 && restored.powerRestored);
    assert(m.store->Read(mouse, "MouseSpeed").value == ConfigValue::String("1"));
    assert(!m.store->Read(mouse, "MouseThreshold1").existed);
    assert(m.store->Read("HKCU\\Control Panel\\Desktop", "SmoothScroll").value == ConfigValue::Int32(1));
    assert(!m.store->Read(std::string(test::IFACES) + "\\{A}", "TcpAckFrequency").existed);

    ServiceRunState state;
    assert(m.services->GetRunState("WSearch", state) && state == ServiceRunState::Running);
    assert(m.power->Active() == POWER_SCHEME_BALANCED);
}

} // namespace

int main()
{
    TestShippedCatalogsAreConsistent();
    TestConstructionRejectsBadDefinitions();
    TestNuclearProfileRoundTrip();

    std::cout << "tweak_catalog_test: pass\n";
    return 0;
}
