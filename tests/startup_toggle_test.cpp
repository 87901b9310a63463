#include "constants.h"
#include "memory_config_store.h"
#include "startup_toggle.h"
#include "test_support.h"

#include <cassert>
#include <fstream>
#include <iostream>

namespace
{

const std::string USER_SIDE_KEY = std::string(RUN_KEY_USER) + "\\" + DISABLED_SUBKEY;

const StartupItem* FindItem(const std::vector<StartupItem>& items, const std::string& name)
{
    for (const auto& item : items)
    {
        if (item.name == name) return &item;
    }
    return nullptr;
}

void Touch(const std::filesystem::path& p)
{
    std::ofstream f(p);
    f << "shortcut";
}

void TestListsAllSources()
{
    auto store = std::make_shared<MemoryConfigStore>();
    test::TempDir dir("startup_list");
    assert(store->Write(RUN_KEY_USER, "Discord", ConfigValue::String("\"C:\\Apps\\Discord.exe\" --min")).ok());
    assert(store->Write(USER_SIDE_KEY, "OneDrive", ConfigValue::String("C:\\Apps\\OneDrive.exe /background")).ok());
    assert(store->Write(RUN_KEY_MACHINE, "Tray", ConfigValue::String("C:\\nowhere\\tray.exe")).ok());
    assert(store->Write(RUN_KEY_USER, "Flags", ConfigValue::Int32(1)).ok());
    Touch(dir.Path() / "notes.lnk");
    Touch(dir.Path() / "old.lnk.disabled");

    StartupManager startup(store, dir.Path());
    AggregateError warnings;
    std::vector<StartupItem> items = startup.ListItems(&warnings);
    assert(warnings.Empty());
    assert(items.size() == 5);

    const StartupItem* discord = FindItem(items, "Discord");
    assert(discord && discord->enabled && discord->location == StartupLocation::RegistryUser);
    assert(discord->impact == "medium");

    const StartupItem* onedrive = FindItem(items, "OneDrive");
    assert(onedrive && !onedrive->enabled && onedrive->impact == "high");

    const StartupItem* tray = FindItem(items, "Tray");
    assert(tray && tray->location == StartupLocation::RegistryMachine && tray->impact == "unknown");

    const StartupItem* old = FindItem(items, "old.lnk");
    assert(old && !old->enabled && old->location == StartupLocation::StartupFolder);
    assert(FindItem(items, "notes.lnk")->enabled);

    // Non-string Run values are not startup commands
    assert(!FindItem(items, "Flags"));
}

void TestRegistryToggleMovesValue()
{
    auto store = std::make_shared<MemoryConfigStore>();
    test::TempDir dir("startup_reg");
    const ConfigValue command = ConfigValue::String("C:\\Apps\\Spotify.exe /minimized");
    assert(store->Write(RUN_KEY_USER, "Spotify", command).ok());

    StartupManager startup(store, dir.Path());
    assert(startup.SetEnabled("spotify", false).ok());
    assert(!store->Read(RUN_KEY_USER, "Spotify").existed);
    ReadResult parked = store->Read(USER_SIDE_KEY, "Spotify");
    assert(parked.existed && parked.value == command);

    // Already disabled
    const size_t mutations = store->MutationCount();
    StartupItem item{"Spotify", "", StartupLocation::RegistryUser, true, ""};
    assert(startup.Disable(item).ok());
    assert(store->MutationCount() == mutations);

    assert(startup.SetEnabled("Spotify", true).ok());
    assert(store->Read(RUN_KEY_USER, "Spotify").value == command);
    assert(!store->Read(USER_SIDE_KEY, "Spotify").existed);

    assert(startup.SetEnabled("Missing", false).kind == ErrorKind::NotFound);
}

void TestToggleKeepsNativeType()
{
    auto store = std::make_shared<MemoryConfigStore>();
    test::TempDir dir("startup_native");
    // REG_EXPAND_SZ
    const ConfigValue command = ConfigValue::String("%ProgramFiles%\Sync\sync.exe").WithNativeType(2);
    assert(store->Write(RUN_KEY_USER, "Sync", command).ok());

    StartupManager startup(store, dir.Path());
    assert(startup.SetEnabled("Sync", false).ok());
    ReadResult parked = store->Read(USER_SIDE_KEY, "Sync");
    assert(parked.existed && parked.value == command);
    assert(parked.value.NativeType() && *parked.value.NativeType() == 2);

    assert(startup.SetEnabled("Sync", true).ok());
    ReadResult back = store->Read(RUN_KEY_USER, "Sync");
    assert(back.value == command);
    assert(back.value != ConfigValue::String("%ProgramFiles%\Sync\sync.exe"));
}

void TestCollisionLeavesBothCopies()
{
    auto store = std::make_shared<MemoryConfigStore>();
    test::TempDir dir("startup_collision");
    const ConfigValue active = ConfigValue::String("C:\Apps\Slack.exe --startup");
    const ConfigValue parkedEarlier = ConfigValue::String("C:\Old\Slack.exe");
    assert(store->Write(RUN_KEY_USER, "Slack", active).ok());
    assert(store->Write(USER_SIDE_KEY, "Slack", parkedEarlier).ok());
    const size_t mutations = store->MutationCount();

    StartupManager startup(store, dir.Path());
    StartupItem item{"Slack", "", StartupLocation::RegistryUser, true, ""};
    assert(startup.Disable(item).kind == ErrorKind::InvalidArgument);
    assert(startup.Enable(item).kind == ErrorKind::InvalidArgument);
    assert(store->MutationCount() == mutations);
    assert(store->Read(RUN_KEY_USER, "Slack").value == active);
    assert(store->Read(USER_SIDE_KEY, "Slack").value == parkedEarlier);

    Touch(dir.Path() / "tool.lnk");
    Touch(dir.Path() / "tool.lnk.disabled");
    StartupItem file{"tool.lnk", "", StartupLocation::StartupFolder, true, ""};
    assert(startup.Disable(file).kind == ErrorKind::InvalidArgument);
    assert(std::filesystem::exists(dir.Path() / "tool.lnk"));
    assert(std::filesystem::exists(dir.Path() / "tool.lnk.disabled"));
}

void TestProtectedRunKeyStaysEnabled()
{
    auto store = std::make_shared<MemoryConfigStore>();
    test::TempDir dir("startup_denied");
    assert(store->Write(RUN_KEY_MACHINE, "Agent", ConfigValue::String("C:\\agent.exe")).ok());
    store->Protect(RUN_KEY_MACHINE);

    StartupManager startup(store, dir.Path());
    assert(startup.SetEnabled("Agent", false).kind == ErrorKind::PermissionDenied);
    assert(store->Read(RUN_KEY_MACHINE, "Agent").existed);
}

void TestFolderToggleRenames()
{
    auto store = std::make_shared<MemoryConfigStore>();
    test::TempDir dir("startup_folder");
    Touch(dir.Path() / "notes.lnk");

    StartupManager startup(store, dir.Path());
    assert(startup.SetEnabled("notes.lnk", false).ok());
    assert(!std::filesystem::exists(dir.Path() / "notes.lnk"));
    assert(std::filesystem::exists(dir.Path() / "notes.lnk.disabled"));

    StartupItem item{"notes.lnk", "", StartupLocation::StartupFolder, false, ""};
    assert(startup.Disable(item).ok());
    assert(startup.Enable(item).ok());
    assert(std::filesystem::exists(dir.Path() / "notes.lnk"));
    assert(!std::filesystem::exists(dir.Path() / "notes.lnk.disabled"));

    StartupItem ghost{"ghost.lnk", "", StartupLocation::StartupFolder, true, ""};
    assert(startup.Disable(ghost).kind == ErrorKind::NotFound);
}

void TestBulkToggleAggregates()
{
    auto store = std::make_shared<MemoryConfigStore>();
    test::TempDir dir("startup_bulk");
    assert(store->Write(RUN_KEY_USER, "A", ConfigValue::String("a.exe")).ok());
    assert(store->Write(RUN_KEY_MACHINE, "B", ConfigValue::String("b.exe")).ok());
    Touch(dir.Path() / "c.lnk");
    store->Protect(RUN_KEY_MACHINE);

    StartupManager startup(store, dir.Path());
    std::vector<StartupItem> items = startup.ListItems();
    assert(items.size() == 3);

    AggregateError errors = startup.DisableAll(items);
    assert(errors.Count() == 1);
    assert(errors.ContainsStep("registry_hklm:B"));

    for (const auto& item : startup.ListItems())
        assert(item.enabled == (item.name == "B"));

    assert(startup.EnableAll(startup.ListItems()).Empty());
    assert(store->Read(RUN_KEY_USER, "A").existed);
    assert(std::filesystem::exists(dir.Path() / "c.lnk"));
}

void TestMissingSourcesAreSkipped()
{
    auto store = std::make_shared<MemoryConfigStore>();
    StartupManager startup(store, std::filesystem::temp_directory_path() / "tweakguard_no_such_startup_dir");
    AggregateError warnings;
    assert(startup.ListItems(&warnings).empty());
    assert(warnings.Empty());
}

void TestImpactEstimate()
{
    assert(StartupManager::EstimateImpact("") == "unknown");
    assert(StartupManager::EstimateImpact("\"C:\\Program Files\\Teams\\Teams.exe\" --system") == "high");
    assert(StartupManager::EstimateImpact("C:\\Tools\\Steam.exe -silent") == "medium");

    test::TempDir dir("impact");
    const std::filesystem::path big = dir.Path() / "bigapp.exe";
    Touch(big);
    std::filesystem::resize_file(big, 20 * 1024 * 1024);
    assert(StartupManager::EstimateImpact(big.string()) == "medium");

    const std::filesystem::path small = dir.Path() / "tiny.exe";
    Touch(small);
    assert(StartupManager::EstimateImpact("\"" + small.string() + "\" /quiet") == "low");
}

} // namespace

int main()
{
    TestListsAllSources();
    TestRegistryToggleMovesValue();
    TestToggleKeepsNativeType();
    TestCollisionLeavesBothCopies();
    TestProtectedRunKeyStaysEnabled();
    TestFolderToggleRenames();
    TestBulkToggleAggregates();
    TestMissingSourcesAreSkipped();
    TestImpactEstimate();

    std::cout << "startup_toggle_test: pass\n";
    return 0;
}
