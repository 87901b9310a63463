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

#include "tweak_catalog.h"
#include "constants.h"
#include <set>
#include <stdexcept>

TweakCatalog::TweakCatalog(std::string name, std::vector<TweakDefinition> tweaks,
                           std::vector<GameProfile> profiles)
    : m_name(std::move(name)), m_tweaks(std::move(tweaks)), m_profiles(std::move(profiles))
{
    std::set<std::string> ids;
    for (const auto& t : m_tweaks)
    {
        if (t.id.empty())
            throw std::invalid_argument(m_name + ": tweak with empty id");
        if (!ids.insert(t.id).second)
            throw std::invalid_argument(m_name + ": duplicate tweak id " + t.id);

        for (const auto& m : t.mutations)
        {
            std::string root, sub;
            if (!SplitRootPath(m.target.path, root, sub).ok())
                throw std::invalid_argument(m_name + ": tweak " + t.id + " has a malformed path " + m.target.path);
        }
        for (const auto& s : t.services)
        {
            if (s.service.empty())
                throw std::invalid_argument(m_name + ": tweak " + t.id + " names an empty service");
        }
    }

    std::set<std::string> profileIds;
    for (const auto& p : m_profiles)
    {
        if (!profileIds.insert(p.id).second)
            throw std::invalid_argument(m_name + ": duplicate profile id " + p.id);
        for (const auto& id : p.tweakIds)
        {
            if (!ids.count(id))
                throw std::invalid_argument(m_name + ": profile " + p.id + " names unknown tweak " + id);
        }
    }
}

const TweakDefinition* TweakCatalog::Find(const std::string& id) const
{
    for (const auto& t : m_tweaks)
    {
        if (t.id == id) return &t;
    }
    return nullptr;
}

const GameProfile* TweakCatalog::FindProfile(const std::string& id) const
{
    for (const auto& p : m_profiles)
    {
        if (p.id == id) return &p;
    }
    return nullptr;
}

// --------------------------------------------------------------------------
// BUILT-IN CATALOGS
// --------------------------------------------------------------------------

static Mutation SetString(const std::string& path, const std::string& name, const std::string& value)
{
    return Mutation{Coordinate{path, name}, ConfigValue::String(value), false};
}

static Mutation SetDword(const std::string& path, const std::string& name, int32_t value)
{
    return Mutation{Coordinate{path, name}, ConfigValue::Int32(value), false};
}

static Mutation SetDwordOnChildren(const std::string& parent, const std::string& name, int32_t value)
{
    return Mutation{Coordinate{parent, name}, ConfigValue::Int32(value), true};
}

static const char MOUSE_KEY[]      = "HKCU\\Control Panel\\Mouse";
static const char KEYBOARD_KEY[]   = "HKCU\\Control Panel\\Keyboard";
static const char GAME_CONFIG[]    = "HKCU\\System\\GameConfigStore";
static const char GAME_BAR[]       = "HKCU\\Software\\Microsoft\\GameBar";
static const char TCPIP_IFACES[]   = "HKLM\\SYSTEM\\CurrentControlSet\\Services\\Tcpip\\Parameters\\Interfaces";
static const char CORE_PARKING[]   = "HKLM\\SYSTEM\\CurrentControlSet\\Control\\Power\\PowerSettings\\"
                                     "54533251-82be-4824-96c1-47b60b740d00\\0cc5b647-c1df-4637-891a-dec35c318583";

TweakCatalog TweakCatalog::Gaming()
{
    std::vector<TweakDefinition> tweaks;

    // Mouse
    tweaks.push_back({"mouse_raw_input", "Raw Mouse Input",
                      "Pass mouse movement through without speed scaling", "mouse",
                      {SetString(MOUSE_KEY, "MouseSpeed", "0")}, {}, ""});
    tweaks.push_back({"mouse_disable_acceleration", "Disable Mouse Acceleration",
                      "Set MouseSpeed, Threshold1, Threshold2 to 0", "mouse",
                      {SetString(MOUSE_KEY, "MouseSpeed", "0"),
                       SetString(MOUSE_KEY, "MouseThreshold1", "0"),
                       SetString(MOUSE_KEY, "MouseThreshold2", "0")}, {}, ""});
    tweaks.push_back({"disable_smooth_scrolling", "Disable Smooth Scrolling",
                      "Turn off smooth scrolling in system settings", "mouse",
                      {SetDword("HKCU\\Control Panel\\Desktop", "SmoothScroll", 0)}, {}, ""});

    // Keyboard and accessibility
    tweaks.push_back({"keyboard_repeat_max", "Max Keyboard Repeat Rate",
                      "Set KeyboardDelay=0 and KeyboardSpeed=31", "keyboard",
                      {SetString(KEYBOARD_KEY, "KeyboardDelay", "0"),
                       SetString(KEYBOARD_KEY, "KeyboardSpeed", "31")}, {}, ""});
    tweaks.push_back({"disable_sticky_keys", "Disable Sticky Keys",
                      "Prevent sticky keys popup during gaming", "keyboard",
                      {SetString("HKCU\\Control Panel\\Accessibility\\StickyKeys", "Flags", "506")}, {}, ""});
    tweaks.push_back({"disable_filter_keys", "Disable Filter Keys",
                      "Prevent filter keys popup during gaming", "keyboard",
                      {SetString("HKCU\\Control Panel\\Accessibility\\Keyboard Response", "Flags", "122")}, {}, ""});
    tweaks.push_back({"disable_toggle_keys", "Disable Toggle Keys",
                      "Prevent toggle keys sound during gaming", "keyboard",
                      {SetString("HKCU\\Control Panel\\Accessibility\\ToggleKeys", "Flags", "58")}, {}, ""});

    // Display / overlays
    tweaks.push_back({"disable_game_dvr", "Disable Game DVR",
                      "Turn off background game recording", "display",
                      {SetDword(GAME_CONFIG, "GameDVR_Enabled", 0)}, {}, ""});
    tweaks.push_back({"disable_game_bar", "Disable Game Bar",
                      "Turn off Xbox Game Bar overlay", "display",
                      {SetDword("HKCU\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\GameDVR", "AppCaptureEnabled", 0),
                       SetDword(GAME_BAR, "UseNexusForGameBarEnabled", 0)}, {}, ""});
    tweaks.push_back({"disable_game_mode", "Disable Game Mode",
                      "Turn off Windows Game Mode", "display",
                      {SetDword(GAME_BAR, "AllowAutoGameMode", 0),
                       SetDword(GAME_BAR, "AutoGameModeEnabled", 0)}, {}, ""});
    tweaks.push_back({"disable_fullscreen_optimize", "Disable Fullscreen Optimizations",
                      "Prevent DWM fullscreen optimizations", "display",
                      {SetDword(GAME_CONFIG, "GameDVR_FSEBehaviorMode", 2),
                       SetDword(GAME_CONFIG, "GameDVR_HonorUserFSEBehaviorMode", 1),
                       SetDword(GAME_CONFIG, "GameDVR_FSEBehavior", 2),
                       SetDword(GAME_CONFIG, "GameDVR_DXGIHonorFSEWindowsCompatible", 1)}, {}, ""});

    // Power
    tweaks.push_back({"ultimate_power_plan", "Ultimate Performance Power Plan",
                      "Activate Windows Ultimate Performance plan", "power",
                      {}, {}, POWER_SCHEME_ULTIMATE});
    tweaks.push_back({"core_parking_off", "Disable Core Parking",
                      "Keep all CPU cores active", "power",
                      {SetDword(CORE_PARKING, "ValueMax", 0)}, {}, ""});

    // System
    tweaks.push_back({"timer_resolution", "High Timer Resolution",
                      "Honour global timer resolution requests", "system",
                      {SetDword("HKLM\\SYSTEM\\CurrentControlSet\\Control\\Session Manager\\kernel",
                                "GlobalTimerResolutionRequests", 1)}, {}, ""});
    tweaks.push_back({"disable_sysmain", "Disable SysMain/SuperFetch",
                      "Stop SysMain service temporarily", "system",
                      {}, {{"SysMain", ServiceRunState::Stopped}}, ""});
    tweaks.push_back({"disable_indexing", "Disable Windows Search Indexing",
                      "Stop WSearch service temporarily", "system",
                      {}, {{"WSearch", ServiceRunState::Stopped}}, ""});
    tweaks.push_back({"cpu_priority_high", "High CPU Priority",
                      "Set foreground process priority boost", "system",
                      {SetDword("HKLM\\SYSTEM\\CurrentControlSet\\Control\\PriorityControl",
                                "Win32PrioritySeparation", 0x26)}, {}, ""});

    // Network
    tweaks.push_back({"disable_nagle", "Disable Nagle Algorithm",
                      "Turn off TCP packet batching on every network interface", "network",
                      {SetDwordOnChildren(TCPIP_IFACES, "TcpAckFrequency", 1),
                       SetDwordOnChildren(TCPIP_IFACES, "TCPNoDelay", 1)}, {}, ""});

    std::vector<GameProfile> profiles = {
        {"competitive_fps", "Competitive FPS",
         "Maximum responsiveness for Valorant, CS2, Apex Legends. Input latency, raw mouse input and network.",
         {"mouse_raw_input", "mouse_disable_acceleration", "timer_resolution", "disable_game_dvr",
          "disable_game_bar", "disable_nagle", "disable_fullscreen_optimize", "keyboard_repeat_max",
          "disable_game_mode"}},
        {"open_world", "Open World",
         "Sustained performance for Cyberpunk 2077, GTA V, Elden Ring. CPU unparking and background services.",
         {"core_parking_off", "disable_indexing", "ultimate_power_plan", "disable_sysmain",
          "disable_game_dvr", "disable_game_bar", "disable_fullscreen_optimize"}},
        {"moba_strategy", "MOBA / Strategy",
         "Network and input optimization for League of Legends, Dota 2, Starcraft.",
         {"disable_nagle", "keyboard_repeat_max", "cpu_priority_high", "disable_game_dvr",
          "disable_game_bar"}},
        {"racing_sim", "Racing / Sim",
         "Sustained high FPS for Forza Horizon, F1, Assetto Corsa. Power plan and display.",
         {"disable_fullscreen_optimize", "ultimate_power_plan", "core_parking_off", "disable_game_dvr",
          "disable_game_bar", "disable_game_mode", "timer_resolution"}},
        {"casual", "Casual / Indie",
         "Light optimization for Minecraft, Stardew Valley, indie titles.",
         {"disable_game_dvr", "disable_game_bar", "disable_sysmain"}},
        {"nuclear", "Nuclear Mode",
         "Every tweak applied. Best for dedicated gaming sessions.",
         {"mouse_raw_input", "mouse_disable_acceleration", "timer_resolution", "disable_game_dvr",
          "disable_game_bar", "disable_game_mode", "disable_nagle", "disable_fullscreen_optimize",
          "keyboard_repeat_max", "core_parking_off", "disable_indexing", "ultimate_power_plan",
          "disable_sysmain", "cpu_priority_high", "disable_smooth_scrolling", "disable_sticky_keys",
          "disable_filter_keys", "disable_toggle_keys"}},
    };

    return TweakCatalog("gaming", std::move(tweaks), std::move(profiles));
}

TweakCatalog TweakCatalog::Privacy()
{
    static const char CONTENT_DELIVERY[] = "HKCU\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\ContentDeliveryManager";
    static const char POLICY_SYSTEM[] = "HKLM\\SOFTWARE\\Policies\\Microsoft\\Windows\\System";

    std::vector<TweakDefinition> tweaks;

    tweaks.push_back({"disable_telemetry", "Disable Telemetry",
                      "Disables Windows diagnostic data collection (AllowTelemetry=0)", "telemetry",
                      {SetDword("HKLM\\SOFTWARE\\Policies\\Microsoft\\Windows\\DataCollection", "AllowTelemetry", 0)}, {}, ""});
    tweaks.push_back({"disable_activity_history", "Disable Activity History",
                      "Prevents Windows from tracking and sending your activity history", "tracking",
                      {SetDword(POLICY_SYSTEM, "EnableActivityFeed", 0),
                       SetDword(POLICY_SYSTEM, "PublishUserActivities", 0)}, {}, ""});
    tweaks.push_back({"disable_location", "Disable Location Tracking",
                      "Denies app access to your device location", "tracking",
                      {SetString("HKCU\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\CapabilityAccessManager\\ConsentStore\\location",
                                 "Value", "Deny")}, {}, ""});
    tweaks.push_back({"disable_advertising_id", "Disable Advertising ID",
                      "Prevents apps from using your advertising ID for targeted ads", "ads",
                      {SetDword("HKCU\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\AdvertisingInfo", "Enabled", 0)}, {}, ""});
    tweaks.push_back({"disable_cortana", "Disable Cortana",
                      "Disables Cortana assistant and its data collection", "cortana",
                      {SetDword("HKLM\\SOFTWARE\\Policies\\Microsoft\\Windows\\Windows Search", "AllowCortana", 0)}, {}, ""});
    tweaks.push_back({"disable_bing_search", "Disable Bing Search in Start Menu",
                      "Removes Bing web search suggestions from the Start Menu search", "cortana",
                      {SetDword("HKCU\\SOFTWARE\\Policies\\Microsoft\\Windows\\Explorer", "DisableSearchBoxSuggestions", 1)}, {}, ""});
    tweaks.push_back({"disable_feedback", "Disable Feedback Requests",
                      "Stops Windows from asking for feedback", "telemetry",
                      {SetDword("HKCU\\SOFTWARE\\Microsoft\\Siuf\\Rules", "NumberOfSIUFInPeriod", 0)}, {}, ""});
    tweaks.push_back({"disable_tailored_experiences", "Disable Tailored Experiences",
                      "Prevents Microsoft from using diagnostic data for personalized tips and ads", "ads",
                      {SetDword("HKCU\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Privacy",
                                "TailoredExperiencesWithDiagnosticDataEnabled", 0)}, {}, ""});
    tweaks.push_back({"disable_tips", "Disable Tips and Suggestions",
                      "Disables Windows tips, suggestions, and recommended content", "ads",
                      {SetDword(CONTENT_DELIVERY, "SubscribedContent-338389Enabled", 0),
                       SetDword(CONTENT_DELIVERY, "SoftLandingEnabled", 0),
                       SetDword(CONTENT_DELIVERY, "SystemPaneSuggestionsEnabled", 0)}, {}, ""});
    tweaks.push_back({"disable_wifi_sense", "Disable Wi-Fi Sense",
                      "Prevents automatic connection to suggested open hotspots and shared networks", "tracking",
                      {SetDword("HKLM\\SOFTWARE\\Microsoft\\WcmSvc\\wifinetworkmanager\\config", "AutoConnectAllowedOEM", 0)}, {}, ""});
    tweaks.push_back({"disable_error_reporting", "Disable Windows Error Reporting",
                      "Stops Windows from sending error reports to Microsoft", "telemetry",
                      {SetDword("HKLM\\SOFTWARE\\Microsoft\\Windows\\Windows Error Reporting", "Disabled", 1)}, {}, ""});

    return TweakCatalog("privacy", std::move(tweaks));
}
