#include "config.h"
#include "logger.h"
#include "utils.h"
#include <fstream>

std::filesystem::path GetConfigPath()
{
    return GetAppDataPath() / CONFIG_FILENAME;
}

bool CreateDefaultConfig(const std::filesystem::path& configPath)
{
    try
    {
        if (configPath.has_parent_path())
        {
            std::filesystem::create_directories(configPath.parent_path());
        }

        std::ofstream f(configPath);
        if (!f)
        {
            Log("[CONFIG] Failed to create default config at: " + configPath.string());
            return false;
        }

        f << DEFAULT_CONFIG;
        f.close();

        Log("[CONFIG] Created default config at: " + configPath.string());
        return true;
    }
    catch (const std::exception& e)
    {
        Log(std::string("[CONFIG] Exception creating default config: ") + e.what());
        return false;
    }
}

static bool ParseBool(const std::string& value, bool& out)
{
    if (value == "true" || value == "1" || value == "yes")  { out = true;  return true; }
    if (value == "false" || value == "0" || value == "no")  { out = false; return true; }
    return false;
}

static bool ParsePositiveInt(const std::string& value, int& out)
{
    try
    {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size() || v <= 0) return false;
        out = v;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

AppConfig ParseConfig(std::istream& in)
{
    AppConfig cfg;
    std::string line;
    enum Sect { NONE, META, GLOBAL } sect = NONE;
    int lineNum = 0;

    while (std::getline(in, line))
    {
        ++lineNum;
        // UTF-8 BOM
        if (lineNum == 1 && line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0)
            line.erase(0, 3);

        std::string s = Trim(line);
        if (s.empty() || s[0] == ';' || s[0] == '#') continue;

        if (s.front() == '[' && s.back() == ']')
        {
            std::string secName = AsciiLowerCopy(Trim(s.substr(1, s.size() - 2)));
            if (secName == "global") sect = GLOBAL;
            else if (secName == "meta") sect = META;
            else sect = NONE;
            continue;
        }

        size_t eqPos = s.find('=');
        if (eqPos == std::string::npos || sect == NONE) continue;

        std::string key = AsciiLowerCopy(Trim(s.substr(0, eqPos)));
        std::string value = AsciiLowerCopy(Trim(s.substr(eqPos + 1)));

        if (sect == META)
        {
            if (key == "version" && !ParsePositiveInt(value, cfg.configVersion))
            {
                cfg.configVersion = 0;
            }
            continue;
        }

        bool valid = true;
        if (key == "service_timeout_ms")
        {
            valid = ParsePositiveInt(value, cfg.serviceTimeoutMs);
        }
        else if (key == "power_timeout_ms")
        {
            valid = ParsePositiveInt(value, cfg.powerTimeoutMs);
        }
        else if (key == "restore_start_types")
        {
            valid = ParseBool(value, cfg.restoreStartTypes);
        }
        else if (key == "verify_writes")
        {
            valid = ParseBool(value, cfg.verifyWrites);
        }

        if (!valid)
        {
            Log("[CONFIG] Line " + std::to_string(lineNum) + ": invalid value for " + key +
                " ('" + value + "'), keeping default");
        }
    }

    return cfg;
}

AppConfig LoadConfig(const std::filesystem::path& configPath)
{
    try
    {
        std::error_code ec;
        if (!std::filesystem::exists(configPath, ec))
        {
            Log("[CONFIG] Config not found, creating default config...");
            if (!CreateDefaultConfig(configPath)) return AppConfig();
        }

        AppConfig cfg;
        {
            std::ifstream f(configPath);
            if (!f)
            {
                Log("[CONFIG] Cannot open " + configPath.string() + ", using defaults");
                return AppConfig();
            }
            cfg = ParseConfig(f);
        }

        if (cfg.configVersion < CONFIG_VERSION)
        {
            Log("[CONFIG] Version mismatch (File: " + std::to_string(cfg.configVersion) +
                ", App: " + std::to_string(CONFIG_VERSION) + "). backing up and resetting...");

            std::filesystem::path backupPath = configPath;
            backupPath += ".old";
            std::filesystem::copy_file(configPath, backupPath, std::filesystem::copy_options::overwrite_existing);
            std::filesystem::remove(configPath);
            if (!CreateDefaultConfig(configPath)) return AppConfig();

            std::ifstream fresh(configPath);
            if (!fresh) return AppConfig();
            cfg = ParseConfig(fresh);
        }

        Log("[CONFIG] Loaded: service_timeout_ms=" + std::to_string(cfg.serviceTimeoutMs) +
            " | power_timeout_ms=" + std::to_string(cfg.powerTimeoutMs) +
            " | restore_start_types=" + (cfg.restoreStartTypes ? "true" : "false") +
            " | verify_writes=" + (cfg.verifyWrites ? "true" : "false"));
        return cfg;
    }
    catch (const std::exception& e)
    {
        Log(std::string("[CONFIG] LoadConfig exception: ") + e.what());
        return AppConfig();
    }
}
