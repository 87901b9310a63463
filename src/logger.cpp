#include "logger.h"
#include <fstream>
#include <mutex>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <system_error>

// Never destroyed: an abandoned service call may still log during exit
static std::mutex& LogMutex()
{
    static std::mutex* mtx = new std::mutex;
    return *mtx;
}

static std::filesystem::path EnvPath(const char* name)
{
    const char* value = std::getenv(name);
    if (value && *value) return std::filesystem::path(value);
    return {};
}

std::filesystem::path GetAppDataPath()
{
    std::filesystem::path override = EnvPath("TWEAKGUARD_HOME");
    if (!override.empty()) return override;

#ifdef _WIN32
    std::filesystem::path localAppData = EnvPath("LOCALAPPDATA");
    if (!localAppData.empty()) return localAppData / "TweakGuard";

    std::filesystem::path profile = EnvPath("USERPROFILE");
    if (!profile.empty()) return profile / "AppData" / "Local" / "TweakGuard";
    return std::filesystem::path("C:\\Users\\Default\\AppData\\Local\\TweakGuard");
#else
    std::filesystem::path xdg = EnvPath("XDG_DATA_HOME");
    if (!xdg.empty()) return xdg / "tweakguard";

    std::filesystem::path home = EnvPath("HOME");
    if (!home.empty()) return home / ".local" / "share" / "tweakguard";
    return std::filesystem::temp_directory_path() / "tweakguard";
#endif
}

void Log(const std::string& msg)
{
    std::lock_guard lg(LogMutex());
    try
    {
        std::filesystem::path dir = GetAppDataPath();

        // Normal user permissions, no custom ACL
        std::error_code ec;
        if (!std::filesystem::exists(dir, ec))
        {
            std::filesystem::create_directories(dir, ec);
            if (ec) return;
        }

        std::ofstream log(dir / "log.txt", std::ios::app);
        if (log)
        {
            auto now = std::chrono::system_clock::now();
            std::time_t t = std::chrono::system_clock::to_time_t(now);

            const size_t TIMEBUF_SIZE = 32;
            char timebuf[TIMEBUF_SIZE] = {0};
            struct tm timeinfo;

#ifdef _WIN32
            bool converted = (localtime_s(&timeinfo, &t) == 0);
#else
            bool converted = (localtime_r(&t, &timeinfo) != nullptr);
#endif
            if (converted)
            {
                if (std::strftime(timebuf, TIMEBUF_SIZE, "%Y-%m-%d %H:%M:%S", &timeinfo) > 0)
                {
                    log << timebuf << "  " << msg << std::endl;
                }
                else
                {
                    log << "[Timestamp Error] " << msg << std::endl;
                }
            }
            else
            {
                log << msg << std::endl;
            }
        }
    }
    catch (const std::exception&)
    {
        // Logging never takes the caller down
    }
}
