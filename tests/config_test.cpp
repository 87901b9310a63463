#include "config.h"
#include "test_support.h"

#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>

namespace
{

AppConfig Parse(const std::string& text)
{
    std::istringstream in(text);
    return ParseConfig(in);
}

void TestDefaults()
{
    AppConfig cfg = Parse("");
    assert(cfg.serviceTimeoutMs == DEFAULT_SERVICE_TIMEOUT_MS);
    assert(cfg.powerTimeoutMs == DEFAULT_POWER_TIMEOUT_MS);
    assert(!cfg.restoreStartTypes);
    assert(cfg.verifyWrites);
    assert(cfg.configVersion == 0);
}

void TestTemplateParsesToDefaults()
{
    AppConfig cfg = Parse(DEFAULT_CONFIG);
    assert(cfg.configVersion == CONFIG_VERSION);
    assert(cfg.serviceTimeoutMs == 30000);
    assert(cfg.powerTimeoutMs == 10000);
    assert(!cfg.restoreStartTypes);
    assert(cfg.verifyWrites);
}

void TestValuesCommentsAndCase()
{
    AppConfig cfg = Parse(
        "\xEF\xBB\xBF; leading comment\n"
        "[META]\n"
        "Version = 1\n"
        "\n"
        "[Global]\n"
        "# hash comment\n"
        "SERVICE_TIMEOUT_MS = 5000\n"
        "power_timeout_ms=250\n"
        "restore_start_types = Yes\n"
        "verify_writes = 0\n"
        "unknown_key = 42\n"
        "[other]\n"
        "service_timeout_ms = 1\n");

    assert(cfg.configVersion == 1);
    assert(cfg.serviceTimeoutMs == 5000);
    assert(cfg.powerTimeoutMs == 250);
    assert(cfg.restoreStartTypes);
    assert(!cfg.verifyWrites);
}

void TestInvalidValuesKeepDefaults()
{
    AppConfig cfg = Parse(
        "[global]\n"
        "service_timeout_ms = -5\n"
        "power_timeout_ms = 10s\n"
        "restore_start_types = maybe\n"
        "verify_writes =\n");

    assert(cfg.serviceTimeoutMs == DEFAULT_SERVICE_TIMEOUT_MS);
    assert(cfg.powerTimeoutMs == DEFAULT_POWER_TIMEOUT_MS);
    assert(!cfg.restoreStartTypes);
    assert(cfg.verifyWrites);
}

void TestLoadCreatesMissingFile()
{
    test::TempDir dir("config_create");
    const std::filesystem::path path = dir.Path() / "nested" / CONFIG_FILENAME;

    AppConfig cfg = LoadConfig(path);
    assert(std::filesystem::exists(path));
    assert(cfg.configVersion == CONFIG_VERSION);
    assert(cfg.serviceTimeoutMs == DEFAULT_SERVICE_TIMEOUT_MS);
}

void TestOutdatedFileIsReplaced()
{
    test::TempDir dir("config_outdated");
    const std::filesystem::path path = dir.Path() / CONFIG_FILENAME;
    {
        std::ofstream f(path);
        f << "[global]\nservice_timeout_ms = 1234\n";
    }

    AppConfig cfg = LoadConfig(path);
    assert(cfg.configVersion == CONFIG_VERSION);
    assert(cfg.serviceTimeoutMs == DEFAULT_SERVICE_TIMEOUT_MS);

    std::filesystem::path old = path;
    old += ".old";
    assert(std::filesystem::exists(old));
    std::ifstream kept(old);
    assert(ParseConfig(kept).serviceTimeoutMs == 1234);
}

void TestCurrentFileIsKept()
{
    test::TempDir dir("config_current");
    const std::filesystem::path path = dir.Path() / CONFIG_FILENAME;
    {
        std::ofstream f(path);
        f << "[meta]\nversion=1\n[global]\npower_timeout_ms = 777\n";
    }

    AppConfig cfg = LoadConfig(path);
    assert(cfg.powerTimeoutMs == 777);
    std::filesystem::path old = path;
    old += ".old";
    assert(!std::filesystem::exists(old));
}

} // namespace

int main()
{
    TestDefaults();
    TestTemplateParsesToDefaults();
    TestValuesCommentsAndCase();
    TestInvalidValuesKeepDefaults();
    TestLoadCreatesMissingFile();
    TestOutdatedFileIsReplaced();
    TestCurrentFileIsKept();

    std::cout << "config_test: pass\n";
    return 0;
}
