#include "utils.h"
#include <cctype>
#include <ctime>
#include <future>
#include <memory>
#include <system_error>
#include <thread>

#ifdef _WIN32

std::string WideToUtf8(const wchar_t* wstr)
{
    if (!wstr || !*wstr) return "";
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr, -1, nullptr, 0, nullptr, nullptr);
    if (len <= 0) return "";

    std::string result;
    try {
        result.resize(len - 1);
        WideCharToMultiByte(CP_UTF8, 0, wstr, -1, &result[0], len, nullptr, nullptr);
    } catch (const std::exception&) {
        return "[ERROR: String conversion failed]";
    }

    return result;
}

std::wstring Utf8ToWide(const std::string& str)
{
    if (str.empty()) return L"";
    int len = MultiByteToWideChar(CP_UTF8, 0, str.c_str(), -1, nullptr, 0);
    if (len <= 0) return L"";

    std::wstring result;
    result.resize(len - 1);
    MultiByteToWideChar(CP_UTF8, 0, str.c_str(), -1, &result[0], len);
    return result;
}
#endif

void asciiLower(std::string& s)
{
    for (char& c : s)
    {
        if (c >= 'A' && c <= 'Z') c = c - 'A' + 'a';
    }
}

std::string AsciiLowerCopy(std::string s)
{
    asciiLower(s);
    return s;
}

bool EqualsIgnoreCase(const std::string& a, const std::string& b)
{
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

bool EndsWithIgnoreCase(const std::string& s, const std::string& suffix)
{
    if (suffix.size() > s.size()) return false;
    return EqualsIgnoreCase(s.substr(s.size() - suffix.size()), suffix);
}

std::string Trim(const std::string& s)
{
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string BytesToHex(const std::vector<uint8_t>& bytes)
{
    static const char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes)
    {
        out.push_back(DIGITS[b >> 4]);
        out.push_back(DIGITS[b & 0x0F]);
    }
    return out;
}

static int HexDigit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool HexToBytes(const std::string& hex, std::vector<uint8_t>& out)
{
    if (hex.size() % 2 != 0) return false;

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        int hi = HexDigit(hex[i]);
        int lo = HexDigit(hex[i + 1]);
        if (hi < 0 || lo < 0) return false;
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    out.swap(bytes);
    return true;
}

std::string CurrentTimestampUtc()
{
    std::time_t t = std::time(nullptr);
    struct tm utc;
#ifdef _WIN32
    if (gmtime_s(&utc, &t) != 0) return "";
#else
    if (!gmtime_r(&t, &utc)) return "";
#endif
    char buf[32] = {0};
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc) == 0) return "";
    return buf;
}

Status RunBounded(std::function<Status()> call,
                  std::chrono::milliseconds timeout,
                  const std::string& what,
                  std::shared_future<Status>* abandoned)
{
    auto task = std::make_shared<std::packaged_task<Status()>>([call = std::move(call)]()
    {
        try
        {
            return call();
        }
        catch (const std::exception& e)
        {
            return Status::Error(ErrorKind::IoError, e.what());
        }
    });

    std::future<Status> result = task->get_future();
    try
    {
        std::thread([task]() { (*task)(); }).detach();
    }
    catch (const std::system_error& e)
    {
        return Status::Error(ErrorKind::IoError, what + ": could not start worker: " + e.what());
    }

    if (result.wait_for(timeout) != std::future_status::ready)
    {
        if (abandoned) *abandoned = result.share();
        return Status::Error(ErrorKind::Timeout,
            what + " did not finish within " + std::to_string(timeout.count()) + " ms");
    }
    return result.get();
}
