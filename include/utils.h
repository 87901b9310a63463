#ifndef TWEAKGUARD_UTILS_H
#define TWEAKGUARD_UTILS_H

#include "types.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <string>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <memory>
#include <type_traits>

// RAII Wrapper for Registry HKEYs
struct RegKeyDeleter {
    void operator()(HKEY h) const {
        if (h) RegCloseKey(h);
    }
};
using UniqueRegKey = std::unique_ptr<std::remove_pointer<HKEY>::type, RegKeyDeleter>;

// RAII Wrapper for SCM handles
struct ScHandleDeleter {
    void operator()(SC_HANDLE h) const {
        if (h) CloseServiceHandle(h);
    }
};
using UniqueScHandle = std::unique_ptr<std::remove_pointer<SC_HANDLE>::type, ScHandleDeleter>;

// Convert wide string to UTF-8
std::string WideToUtf8(const wchar_t* wstr);

// Convert UTF-8 string to wide
std::wstring Utf8ToWide(const std::string& str);
#endif

// Convert ASCII string to lowercase in-place
void asciiLower(std::string& s);
std::string AsciiLowerCopy(std::string s);

bool EqualsIgnoreCase(const std::string& a, const std::string& b);
bool EndsWithIgnoreCase(const std::string& s, const std::string& suffix);

std::string Trim(const std::string& s);

// Lowercase hex, two digits per byte
std::string BytesToHex(const std::vector<uint8_t>& bytes);

// Rejects odd lengths and non-hex digits
bool HexToBytes(const std::string& hex, std::vector<uint8_t>& out);

// ISO-8601 UTC, e.g. 2025-06-01T12:00:00Z
std::string CurrentTimestampUtc();

// Runs a blocking external call with an upper bound on the wait.
// On timeout the call is abandoned (left to finish on its own thread) and
// Timeout is returned; the callable must only touch state it co-owns.
// When abandoned is given it receives the still-running call's result.
Status RunBounded(std::function<Status()> call,
                  std::chrono::milliseconds timeout,
                  const std::string& what,
                  std::shared_future<Status>* abandoned = nullptr);

#endif // TWEAKGUARD_UTILS_H
