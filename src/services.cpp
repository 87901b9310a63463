#ifdef _WIN32

#include "services.h"
#include "constants.h"
#include "logger.h"
#include <powrprof.h>
#include <vector>

static Status FromServiceError(DWORD err, const std::string& what)
{
    switch (err)
    {
    case ERROR_SERVICE_DOES_NOT_EXIST:
        return Status::Error(ErrorKind::NotFound, what + ": service does not exist");
    case ERROR_ACCESS_DENIED:
        return Status::Error(ErrorKind::PermissionDenied, what + ": access denied (run as administrator)");
    case ERROR_SERVICE_REQUEST_TIMEOUT:
        return Status::Error(ErrorKind::Timeout, what + ": service did not respond");
    case ERROR_SERVICE_DISABLED:
        return Status::Error(ErrorKind::InvalidArgument, what + ": service is disabled");
    default:
        return Status::Error(ErrorKind::IoError, what + ": error " + std::to_string(err));
    }
}

WindowsServiceControl::WindowsServiceControl(int settleTimeoutMs)
    : m_settleTimeoutMs(settleTimeoutMs)
{
}

WindowsServiceControl::~WindowsServiceControl() = default;

Status WindowsServiceControl::Initialize()
{
    std::lock_guard lock(m_mutex);
    if (m_scManager) return Status::Ok();

    m_scManager.reset(OpenSCManagerW(nullptr, nullptr, SC_MANAGER_CONNECT));
    if (!m_scManager)
    {
        DWORD err = GetLastError();
        Log("[SERVICE] Failed to open SC Manager: " + std::to_string(err));
        return FromServiceError(err, "OpenSCManager");
    }

    Log("[SERVICE] Service Control Manager connected");
    return Status::Ok();
}

Status WindowsServiceControl::OpenServiceHandle(const std::string& service, DWORD access, UniqueScHandle& handle)
{
    Status s = Initialize();
    if (!s.ok()) return s;

    std::wstring wname = Utf8ToWide(service);
    handle.reset(OpenServiceW(m_scManager.get(), wname.c_str(), access));
    if (!handle)
    {
        return FromServiceError(GetLastError(), service);
    }
    return Status::Ok();
}

Status WindowsServiceControl::WaitForState(SC_HANDLE handle, const std::string& service, DWORD target)
{
    SERVICE_STATUS status;
    const int maxPolls = m_settleTimeoutMs / SERVICE_POLL_INTERVAL_MS;
    for (int i = 0; i <= maxPolls; ++i)
    {
        if (!QueryServiceStatus(handle, &status))
        {
            return FromServiceError(GetLastError(), service);
        }
        if (status.dwCurrentState == target) return Status::Ok();
        Sleep(SERVICE_POLL_INTERVAL_MS);
    }
    return Status::Error(ErrorKind::Timeout,
        service + " did not settle within " + std::to_string(m_settleTimeoutMs) + " ms");
}

Status WindowsServiceControl::QueryRunState(const std::string& service, ServiceRunState& state)
{
    UniqueScHandle handle;
    Status s = OpenServiceHandle(service, SERVICE_QUERY_STATUS, handle);
    if (!s.ok()) return s;

    SERVICE_STATUS status;
    if (!QueryServiceStatus(handle.get(), &status))
    {
        return FromServiceError(GetLastError(), service);
    }

    switch (status.dwCurrentState)
    {
    case SERVICE_RUNNING:
    case SERVICE_START_PENDING:
    case SERVICE_CONTINUE_PENDING:
    case SERVICE_PAUSED:
    case SERVICE_PAUSE_PENDING:
        state = ServiceRunState::Running;
        break;
    default:
        state = ServiceRunState::Stopped;
        break;
    }
    return Status::Ok();
}

Status WindowsServiceControl::Start(const std::string& service)
{
    UniqueScHandle handle;
    Status s = OpenServiceHandle(service, SERVICE_START | SERVICE_QUERY_STATUS, handle);
    if (!s.ok()) return s;

    if (!StartServiceW(handle.get(), 0, nullptr))
    {
        DWORD err = GetLastError();
        if (err != ERROR_SERVICE_ALREADY_RUNNING)
        {
            Log("[SERVICE] Failed to start " + service + ": " + std::to_string(err));
            return FromServiceError(err, service);
        }
    }
    return WaitForState(handle.get(), service, SERVICE_RUNNING);
}

Status WindowsServiceControl::Stop(const std::string& service)
{
    UniqueScHandle handle;
    Status s = OpenServiceHandle(service, SERVICE_STOP | SERVICE_QUERY_STATUS, handle);
    if (!s.ok()) return s;

    SERVICE_STATUS status;
    if (!ControlService(handle.get(), SERVICE_CONTROL_STOP, &status))
    {
        DWORD err = GetLastError();
        if (err == ERROR_SERVICE_NOT_ACTIVE) return Status::Ok();
        Log("[SERVICE] Failed to stop " + service + ": " + std::to_string(err));
        return FromServiceError(err, service);
    }
    return WaitForState(handle.get(), service, SERVICE_STOPPED);
}

Status WindowsServiceControl::QueryStartType(const std::string& service, ServiceStartType& type)
{
    UniqueScHandle handle;
    Status s = OpenServiceHandle(service, SERVICE_QUERY_CONFIG, handle);
    if (!s.ok()) return s;

    DWORD bytesNeeded = 0;
    QueryServiceConfigW(handle.get(), nullptr, 0, &bytesNeeded);
    DWORD err = GetLastError();
    if (err != ERROR_INSUFFICIENT_BUFFER)
    {
        return FromServiceError(err, service);
    }

    std::vector<BYTE> configBuffer(bytesNeeded);
    LPQUERY_SERVICE_CONFIGW config = reinterpret_cast<LPQUERY_SERVICE_CONFIGW>(configBuffer.data());
    if (!QueryServiceConfigW(handle.get(), config, bytesNeeded, &bytesNeeded))
    {
        return FromServiceError(GetLastError(), service);
    }

    switch (config->dwStartType)
    {
    case SERVICE_BOOT_START:   type = ServiceStartType::Boot; break;
    case SERVICE_SYSTEM_START: type = ServiceStartType::System; break;
    case SERVICE_AUTO_START:   type = ServiceStartType::Automatic; break;
    case SERVICE_DISABLED:     type = ServiceStartType::Disabled; break;
    default:                   type = ServiceStartType::Manual; break;
    }
    return Status::Ok();
}

Status WindowsServiceControl::SetStartType(const std::string& service, ServiceStartType type)
{
    UniqueScHandle handle;
    Status s = OpenServiceHandle(service, SERVICE_CHANGE_CONFIG, handle);
    if (!s.ok()) return s;

    DWORD startType = SERVICE_DEMAND_START;
    switch (type)
    {
    case ServiceStartType::Boot:      startType = SERVICE_BOOT_START; break;
    case ServiceStartType::System:    startType = SERVICE_SYSTEM_START; break;
    case ServiceStartType::Automatic: startType = SERVICE_AUTO_START; break;
    case ServiceStartType::Manual:    startType = SERVICE_DEMAND_START; break;
    case ServiceStartType::Disabled:  startType = SERVICE_DISABLED; break;
    }

    if (!ChangeServiceConfigW(handle.get(), SERVICE_NO_CHANGE, startType, SERVICE_NO_CHANGE,
                              nullptr, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr))
    {
        DWORD err = GetLastError();
        Log("[SERVICE] Failed to configure " + service + ": " + std::to_string(err));
        return FromServiceError(err, service);
    }
    return Status::Ok();
}

// --------------------------------------------------------------------------
// POWER SCHEMES
// --------------------------------------------------------------------------

static std::string GuidToString(const GUID& guid)
{
    wchar_t buf[64] = {0};
    if (StringFromGUID2(guid, buf, 64) == 0) return "";

    // {8C5E7FDA-...} -> 8c5e7fda-...
    std::string text = WideToUtf8(buf);
    if (text.size() > 2 && text.front() == '{' && text.back() == '}')
    {
        text = text.substr(1, text.size() - 2);
    }
    asciiLower(text);
    return text;
}

static bool StringToGuid(const std::string& text, GUID& guid)
{
    std::string braced = text;
    if (braced.empty() || braced.front() != '{') braced = "{" + braced + "}";
    std::wstring wide = Utf8ToWide(braced);
    return SUCCEEDED(CLSIDFromString(wide.c_str(), &guid));
}

Status WindowsPowerSchemeControl::GetActiveScheme(std::string& schemeId)
{
    GUID* active = nullptr;
    DWORD rc = PowerGetActiveScheme(nullptr, &active);
    if (rc != ERROR_SUCCESS || !active)
    {
        return Status::Error(ErrorKind::IoError, "PowerGetActiveScheme failed: " + std::to_string(rc));
    }

    schemeId = GuidToString(*active);
    LocalFree(active);

    if (schemeId.empty())
    {
        return Status::Error(ErrorKind::IoError, "could not format active power scheme");
    }
    return Status::Ok();
}

Status WindowsPowerSchemeControl::SetActiveScheme(const std::string& schemeId)
{
    GUID guid;
    if (!StringToGuid(schemeId, guid))
    {
        return Status::Error(ErrorKind::InvalidArgument, "malformed power scheme id: " + schemeId);
    }

    DWORD rc = PowerSetActiveScheme(nullptr, &guid);
    if (rc == ERROR_ACCESS_DENIED)
    {
        return Status::Error(ErrorKind::PermissionDenied, "power scheme " + schemeId + ": access denied");
    }
    if (rc != ERROR_SUCCESS)
    {
        // Not installed on this machine (Ultimate Performance is hidden by default)
        return Status::Error(rc == ERROR_FILE_NOT_FOUND ? ErrorKind::NotFound : ErrorKind::IoError,
                             "PowerSetActiveScheme " + schemeId + " failed: " + std::to_string(rc));
    }
    return Status::Ok();
}

#endif // _WIN32
