#ifndef TWEAKGUARD_SERVICES_H
#define TWEAKGUARD_SERVICES_H

#ifdef _WIN32

#include "service_control.h"
#include "utils.h"
#include <mutex>

// Service Control Manager backend
class WindowsServiceControl : public ServiceControl
{
public:
    // settleTimeoutMs bounds the wait for START_PENDING/STOP_PENDING to clear
    explicit WindowsServiceControl(int settleTimeoutMs);
    ~WindowsServiceControl() override;

    Status QueryRunState(const std::string& service, ServiceRunState& state) override;
    Status Start(const std::string& service) override;
    Status Stop(const std::string& service) override;
    Status QueryStartType(const std::string& service, ServiceStartType& type) override;
    Status SetStartType(const std::string& service, ServiceStartType type) override;

private:
    Status Initialize();
    Status OpenServiceHandle(const std::string& service, DWORD access, UniqueScHandle& handle);
    Status WaitForState(SC_HANDLE handle, const std::string& service, DWORD target);

    std::mutex m_mutex;
    UniqueScHandle m_scManager;
    int m_settleTimeoutMs;
};

// powrprof backend
class WindowsPowerSchemeControl : public PowerSchemeControl
{
public:
    Status GetActiveScheme(std::string& schemeId) override;
    Status SetActiveScheme(const std::string& schemeId) override;
};

#endif // _WIN32

#endif // TWEAKGUARD_SERVICES_H
