#include "constants.h"
#include "memory_services.h"
#include "service_control.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace
{

using std::chrono::milliseconds;

const milliseconds TIMEOUT{1000};

void TestNames()
{
    ServiceRunState state;
    assert(ParseServiceRunState(ServiceRunStateName(ServiceRunState::Running), state));
    assert(state == ServiceRunState::Running);
    assert(!ParseServiceRunState("paused", state));

    ServiceStartType type;
    assert(std::string(ServiceStartTypeName(ServiceStartType::Automatic)) == "auto");
    assert(ParseServiceStartType("disabled", type) && type == ServiceStartType::Disabled);
    assert(!ParseServiceStartType("delayed", type));
}

void TestRunStateCaptureAndRestore()
{
    auto services = std::make_shared<MemoryServiceControl>();
    services->AddService("SysMain", ServiceRunState::Running);

    ServiceRunState captured = ServiceRunState::Stopped;
    assert(CaptureServiceRunState(services, "SysMain", TIMEOUT, captured).ok());
    assert(captured == ServiceRunState::Running);

    assert(RestoreServiceRunState(services, "sysmain", ServiceRunState::Stopped, TIMEOUT).ok());
    ServiceRunState now;
    assert(services->GetRunState("SysMain", now) && now == ServiceRunState::Stopped);
    assert(services->ChangeCount() == 1);

    // Already there
    assert(RestoreServiceRunState(services, "SysMain", ServiceRunState::Stopped, TIMEOUT).ok());
    assert(services->ChangeCount() == 1);
}

void TestFailuresPropagate()
{
    auto services = std::make_shared<MemoryServiceControl>();
    ServiceRunState state;
    assert(CaptureServiceRunState(services, "Nope", TIMEOUT, state).kind == ErrorKind::NotFound);

    services->AddService("WSearch", ServiceRunState::Stopped, ServiceStartType::Disabled);
    assert(RestoreServiceRunState(services, "WSearch", ServiceRunState::Running, TIMEOUT).kind
           == ErrorKind::InvalidArgument);

    services->Fail("WSearch", Status::Error(ErrorKind::PermissionDenied, "needs admin"));
    assert(CaptureServiceRunState(services, "WSearch", TIMEOUT, state).kind == ErrorKind::PermissionDenied);
    services->ClearFailure("WSearch");
    assert(CaptureServiceRunState(services, "WSearch", TIMEOUT, state).ok());

    std::shared_ptr<ServiceControl> none;
    assert(CaptureServiceRunState(none, "WSearch", TIMEOUT, state).kind == ErrorKind::InvalidArgument);
}

void TestUnresponsiveServiceTimesOut()
{
    auto services = std::make_shared<MemoryServiceControl>();
    services->AddService("Hung", ServiceRunState::Running);
    services->SetDelay("Hung", milliseconds(300));

    const auto start = std::chrono::steady_clock::now();
    ServiceRunState state = ServiceRunState::Stopped;
    Status s = CaptureServiceRunState(services, "Hung", milliseconds(30), state);
    const auto waited = std::chrono::steady_clock::now() - start;

    assert(s.kind == ErrorKind::Timeout);
    assert(waited < milliseconds(250));
    assert(state == ServiceRunState::Stopped);

    // Let the abandoned query finish before the control goes away
    std::this_thread::sleep_for(milliseconds(400));
}

void TestStartTypes()
{
    auto services = std::make_shared<MemoryServiceControl>();
    services->AddService("SysMain", ServiceRunState::Running, ServiceStartType::Automatic);

    ServiceStartType type = ServiceStartType::Manual;
    assert(CaptureServiceStartType(services, "SysMain", TIMEOUT, type).ok());
    assert(type == ServiceStartType::Automatic);

    assert(RestoreServiceStartType(services, "SysMain", ServiceStartType::Disabled, TIMEOUT).ok());
    assert(services->GetStartType("SysMain", type) && type == ServiceStartType::Disabled);
    const size_t changes = services->ChangeCount();
    assert(RestoreServiceStartType(services, "SysMain", ServiceStartType::Disabled, TIMEOUT).ok());
    assert(services->ChangeCount() == changes);
}

void TestPowerPlan()
{
    auto power = std::make_shared<MemoryPowerSchemeControl>();
    std::string scheme;
    assert(CaptureActivePowerPlan(power, TIMEOUT, scheme).kind == ErrorKind::NotFound);

    assert(RestoreActivePowerPlan(power, "381B4222-F694-41F0-9685-FF5BB260DF2E", TIMEOUT).ok());
    assert(power->Active() == POWER_SCHEME_BALANCED);
    assert(CaptureActivePowerPlan(power, TIMEOUT, scheme).ok());
    assert(scheme == POWER_SCHEME_BALANCED);

    assert(RestoreActivePowerPlan(power, "", TIMEOUT).kind == ErrorKind::InvalidArgument);

    power->Fail(Status::Error(ErrorKind::PermissionDenied, "policy"));
    assert(RestoreActivePowerPlan(power, POWER_SCHEME_ULTIMATE, TIMEOUT).kind == ErrorKind::PermissionDenied);
    power->Fail(Status::Ok());

    power->SetDelay(milliseconds(300));
    assert(CaptureActivePowerPlan(power, milliseconds(30), scheme).kind == ErrorKind::Timeout);
    std::this_thread::sleep_for(milliseconds(400));
}

} // namespace

int main()
{
    TestNames();
    TestRunStateCaptureAndRestore();
    TestFailuresPropagate();
    TestUnresponsiveServiceTimesOut();
    TestStartTypes();
    TestPowerPlan();

    std::cout << "service_control_test: pass\n";
    return 0;
}
