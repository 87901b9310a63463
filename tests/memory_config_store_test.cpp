#include "memory_config_store.h"

#include <algorithm>
#include <cassert>
#include <iostream>

namespace
{

bool Has(const std::vector<std::string>& names, const std::string& name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

void TestReadDistinguishesAbsentFromError()
{
    MemoryConfigStore store;

    ReadResult missing = store.Read("HKCU\\Nothing\\Here", "x");
    assert(missing.status.ok());
    assert(!missing.existed);

    ReadResult badRoot = store.Read("HKXX\\Software", "x");
    assert(badRoot.status.kind == ErrorKind::InvalidArgument);
}

void TestWriteCreatesIntermediateKeys()
{
    MemoryConfigStore store;
    assert(store.Write("HKCU\\Software\\Vendor\\App", "Level", ConfigValue::Int32(3)).ok());

    ReadResult r = store.Read("hkey_current_user/software/vendor/app", "LEVEL");
    assert(r.status.ok() && r.existed);
    assert(r.value == ConfigValue::Int32(3));

    std::vector<std::string> children;
    assert(store.EnumerateChildren("HKCU\\Software", children).ok());
    assert(children.size() == 1 && children[0] == "Vendor");

    assert(store.Write("HKCU\\X", "v", ConfigValue::Absent()).kind == ErrorKind::InvalidArgument);
}

void TestDeleteIsIdempotent()
{
    MemoryConfigStore store;
    assert(store.Write("HKLM\\SOFTWARE\\T", "v", ConfigValue::String("a")).ok());
    assert(store.Delete("HKLM\\SOFTWARE\\T", "v").ok());
    assert(!store.Read("HKLM\\SOFTWARE\\T", "v").existed);

    const size_t before = store.MutationCount();
    assert(store.Delete("HKLM\\SOFTWARE\\T", "v").ok());
    assert(store.Delete("HKLM\\SOFTWARE\\Missing\\Key", "v").ok());
    assert(store.MutationCount() == before);
}

void TestEnumeration()
{
    MemoryConfigStore store;
    const std::string ifaces = "HKLM\\SYSTEM\\CurrentControlSet\\Services\\Tcpip\\Parameters\\Interfaces";
    assert(store.CreateKey(ifaces + "\\{A}").ok());
    assert(store.CreateKey(ifaces + "\\{B}\\Nested").ok());
    assert(store.Write(ifaces + "\\{A}", "DhcpIPAddress", ConfigValue::String("10.0.0.2")).ok());

    std::vector<std::string> children;
    assert(store.EnumerateChildren(ifaces, children).ok());
    assert(children.size() == 2);
    assert(Has(children, "{A}") && Has(children, "{B}"));

    std::vector<std::string> values;
    assert(store.EnumerateValues(ifaces + "\\{A}", values).ok());
    assert(values.size() == 1 && values[0] == "DhcpIPAddress");

    assert(store.EnumerateChildren("HKLM\\Nope", children).kind == ErrorKind::NotFound);
    assert(store.EnumerateValues("HKLM\\Nope", values).kind == ErrorKind::NotFound);
}

void TestProtectedSubtree()
{
    MemoryConfigStore store;
    assert(store.Write("HKLM\\SOFTWARE\\Policies\\Locked", "v", ConfigValue::Int32(1)).ok());

    store.Protect("HKLM\\SOFTWARE\\Policies");
    assert(store.Write("HKLM\\SOFTWARE\\Policies\\Locked", "v", ConfigValue::Int32(0)).kind
           == ErrorKind::PermissionDenied);
    assert(store.Delete("HKLM\\SOFTWARE\\Policies\\Locked", "v").kind == ErrorKind::PermissionDenied);
    assert(store.Read("HKLM\\SOFTWARE\\Policies\\Locked", "v").existed);

    // Siblings sharing a name prefix are not covered
    assert(store.Write("HKLM\\SOFTWARE\\PoliciesOther", "v", ConfigValue::Int32(0)).ok());

    store.Protect("HKLM\\SOFTWARE\\Policies", true);
    assert(store.Read("HKLM\\SOFTWARE\\Policies\\Locked", "v").status.kind == ErrorKind::PermissionDenied);

    store.Unprotect("HKLM\\SOFTWARE\\Policies");
    assert(store.Write("HKLM\\SOFTWARE\\Policies\\Locked", "v", ConfigValue::Int32(0)).ok());
}

} // namespace

int main()
{
    TestReadDistinguishesAbsentFromError();
    TestWriteCreatesIntermediateKeys();
    TestDeleteIsIdempotent();
    TestEnumeration();
    TestProtectedSubtree();

    std::cout << "memory_config_store_test: pass\n";
    return 0;
}
