#include "platform.hpp"

#if defined(__APPLE__) && defined(__MACH__)

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <sys/sysctl.h>
#include <sys/utsname.h>

namespace {

static bool sysctl_u64(const char* name, uint64_t& out) {
    uint64_t v = 0;
    size_t len = sizeof(v);
    if (sysctlbyname(name, &v, &len, nullptr, 0) != 0) return false;
    out = v;
    return true;
}

static bool sysctl_int(const char* name, int& out) {
    int v = 0;
    size_t len = sizeof(v);
    if (sysctlbyname(name, &v, &len, nullptr, 0) != 0) return false;
    out = v;
    return true;
}

static bool sysctl_bool(const char* name, bool& out) {
    int v = 0;
    if (!sysctl_int(name, v)) return false;
    out = (v != 0);
    return true;
}

static bool sysctl_string(const char* name, std::string& out) {
    size_t len = 0;
    if (sysctlbyname(name, nullptr, &len, nullptr, 0) != 0 || len == 0) return false;
    std::vector<char> buf(len);
    if (sysctlbyname(name, buf.data(), &len, nullptr, 0) != 0) return false;
    out.assign(buf.data(), strnlen(buf.data(), len));
    return true;
}

} // namespace

HostEnvironment host_environment_platform() {
    return HostEnvironment::MacOS;
}

HwFacts fill_hw_facts_platform() {
    HwFacts hw{};

    // RAM
    sysctl_u64("hw.memsize", hw.ram_bytes);

    // CPU
    int logical = 0;
    if (!sysctl_int("hw.logicalcpu", logical) || logical <= 0) sysctl_int("hw.logicalcpu_max", logical);
    if (logical > 0) hw.logical_cores = static_cast<uint32_t>(logical);

    // Apple Silicon reports no vendor or frequency sysctls.
    bool arm64 = false;
    if (sysctl_bool("hw.optional.arm64", arm64) && arm64) {
        hw.cpu_vendor = "Apple";
    } else {
        sysctl_string("machdep.cpu.vendor", hw.cpu_vendor);
        uint64_t hz = 0;
        if (sysctl_u64("hw.cpufrequency", hz) && hz > 0) {
            hw.cpu_clock_mhz = static_cast<uint32_t>(hz / 1000000ull);
        }
    }

    struct utsname u{};
    if (uname(&u) == 0) {
        hw.arch = architecture_from_machine(u.machine);
        hw.os_release = u.release;
    }
    // Rosetta reports x86_64 from uname; the hardware is still arm64.
    if (arm64) hw.arch = Architecture::Arm64;

    return hw;
}

#endif
