#include "common.hpp"

#if defined(__OpenBSD__)

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

namespace {

static bool sysctl_text(const char* name, std::string& out) {
    std::string cmd = "sysctl -n ";
    cmd += name;
    cmd += " 2>/dev/null";

    FILE* f = popen(cmd.c_str(), "r");
    if (!f) return false;

    char buf[128];
    if (!fgets(buf, sizeof(buf), f)) {
        pclose(f);
        return false;
    }
    pclose(f);

    out = bsd_common::trim(buf);
    return !out.empty();
}

static bool sysctl_u64(const char* name, uint64_t& out) {
    std::string s;
    if (!sysctl_text(name, s)) return false;

    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str()) return false;
    out = static_cast<uint64_t>(v);
    return true;
}

static bool sysctl_u32(const char* name, uint32_t& out) {
    uint64_t v = 0;
    if (!sysctl_u64(name, v)) return false;
    if (v == 0 || v > std::numeric_limits<uint32_t>::max()) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

} // namespace

HostEnvironment host_environment_platform() {
    return HostEnvironment::OpenBSD;
}

HwFacts fill_hw_facts_platform() {
    HwFacts hw{};
    bsd_common::fill_uname_and_cpuid(hw);

    // OpenBSD reports physical memory as bytes in hw.physmem.
    sysctl_u64("hw.physmem", hw.ram_bytes);

    // hw.ncpu counts only online CPUs when SMT is disabled; ncpufound is the hardware.
    if (!sysctl_u32("hw.ncpufound", hw.logical_cores)) sysctl_u32("hw.ncpu", hw.logical_cores);

    uint32_t mhz = 0;
    if (sysctl_u32("hw.cpuspeed", mhz)) hw.cpu_clock_mhz = mhz;

    std::string machine;
    if (sysctl_text("hw.machine", machine)) hw.arch = architecture_from_machine(machine);

    return hw;
}

#endif
