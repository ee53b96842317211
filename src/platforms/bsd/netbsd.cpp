#include "common.hpp"

#if defined(__NetBSD__)

#include <string>

HostEnvironment host_environment_platform() {
    return HostEnvironment::NetBSD;
}

HwFacts fill_hw_facts_platform() {
    HwFacts hw{};
    bsd_common::fill_uname_and_cpuid(hw);

    // RAM: hw.physmem64 is reliable on NetBSD. hw.physmem may be -1 on some systems.
    if (!bsd_common::sysctlbyname_u64("hw.physmem64", hw.ram_bytes)) {
        int64_t physmem = 0;
        if (bsd_common::sysctlbyname_i64("hw.physmem", physmem) && physmem > 0) {
            hw.ram_bytes = (uint64_t)physmem;
        }
    }

    // CPU threads
    int ncpu = 0;
    if (bsd_common::sysctlbyname_int("hw.ncpu", ncpu) && ncpu > 0) {
        hw.logical_cores = (uint32_t)ncpu;
    }

    // uname -m is the port name ("evbarm", "amd64"); machine_arch is the CPU.
    std::string arch;
    if (bsd_common::sysctlbyname_string("hw.machine_arch", arch)) {
        hw.arch = architecture_from_machine(arch);
    }

    int64_t hz = 0;
    if (bsd_common::sysctlbyname_i64("machdep.tsc_freq", hz) && hz > 0) {
        hw.cpu_clock_mhz = (uint32_t)(hz / 1000000);
    }

    return hw;
}

#endif
