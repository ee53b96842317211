#include "common.hpp"

#if defined(__DragonFly__)

HostEnvironment host_environment_platform() {
    return HostEnvironment::DragonFly;
}

HwFacts fill_hw_facts_platform() {
    HwFacts hw{};
    bsd_common::fill_uname_and_cpuid(hw);

    if (!bsd_common::sysctlbyname_u64("hw.physmem64", hw.ram_bytes)) {
        bsd_common::sysctlbyname_u64("hw.physmem", hw.ram_bytes);
    }

    int ncpu = 0;
    if (bsd_common::sysctlbyname_int("hw.ncpu", ncpu) && ncpu > 0) {
        hw.logical_cores = (uint32_t)ncpu;
    }

    int mhz = 0;
    if (bsd_common::sysctlbyname_int("hw.clockrate", mhz) && mhz > 0) {
        hw.cpu_clock_mhz = (uint32_t)mhz;
    }

    return hw;
}

#endif
