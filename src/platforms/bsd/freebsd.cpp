#include "common.hpp"

#if defined(__FreeBSD__)

#include <string>

HostEnvironment host_environment_platform() {
    return HostEnvironment::FreeBSD;
}

HwFacts fill_hw_facts_platform() {
    HwFacts hw{};
    bsd_common::fill_uname_and_cpuid(hw);

    // RAM
    if (!bsd_common::sysctlbyname_u64("hw.physmem", hw.ram_bytes)) {
        int64_t physmem = 0;
        if (bsd_common::sysctlbyname_i64("hw.realmem", physmem) && physmem > 0) {
            hw.ram_bytes = (uint64_t)physmem;
        }
    }

    // CPU
    int ncpu = 0;
    if (bsd_common::sysctlbyname_int("hw.ncpu", ncpu) && ncpu > 0) {
        hw.logical_cores = (uint32_t)ncpu;
    }

    // hw.machine is "arm64" on every ARM board; machine_arch tells aarch64 from armv7.
    std::string arch;
    if (bsd_common::sysctlbyname_string("hw.machine_arch", arch)) {
        hw.arch = architecture_from_machine(arch);
    }

    int mhz = 0;
    if (bsd_common::sysctlbyname_int("dev.cpu.0.freq", mhz) && mhz > 0) {
        hw.cpu_clock_mhz = (uint32_t)mhz;
    } else if (bsd_common::sysctlbyname_int("hw.clockrate", mhz) && mhz > 0) {
        hw.cpu_clock_mhz = (uint32_t)mhz;
    }

    return hw;
}

#endif
