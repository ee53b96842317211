#pragma once

#include "devtier.hpp"

#if defined(__linux__) || (defined(__APPLE__) && defined(__MACH__)) || defined(_WIN32) || \
    defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__) || defined(__DragonFly__)
#define DEVTIER_HAS_HOST_PROBE 1
#endif

#if defined(DEVTIER_HAS_HOST_PROBE)
// Implemented once per OS under src/platforms/. Raw values only: zero, empty
// or Unknown where the OS would not say.
HwFacts fill_hw_facts_platform();
HostEnvironment host_environment_platform();
#endif

// Kernel-exported firmware memory map with native CPUID to go with it. Other
// CPUs have no CPUID, so a boot-stage run there would misreport the machine.
#if defined(__linux__) && (defined(__i386__) || defined(__x86_64__))
#define DEVTIER_HAS_FIRMWARE_TABLES 1
#endif
