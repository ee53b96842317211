#pragma once

#include <cstdint>
#include <string>

struct CpuidRegs {
    uint32_t eax = 0;
    uint32_t ebx = 0;
    uint32_t ecx = 0;
    uint32_t edx = 0;
};

// False on non-x86 builds or when the leaf is above the CPU's maximum.
bool native_cpuid(uint32_t leaf, CpuidRegs& out);

// Vendor id from leaf 0 ("GenuineIntel", "AuthenticAMD"), empty if unavailable.
std::string cpuid_vendor_string(const CpuidRegs& leaf0);
std::string native_cpu_vendor();

// Base frequency from leaf 0x16 in MHz, 0 if the CPU does not report it.
uint32_t native_cpu_base_mhz();
