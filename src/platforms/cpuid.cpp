#include "cpuid.hpp"

#include <cstring>

#if defined(__i386__) || defined(__x86_64__)
#define DEVTIER_X86 1
#include <cpuid.h>
#elif defined(_MSC_VER) && (defined(_M_IX86) || defined(_M_X64))
#define DEVTIER_X86 1
#include <intrin.h>
#endif

bool native_cpuid(uint32_t leaf, CpuidRegs& out) {
#if defined(DEVTIER_X86) && defined(_MSC_VER)
    int info[4] = {0};
    __cpuid(info, static_cast<int>(leaf & 0x80000000u));
    if (static_cast<uint32_t>(info[0]) < leaf) return false;
    __cpuid(info, static_cast<int>(leaf));
    out.eax = static_cast<uint32_t>(info[0]);
    out.ebx = static_cast<uint32_t>(info[1]);
    out.ecx = static_cast<uint32_t>(info[2]);
    out.edx = static_cast<uint32_t>(info[3]);
    return true;
#elif defined(DEVTIER_X86)
    unsigned int a = 0, b = 0, c = 0, d = 0;
    // __get_cpuid checks the leaf against the max for its range.
    if (!__get_cpuid(leaf, &a, &b, &c, &d)) return false;
    out.eax = a;
    out.ebx = b;
    out.ecx = c;
    out.edx = d;
    return true;
#else
    (void)leaf;
    (void)out;
    return false;
#endif
}

std::string cpuid_vendor_string(const CpuidRegs& leaf0) {
    char vendor[13] = {0};
    std::memcpy(vendor, &leaf0.ebx, 4);
    std::memcpy(vendor + 4, &leaf0.edx, 4);
    std::memcpy(vendor + 8, &leaf0.ecx, 4);
    return std::string(vendor);
}

std::string native_cpu_vendor() {
    CpuidRegs r;
    if (!native_cpuid(0, r)) return {};
    return cpuid_vendor_string(r);
}

uint32_t native_cpu_base_mhz() {
    CpuidRegs r;
    if (!native_cpuid(0x16, r)) return 0;
    return r.eax & 0xFFFFu;
}
