#pragma once

#include "../platform.hpp"

#include <cstdint>
#include <string>

namespace bsd_common {

std::string trim(std::string s);

// Architecture, release and (on x86) vendor/base clock from uname() and CPUID.
// Callers overwrite whatever their own sysctls report better.
void fill_uname_and_cpuid(HwFacts& hw);

#if defined(__FreeBSD__) || defined(__NetBSD__) || defined(__DragonFly__)
bool sysctlbyname_u64(const char* name, uint64_t& out);
bool sysctlbyname_i64(const char* name, int64_t& out);
bool sysctlbyname_int(const char* name, int& out);
bool sysctlbyname_string(const char* name, std::string& out);
#endif

} // namespace bsd_common
