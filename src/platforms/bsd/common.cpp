#include "common.hpp"
#include "../cpuid.hpp"

#include <cstring>
#include <vector>

#if defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__) || defined(__DragonFly__)
#include <sys/types.h>
#include <sys/utsname.h>
#endif

#if defined(__FreeBSD__) || defined(__NetBSD__) || defined(__DragonFly__)
#include <sys/sysctl.h>
#endif

namespace bsd_common {

std::string trim(std::string s) {
    auto notspace = [](unsigned char c){ return c != ' ' && c != '\t' && c != '\n' && c != '\r'; };
    while (!s.empty() && !notspace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && !notspace((unsigned char)s.back())) s.pop_back();
    return s;
}

#if defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__) || defined(__DragonFly__)
void fill_uname_and_cpuid(HwFacts& hw) {
    struct utsname u{};
    if (uname(&u) == 0) {
        hw.arch = architecture_from_machine(u.machine);
        hw.os_release = u.release;
    }
    hw.cpu_vendor = native_cpu_vendor();
    hw.cpu_clock_mhz = native_cpu_base_mhz();
}
#endif

#if defined(__FreeBSD__) || defined(__NetBSD__) || defined(__DragonFly__)
bool sysctlbyname_u64(const char* name, uint64_t& out) {
    uint64_t v = 0;
    size_t len = sizeof(v);
    if (sysctlbyname(name, &v, &len, nullptr, 0) != 0) return false;
    out = v;
    return true;
}

bool sysctlbyname_i64(const char* name, int64_t& out) {
    int64_t v = 0;
    size_t len = sizeof(v);
    if (sysctlbyname(name, &v, &len, nullptr, 0) != 0) return false;
    out = v;
    return true;
}

bool sysctlbyname_int(const char* name, int& out) {
    int v = 0;
    size_t len = sizeof(v);
    if (sysctlbyname(name, &v, &len, nullptr, 0) != 0) return false;
    out = v;
    return true;
}

bool sysctlbyname_string(const char* name, std::string& out) {
    size_t len = 0;
    if (sysctlbyname(name, nullptr, &len, nullptr, 0) != 0 || len == 0) return false;
    std::vector<char> buf(len);
    if (sysctlbyname(name, buf.data(), &len, nullptr, 0) != 0) return false;
    out.assign(buf.data(), strnlen(buf.data(), len));
    return true;
}
#endif

} // namespace bsd_common
