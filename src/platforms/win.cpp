#include "platform.hpp"
#include "cpuid.hpp"

#if defined(_WIN32)

#include <cstdint>
#include <string>
#include <vector>

#include <windows.h>

namespace {

static const char* kCpuKey = "HARDWARE\\DESCRIPTION\\System\\CentralProcessor\\0";
static const char* kVersionKey = "SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion";

static bool reg_read_string(const char* subkey, const char* value, std::string& out) {
    HKEY key = nullptr;
    if (RegOpenKeyExA(HKEY_LOCAL_MACHINE, subkey, 0, KEY_READ, &key) != ERROR_SUCCESS) return false;

    DWORD type = 0;
    DWORD size = 0;
    bool ok = false;
    if (RegQueryValueExA(key, value, nullptr, &type, nullptr, &size) == ERROR_SUCCESS &&
        type == REG_SZ && size > 0) {
        std::vector<char> buf(size + 1, '\0');
        if (RegQueryValueExA(key, value, nullptr, nullptr, reinterpret_cast<LPBYTE>(buf.data()), &size) ==
            ERROR_SUCCESS) {
            out = buf.data();
            ok = true;
        }
    }
    RegCloseKey(key);
    return ok;
}

static bool reg_read_dword(const char* subkey, const char* value, DWORD& out) {
    HKEY key = nullptr;
    if (RegOpenKeyExA(HKEY_LOCAL_MACHINE, subkey, 0, KEY_READ, &key) != ERROR_SUCCESS) return false;

    DWORD size = sizeof(out);
    bool ok = RegQueryValueExA(key, value, nullptr, nullptr, reinterpret_cast<LPBYTE>(&out), &size) ==
              ERROR_SUCCESS;
    RegCloseKey(key);
    return ok;
}

static Architecture native_architecture() {
    SYSTEM_INFO si{};
    GetNativeSystemInfo(&si);
    switch (si.wProcessorArchitecture) {
        case PROCESSOR_ARCHITECTURE_AMD64: return Architecture::X86_64;
        case PROCESSOR_ARCHITECTURE_INTEL: return Architecture::X86_32;
        case PROCESSOR_ARCHITECTURE_ARM: return Architecture::Arm32;
#if defined(PROCESSOR_ARCHITECTURE_ARM64)
        case PROCESSOR_ARCHITECTURE_ARM64: return Architecture::Arm64;
#endif
        default: return Architecture::Unknown;
    }
}

} // namespace

HostEnvironment host_environment_platform() {
    return HostEnvironment::Windows;
}

HwFacts fill_hw_facts_platform() {
    HwFacts hw{};

    // RAM
    MEMORYSTATUSEX ms{};
    ms.dwLength = sizeof(ms);
    if (GlobalMemoryStatusEx(&ms)) {
        hw.ram_bytes = static_cast<uint64_t>(ms.ullTotalPhys);
    }

    // CPU: all processor groups, not just the one this thread runs in.
    hw.logical_cores = static_cast<uint32_t>(GetActiveProcessorCount(ALL_PROCESSOR_GROUPS));

    if (!reg_read_string(kCpuKey, "VendorIdentifier", hw.cpu_vendor)) {
        hw.cpu_vendor = native_cpu_vendor();
    }

    DWORD mhz = 0;
    if (reg_read_dword(kCpuKey, "~MHz", mhz) && mhz > 0) {
        hw.cpu_clock_mhz = static_cast<uint32_t>(mhz);
    } else {
        hw.cpu_clock_mhz = native_cpu_base_mhz();
    }

    hw.arch = native_architecture();

    std::string build;
    if (reg_read_string(kVersionKey, "CurrentBuildNumber", build)) {
        std::string display;
        if (reg_read_string(kVersionKey, "DisplayVersion", display)) {
            hw.os_release = display + " (build " + build + ")";
        } else {
            hw.os_release = "build " + build;
        }
    }

    return hw;
}

#endif
