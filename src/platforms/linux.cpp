// Fill HwFacts on Linux and Android with NO third-party deps.
// Uses: sysinfo(), /proc, /sys and uname().
//
// Notes:
// - Memory is the kernel's total RAM. Cgroup and container limits are
//   deliberately ignored: a constrained sub-allocation is not the machine.
// - ARM kernels have no vendor_id line; the "CPU implementer" code is mapped
//   to a vendor name instead.

#include "platform.hpp"
#include "cpuid.hpp"

#if defined(__linux__)

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace {

static inline std::string trim(std::string s) {
    auto notspace = [](unsigned char c){ return c != ' ' && c != '\t' && c != '\n' && c != '\r'; };
    while (!s.empty() && !notspace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && !notspace((unsigned char)s.back())) s.pop_back();
    return s;
}

static std::optional<std::string> read_text_file(const std::filesystem::path& p) {
    std::ifstream f(p);
    if (!f) return std::nullopt;
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static std::optional<uint64_t> read_dec_u64_file(const std::filesystem::path& p) {
    auto txt = read_text_file(p);
    if (!txt) return std::nullopt;
    std::string s = trim(*txt);
    uint64_t v = 0;
    try {
        v = std::stoull(s, nullptr, 10);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return v;
}

static uint64_t get_total_ram_bytes_sysinfo() {
    struct sysinfo info{};
    if (sysinfo(&info) != 0) return 0;
    return static_cast<uint64_t>(info.totalram) * info.mem_unit;
}

// "MemTotal:        3884136 kB"
static uint64_t get_total_ram_bytes_meminfo() {
    std::ifstream f("/proc/meminfo");
    std::string line;
    while (std::getline(f, line)) {
        if (line.rfind("MemTotal:", 0) != 0) continue;
        std::istringstream in(line.substr(9));
        uint64_t kb = 0;
        if (in >> kb) return kb * 1024ull;
        spdlog::warn("Failed to parse MemTotal line: {}", line);
        return 0;
    }
    return 0;
}

static const char* arm_implementer_name(uint64_t code) {
    switch (code) {
        case 0x41: return "ARM";
        case 0x42: return "Broadcom";
        case 0x43: return "Cavium";
        case 0x46: return "Fujitsu";
        case 0x48: return "HiSilicon";
        case 0x4e: return "NVIDIA";
        case 0x51: return "Qualcomm";
        case 0x53: return "Samsung";
        case 0x56: return "Marvell";
        case 0x61: return "Apple";
        case 0x69: return "Intel";
        case 0xc0: return "Ampere";
    }
    return "";
}

struct CpuInfo {
    uint32_t logical_cores = 0;
    std::string vendor;
    uint32_t mhz = 0;
};

// - logical_cores: count "processor\t:" lines
// - vendor: x86 "vendor_id", else ARM "CPU implementer"
// - mhz: first "cpu MHz" (x86 only; ARM kernels omit it)
static CpuInfo get_cpu_info_from_proc() {
    CpuInfo out;

    std::ifstream f("/proc/cpuinfo");
    if (!f) return out;

    std::string line;
    while (std::getline(f, line)) {
        auto pos = line.find(':');
        if (pos == std::string::npos) continue;
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));

        if (key == "processor") {
            out.logical_cores++;
        } else if (key == "vendor_id" && out.vendor.empty()) {
            out.vendor = val;
        } else if (key == "CPU implementer" && out.vendor.empty()) {
            try {
                out.vendor = arm_implementer_name(std::stoull(val, nullptr, 16));
            } catch (const std::exception&) {
                spdlog::debug("unparseable CPU implementer '{}'", val);
            }
        } else if (key == "cpu MHz" && out.mhz == 0) {
            try {
                out.mhz = static_cast<uint32_t>(std::stod(val));
            } catch (const std::exception&) {
                spdlog::debug("unparseable cpu MHz '{}'", val);
            }
        }
    }
    return out;
}

static uint32_t get_cpufreq_max_mhz() {
    auto khz = read_dec_u64_file("/sys/devices/system/cpu/cpu0/cpufreq/cpuinfo_max_freq");
    if (!khz || *khz == 0) return 0;
    return static_cast<uint32_t>(*khz / 1000);
}

} // namespace

HostEnvironment host_environment_platform() {
#if defined(__ANDROID__)
    return HostEnvironment::Android;
#else
    return HostEnvironment::Linux;
#endif
}

HwFacts fill_hw_facts_platform() {
    HwFacts hw{};

    // RAM
    hw.ram_bytes = get_total_ram_bytes_sysinfo();
    if (hw.ram_bytes == 0) hw.ram_bytes = get_total_ram_bytes_meminfo();

    // CPU
    CpuInfo c = get_cpu_info_from_proc();
    hw.logical_cores = c.logical_cores;
    if (hw.logical_cores == 0) {
        long n = sysconf(_SC_NPROCESSORS_CONF);
        if (n > 0) hw.logical_cores = static_cast<uint32_t>(n);
    }

    hw.cpu_vendor = c.vendor;
    if (hw.cpu_vendor.empty()) hw.cpu_vendor = native_cpu_vendor();

    hw.cpu_clock_mhz = get_cpufreq_max_mhz();
    if (hw.cpu_clock_mhz == 0) hw.cpu_clock_mhz = c.mhz;

    // Architecture and kernel
    struct utsname u{};
    if (uname(&u) == 0) {
        hw.arch = architecture_from_machine(u.machine);
        hw.os_release = u.release;
    }

    return hw;
}

#endif
