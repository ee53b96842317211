#include "devtier.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>

static const TierSpec kDefaultTiers[kTierCount] = {
    {DeviceTier::Calculator,    512,      1,   "Calculator/8-bit",       "Z80/6502/PIC",            "16x2 LCD",           "tiny-monitor"},
    {DeviceTier::Embedded,      KiB(2),   1,   "Embedded/16-bit",        "ARM Cortex-M/AVR",        "OLED/E-Paper",       "rtos-core"},
    {DeviceTier::Mobile,        GiB(1),   2,   "Mobile/32-bit",          "ARM Cortex-A/Snapdragon", "Touch Display",      "mobile-lite"},
    {DeviceTier::Desktop,       GiB(4),   4,   "Desktop/64-bit",         "Intel/AMD x64",           "4K Monitor",         "desktop-full"},
    {DeviceTier::Workstation,   GiB(16),  8,   "Workstation",            "Xeon/Threadripper",       "Multi-Display",      "workstation-pro"},
    {DeviceTier::Server,        GiB(64),  16,  "Server/Multi-socket",    "Xeon/EPYC",               "Headless",           "server-headless"},
    {DeviceTier::Cluster,       GiB(256), 64,  "Cluster Node",           "HPC Optimized",           "Network Fabric",     "cluster-node"},
    {DeviceTier::Supercomputer, TiB(1),   128, "Supercomputer/Exascale", "Custom Silicon",          "Management Console", "hpc-exascale"},
};

const TierTable& default_tier_table() {
    static const TierTable table(std::begin(kDefaultTiers), std::end(kDefaultTiers));
    return table;
}

bool validate_tier_table(const TierTable& table, std::string& error) {
    if (table.size() != static_cast<size_t>(kTierCount)) {
        error = "tier table must have " + std::to_string(kTierCount) + " entries, got " +
                std::to_string(table.size());
        return false;
    }

    for (size_t i = 0; i < table.size(); ++i) {
        const TierSpec& t = table[i];
        if (static_cast<size_t>(t.tier) != i) {
            error = std::string("entry ") + std::to_string(i) + " is " + tier_name(t.tier) +
                    ", expected " + tier_name(static_cast<DeviceTier>(i));
            return false;
        }
        if (t.min_ram_bytes == 0 || t.min_cores == 0) {
            error = std::string(tier_name(t.tier)) + ": thresholds must be at least 1";
            return false;
        }
        if (i == 0) continue;

        const TierSpec& prev = table[i - 1];
        if (t.min_ram_bytes <= prev.min_ram_bytes) {
            error = std::string(tier_name(t.tier)) + ": memory threshold must be above " +
                    tier_name(prev.tier);
            return false;
        }
        if (t.min_cores < prev.min_cores) {
            error = std::string(tier_name(t.tier)) + ": core threshold must not be below " +
                    tier_name(prev.tier);
            return false;
        }
    }
    return true;
}

OptimizationLevel optimization_for(DeviceTier tier) {
    switch (tier) {
        case DeviceTier::Calculator:    return OptimizationLevel::Minimal;
        case DeviceTier::Embedded:      return OptimizationLevel::Basic;
        case DeviceTier::Mobile:        return OptimizationLevel::Standard;
        case DeviceTier::Desktop:       return OptimizationLevel::Standard;
        case DeviceTier::Workstation:   return OptimizationLevel::Aggressive;
        case DeviceTier::Server:        return OptimizationLevel::Aggressive;
        case DeviceTier::Cluster:       return OptimizationLevel::Extreme;
        case DeviceTier::Supercomputer: return OptimizationLevel::Extreme;
    }
    return OptimizationLevel::Minimal;
}

TierResult classify_tier(const HwFacts& hw) {
    return classify_tier(hw, default_tier_table());
}

// Keeps the last tier whose memory AND core thresholds both hold, so the
// scarcer resource bounds the result. Never stops early.
TierResult classify_tier(const HwFacts& hw, const TierTable& table) {
    TierResult out;

    const TierSpec* matched = nullptr;
    for (const TierSpec& t : table) {
        if (hw.ram_bytes >= t.min_ram_bytes && hw.logical_cores >= t.min_cores) {
            matched = &t;
        }
    }

    std::ostringstream reason;
    if (matched) {
        out.tier = matched->tier;
        reason << "memory >= " << matched->min_ram_bytes << " B and cores >= " << matched->min_cores;
    } else {
        // Below the floor of the table: lowest tier by definition.
        out.tier = DeviceTier::Calculator;
        reason << "below every tier threshold; lowest tier";
    }

    // Name the resource that kept us from the next tier, if any.
    auto next = static_cast<size_t>(out.tier) + (matched ? 1 : 0);
    if (next < table.size()) {
        const TierSpec& up = table[next];
        const bool ram_short = hw.ram_bytes < up.min_ram_bytes;
        const bool cores_short = hw.logical_cores < up.min_cores;
        if (ram_short && cores_short) {
            reason << "; memory and cores below " << tier_name(up.tier);
        } else if (ram_short) {
            reason << "; memory below " << tier_name(up.tier);
        } else if (cores_short) {
            reason << "; cores below " << tier_name(up.tier);
        }
    }

    const size_t idx = static_cast<size_t>(out.tier);
    if (idx < table.size()) {
        out.label = table[idx].label;
        out.os_hint = table[idx].os_hint;
    }
    out.optimization = optimization_for(out.tier);
    out.reason = reason.str();
    return out;
}

const char* tier_name(DeviceTier t) {
    switch (t) {
        case DeviceTier::Calculator: return "Calculator";
        case DeviceTier::Embedded: return "Embedded";
        case DeviceTier::Mobile: return "Mobile";
        case DeviceTier::Desktop: return "Desktop";
        case DeviceTier::Workstation: return "Workstation";
        case DeviceTier::Server: return "Server";
        case DeviceTier::Cluster: return "Cluster";
        case DeviceTier::Supercomputer: return "Supercomputer";
    }
    return "Unknown";
}

const char* tier_scale_description(DeviceTier t) {
    switch (t) {
        case DeviceTier::Calculator: return "8-bit microcontroller scale";
        case DeviceTier::Embedded: return "16-bit embedded scale";
        case DeviceTier::Mobile: return "32-bit mobile scale";
        case DeviceTier::Desktop: return "64-bit desktop scale";
        case DeviceTier::Workstation: return "Professional workstation scale";
        case DeviceTier::Server: return "Enterprise server scale";
        case DeviceTier::Cluster: return "HPC cluster scale";
        case DeviceTier::Supercomputer: return "Exascale supercomputer scale";
    }
    return "Unknown scale";
}

const char* optimization_name(OptimizationLevel o) {
    switch (o) {
        case OptimizationLevel::Minimal: return "Minimal";
        case OptimizationLevel::Basic: return "Basic";
        case OptimizationLevel::Standard: return "Standard";
        case OptimizationLevel::Aggressive: return "Aggressive";
        case OptimizationLevel::Extreme: return "Extreme";
    }
    return "Unknown";
}

const char* architecture_name(Architecture a) {
    switch (a) {
        case Architecture::X86_16: return "x86_16";
        case Architecture::X86_32: return "x86";
        case Architecture::X86_64: return "x86_64";
        case Architecture::Arm32: return "arm";
        case Architecture::Arm64: return "arm64";
        case Architecture::RiscV64: return "riscv64";
        case Architecture::PowerPC64: return "ppc64";
        case Architecture::Unknown: return "unknown";
    }
    return "unknown";
}

const char* host_environment_name(HostEnvironment h) {
    switch (h) {
        case HostEnvironment::PreOsFirmware: return "pre-os";
        case HostEnvironment::Linux: return "linux";
        case HostEnvironment::Android: return "android";
        case HostEnvironment::MacOS: return "macos";
        case HostEnvironment::Windows: return "windows";
        case HostEnvironment::FreeBSD: return "freebsd";
        case HostEnvironment::NetBSD: return "netbsd";
        case HostEnvironment::OpenBSD: return "openbsd";
        case HostEnvironment::DragonFly: return "dragonfly";
    }
    return "unknown";
}

// Reverse lookup over a name function; enums are dense from 0 to Last.
template <typename Enum, typename NameFn>
static bool parse_by_name(const std::string& name, Enum last, NameFn fn, Enum& out) {
    for (int i = 0; i <= static_cast<int>(last); ++i) {
        Enum e = static_cast<Enum>(i);
        if (name == fn(e)) {
            out = e;
            return true;
        }
    }
    return false;
}

bool parse_tier(const std::string& name, DeviceTier& out) {
    return parse_by_name(name, DeviceTier::Supercomputer, tier_name, out);
}

bool parse_optimization(const std::string& name, OptimizationLevel& out) {
    return parse_by_name(name, OptimizationLevel::Extreme, optimization_name, out);
}

bool parse_architecture(const std::string& name, Architecture& out) {
    return parse_by_name(name, Architecture::Unknown, architecture_name, out);
}

bool parse_host_environment(const std::string& name, HostEnvironment& out) {
    return parse_by_name(name, HostEnvironment::DragonFly, host_environment_name, out);
}

Architecture architecture_from_machine(const std::string& machine) {
    std::string m;
    m.reserve(machine.size());
    for (char c : machine) {
        if (!std::isspace(static_cast<unsigned char>(c))) m += (char)std::tolower((unsigned char)c);
    }

    if (m == "x86_64" || m == "amd64" || m == "x64") return Architecture::X86_64;
    if (m == "x86" || m == "i86pc" || m == "i386" || m == "i486" || m == "i586" || m == "i686") {
        return Architecture::X86_32;
    }
    if (m == "aarch64" || m == "arm64" || m == "arm64e" || m == "aarch64_be") return Architecture::Arm64;
    if (m.rfind("arm", 0) == 0 || m.rfind("earm", 0) == 0 || m == "evbarm") return Architecture::Arm32;
    if (m == "riscv64") return Architecture::RiscV64;
    if (m == "ppc64" || m == "ppc64le" || m == "powerpc64" || m == "powerpc64le") return Architecture::PowerPC64;
    return Architecture::Unknown;
}
