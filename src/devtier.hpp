#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class DeviceTier {
    Calculator,
    Embedded,
    Mobile,
    Desktop,
    Workstation,
    Server,
    Cluster,
    Supercomputer
};

enum class OptimizationLevel {
    Minimal,
    Basic,
    Standard,
    Aggressive,
    Extreme
};

enum class Architecture {
    X86_16,     // x86 without CPUID (8086/286), only seen before an OS is loaded
    X86_32,
    X86_64,
    Arm32,
    Arm64,
    RiscV64,
    PowerPC64,
    Unknown
};

enum class HostEnvironment {
    PreOsFirmware,
    Linux,
    Android,
    MacOS,
    Windows,
    FreeBSD,
    NetBSD,
    OpenBSD,
    DragonFly
};

constexpr int kTierCount = 8;

struct HwFacts {
    // Total installed memory, never a per-process or runtime limit.
    uint64_t ram_bytes = 0;
    uint32_t logical_cores = 0;

    std::string cpu_vendor;          // "GenuineIntel", "ARM", ... empty if unknown
    uint32_t cpu_clock_mhz = 0;      // hint only; 0 if unknown
    Architecture arch = Architecture::Unknown;

    // Where the facts came from. Reporting only, never used by the classifier.
    HostEnvironment host = HostEnvironment::PreOsFirmware;
    std::string os_release;

    // Set by normalize_facts() when a value was substituted with a default.
    bool ram_estimated = false;
    bool cores_estimated = false;
    bool arch_estimated = false;
};

struct TierSpec {
    DeviceTier tier = DeviceTier::Calculator;
    uint64_t min_ram_bytes = 0;
    uint32_t min_cores = 0;
    std::string label;
    std::string arch_hint;
    std::string display_hint;
    std::string os_hint;
};

// Ascending, one entry per DeviceTier.
using TierTable = std::vector<TierSpec>;

struct TierResult {
    DeviceTier tier = DeviceTier::Calculator;
    OptimizationLevel optimization = OptimizationLevel::Minimal;
    std::string label;
    std::string os_hint; // empty when the table has no recommendation
    std::string reason;  // for logs/UI
};

const TierTable& default_tier_table();
bool validate_tier_table(const TierTable& table, std::string& error);

TierResult classify_tier(const HwFacts& hw);
TierResult classify_tier(const HwFacts& hw, const TierTable& table);
OptimizationLevel optimization_for(DeviceTier tier);

const char* tier_name(DeviceTier t);
const char* tier_scale_description(DeviceTier t);
const char* optimization_name(OptimizationLevel o);
const char* architecture_name(Architecture a);
const char* host_environment_name(HostEnvironment h);

bool parse_tier(const std::string& name, DeviceTier& out);
bool parse_optimization(const std::string& name, OptimizationLevel& out);
bool parse_architecture(const std::string& name, Architecture& out);
bool parse_host_environment(const std::string& name, HostEnvironment& out);

// Maps `uname -m` / hw.machine_arch style strings; anything else is Unknown.
Architecture architecture_from_machine(const std::string& machine);

inline constexpr uint64_t KiB(uint64_t x) { return x * 1024ull; }
inline constexpr uint64_t MiB(uint64_t x) { return x * 1024ull * 1024ull; }
inline constexpr uint64_t GiB(uint64_t x) { return x * 1024ull * 1024ull * 1024ull; }
inline constexpr uint64_t TiB(uint64_t x) { return x * 1024ull * 1024ull * 1024ull * 1024ull; }
