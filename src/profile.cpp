#include "profile.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <sstream>

static std::string printable_ascii(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u >= 0x20 && u < 0x7f) out += c;
    }
    // CPUID vendor strings and registry values come padded.
    while (!out.empty() && out.front() == ' ') out.erase(out.begin());
    while (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

void normalize_facts(HwFacts& hw, const TierTable& table) {
    if (hw.ram_bytes == 0) {
        const uint64_t floor = table.empty() ? 1 : table.front().min_ram_bytes;
        hw.ram_bytes = floor > 0 ? floor - 1 : 0;
        hw.ram_estimated = true;
        spdlog::warn("memory size unavailable; using default of {} bytes", hw.ram_bytes);
    }

    if (hw.logical_cores == 0) {
        hw.logical_cores = 1;
        hw.cores_estimated = true;
        spdlog::warn("core count unavailable; assuming 1 core");
    }

    if (hw.arch == Architecture::Unknown) {
        hw.arch_estimated = true;
        spdlog::warn("architecture not recognised; reporting unknown");
    }

    hw.cpu_vendor = printable_ascii(hw.cpu_vendor);
    hw.os_release = printable_ascii(hw.os_release);
}

bool validate_facts(const HwFacts& hw, std::string& error) {
    if (hw.logical_cores == 0) {
        error = "logical core count must be at least 1";
        return false;
    }
    if (hw.ram_bytes == 0 && !hw.ram_estimated) {
        error = "memory size is zero but not marked as estimated";
        return false;
    }
    if (hw.arch == Architecture::Unknown && !hw.arch_estimated) {
        error = "architecture is unknown but not marked as estimated";
        return false;
    }
    return true;
}

bool any_estimated(const HwFacts& hw) {
    return hw.ram_estimated || hw.cores_estimated || hw.arch_estimated;
}

Profile make_profile(const HwFacts& hw, const TierTable& table) {
    Profile p;
    p.facts = hw;
    p.result = classify_tier(hw, table);

    spdlog::info("classified as {} ({}), optimization {}",
                 tier_name(p.result.tier), p.result.label, optimization_name(p.result.optimization));
    spdlog::debug("classification reason: {}", p.result.reason);
    return p;
}

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};

    if (bytes < 1024) return std::to_string(bytes) + " B";

    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 6) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value << ' ' << units[unit];
    return ss.str();
}
