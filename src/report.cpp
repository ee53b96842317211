#include "report.hpp"

#include <iomanip>
#include <sstream>

namespace {

constexpr const char* kEstimatedMark = " [estimated (probe default)]";

void row(std::ostringstream& out, const char* key, const std::string& value, bool estimated = false) {
    out << "  " << std::left << std::setw(16) << key << value;
    if (estimated) out << kEstimatedMark;
    out << "\n";
}

std::string or_unknown(const std::string& s) {
    return s.empty() ? "unknown" : s;
}

} // namespace

std::string format_report(const Profile& profile, const TierTable& table) {
    const HwFacts& hw = profile.facts;
    const TierResult& r = profile.result;
    std::ostringstream out;

    out << "Hardware profile (" << host_environment_name(hw.host) << ")\n";
    row(out, "Memory:", format_bytes(hw.ram_bytes) + " (" + std::to_string(hw.ram_bytes) + " bytes)",
        hw.ram_estimated);
    row(out, "Logical cores:", std::to_string(hw.logical_cores), hw.cores_estimated);
    row(out, "CPU vendor:", or_unknown(hw.cpu_vendor));
    row(out, "CPU clock:", hw.cpu_clock_mhz ? std::to_string(hw.cpu_clock_mhz) + " MHz" : "unknown");
    row(out, "Architecture:", architecture_name(hw.arch), hw.arch_estimated);
    if (!hw.os_release.empty()) row(out, "OS release:", hw.os_release);

    out << "\nClassification\n";
    row(out, "Tier:", std::string(tier_name(r.tier)) + " (" + r.label + ")");
    row(out, "Scale:", tier_scale_description(r.tier));

    const size_t idx = static_cast<size_t>(r.tier);
    if (idx < table.size()) {
        const TierSpec& t = table[idx];
        row(out, "Thresholds:", ">= " + format_bytes(t.min_ram_bytes) + ", >= " +
                                    std::to_string(t.min_cores) + (t.min_cores == 1 ? " core" : " cores"));
        row(out, "Typical CPU:", t.arch_hint);
        row(out, "Typical display:", t.display_hint);
    }
    row(out, "Optimization:", optimization_name(r.optimization));
    row(out, "Recommended OS:", r.os_hint.empty() ? "none" : r.os_hint);
    if (!r.reason.empty()) row(out, "Reason:", r.reason);

    if (any_estimated(hw)) {
        out << "\nNote: some facts could not be read and were replaced with conservative defaults;"
               " the tier may be lower than the machine deserves.\n";
    }
    return out.str();
}

std::string format_hw_facts(const HwFacts& hw) {
    std::ostringstream out;
    out << "ram_bytes=" << hw.ram_bytes << "\n";
    out << "logical_cores=" << hw.logical_cores << "\n";
    out << "cpu_vendor=" << hw.cpu_vendor << "\n";
    out << "cpu_clock_mhz=" << hw.cpu_clock_mhz << "\n";
    out << "architecture=" << architecture_name(hw.arch) << "\n";
    out << "host=" << host_environment_name(hw.host) << "\n";
    out << "os_release=" << hw.os_release << "\n";
    out << "ram_estimated=" << (hw.ram_estimated ? "true" : "false") << "\n";
    out << "cores_estimated=" << (hw.cores_estimated ? "true" : "false") << "\n";
    out << "arch_estimated=" << (hw.arch_estimated ? "true" : "false") << "\n";
    return out.str();
}

std::string format_tier_line(const TierResult& result, bool with_reason) {
    std::string line = tier_name(result.tier);
    if (with_reason && !result.reason.empty()) {
        line += ": ";
        line += result.reason;
    }
    return line;
}
