#include "report.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Report shows facts and classification") {
    HwFacts hw{};
    hw.ram_bytes = GiB(256);
    hw.logical_cores = 64;
    hw.cpu_vendor = "AuthenticAMD";
    hw.cpu_clock_mhz = 2450;
    hw.arch = Architecture::X86_64;
    hw.host = HostEnvironment::Linux;
    Profile p = make_profile(hw, default_tier_table());

    const std::string report = format_report(p, default_tier_table());
    REQUIRE(contains(report, "Hardware profile (linux)"));
    REQUIRE(contains(report, "256.00 GiB"));
    REQUIRE(contains(report, "AuthenticAMD"));
    REQUIRE(contains(report, "2450 MHz"));
    REQUIRE(contains(report, "Cluster (Cluster Node)"));
    REQUIRE(contains(report, "HPC cluster scale"));
    REQUIRE(contains(report, "Extreme"));
    REQUIRE(contains(report, "cluster-node"));
    REQUIRE_FALSE(contains(report, "estimated"));
    REQUIRE_FALSE(contains(report, "Note:"));
}

TEST_CASE("Substituted facts are marked in the report") {
    HwFacts hw{};
    hw.host = HostEnvironment::PreOsFirmware;
    normalize_facts(hw, default_tier_table());
    Profile p = make_profile(hw, default_tier_table());

    const std::string report = format_report(p, default_tier_table());
    REQUIRE(contains(report, "Hardware profile (pre-os)"));
    REQUIRE(contains(report, "511 B (511 bytes) [estimated (probe default)]"));
    REQUIRE(contains(report, "Calculator"));
    REQUIRE(contains(report, "Note: some facts could not be read"));
    REQUIRE(contains(report, "CPU vendor:     unknown"));
}

TEST_CASE("Facts mode prints key=value lines") {
    HwFacts hw{};
    hw.ram_bytes = 4096;
    hw.logical_cores = 2;
    hw.arch = Architecture::Arm32;
    hw.host = HostEnvironment::Android;

    const std::string out = format_hw_facts(hw);
    REQUIRE(contains(out, "ram_bytes=4096\n"));
    REQUIRE(contains(out, "logical_cores=2\n"));
    REQUIRE(contains(out, "architecture=arm\n"));
    REQUIRE(contains(out, "host=android\n"));
    REQUIRE(contains(out, "ram_estimated=false\n"));
}

TEST_CASE("Tier line is one word unless a reason is asked for") {
    HwFacts hw{};
    hw.ram_bytes = GiB(8);
    hw.logical_cores = 8;
    TierResult r = classify_tier(hw);

    REQUIRE(format_tier_line(r, false) == "Desktop");
    const std::string with_reason = format_tier_line(r, true);
    REQUIRE(with_reason.rfind("Desktop: ", 0) == 0);
    REQUIRE(contains(with_reason, "memory below Workstation"));
}
