#include "devtier.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

namespace {

HwFacts facts(uint64_t ram, uint32_t cores) {
    HwFacts hw{};
    hw.ram_bytes = ram;
    hw.logical_cores = cores;
    hw.arch = Architecture::X86_64;
    hw.host = HostEnvironment::Linux;
    return hw;
}

DeviceTier tier_of(uint64_t ram, uint32_t cores) {
    return classify_tier(facts(ram, cores)).tier;
}

} // namespace

TEST_CASE("512 bytes and one core is a Calculator") {
    TierResult r = classify_tier(facts(512, 1));
    REQUIRE(r.tier == DeviceTier::Calculator);
    REQUIRE(r.optimization == OptimizationLevel::Minimal);
    REQUIRE(r.label == "Calculator/8-bit");
    REQUIRE(r.os_hint == "tiny-monitor");
}

TEST_CASE("2 KiB and one core is exactly Embedded") {
    TierResult r = classify_tier(facts(2 * 1024, 1));
    REQUIRE(r.tier == DeviceTier::Embedded);
    REQUIRE(r.optimization == OptimizationLevel::Basic);
}

TEST_CASE("Total system memory of 9.72 GiB with 4 cores is Desktop, not Mobile") {
    REQUIRE(tier_of(10436770529ull, 4) == DeviceTier::Desktop);
    REQUIRE(classify_tier(facts(10436770529ull, 4)).optimization == OptimizationLevel::Standard);

    // A runtime-limited view of the same machine would under-classify.
    REQUIRE(tier_of(GiB(2), 4) == DeviceTier::Mobile);
}

TEST_CASE("256 GiB with 64 cores resolves to Cluster") {
    TierResult r = classify_tier(facts(GiB(256), 64));
    REQUIRE(r.tier == DeviceTier::Cluster);
    REQUIRE(r.optimization == OptimizationLevel::Extreme);

    REQUIRE(tier_of(GiB(256), 63) == DeviceTier::Server);
    REQUIRE(tier_of(GiB(256) - 1, 64) == DeviceTier::Server);
}

TEST_CASE("Every tier is matched exactly at its thresholds") {
    for (const TierSpec& t : default_tier_table()) {
        INFO(tier_name(t.tier));
        REQUIRE(tier_of(t.min_ram_bytes, t.min_cores) == t.tier);
    }
}

TEST_CASE("One unit below either threshold drops to the next lower tier") {
    const TierTable& table = default_tier_table();
    for (size_t i = 1; i < table.size(); ++i) {
        const TierSpec& t = table[i];
        const DeviceTier lower = table[i - 1].tier;
        INFO(tier_name(t.tier));

        REQUIRE(tier_of(t.min_ram_bytes - 1, t.min_cores) == lower);
        if (t.min_cores > table[i - 1].min_cores) {
            REQUIRE(tier_of(t.min_ram_bytes, t.min_cores - 1) == lower);
        }
    }
}

TEST_CASE("The scarcer resource bounds the tier") {
    REQUIRE(tier_of(TiB(4), 1) == DeviceTier::Embedded);
    REQUIRE(tier_of(GiB(2), 256) == DeviceTier::Mobile);

    TierResult r = classify_tier(facts(TiB(4), 1));
    REQUIRE(r.reason.find("cores below Mobile") != std::string::npos);
}

TEST_CASE("More memory never lowers the tier") {
    for (uint32_t cores : {1u, 2u, 4u, 8u, 16u, 64u, 128u, 1024u}) {
        DeviceTier prev = DeviceTier::Calculator;
        for (uint64_t ram = 256; ram <= TiB(4); ram *= 2) {
            DeviceTier t = tier_of(ram, cores);
            REQUIRE(static_cast<int>(t) >= static_cast<int>(prev));
            prev = t;
        }
    }
}

TEST_CASE("More cores never lowers the tier") {
    for (uint64_t ram : {uint64_t{512}, KiB(2), GiB(1), GiB(8), GiB(64), TiB(2)}) {
        DeviceTier prev = DeviceTier::Calculator;
        for (uint32_t cores = 1; cores <= 512; ++cores) {
            DeviceTier t = tier_of(ram, cores);
            REQUIRE(static_cast<int>(t) >= static_cast<int>(prev));
            prev = t;
        }
    }
}

TEST_CASE("Host environment never changes the decision") {
    for (HostEnvironment h : {HostEnvironment::PreOsFirmware, HostEnvironment::Linux, HostEnvironment::Android,
                              HostEnvironment::MacOS, HostEnvironment::Windows, HostEnvironment::FreeBSD,
                              HostEnvironment::NetBSD, HostEnvironment::OpenBSD, HostEnvironment::DragonFly}) {
        HwFacts hw = facts(GiB(32), 12);
        hw.host = h;
        hw.arch = Architecture::Arm64;
        TierResult r = classify_tier(hw);
        REQUIRE(r.tier == DeviceTier::Workstation);
        REQUIRE(r.reason == classify_tier(facts(GiB(32), 12)).reason);
    }
}

TEST_CASE("Extreme inputs still resolve to a tier") {
    REQUIRE(tier_of(0, 0) == DeviceTier::Calculator);
    REQUIRE(tier_of(0, 1) == DeviceTier::Calculator);
    REQUIRE(tier_of(511, 1) == DeviceTier::Calculator);
    REQUIRE(tier_of(std::numeric_limits<uint64_t>::max(), 0) == DeviceTier::Calculator);
    REQUIRE(tier_of(std::numeric_limits<uint64_t>::max(), std::numeric_limits<uint32_t>::max()) ==
            DeviceTier::Supercomputer);

    TierResult r = classify_tier(facts(100, 1));
    REQUIRE(r.reason.find("lowest tier") != std::string::npos);
}

TEST_CASE("Optimization level rises with tier") {
    REQUIRE(optimization_for(DeviceTier::Calculator) == OptimizationLevel::Minimal);
    REQUIRE(optimization_for(DeviceTier::Embedded) == OptimizationLevel::Basic);
    REQUIRE(optimization_for(DeviceTier::Mobile) == OptimizationLevel::Standard);
    REQUIRE(optimization_for(DeviceTier::Desktop) == OptimizationLevel::Standard);
    REQUIRE(optimization_for(DeviceTier::Workstation) == OptimizationLevel::Aggressive);
    REQUIRE(optimization_for(DeviceTier::Server) == OptimizationLevel::Aggressive);
    REQUIRE(optimization_for(DeviceTier::Cluster) == OptimizationLevel::Extreme);
    REQUIRE(optimization_for(DeviceTier::Supercomputer) == OptimizationLevel::Extreme);

    for (int i = 1; i < kTierCount; ++i) {
        REQUIRE(static_cast<int>(optimization_for(static_cast<DeviceTier>(i))) >=
                static_cast<int>(optimization_for(static_cast<DeviceTier>(i - 1))));
    }
}

TEST_CASE("Tier names are stable") {
    REQUIRE(std::string(tier_name(DeviceTier::Calculator)) == "Calculator");
    REQUIRE(std::string(tier_name(DeviceTier::Embedded)) == "Embedded");
    REQUIRE(std::string(tier_name(DeviceTier::Mobile)) == "Mobile");
    REQUIRE(std::string(tier_name(DeviceTier::Desktop)) == "Desktop");
    REQUIRE(std::string(tier_name(DeviceTier::Workstation)) == "Workstation");
    REQUIRE(std::string(tier_name(DeviceTier::Server)) == "Server");
    REQUIRE(std::string(tier_name(DeviceTier::Cluster)) == "Cluster");
    REQUIRE(std::string(tier_name(DeviceTier::Supercomputer)) == "Supercomputer");

    DeviceTier t{};
    REQUIRE(parse_tier("Workstation", t));
    REQUIRE(t == DeviceTier::Workstation);
    REQUIRE_FALSE(parse_tier("workstation", t));

    Architecture a{};
    REQUIRE(parse_architecture("x86_16", a));
    REQUIRE(a == Architecture::X86_16);
    HostEnvironment h{};
    REQUIRE(parse_host_environment("pre-os", h));
    REQUIRE(h == HostEnvironment::PreOsFirmware);
    REQUIRE_FALSE(parse_host_environment("plan9", h));
}

TEST_CASE("Built-in tier table is valid") {
    std::string error;
    REQUIRE(validate_tier_table(default_tier_table(), error));
    REQUIRE(error.empty());
}

TEST_CASE("Out-of-order tier tables are rejected") {
    std::string error;

    TierTable table = default_tier_table();
    table[4].min_ram_bytes = table[3].min_ram_bytes;
    REQUIRE_FALSE(validate_tier_table(table, error));
    REQUIRE(error.find("Workstation") != std::string::npos);

    table = default_tier_table();
    table[2].min_cores = 1;
    table[3].min_cores = 1;
    REQUIRE(validate_tier_table(table, error));
    table[5].min_cores = 4;
    REQUIRE_FALSE(validate_tier_table(table, error));

    table = default_tier_table();
    table.pop_back();
    REQUIRE_FALSE(validate_tier_table(table, error));

    table = default_tier_table();
    std::swap(table[0].tier, table[1].tier);
    REQUIRE_FALSE(validate_tier_table(table, error));

    table = default_tier_table();
    table[0].min_cores = 0;
    REQUIRE_FALSE(validate_tier_table(table, error));
}

TEST_CASE("Machine strings map onto the architecture vocabulary") {
    REQUIRE(architecture_from_machine("x86_64") == Architecture::X86_64);
    REQUIRE(architecture_from_machine("amd64") == Architecture::X86_64);
    REQUIRE(architecture_from_machine("i686") == Architecture::X86_32);
    REQUIRE(architecture_from_machine("aarch64") == Architecture::Arm64);
    REQUIRE(architecture_from_machine("arm64") == Architecture::Arm64);
    REQUIRE(architecture_from_machine("armv7l") == Architecture::Arm32);
    REQUIRE(architecture_from_machine("riscv64") == Architecture::RiscV64);
    REQUIRE(architecture_from_machine("ppc64le") == Architecture::PowerPC64);
    REQUIRE(architecture_from_machine("s390x") == Architecture::Unknown);
    REQUIRE(architecture_from_machine("") == Architecture::Unknown);
    REQUIRE(std::string(architecture_name(architecture_from_machine("mips"))) == "unknown");
}
