#include "profile_json.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

namespace {

Profile desktop_profile() {
    HwFacts hw{};
    hw.ram_bytes = 10436770529ull;
    hw.logical_cores = 4;
    hw.cpu_vendor = "AuthenticAMD";
    hw.cpu_clock_mhz = 3600;
    hw.arch = Architecture::X86_64;
    hw.host = HostEnvironment::Linux;
    hw.os_release = "6.8.0";
    return make_profile(hw, default_tier_table());
}

Profile firmware_fallback_profile() {
    HwFacts hw{};
    hw.host = HostEnvironment::PreOsFirmware;
    normalize_facts(hw, default_tier_table());
    return make_profile(hw, default_tier_table());
}

} // namespace

TEST_CASE("Profile JSON carries the stable field set") {
    nlohmann::json j = profile_to_json(desktop_profile());

    REQUIRE(j.size() == 14);
    REQUIRE(j["schema_version"] == 1);
    REQUIRE(j["memory_bytes"].get<uint64_t>() == 10436770529ull);
    REQUIRE(j["memory_human"] == "9.72 GiB");
    REQUIRE(j["logical_cores"] == 4);
    REQUIRE(j["cpu_vendor"] == "AuthenticAMD");
    REQUIRE(j["cpu_clock_mhz"] == 3600);
    REQUIRE(j["architecture"] == "x86_64");
    REQUIRE(j["host"] == "linux");
    REQUIRE(j["os_release"] == "6.8.0");
    REQUIRE(j["tier"] == "Desktop");
    REQUIRE(j["tier_label"] == "Desktop/64-bit");
    REQUIRE(j["optimization"] == "Standard");
    REQUIRE(j["recommended_os"] == "desktop-full");
    REQUIRE(j["estimated"].is_array());
    REQUIRE(j["estimated"].empty());
}

TEST_CASE("Unknown optional facts encode as null and defaults are listed") {
    nlohmann::json j = profile_to_json(firmware_fallback_profile());

    REQUIRE(j["cpu_vendor"].is_null());
    REQUIRE(j["cpu_clock_mhz"].is_null());
    REQUIRE(j["os_release"].is_null());
    REQUIRE(j["architecture"] == "unknown");
    REQUIRE(j["host"] == "pre-os");
    REQUIRE(j["tier"] == "Calculator");
    REQUIRE(j["memory_bytes"] == 511);
    REQUIRE(j["estimated"] == nlohmann::json::array({"memory", "cores", "architecture"}));
}

TEST_CASE("Decoding and re-encoding is byte-identical") {
    for (const Profile& p : {desktop_profile(), firmware_fallback_profile()}) {
        const std::string encoded = encode_profile(p);

        std::string error;
        auto decoded = decode_profile(encoded, error);
        REQUIRE(decoded);
        REQUIRE(error.empty());
        REQUIRE(encode_profile(*decoded) == encoded);

        REQUIRE(decoded->facts.ram_bytes == p.facts.ram_bytes);
        REQUIRE(decoded->result.tier == p.result.tier);
        REQUIRE(decoded->facts.ram_estimated == p.facts.ram_estimated);
    }
}

TEST_CASE("Encoding uses sorted keys") {
    const std::string text = encode_profile(desktop_profile());
    REQUIRE(text.find("\"architecture\"") < text.find("\"cpu_clock_mhz\""));
    REQUIRE(text.find("\"tier\"") < text.find("\"tier_label\""));
    REQUIRE(text.rfind("{\n  \"architecture\"", 0) == 0);
}

TEST_CASE("Malformed profiles are rejected with a message") {
    std::string error;

    REQUIRE_FALSE(decode_profile("{not json", error));
    REQUIRE(error == "not valid JSON");

    REQUIRE_FALSE(decode_profile("[1, 2]", error));

    nlohmann::json j = profile_to_json(desktop_profile());

    nlohmann::json missing = j;
    missing.erase("tier");
    REQUIRE_FALSE(profile_from_json(missing, error));
    REQUIRE(error.find("tier") != std::string::npos);

    nlohmann::json zero_cores = j;
    zero_cores["logical_cores"] = 0;
    REQUIRE_FALSE(profile_from_json(zero_cores, error));

    nlohmann::json bad_arch = j;
    bad_arch["architecture"] = "vax";
    REQUIRE_FALSE(profile_from_json(bad_arch, error));
    REQUIRE(error.find("vax") != std::string::npos);

    nlohmann::json bad_host = j;
    bad_host["host"] = "plan9";
    REQUIRE_FALSE(profile_from_json(bad_host, error));

    nlohmann::json mismatch = j;
    mismatch["optimization"] = "Extreme";
    REQUIRE_FALSE(profile_from_json(mismatch, error));

    nlohmann::json bad_estimate = j;
    bad_estimate["estimated"] = nlohmann::json::array({"gpu"});
    REQUIRE_FALSE(profile_from_json(bad_estimate, error));

    nlohmann::json wrong_type = j;
    wrong_type["memory_bytes"] = "lots";
    REQUIRE_FALSE(profile_from_json(wrong_type, error));

    nlohmann::json future = j;
    future["schema_version"] = 2;
    REQUIRE_FALSE(profile_from_json(future, error));

    // 2^32 + 1 must not wrap around to version 1.
    nlohmann::json wrapped = j;
    wrapped["schema_version"] = 4294967297ull;
    REQUIRE_FALSE(profile_from_json(wrapped, error));
    REQUIRE(error.find("4294967297") != std::string::npos);
}

TEST_CASE("Decoded facts must be complete or marked estimated") {
    std::string error;
    nlohmann::json j = profile_to_json(desktop_profile());

    nlohmann::json no_memory = j;
    no_memory["memory_bytes"] = 0;
    REQUIRE_FALSE(profile_from_json(no_memory, error));
    REQUIRE(error.find("memory") != std::string::npos);

    nlohmann::json unknown_arch = j;
    unknown_arch["architecture"] = "unknown";
    REQUIRE_FALSE(profile_from_json(unknown_arch, error));

    nlohmann::json marked = j;
    marked["memory_bytes"] = 0;
    marked["architecture"] = "unknown";
    marked["estimated"] = nlohmann::json::array({"memory", "architecture"});
    auto p = profile_from_json(marked, error);
    REQUIRE(p);
    REQUIRE(p->facts.ram_bytes == 0);
    REQUIRE(p->facts.ram_estimated);
    REQUIRE(p->facts.arch_estimated);
}
