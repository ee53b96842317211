#include "profile_json.hpp"

#include <limits>

using nlohmann::json;

static json string_or_null(const std::string& s) {
    return s.empty() ? json(nullptr) : json(s);
}

json profile_to_json(const Profile& profile) {
    const HwFacts& hw = profile.facts;
    const TierResult& r = profile.result;

    json estimated = json::array();
    if (hw.ram_estimated) estimated.push_back("memory");
    if (hw.cores_estimated) estimated.push_back("cores");
    if (hw.arch_estimated) estimated.push_back("architecture");

    json j;
    j["schema_version"] = kProfileSchemaVersion;
    j["memory_bytes"] = hw.ram_bytes;
    j["memory_human"] = format_bytes(hw.ram_bytes);
    j["logical_cores"] = hw.logical_cores;
    j["cpu_vendor"] = string_or_null(hw.cpu_vendor);
    j["cpu_clock_mhz"] = hw.cpu_clock_mhz ? json(hw.cpu_clock_mhz) : json(nullptr);
    j["architecture"] = architecture_name(hw.arch);
    j["host"] = host_environment_name(hw.host);
    j["os_release"] = string_or_null(hw.os_release);
    j["tier"] = tier_name(r.tier);
    j["tier_label"] = r.label;
    j["optimization"] = optimization_name(r.optimization);
    j["recommended_os"] = string_or_null(r.os_hint);
    j["estimated"] = estimated;
    return j;
}

std::string encode_profile(const Profile& profile) {
    return profile_to_json(profile).dump(2);
}

namespace {

bool require(const json& j, const char* key, json::value_t type, std::string& error) {
    auto it = j.find(key);
    if (it == j.end()) {
        error = std::string("missing key '") + key + "'";
        return false;
    }
    if (it->type() != type) {
        // Unsigned fields may legitimately arrive as signed integers.
        if (type == json::value_t::number_unsigned && it->is_number_integer() && it->get<int64_t>() >= 0) {
            return true;
        }
        error = std::string("key '") + key + "' has type " + it->type_name();
        return false;
    }
    return true;
}

bool optional_string(const json& j, const char* key, std::string& out, std::string& error) {
    auto it = j.find(key);
    if (it == j.end()) {
        error = std::string("missing key '") + key + "'";
        return false;
    }
    if (it->is_null()) {
        out.clear();
        return true;
    }
    if (!it->is_string()) {
        error = std::string("key '") + key + "' must be a string or null";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

} // namespace

std::optional<Profile> profile_from_json(const json& j, std::string& error) {
    if (!j.is_object()) {
        error = "profile must be a JSON object";
        return std::nullopt;
    }

    if (!require(j, "schema_version", json::value_t::number_unsigned, error)) return std::nullopt;
    if (j["schema_version"].get<uint64_t>() != static_cast<uint64_t>(kProfileSchemaVersion)) {
        error = "unsupported schema_version " + j["schema_version"].dump();
        return std::nullopt;
    }

    if (!require(j, "memory_bytes", json::value_t::number_unsigned, error)) return std::nullopt;
    if (!require(j, "memory_human", json::value_t::string, error)) return std::nullopt;
    if (!require(j, "logical_cores", json::value_t::number_unsigned, error)) return std::nullopt;
    if (!require(j, "architecture", json::value_t::string, error)) return std::nullopt;
    if (!require(j, "host", json::value_t::string, error)) return std::nullopt;
    if (!require(j, "tier", json::value_t::string, error)) return std::nullopt;
    if (!require(j, "tier_label", json::value_t::string, error)) return std::nullopt;
    if (!require(j, "optimization", json::value_t::string, error)) return std::nullopt;
    if (!require(j, "estimated", json::value_t::array, error)) return std::nullopt;

    Profile p;
    HwFacts& hw = p.facts;
    TierResult& r = p.result;

    hw.ram_bytes = j["memory_bytes"].get<uint64_t>();

    const uint64_t cores = j["logical_cores"].get<uint64_t>();
    if (cores == 0 || cores > std::numeric_limits<uint32_t>::max()) {
        error = "logical_cores out of range";
        return std::nullopt;
    }
    hw.logical_cores = static_cast<uint32_t>(cores);

    if (!optional_string(j, "cpu_vendor", hw.cpu_vendor, error)) return std::nullopt;
    if (!optional_string(j, "os_release", hw.os_release, error)) return std::nullopt;
    if (!optional_string(j, "recommended_os", r.os_hint, error)) return std::nullopt;

    auto clock = j.find("cpu_clock_mhz");
    if (clock == j.end()) {
        error = "missing key 'cpu_clock_mhz'";
        return std::nullopt;
    }
    if (!clock->is_null()) {
        if (!clock->is_number_integer() || clock->get<int64_t>() <= 0 ||
            clock->get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
            error = "cpu_clock_mhz must be a positive integer or null";
            return std::nullopt;
        }
        hw.cpu_clock_mhz = clock->get<uint32_t>();
    }

    if (!parse_architecture(j["architecture"].get<std::string>(), hw.arch)) {
        error = "unknown architecture '" + j["architecture"].get<std::string>() + "'";
        return std::nullopt;
    }
    if (!parse_host_environment(j["host"].get<std::string>(), hw.host)) {
        error = "unknown host '" + j["host"].get<std::string>() + "'";
        return std::nullopt;
    }
    if (!parse_tier(j["tier"].get<std::string>(), r.tier)) {
        error = "unknown tier '" + j["tier"].get<std::string>() + "'";
        return std::nullopt;
    }
    if (!parse_optimization(j["optimization"].get<std::string>(), r.optimization)) {
        error = "unknown optimization '" + j["optimization"].get<std::string>() + "'";
        return std::nullopt;
    }
    if (r.optimization != optimization_for(r.tier)) {
        error = std::string("optimization ") + optimization_name(r.optimization) +
                " does not match tier " + tier_name(r.tier);
        return std::nullopt;
    }
    r.label = j["tier_label"].get<std::string>();

    for (const auto& e : j["estimated"]) {
        if (!e.is_string()) {
            error = "estimated entries must be strings";
            return std::nullopt;
        }
        const std::string fact = e.get<std::string>();
        if (fact == "memory") hw.ram_estimated = true;
        else if (fact == "cores") hw.cores_estimated = true;
        else if (fact == "architecture") hw.arch_estimated = true;
        else {
            error = "unknown estimated fact '" + fact + "'";
            return std::nullopt;
        }
    }

    if (!validate_facts(hw, error)) return std::nullopt;
    return p;
}

std::optional<Profile> decode_profile(const std::string& text, std::string& error) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        error = "not valid JSON";
        return std::nullopt;
    }
    return profile_from_json(j, error);
}
