#include "tier_config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

// ---------- tiny helpers ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

bool parse_byte_size(const std::string& text, uint64_t& out)
{
    size_t i = 0;
    while (i < text.size() && std::isspace((unsigned char)text[i])) ++i;

    const size_t digits_begin = i;
    uint64_t value = 0;
    while (i < text.size() && std::isdigit((unsigned char)text[i])) {
        const uint64_t d = static_cast<uint64_t>(text[i] - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - d) / 10) return false;
        value = value * 10 + d;
        ++i;
    }
    if (i == digits_begin) return false;

    while (i < text.size() && std::isspace((unsigned char)text[i])) ++i;
    std::string unit;
    while (i < text.size() && !std::isspace((unsigned char)text[i])) unit += text[i++];
    while (i < text.size() && std::isspace((unsigned char)text[i])) ++i;
    if (i != text.size()) return false;

    int shift = 0;
    if (unit.empty() || unit == "B")                 shift = 0;
    else if (unit == "KiB" || unit == "K")           shift = 10;
    else if (unit == "MiB" || unit == "M")           shift = 20;
    else if (unit == "GiB" || unit == "G")           shift = 30;
    else if (unit == "TiB" || unit == "T")           shift = 40;
    else return false;

    if (shift > 0 && value > (std::numeric_limits<uint64_t>::max() >> shift)) return false;
    out = value << shift;
    return true;
}

// ---------- from_yaml helpers ----------

static bool from_yaml(const YAML::Node& node, TierSpec& out, std::string& error)
{
    if (auto mem = node["min_memory"]) {
        if (!parse_byte_size(mem.as<std::string>(), out.min_ram_bytes)) {
            error = std::string(tier_name(out.tier)) + ": bad min_memory '" + mem.as<std::string>() + "'";
            return false;
        }
    }
    out.min_cores    = get_or<uint32_t>(node, "min_cores", out.min_cores);
    out.label        = get_or<std::string>(node, "label", out.label);
    out.arch_hint    = get_or<std::string>(node, "arch_hint", out.arch_hint);
    out.display_hint = get_or<std::string>(node, "display_hint", out.display_hint);
    out.os_hint      = get_or<std::string>(node, "os_hint", out.os_hint);
    return true;
}

static bool from_yaml(const YAML::Node& root, TierTable& table, std::string& error)
{
    auto tiers = root["tiers"];
    if (!tiers || !tiers.IsSequence()) {
        error = "expected a 'tiers' sequence";
        return false;
    }

    const TierTable& defaults = default_tier_table();
    table.clear();
    for (const auto& tn : tiers) {
        const std::string name = get_or<std::string>(tn, "name", "");
        DeviceTier tier{};
        if (!parse_tier(name, tier)) {
            error = "unknown tier name '" + name + "'";
            return false;
        }

        TierSpec spec = defaults[static_cast<size_t>(tier)];
        if (!from_yaml(tn, spec, error)) return false;
        table.push_back(std::move(spec));
    }
    return true;
}

std::optional<TierTable> parse_tier_table_yaml(const std::string& text, std::string& error)
{
    TierTable table;
    try {
        YAML::Node root = YAML::Load(text);
        if (!from_yaml(root, table, error)) return std::nullopt;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return std::nullopt;
    }

    if (!validate_tier_table(table, error)) return std::nullopt;
    return table;
}

std::optional<TierTable> load_tier_table_file(const std::string& path, std::string& error)
{
    std::ifstream f(path);
    if (!f) {
        error = "cannot open " + path;
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << f.rdbuf();

    auto table = parse_tier_table_yaml(ss.str(), error);
    if (!table) {
        error = path + ": " + error;
        return std::nullopt;
    }
    spdlog::debug("loaded tier table from {}", path);
    return table;
}

// ---------- to_yaml ----------

static std::string size_string(uint64_t bytes)
{
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    int unit = 0;
    while (unit < 4 && bytes != 0 && (bytes % 1024) == 0) {
        bytes /= 1024;
        ++unit;
    }
    return std::to_string(bytes) + units[unit];
}

std::string tier_table_to_yaml(const TierTable& table)
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "tiers" << YAML::Value << YAML::BeginSeq;
    for (const auto& t : table) {
        out << YAML::BeginMap;
        out << YAML::Key << "name"         << YAML::Value << tier_name(t.tier);
        out << YAML::Key << "min_memory"   << YAML::Value << size_string(t.min_ram_bytes);
        out << YAML::Key << "min_cores"    << YAML::Value << t.min_cores;
        out << YAML::Key << "label"        << YAML::Value << t.label;
        out << YAML::Key << "arch_hint"    << YAML::Value << t.arch_hint;
        out << YAML::Key << "display_hint" << YAML::Value << t.display_hint;
        out << YAML::Key << "os_hint"      << YAML::Value << t.os_hint;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}
