#include "boot_stage.hpp"
#include "devtier.hpp"
#include "firmware.hpp"
#include "probe.hpp"
#include "profile_json.hpp"
#include "report.hpp"
#include "tier_config.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#ifndef DEVTIER_VERSION
#define DEVTIER_VERSION "0.0.0"
#endif

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUnsupported = 1;
constexpr int kExitUsage = 2;
constexpr int kExitContract = 3;

const char* kUsage =
    "Usage: devtier [--detect | --json | --hwfacts | --boot | --dump-tiers] [options]\n"
    "  Prints a single-word device tier.\n"
    "  --detect          Print a full hardware and classification report.\n"
    "  --json            Print the profile as JSON.\n"
    "  --hwfacts         Print detected hardware facts as key=value lines.\n"
    "  --boot            Run the firmware boot stage against this machine's firmware tables.\n"
    "  --dump-tiers      Print the active tier table as YAML.\n"
    "  --reason          Include a short explanation with the tier word.\n"
    "  --tiers FILE      Load the tier table from a YAML file (default: $DEVTIER_TIERS).\n"
    "  --log-level LVL   trace, debug, info, warn, error, critical or off (default: warn).\n"
    "  --version         Show version.\n"
    "  -h, --help        Show this help.\n";

void setup_logging(const std::string& level_name) {
    auto logger = spdlog::stderr_color_mt("devtier");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("devtier: [%^%l%$] %v");
    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();
    if (!level_name.empty()) spdlog::set_level(spdlog::level::from_str(level_name));
}

bool valid_level(const std::string& name) {
    return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

std::optional<TierTable> active_tier_table(const std::string& tiers_path) {
    std::string path = tiers_path;
    if (path.empty()) {
        if (const char* env = std::getenv("DEVTIER_TIERS")) path = env;
    }
    if (path.empty()) return default_tier_table();

    std::string error;
    auto table = load_tier_table_file(path, error);
    if (!table) {
        spdlog::error("tier table {}: {}", path, error);
        return std::nullopt;
    }
    spdlog::info("using tier table from {}", path);
    return table;
}

int unsupported() {
    std::cerr << "devtier: unsupported environment\n";
    return kExitUnsupported;
}

} // namespace

int main(int argc, char** argv) {
    bool want_detect = false;
    bool want_json = false;
    bool want_hwfacts = false;
    bool want_boot = false;
    bool want_dump_tiers = false;
    bool want_reason = false;
    bool want_help = false;
    bool want_version = false;
    std::string tiers_path;
    std::string log_level;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--detect") {
            want_detect = true;
        } else if (arg == "--json") {
            want_json = true;
        } else if (arg == "--hwfacts") {
            want_hwfacts = true;
        } else if (arg == "--boot") {
            want_boot = true;
        } else if (arg == "--dump-tiers") {
            want_dump_tiers = true;
        } else if (arg == "--reason") {
            want_reason = true;
        } else if (arg == "--tiers" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "devtier: " << arg << " needs a value\n" << kUsage;
                return kExitUsage;
            }
            (arg == "--tiers" ? tiers_path : log_level) = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            want_help = true;
        } else if (arg == "--version") {
            want_version = true;
        } else {
            std::cerr << "devtier: unknown option '" << arg << "'\n" << kUsage;
            return kExitUsage;
        }
    }

    if (want_help) {
        std::cout << kUsage;
        return kExitOk;
    }

    if (want_version) {
        std::cout << "devtier " << DEVTIER_VERSION << "\n";
        return kExitOk;
    }

    if (!log_level.empty() && !valid_level(log_level)) {
        std::cerr << "devtier: unknown log level '" << log_level << "'\n";
        return kExitUsage;
    }
    setup_logging(log_level);

    auto table = active_tier_table(tiers_path);
    if (!table) return kExitUsage;

    if (want_dump_tiers) {
        std::cout << tier_table_to_yaml(*table);
        return kExitOk;
    }

    try {
        if (want_boot) {
            auto firmware = make_host_firmware();
            if (!firmware) return unsupported();

            BootStage stage(*firmware, *table, [&](const Profile& p) {
                if (want_json) {
                    std::cout << encode_profile(p) << "\n";
                } else {
                    std::cout << format_report(p, *table);
                }
                std::cout.flush();
                return static_cast<bool>(std::cout);
            });
            BootState end = stage.run();
            spdlog::info("boot stage finished in {} after {} firmware calls", boot_state_name(end),
                         stage.firmware_calls());
            return end == BootState::Halt ? kExitOk : kExitUnsupported;
        }

        auto probe = make_host_probe();
        if (!probe) return unsupported();

        HwFacts hw = probe_facts(*probe, *table);

        if (want_hwfacts) {
            std::cout << format_hw_facts(hw);
            if (!want_detect && !want_json && !want_reason) return kExitOk;
            std::cout << "\n";
        }

        Profile profile = make_profile(hw, *table);

        if (want_json) {
            std::cout << encode_profile(profile) << "\n";
        } else if (want_detect) {
            std::cout << format_report(profile, *table);
        } else {
            std::cout << format_tier_line(profile.result, want_reason) << "\n";
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::critical("profile could not be encoded: {}", e.what());
        return kExitContract;
    }
    return kExitOk;
}
