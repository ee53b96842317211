#include "probe.hpp"

#include "platforms/platform.hpp"

#include <spdlog/spdlog.h>

namespace {

#if defined(DEVTIER_HAS_HOST_PROBE)
class HostProbe : public FactProbe {
public:
    HostEnvironment environment() const override { return host_environment_platform(); }

    HwFacts read_facts() override {
        HwFacts hw = fill_hw_facts_platform();
        hw.host = host_environment_platform();
        return hw;
    }
};
#endif

} // namespace

std::unique_ptr<FactProbe> make_host_probe() {
#if defined(DEVTIER_HAS_HOST_PROBE)
    return std::make_unique<HostProbe>();
#else
    spdlog::error("no hardware probe for this operating system");
    return nullptr;
#endif
}

HwFacts probe_facts(FactProbe& probe, const TierTable& table) {
    HwFacts hw = probe.read_facts();
    hw.host = probe.environment();

    spdlog::debug("raw facts from {}: ram_bytes={} logical_cores={} vendor='{}' clock_mhz={} arch={}",
                  host_environment_name(hw.host), hw.ram_bytes, hw.logical_cores, hw.cpu_vendor,
                  hw.cpu_clock_mhz, architecture_name(hw.arch));

    normalize_facts(hw, table);
    return hw;
}

std::optional<HwFacts> detect_hw_facts() {
    auto probe = make_host_probe();
    if (!probe) return std::nullopt;
    return probe_facts(*probe, default_tier_table());
}

std::optional<Profile> detect_profile(const TierTable& table) {
    auto probe = make_host_probe();
    if (!probe) return std::nullopt;
    return make_profile(probe_facts(*probe, table), table);
}

std::optional<TierResult> detect_tier() {
    auto profile = detect_profile(default_tier_table());
    if (!profile) return std::nullopt;
    return profile->result;
}

std::string detect_tier_word() {
    auto result = detect_tier();
    return result ? tier_name(result->tier) : "Unsupported";
}
