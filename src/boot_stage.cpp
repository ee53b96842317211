#include "boot_stage.hpp"

#include <spdlog/spdlog.h>

#include <utility>

const char* boot_state_name(BootState s) {
    switch (s) {
        case BootState::Transferred: return "TRANSFERRED";
        case BootState::Probing: return "PROBING";
        case BootState::Classified: return "CLASSIFIED";
        case BootState::Presented: return "PRESENTED";
        case BootState::Halt: return "HALT";
        case BootState::Retry: return "RETRY";
    }
    return "UNKNOWN";
}

BootStage::BootStage(Firmware& firmware, TierTable table, ProfileSink sink, int retry_limit)
    : probe_(firmware, retry_limit), table_(std::move(table)), sink_(std::move(sink)) {
    trace_.push_back(state_);
}

void BootStage::enter(BootState next) {
    spdlog::debug("boot stage: {} -> {}", boot_state_name(state_), boot_state_name(next));
    state_ = next;
    trace_.push_back(next);
}

BootState BootStage::step() {
    switch (state_) {
        case BootState::Transferred:
            enter(BootState::Probing);
            break;

        case BootState::Probing: {
            // Firmware failures were already absorbed by the probe's retries and
            // by normalize_facts(); classification always has something to work on.
            HwFacts hw = probe_facts(probe_, table_);
            profile_ = make_profile(hw, table_);
            if (any_estimated(hw)) {
                spdlog::warn("boot stage: continuing with default values (memory source: {})",
                             memory_source_name(probe_.memory_source()));
            }
            enter(BootState::Classified);
            break;
        }

        case BootState::Classified:
            delivered_ = sink_ ? sink_(*profile_) : true;
            enter(BootState::Presented);
            break;

        case BootState::Presented:
            if (!delivered_) spdlog::warn("boot stage: profile was not delivered; handing back to the loader");
            enter(delivered_ ? BootState::Halt : BootState::Retry);
            break;

        case BootState::Halt:
        case BootState::Retry:
            break;
    }
    return state_;
}

BootState BootStage::run() {
    while (!finished()) step();
    return state_;
}
