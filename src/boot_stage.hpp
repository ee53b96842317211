#pragma once

#include "firmware.hpp"
#include "profile.hpp"

#include <functional>
#include <optional>
#include <vector>

enum class BootState {
    Transferred, // control received from the previous loader stage
    Probing,
    Classified,
    Presented,
    Halt,
    Retry        // the sink refused the profile; the upstream loader decides what next
};

const char* boot_state_name(BootState s);

// Shows the profile and/or hands it to the next stage. Returns false if the
// profile could not be delivered.
using ProfileSink = std::function<bool(const Profile&)>;

// Pre-OS sequence for one boot:
//   Transferred -> Probing -> Classified -> Presented -> Halt | Retry
// The profile is computed exactly once; nothing goes back to Probing.
class BootStage {
public:
    BootStage(Firmware& firmware, TierTable table, ProfileSink sink, int retry_limit = kFirmwareRetryLimit);

    BootState state() const { return state_; }
    bool finished() const { return state_ == BootState::Halt || state_ == BootState::Retry; }

    // One transition. A finished machine stays where it is.
    BootState step();
    BootState run();

    const std::optional<Profile>& profile() const { return profile_; }
    const std::vector<BootState>& trace() const { return trace_; }

    MemorySource memory_source() const { return probe_.memory_source(); }
    int firmware_calls() const { return probe_.firmware_calls(); }

private:
    void enter(BootState next);

    FirmwareProbe probe_;
    TierTable table_;
    ProfileSink sink_;

    BootState state_ = BootState::Transferred;
    std::optional<Profile> profile_;
    bool delivered_ = false;
    std::vector<BootState> trace_;
};
