#pragma once

#include "devtier.hpp"
#include "profile.hpp"

#include <memory>
#include <optional>
#include <string>

// A source of raw hardware facts: the host OS, or firmware services before
// an OS exists. read_facts() never fails; facts it cannot read are left at
// zero / empty / Unknown for normalize_facts() to fill in.
class FactProbe {
public:
    virtual ~FactProbe() = default;

    virtual HostEnvironment environment() const = 0;
    virtual HwFacts read_facts() = 0;
};

// Probe for the OS this binary was built for, or nullptr when there is none.
std::unique_ptr<FactProbe> make_host_probe();

// read_facts() + normalize_facts(); the result is complete and valid.
HwFacts probe_facts(FactProbe& probe, const TierTable& table);

// Simple public API: call this and get a single word bucket name.
std::optional<HwFacts> detect_hw_facts();
std::optional<Profile> detect_profile(const TierTable& table);
std::optional<TierResult> detect_tier();
std::string detect_tier_word();
