#pragma once

#include "devtier.hpp"

#include <cstdint>
#include <string>

// One run's facts and the classification derived from them.
struct Profile {
    HwFacts facts;
    TierResult result;
};

// Substitutes conservative defaults for facts the probe could not read and
// marks them as estimated:
//   ram_bytes == 0      -> lowest tier threshold - 1
//   logical_cores == 0  -> 1
//   arch == Unknown     -> arch_estimated
// Also strips the vendor string down to printable ASCII.
void normalize_facts(HwFacts& hw, const TierTable& table);

// True once normalize_facts() has run (or the facts were built correctly by hand).
bool validate_facts(const HwFacts& hw, std::string& error);

bool any_estimated(const HwFacts& hw);

Profile make_profile(const HwFacts& hw, const TierTable& table);

// "512 B", "2.00 KiB", "9.72 GiB"
std::string format_bytes(uint64_t bytes);
