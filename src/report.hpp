#pragma once

#include "profile.hpp"

#include <string>

// Console report for a human. Layout is free to change; consumers that need
// stable fields should read encode_profile() instead.
std::string format_report(const Profile& profile, const TierTable& table);

// key=value lines, one per fact.
std::string format_hw_facts(const HwFacts& hw);

// "Desktop" or "Desktop: <reason>"
std::string format_tier_line(const TierResult& result, bool with_reason);
