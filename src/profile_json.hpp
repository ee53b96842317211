#pragma once

#include "profile.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

constexpr int kProfileSchemaVersion = 1;

// Stable machine-readable encoding; the key set and types are a contract
// with whatever consumes the profile, independent of the text report.
nlohmann::json profile_to_json(const Profile& profile);

// Sorted keys, two-space indent. Throws nlohmann::json::exception only if a
// value cannot be represented, which normalized facts never produce.
std::string encode_profile(const Profile& profile);

std::optional<Profile> profile_from_json(const nlohmann::json& j, std::string& error);
std::optional<Profile> decode_profile(const std::string& text, std::string& error);
