#pragma once

#include "devtier.hpp"

#include <cstdint>
#include <optional>
#include <string>

// Tier tables as YAML:
//
//   tiers:
//     - name: Calculator
//       min_memory: 512B      # integer bytes or a size with B/KiB/MiB/GiB/TiB
//       min_cores: 1
//       label: Calculator/8-bit
//       ...
//
// Entries are overlaid on the built-in table by name; every tier must appear
// exactly once, in ascending order, and the result must pass
// validate_tier_table().
std::optional<TierTable> parse_tier_table_yaml(const std::string& text, std::string& error);
std::optional<TierTable> load_tier_table_file(const std::string& path, std::string& error);

std::string tier_table_to_yaml(const TierTable& table);

// "2KiB", "4 GiB", "512", "512B" -> bytes
bool parse_byte_size(const std::string& text, uint64_t& out);
