/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace qlab {
namespace quantum {

// Big-endian bitstring -> shot count
using Histogram = std::map<std::string, std::uint64_t>;

std::uint64_t total_counts(const Histogram& histogram);

// Highest count; ties resolve to the lexicographically smallest key.
std::optional<std::string> most_frequent(const Histogram& histogram);

// count(key) / total, 0.0 for an empty histogram
double probability_of(const Histogram& histogram, const std::string& key);

} // namespace quantum
} // namespace qlab
