/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/quantum/histogram.hpp"

namespace qlab {
namespace quantum {

std::uint64_t total_counts(const Histogram& histogram) {
    std::uint64_t total = 0;
    for (const auto& [key, count] : histogram) {
        total += count;
    }
    return total;
}

std::optional<std::string> most_frequent(const Histogram& histogram) {
    std::optional<std::string> best;
    std::uint64_t best_count = 0;
    for (const auto& [key, count] : histogram) {
        if (!best || count > best_count) {
            best = key;
            best_count = count;
        }
    }
    return best;
}

double probability_of(const Histogram& histogram, const std::string& key) {
    const std::uint64_t total = total_counts(histogram);
    if (total == 0) {
        return 0.0;
    }
    auto it = histogram.find(key);
    return it == histogram.end() ? 0.0 : static_cast<double>(it->second) / static_cast<double>(total);
}

} // namespace quantum
} // namespace qlab
