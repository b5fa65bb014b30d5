/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <qlab/algorithms/bitstring.hpp>

#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

namespace qlab::algorithms::bitstring {

bool is_valid(std::string_view bits) {
    return !bits.empty() &&
           std::all_of(bits.begin(), bits.end(), [](char c) { return c == '0' || c == '1'; });
}

void require_valid(std::string_view bits, std::string_view what, int expected_length) {
    if (!is_valid(bits)) {
        throw std::invalid_argument(fmt::format("{} must be a non-empty string of 0/1, got \"{}\"", what, bits));
    }
    if (expected_length >= 0 && static_cast<int>(bits.size()) != expected_length) {
        throw std::invalid_argument(fmt::format(
            "{} must have {} bits, got {} (\"{}\")", what, expected_length, bits.size(), bits));
    }
}

bool bit_for_qubit(std::string_view bits, int qubit) {
    if (qubit < 0 || static_cast<std::size_t>(qubit) >= bits.size()) {
        throw std::out_of_range(fmt::format("Qubit {} outside {}-bit string", qubit, bits.size()));
    }
    return bits[bits.size() - 1 - static_cast<std::size_t>(qubit)] == '1';
}

std::string to_bitstring(std::uint64_t value, int width) {
    if (width <= 0 || width > 64) {
        throw std::invalid_argument(fmt::format("Invalid bitstring width {}", width));
    }
    std::string bits(static_cast<std::size_t>(width), '0');
    for (int q = 0; q < width; ++q) {
        if ((value >> q) & 1ULL) {
            bits[static_cast<std::size_t>(width - 1 - q)] = '1';
        }
    }
    return bits;
}

std::uint64_t from_bitstring(std::string_view bits) {
    require_valid(bits, "bitstring");
    if (bits.size() > 64) {
        throw std::invalid_argument(fmt::format("Bitstring of {} bits does not fit 64 bits", bits.size()));
    }
    std::uint64_t value = 0;
    for (char c : bits) {
        value = (value << 1) | (c == '1' ? 1ULL : 0ULL);
    }
    return value;
}

} // namespace qlab::algorithms::bitstring
