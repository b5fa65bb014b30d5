/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace qlab::algorithms::bitstring {

// Non-empty and only '0'/'1'.
bool is_valid(std::string_view bits);

// Throws std::invalid_argument naming `what` unless bits is a valid
// bitstring (of exactly expected_length characters when that is >= 0).
void require_valid(std::string_view bits, std::string_view what, int expected_length = -1);

// Big-endian: qubit 0 is the rightmost character.
bool bit_for_qubit(std::string_view bits, int qubit);

std::string to_bitstring(std::uint64_t value, int width);
std::uint64_t from_bitstring(std::string_view bits);

} // namespace qlab::algorithms::bitstring
