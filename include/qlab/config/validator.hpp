/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>
#include <vector>

namespace qlab::config {

const std::vector<std::string>& known_algorithms();

bool is_known_algorithm(const std::string& algo, std::string& err);

// Non-empty string over {0,1}; field names the option in the message.
bool validate_bitstring(const std::string& bits, const std::string& field, std::string& err);

bool validate_positive(long long value, const std::string& field, std::string& err);

// phi in [0, 1]
bool validate_phase(double phase, std::string& err);

// 0 <= value < 2^bits
bool validate_operand(long long value, int bits, const std::string& field, std::string& err);

// Largest register a configured run may allocate.
inline constexpr int kMaxRunQubits = 20;

// width is the total qubit count the selected algorithm builds.
bool validate_register_width(long long width, const std::string& algo, std::string& err);

} // namespace qlab::config
