/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <qlab/config/validator.hpp>

#include <algorithm>

#include <fmt/core.h>
#include <fmt/ranges.h>

namespace qlab::config {

const std::vector<std::string>& known_algorithms() {
    static const std::vector<std::string> algos{
        "hello", "coin", "bell", "product", "grover", "deutsch_jozsa",
        "bernstein_vazirani", "simon", "qft", "phase_estimation", "adder", "teleport"};
    return algos;
}

bool is_known_algorithm(const std::string& algo, std::string& err) {
    const auto& algos = known_algorithms();
    if (std::find(algos.begin(), algos.end(), algo) == algos.end()) {
        err = fmt::format("unknown algo '{}' (expected one of: {})", algo, fmt::join(algos, ", "));
        return false;
    }
    return true;
}

bool validate_bitstring(const std::string& bits, const std::string& field, std::string& err) {
    if (bits.empty()) { err = fmt::format("{} must not be empty", field); return false; }
    if (!std::all_of(bits.begin(), bits.end(), [](char c) { return c == '0' || c == '1'; })) {
        err = fmt::format("{} must contain only 0 and 1, got '{}'", field, bits); return false; }
    return true;
}

bool validate_positive(long long value, const std::string& field, std::string& err) {
    if (value < 1) { err = fmt::format("{} must be >= 1, got {}", field, value); return false; }
    return true;
}

bool validate_phase(double phase, std::string& err) {
    if (!(phase >= 0.0 && phase <= 1.0)) {
        err = fmt::format("phase must be within [0, 1], got {}", phase); return false; }
    return true;
}

bool validate_register_width(long long width, const std::string& algo, std::string& err) {
    if (width > kMaxRunQubits) {
        err = fmt::format("{} needs {} qubits, limit is {}", algo, width, kMaxRunQubits); return false; }
    return true;
}

bool validate_operand(long long value, int bits, const std::string& field, std::string& err) {
    if (bits < 1 || bits > 14) { err = fmt::format("bits must be within 1..14, got {}", bits); return false; }
    const long long limit = 1LL << bits;
    if (value < 0 || value >= limit) {
        err = fmt::format("{} must be between 0 and {}, got {}", field, limit - 1, value); return false; }
    return true;
}

} // namespace qlab::config
