/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>
#include <variant>
#include "qlab/quantum/circuit.hpp"
#include "qlab/quantum/histogram.hpp"

namespace qlab {
namespace algorithms {
namespace deutsch_jozsa {

// f(x) = value
struct ConstantOracle {
    bool value = false;
};

// f(x) = XOR of the input bits selected by mask (big-endian, non-zero)
struct BalancedOracle {
    std::string mask;
};

using Oracle = std::variant<ConstantOracle, BalancedOracle>;

Oracle constant_zero();
Oracle constant_one();
Oracle balanced_first(int num_inputs);   // f(x) = x_0
Oracle balanced_parity(int num_inputs);  // f(x) = x_0 ^ ... ^ x_{n-1}

// "constant_zero", "constant_one", "balanced_first", "balanced_parity"
Oracle oracle_from_name(const std::string& name, int num_inputs);
bool is_known_oracle_name(const std::string& name);

// n inputs plus ancilla n; only the inputs are measured.
quantum::QuantumCircuit build(int num_inputs, const Oracle& oracle);

enum class Verdict {
    Constant,
    Balanced,
    Unknown
};

// Constant when the all-zero outcome holds more than 80% of the shots.
Verdict classify(const quantum::Histogram& histogram, int num_inputs);
const char* verdict_name(Verdict verdict);

} // namespace deutsch_jozsa
} // namespace algorithms
} // namespace qlab
