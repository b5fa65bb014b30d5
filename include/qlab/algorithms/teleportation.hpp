/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <string>
#include "qlab/quantum/circuit.hpp"
#include "qlab/quantum/histogram.hpp"

namespace qlab {
namespace algorithms {
namespace teleportation {

enum class NamedState {
    Zero,
    One,
    Plus,
    Minus
};

// "zero", "one", "plus", "minus"
NamedState parse_state(const std::string& name);
bool is_known_state(const std::string& name);
const char* state_name(NamedState state);

/**
 * Teleports a state from qubit 0 to qubit 2.
 *
 * Bell pair on 1-2, Bell measurement on 0-1, then qubit q is read into
 * classical bit q. No correction is applied in the circuit; use
 * corrected_target_counts() on the histogram.
 */
quantum::QuantumCircuit build(NamedState state);

// Teleports cos(theta/2)|0> + e^{i phi} sin(theta/2)|1> (prepared as RY then P).
quantum::QuantumCircuit build_arbitrary(double theta, double phi);

// Which Bell-measurement bit drives the classical X correction.
enum class CorrectionBit {
    Qubit0,  // flip the reported target bit whenever m0 is 1
    Qubit1   // X^{m1}: exact Z-basis statistics, basis states arrive with certainty
};

/**
 * Marginal {"0", "1"} counts of the teleported qubit after the classical X
 * correction. By default the target bit is flipped whenever the bit measured
 * from qubit 0 is 1. Histogram keys are "c2 c1 c0"; keys of any other length
 * are rejected with std::invalid_argument.
 */
quantum::Histogram corrected_target_counts(const quantum::Histogram& histogram,
                                           CorrectionBit rule = CorrectionBit::Qubit0);

} // namespace teleportation
} // namespace algorithms
} // namespace qlab
