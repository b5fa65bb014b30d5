/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>
#include "qlab/quantum/circuit.hpp"

namespace qlab {
namespace algorithms {
namespace phase_estimation {

/**
 * Estimates phi for U = diag(1, e^{2 pi i phi}).
 *
 * Counting qubits 0..c-1 and eigenstate qubit c (prepared in |1>).
 * Counting qubit i is read into classical bit i, so the measured string is
 * the binary expansion of phi * 2^c, most significant bit first.
 *
 * @param num_counting Counting qubits, c >= 1
 * @param phase phi in [0, 1]
 */
quantum::QuantumCircuit build(int num_counting, double phase);

// Binary fraction: character i from the left has weight 2^-(i+1).
double decode_phase(const std::string& bits);

} // namespace phase_estimation
} // namespace algorithms
} // namespace qlab
