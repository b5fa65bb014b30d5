/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <string>
#include "qlab/quantum/circuit.hpp"

namespace qlab {
namespace algorithms {
namespace adder {

/**
 * Ripple-carry adder built from MAJ / UMA blocks.
 *
 * Layout for `bits` = b: a on qubits 0..b-1, b on b..2b-1 (both LSB first),
 * carry-in 2b, carry-out 2b+1. The sum replaces the b register; sum bit i
 * is read into classical bit i and the carry-out into classical bit b.
 */
quantum::QuantumCircuit build(std::uint64_t a, std::uint64_t b, int bits = 4);

// Measured (bits+1)-character string to integer.
std::uint64_t decode_sum(const std::string& result);

// Exposed for tests.
void append_majority(quantum::QuantumCircuit& qc, int a, int b, int c);
void append_unmajority(quantum::QuantumCircuit& qc, int a, int b, int c);

} // namespace adder
} // namespace algorithms
} // namespace qlab
