/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>
#include <vector>
#include "qlab/quantum/circuit.hpp"

namespace qlab {
namespace algorithms {
namespace qft {

/**
 * Appends the Fourier transform over the listed qubits.
 *
 * For j = 0..k-1: H on qubits[j], then CP(2*pi / 2^(m-j+1)) controlled by
 * qubits[m] for every m > j; finally the swap network reverses the list.
 * qubits[0] plays the role of the most significant input bit.
 */
void append_qft(quantum::QuantumCircuit& qc, const std::vector<int>& qubits);

// Exact mirror of append_qft over the same list.
void append_inverse_qft(quantum::QuantumCircuit& qc, const std::vector<int>& qubits);

// 0..n-1
std::vector<int> all_qubits(int num_qubits);

// Prepares |initial_state>, applies QFT then its inverse, measures everything.
quantum::QuantumCircuit build_round_trip(const std::string& initial_state);

// H on every qubit followed by the QFT; the result concentrates on |0...0>.
quantum::QuantumCircuit build_uniform_transform(int num_qubits);

} // namespace qft
} // namespace algorithms
} // namespace qlab
