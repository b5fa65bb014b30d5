/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <optional>
#include <string>
#include "qlab/quantum/circuit.hpp"

namespace qlab {
namespace algorithms {
namespace grover {

// max(1, floor(pi/4 * sqrt(2^n)))
int default_iterations(int num_qubits);

// Z on the last qubit controlled by all others (Z for n=1, CZ for n=2).
void append_full_controlled_z(quantum::QuantumCircuit& qc);

// Phase-flips exactly the basis state named by target (big-endian).
void append_oracle(quantum::QuantumCircuit& qc, const std::string& target);

// 2|s><s| - I over the uniform superposition |s>.
void append_diffuser(quantum::QuantumCircuit& qc);

/**
 * Full search circuit over target.size() qubits, all measured.
 * @param iterations Grover iterations, default_iterations() when omitted
 */
quantum::QuantumCircuit build(const std::string& target, std::optional<int> iterations = std::nullopt);

} // namespace grover
} // namespace algorithms
} // namespace qlab
