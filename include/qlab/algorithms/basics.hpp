/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qlab/quantum/circuit.hpp"

namespace qlab {
namespace algorithms {
namespace basics {

// 1 qubit: H then measure. Fair coin.
quantum::QuantumCircuit build_hello();

// n independent fair coins.
quantum::QuantumCircuit build_coin(int num_coins);

// (|00> + |11>)/sqrt(2), both qubits measured.
quantum::QuantumCircuit build_bell_pair();

// H on two qubits, uniform over all four outcomes.
quantum::QuantumCircuit build_product_superposition();

} // namespace basics
} // namespace algorithms
} // namespace qlab
