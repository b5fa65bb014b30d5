/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/algorithms/basics.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace qlab {
namespace algorithms {
namespace basics {

using quantum::QuantumCircuit;

QuantumCircuit build_hello() {
    QuantumCircuit qc(1, 1);
    qc.h(0);
    qc.measure(0, 0);
    return qc;
}

QuantumCircuit build_coin(int num_coins) {
    if (num_coins <= 0) {
        throw std::invalid_argument(fmt::format("Number of coins must be >= 1, got {}", num_coins));
    }
    QuantumCircuit qc(num_coins, num_coins);
    for (int q = 0; q < num_coins; ++q) {
        qc.h(q);
    }
    for (int q = 0; q < num_coins; ++q) {
        qc.measure(q, q);
    }
    return qc;
}

QuantumCircuit build_bell_pair() {
    QuantumCircuit qc(2, 2);
    qc.h(0);
    qc.cx(0, 1);
    qc.measure(0, 0);
    qc.measure(1, 1);
    return qc;
}

QuantumCircuit build_product_superposition() {
    QuantumCircuit qc(2, 2);
    qc.h(0);
    qc.h(1);
    qc.measure(0, 0);
    qc.measure(1, 1);
    return qc;
}

} // namespace basics
} // namespace algorithms
} // namespace qlab
