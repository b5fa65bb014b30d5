/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/algorithms/bernstein_vazirani.hpp"
#include "qlab/algorithms/bitstring.hpp"

namespace qlab {
namespace algorithms {
namespace bernstein_vazirani {

using quantum::QuantumCircuit;

QuantumCircuit build(const std::string& secret) {
    bitstring::require_valid(secret, "Secret");
    const int n = static_cast<int>(secret.size());
    QuantumCircuit qc(n + 1, n);

    // Ancilla in |->
    qc.x(n);
    qc.h(n);
    for (int q = 0; q < n; ++q) {
        qc.h(q);
    }
    for (int q = 0; q < n; ++q) {
        if (bitstring::bit_for_qubit(secret, q)) {
            qc.cx(q, n);
        }
    }
    for (int q = 0; q < n; ++q) {
        qc.h(q);
    }
    for (int q = 0; q < n; ++q) {
        qc.measure(q, q);
    }
    return qc;
}

std::optional<std::string> recover_secret(const quantum::Histogram& histogram) {
    return quantum::most_frequent(histogram);
}

} // namespace bernstein_vazirani
} // namespace algorithms
} // namespace qlab
