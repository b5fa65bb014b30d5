/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/algorithms/qft.hpp"
#include "qlab/algorithms/bitstring.hpp"
#include <fmt/format.h>
#include <cmath>
#include <stdexcept>

namespace qlab {
namespace algorithms {
namespace qft {

using quantum::QuantumCircuit;

static double rotation_angle(int distance) {
    return 2.0 * M_PI / std::ldexp(1.0, distance + 1);
}

static void append_swaps(QuantumCircuit& qc, const std::vector<int>& qubits) {
    const std::size_t k = qubits.size();
    for (std::size_t i = 0; i < k / 2; ++i) {
        qc.swap(qubits[i], qubits[k - 1 - i]);
    }
}

void append_qft(QuantumCircuit& qc, const std::vector<int>& qubits) {
    const int k = static_cast<int>(qubits.size());
    for (int j = 0; j < k; ++j) {
        qc.h(qubits[j]);
        for (int m = j + 1; m < k; ++m) {
            qc.cp(rotation_angle(m - j), qubits[m], qubits[j]);
        }
    }
    append_swaps(qc, qubits);
}

void append_inverse_qft(QuantumCircuit& qc, const std::vector<int>& qubits) {
    const int k = static_cast<int>(qubits.size());
    append_swaps(qc, qubits);
    for (int j = k - 1; j >= 0; --j) {
        for (int m = k - 1; m > j; --m) {
            qc.cp(-rotation_angle(m - j), qubits[m], qubits[j]);
        }
        qc.h(qubits[j]);
    }
}

std::vector<int> all_qubits(int num_qubits) {
    std::vector<int> qubits(num_qubits);
    for (int q = 0; q < num_qubits; ++q) {
        qubits[q] = q;
    }
    return qubits;
}

QuantumCircuit build_round_trip(const std::string& initial_state) {
    bitstring::require_valid(initial_state, "Initial state");
    const int n = static_cast<int>(initial_state.size());
    QuantumCircuit qc(n, n);
    for (int q = 0; q < n; ++q) {
        if (bitstring::bit_for_qubit(initial_state, q)) {
            qc.x(q);
        }
    }
    const auto qubits = all_qubits(n);
    append_qft(qc, qubits);
    append_inverse_qft(qc, qubits);
    for (int q = 0; q < n; ++q) {
        qc.measure(q, q);
    }
    return qc;
}

QuantumCircuit build_uniform_transform(int num_qubits) {
    if (num_qubits <= 0) {
        throw std::invalid_argument(fmt::format("Number of qubits must be >= 1, got {}", num_qubits));
    }
    QuantumCircuit qc(num_qubits, num_qubits);
    for (int q = 0; q < num_qubits; ++q) {
        qc.h(q);
    }
    append_qft(qc, all_qubits(num_qubits));
    for (int q = 0; q < num_qubits; ++q) {
        qc.measure(q, q);
    }
    return qc;
}

} // namespace qft
} // namespace algorithms
} // namespace qlab
