/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/algorithms/grover.hpp"
#include "qlab/algorithms/bitstring.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace qlab {
namespace algorithms {
namespace grover {

using quantum::QuantumCircuit;

int default_iterations(int num_qubits) {
    if (num_qubits <= 0) {
        throw std::invalid_argument(fmt::format("Number of qubits must be >= 1, got {}", num_qubits));
    }
    const double n_states = std::ldexp(1.0, num_qubits);
    const int k = static_cast<int>(std::floor(M_PI / 4.0 * std::sqrt(n_states)));
    return std::max(1, k);
}

void append_full_controlled_z(QuantumCircuit& qc) {
    const int n = qc.num_qubits();
    if (n == 1) {
        qc.z(0);
    } else if (n == 2) {
        qc.cz(0, 1);
    } else {
        std::vector<int> controls(n - 1);
        for (int q = 0; q < n - 1; ++q) {
            controls[q] = q;
        }
        qc.mcz(controls, n - 1);
    }
}

static void flip_zero_bits(QuantumCircuit& qc, const std::string& target) {
    for (int q = 0; q < qc.num_qubits(); ++q) {
        if (!bitstring::bit_for_qubit(target, q)) {
            qc.x(q);
        }
    }
}

void append_oracle(QuantumCircuit& qc, const std::string& target) {
    bitstring::require_valid(target, "Grover target", qc.num_qubits());
    flip_zero_bits(qc, target);
    append_full_controlled_z(qc);
    flip_zero_bits(qc, target);
}

void append_diffuser(QuantumCircuit& qc) {
    const int n = qc.num_qubits();
    for (int q = 0; q < n; ++q) qc.h(q);
    for (int q = 0; q < n; ++q) qc.x(q);
    append_full_controlled_z(qc);
    for (int q = 0; q < n; ++q) qc.x(q);
    for (int q = 0; q < n; ++q) qc.h(q);
}

QuantumCircuit build(const std::string& target, std::optional<int> iterations) {
    bitstring::require_valid(target, "Grover target");
    const int n = static_cast<int>(target.size());
    const int rounds = iterations ? *iterations : default_iterations(n);
    if (rounds < 1) {
        throw std::invalid_argument(fmt::format("Grover iterations must be >= 1, got {}", rounds));
    }

    QuantumCircuit qc(n, n);
    for (int q = 0; q < n; ++q) {
        qc.h(q);
    }
    for (int k = 0; k < rounds; ++k) {
        append_oracle(qc, target);
        append_diffuser(qc);
    }
    for (int q = 0; q < n; ++q) {
        qc.measure(q, q);
    }
    return qc;
}

} // namespace grover
} // namespace algorithms
} // namespace qlab
