/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/algorithms/phase_estimation.hpp"
#include "qlab/algorithms/bitstring.hpp"
#include "qlab/algorithms/qft.hpp"
#include <fmt/format.h>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace qlab {
namespace algorithms {
namespace phase_estimation {

using quantum::QuantumCircuit;

QuantumCircuit build(int num_counting, double phase) {
    if (num_counting <= 0) {
        throw std::invalid_argument(fmt::format("Counting qubits must be >= 1, got {}", num_counting));
    }
    if (!(phase >= 0.0 && phase <= 1.0)) {
        throw std::invalid_argument(fmt::format("Phase must lie in [0, 1], got {}", phase));
    }
    const int c = num_counting;
    QuantumCircuit qc(c + 1, c);

    qc.x(c);
    for (int k = 0; k < c; ++k) {
        qc.h(k);
    }
    // Controlled-U^(2^k) for a pure phase unitary is a single controlled phase.
    for (int k = 0; k < c; ++k) {
        qc.cp(2.0 * M_PI * phase * std::ldexp(1.0, k), k, c);
    }

    // Qubit k carries weight 2^k, so the register is listed most significant first.
    std::vector<int> counting(c);
    for (int i = 0; i < c; ++i) {
        counting[i] = c - 1 - i;
    }
    qft::append_inverse_qft(qc, counting);

    for (int k = 0; k < c; ++k) {
        qc.measure(k, k);
    }
    return qc;
}

double decode_phase(const std::string& bits) {
    bitstring::require_valid(bits, "Phase bitstring");
    double phase = 0.0;
    for (std::size_t i = 0; i < bits.size(); ++i) {
        if (bits[i] == '1') {
            phase += std::ldexp(1.0, -static_cast<int>(i + 1));
        }
    }
    return phase;
}

} // namespace phase_estimation
} // namespace algorithms
} // namespace qlab
