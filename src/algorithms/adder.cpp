/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/algorithms/adder.hpp"
#include "qlab/algorithms/bitstring.hpp"
#include "qlab/quantum/types.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace qlab {
namespace algorithms {
namespace adder {

using quantum::QuantumCircuit;

void append_majority(QuantumCircuit& qc, int a, int b, int c) {
    qc.cx(c, b);
    qc.cx(c, a);
    qc.ccx(a, b, c);
}

void append_unmajority(QuantumCircuit& qc, int a, int b, int c) {
    qc.ccx(a, b, c);
    qc.cx(c, a);
    qc.cx(a, b);
}

QuantumCircuit build(std::uint64_t a, std::uint64_t b, int bits) {
    // 2*bits + 2 qubits must fit the register limit.
    if (bits <= 0 || 2 * bits + 2 > quantum::kMaxQubits) {
        throw std::invalid_argument(fmt::format(
            "Adder width must be 1..{}, got {}", (quantum::kMaxQubits - 2) / 2, bits));
    }
    const std::uint64_t limit = 1ULL << bits;
    if (a >= limit) {
        throw std::invalid_argument(fmt::format("a must be between 0 and {}, got {}", limit - 1, a));
    }
    if (b >= limit) {
        throw std::invalid_argument(fmt::format("b must be between 0 and {}, got {}", limit - 1, b));
    }

    const int carry_in = 2 * bits;
    const int carry_out = 2 * bits + 1;
    auto a_qubit = [](int i) { return i; };
    auto b_qubit = [bits](int i) { return bits + i; };

    QuantumCircuit qc(2 * bits + 2, bits + 1);
    for (int i = 0; i < bits; ++i) {
        if ((a >> i) & 1ULL) qc.x(a_qubit(i));
        if ((b >> i) & 1ULL) qc.x(b_qubit(i));
    }

    for (int i = 0; i < bits; ++i) {
        const int carry = i == 0 ? carry_in : a_qubit(i - 1);
        append_majority(qc, carry, b_qubit(i), a_qubit(i));
    }
    qc.cx(a_qubit(bits - 1), carry_out);
    for (int i = bits - 1; i >= 0; --i) {
        const int carry = i == 0 ? carry_in : a_qubit(i - 1);
        append_unmajority(qc, carry, b_qubit(i), a_qubit(i));
    }

    for (int i = 0; i < bits; ++i) {
        qc.measure(b_qubit(i), i);
    }
    qc.measure(carry_out, bits);
    return qc;
}

std::uint64_t decode_sum(const std::string& result) {
    return bitstring::from_bitstring(result);
}

} // namespace adder
} // namespace algorithms
} // namespace qlab
