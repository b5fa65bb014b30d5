/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/quantum/pauli.hpp"
#include <fmt/format.h>
#include <bit>
#include <stdexcept>

namespace qlab {
namespace quantum {

namespace {

struct PauliMasks {
    std::size_t flip = 0;   // X or Y: bit flipped
    std::size_t sign = 0;   // Y or Z: (-1)^bit
    int num_y = 0;          // each Y contributes a factor i
};

PauliMasks masks_for(const std::string& paulis) {
    PauliMasks m;
    const std::size_t n = paulis.size();
    for (std::size_t pos = 0; pos < n; ++pos) {
        const std::size_t bit = std::size_t(1) << (n - 1 - pos);
        switch (paulis[pos]) {
            case 'I': break;
            case 'X': m.flip |= bit; break;
            case 'Y': m.flip |= bit; m.sign |= bit; ++m.num_y; break;
            case 'Z': m.sign |= bit; break;
            default:
                throw std::invalid_argument(fmt::format(
                    "Invalid Pauli character '{}' in \"{}\"", paulis[pos], paulis));
        }
    }
    return m;
}

Complex i_power(int k) {
    switch (k % 4) {
        case 0: return Complex(1.0, 0.0);
        case 1: return Complex(0.0, 1.0);
        case 2: return Complex(-1.0, 0.0);
        default: return Complex(0.0, -1.0);
    }
}

void check_pauli_string(const std::string& paulis, int num_qubits) {
    if (static_cast<int>(paulis.size()) != num_qubits) {
        throw std::invalid_argument(fmt::format(
            "Pauli string \"{}\" has length {}, expected {}", paulis, paulis.size(), num_qubits));
    }
    masks_for(paulis);
}

} // namespace

PauliOperator::PauliOperator(int num_qubits)
    : num_qubits_(num_qubits) {
    if (num_qubits <= 0 || num_qubits > kMaxQubits) {
        throw std::invalid_argument(fmt::format("Invalid Pauli operator width {}", num_qubits));
    }
}

PauliOperator::PauliOperator(int num_qubits, const std::vector<PauliTerm>& terms)
    : PauliOperator(num_qubits) {
    for (const auto& term : terms) {
        add_term(term.coefficient, term.paulis);
    }
}

void PauliOperator::add_term(double coefficient, const std::string& paulis) {
    check_pauli_string(paulis, num_qubits_);
    terms_.push_back({coefficient, paulis});
}

Complex pauli_string_expectation(const StateVector& state, const std::string& paulis) {
    check_pauli_string(paulis, state.num_qubits());
    const PauliMasks m = masks_for(paulis);
    const Complex global = i_power(m.num_y);
    const auto& psi = state.amplitudes();

    // P|i> = phase(i) |i ^ flip>, so <psi|P|psi> = sum_i conj(psi[i ^ flip]) phase(i) psi[i].
    Complex acc(0.0, 0.0);
    for (std::size_t i = 0; i < psi.size(); ++i) {
        const Complex term = std::conj(psi[i ^ m.flip]) * psi[i];
        if (std::popcount(i & m.sign) & 1) {
            acc -= term;
        } else {
            acc += term;
        }
    }
    return global * acc;
}

double expectation_value(const StateVector& state, const PauliOperator& op) {
    if (op.num_qubits() != state.num_qubits()) {
        throw std::invalid_argument(fmt::format(
            "Operator acts on {} qubits but state has {}", op.num_qubits(), state.num_qubits()));
    }
    double energy = 0.0;
    for (const auto& term : op.terms()) {
        energy += term.coefficient * pauli_string_expectation(state, term.paulis).real();
    }
    return energy;
}

} // namespace quantum
} // namespace qlab
