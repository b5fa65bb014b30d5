/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>
#include <vector>
#include "qlab/quantum/state_vector.hpp"

namespace qlab {
namespace quantum {

/**
 * Weighted Pauli string. paulis has one character per qubit from
 * {I, X, Y, Z}; the leftmost character acts on qubit n-1, matching the
 * big-endian bitstring convention.
 */
struct PauliTerm {
    double coefficient;
    std::string paulis;
};

class PauliOperator {
public:
    explicit PauliOperator(int num_qubits);
    PauliOperator(int num_qubits, const std::vector<PauliTerm>& terms);

    // Throws std::invalid_argument on wrong length or an unknown character.
    void add_term(double coefficient, const std::string& paulis);

    int num_qubits() const { return num_qubits_; }
    const std::vector<PauliTerm>& terms() const { return terms_; }
    bool empty() const { return terms_.empty(); }

private:
    int num_qubits_;
    std::vector<PauliTerm> terms_;
};

// <psi|P|psi> for a single unweighted Pauli string.
Complex pauli_string_expectation(const StateVector& state, const std::string& paulis);

// Re sum_k c_k <psi|P_k|psi>
double expectation_value(const StateVector& state, const PauliOperator& op);

} // namespace quantum
} // namespace qlab
