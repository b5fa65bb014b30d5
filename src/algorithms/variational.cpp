/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/algorithms/variational.hpp"
#include <fmt/format.h>
#include <stdexcept>
#include <utility>

namespace qlab {
namespace algorithms {
namespace variational {

using quantum::QuantumCircuit;

QuantumCircuit build_real_amplitudes(int num_qubits, int reps) {
    if (num_qubits <= 0) {
        throw std::invalid_argument(fmt::format("Number of qubits must be >= 1, got {}", num_qubits));
    }
    if (reps < 0) {
        throw std::invalid_argument(fmt::format("reps must be >= 0, got {}", reps));
    }
    const int n = num_qubits;
    QuantumCircuit qc(n);
    int slot = 0;
    for (int r = 0; r < reps; ++r) {
        for (int q = 0; q < n; ++q) {
            qc.add_parameterized_rotation(q, slot++);
        }
        for (int q = n - 2; q >= 0; --q) {
            qc.cx(q, q + 1);
        }
    }
    for (int q = 0; q < n; ++q) {
        qc.add_parameterized_rotation(q, slot++);
    }
    return qc;
}

EnergyObjective::EnergyObjective(QuantumCircuit ansatz, quantum::PauliOperator op,
                                 quantum::IQuantumSimulator& simulator)
    : ansatz_(std::move(ansatz))
    , op_(std::move(op))
    , simulator_(simulator) {
    if (op_.num_qubits() != ansatz_.num_qubits()) {
        throw std::invalid_argument(fmt::format(
            "Operator acts on {} qubits but ansatz has {}", op_.num_qubits(), ansatz_.num_qubits()));
    }
}

double EnergyObjective::operator()(const std::vector<double>& parameters) {
    const double energy = simulator_.expectation(ansatz_.bind(parameters), op_);
    ++evaluations_;
    return energy;
}

quantum::PauliOperator h2_hamiltonian() {
    return quantum::PauliOperator(2, {
        {-1.052373245772859, "II"},
        {0.39793742484318045, "IZ"},
        {-0.39793742484318045, "ZI"},
        {-0.01128010425624393, "ZZ"},
        {0.18093119978423156, "XX"},
    });
}

} // namespace variational
} // namespace algorithms
} // namespace qlab
