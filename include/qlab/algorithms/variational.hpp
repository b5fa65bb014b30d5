/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <vector>
#include "qlab/quantum/circuit.hpp"
#include "qlab/quantum/pauli.hpp"
#include "qlab/quantum/simulator.hpp"

namespace qlab {
namespace algorithms {
namespace variational {

/**
 * RealAmplitudes-style ansatz.
 *
 * reps times: RY on every qubit, then CX(n-2, n-1), ..., CX(0, 1); one
 * closing RY layer. Slot r*n + q drives the RY of qubit q in layer r, so
 * the circuit has n * (reps + 1) parameters.
 */
quantum::QuantumCircuit build_real_amplitudes(int num_qubits, int reps = 1);

/**
 * Scalar objective for an external minimizer.
 *
 * Each call binds the parameters into the ansatz and returns the
 * expectation of the operator. The simulator must outlive the objective.
 */
class EnergyObjective {
public:
    EnergyObjective(quantum::QuantumCircuit ansatz, quantum::PauliOperator op,
                    quantum::IQuantumSimulator& simulator);

    double operator()(const std::vector<double>& parameters);

    int num_parameters() const { return ansatz_.num_parameters(); }
    int evaluations() const { return evaluations_; }

private:
    quantum::QuantumCircuit ansatz_;
    quantum::PauliOperator op_;
    quantum::IQuantumSimulator& simulator_;
    int evaluations_ = 0;
};

// Two-qubit reduced H2 Hamiltonian near equilibrium bond length.
quantum::PauliOperator h2_hamiltonian();

} // namespace variational
} // namespace algorithms
} // namespace qlab
