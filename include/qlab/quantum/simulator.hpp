/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>
#include <vector>
#include "qlab/quantum/circuit.hpp"
#include "qlab/quantum/histogram.hpp"
#include "qlab/quantum/pauli.hpp"
#include "qlab/quantum/state_vector.hpp"

namespace qlab {
namespace quantum {

/**
 * Abstract quantum simulator interface
 *
 * Every call starts from a fresh |0...0> register; nothing is carried over
 * between calls except the sampler's random state.
 */
class IQuantumSimulator {
public:
    virtual ~IQuantumSimulator() = default;

    // Final state after all non-measurement operations.
    virtual StateVector evolve(const QuantumCircuit& circuit) = 0;

    // shots >= 1. Without declared measurements every qubit q is read into bit q.
    virtual Histogram sample(const QuantumCircuit& circuit, int shots) = 0;

    virtual double expectation(const QuantumCircuit& circuit, const PauliOperator& op) = 0;

    // Exact |amplitude|^2 per basis index.
    virtual std::vector<double> probabilities(const QuantumCircuit& circuit) = 0;

    virtual std::string backend_name() const = 0;
};

} // namespace quantum
} // namespace qlab
