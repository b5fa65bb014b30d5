/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include "qlab/logging/logger.hpp"
#include "qlab/quantum/simulator.hpp"

namespace qlab {
namespace quantum {

/**
 * Exact statevector simulator on the CPU
 *
 * Owns only its PRNG. Use one instance per thread; two instances built
 * with the same seed produce identical histograms for the same circuit.
 */
class CPUSimulator : public IQuantumSimulator {
public:
    explicit CPUSimulator(std::optional<std::uint64_t> seed = std::nullopt,
                          logging::Logger* logger = nullptr);

    StateVector evolve(const QuantumCircuit& circuit) override;
    Histogram sample(const QuantumCircuit& circuit, int shots) override;
    double expectation(const QuantumCircuit& circuit, const PauliOperator& op) override;
    std::vector<double> probabilities(const QuantumCircuit& circuit) override;

    std::string backend_name() const override { return "CPU_STATEVECTOR"; }

    void reseed(std::uint64_t seed) { rng_.seed(seed); }

private:
    void apply_operation(StateVector& state, const Operation& op) const;
    void debug(const std::string& msg) const;

    std::mt19937_64 rng_;
    logging::Logger* logger_;
};

} // namespace quantum
} // namespace qlab
