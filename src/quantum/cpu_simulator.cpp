/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/quantum/cpu_simulator.hpp"
#include "qlab/quantum/gates.hpp"
#include <fmt/format.h>
#include <cmath>
#include <map>
#include <stdexcept>

namespace qlab {
namespace quantum {

namespace {

std::uint64_t seed_from_device() {
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

} // namespace

CPUSimulator::CPUSimulator(std::optional<std::uint64_t> seed, logging::Logger* logger)
    : rng_(seed ? *seed : seed_from_device())
    , logger_(logger) {}

void CPUSimulator::debug(const std::string& msg) const {
    if (logger_ && logger_->debug_enabled()) {
        logger_->debug(msg);
    }
}

void CPUSimulator::apply_operation(StateVector& state, const Operation& op) const {
    const int target = op.targets.front();
    switch (op.type) {
        case GateType::H:
            state.apply_matrix(target, gates::hadamard());
            break;
        case GateType::X:
            state.apply_x(target);
            break;
        case GateType::Y:
            state.apply_matrix(target, gates::pauli_y());
            break;
        case GateType::Z:
            state.apply_z(target);
            break;
        case GateType::S:
            state.apply_phase(target, M_PI / 2.0);
            break;
        case GateType::T:
            state.apply_phase(target, M_PI / 4.0);
            break;
        case GateType::P:
            state.apply_phase(target, op.angle);
            break;
        case GateType::RX:
            state.apply_matrix(target, gates::rx(op.angle));
            break;
        case GateType::RY:
            state.apply_matrix(target, gates::ry(op.angle));
            break;
        case GateType::RZ:
            state.apply_matrix(target, gates::rz(op.angle));
            break;
        case GateType::CX:
        case GateType::CCX:
        case GateType::MCX:
            state.apply_mcx(op.controls, target);
            break;
        case GateType::CZ:
        case GateType::MCZ:
            state.apply_mcz(op.controls, target);
            break;
        case GateType::CP:
            state.apply_controlled_phase(op.controls.front(), target, op.angle);
            break;
        case GateType::SWAP:
            state.apply_swap(op.targets[0], op.targets[1]);
            break;
        case GateType::MEASURE:
            // Terminal; read out by sample().
            break;
    }
}

StateVector CPUSimulator::evolve(const QuantumCircuit& circuit) {
    if (circuit.has_unbound_parameters()) {
        throw std::invalid_argument(fmt::format(
            "Circuit has {} unbound parameters; call bind() first", circuit.num_parameters()));
    }
    debug(fmt::format("evolve: {} qubits, {} operations", circuit.num_qubits(), circuit.size()));

    StateVector state(circuit.num_qubits());
    for (const auto& op : circuit.operations()) {
        apply_operation(state, op);
    }
    state.check_normalized();
    return state;
}

std::vector<double> CPUSimulator::probabilities(const QuantumCircuit& circuit) {
    return evolve(circuit).probabilities();
}

Histogram CPUSimulator::sample(const QuantumCircuit& circuit, int shots) {
    if (shots < 1) {
        throw std::invalid_argument(fmt::format("shots must be >= 1, got {}", shots));
    }

    std::vector<double> probs = probabilities(circuit);
    double total = 0.0;
    for (auto& p : probs) {
        if (p < kProbabilityEpsilon) {
            p = 0.0;
        }
        total += p;
    }
    if (!std::isfinite(total) || total <= 0.0) {
        throw NumericalError(fmt::format("Probability vector sums to {}", total));
    }
    for (auto& p : probs) {
        p /= total;
    }

    std::vector<std::pair<int, int>> readout = circuit.measurements();
    int width = circuit.num_clbits();
    if (readout.empty()) {
        width = circuit.num_qubits();
        for (int q = 0; q < width; ++q) {
            readout.emplace_back(q, q);
        }
    }
    debug(fmt::format("sample: {} shots, {} readout bits", shots, width));

    // Tally basis indices first; distinct outcomes are few compared to shots.
    std::discrete_distribution<std::size_t> dist(probs.begin(), probs.end());
    std::map<std::size_t, std::uint64_t> outcomes;
    for (int s = 0; s < shots; ++s) {
        ++outcomes[dist(rng_)];
    }

    Histogram histogram;
    for (const auto& [index, count] : outcomes) {
        std::string bits(width, '0');
        for (const auto& [qubit, clbit] : readout) {
            if ((index >> qubit) & 1) {
                bits[width - 1 - clbit] = '1';
            }
        }
        histogram[bits] += count;
    }
    return histogram;
}

double CPUSimulator::expectation(const QuantumCircuit& circuit, const PauliOperator& op) {
    if (op.num_qubits() != circuit.num_qubits()) {
        throw std::invalid_argument(fmt::format(
            "Operator acts on {} qubits but circuit has {}", op.num_qubits(), circuit.num_qubits()));
    }
    return expectation_value(evolve(circuit), op);
}

} // namespace quantum
} // namespace qlab
