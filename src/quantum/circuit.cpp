/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/quantum/circuit.hpp"
#include "qlab/quantum/types.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

namespace qlab {
namespace quantum {

const char* gate_name(GateType type) {
    switch (type) {
        case GateType::H: return "H";
        case GateType::X: return "X";
        case GateType::Y: return "Y";
        case GateType::Z: return "Z";
        case GateType::S: return "S";
        case GateType::T: return "T";
        case GateType::P: return "P";
        case GateType::RX: return "RX";
        case GateType::RY: return "RY";
        case GateType::RZ: return "RZ";
        case GateType::CX: return "CX";
        case GateType::CZ: return "CZ";
        case GateType::CP: return "CP";
        case GateType::CCX: return "CCX";
        case GateType::MCX: return "MCX";
        case GateType::MCZ: return "MCZ";
        case GateType::SWAP: return "SWAP";
        case GateType::MEASURE: return "MEASURE";
    }
    return "UNKNOWN";
}

QuantumCircuit::QuantumCircuit(int num_qubits, int num_clbits)
    : num_qubits_(num_qubits)
    , num_clbits_(num_clbits) {
    if (num_qubits <= 0 || num_qubits > kMaxQubits) {
        throw std::invalid_argument(fmt::format(
            "Invalid number of qubits: {} (expected 1..{})", num_qubits, kMaxQubits));
    }
    if (num_clbits < 0 || num_clbits > num_qubits) {
        throw std::invalid_argument(fmt::format(
            "Invalid number of classical bits: {} (expected 0..{})", num_clbits, num_qubits));
    }
    measured_qubits_.assign(num_qubits, false);
    written_clbits_.assign(num_clbits, false);
}

void QuantumCircuit::check_qubit(int qubit) const {
    if (qubit < 0 || qubit >= num_qubits_) {
        throw std::out_of_range(fmt::format(
            "Qubit index {} out of range for {}-qubit circuit", qubit, num_qubits_));
    }
}

void QuantumCircuit::check_not_measured(int qubit) const {
    if (measured_qubits_[qubit]) {
        throw std::invalid_argument(fmt::format(
            "Qubit {} already measured; measurements must be terminal", qubit));
    }
}

void QuantumCircuit::add_gate(GateType type, std::vector<int> targets, std::vector<int> controls,
                              double angle, int parameter) {
    std::vector<int> touched = targets;
    touched.insert(touched.end(), controls.begin(), controls.end());
    for (int q : touched) {
        check_qubit(q);
        check_not_measured(q);
    }
    std::vector<int> sorted = touched;
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
        throw std::invalid_argument(fmt::format(
            "{} gate uses the same qubit more than once", gate_name(type)));
    }
    Operation op;
    op.type = type;
    op.targets = std::move(targets);
    op.controls = std::move(controls);
    op.angle = angle;
    op.parameter = parameter;
    operations_.push_back(std::move(op));
}

void QuantumCircuit::h(int qubit) { add_gate(GateType::H, {qubit}); }
void QuantumCircuit::x(int qubit) { add_gate(GateType::X, {qubit}); }
void QuantumCircuit::y(int qubit) { add_gate(GateType::Y, {qubit}); }
void QuantumCircuit::z(int qubit) { add_gate(GateType::Z, {qubit}); }
void QuantumCircuit::s(int qubit) { add_gate(GateType::S, {qubit}); }
void QuantumCircuit::t(int qubit) { add_gate(GateType::T, {qubit}); }

void QuantumCircuit::phase(int qubit, double angle) {
    add_gate(GateType::P, {qubit}, {}, angle);
}

static GateType rotation_type(RotationAxis axis) {
    switch (axis) {
        case RotationAxis::X: return GateType::RX;
        case RotationAxis::Y: return GateType::RY;
        case RotationAxis::Z: return GateType::RZ;
    }
    throw std::invalid_argument("Unknown rotation axis");
}

void QuantumCircuit::add_rotation(int qubit, double angle, RotationAxis axis) {
    add_gate(rotation_type(axis), {qubit}, {}, angle);
}

void QuantumCircuit::add_parameterized_rotation(int qubit, int parameter, RotationAxis axis) {
    if (parameter < 0) {
        throw std::invalid_argument(fmt::format("Invalid parameter slot {}", parameter));
    }
    add_gate(rotation_type(axis), {qubit}, {}, 0.0, parameter);
    num_parameters_ = std::max(num_parameters_, parameter + 1);
}

void QuantumCircuit::cx(int control, int target) {
    add_gate(GateType::CX, {target}, {control});
}

void QuantumCircuit::cz(int control, int target) {
    add_gate(GateType::CZ, {target}, {control});
}

void QuantumCircuit::cp(double angle, int control, int target) {
    add_gate(GateType::CP, {target}, {control}, angle);
}

void QuantumCircuit::ccx(int control1, int control2, int target) {
    add_gate(GateType::CCX, {target}, {control1, control2});
}

void QuantumCircuit::mcx(const std::vector<int>& controls, int target) {
    add_gate(GateType::MCX, {target}, controls);
}

void QuantumCircuit::mcz(const std::vector<int>& controls, int target) {
    add_gate(GateType::MCZ, {target}, controls);
}

void QuantumCircuit::swap(int a, int b) {
    add_gate(GateType::SWAP, {a, b});
}

void QuantumCircuit::measure(int qubit, int clbit) {
    check_qubit(qubit);
    if (clbit < 0 || clbit >= num_clbits_) {
        throw std::out_of_range(fmt::format(
            "Classical bit {} out of range for {} classical bits", clbit, num_clbits_));
    }
    if (written_clbits_[clbit]) {
        throw std::invalid_argument(fmt::format("Classical bit {} already assigned", clbit));
    }
    check_not_measured(qubit);

    Operation op;
    op.type = GateType::MEASURE;
    op.targets = {qubit};
    op.clbit = clbit;
    operations_.push_back(std::move(op));
    measured_qubits_[qubit] = true;
    written_clbits_[clbit] = true;
}

QuantumCircuit QuantumCircuit::bind(const std::vector<double>& values) const {
    if (static_cast<int>(values.size()) != num_parameters_) {
        throw std::invalid_argument(fmt::format(
            "Expected {} parameter values, got {}", num_parameters_, values.size()));
    }
    QuantumCircuit bound = *this;
    for (auto& op : bound.operations_) {
        if (op.parameter >= 0) {
            op.angle = values[op.parameter];
            op.parameter = -1;
        }
    }
    bound.num_parameters_ = 0;
    return bound;
}

bool QuantumCircuit::has_measurements() const {
    return std::any_of(operations_.begin(), operations_.end(),
                       [](const Operation& op) { return op.type == GateType::MEASURE; });
}

bool QuantumCircuit::has_unbound_parameters() const {
    return std::any_of(operations_.begin(), operations_.end(),
                       [](const Operation& op) { return op.parameter >= 0; });
}

std::vector<std::pair<int, int>> QuantumCircuit::measurements() const {
    std::vector<std::pair<int, int>> out;
    for (const auto& op : operations_) {
        if (op.type == GateType::MEASURE) {
            out.emplace_back(op.targets[0], op.clbit);
        }
    }
    return out;
}

} // namespace quantum
} // namespace qlab
