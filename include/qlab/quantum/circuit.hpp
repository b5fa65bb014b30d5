/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace qlab {
namespace quantum {

/**
 * @brief Quantum gate types
 */
enum class GateType {
    H,        // Hadamard
    X,        // Pauli-X
    Y,        // Pauli-Y
    Z,        // Pauli-Z
    S,        // sqrt(Z)
    T,        // fourth root of Z
    P,        // Phase rotation diag(1, e^{i angle})
    RX,       // Rotation around X axis
    RY,       // Rotation around Y axis
    RZ,       // Rotation around Z axis
    CX,       // Controlled-NOT
    CZ,       // Controlled-Z
    CP,       // Controlled phase rotation
    CCX,      // Toffoli
    MCX,      // n-controlled X
    MCZ,      // n-controlled Z
    SWAP,
    MEASURE
};

enum class RotationAxis {
    X,
    Y,
    Z
};

const char* gate_name(GateType type);

/**
 * @brief Single operation of a circuit program
 */
struct Operation {
    GateType type;
    std::vector<int> targets;   // one entry, two for SWAP
    std::vector<int> controls;  // empty for uncontrolled gates
    double angle = 0.0;         // radians, for P/RX/RY/RZ/CP
    int clbit = -1;             // MEASURE only
    int parameter = -1;         // unbound variational slot, -1 when angle is final
};

/**
 * @brief Ordered, append-only circuit program
 *
 * Every builder call validates its indices immediately: a qubit outside
 * [0, n) or a classical bit outside [0, m) throws std::out_of_range, and
 * structural mistakes (target among controls, classical bit written twice,
 * gate after the qubit was measured) throw std::invalid_argument.
 */
class QuantumCircuit {
public:
    QuantumCircuit(int num_qubits, int num_clbits = 0);

    // Single-qubit gates
    void h(int qubit);
    void x(int qubit);
    void y(int qubit);
    void z(int qubit);
    void s(int qubit);
    void t(int qubit);
    void phase(int qubit, double angle);
    void add_rotation(int qubit, double angle, RotationAxis axis = RotationAxis::Y);
    void add_parameterized_rotation(int qubit, int parameter, RotationAxis axis = RotationAxis::Y);

    // Controlled gates
    void cx(int control, int target);
    void cz(int control, int target);
    void cp(double angle, int control, int target);
    void ccx(int control1, int control2, int target);
    void mcx(const std::vector<int>& controls, int target);
    void mcz(const std::vector<int>& controls, int target);
    void swap(int a, int b);

    void measure(int qubit, int clbit);

    // Substitutes every parameter slot; values.size() must equal num_parameters().
    QuantumCircuit bind(const std::vector<double>& values) const;

    // Circuit properties
    int num_qubits() const { return num_qubits_; }
    int num_clbits() const { return num_clbits_; }
    int num_parameters() const { return num_parameters_; }
    std::size_t size() const { return operations_.size(); }
    const std::vector<Operation>& operations() const { return operations_; }

    bool has_measurements() const;
    bool has_unbound_parameters() const;

    // (qubit, clbit) pairs in declaration order
    std::vector<std::pair<int, int>> measurements() const;

    std::size_t state_vector_size() const {
        return std::size_t(1) << num_qubits_;  // 2^n
    }

private:
    void check_qubit(int qubit) const;
    void check_not_measured(int qubit) const;
    void add_gate(GateType type, std::vector<int> targets, std::vector<int> controls = {},
                  double angle = 0.0, int parameter = -1);

    int num_qubits_;
    int num_clbits_;
    int num_parameters_ = 0;
    std::vector<Operation> operations_;
    std::vector<bool> measured_qubits_;
    std::vector<bool> written_clbits_;
};

} // namespace quantum
} // namespace qlab
