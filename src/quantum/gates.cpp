/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/quantum/gates.hpp"
#include <cmath>

namespace qlab {
namespace quantum {
namespace gates {

namespace {
const double INV_SQRT_2 = 1.0 / std::sqrt(2.0);
}

Matrix2 identity() {
    return {Complex(1.0, 0.0), Complex(0.0, 0.0), Complex(0.0, 0.0), Complex(1.0, 0.0)};
}

Matrix2 hadamard() {
    return {Complex(INV_SQRT_2, 0.0), Complex(INV_SQRT_2, 0.0),
            Complex(INV_SQRT_2, 0.0), Complex(-INV_SQRT_2, 0.0)};
}

Matrix2 pauli_x() {
    return {Complex(0.0, 0.0), Complex(1.0, 0.0), Complex(1.0, 0.0), Complex(0.0, 0.0)};
}

Matrix2 pauli_y() {
    // [[0, -i], [i, 0]]
    return {Complex(0.0, 0.0), Complex(0.0, -1.0), Complex(0.0, 1.0), Complex(0.0, 0.0)};
}

Matrix2 pauli_z() {
    return {Complex(1.0, 0.0), Complex(0.0, 0.0), Complex(0.0, 0.0), Complex(-1.0, 0.0)};
}

Matrix2 s_gate() {
    return {Complex(1.0, 0.0), Complex(0.0, 0.0), Complex(0.0, 0.0), Complex(0.0, 1.0)};
}

Matrix2 t_gate() {
    return phase(M_PI / 4.0);
}

Matrix2 phase(double theta) {
    return {Complex(1.0, 0.0), Complex(0.0, 0.0), Complex(0.0, 0.0), std::polar(1.0, theta)};
}

Matrix2 rx(double theta) {
    double c = std::cos(theta / 2.0);
    double s = std::sin(theta / 2.0);
    return {Complex(c, 0.0), Complex(0.0, -s), Complex(0.0, -s), Complex(c, 0.0)};
}

Matrix2 ry(double theta) {
    double c = std::cos(theta / 2.0);
    double s = std::sin(theta / 2.0);
    return {Complex(c, 0.0), Complex(-s, 0.0), Complex(s, 0.0), Complex(c, 0.0)};
}

Matrix2 rz(double theta) {
    // diag(e^{-i theta/2}, e^{i theta/2})
    return {std::polar(1.0, -theta / 2.0), Complex(0.0, 0.0),
            Complex(0.0, 0.0), std::polar(1.0, theta / 2.0)};
}

Matrix2 adjoint(const Matrix2& m) {
    return {std::conj(m.m00), std::conj(m.m10), std::conj(m.m01), std::conj(m.m11)};
}

Matrix2 multiply(const Matrix2& a, const Matrix2& b) {
    return {a.m00 * b.m00 + a.m01 * b.m10,
            a.m00 * b.m01 + a.m01 * b.m11,
            a.m10 * b.m00 + a.m11 * b.m10,
            a.m10 * b.m01 + a.m11 * b.m11};
}

bool is_unitary(const Matrix2& m, double tolerance) {
    Matrix2 p = multiply(adjoint(m), m);
    return std::abs(p.m00 - Complex(1.0, 0.0)) < tolerance &&
           std::abs(p.m01) < tolerance &&
           std::abs(p.m10) < tolerance &&
           std::abs(p.m11 - Complex(1.0, 0.0)) < tolerance;
}

} // namespace gates
} // namespace quantum
} // namespace qlab
