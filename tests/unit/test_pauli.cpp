/*
 * Unit tests for Pauli operators and expectation values
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <stdexcept>

#include <qlab/quantum/cpu_simulator.hpp>
#include <qlab/quantum/pauli.hpp>

using namespace qlab::quantum;

namespace {

double expect(const QuantumCircuit& qc, const std::string& paulis) {
    CPUSimulator sim;
    PauliOperator op(qc.num_qubits());
    op.add_term(1.0, paulis);
    return sim.expectation(qc, op);
}

} // namespace

TEST_SUITE("Pauli Expectation") {
    TEST_CASE("single qubit eigenstates") {
        QuantumCircuit zero(1);
        CHECK(expect(zero, "Z") == doctest::Approx(1.0));
        CHECK(expect(zero, "X") == doctest::Approx(0.0));

        QuantumCircuit one(1);
        one.x(0);
        CHECK(expect(one, "Z") == doctest::Approx(-1.0));

        QuantumCircuit plus(1);
        plus.h(0);
        CHECK(expect(plus, "X") == doctest::Approx(1.0));
        CHECK(expect(plus, "Z") == doctest::Approx(0.0));

        QuantumCircuit plus_i(1);
        plus_i.h(0);
        plus_i.s(0);
        CHECK(expect(plus_i, "Y") == doctest::Approx(1.0));
        CHECK(expect(plus_i, "I") == doctest::Approx(1.0));
    }

    TEST_CASE("Bell state correlations") {
        QuantumCircuit bell(2);
        bell.h(0);
        bell.cx(0, 1);
        CHECK(expect(bell, "ZZ") == doctest::Approx(1.0));
        CHECK(expect(bell, "XX") == doctest::Approx(1.0));
        CHECK(expect(bell, "YY") == doctest::Approx(-1.0));
        CHECK(expect(bell, "ZI") == doctest::Approx(0.0));
    }

    TEST_CASE("leftmost character acts on the highest qubit") {
        QuantumCircuit qc(2);
        qc.x(1);
        CHECK(expect(qc, "ZI") == doctest::Approx(-1.0));
        CHECK(expect(qc, "IZ") == doctest::Approx(1.0));
    }

    TEST_CASE("weighted sum matches term by term") {
        QuantumCircuit qc(2);
        qc.add_rotation(0, 0.8, RotationAxis::Y);
        qc.add_rotation(1, -1.3, RotationAxis::X);
        qc.cx(0, 1);
        PauliOperator op(2, {{0.5, "ZZ"}, {-1.5, "XI"}, {2.0, "YX"}});
        CPUSimulator sim;
        const double expected = 0.5 * expect(qc, "ZZ") - 1.5 * expect(qc, "XI") + 2.0 * expect(qc, "YX");
        CHECK(sim.expectation(qc, op) == doctest::Approx(expected));

        auto state = sim.evolve(qc);
        CHECK(std::abs(pauli_string_expectation(state, "ZZ").imag()) < 1e-12);
    }

    TEST_CASE("weighted sum over a state vector") {
        // Index 1: qubit 0 is set. "ZI" reads qubit 1 (+1), "IZ" reads qubit 0 (-1).
        auto state = StateVector::basis_state(2, 1);
        PauliOperator op(2, {{0.5, "ZI"}, {2.0, "IZ"}, {3.0, "XX"}});
        CHECK(expectation_value(state, op) == doctest::Approx(0.5 - 2.0));
        CHECK(expectation_value(state, PauliOperator(2)) == doctest::Approx(0.0));
    }

    TEST_CASE("malformed operators are rejected") {
        PauliOperator op(2);
        CHECK_THROWS_AS(op.add_term(1.0, "Z"), std::invalid_argument);
        CHECK_THROWS_AS(op.add_term(1.0, "ZQ"), std::invalid_argument);
        CHECK_THROWS_AS(PauliOperator(0), std::invalid_argument);
        CHECK(op.empty());

        PauliOperator three(3);
        three.add_term(1.0, "ZZZ");
        CPUSimulator sim;
        CHECK_THROWS_AS(sim.expectation(QuantumCircuit(2), three), std::invalid_argument);
    }
}
