/*
 * Unit tests for the CPU statevector simulator and histograms
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <stdexcept>

#include <qlab/logging/logger.hpp>
#include <qlab/quantum/cpu_simulator.hpp>

using namespace qlab::quantum;

namespace {

class CountingLogger : public qlab::logging::Logger {
public:
    void info(std::string_view) override {}
    void warn(std::string_view) override {}
    void error(std::string_view) override {}
    void debug(std::string_view) override { ++debug_lines; }
    int debug_lines = 0;
};

} // namespace

TEST_SUITE("CPU Simulator") {
    TEST_CASE("evolve is deterministic and ignores measurements") {
        QuantumCircuit qc(2, 2);
        qc.h(0);
        qc.cx(0, 1);
        qc.measure(0, 0);
        qc.measure(1, 1);

        CPUSimulator sim(7);
        auto state = sim.evolve(qc);
        const double h = 1.0 / std::sqrt(2.0);
        CHECK(state.amplitude(0).real() == doctest::Approx(h));
        CHECK(state.amplitude(3).real() == doctest::Approx(h));
        CHECK(std::abs(state.amplitude(1)) < 1e-12);
        CHECK(std::abs(state.amplitude(2)) < 1e-12);
        CHECK(state.norm_squared() == doctest::Approx(1.0).epsilon(1e-9));
    }

    TEST_CASE("every gate type keeps the state normalized") {
        QuantumCircuit qc(4);
        qc.h(0); qc.x(1); qc.y(2); qc.z(3);
        qc.s(0); qc.t(1); qc.phase(2, 0.3);
        qc.add_rotation(3, 0.4, RotationAxis::X);
        qc.add_rotation(0, 0.5, RotationAxis::Y);
        qc.add_rotation(1, 0.6, RotationAxis::Z);
        qc.cx(0, 1); qc.cz(1, 2); qc.cp(0.7, 2, 3);
        qc.ccx(0, 1, 2); qc.mcx({0, 1, 2}, 3); qc.mcz({1, 2, 3}, 0);
        qc.swap(0, 3);
        CPUSimulator sim;
        CHECK_NOTHROW(sim.evolve(qc).check_normalized(1e-9));
    }

    TEST_CASE("histogram counts sum to shots") {
        QuantumCircuit qc(3, 3);
        for (int q = 0; q < 3; ++q) qc.h(q);
        for (int q = 0; q < 3; ++q) qc.measure(q, q);
        CPUSimulator sim(11);
        for (int shots : {1, 17, 1000}) {
            auto hist = sim.sample(qc, shots);
            CHECK(total_counts(hist) == static_cast<std::uint64_t>(shots));
            for (const auto& [bits, count] : hist) CHECK(bits.size() == 3);
        }
    }

    TEST_CASE("shots must be positive") {
        QuantumCircuit qc(1, 1);
        qc.measure(0, 0);
        CPUSimulator sim(1);
        CHECK_THROWS_AS(sim.sample(qc, 0), std::invalid_argument);
        CHECK_THROWS_AS(sim.sample(qc, -5), std::invalid_argument);
    }

    TEST_CASE("same seed gives identical histograms") {
        QuantumCircuit qc(3, 3);
        for (int q = 0; q < 3; ++q) qc.h(q);
        for (int q = 0; q < 3; ++q) qc.measure(q, q);
        CPUSimulator a(1234);
        CPUSimulator b(1234);
        CHECK(a.sample(qc, 500) == b.sample(qc, 500));
    }

    TEST_CASE("bitstrings are big-endian over classical bits") {
        QuantumCircuit qc(3, 3);
        qc.x(0);
        for (int q = 0; q < 3; ++q) qc.measure(q, q);
        CPUSimulator sim(3);
        auto hist = sim.sample(qc, 50);
        REQUIRE(hist.size() == 1);
        CHECK(hist.begin()->first == "001");
    }

    TEST_CASE("measurement mapping routes qubits onto declared classical bits") {
        QuantumCircuit qc(3, 2);
        qc.x(2);
        qc.measure(2, 0);  // qubit 2 -> rightmost character
        qc.measure(0, 1);
        CPUSimulator sim(5);
        auto hist = sim.sample(qc, 20);
        REQUIRE(hist.size() == 1);
        CHECK(hist.begin()->first == "01");
    }

    TEST_CASE("without measurements every qubit is read out") {
        QuantumCircuit qc(2);
        qc.x(1);
        CPUSimulator sim(9);
        auto hist = sim.sample(qc, 10);
        REQUIRE(hist.size() == 1);
        CHECK(hist.begin()->first == "10");
        CHECK(hist.begin()->second == 10);
    }

    TEST_CASE("fair coin is roughly balanced") {
        QuantumCircuit qc(1, 1);
        qc.h(0);
        qc.measure(0, 0);
        CPUSimulator sim(2025);
        auto hist = sim.sample(qc, 4000);
        CHECK(probability_of(hist, "0") == doctest::Approx(0.5).epsilon(0.1));
        CHECK(probability_of(hist, "1") == doctest::Approx(0.5).epsilon(0.1));
    }

    TEST_CASE("probabilities and unbound parameters") {
        QuantumCircuit qc(1);
        qc.h(0);
        CPUSimulator sim;
        auto probs = sim.probabilities(qc);
        CHECK(probs[0] == doctest::Approx(0.5));
        CHECK(probs[1] == doctest::Approx(0.5));

        QuantumCircuit param(1);
        param.add_parameterized_rotation(0, 0);
        CHECK_THROWS_AS(sim.evolve(param), std::invalid_argument);
    }

    TEST_CASE("debug details go through the logger") {
        CountingLogger log;
        CPUSimulator sim(1, &log);
        QuantumCircuit qc(1, 1);
        qc.measure(0, 0);
        sim.sample(qc, 3);
        CHECK(log.debug_lines >= 2);
        CHECK(sim.backend_name() == "CPU_STATEVECTOR");
    }
}

TEST_SUITE("Histogram") {
    TEST_CASE("totals, most frequent and probability") {
        Histogram h{{"00", 10}, {"01", 30}, {"10", 30}, {"11", 0}};
        CHECK(total_counts(h) == 70);
        CHECK(most_frequent(h) == std::optional<std::string>("01"));
        CHECK(probability_of(h, "10") == doctest::Approx(30.0 / 70.0));
        CHECK(probability_of(h, "zz") == 0.0);
        CHECK_FALSE(most_frequent(Histogram{}).has_value());
        CHECK(probability_of(Histogram{}, "0") == 0.0);
    }
}
