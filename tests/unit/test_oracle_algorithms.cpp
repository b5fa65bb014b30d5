/*
 * Unit tests for Grover, Deutsch-Jozsa, Bernstein-Vazirani and Simon builders
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include <qlab/algorithms/bernstein_vazirani.hpp>
#include <qlab/algorithms/deutsch_jozsa.hpp>
#include <qlab/algorithms/grover.hpp>
#include <qlab/algorithms/simon.hpp>
#include <qlab/quantum/cpu_simulator.hpp>

using namespace qlab::algorithms;
using qlab::quantum::CPUSimulator;
using qlab::quantum::Histogram;

TEST_SUITE("Grover") {
    TEST_CASE("default iteration count") {
        CHECK(grover::default_iterations(1) == 1);
        CHECK(grover::default_iterations(2) == 1);
        CHECK(grover::default_iterations(3) == 2);
        CHECK(grover::default_iterations(4) == 3);
        CHECK_THROWS_AS(grover::default_iterations(0), std::invalid_argument);
    }

    TEST_CASE("two-qubit search finds every target") {
        CPUSimulator sim(42);
        for (const std::string target : {"00", "01", "10", "11"}) {
            auto hist = sim.sample(grover::build(target, 1), 1000);
            CHECK(hist[target] > 800);
        }
    }

    TEST_CASE("three and four qubit search amplifies the target") {
        CPUSimulator sim(7);
        auto hist3 = sim.sample(grover::build("101"), 1000);
        CHECK(hist3["101"] > 850);
        auto hist4 = sim.sample(grover::build("0110"), 1000);
        CHECK(hist4["0110"] > 900);
    }

    TEST_CASE("oracle flips only the target amplitude") {
        qlab::quantum::QuantumCircuit qc(3);
        for (int q = 0; q < 3; ++q) qc.h(q);
        grover::append_oracle(qc, "110");
        CPUSimulator sim;
        auto state = sim.evolve(qc);
        for (std::size_t i = 0; i < 8; ++i) {
            const double sign = i == 0b110 ? -1.0 : 1.0;
            CHECK(state.amplitude(i).real() == doctest::Approx(sign / std::sqrt(8.0)));
        }
    }

    TEST_CASE("invalid targets are rejected") {
        CHECK_THROWS_AS(grover::build(""), std::invalid_argument);
        CHECK_THROWS_AS(grover::build("1a"), std::invalid_argument);
        CHECK_THROWS_AS(grover::build("11", 0), std::invalid_argument);
    }
}

TEST_SUITE("Deutsch-Jozsa") {
    TEST_CASE("constant oracles measure all zeros") {
        CPUSimulator sim(1);
        for (int n : {1, 3, 4}) {
            auto zero = sim.sample(deutsch_jozsa::build(n, deutsch_jozsa::constant_zero()), 500);
            CHECK(qlab::quantum::probability_of(zero, std::string(n, '0')) > 0.8);
            CHECK(deutsch_jozsa::classify(zero, n) == deutsch_jozsa::Verdict::Constant);

            auto one = sim.sample(deutsch_jozsa::build(n, deutsch_jozsa::constant_one()), 500);
            CHECK(deutsch_jozsa::classify(one, n) == deutsch_jozsa::Verdict::Constant);
        }
    }

    TEST_CASE("balanced oracles never measure all zeros") {
        CPUSimulator sim(2);
        const int n = 3;
        auto parity = sim.sample(deutsch_jozsa::build(n, deutsch_jozsa::balanced_parity(n)), 500);
        CHECK(qlab::quantum::probability_of(parity, "000") == 0.0);
        CHECK(parity["111"] == 500);
        CHECK(deutsch_jozsa::classify(parity, n) == deutsch_jozsa::Verdict::Balanced);

        auto first = sim.sample(deutsch_jozsa::build(n, deutsch_jozsa::balanced_first(n)), 500);
        CHECK(first["001"] == 500);
    }

    TEST_CASE("oracle names and classification edge cases") {
        CHECK(std::holds_alternative<deutsch_jozsa::ConstantOracle>(deutsch_jozsa::oracle_from_name("constant_one", 2)));
        auto bal = deutsch_jozsa::oracle_from_name("balanced_first", 2);
        REQUIRE(std::holds_alternative<deutsch_jozsa::BalancedOracle>(bal));
        CHECK(std::get<deutsch_jozsa::BalancedOracle>(bal).mask == "01");
        CHECK_THROWS_AS(deutsch_jozsa::oracle_from_name("random", 2), std::invalid_argument);
        CHECK_THROWS_AS(deutsch_jozsa::build(0, deutsch_jozsa::constant_zero()), std::invalid_argument);
        CHECK_THROWS_AS(deutsch_jozsa::build(2, deutsch_jozsa::BalancedOracle{"00"}), std::invalid_argument);
        CHECK_THROWS_AS(deutsch_jozsa::build(2, deutsch_jozsa::BalancedOracle{"011"}), std::invalid_argument);
        CHECK(deutsch_jozsa::classify(Histogram{}, 2) == deutsch_jozsa::Verdict::Unknown);
        CHECK(std::string(deutsch_jozsa::verdict_name(deutsch_jozsa::Verdict::Balanced)) == "balanced");
    }
}

TEST_SUITE("Bernstein-Vazirani") {
    TEST_CASE("secret 1011 is recovered in one query") {
        CPUSimulator sim(3);
        auto hist = sim.sample(bernstein_vazirani::build("1011"), 500);
        CHECK(bernstein_vazirani::recover_secret(hist) == std::optional<std::string>("1011"));
        CHECK(hist["1011"] == 500);
    }

    TEST_CASE("circuit shape") {
        auto qc = bernstein_vazirani::build("100");
        CHECK(qc.num_qubits() == 4);
        CHECK(qc.num_clbits() == 3);
        CHECK_THROWS_AS(bernstein_vazirani::build("10x"), std::invalid_argument);
    }
}

TEST_SUITE("Simon") {
    TEST_CASE("every measured y is orthogonal to the secret") {
        CPUSimulator sim(4);
        for (const std::string secret : {"010", "110", "1001"}) {
            auto hist = sim.sample(simon::build(secret), 512);
            for (const auto& [y, count] : hist) {
                CHECK(simon::is_orthogonal(y, secret));
            }
        }
    }

    TEST_CASE("single-bit secret is recovered end to end") {
        CPUSimulator sim(5);
        auto hist = sim.sample(simon::build("010"), 1024);
        std::vector<std::string> ys;
        for (const auto& [y, count] : hist) ys.push_back(y);
        CHECK(simon::solve_secret(ys, 3) == std::optional<std::string>("010"));
    }

    TEST_CASE("GF(2) elimination") {
        // y.s = 0 for s = 101: 010, 101, 111
        CHECK(simon::solve_secret({"010", "101"}, 3) == std::optional<std::string>("101"));
        CHECK(simon::solve_secret({"111", "010", "000", "101"}, 3) == std::optional<std::string>("101"));
        // Full rank only admits the zero secret.
        CHECK(simon::solve_secret({"100", "010", "001"}, 3) == std::optional<std::string>("000"));
        // Too few equations.
        CHECK_FALSE(simon::solve_secret({"010"}, 3).has_value());
        CHECK_FALSE(simon::solve_secret({}, 2).has_value());
        CHECK_THROWS_AS(simon::solve_secret({"01"}, 3), std::invalid_argument);
    }

    TEST_CASE("multi-bit secret is reported as ambiguous") {
        CPUSimulator sim(6);
        auto hist = sim.sample(simon::build("110"), 1024);
        std::vector<std::string> ys;
        for (const auto& [y, count] : hist) ys.push_back(y);
        CHECK_FALSE(simon::solve_secret(ys, 3).has_value());
    }
}
