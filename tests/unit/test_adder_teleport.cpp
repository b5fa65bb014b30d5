/*
 * Unit tests for the ripple-carry adder and teleportation builders
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <cstdint>
#include <stdexcept>

#include <qlab/algorithms/adder.hpp>
#include <qlab/algorithms/bitstring.hpp>
#include <qlab/algorithms/teleportation.hpp>
#include <qlab/quantum/cpu_simulator.hpp>

using namespace qlab::algorithms;
using qlab::quantum::CPUSimulator;
using qlab::quantum::Histogram;

TEST_SUITE("Ripple-carry Adder") {
    TEST_CASE("3 + 5 with 4-bit operands reads 01000") {
        CPUSimulator sim(20);
        auto hist = sim.sample(adder::build(3, 5, 4), 200);
        auto top = qlab::quantum::most_frequent(hist);
        REQUIRE(top.has_value());
        CHECK(*top == "01000");
        CHECK(adder::decode_sum(*top) == 8);
        CHECK(hist["01000"] == 200);
    }

    TEST_CASE("exhaustive 2-bit sums including carry-out") {
        CPUSimulator sim(21);
        for (std::uint64_t a = 0; a < 4; ++a) {
            for (std::uint64_t b = 0; b < 4; ++b) {
                auto hist = sim.sample(adder::build(a, b, 2), 10);
                REQUIRE(hist.size() == 1);
                CHECK(hist.begin()->first == bitstring::to_bitstring(a + b, 3));
            }
        }
    }

    TEST_CASE("layout and operand validation") {
        auto qc = adder::build(1, 1, 3);
        CHECK(qc.num_qubits() == 8);
        CHECK(qc.num_clbits() == 4);
        CHECK_THROWS_AS(adder::build(16, 0, 4), std::invalid_argument);
        CHECK_THROWS_AS(adder::build(0, 16, 4), std::invalid_argument);
        CHECK_THROWS_AS(adder::build(0, 0, 0), std::invalid_argument);
        CHECK_THROWS_AS(adder::build(0, 0, 15), std::invalid_argument);
    }
}

TEST_SUITE("Teleportation") {
    TEST_CASE("plus state teleports to a fair coin") {
        CPUSimulator sim(30);
        auto hist = sim.sample(teleportation::build(teleportation::NamedState::Plus), 1000);
        CHECK(qlab::quantum::total_counts(hist) == 1000);
        auto target = teleportation::corrected_target_counts(hist);
        CHECK(qlab::quantum::total_counts(target) == 1000);
        CHECK(target["0"] > 400);
        CHECK(target["1"] > 400);
    }

    TEST_CASE("basis states teleport with certainty after the m1 correction") {
        CPUSimulator sim(31);
        const auto rule = teleportation::CorrectionBit::Qubit1;
        auto zero = teleportation::corrected_target_counts(
            sim.sample(teleportation::build(teleportation::NamedState::Zero), 500), rule);
        CHECK(zero["0"] == 500);
        auto one = teleportation::corrected_target_counts(
            sim.sample(teleportation::build(teleportation::NamedState::One), 500), rule);
        CHECK(one["1"] == 500);
    }

    TEST_CASE("default correction flips the target whenever m0 is 1") {
        CPUSimulator sim(1);
        auto hist = sim.sample(teleportation::build(teleportation::NamedState::Zero), 1000);
        // Teleporting |0> leaves the target reading m1; the m0 rule reports m1 xor m0.
        std::uint64_t flipped = 0;
        for (const auto& [bits, count] : hist) {
            CHECK(bits[0] == bits[1]);
            if (bits[0] != bits[2]) flipped += count;
        }
        auto target = teleportation::corrected_target_counts(hist);
        CHECK(target["1"] == flipped);
        CHECK(target["0"] == 1000 - flipped);
        CHECK(target["1"] > 400);
        CHECK(target["0"] > 400);
    }

    TEST_CASE("arbitrary state keeps its Z statistics under the m1 correction") {
        CPUSimulator sim(32);
        const double theta = 2.0 * M_PI / 3.0;  // P(1) = sin^2(theta/2) = 0.75
        auto target = teleportation::corrected_target_counts(
            sim.sample(teleportation::build_arbitrary(theta, 0.4), 4000), teleportation::CorrectionBit::Qubit1);
        CHECK(static_cast<double>(target["1"]) / 4000.0 == doctest::Approx(0.75).epsilon(0.05));
    }

    TEST_CASE("correction rule selects the driving bit") {
        // keys are c2 c1 c0
        Histogram h{{"100", 3}, {"110", 5}, {"001", 7}};
        auto by_q0 = teleportation::corrected_target_counts(h);
        CHECK(by_q0["1"] == 3 + 5 + 7);
        CHECK(by_q0["0"] == 0);
        auto by_q1 = teleportation::corrected_target_counts(h, teleportation::CorrectionBit::Qubit1);
        CHECK(by_q1["1"] == 3);
        CHECK(by_q1["0"] == 5 + 7);
        CHECK_THROWS_AS(teleportation::corrected_target_counts(Histogram{{"10", 1}}), std::invalid_argument);
    }

    TEST_CASE("state names") {
        CHECK(teleportation::parse_state("minus") == teleportation::NamedState::Minus);
        CHECK(std::string(teleportation::state_name(teleportation::NamedState::Plus)) == "plus");
        CHECK(teleportation::is_known_state("one"));
        CHECK_FALSE(teleportation::is_known_state("psi"));
        CHECK_THROWS_AS(teleportation::parse_state("psi"), std::invalid_argument);
    }
}
