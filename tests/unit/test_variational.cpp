/*
 * Unit tests for the variational ansatz and energy objective
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include <qlab/algorithms/variational.hpp>
#include <qlab/quantum/cpu_simulator.hpp>

using namespace qlab::algorithms;
using qlab::quantum::CPUSimulator;
using qlab::quantum::GateType;

TEST_SUITE("Variational") {
    TEST_CASE("RealAmplitudes layout") {
        auto ansatz = variational::build_real_amplitudes(3, 2);
        CHECK(ansatz.num_parameters() == 9);
        const auto& ops = ansatz.operations();
        // 3 RY, CX(1,2), CX(0,1), 3 RY, 2 CX, 3 RY
        REQUIRE(ops.size() == 13);
        CHECK(ops[0].type == GateType::RY);
        CHECK(ops[0].parameter == 0);
        CHECK(ops[3].type == GateType::CX);
        CHECK(ops[3].controls.front() == 1);
        CHECK(ops[3].targets.front() == 2);
        CHECK(ops[4].controls.front() == 0);
        CHECK(ops[12].parameter == 8);

        CHECK(variational::build_real_amplitudes(2, 0).num_parameters() == 2);
        CHECK_THROWS_AS(variational::build_real_amplitudes(0, 1), std::invalid_argument);
        CHECK_THROWS_AS(variational::build_real_amplitudes(2, -1), std::invalid_argument);
    }

    TEST_CASE("H2 energy at the zero point is the diagonal sum on |00>") {
        CPUSimulator sim;
        variational::EnergyObjective objective(variational::build_real_amplitudes(2, 1),
                                               variational::h2_hamiltonian(), sim);
        CHECK(objective.num_parameters() == 4);
        const double energy = objective(std::vector<double>(4, 0.0));
        CHECK(energy == doctest::Approx(-1.06365335002910293).epsilon(1e-12));
        CHECK(objective.evaluations() == 1);
    }

    TEST_CASE("objective is bounded by the operator norm and counts calls") {
        CPUSimulator sim;
        const auto h2 = variational::h2_hamiltonian();
        double bound = 0.0;
        for (const auto& term : h2.terms()) bound += std::abs(term.coefficient);

        variational::EnergyObjective objective(variational::build_real_amplitudes(2, 1), h2, sim);
        const std::vector<std::vector<double>> points{
            {0.1, 0.2, 0.3, 0.4}, {M_PI, 0.0, -1.0, 2.0}, {-0.5, 1.5, 0.25, -2.5}};
        for (const auto& p : points) {
            CHECK(std::abs(objective(p)) <= bound + 1e-12);
        }
        CHECK(objective.evaluations() == 3);
        CHECK_THROWS_AS(objective({0.1}), std::invalid_argument);
        CHECK(objective.evaluations() == 3);
    }

    TEST_CASE("flipping qubit 0 with RY(pi) changes the diagonal energy") {
        CPUSimulator sim;
        variational::EnergyObjective objective(variational::build_real_amplitudes(2, 0),
                                               variational::h2_hamiltonian(), sim);
        // |01>: II + (-1)IZ + ZI + (-1)ZZ
        const double expected = -1.052373245772859 - 0.39793742484318045 - 0.39793742484318045 + 0.01128010425624393;
        CHECK(objective({M_PI, 0.0}) == doctest::Approx(expected).epsilon(1e-12));
    }

    TEST_CASE("operator width must match the ansatz") {
        CPUSimulator sim;
        CHECK_THROWS_AS(variational::EnergyObjective(variational::build_real_amplitudes(3, 1),
                                                     variational::h2_hamiltonian(), sim),
                        std::invalid_argument);
    }
}
