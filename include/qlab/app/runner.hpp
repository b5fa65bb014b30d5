/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <optional>

#include <qlab/config/types.hpp>
#include <qlab/logging/logger.hpp>
#include <qlab/quantum/circuit.hpp>

namespace qlab::app {

// defaults < config file < environment < explicit CLI options, then
// validate_final. Every error is logged; nullopt when any occurred.
std::optional<config::RunConfig> resolve_config(const config::ParseResult& pr, logging::Logger& log);

// Circuit for cfg.algo; cfg must have passed validate_final.
quantum::QuantumCircuit build_circuit(const config::RunConfig& cfg);

// Samples the selected algorithm and logs the histogram and its interpretation.
int run(const config::RunConfig& cfg, logging::Logger& log);

} // namespace qlab::app
