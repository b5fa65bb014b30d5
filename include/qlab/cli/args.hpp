/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <qlab/config/types.hpp>
#include <qlab/logging/logger.hpp>

namespace qlab::cli {

// Parse CLI using cxxopts. Writes help/version through provided logger when requested.
qlab::config::ParseResult parse(int argc, char** argv, qlab::logging::Logger& log);

} // namespace qlab::cli
