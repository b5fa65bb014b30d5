/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <qlab/config/types.hpp>

namespace qlab::config {

// Assigns one field from its textual form. Returns an error message for an
// unknown key or an unparsable value; cfg is left unchanged in that case.
std::optional<std::string> set_value(RunConfig& cfg, const std::string& key, const std::string& value);

// Read configuration from file (JSON or key=value). A missing file is not an
// error. Returns list of errors (empty if ok); on error cfg is untouched.
std::vector<std::string> load_from_file(RunConfig& cfg, const std::string& path);

// Apply QLAB_ALGO, QLAB_SHOTS and QLAB_SEED on top of current cfg.
std::vector<std::string> apply_env_overrides(RunConfig& cfg);

std::vector<std::string> apply_overrides(RunConfig& cfg, const Overrides& overrides);

// Validate the parameters the selected algorithm uses. Returns list of errors.
std::vector<std::string> validate_final(const RunConfig& cfg);

} // namespace qlab::config
