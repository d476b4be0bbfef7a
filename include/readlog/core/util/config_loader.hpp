// include/readlog/core/util/config_loader.hpp
#pragma once

#include <string>

#include "readlog/core/config.hpp"
#include "readlog/core/status.hpp"

namespace readlog {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

// Same, from YAML text (no includes). Used for inline configs and tests.
Result<Config> parse_config(const std::string& yaml_text);

}  // namespace readlog
