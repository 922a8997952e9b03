#pragma once

#include <string>

#include "config/config.pb.h"

namespace evolve::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown fields are
  rejected. Every loader applies EVOLVE_* environment overrides last.
*/
class ConfigLoader {
 public:
  static evolve::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Memory backend with built-in defaults, plus environment overrides.
  static evolve::runtime::config::RuntimeConfig LoadDefault();

  /*
    EVOLVE_DB_PATH            -> database.sqlite.path (switches to sqlite)
    EVOLVE_POPULATION_SIZE    -> population.population_size
    EVOLVE_ARCHIVE_SIZE       -> population.archive_size
    EVOLVE_ELITE_RATIO        -> selection.elite_ratio
    EVOLVE_EXPLORATION_RATIO  -> selection.exploration_ratio
    EVOLVE_RANDOM_SEED        -> selection.random_seed

    Throws util::InvalidArgument for values that do not parse.
  */
  static void ApplyEnvironmentOverrides(evolve::runtime::config::RuntimeConfig& config);
};

} // namespace evolve::config
