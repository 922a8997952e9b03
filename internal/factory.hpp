#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/store/program_store.hpp"

namespace evolve::factory {

/*
  Application

  Owns the long-lived objects of one process. The store keeps its own
  reference to the repository; repository is exposed for tooling.
*/
struct Application {
  std::shared_ptr<db::Repository>     repository;
  std::shared_ptr<store::ProgramStore> store;
};

/*
  Composition root. The ONLY place allowed to know concrete DB types.
  SQLite databases are migrated to the latest schema before use.
*/
std::shared_ptr<db::Repository> BuildRepository(const evolve::runtime::config::RuntimeConfig& config);

// Built-in defaults overlaid with the population/selection sections.
store::StoreOptions BuildStoreOptions(const evolve::runtime::config::RuntimeConfig& config);

Application Build(const evolve::runtime::config::RuntimeConfig& config);

} // namespace evolve::factory
