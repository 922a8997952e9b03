#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace evolve::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin(AccessMode mode = AccessMode::kReadWrite) override;

  Result InsertProgram(Transaction&, const model::ProgramRecord&) override;
  std::optional<model::ProgramRecord> GetProgram(Transaction&, const std::string&) override;
  std::vector<model::ProgramRecord> ListPrograms(Transaction&, const ProgramFilter&) override;
  Result UpdateMetrics(Transaction&, const std::string&, const evolve::model::FitnessMetrics&) override;
  Result DeletePrograms(Transaction&, const std::vector<std::string>&) override;
  std::uint64_t CountPrograms(Transaction&, const std::optional<std::string>& experiment) override;
  std::vector<model::ExperimentRecord> ListExperiments(Transaction&) override;
  std::optional<std::int64_t> MaxCreatedAt(Transaction&) override;

  Result InsertTombstone(Transaction&, const model::TombstoneRecord&) override;
  std::optional<model::TombstoneRecord> GetTombstone(Transaction&, const std::string&) override;

  void Flush() override {}

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ProgramRecord> programs;
    std::unordered_map<std::string, model::TombstoneRecord> tombstones;
    std::optional<std::int64_t> max_created_at_us;
  };

  std::mutex mutex_;
  // Readers share the committed snapshot; commits publish a new one.
  std::shared_ptr<const State> committed_;
  std::uint64_t committed_version_ = 0;
};

}
