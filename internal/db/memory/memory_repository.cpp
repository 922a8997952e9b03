#include "memory_repository.hpp"

#include <algorithm>
#include <map>

#include "memory_tx.hpp"

namespace evolve::db::memory {

namespace {

bool Matches(const model::ProgramRecord& record, const ProgramFilter& filter) {
  if (filter.experiment && record.experiment != filter.experiment) return false;
  if (filter.scored_only && !record.metrics) return false;
  if (filter.id_prefix && record.id.compare(0, filter.id_prefix->size(), *filter.id_prefix) != 0) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin(AccessMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertProgram(Transaction& t, const model::ProgramRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.programs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  s.programs[r.id]    = r;
  s.max_created_at_us = std::max(s.max_created_at_us.value_or(r.created_at_us), r.created_at_us);
  return Result::Ok();
}

std::optional<model::ProgramRecord> MemoryRepository::GetProgram(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.programs.find(id);
  if (it == s.programs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ProgramRecord> MemoryRepository::ListPrograms(Transaction& t, const ProgramFilter& filter) {
  const auto&                       s = TX(t).View();
  std::vector<model::ProgramRecord> records;
  records.reserve(s.programs.size());
  for (const auto& [_, record] : s.programs) {
    if (Matches(record, filter)) records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpdateMetrics(Transaction& t, const std::string& id, const evolve::model::FitnessMetrics& metrics) {
  auto& s  = TX(t).Mutable();
  auto  it = s.programs.find(id);
  if (it == s.programs.end()) return Result::Err(ErrorCode::NotFound, id);
  it->second.metrics = metrics;
  return Result::Ok();
}

Result MemoryRepository::DeletePrograms(Transaction& t, const std::vector<std::string>& ids) {
  auto& s = TX(t).Mutable();
  for (const auto& id : ids) {
    s.programs.erase(id);
  }
  return Result::Ok();
}

std::uint64_t MemoryRepository::CountPrograms(Transaction& t, const std::optional<std::string>& experiment) {
  const auto& s = TX(t).View();
  if (!experiment) return s.programs.size();
  return static_cast<std::uint64_t>(
      std::count_if(s.programs.begin(), s.programs.end(), [&](const auto& entry) { return entry.second.experiment == experiment; }));
}

std::vector<model::ExperimentRecord> MemoryRepository::ListExperiments(Transaction& t) {
  std::map<std::string, model::ExperimentRecord> by_name;
  for (const auto& [_, record] : TX(t).View().programs) {
    if (!record.experiment) continue;

    auto [it, inserted] = by_name.try_emplace(*record.experiment);
    auto& summary       = it->second;
    if (inserted) {
      summary.name                = *record.experiment;
      summary.first_created_at_us = record.created_at_us;
    }
    summary.count++;
    summary.first_created_at_us = std::min(summary.first_created_at_us, record.created_at_us);
    if (record.metrics) {
      summary.best_calmar = std::max(summary.best_calmar.value_or(record.metrics->calmar_ratio), record.metrics->calmar_ratio);
    }
  }

  std::vector<model::ExperimentRecord> out;
  out.reserve(by_name.size());
  for (auto& [_, summary] : by_name) out.push_back(std::move(summary));

  // newest experiment first
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.first_created_at_us > b.first_created_at_us; });
  return out;
}

std::optional<std::int64_t> MemoryRepository::MaxCreatedAt(Transaction& t) {
  return TX(t).View().max_created_at_us;
}

Result MemoryRepository::InsertTombstone(Transaction& t, const model::TombstoneRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.tombstones.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  s.tombstones[r.id]  = r;
  s.max_created_at_us = std::max(s.max_created_at_us.value_or(r.created_at_us), r.created_at_us);
  return Result::Ok();
}

std::optional<model::TombstoneRecord> MemoryRepository::GetTombstone(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.tombstones.find(id);
  if (it == s.tombstones.end()) return std::nullopt;
  return it->second;
}

} // namespace evolve::db::memory
