#include "program_store.hpp"

#include <algorithm>
#include <random>
#include <unordered_map>
#include <unordered_set>

#include "internal/model/metric.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/ranking.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace evolve::store {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      EVOLVE_LOG_ERROR("Storage failure", {StringField("context", context), StringField("error", result.message)});
      throw util::StorageError(message);
  }
}

void ValidateMetrics(const model::FitnessMetrics& metrics) {
  if (!model::IsFinite(metrics)) {
    throw util::InvalidArgument("fitness metrics must be finite");
  }
}

model::Program ToProgram(db::model::ProgramRecord record) {
  model::Program program;
  program.id         = std::move(record.id);
  program.code       = std::move(record.code);
  program.parent_id  = std::move(record.parent_id);
  program.generation = record.generation;
  program.experiment = std::move(record.experiment);
  if (record.metrics) {
    program.evaluation = model::Scored{*record.metrics};
  } else {
    program.evaluation = model::Pending{};
  }
  program.created_at = util::FromUnixMicros(record.created_at_us);
  return program;
}

std::vector<model::Program> ToPrograms(std::vector<db::model::ProgramRecord> records) {
  std::vector<model::Program> programs;
  programs.reserve(records.size());
  for (auto& record : records) {
    programs.push_back(ToProgram(std::move(record)));
  }
  return programs;
}

Rng MakeRng(const std::optional<std::uint64_t>& seed) {
  if (seed) {
    return Rng(*seed);
  }
  return Rng(std::random_device{}());
}

} // namespace

void ValidateOptions(const StoreOptions& options) {
  if (options.population_size == 0) {
    throw util::InvalidArgument("population_size must be positive");
  }
  if (options.archive_size == 0) {
    throw util::InvalidArgument("archive_size must be positive");
  }
  if (options.archive_size >= options.population_size) {
    throw util::InvalidArgument("archive_size (" + std::to_string(options.archive_size) + ") must be < population_size (" +
                                std::to_string(options.population_size) + ")");
  }
  ValidateMix(options.mix);
}

ProgramStore::ProgramStore(std::shared_ptr<db::Repository> repository, StoreOptions options)
    : repository_(std::move(repository)), options_(std::move(options)), rng_(MakeRng(options_.random_seed)) {
  if (!repository_) {
    throw util::InvalidArgument("program store requires a repository");
  }
  ValidateOptions(options_);

  // resume the created_at sequence after a restart
  auto tx             = repository_->Begin(db::AccessMode::kReadOnly);
  last_created_at_us_ = repository_->MaxCreatedAt(*tx).value_or(0);
  tx->Commit();

  EVOLVE_LOG_INFO("Program store opened", {IntField("population_size", options_.population_size),
                                           IntField("archive_size", options_.archive_size),
                                           BoolField("seeded", options_.random_seed.has_value())});
}

void ProgramStore::EnsureOpen() const {
  if (closed_.load()) {
    throw util::InvalidState("program store is closed");
  }
}

std::int64_t ProgramStore::NextCreatedAtLocked() {
  auto now = util::ToUnixMicros(util::Now());
  if (now <= last_created_at_us_) {
    now = last_created_at_us_ + 1;
  }
  last_created_at_us_ = now;
  return now;
}

std::uint32_t ProgramStore::ResolveGeneration(db::Transaction& tx, const std::string& parent_id) {
  if (auto parent = repository_->GetProgram(tx, parent_id)) {
    return parent->generation + 1;
  }
  // pruned parents stay valid lineage anchors
  if (auto tombstone = repository_->GetTombstone(tx, parent_id)) {
    return tombstone->generation + 1;
  }
  throw util::NotFound("parent program not found: " + parent_id);
}

std::string ProgramStore::Insert(const std::string& code, std::optional<model::FitnessMetrics> metrics, std::optional<std::string> parent_id,
                                 std::optional<std::string> experiment) {
  if (code.empty()) {
    throw util::InvalidArgument("program code must not be empty");
  }
  if (metrics) {
    ValidateMetrics(*metrics);
  }
  if (parent_id && !util::IsWellFormedId(*parent_id)) {
    throw util::InvalidArgument("malformed parent id: " + *parent_id);
  }

  std::lock_guard<std::mutex> lock(mutation_mutex_);
  EnsureOpen();

  auto tx = repository_->Begin(db::AccessMode::kReadWrite);

  db::model::ProgramRecord record;
  record.id            = util::NewId();
  record.code          = code;
  record.parent_id     = std::move(parent_id);
  record.generation    = record.parent_id ? ResolveGeneration(*tx, *record.parent_id) : 0;
  record.experiment    = std::move(experiment);
  record.metrics       = std::move(metrics);
  record.created_at_us = NextCreatedAtLocked();

  ThrowIfDbError(repository_->InsertProgram(*tx, record), "insert program");

  std::size_t pruned = 0;
  if (repository_->CountPrograms(*tx, std::nullopt) > options_.population_size) {
    pruned = PruneLocked(*tx);
  }

  tx->Commit();

  EVOLVE_LOG_DEBUG("Inserted program", {StringField("id", record.id), IntField("generation", record.generation),
                                        StringField("experiment", record.experiment.value_or("")),
                                        BoolField("scored", record.metrics.has_value()), IntField("pruned", static_cast<int64_t>(pruned))});
  return record.id;
}

void ProgramStore::UpdateMetrics(const std::string& id, const model::FitnessMetrics& metrics) {
  ValidateMetrics(metrics);

  std::lock_guard<std::mutex> lock(mutation_mutex_);
  EnsureOpen();

  auto tx = repository_->Begin(db::AccessMode::kReadWrite);
  ThrowIfDbError(repository_->UpdateMetrics(*tx, id, metrics), "update metrics for program " + id);
  tx->Commit();

  EVOLVE_LOG_DEBUG("Updated program metrics", {StringField("id", id), observability::DoubleField("calmar", metrics.calmar_ratio)});
}

std::optional<model::Program> ProgramStore::Get(const std::string& id) const {
  EnsureOpen();

  auto tx     = repository_->Begin(db::AccessMode::kReadOnly);
  auto record = repository_->GetProgram(*tx, id);
  tx->Commit();

  if (!record) {
    return std::nullopt;
  }
  return ToProgram(std::move(*record));
}

std::vector<model::Program> ProgramStore::TopK(std::size_t k, std::string_view metric, const std::optional<std::string>& experiment) const {
  const auto parsed = model::ParseMetric(metric);
  EnsureOpen();

  if (k == 0) {
    return {};
  }

  db::ProgramFilter filter;
  filter.experiment  = experiment;
  filter.scored_only = true;

  auto tx      = repository_->Begin(db::AccessMode::kReadOnly);
  auto records = repository_->ListPrograms(*tx, filter);
  tx->Commit();

  auto ranked = RankByMetric(ToPrograms(std::move(records)), parsed);
  if (ranked.size() > k) {
    ranked.resize(k);
  }
  return ranked;
}

std::optional<model::Program> ProgramStore::Sample(std::string_view strategy, const std::optional<std::string>& experiment) const {
  return Sample(ParseSampleStrategy(strategy), experiment);
}

std::optional<model::Program> ProgramStore::Sample(SampleStrategy strategy, const std::optional<std::string>& experiment) const {
  EnsureOpen();

  db::ProgramFilter filter;
  filter.experiment  = experiment;
  filter.scored_only = strategy != SampleStrategy::kExplore;

  auto tx      = repository_->Begin(db::AccessMode::kReadOnly);
  auto records = repository_->ListPrograms(*tx, filter);
  tx->Commit();

  std::lock_guard<std::mutex> lock(rng_mutex_);
  return Select(strategy, ToPrograms(std::move(records)), rng_);
}

std::optional<SampledParent> ProgramStore::SampleParent(const std::optional<std::string>& experiment) const {
  SampleStrategy strategy;
  {
    std::lock_guard<std::mutex>            lock(rng_mutex_);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    strategy = ChooseStrategy(unit(rng_), options_.mix);
  }

  auto program = Sample(strategy, experiment);
  if (!program) {
    return std::nullopt;
  }

  EVOLVE_LOG_DEBUG("Sampled parent", {StringField("strategy", ToString(strategy)), StringField("id", program->id)});
  return SampledParent{strategy, std::move(*program)};
}

std::vector<model::Program> ProgramStore::GetLineage(const std::string& id) const {
  EnsureOpen();

  auto tx    = repository_->Begin(db::AccessMode::kReadOnly);
  auto start = repository_->GetProgram(*tx, id);
  if (!start) {
    throw util::NotFound("program not found: " + id);
  }

  std::vector<model::Program>     lineage;
  std::unordered_set<std::string> visited{id};

  auto parent_id = start->parent_id;
  lineage.push_back(ToProgram(std::move(*start)));

  while (parent_id) {
    if (!visited.insert(*parent_id).second) {
      EVOLVE_LOG_WARN("Lineage cycle detected", {StringField("id", id), StringField("at", *parent_id)});
      break;
    }

    auto parent = repository_->GetProgram(*tx, *parent_id);
    if (!parent) {
      // dangling: the parent was pruned
      break;
    }

    parent_id = parent->parent_id;
    lineage.push_back(ToProgram(std::move(*parent)));
  }

  tx->Commit();
  return lineage;
}

std::uint64_t ProgramStore::Count(const std::optional<std::string>& experiment) const {
  EnsureOpen();

  auto tx    = repository_->Begin(db::AccessMode::kReadOnly);
  auto count = repository_->CountPrograms(*tx, experiment);
  tx->Commit();
  return count;
}

std::size_t ProgramStore::Prune() {
  std::lock_guard<std::mutex> lock(mutation_mutex_);
  EnsureOpen();

  auto tx     = repository_->Begin(db::AccessMode::kReadWrite);
  auto pruned = PruneLocked(*tx);
  tx->Commit();
  return pruned;
}

std::size_t ProgramStore::PruneLocked(db::Transaction& tx) {
  auto live = ToPrograms(repository_->ListPrograms(tx, db::ProgramFilter{}));
  if (live.size() <= options_.population_size) {
    return 0;
  }

  const auto live_before = live.size();
  auto       victims     = SelectPruneVictims(live, options_.population_size, options_.archive_size);
  if (victims.empty()) {
    return 0;
  }

  std::unordered_map<std::string, const model::Program*> by_id;
  by_id.reserve(live.size());
  for (const auto& program : live) {
    by_id.emplace(program.id, &program);
  }

  ThrowIfDbError(repository_->DeletePrograms(tx, victims), "delete pruned programs");

  const auto pruned_at_us = util::ToUnixMicros(util::Now());
  for (const auto& id : victims) {
    const auto* program = by_id.at(id);

    db::model::TombstoneRecord tombstone;
    tombstone.id            = id;
    tombstone.generation    = program->generation;
    tombstone.experiment    = program->experiment;
    tombstone.created_at_us = util::ToUnixMicros(program->created_at);
    tombstone.pruned_at_us  = pruned_at_us;
    ThrowIfDbError(repository_->InsertTombstone(tx, tombstone), "record tombstone for " + id);
  }

  EVOLVE_LOG_INFO("Pruned programs", {IntField("pruned", static_cast<int64_t>(victims.size())),
                                      IntField("live_before", static_cast<int64_t>(live_before)),
                                      IntField("population_size", options_.population_size)});
  return victims.size();
}

std::vector<ExperimentSummary> ProgramStore::ListExperiments() const {
  EnsureOpen();

  auto tx      = repository_->Begin(db::AccessMode::kReadOnly);
  auto records = repository_->ListExperiments(*tx);
  tx->Commit();

  std::vector<ExperimentSummary> out;
  out.reserve(records.size());
  for (auto& record : records) {
    ExperimentSummary summary;
    summary.name        = std::move(record.name);
    summary.count       = record.count;
    summary.best_calmar = record.best_calmar;
    summary.created_at  = util::FromUnixMicros(record.first_created_at_us);
    out.push_back(std::move(summary));
  }
  return out;
}

std::optional<model::Program> ProgramStore::FindByPrefix(const std::string& prefix) const {
  if (prefix.empty()) {
    throw util::InvalidArgument("id prefix must not be empty");
  }
  if (auto exact = Get(prefix)) {
    return exact;
  }

  db::ProgramFilter filter;
  filter.id_prefix = prefix;

  auto tx      = repository_->Begin(db::AccessMode::kReadOnly);
  auto records = repository_->ListPrograms(*tx, filter);
  tx->Commit();

  if (records.empty()) {
    return std::nullopt;
  }
  if (records.size() > 1) {
    throw util::InvalidArgument("ambiguous id prefix " + prefix + " matches " + std::to_string(records.size()) + " programs");
  }
  return ToProgram(std::move(records.front()));
}

void ProgramStore::Close() {
  std::lock_guard<std::mutex> lock(mutation_mutex_);
  if (closed_.exchange(true)) {
    return;
  }

  repository_->Flush();
  EVOLVE_LOG_INFO("Program store closed");
}

} // namespace evolve::store
