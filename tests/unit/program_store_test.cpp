#include "internal/store/program_store.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using evolve::db::memory::MemoryRepository;
using evolve::model::FitnessMetrics;
using evolve::store::ProgramStore;
using evolve::store::StoreOptions;

FitnessMetrics Calmar(double calmar) {
  FitnessMetrics metrics;
  metrics.calmar_ratio = calmar;
  metrics.sharpe_ratio = calmar / 2.0;
  metrics.max_drawdown = -0.1;
  metrics.cagr         = 0.2;
  metrics.total_return = 0.5;
  return metrics;
}

std::unique_ptr<ProgramStore> MakeStore(std::uint32_t population_size = 500, std::uint32_t archive_size = 50) {
  StoreOptions options;
  options.population_size = population_size;
  options.archive_size    = archive_size;
  options.random_seed     = 42;
  return std::make_unique<ProgramStore>(std::make_shared<MemoryRepository>(), options);
}

std::multiset<double> LiveCalmars(const ProgramStore& store) {
  std::multiset<double> out;
  for (const auto& program : store.TopK(1000)) {
    out.insert(program.Metrics()->calmar_ratio);
  }
  return out;
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestPruneKeepsArchiveAndDropsLowest() {
  auto store = MakeStore(3, 1);

  for (double calmar : {1.0, 5.0, 2.0, 0.5}) {
    store->Insert("def strategy(): return " + std::to_string(calmar), Calmar(calmar));
  }

  assert(store->Count() == 3);
  assert((LiveCalmars(*store) == std::multiset<double>{5.0, 1.0, 2.0}));
}

void TestChildGenerationAndLineage() {
  auto store = MakeStore();

  const auto a = store->Insert("root");
  const auto b = store->Insert("child", std::nullopt, a);

  auto child = store->Get(b);
  assert(child.has_value());
  assert(child->generation == 1);
  assert(child->parent_id == a);

  auto lineage = store->GetLineage(b);
  assert(lineage.size() == 2);
  assert(lineage[0].id == b);
  assert(lineage[1].id == a);
  assert(lineage[1].generation == 0);
  assert(!lineage[1].parent_id.has_value());
}

void TestTopKExcludesPending() {
  auto store = MakeStore();

  store->Insert("pending");
  const auto three = store->Insert("three", Calmar(3.0));
  const auto seven = store->Insert("seven", Calmar(7.0));

  auto top = store->TopK(2, "calmar");
  assert(top.size() == 2);
  assert(top[0].id == seven);
  assert(top[1].id == three);

  auto all = store->TopK(10, "sharpe");
  assert(all.size() == 2);
  for (const auto& program : all) {
    assert(program.IsScored());
  }
}

void TestUnknownNamesAreRejected() {
  auto store = MakeStore();
  store->Insert("x", Calmar(1.0));

  assert(Throws<evolve::util::InvalidArgument>([&] { (void)store->Sample("bogus"); }));
  assert(Throws<evolve::util::InvalidArgument>([&] { (void)store->TopK(1, "sortino"); }));
}

void TestUpdateMetricsUnknownIdIsNotFound() {
  auto store = MakeStore();
  assert(Throws<evolve::util::NotFound>([&] { store->UpdateMetrics("nonexistent-id", Calmar(1.0)); }));
  assert(Throws<evolve::util::NotFound>([&] { (void)store->GetLineage("nonexistent-id"); }));
}

void TestEmptyStoreQueries() {
  auto store = MakeStore();

  assert(!store->Sample().has_value());
  assert(!store->Sample("elite").has_value());
  assert(!store->Sample("explore").has_value());
  assert(!store->SampleParent().has_value());
  assert(store->TopK(5).empty());
  assert(store->Count() == 0);
  assert(store->ListExperiments().empty());
  assert(!store->Get("missing").has_value());
}

void TestUpdateMetricsIsIdempotent() {
  auto store = MakeStore();

  const auto root  = store->Insert("root", Calmar(1.0));
  const auto child = store->Insert("child", std::nullopt, root, "exp");

  auto metrics        = Calmar(4.0);
  metrics.psr         = 0.9;
  metrics.trade_count = 12;

  store->UpdateMetrics(child, metrics);
  store->UpdateMetrics(child, metrics);

  auto program = store->Get(child);
  assert(program.has_value());
  assert(program->IsScored());
  assert(*program->Metrics() == metrics);
  assert(program->generation == 1);
  assert(program->parent_id == root);
  assert(program->experiment == std::optional<std::string>("exp"));
  assert(store->Count() == 2);
}

void TestPendingArePrunedBeforeScored() {
  auto store = MakeStore(3, 1);

  const auto best = store->Insert("best", Calmar(9.0));
  const auto low  = store->Insert("low", Calmar(-2.0));
  const auto p1   = store->Insert("pending 1");
  const auto p2   = store->Insert("pending 2");

  assert(store->Count() == 3);
  assert(store->Get(best).has_value());
  assert(store->Get(low).has_value());
  // newest pending goes first
  assert(store->Get(p1).has_value());
  assert(!store->Get(p2).has_value());
}

void TestArchiveSurvivesPressure() {
  auto store = MakeStore(5, 2);

  const auto top1 = store->Insert("top1", Calmar(100.0));
  const auto top2 = store->Insert("top2", Calmar(90.0));

  for (int i = 0; i < 20; ++i) {
    store->Insert("filler " + std::to_string(i), Calmar(static_cast<double>(i)));
    assert(store->Count() <= 5);
    assert(store->Get(top1).has_value());
    assert(store->Get(top2).has_value());
  }
}

void TestPopulationBoundAcrossExperiments() {
  auto store = MakeStore(4, 1);

  for (int i = 0; i < 12; ++i) {
    const auto experiment = (i % 2 == 0) ? std::optional<std::string>("a") : std::optional<std::string>("b");
    if (i % 3 == 0) {
      store->Insert("p" + std::to_string(i), std::nullopt, std::nullopt, experiment);
    } else {
      store->Insert("p" + std::to_string(i), Calmar(static_cast<double>(i)), std::nullopt, experiment);
    }
    assert(store->Count() <= 4);
  }
  assert(store->Count() == 4);
  assert(store->Count("a") + store->Count("b") == 4);
}

void TestDanglingParentAfterPrune() {
  auto store = MakeStore(2, 1);

  const auto keeper = store->Insert("keeper", Calmar(10.0));
  const auto weak   = store->Insert("weak", Calmar(0.1));
  const auto child  = store->Insert("child", Calmar(5.0), weak);

  // the weak parent was pruned by the third insert
  assert(!store->Get(weak).has_value());
  assert(store->Get(keeper).has_value());

  auto program = store->Get(child);
  assert(program.has_value());
  assert(program->parent_id == weak);
  assert(program->generation == 1);

  auto lineage = store->GetLineage(child);
  assert(lineage.size() == 1);
  assert(lineage[0].id == child);

  // a pruned parent still resolves generation
  const auto grandchild = store->Insert("grandchild", Calmar(20.0), child);
  assert(store->Get(grandchild)->generation == 2);

  const auto sibling = store->Insert("sibling", Calmar(30.0), weak);
  assert(store->Get(sibling)->generation == 1);
}

void TestInsertValidation() {
  auto store = MakeStore();

  assert(Throws<evolve::util::InvalidArgument>([&] { store->Insert(""); }));
  assert(Throws<evolve::util::InvalidArgument>([&] { store->Insert("x", std::nullopt, std::string("not-a-uuid")); }));
  assert(Throws<evolve::util::NotFound>([&] { store->Insert("x", std::nullopt, std::string("00000000-0000-4000-8000-000000000000")); }));

  auto bad         = Calmar(1.0);
  bad.calmar_ratio = std::numeric_limits<double>::quiet_NaN();
  assert(Throws<evolve::util::InvalidArgument>([&] { store->Insert("x", bad); }));

  auto bad_optional = Calmar(1.0);
  bad_optional.win_rate = std::numeric_limits<double>::infinity();
  const auto id = store->Insert("x");
  assert(Throws<evolve::util::InvalidArgument>([&] { store->UpdateMetrics(id, bad_optional); }));

  assert(store->Count() == 1);
}

void TestInvalidOptionsAreRejected() {
  auto make = [](StoreOptions options) { ProgramStore store(std::make_shared<MemoryRepository>(), options); };

  StoreOptions archive_too_big;
  archive_too_big.population_size = 10;
  archive_too_big.archive_size    = 10;
  assert(Throws<evolve::util::InvalidArgument>([&] { make(archive_too_big); }));

  StoreOptions zero_population;
  zero_population.population_size = 0;
  assert(Throws<evolve::util::InvalidArgument>([&] { make(zero_population); }));

  StoreOptions zero_archive;
  zero_archive.archive_size = 0;
  assert(Throws<evolve::util::InvalidArgument>([&] { make(zero_archive); }));

  StoreOptions bad_ratio;
  bad_ratio.mix.elite_ratio = 1.5;
  assert(Throws<evolve::util::InvalidArgument>([&] { make(bad_ratio); }));

  StoreOptions ratio_sum;
  ratio_sum.mix.elite_ratio       = 0.6;
  ratio_sum.mix.exploration_ratio = 0.6;
  assert(Throws<evolve::util::InvalidArgument>([&] { make(ratio_sum); }));

  assert(Throws<evolve::util::InvalidArgument>([&] { ProgramStore store(nullptr, StoreOptions{}); }));
}

void TestCreatedAtIsStrictlyIncreasing() {
  auto store = MakeStore();

  std::vector<std::string> ids;
  for (int i = 0; i < 50; ++i) {
    ids.push_back(store->Insert("p" + std::to_string(i)));
  }
  for (std::size_t i = 1; i < ids.size(); ++i) {
    assert(store->Get(ids[i - 1])->created_at < store->Get(ids[i])->created_at);
  }
}

void TestExperimentScopedQueries() {
  auto store = MakeStore();

  store->Insert("a1", Calmar(1.0), std::nullopt, "alpha");
  const auto a2 = store->Insert("a2", Calmar(3.0), std::nullopt, "alpha");
  const auto b1 = store->Insert("b1", Calmar(8.0), std::nullopt, "beta");
  store->Insert("b2", std::nullopt, std::nullopt, "beta");
  store->Insert("loose", Calmar(50.0));

  assert(store->Count() == 5);
  assert(store->Count("alpha") == 2);
  assert(store->Count("beta") == 2);
  assert(store->Count("gamma") == 0);

  auto alpha_top = store->TopK(5, "calmar", "alpha");
  assert(alpha_top.size() == 2);
  assert(alpha_top[0].id == a2);

  for (int i = 0; i < 20; ++i) {
    auto sampled = store->Sample("elite", "beta");
    assert(sampled.has_value());
    assert(sampled->id == b1);
  }

  auto experiments = store->ListExperiments();
  assert(experiments.size() == 2);
  // newest experiment first
  assert(experiments[0].name == "beta");
  assert(experiments[0].count == 2);
  assert(experiments[0].best_calmar == std::optional<double>(8.0));
  assert(experiments[1].name == "alpha");
  assert(experiments[1].best_calmar == std::optional<double>(3.0));
}

void TestFindByPrefix() {
  auto store = MakeStore();

  const auto id = store->Insert("only", Calmar(1.0));

  auto exact = store->FindByPrefix(id);
  assert(exact.has_value() && exact->id == id);

  auto prefix = store->FindByPrefix(id.substr(0, 8));
  assert(prefix.has_value() && prefix->id == id);

  assert(!store->FindByPrefix("zzzz").has_value());
  assert(Throws<evolve::util::InvalidArgument>([&] { (void)store->FindByPrefix(""); }));

  // hex ids: 17 programs guarantee two share a first character
  for (int i = 0; i < 16; ++i) {
    store->Insert("more " + std::to_string(i));
  }
  bool ambiguous = false;
  for (const char c : std::string("0123456789abcdef")) {
    if (Throws<evolve::util::InvalidArgument>([&] { (void)store->FindByPrefix(std::string(1, c)); })) {
      ambiguous = true;
    }
  }
  assert(ambiguous);
}

void TestManualPruneIsNoOpWithinBounds() {
  auto store = MakeStore(10, 2);
  for (int i = 0; i < 5; ++i) {
    store->Insert("p" + std::to_string(i), Calmar(i));
  }
  assert(store->Prune() == 0);
  assert(store->Count() == 5);
}

void TestSampleParentFollowsMix() {
  StoreOptions elite_only;
  elite_only.mix         = {1.0, 0.0};
  elite_only.random_seed = 7;
  ProgramStore elite_store(std::make_shared<MemoryRepository>(), elite_only);

  std::string best;
  for (int i = 0; i < 10; ++i) {
    const auto id = elite_store.Insert("e" + std::to_string(i), Calmar(i));
    if (i == 9) best = id;
  }
  for (int i = 0; i < 20; ++i) {
    auto parent = elite_store.SampleParent();
    assert(parent.has_value());
    assert(parent->strategy == evolve::store::SampleStrategy::kElite);
    assert(parent->program.id == best);
  }

  StoreOptions explore_only;
  explore_only.mix         = {0.0, 1.0};
  explore_only.random_seed = 7;
  ProgramStore explore_store(std::make_shared<MemoryRepository>(), explore_only);

  const auto pending = explore_store.Insert("pending only");
  auto       parent  = explore_store.SampleParent();
  assert(parent.has_value());
  assert(parent->strategy == evolve::store::SampleStrategy::kExplore);
  assert(parent->program.id == pending);
}

void TestCloseRejectsLaterCalls() {
  auto       store = MakeStore();
  const auto id    = store->Insert("x", Calmar(1.0));

  store->Close();
  store->Close();

  assert(Throws<evolve::util::InvalidState>([&] { (void)store->Get(id); }));
  assert(Throws<evolve::util::InvalidState>([&] { store->Insert("y"); }));
  assert(Throws<evolve::util::InvalidState>([&] { (void)store->Count(); }));
  assert(Throws<evolve::util::InvalidState>([&] { (void)store->Sample(); }));
}

} // namespace

int main() {
  TestPruneKeepsArchiveAndDropsLowest();
  TestChildGenerationAndLineage();
  TestTopKExcludesPending();
  TestUnknownNamesAreRejected();
  TestUpdateMetricsUnknownIdIsNotFound();
  TestEmptyStoreQueries();
  TestUpdateMetricsIsIdempotent();
  TestPendingArePrunedBeforeScored();
  TestArchiveSurvivesPressure();
  TestPopulationBoundAcrossExperiments();
  TestDanglingParentAfterPrune();
  TestInsertValidation();
  TestInvalidOptionsAreRejected();
  TestCreatedAtIsStrictlyIncreasing();
  TestExperimentScopedQueries();
  TestFindByPrefix();
  TestManualPruneIsNoOpWithinBounds();
  TestSampleParentFollowsMix();
  TestCloseRejectsLaterCalls();

  std::cout << "evolve_store_unit_program_store: pass\n";
  return 0;
}
