#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/proto_convert.hpp"
#include "internal/util/errors.hpp"

using evolve::model::Program;
using evolve::store::ProgramStore;

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitUsage    = 1;
constexpr int kExitNotFound = 2;
constexpr int kExitFailure  = 3;

void Usage() {
  std::cout << "Usage:\n"
            << "  evolvectl [--config <path.yaml>] status [experiment]\n"
            << "  evolvectl [--config <path.yaml>] best [k] [--metric m] [--experiment e] [--json]\n"
            << "  evolvectl [--config <path.yaml>] show <id-or-prefix> [--json]\n"
            << "  evolvectl [--config <path.yaml>] lineage <id-or-prefix>\n"
            << "  evolvectl [--config <path.yaml>] export <id-or-prefix> [--output file] [--with-lineage]\n"
            << "  evolvectl [--config <path.yaml>] experiments [--json]\n"
            << "  evolvectl [--config <path.yaml>] sample [elite|exploit|explore] [--experiment e]\n"
            << "  evolvectl [--config <path.yaml>] seed <file> [--experiment e]\n"
            << "  evolvectl [--config <path.yaml>] score <id-or-prefix> <metrics.json>\n"
            << "  evolvectl [--config <path.yaml>] prune\n";
}

struct Args {
  std::string                        command;
  std::vector<std::string>           positional;
  std::map<std::string, std::string> options;
  bool                               json         = false;
  bool                               with_lineage = false;

  std::optional<std::string> Option(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) return std::nullopt;
    return it->second;
  }
};

// nullopt on malformed input
std::optional<Args> ParseArgs(int argc, char** argv, std::optional<std::string>& config_path) {
  Args args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--json") {
      args.json = true;
      continue;
    }
    if (arg == "--with-lineage") {
      args.with_lineage = true;
      continue;
    }
    if (arg == "-o") arg = "--output";

    if (arg == "--config" || arg == "--metric" || arg == "--experiment" || arg == "--output") {
      if (i + 1 >= argc) {
        std::cerr << arg << " requires a value\n";
        return std::nullopt;
      }
      if (arg == "--config") {
        config_path = argv[++i];
      } else {
        args.options[arg.substr(2)] = argv[++i];
      }
      continue;
    }
    if (arg.rfind("--", 0) == 0) {
      std::cerr << "unknown option: " << arg << "\n";
      return std::nullopt;
    }

    if (args.command.empty()) {
      args.command = arg;
    } else {
      args.positional.push_back(arg);
    }
  }

  if (args.command.empty()) return std::nullopt;
  return args;
}

std::string Fixed(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

std::string ShortId(const std::string& id) {
  return id.substr(0, 8);
}

// Exact id or unique prefix; NotFound otherwise.
Program Resolve(const ProgramStore& store, const std::string& id_or_prefix) {
  auto program = store.FindByPrefix(id_or_prefix);
  if (!program) {
    throw evolve::util::NotFound("program not found: " + id_or_prefix);
  }
  return std::move(*program);
}

void PrintProgram(const Program& program) {
  std::cout << "id=" << program.id << "\n";
  std::cout << "generation=" << program.generation << "\n";
  std::cout << "parent=" << program.parent_id.value_or("seed") << "\n";
  std::cout << "experiment=" << program.experiment.value_or("") << "\n";
  std::cout << "created_at=" << evolve::util::FormatMinutes(program.created_at) << "\n";

  if (const auto* m = program.Metrics()) {
    std::cout << "calmar=" << Fixed(m->calmar_ratio, 4) << "\n";
    std::cout << "sharpe=" << Fixed(m->sharpe_ratio, 4) << "\n";
    std::cout << "max_dd=" << Fixed(m->max_drawdown, 4) << "\n";
    std::cout << "cagr=" << Fixed(m->cagr, 4) << "\n";
    std::cout << "total_return=" << Fixed(m->total_return, 4) << "\n";
  } else {
    std::cout << "state=pending\n";
  }

  std::cout << "\n" << program.code << "\n";
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

int Status(const ProgramStore& store, const Args& args) {
  std::optional<std::string> experiment;
  if (!args.positional.empty()) experiment = args.positional[0];

  const auto count = store.Count(experiment);
  if (experiment && count == 0) {
    std::cerr << "experiment not found: " << *experiment << "\n";
    return kExitNotFound;
  }

  auto top = store.TopK(1, "calmar", experiment);

  std::cout << "experiment=" << experiment.value_or("*") << "\n";
  std::cout << "population=" << count << "\n";
  std::cout << "population_size=" << store.Options().population_size << "\n";
  if (!top.empty()) {
    std::cout << "best_calmar=" << Fixed(top.front().Metrics()->calmar_ratio, 4) << "\n";
    std::cout << "best_id=" << top.front().id << "\n";
    std::cout << "best_generation=" << top.front().generation << "\n";
  }
  return kExitOk;
}

int Best(const ProgramStore& store, const Args& args) {
  std::size_t k = 10;
  if (!args.positional.empty()) {
    const auto& text   = args.positional[0];
    char*       endptr = nullptr;
    k                  = std::strtoul(text.c_str(), &endptr, 10);
    if (text.empty() || text.front() == '-' || *endptr != '\0') {
      throw evolve::util::InvalidArgument("k must be a non-negative integer, got '" + text + "'");
    }
  }

  const auto metric = args.Option("metric").value_or("calmar");
  auto       top    = store.TopK(k, metric, args.Option("experiment"));

  if (top.empty()) {
    std::cerr << "no scored programs\n";
    return kExitNotFound;
  }

  if (args.json) {
    std::cout << evolve::store::ToJson(evolve::store::ToProgramList(top));
    return kExitOk;
  }

  std::cout << "Top " << top.size() << " programs (by " << metric << ")\n";
  std::cout << std::left << std::setw(5) << "Rank" << std::setw(10) << "ID" << std::setw(5) << "Gen" << std::setw(12) << "Calmar"
            << std::setw(12) << "Sharpe" << std::setw(12) << "MaxDD" << "\n";

  std::size_t rank = 1;
  for (const auto& program : top) {
    const auto* m = program.Metrics();
    std::cout << std::left << std::setw(5) << rank++ << std::setw(10) << ShortId(program.id) << std::setw(5) << program.generation
              << std::setw(12) << Fixed(m->calmar_ratio, 4) << std::setw(12) << Fixed(m->sharpe_ratio, 4) << std::setw(12)
              << Fixed(m->max_drawdown, 4) << "\n";
  }
  return kExitOk;
}

int Show(const ProgramStore& store, const Args& args) {
  if (args.positional.empty()) return kExitUsage;

  auto program = Resolve(store, args.positional[0]);
  if (args.json) {
    std::cout << evolve::store::ToJson(evolve::store::ToProto(program));
  } else {
    PrintProgram(program);
  }
  return kExitOk;
}

int Lineage(const ProgramStore& store, const Args& args) {
  if (args.positional.empty()) return kExitUsage;

  auto lineage = store.GetLineage(Resolve(store, args.positional[0]).id);
  for (const auto& program : lineage) {
    std::cout << program.id << " gen=" << program.generation;
    if (const auto* m = program.Metrics()) {
      std::cout << " calmar=" << Fixed(m->calmar_ratio, 4);
    } else {
      std::cout << " pending";
    }
    std::cout << "\n";
  }

  const auto& root = lineage.back();
  if (root.parent_id) {
    std::cout << root.parent_id.value() << " (pruned)\n";
  }
  return kExitOk;
}

int Export(const ProgramStore& store, const Args& args) {
  if (args.positional.empty()) return kExitUsage;

  auto program = Resolve(store, args.positional[0]);

  std::ostringstream out;
  out << "\"\"\"\n";
  out << "Evolved Strategy: " << program.id << "\n";
  out << "Generation: " << program.generation << "\n";
  out << "Parent: " << program.parent_id.value_or("seed") << "\n";
  if (const auto* m = program.Metrics()) {
    out << "Fitness: Calmar=" << Fixed(m->calmar_ratio, 4) << ", Sharpe=" << Fixed(m->sharpe_ratio, 4) << "\n";
  }

  if (args.with_lineage) {
    auto lineage = store.GetLineage(program.id);
    if (lineage.size() > 1) {
      out << "\nLineage:\n";
      for (std::size_t i = 1; i < lineage.size(); ++i) {
        const auto* m = lineage[i].Metrics();
        out << "  <- " << ShortId(lineage[i].id) << "... (gen " << lineage[i].generation
            << ", calmar=" << Fixed(m ? m->calmar_ratio : 0.0, 2) << ")\n";
      }
    }
  }
  out << "\"\"\"\n\n" << program.code;

  const auto path = args.Option("output").value_or("./" + ShortId(program.id) + ".py");

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file << out.str();
  file.close();
  if (!file) {
    throw evolve::util::StorageError("failed to write " + path);
  }

  std::cout << "Exported to: " << path << "\n";
  return kExitOk;
}

int Experiments(const ProgramStore& store, const Args& args) {
  auto experiments = store.ListExperiments();

  if (args.json) {
    std::cout << evolve::store::ToJson(evolve::store::ToExperimentList(experiments));
    return kExitOk;
  }

  if (experiments.empty()) {
    std::cout << "No experiments found\n";
    return kExitOk;
  }

  std::cout << std::left << std::setw(25) << "Name" << std::setw(8) << "Count" << std::setw(10) << "Best" << "Created\n";
  for (const auto& e : experiments) {
    std::cout << std::left << std::setw(25) << e.name << std::setw(8) << e.count << std::setw(10)
              << (e.best_calmar ? Fixed(*e.best_calmar, 4) : std::string("N/A")) << evolve::util::FormatMinutes(e.created_at) << "\n";
  }
  return kExitOk;
}

int Sample(const ProgramStore& store, const Args& args) {
  const auto experiment = args.Option("experiment");

  if (!args.positional.empty()) {
    const auto strategy = evolve::store::ParseSampleStrategy(args.positional[0]);
    auto       program  = store.Sample(strategy, experiment);
    if (!program) {
      std::cerr << "nothing to sample\n";
      return kExitNotFound;
    }
    std::cout << "strategy=" << evolve::store::ToString(strategy) << " id=" << program->id << "\n";
    return kExitOk;
  }

  auto sampled = store.SampleParent(experiment);
  if (!sampled) {
    std::cerr << "nothing to sample\n";
    return kExitNotFound;
  }
  std::cout << "strategy=" << evolve::store::ToString(sampled->strategy) << " id=" << sampled->program.id << "\n";
  return kExitOk;
}

int Seed(ProgramStore& store, const Args& args) {
  if (args.positional.empty()) return kExitUsage;

  std::ifstream file(args.positional[0], std::ios::binary);
  if (!file) {
    std::cerr << "cannot read " << args.positional[0] << "\n";
    return kExitNotFound;
  }
  std::ostringstream code;
  code << file.rdbuf();

  auto id = store.Insert(code.str(), std::nullopt, std::nullopt, args.Option("experiment"));
  std::cout << id << "\n";
  return kExitOk;
}

int Score(ProgramStore& store, const Args& args) {
  if (args.positional.size() < 2) return kExitUsage;

  const auto id = Resolve(store, args.positional[0]).id;

  std::ifstream file(args.positional[1], std::ios::binary);
  if (!file) {
    std::cerr << "cannot read " << args.positional[1] << "\n";
    return kExitNotFound;
  }
  std::ostringstream json;
  json << file.rdbuf();

  store.UpdateMetrics(id, evolve::store::MetricsFromJson(json.str()));
  std::cout << "scored " << id << "\n";
  return kExitOk;
}

int Prune(ProgramStore& store) {
  std::cout << "pruned=" << store.Prune() << "\n";
  return kExitOk;
}

int Dispatch(ProgramStore& store, const Args& args) {
  if (args.command == "status") return Status(store, args);
  if (args.command == "best") return Best(store, args);
  if (args.command == "show") return Show(store, args);
  if (args.command == "lineage") return Lineage(store, args);
  if (args.command == "export") return Export(store, args);
  if (args.command == "experiments") return Experiments(store, args);
  if (args.command == "sample") return Sample(store, args);
  if (args.command == "seed") return Seed(store, args);
  if (args.command == "score") return Score(store, args);
  if (args.command == "prune") return Prune(store);

  std::cerr << "unknown command: " << args.command << "\n";
  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  auto                       args = ParseArgs(argc, argv, config_path);
  if (!args) {
    Usage();
    return kExitUsage;
  }

  int rc = kExitOk;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path ? evolve::config::ConfigLoader::LoadFromYaml(*config_path) : evolve::config::ConfigLoader::LoadDefault();

    evolve::observability::InitializeLogging(config);

    auto app = evolve::factory::Build(config);

    rc = Dispatch(*app.store, *args);
    if (rc == kExitUsage) Usage();

    app.store->Close();
  } catch (const evolve::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    rc = kExitNotFound;
  } catch (const evolve::util::InvalidArgument& e) {
    std::cerr << e.what() << "\n";
    rc = kExitUsage;
  } catch (const std::exception& e) {
    EVOLVE_LOG_ERROR("Fatal error", {evolve::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    rc = kExitFailure;
  }

  evolve::observability::ShutdownLogging();
  return rc;
}
