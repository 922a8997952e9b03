#include "internal/store/proto_convert.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using evolve::model::FitnessMetrics;
using evolve::model::Program;
using evolve::model::Scored;

Program MakeScored() {
  FitnessMetrics metrics;
  metrics.calmar_ratio = 2.0;
  metrics.sharpe_ratio = 1.5;
  metrics.max_drawdown = -0.25;
  metrics.cagr         = 0.3;
  metrics.total_return = 1.1;
  metrics.trade_count  = 40;
  metrics.psr          = 0.97;

  Program program;
  program.id         = "6f1c7e0a-4d2b-4c1e-9a57-2b8f5d3c9e10";
  program.code       = "def strategy():\n    pass\n";
  program.parent_id  = "0b7a3c2e-1f4d-4e6a-8b9c-d0e1f2a3b4c5";
  program.generation = 3;
  program.experiment = "momentum";
  program.evaluation = Scored{metrics};
  program.created_at = evolve::util::FromUnixMicros(1700000000123456);
  return program;
}

void TestScoredProgramToProto() {
  const auto program = MakeScored();
  const auto proto   = evolve::store::ToProto(program);

  assert(proto.id() == program.id);
  assert(proto.code() == program.code);
  assert(proto.has_parent_id() && proto.parent_id() == *program.parent_id);
  assert(proto.generation() == 3);
  assert(proto.experiment() == "momentum");
  assert(proto.state() == evolve::store::v1::EVALUATION_STATE_SCORED);
  assert(proto.metrics().calmar_ratio() == 2.0);
  assert(proto.metrics().has_trade_count() && proto.metrics().trade_count() == 40);
  assert(!proto.metrics().has_win_rate());
  assert(proto.created_at().seconds() == 1700000000);
  assert(proto.created_at().nanos() == 123456000);

  assert(evolve::store::FromProto(proto.metrics()) == *program.Metrics());
}

void TestPendingRootProgramToProto() {
  Program program;
  program.id   = "root";
  program.code = "x = 1";

  const auto proto = evolve::store::ToProto(program);
  assert(proto.state() == evolve::store::v1::EVALUATION_STATE_PENDING);
  assert(!proto.has_parent_id());
  assert(!proto.has_experiment());
  assert(!proto.has_metrics());
}

void TestJsonUsesProtoFieldNames() {
  const auto json = evolve::store::ToJson(evolve::store::ToProto(MakeScored()));

  assert(json.find("\"calmar_ratio\": 2") != std::string::npos);
  assert(json.find("\"parent_id\"") != std::string::npos);
  assert(json.find("\"EVALUATION_STATE_SCORED\"") != std::string::npos);
  assert(json.find("\"created_at\": \"2023-11-14T22:13:20.123456Z\"") != std::string::npos);
}

void TestExperimentListJson() {
  evolve::store::ExperimentSummary summary;
  summary.name        = "alpha";
  summary.count       = 7;
  summary.best_calmar = 1.25;

  const auto json = evolve::store::ToJson(evolve::store::ToExperimentList({summary}));
  assert(json.find("\"alpha\"") != std::string::npos);
  assert(json.find("\"best_calmar\": 1.25") != std::string::npos);
}

void TestMetricsFromJson() {
  auto metrics = evolve::store::MetricsFromJson(R"({"calmar_ratio": 1.5, "sharpe_ratio": 0.8, "win_rate": 0.6})");
  assert(metrics.calmar_ratio == 1.5);
  assert(metrics.sharpe_ratio == 0.8);
  assert(metrics.win_rate.has_value() && *metrics.win_rate == 0.6);
  assert(!metrics.psr.has_value());

  bool threw = false;
  try {
    (void)evolve::store::MetricsFromJson(R"({"sortino": 2.0})");
  } catch (const evolve::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScoredProgramToProto();
  TestPendingRootProgramToProto();
  TestJsonUsesProtoFieldNames();
  TestExperimentListJson();
  TestMetricsFromJson();

  std::cout << "evolve_store_unit_proto_convert: pass\n";
  return 0;
}
