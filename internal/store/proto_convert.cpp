#include "proto_convert.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace evolve::store {

v1::FitnessMetrics ToProto(const model::FitnessMetrics& metrics) {
  v1::FitnessMetrics out;
  out.set_sharpe_ratio(metrics.sharpe_ratio);
  out.set_calmar_ratio(metrics.calmar_ratio);
  out.set_max_drawdown(metrics.max_drawdown);
  out.set_cagr(metrics.cagr);
  out.set_total_return(metrics.total_return);

  if (metrics.trade_count) out.set_trade_count(*metrics.trade_count);
  if (metrics.win_rate) out.set_win_rate(*metrics.win_rate);
  if (metrics.psr) out.set_psr(*metrics.psr);
  if (metrics.net_sharpe) out.set_net_sharpe(*metrics.net_sharpe);
  return out;
}

v1::Program ToProto(const model::Program& program) {
  v1::Program out;
  out.set_id(program.id);
  out.set_code(program.code);
  if (program.parent_id) out.set_parent_id(*program.parent_id);
  out.set_generation(program.generation);
  if (program.experiment) out.set_experiment(*program.experiment);

  if (const auto* metrics = program.Metrics()) {
    out.set_state(v1::EVALUATION_STATE_SCORED);
    *out.mutable_metrics() = ToProto(*metrics);
  } else {
    out.set_state(v1::EVALUATION_STATE_PENDING);
  }

  *out.mutable_created_at() = util::ToProto(program.created_at);
  return out;
}

v1::ExperimentSummary ToProto(const ExperimentSummary& summary) {
  v1::ExperimentSummary out;
  out.set_name(summary.name);
  out.set_count(summary.count);
  if (summary.best_calmar) out.set_best_calmar(*summary.best_calmar);
  *out.mutable_created_at() = util::ToProto(summary.created_at);
  return out;
}

v1::ProgramList ToProgramList(const std::vector<model::Program>& programs) {
  v1::ProgramList out;
  for (const auto& program : programs) {
    *out.add_programs() = ToProto(program);
  }
  return out;
}

v1::ExperimentList ToExperimentList(const std::vector<ExperimentSummary>& experiments) {
  v1::ExperimentList out;
  for (const auto& experiment : experiments) {
    *out.add_experiments() = ToProto(experiment);
  }
  return out;
}

model::FitnessMetrics FromProto(const v1::FitnessMetrics& metrics) {
  model::FitnessMetrics out;
  out.sharpe_ratio = metrics.sharpe_ratio();
  out.calmar_ratio = metrics.calmar_ratio();
  out.max_drawdown = metrics.max_drawdown();
  out.cagr         = metrics.cagr();
  out.total_return = metrics.total_return();

  if (metrics.has_trade_count()) out.trade_count = metrics.trade_count();
  if (metrics.has_win_rate()) out.win_rate = metrics.win_rate();
  if (metrics.has_psr()) out.psr = metrics.psr();
  if (metrics.has_net_sharpe()) out.net_sharpe = metrics.net_sharpe();
  return out;
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::InvalidArgument("Failed to serialize " + message.GetTypeName() + " to JSON: " + std::string(status.message()));
  }
  return json;
}

model::FitnessMetrics MetricsFromJson(const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  v1::FitnessMetrics metrics;
  auto               status = google::protobuf::util::JsonStringToMessage(json, &metrics, options);
  if (!status.ok()) {
    throw util::InvalidArgument("Invalid metrics JSON: " + std::string(status.message()));
  }
  return FromProto(metrics);
}

} // namespace evolve::store
