#pragma once

#include <string>
#include <vector>

#include <google/protobuf/message.h>

#include "evolve/store/v1.hpp"
#include "internal/model/program.hpp"
#include "internal/store/program_store.hpp"

namespace evolve::store {

/*
  Wire representation of store values (evolve.store.v1).

  Used by evolvectl for --json output and exports.
*/

v1::FitnessMetrics    ToProto(const model::FitnessMetrics& metrics);
v1::Program           ToProto(const model::Program& program);
v1::ExperimentSummary ToProto(const ExperimentSummary& summary);

v1::ProgramList    ToProgramList(const std::vector<model::Program>& programs);
v1::ExperimentList ToExperimentList(const std::vector<ExperimentSummary>& experiments);

model::FitnessMetrics FromProto(const v1::FitnessMetrics& metrics);

// Pretty-printed JSON with proto field names. Throws util::InvalidArgument.
std::string ToJson(const google::protobuf::Message& message);

// Parses a JSON FitnessMetrics object, rejecting unknown fields.
model::FitnessMetrics MetricsFromJson(const std::string& json);

} // namespace evolve::store
