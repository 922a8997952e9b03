#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>

#include "internal/util/errors.hpp"

namespace evolve::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::InvalidArgument("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Environment
// ------------------------------------------------------------

static std::optional<std::string> Env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

static std::uint64_t ParseUnsigned(const char* name, const std::string& text, std::uint64_t max) {
  char* endptr = nullptr;
  errno        = 0;
  const auto v = std::strtoull(text.c_str(), &endptr, 10);
  if (errno != 0 || endptr == text.c_str() || *endptr != '\0' || text.front() == '-' || v > max) {
    throw util::InvalidArgument(std::string(name) + " must be an unsigned integer, got '" + text + "'");
  }
  return v;
}

static double ParseDouble(const char* name, const std::string& text) {
  char* endptr = nullptr;
  errno        = 0;
  const auto v = std::strtod(text.c_str(), &endptr);
  if (errno != 0 || endptr == text.c_str() || *endptr != '\0') {
    throw util::InvalidArgument(std::string(name) + " must be a number, got '" + text + "'");
  }
  return v;
}

void ConfigLoader::ApplyEnvironmentOverrides(evolve::runtime::config::RuntimeConfig& config) {
  if (auto path = Env("EVOLVE_DB_PATH")) {
    const bool was_sqlite = config.database().has_sqlite();
    auto*      sqlite     = config.mutable_database()->mutable_sqlite();
    sqlite->set_path(*path);
    if (!was_sqlite) {
      sqlite->set_wal_mode(true);
    }
  }

  constexpr auto kMaxU32 = std::numeric_limits<std::uint32_t>::max();
  if (auto v = Env("EVOLVE_POPULATION_SIZE")) {
    config.mutable_population()->set_population_size(static_cast<std::uint32_t>(ParseUnsigned("EVOLVE_POPULATION_SIZE", *v, kMaxU32)));
  }
  if (auto v = Env("EVOLVE_ARCHIVE_SIZE")) {
    config.mutable_population()->set_archive_size(static_cast<std::uint32_t>(ParseUnsigned("EVOLVE_ARCHIVE_SIZE", *v, kMaxU32)));
  }
  if (auto v = Env("EVOLVE_ELITE_RATIO")) {
    config.mutable_selection()->set_elite_ratio(ParseDouble("EVOLVE_ELITE_RATIO", *v));
  }
  if (auto v = Env("EVOLVE_EXPLORATION_RATIO")) {
    config.mutable_selection()->set_exploration_ratio(ParseDouble("EVOLVE_EXPLORATION_RATIO", *v));
  }
  if (auto v = Env("EVOLVE_RANDOM_SEED")) {
    config.mutable_selection()->set_random_seed(
        ParseUnsigned("EVOLVE_RANDOM_SEED", *v, std::numeric_limits<std::uint64_t>::max()));
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

evolve::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidArgument("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  evolve::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::InvalidArgument("Invalid configuration: " + std::string(status.message()));
  }

  ApplyEnvironmentOverrides(config);
  return config;
}

evolve::runtime::config::RuntimeConfig ConfigLoader::LoadDefault() {
  evolve::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  ApplyEnvironmentOverrides(config);
  return config;
}

} // namespace evolve::config
