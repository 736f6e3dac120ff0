#include "store/codec.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pwr_agent::store {
namespace {

constexpr int kClassifierFormat = 1;

struct FloatField {
  const char* key;
  float model::system_snapshot::*member;
  float fallback;
  std::uint32_t flag;
};

struct CounterField {
  const char* key;
  std::uint64_t model::system_snapshot::*member;
  std::uint32_t flag;
};

constexpr FloatField kFloatFields[] = {
    {"battery_percent", &model::system_snapshot::battery_percent, 50.0F, model::METRIC_BATTERY},
    {"battery_power_draw", &model::system_snapshot::battery_power_draw, 10.0F, model::METRIC_POWER_DRAW},
    {"cpu_percent", &model::system_snapshot::cpu_percent, 0.0F, model::METRIC_CPU},
    {"cpu_freq", &model::system_snapshot::cpu_freq_mhz, 0.0F, model::METRIC_CPU_FREQ},
    {"memory_percent", &model::system_snapshot::memory_percent, 0.0F, model::METRIC_MEMORY},
    {"gpu_percent", &model::system_snapshot::gpu_percent, 0.0F, model::METRIC_GPU},
    {"gpu_memory_percent", &model::system_snapshot::gpu_memory_percent, 0.0F, model::METRIC_GPU},
    {"screen_brightness", &model::system_snapshot::screen_brightness, 50.0F, model::METRIC_BRIGHTNESS},
    {"target_app_cpu", &model::system_snapshot::target_app_cpu, 0.0F, model::METRIC_TARGET_APP},
    {"target_app_memory", &model::system_snapshot::target_app_memory, 0.0F, model::METRIC_TARGET_APP},
};

constexpr CounterField kCounterFields[] = {
    {"network_bytes_sent", &model::system_snapshot::network_bytes_sent, model::METRIC_NETWORK},
    {"network_bytes_recv", &model::system_snapshot::network_bytes_recv, model::METRIC_NETWORK},
    {"disk_io_read", &model::system_snapshot::disk_io_read, model::METRIC_DISK},
    {"disk_io_write", &model::system_snapshot::disk_io_write, model::METRIC_DISK},
};

template <typename T>
T read_or(const json& doc, const char* key, const T fallback) {
  const auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    return fallback;
  }
  return it->template get<T>();
}

void require_object(const json& doc, const char* what) {
  if (!doc.is_object()) {
    throw std::runtime_error(std::string(what) + " must be a JSON object");
  }
}

json vector_to_json(const reasoning::FeatureVector& values) {
  json out = json::array();
  for (const float value : values) {
    out.push_back(value);
  }
  return out;
}

template <std::size_t N>
std::array<float, N> array_from_json(const json& doc, const char* key) {
  const auto it = doc.find(key);
  if (it == doc.end() || !it->is_array() || it->size() != N) {
    throw std::runtime_error(std::string("classifier field '") + key + "' must be an array of " + std::to_string(N));
  }
  std::array<float, N> out{};
  for (std::size_t i = 0; i < N; ++i) {
    out[i] = (*it)[i].get<float>();
  }
  return out;
}

}  // namespace

json snapshot_to_json(const model::system_snapshot& snapshot) {
  json doc = json::object();
  doc["timestamp"] = snapshot.timestamp_ms;
  for (const FloatField& field : kFloatFields) {
    doc[field.key] = snapshot.*field.member;
  }
  for (const CounterField& field : kCounterFields) {
    doc[field.key] = snapshot.*field.member;
  }
  doc["active_processes"] = snapshot.active_process_count;
  doc["power_plugged"] = snapshot.power_plugged;
  doc["unavailable"] = snapshot.unavailable;
  return doc;
}

model::system_snapshot snapshot_from_json(const json& doc) {
  require_object(doc, "snapshot");

  model::system_snapshot snapshot{};
  try {
    snapshot.timestamp_ms = read_or<std::uint64_t>(doc, "timestamp", 0);
    for (const FloatField& field : kFloatFields) {
      const auto it = doc.find(field.key);
      if (it == doc.end() || it->is_null()) {
        snapshot.*field.member = field.fallback;
        snapshot.unavailable |= field.flag;
      } else {
        snapshot.*field.member = it->get<float>();
      }
    }
    for (const CounterField& field : kCounterFields) {
      const auto it = doc.find(field.key);
      if (it == doc.end() || it->is_null()) {
        snapshot.*field.member = 0;
        snapshot.unavailable |= field.flag;
      } else {
        snapshot.*field.member = it->get<std::uint64_t>();
      }
    }

    const auto processes = doc.find("active_processes");
    if (processes == doc.end() || processes->is_null()) {
      snapshot.unavailable |= model::METRIC_PROCESSES;
    } else {
      snapshot.active_process_count = processes->get<std::uint32_t>();
    }

    const auto plugged = doc.find("power_plugged");
    if (plugged == doc.end() || plugged->is_null()) {
      snapshot.unavailable |= model::METRIC_POWER_SOURCE;
    } else {
      snapshot.power_plugged = plugged->get<bool>();
    }

    snapshot.unavailable = read_or<std::uint32_t>(doc, "unavailable", snapshot.unavailable);
  } catch (const json::exception& error) {
    throw std::runtime_error(std::string("invalid snapshot: ") + error.what());
  }
  return snapshot;
}

json action_to_json(const model::optimization_action& action) {
  return json{
      {"id", action.id},
      {"type", model::to_string(action.type)},
      {"intensity", action.intensity},
      {"target", action.target_component},
      {"estimated_savings", action.estimated_savings},
      {"performance_impact", action.performance_impact},
      {"confidence", action.confidence},
      {"created_at", action.created_at_ms},
  };
}

model::optimization_action action_from_json(const json& doc) {
  require_object(doc, "action");
  model::optimization_action action{};
  try {
    action.id = doc.at("id").get<std::string>();
    const auto type = model::parse_action_type(doc.at("type").get<std::string>());
    if (!type.has_value()) {
      throw std::runtime_error("unknown action type: " + doc.at("type").get<std::string>());
    }
    action.type = *type;
    action.intensity = doc.at("intensity").get<float>();
    action.target_component = doc.at("target").get<std::string>();
    action.estimated_savings = read_or<float>(doc, "estimated_savings", 0.0F);
    action.performance_impact = read_or<float>(doc, "performance_impact", 0.0F);
    action.confidence = read_or<float>(doc, "confidence", 0.0F);
    action.created_at_ms = read_or<std::uint64_t>(doc, "created_at", 0);
  } catch (const json::exception& error) {
    throw std::runtime_error(std::string("invalid action: ") + error.what());
  }
  return action;
}

json feedback_to_json(const model::feedback_record& feedback) {
  return json{
      {"satisfaction", feedback.satisfaction},
      {"performance_acceptable", feedback.performance_acceptable},
      {"battery_improvement", feedback.battery_improvement},
      {"comments", feedback.comments},
      {"decision_id", feedback.decision_id},
      {"timestamp", feedback.timestamp_ms},
  };
}

model::feedback_record feedback_from_json(const json& doc) {
  require_object(doc, "feedback");
  model::feedback_record feedback{};
  try {
    feedback.satisfaction = doc.at("satisfaction").get<float>();
    feedback.performance_acceptable = read_or<bool>(doc, "performance_acceptable", true);
    feedback.battery_improvement = read_or<bool>(doc, "battery_improvement", false);
    feedback.comments = read_or<std::string>(doc, "comments", "");
    feedback.decision_id = read_or<std::string>(doc, "decision_id", "");
    feedback.timestamp_ms = read_or<std::uint64_t>(doc, "timestamp", 0);
  } catch (const json::exception& error) {
    throw std::runtime_error(std::string("invalid feedback: ") + error.what());
  }
  return feedback;
}

json outcome_to_json(const model::decision_outcome& outcome) {
  return json{
      {"decision_id", outcome.decision_id},
      {"snapshot", snapshot_to_json(outcome.snapshot)},
      {"context_score", outcome.context_score},
      {"severity", static_cast<int>(outcome.decided)},
      {"source", model::to_string(outcome.source)},
      {"actions_applied", outcome.actions_applied},
      {"observed_savings", outcome.observed_savings},
      {"observed_satisfaction", outcome.observed_satisfaction},
      {"timestamp", outcome.timestamp_ms},
  };
}

model::decision_outcome outcome_from_json(const json& doc) {
  require_object(doc, "outcome");
  model::decision_outcome outcome{};
  try {
    outcome.decision_id = doc.at("decision_id").get<std::string>();
    outcome.snapshot = snapshot_from_json(doc.at("snapshot"));
    outcome.context_score = read_or<float>(doc, "context_score", 0.0F);

    const int level = doc.at("severity").get<int>();
    if (level < 0 || level >= static_cast<int>(model::kSeverityClasses)) {
      throw std::runtime_error("outcome severity out of range: " + std::to_string(level));
    }
    outcome.decided = static_cast<model::severity>(level);

    const std::string source = read_or<std::string>(doc, "source", "rule");
    if (source == "learned") {
      outcome.source = model::decision_source::LEARNED;
    } else if (source == "emergency") {
      outcome.source = model::decision_source::EMERGENCY;
    } else {
      outcome.source = model::decision_source::RULE;
    }

    outcome.actions_applied = read_or<std::vector<std::string>>(doc, "actions_applied", {});
    outcome.observed_savings = read_or<float>(doc, "observed_savings", 0.0F);
    outcome.observed_satisfaction = read_or<float>(doc, "observed_satisfaction", 0.0F);
    outcome.timestamp_ms = read_or<std::uint64_t>(doc, "timestamp", 0);
  } catch (const json::exception& error) {
    throw std::runtime_error(std::string("invalid outcome: ") + error.what());
  }
  return outcome;
}

json classifier_to_json(const reasoning::SeverityClassifier& classifier) {
  json weights = json::array();
  for (const reasoning::FeatureVector& row : classifier.weights()) {
    weights.push_back(vector_to_json(row));
  }
  json bias = json::array();
  for (const float value : classifier.bias()) {
    bias.push_back(value);
  }
  return json{
      {"format", kClassifierFormat},
      {"features", reasoning::kFeatureCount},
      {"classes", model::kSeverityClasses},
      {"sample_count", classifier.sample_count()},
      {"mean", vector_to_json(classifier.mean())},
      {"scale", vector_to_json(classifier.scale())},
      {"weights", std::move(weights)},
      {"bias", std::move(bias)},
  };
}

reasoning::SeverityClassifier classifier_from_json(const json& doc) {
  require_object(doc, "classifier");
  try {
    if (read_or<int>(doc, "format", 0) != kClassifierFormat) {
      throw std::runtime_error("unsupported classifier format");
    }
    if (doc.at("features").get<std::size_t>() != reasoning::kFeatureCount ||
        doc.at("classes").get<std::size_t>() != model::kSeverityClasses) {
      throw std::runtime_error("classifier dimensions do not match this build");
    }

    const auto mean = array_from_json<reasoning::kFeatureCount>(doc, "mean");
    const auto scale = array_from_json<reasoning::kFeatureCount>(doc, "scale");
    const auto bias = array_from_json<model::kSeverityClasses>(doc, "bias");

    const json& rows = doc.at("weights");
    if (!rows.is_array() || rows.size() != model::kSeverityClasses) {
      throw std::runtime_error("classifier weights must have one row per class");
    }
    reasoning::SeverityClassifier::WeightMatrix weights{};
    for (std::size_t k = 0; k < model::kSeverityClasses; ++k) {
      const json& row = rows[k];
      if (!row.is_array() || row.size() != reasoning::kFeatureCount) {
        throw std::runtime_error("classifier weight row has the wrong width");
      }
      for (std::size_t j = 0; j < reasoning::kFeatureCount; ++j) {
        weights[k][j] = row[j].get<float>();
      }
    }

    return reasoning::SeverityClassifier(mean, scale, weights, bias, doc.at("sample_count").get<std::size_t>());
  } catch (const json::exception& error) {
    throw std::runtime_error(std::string("invalid classifier: ") + error.what());
  }
}

}  // namespace pwr_agent::store
