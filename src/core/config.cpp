#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pwr_agent::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::chrono::milliseconds parse_positive_ms(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed <= 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return std::chrono::milliseconds(parsed);
}

std::size_t parse_count(const std::string& key, const std::string& value, const long long minimum) {
  const auto parsed = std::stoll(value);
  if (parsed < minimum) {
    throw std::runtime_error(key + " must be greater than or equal to " + std::to_string(minimum));
  }
  return static_cast<std::size_t>(parsed);
}

bool apply_float(AgentConfig& config, const std::string& key, const std::string& value) {
  const std::vector<std::pair<const char*, float*>> fields = {
      {"context.critical_battery_pct", &config.context.critical_battery_pct},
      {"context.low_battery_pct", &config.context.low_battery_pct},
      {"context.medium_battery_pct", &config.context.medium_battery_pct},
      {"context.full_battery_pct", &config.context.full_battery_pct},
      {"context.heavy_demand_pct", &config.context.heavy_demand_pct},
      {"context.moderate_demand_pct", &config.context.moderate_demand_pct},
      {"context.light_demand_pct", &config.context.light_demand_pct},
      {"context.near_zero_cpu_pct", &config.context.near_zero_cpu_pct},
      {"context.near_zero_app_cpu_pct", &config.context.near_zero_app_cpu_pct},
      {"context.idle_cpu_pct", &config.context.idle_cpu_pct},
      {"context.idle_app_cpu_pct", &config.context.idle_app_cpu_pct},
      {"context.power_draw_deadband_w", &config.context.power_draw_deadband_w},
      {"decision.rule_confidence", &config.decision.rule_confidence},
      {"decision.probability_floor", &config.decision.probability_floor},
      {"decision.emergency_confidence_boost", &config.decision.emergency_confidence_boost},
      {"decision.score_floor", &config.decision.score_floor},
      {"decision.interp_low", &config.decision.interp_low},
      {"decision.interp_high", &config.decision.interp_high},
      {"decision.aggressive_battery_pct", &config.decision.aggressive_battery_pct},
      {"decision.moderate_battery_pct", &config.decision.moderate_battery_pct},
      {"decision.light_battery_pct", &config.decision.light_battery_pct},
      {"decision.light_cpu_pct", &config.decision.light_cpu_pct},
      {"decision.min_brightness_for_dimming", &config.decision.min_brightness_for_dimming},
      {"decision.critical_app_cpu_pct", &config.decision.critical_app_cpu_pct},
      {"decision.away_network_mib", &config.decision.away_network_mib},
      {"policy.max_performance_impact", &config.policy.max_performance_impact},
      {"policy.emergency_min_confidence", &config.policy.emergency_min_confidence},
      {"actuation.intensity_tolerance", &config.actuation.intensity_tolerance},
      {"learner.accuracy_alpha", &config.learner.accuracy_alpha},
      {"learner.live_sample_weight", &config.learner.live_sample_weight},
      {"learner.learning_rate", &config.learner.learning_rate},
      {"learner.l2_penalty", &config.learner.l2_penalty},
  };

  for (const auto& [name, field] : fields) {
    if (key == name) {
      *field = std::stof(value);
      return true;
    }
  }
  return false;
}

bool apply_mode_limit(AgentConfig& config, const std::string& key, const std::string& value) {
  if (key.rfind("modes.", 0) != 0) {
    return false;
  }

  const std::string rest = key.substr(std::string("modes.").size());
  const auto dot = rest.find('.');
  if (dot == std::string::npos) {
    return false;
  }

  const auto name = model::parse_mode_name(rest.substr(0, dot));
  if (!name.has_value()) {
    throw std::runtime_error("unknown optimization mode: " + rest.substr(0, dot));
  }

  ModeLimits& limits = config.modes[static_cast<std::size_t>(*name)];
  const std::string field = rest.substr(dot + 1);
  if (field == "max_intensity") {
    limits.max_intensity = std::stof(value);
  } else if (field == "min_confidence") {
    limits.min_confidence = std::stof(value);
  } else {
    return false;
  }
  return true;
}

void apply_redis_address(AgentConfig& config, const std::string& value) {
  config.redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    config.redis.unix_socket = value.substr(std::string("unix://").size());
    config.redis.host.clear();
    config.redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    config.redis.unix_socket = value;
    config.redis.host.clear();
    config.redis.port = 0;
    return;
  }

  config.redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    config.redis.host = value;
    return;
  }

  config.redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }

  config.redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(AgentConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "agent.decision_interval_ms") {
    config.decision_interval = parse_positive_ms(key, value);
    return;
  }

  if (key == "agent.sampling_interval_ms") {
    config.sampling_interval = parse_positive_ms(key, value);
    return;
  }

  if (key == "agent.history_window") {
    config.history_window = parse_count(key, value, 1);
    return;
  }

  if (key == "agent.mode") {
    const auto name = model::parse_mode_name(to_lower(value));
    if (!name.has_value()) {
      throw std::runtime_error("agent.mode must be one of conservative, balanced, aggressive");
    }
    config.mode = *name;
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "agent.publish_metrics") {
    config.publish_metrics = parse_bool(value);
    return;
  }

  if (key == "context.away_after_ms") {
    config.context.away_after = parse_positive_ms(key, value);
    return;
  }

  if (key == "context.night_start_hour" || key == "context.night_end_hour") {
    const auto hour = std::stoi(value);
    if (hour < 0 || hour > 23) {
      throw std::runtime_error(key + " must be in range 0..23");
    }
    (key == "context.night_start_hour" ? config.context.night_start_hour : config.context.night_end_hour) =
        static_cast<std::uint8_t>(hour);
    return;
  }

  if (key == "decision.min_model_samples") {
    config.decision.min_model_samples = parse_count(key, value, 0);
    return;
  }

  if (key == "policy.max_actions_per_cycle") {
    config.policy.max_actions_per_cycle = parse_count(key, value, 1);
    return;
  }

  if (key == "actuation.max_retries") {
    config.actuation.max_retries = static_cast<std::uint32_t>(parse_count(key, value, 0));
    return;
  }

  if (key == "actuation.backoff_ms") {
    config.actuation.backoff = std::chrono::milliseconds(static_cast<long long>(parse_count(key, value, 0)));
    return;
  }

  if (key == "actuation.dispatch_timeout_ms") {
    config.actuation.dispatch_timeout = parse_positive_ms(key, value);
    return;
  }

  if (key == "learner.buffer_capacity") {
    config.learner.buffer_capacity = parse_count(key, value, 1);
    return;
  }

  if (key == "learner.retrain_sample_threshold") {
    config.learner.retrain_sample_threshold = parse_count(key, value, 0);
    return;
  }

  if (key == "learner.retrain_interval_ms") {
    config.learner.retrain_interval = std::chrono::milliseconds(static_cast<long long>(parse_count(key, value, 0)));
    return;
  }

  if (key == "learner.bootstrap_samples") {
    config.learner.bootstrap_samples = parse_count(key, value, 1);
    return;
  }

  if (key == "learner.bootstrap_seed") {
    config.learner.bootstrap_seed = static_cast<std::uint32_t>(parse_count(key, value, 0));
    return;
  }

  if (key == "learner.training_epochs") {
    config.learner.training_epochs = parse_count(key, value, 1);
    return;
  }

  if (key == "learner.persist_every") {
    config.learner.persist_every = parse_count(key, value, 1);
    return;
  }

  if (key == "store.backend") {
    const std::string backend = to_lower(value);
    if (backend != "file" && backend != "redis" && backend != "memory") {
      throw std::runtime_error("store.backend must be file, redis or memory");
    }
    config.store.backend = backend;
    return;
  }

  if (key == "store.path") {
    config.store.path = value;
    return;
  }

  if (key == "store.key_prefix") {
    config.store.key_prefix = value;
    return;
  }

  if (key == "monitor.replay_path") {
    config.monitor.replay_path = value;
    return;
  }

  if (key == "monitor.loop") {
    config.monitor.loop = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config, value);
    return;
  }

  if (key.rfind("targets.", 0) == 0) {
    const std::string target_name = key.substr(std::string("targets.").size());
    config.target_enabled[target_name] = parse_bool(value);
    return;
  }

  if (apply_mode_limit(config, key, value)) {
    return;
  }

  (void)apply_float(config, key, value);
}

void require_unit_range(const char* key, const float value) {
  if (value < 0.0F || value > 1.0F) {
    throw std::runtime_error(std::string(key) + " must be in range 0..1");
  }
}

void validate(const AgentConfig& config) {
  for (std::size_t i = 0; i < config.modes.size(); ++i) {
    const auto name = std::string("modes.") + model::to_string(static_cast<model::mode_name>(i));
    require_unit_range((name + ".max_intensity").c_str(), config.modes[i].max_intensity);
    require_unit_range((name + ".min_confidence").c_str(), config.modes[i].min_confidence);
  }

  const ContextConfig& context = config.context;
  if (!(context.critical_battery_pct < context.low_battery_pct && context.low_battery_pct < context.medium_battery_pct &&
        context.medium_battery_pct < context.full_battery_pct)) {
    throw std::runtime_error("context battery thresholds must be strictly increasing");
  }

  const DecisionConfig& decision = config.decision;
  require_unit_range("decision.rule_confidence", decision.rule_confidence);
  require_unit_range("decision.probability_floor", decision.probability_floor);
  require_unit_range("decision.score_floor", decision.score_floor);
  if (decision.emergency_confidence_boost < 1.0F) {
    throw std::runtime_error("decision.emergency_confidence_boost must be at least 1");
  }
  if (decision.interp_high < decision.interp_low) {
    throw std::runtime_error("decision.interp_high must not be below decision.interp_low");
  }

  require_unit_range("policy.max_performance_impact", config.policy.max_performance_impact);
  require_unit_range("policy.emergency_min_confidence", config.policy.emergency_min_confidence);
  require_unit_range("actuation.intensity_tolerance", config.actuation.intensity_tolerance);
  require_unit_range("learner.accuracy_alpha", config.learner.accuracy_alpha);
}

}  // namespace

AgentConfig load_agent_config(const std::string& path) {
  AgentConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    // Nesting is two spaces per level; a line may open at most one level below its parent.
    if (depth > sections.size()) {
      throw std::runtime_error("config line " + std::to_string(line_number) + ": key '" + key +
                               "' is indented past its parent section");
    }
    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate(config);
  return config;
}

model::optimization_mode mode_settings(const AgentConfig& config, const model::mode_name name) noexcept {
  const ModeLimits& limits = config.modes[static_cast<std::size_t>(name)];
  return model::optimization_mode{name, limits.max_intensity, limits.min_confidence};
}

}  // namespace pwr_agent::core
