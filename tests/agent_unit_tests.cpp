#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "actuators/registry.hpp"
#include "control/status.hpp"
#include "core/config.hpp"
#include "learning/feedback_learner.hpp"
#include "model/feedback.hpp"
#include "model/optimization_action.hpp"
#include "model/snapshot.hpp"
#include "monitor/replay_monitor.hpp"
#include "sinks/redis_ts.hpp"
#include "store/codec.hpp"
#include "store/redis_store.hpp"
#include "store/state_store.hpp"

using pwr_agent::actuators::make_dry_run_registry;
using pwr_agent::control::controller_state;
using pwr_agent::control::ControllerStatus;
using pwr_agent::core::AgentConfig;
using pwr_agent::core::ContextConfig;
using pwr_agent::core::LearnerConfig;
using pwr_agent::core::load_agent_config;
using pwr_agent::core::mode_settings;
using pwr_agent::learning::FeedbackLearner;
using pwr_agent::model::decision_outcome;
using pwr_agent::model::mode_name;
using pwr_agent::model::severity;
using pwr_agent::model::system_snapshot;
using pwr_agent::monitor::ReplayMonitor;
using pwr_agent::sinks::RedisTsOptions;
using pwr_agent::sinks::RedisTsSink;
using pwr_agent::store::RedisStateStore;
using pwr_agent::store::RedisStoreOptions;
using pwr_agent::store::StoreUnavailable;

struct RedisMockState {
  std::vector<std::string> last_argv{};
  int command_argv_calls{0};
  int command_calls{0};
  int connects{0};
  std::string create_error{};
  std::map<std::string, std::string> values{};
  bool connect_fails{false};
};

RedisMockState g_redis_mock{};

namespace {

redisReply* make_reply(const int type) {
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = type;
  return reply;
}

redisReply* make_string_reply(const int type, const std::string& value) {
  redisReply* reply = make_reply(type);
  reply->str = static_cast<char*>(std::malloc(value.size() + 1));
  std::memcpy(reply->str, value.c_str(), value.size() + 1);
  reply->len = value.size();
  return reply;
}

redisContext* make_context() {
  g_redis_mock.connects += 1;
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  if (g_redis_mock.connect_fails) {
    context->err = REDIS_ERR_IO;
    std::strncpy(context->errstr, "Connection refused", sizeof(context->errstr) - 1);
  }
  return context;
}

}  // namespace

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) { return make_context(); }

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) { return make_context(); }

void redisFree(redisContext* c) { std::free(c); }

void* redisCommand(redisContext*, const char*, ...) {
  g_redis_mock.command_calls += 1;
  if (!g_redis_mock.create_error.empty()) {
    return make_string_reply(REDIS_REPLY_ERROR, g_redis_mock.create_error);
  }
  return make_reply(REDIS_REPLY_STATUS);
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t* argvlen) {
  g_redis_mock.command_argv_calls += 1;
  g_redis_mock.last_argv.clear();
  for (int i = 0; i < argc; ++i) {
    if (argvlen != nullptr) {
      g_redis_mock.last_argv.emplace_back(argv[i], argvlen[i]);
    } else {
      g_redis_mock.last_argv.emplace_back(argv[i]);
    }
  }

  const std::string& command = g_redis_mock.last_argv.front();
  if (command == "SET" && argc == 3) {
    g_redis_mock.values[g_redis_mock.last_argv[1]] = g_redis_mock.last_argv[2];
    return make_string_reply(REDIS_REPLY_STATUS, "OK");
  }
  if (command == "GET" && argc == 2) {
    const auto it = g_redis_mock.values.find(g_redis_mock.last_argv[1]);
    if (it == g_redis_mock.values.end()) {
      return make_reply(REDIS_REPLY_NIL);
    }
    return make_string_reply(REDIS_REPLY_STRING, it->second);
  }
  return make_reply(REDIS_REPLY_ARRAY);
}

void freeReplyObject(void* reply) {
  if (reply == nullptr) {
    return;
  }
  std::free(static_cast<redisReply*>(reply)->str);
  std::free(reply);
}

}  // extern "C"

namespace {

bool almost_equal(float a, float b, float eps = 1e-4F) {
  return std::fabs(a - b) <= eps;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path temp_path(const std::string& name) {
  return std::filesystem::temp_directory_path() / ("pwr_agent_" + std::to_string(::getpid()) + "_" + name);
}

bool config_throws(const std::string& name, const std::string& content) {
  const auto path = temp_path(name);
  {
    std::ofstream out(path);
    out << content;
  }
  bool threw = false;
  try {
    (void)load_agent_config(path.string());
  } catch (const std::exception&) {
    threw = true;
  }
  std::filesystem::remove(path);
  return threw;
}

int test_config_parsing() {
  const auto path = temp_path("config.yaml");
  {
    std::ofstream out(path);
    out << "# tuned for a small laptop\n"
           "agent:\n"
           "  decision_interval_ms: 5000\n"
           "  mode: aggressive\n"
           "  stdout_debug: false\n"
           "modes:\n"
           "  aggressive:\n"
           "    max_intensity: 0.85\n"
           "decision:\n"
           "  rule_confidence: 0.8\n"
           "  min_model_samples: 10\n"
           "learner:\n"
           "  retrain_sample_threshold: 5\n"
           "  persist_every: 3\n"
           "store:\n"
           "  backend: memory\n"
           "  key_prefix: \"pwr:laptop\"\n"
           "targets:\n"
           "  display: false\n"
           "redis:\n"
           "  address: unix:///var/run/redis/redis.sock\n";
  }

  const AgentConfig config = load_agent_config(path.string());
  std::filesystem::remove(path);

  if (config.decision_interval != std::chrono::milliseconds(5000) || config.mode != mode_name::AGGRESSIVE ||
      config.stdout_debug) {
    return fail("test_config_parsing", "agent section not applied");
  }
  const auto aggressive = mode_settings(config, mode_name::AGGRESSIVE);
  if (!almost_equal(aggressive.max_intensity, 0.85F) || !almost_equal(aggressive.min_confidence, 0.6F)) {
    return fail("test_config_parsing", "mode limits should override per field");
  }
  if (!almost_equal(config.decision.rule_confidence, 0.8F) || config.decision.min_model_samples != 10 ||
      config.learner.retrain_sample_threshold != 5 || config.learner.persist_every != 3) {
    return fail("test_config_parsing", "decision or learner section not applied");
  }
  if (config.store.backend != "memory" || config.store.key_prefix != "pwr:laptop") {
    return fail("test_config_parsing", "store section not applied");
  }
  if (!config.redis.enabled || config.redis.unix_socket != "/var/run/redis/redis.sock") {
    return fail("test_config_parsing", "unix socket redis address should parse");
  }

  const auto registry = make_dry_run_registry(config);
  if (registry.size() != 4 || registry.find("display") != nullptr || registry.find("system") == nullptr) {
    return fail("test_config_parsing", "disabled target should not be registered");
  }
  if (pwr_agent::store::make_state_store(config) == nullptr) {
    return fail("test_config_parsing", "memory backend should build");
  }
  return 0;
}

int test_config_rejects_invalid_values() {
  if (!config_throws("bad_mode.yaml", "agent:\n  mode: turbo\n")) {
    return fail("test_config_rejects_invalid_values", "unknown mode should throw");
  }
  if (!config_throws("bad_backend.yaml", "store:\n  backend: sqlite\n")) {
    return fail("test_config_rejects_invalid_values", "unknown store backend should throw");
  }
  if (!config_throws("bad_thresholds.yaml", "context:\n  low_battery_pct: 70\n")) {
    return fail("test_config_rejects_invalid_values", "unordered battery thresholds should throw");
  }
  if (!config_throws("bad_limit.yaml", "modes:\n  balanced:\n    max_intensity: 1.5\n")) {
    return fail("test_config_rejects_invalid_values", "intensity above 1 should throw");
  }
  if (!config_throws("bad_interval.yaml", "agent:\n  decision_interval_ms: 0\n")) {
    return fail("test_config_rejects_invalid_values", "zero interval should throw");
  }
  if (!config_throws("bad_port.yaml", "redis:\n  address: localhost:99999\n")) {
    return fail("test_config_rejects_invalid_values", "bad redis port should throw");
  }
  if (!config_throws("bad_float.yaml", "decision:\n  rule_confidence: high\n")) {
    return fail("test_config_rejects_invalid_values", "invalid float should throw");
  }
  if (!config_throws("four_space.yaml", "modes:\n    balanced:\n        max_intensity: 0.5\n")) {
    return fail("test_config_rejects_invalid_values", "section indented two levels should throw");
  }
  if (!config_throws("deep_value.yaml", "agent:\n      mode: eco\n")) {
    return fail("test_config_rejects_invalid_values", "value indented past its section should throw");
  }

  bool missing_threw = false;
  try {
    (void)load_agent_config(temp_path("does_not_exist.yaml").string());
  } catch (const std::runtime_error&) {
    missing_threw = true;
  }
  if (!missing_threw) {
    return fail("test_config_rejects_invalid_values", "missing file should throw");
  }

  AgentConfig config;
  config.store.backend = "sqlite";
  try {
    (void)pwr_agent::store::make_state_store(config);
    return fail("test_config_rejects_invalid_values", "unknown backend should not build");
  } catch (const std::runtime_error&) {
  }
  return 0;
}

int test_snapshot_codec_substitutes_defaults() {
  const nlohmann::json partial = {{"battery_percent", 68.0}, {"cpu_percent", 12.0}, {"power_plugged", true}};
  const system_snapshot snapshot = pwr_agent::store::snapshot_from_json(partial);

  if (!almost_equal(snapshot.battery_percent, 68.0F) || !snapshot.power_plugged) {
    return fail("test_snapshot_codec_substitutes_defaults", "present fields should be kept");
  }
  if (!almost_equal(snapshot.battery_power_draw, 10.0F) || !almost_equal(snapshot.screen_brightness, 50.0F)) {
    return fail("test_snapshot_codec_substitutes_defaults", "missing fields should take documented defaults");
  }
  const std::uint32_t expected = pwr_agent::model::METRIC_POWER_DRAW | pwr_agent::model::METRIC_BRIGHTNESS |
                                 pwr_agent::model::METRIC_GPU | pwr_agent::model::METRIC_NETWORK;
  if ((snapshot.unavailable & expected) != expected || (snapshot.unavailable & pwr_agent::model::METRIC_CPU) != 0) {
    return fail("test_snapshot_codec_substitutes_defaults", "substituted fields should be flagged");
  }

  nlohmann::json masked = partial;
  masked["unavailable"] = 0;
  if (pwr_agent::store::snapshot_from_json(masked).unavailable != 0) {
    return fail("test_snapshot_codec_substitutes_defaults", "stored mask should win");
  }

  bool threw = false;
  try {
    (void)pwr_agent::store::snapshot_from_json({{"cpu_percent", "high"}});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_snapshot_codec_substitutes_defaults", "wrong field type should throw");
  }

  threw = false;
  try {
    (void)pwr_agent::store::action_from_json(
        {{"id", "act-1"}, {"type", "overclock"}, {"intensity", 0.5}, {"target", "system"}});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_snapshot_codec_substitutes_defaults", "unknown action type should throw");
  }
  return 0;
}

int test_replay_monitor_publishes_frames() {
  const auto path = temp_path("replay.jsonl");
  {
    std::ofstream out(path);
    out << "# two frames\n\n"
           "{\"battery_percent\": 40.0, \"cpu_percent\": 20.0, \"power_plugged\": false}\n"
           "{\"battery_percent\": 39.0, \"battery_power_draw\": 8.0, \"cpu_percent\": 25.0, \"cpu_freq\": 2000,"
           " \"memory_percent\": 40.0, \"gpu_percent\": 1.0, \"gpu_memory_percent\": 2.0, \"network_bytes_sent\": 1,"
           " \"network_bytes_recv\": 2, \"disk_io_read\": 3, \"disk_io_write\": 4, \"screen_brightness\": 70,"
           " \"active_processes\": 100, \"target_app_cpu\": 3.0, \"target_app_memory\": 2.0,"
           " \"power_plugged\": false}\n";
  }

  if (ReplayMonitor::load_frames(path.string()).size() != 2) {
    std::filesystem::remove(path);
    return fail("test_replay_monitor_publishes_frames", "comments and blank lines should be skipped");
  }

  std::atomic<std::uint64_t> now{5000};
  ReplayMonitor monitor(path.string(), std::chrono::milliseconds(20), false, [&now] { return now.load(); });
  monitor.start();
  const auto first = monitor.latest_snapshot();
  if (!first.has_value() || !almost_equal(first->battery_percent, 40.0F) || first->timestamp_ms != 5000) {
    monitor.stop();
    std::filesystem::remove(path);
    return fail("test_replay_monitor_publishes_frames", "first frame should be published on start");
  }

  now.store(6000);
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  const auto last = monitor.latest_snapshot();
  monitor.stop();
  std::filesystem::remove(path);

  if (!last.has_value() || !almost_equal(last->battery_percent, 39.0F) || last->timestamp_ms < 5000) {
    return fail("test_replay_monitor_publishes_frames", "replay should stop on the last frame");
  }
  if (monitor.unavailable_metrics() == 0) {
    return fail("test_replay_monitor_publishes_frames", "substituted metrics should be counted");
  }

  const auto empty = temp_path("empty.jsonl");
  {
    std::ofstream out(empty);
    out << "# nothing recorded\n";
  }
  bool threw = false;
  try {
    (void)ReplayMonitor::load_frames(empty.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  std::filesystem::remove(empty);
  if (!threw) {
    return fail("test_replay_monitor_publishes_frames", "empty replay should throw");
  }
  return 0;
}

int test_redis_sink_publish_logic() {
  g_redis_mock = {};

  RedisTsOptions options;
  options.key_prefix = "pwr:test";
  RedisTsSink sink(options);

  ControllerStatus status;
  status.state = controller_state::EMERGENCY;
  status.battery_percent = 42.5F;
  status.timestamp_ms = 1234;

  if (!sink.publish(status)) {
    return fail("test_redis_sink_publish_logic", "publish should succeed with mock redis");
  }
  if (g_redis_mock.command_calls != static_cast<int>(RedisTsSink::metric_suffixes().size())) {
    return fail("test_redis_sink_publish_logic", "one TS.CREATE per metric expected");
  }
  const auto& argv = g_redis_mock.last_argv;
  if (g_redis_mock.command_argv_calls != 1 || argv.size() != 1 + (RedisTsSink::metric_suffixes().size() * 3) ||
      argv.front() != "TS.MADD") {
    return fail("test_redis_sink_publish_logic", "expected one TS.MADD covering every metric");
  }
  if (argv[1] != "pwr:test:status:state" || argv[2] != "1234" || argv[3] != std::to_string(3.0)) {
    return fail("test_redis_sink_publish_logic", "state sample encoded incorrectly");
  }
  if (argv[7] != "pwr:test:status:battery" || argv[9] != std::to_string(42.5)) {
    return fail("test_redis_sink_publish_logic", "battery sample encoded incorrectly");
  }

  if (!sink.publish(status) || g_redis_mock.command_calls != static_cast<int>(RedisTsSink::metric_suffixes().size())) {
    return fail("test_redis_sink_publish_logic", "schema should only be created once");
  }
  return 0;
}

int test_redis_sink_without_timeseries_module() {
  g_redis_mock = {};
  g_redis_mock.create_error = "ERR unknown command 'TS.CREATE'";

  RedisTsSink sink;
  if (sink.publish(ControllerStatus{})) {
    return fail("test_redis_sink_without_timeseries_module", "publish should fail without the module");
  }
  const int connects = g_redis_mock.connects;
  if (sink.publish(ControllerStatus{}) || g_redis_mock.connects != connects) {
    return fail("test_redis_sink_without_timeseries_module", "sink should stop retrying after unknown command");
  }
  if (g_redis_mock.command_argv_calls != 0) {
    return fail("test_redis_sink_without_timeseries_module", "no samples should be sent");
  }
  return 0;
}

int test_redis_sink_recovers_after_connect_failure() {
  g_redis_mock = {};
  g_redis_mock.connect_fails = true;

  RedisTsSink sink;
  if (sink.check_connectivity() || sink.publish(ControllerStatus{})) {
    return fail("test_redis_sink_recovers_after_connect_failure", "publish should fail while redis is down");
  }
  if (g_redis_mock.command_calls != 0 || g_redis_mock.command_argv_calls != 0) {
    return fail("test_redis_sink_recovers_after_connect_failure", "nothing should be sent without a connection");
  }

  g_redis_mock.connect_fails = false;
  if (!sink.publish(ControllerStatus{}) || g_redis_mock.command_argv_calls != 1) {
    return fail("test_redis_sink_recovers_after_connect_failure", "publish should reconnect once redis is back");
  }
  return 0;
}

int test_redis_state_store_reports_outage() {
  g_redis_mock = {};
  g_redis_mock.values["pwr:test:state:model"] = R"({"format":1})";
  g_redis_mock.connect_fails = true;

  RedisStoreOptions options;
  options.key_prefix = "pwr:test";
  RedisStateStore store(options);

  bool unavailable = false;
  try {
    (void)store.load(pwr_agent::store::kModelKey);
  } catch (const StoreUnavailable&) {
    unavailable = true;
  }
  if (!unavailable) {
    return fail("test_redis_state_store_reports_outage", "unreachable redis must not look like a missing key");
  }
  if (store.save(pwr_agent::store::kModelKey, nlohmann::json::object())) {
    return fail("test_redis_state_store_reports_outage", "save should fail while redis is down");
  }

  g_redis_mock.connect_fails = false;
  const auto loaded = store.load(pwr_agent::store::kModelKey);
  if (!loaded.has_value() || loaded->value("format", 0) != 1) {
    return fail("test_redis_state_store_reports_outage", "store should reconnect once redis is back");
  }
  return 0;
}

int test_learner_holds_state_while_redis_is_down() {
  g_redis_mock = {};
  const std::string buffer_key = "pwr:test:state:learner_buffer";

  decision_outcome earlier{};
  earlier.decision_id = "dec-before-restart";
  earlier.decided = severity::LIGHT;
  earlier.observed_satisfaction = 0.9F;
  const nlohmann::json persisted{
      {"entries", nlohmann::json::array({{{"kind", "outcome"}, {"data", pwr_agent::store::outcome_to_json(earlier)}}})}};
  g_redis_mock.values[buffer_key] = persisted.dump();
  g_redis_mock.connect_fails = true;

  LearnerConfig config;
  config.bootstrap_samples = 100;
  config.training_epochs = 20;
  config.retrain_sample_threshold = 0;
  config.retrain_interval = std::chrono::milliseconds(0);
  config.persist_every = 0;

  RedisStoreOptions options;
  options.key_prefix = "pwr:test";
  auto store = std::make_shared<RedisStateStore>(options);
  FeedbackLearner learner(config, ContextConfig{}, store);
  learner.initialize();

  if (!learner.stats().state_held || learner.stats().buffered != 0) {
    return fail("test_learner_holds_state_while_redis_is_down", "unreadable state should be held, not dropped");
  }
  if (g_redis_mock.values.at(buffer_key) != persisted.dump() || g_redis_mock.values.count("pwr:test:state:model") != 0) {
    return fail("test_learner_holds_state_while_redis_is_down", "nothing should be written during the outage");
  }

  decision_outcome later = earlier;
  later.decision_id = "dec-after-restart";
  learner.record_outcome(later);

  g_redis_mock.connect_fails = false;
  learner.shutdown();

  const auto stats = learner.stats();
  if (stats.state_held || stats.buffered != 2) {
    return fail("test_learner_holds_state_while_redis_is_down", "persisted records should merge once readable");
  }
  const nlohmann::json saved = nlohmann::json::parse(g_redis_mock.values.at(buffer_key));
  if (saved.at("entries").size() != 2 || g_redis_mock.values.count("pwr:test:state:model") != 1) {
    return fail("test_learner_holds_state_while_redis_is_down", "merged state should be saved after recovery");
  }
  return 0;
}

int test_redis_state_store() {
  g_redis_mock = {};

  RedisStoreOptions options;
  options.key_prefix = "pwr:test";
  RedisStateStore store(options);

  if (store.load(pwr_agent::store::kModelKey).has_value()) {
    return fail("test_redis_state_store", "missing key should load as empty");
  }

  const nlohmann::json doc{{"format", 1}, {"sample_count", 3}};
  if (!store.save(pwr_agent::store::kModelKey, doc)) {
    return fail("test_redis_state_store", "save should succeed with mock redis");
  }
  if (g_redis_mock.last_argv.size() != 3 || g_redis_mock.last_argv[0] != "SET" ||
      g_redis_mock.last_argv[1] != "pwr:test:state:model") {
    return fail("test_redis_state_store", "SET should target the prefixed state key");
  }

  const auto loaded = store.load(pwr_agent::store::kModelKey);
  if (!loaded.has_value() || *loaded != doc) {
    return fail("test_redis_state_store", "saved document should load back");
  }

  g_redis_mock.values["pwr:test:state:model"] = "{ not json";
  bool threw = false;
  try {
    (void)store.load(pwr_agent::store::kModelKey);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_redis_state_store", "corrupt document should throw");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_config_parsing(); rc != 0) return rc;
  if (int rc = test_config_rejects_invalid_values(); rc != 0) return rc;
  if (int rc = test_snapshot_codec_substitutes_defaults(); rc != 0) return rc;
  if (int rc = test_replay_monitor_publishes_frames(); rc != 0) return rc;
  if (int rc = test_redis_sink_publish_logic(); rc != 0) return rc;
  if (int rc = test_redis_sink_without_timeseries_module(); rc != 0) return rc;
  if (int rc = test_redis_sink_recovers_after_connect_failure(); rc != 0) return rc;
  if (int rc = test_redis_state_store(); rc != 0) return rc;
  if (int rc = test_redis_state_store_reports_outage(); rc != 0) return rc;
  if (int rc = test_learner_holds_state_while_redis_is_down(); rc != 0) return rc;

  std::cout << "[PASS] agent unit tests\n";
  return 0;
}
