#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "actuators/registry.hpp"
#include "control/controller.hpp"
#include "core/config.hpp"
#include "learning/feedback_learner.hpp"
#include "monitor/monitor.hpp"
#include "monitor/replay_monitor.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"
#include "store/state_store.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

std::string format_config_settings(const pwr_agent::core::AgentConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | decision_interval_ms=" << config.decision_interval.count()
         << " | sampling_interval_ms=" << config.sampling_interval.count()
         << " | mode=" << pwr_agent::model::to_string(config.mode)
         << " | store=" << config.store.backend
         << " | replay=" << (config.monitor.replay_path.empty() ? "none" : config.monitor.replay_path)
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/pwr-agent.yaml";

  pwr_agent::core::AgentConfig config{};
  std::shared_ptr<pwr_agent::store::StateStore> store;
  try {
    config = pwr_agent::core::load_agent_config(config_path);
    store = pwr_agent::store::make_state_store(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  std::shared_ptr<pwr_agent::monitor::Monitor> monitor;
  if (!config.monitor.replay_path.empty()) {
    auto replay = std::make_shared<pwr_agent::monitor::ReplayMonitor>(config.monitor.replay_path,
                                                                      config.sampling_interval, config.monitor.loop);
    try {
      replay->start();
    } catch (const std::exception& ex) {
      std::cerr << "replay error: " << ex.what() << '\n';
      return 1;
    }
    monitor = replay;
  } else {
    std::cerr << "[agent] no snapshot source configured; ticks will be skipped until one publishes\n";
    monitor = std::make_shared<pwr_agent::monitor::SnapshotCell>();
  }

  auto actuators =
      std::make_shared<pwr_agent::actuators::ActuatorRegistry>(pwr_agent::actuators::make_dry_run_registry(config));
  auto learner = std::make_shared<pwr_agent::learning::FeedbackLearner>(config.learner, config.context, store);

  std::unique_ptr<pwr_agent::sinks::RedisTsSink> redis_sink;
  if (config.redis.enabled && config.publish_metrics) {
    pwr_agent::sinks::RedisTsOptions options{};
    options.endpoint.host = config.redis.host;
    options.endpoint.port = config.redis.port;
    options.endpoint.unix_socket = config.redis.unix_socket;
    options.key_prefix = config.store.key_prefix;
    redis_sink = std::make_unique<pwr_agent::sinks::RedisTsSink>(options);
    if (redis_sink->check_connectivity()) {
      std::cerr << "[agent] redis connectivity confirmed\n";
    } else {
      std::cerr << "[agent] redis connectivity check failed; will retry on publish\n";
    }
  }
  const pwr_agent::sinks::StdoutDebugSink stdout_sink{};

  pwr_agent::control::Controller controller{config, monitor, actuators, store, learner};
  controller.start();

  bool redis_was_ok = true;
  while (g_shutdown_requested == 0) {
    const pwr_agent::control::ControllerStatus status = controller.run_for_ticks(1);
    if (config.stdout_debug) {
      stdout_sink.publish(status);
    }
    if (redis_sink != nullptr) {
      const bool ok = redis_sink->publish(status);
      if (ok != redis_was_ok) {
        std::cerr << (ok ? "[agent] redis publish recovered\n" : "[agent] redis publish failing\n");
        redis_was_ok = ok;
      }
    }
  }

  std::cerr << "[agent] shutdown signal received; reverting actions\n";
  controller.shutdown();

  return 0;
}
