#pragma once

#include <string>
#include <vector>

#include "control/status.hpp"
#include "store/redis_connection.hpp"

namespace pwr_agent::sinks {

struct RedisTsOptions {
  store::RedisEndpoint endpoint{};
  std::string key_prefix{"pwr:agent"};
};

// Publishes controller status to RedisTimeSeries under <key_prefix>:<suffix>,
// one series per entry of metric_suffixes(). Series are created on first
// connect; a server without the module disables the sink for good.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;

  bool check_connectivity();
  bool publish(const control::ControllerStatus& status);

  [[nodiscard]] static const std::vector<std::string>& metric_suffixes();

 private:
  bool connect();
  bool create_series();
  bool send_sample(const control::ControllerStatus& status);

  RedisTsOptions options_;
  store::RedisContextPtr context_;
  bool disabled_{false};
  bool series_created_{false};
};

}  // namespace pwr_agent::sinks
