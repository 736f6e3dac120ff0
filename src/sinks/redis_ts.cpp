#include "sinks/redis_ts.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <utility>

#include <hiredis/hiredis.h>

namespace pwr_agent::sinks {
namespace {

double finite_or_zero(const float value) {
  return std::isfinite(value) ? static_cast<double>(value) : 0.0;
}

template <typename Enum>
double enum_value(const Enum value) {
  return static_cast<double>(static_cast<std::uint8_t>(value));
}

bool reply_mentions(const redisReply* reply, const char* text) {
  return reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && std::strstr(reply->str, text) != nullptr;
}

}  // namespace

const std::vector<std::string>& RedisTsSink::metric_suffixes() {
  static const std::vector<std::string> kSuffixes = {
      "status:state",
      "status:mode",
      "status:battery",
      "status:context_score",
      "status:severity",
      "status:active_actions",
      "status:aggregate_savings",
      "status:running_satisfaction",
      "status:historical_accuracy",
      "status:stale_snapshots",
      "status:dispatch_failures",
      "status:stuck_actions",
      "status:pending_dispatches",
      "status:retrain_failures",
  };
  return kSuffixes;
}

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {}

bool RedisTsSink::check_connectivity() {
  if (disabled_) {
    return false;
  }
  return store::redis_usable(context_) || connect();
}

bool RedisTsSink::connect() {
  context_ = store::connect_redis(options_.endpoint, "sink");
  if (context_ == nullptr) {
    return false;
  }
  if (!create_series()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisTsSink::create_series() {
  if (series_created_) {
    return true;
  }

  for (const auto& suffix : metric_suffixes()) {
    const std::string key = options_.key_prefix + ":" + suffix;
    auto* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
    if (reply == nullptr) {
      return false;
    }

    if (reply_mentions(reply, "unknown command")) {
      freeReplyObject(reply);
      std::cerr << "[sink] RedisTimeSeries module not loaded; metrics publishing disabled\n";
      disabled_ = true;
      return false;
    }
    if (reply->type == REDIS_REPLY_ERROR && !reply_mentions(reply, "already exists")) {
      std::cerr << "[sink] TS.CREATE " << key << " failed: " << (reply->str != nullptr ? reply->str : "unknown")
                << '\n';
      freeReplyObject(reply);
      return false;
    }
    freeReplyObject(reply);
  }

  series_created_ = true;
  return true;
}

bool RedisTsSink::publish(const control::ControllerStatus& status) {
  if (!check_connectivity()) {
    return false;
  }
  if (send_sample(status)) {
    return true;
  }
  // One fresh connection per publish; a second failure waits for the next tick.
  return connect() && send_sample(status);
}

bool RedisTsSink::send_sample(const control::ControllerStatus& status) {
  const double values[] = {
      enum_value(status.state),
      enum_value(status.mode),
      finite_or_zero(status.battery_percent),
      finite_or_zero(status.context_score),
      enum_value(status.last_severity),
      static_cast<double>(status.active_count),
      finite_or_zero(status.aggregate_savings),
      finite_or_zero(status.running_satisfaction),
      finite_or_zero(status.historical_accuracy),
      static_cast<double>(status.stale_snapshots),
      static_cast<double>(status.dispatch_failures),
      static_cast<double>(status.stuck_actions),
      static_cast<double>(status.pending_dispatches),
      static_cast<double>(status.retrain_failures),
  };
  const auto& suffixes = metric_suffixes();
  const std::string timestamp = std::to_string(status.timestamp_ms);

  // TS.MADD key timestamp value [key timestamp value ...]
  std::vector<std::string> args;
  args.reserve(1 + suffixes.size() * 3);
  args.emplace_back("TS.MADD");
  for (std::size_t i = 0; i < suffixes.size(); ++i) {
    args.push_back(options_.key_prefix + ":" + suffixes[i]);
    args.push_back(timestamp);
    args.push_back(std::to_string(values[i]));
  }

  std::vector<const char*> argv;
  std::vector<std::size_t> argv_len;
  argv.reserve(args.size());
  argv_len.reserve(args.size());
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
    argv_len.push_back(arg.size());
  }

  auto* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(argv.size()), argv.data(), argv_len.data()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

}  // namespace pwr_agent::sinks
