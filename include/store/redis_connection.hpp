#pragma once

#include <cstdint>
#include <memory>
#include <string>

struct redisContext;

namespace pwr_agent::store {

struct RedisContextDeleter {
  void operator()(redisContext* context) const;
};

using RedisContextPtr = std::unique_ptr<redisContext, RedisContextDeleter>;

struct RedisEndpoint {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  // Takes precedence over host/port when set.
  std::string unix_socket{};
  std::uint32_t connect_timeout_ms{1000};
};

// Null when the connection cannot be established; the reason is logged
// under the given tag.
RedisContextPtr connect_redis(const RedisEndpoint& endpoint, const char* log_tag);

// True while the context exists and has not recorded an I/O error.
bool redis_usable(const RedisContextPtr& context) noexcept;

}  // namespace pwr_agent::store
