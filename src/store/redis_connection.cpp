#include "store/redis_connection.hpp"

#include <iostream>

#include <hiredis/hiredis.h>

namespace pwr_agent::store {

void RedisContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

RedisContextPtr connect_redis(const RedisEndpoint& endpoint, const char* log_tag) {
  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(endpoint.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((endpoint.connect_timeout_ms % 1000) * 1000);

  RedisContextPtr context(endpoint.unix_socket.empty()
                              ? redisConnectWithTimeout(endpoint.host.c_str(), static_cast<int>(endpoint.port), timeout)
                              : redisConnectUnixWithTimeout(endpoint.unix_socket.c_str(), timeout));
  if (context == nullptr) {
    std::cerr << '[' << log_tag << "] redis connect failed: out of memory\n";
    return nullptr;
  }
  if (context->err != REDIS_OK) {
    std::cerr << '[' << log_tag << "] redis connect failed: " << context->errstr << '\n';
    return nullptr;
  }
  return context;
}

bool redis_usable(const RedisContextPtr& context) noexcept {
  return context != nullptr && context->err == REDIS_OK;
}

}  // namespace pwr_agent::store
