#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "store/redis_connection.hpp"
#include "store/state_store.hpp"

namespace pwr_agent::store {

struct RedisStoreOptions {
  RedisEndpoint endpoint{};
  std::string key_prefix{"pwr:agent"};
};

// Documents stored as plain string values under <key_prefix>:state:<key>.
class RedisStateStore final : public StateStore {
 public:
  explicit RedisStateStore(RedisStoreOptions options = {});
  ~RedisStateStore() override;

  RedisStateStore(const RedisStateStore&) = delete;
  RedisStateStore& operator=(const RedisStateStore&) = delete;

  bool save(const std::string& key, const nlohmann::json& doc) override;
  std::optional<nlohmann::json> load(const std::string& key) override;

  [[nodiscard]] std::string redis_key(const std::string& key) const;

 private:
  enum class read_status {
    FOUND,
    MISSING,
    FAILED,
  };

  bool ensure_connected();
  bool reconnect();
  bool save_impl(const std::string& redis_key, const std::string& payload);
  read_status load_impl(const std::string& redis_key, std::string& payload);

  RedisStoreOptions options_;
  RedisContextPtr context_;
  std::mutex mutex_{};
};

}  // namespace pwr_agent::store
