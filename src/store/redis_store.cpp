#include "store/redis_store.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include <hiredis/hiredis.h>

namespace pwr_agent::store {

RedisStateStore::RedisStateStore(RedisStoreOptions options) : options_(std::move(options)) {}

RedisStateStore::~RedisStateStore() = default;

std::string RedisStateStore::redis_key(const std::string& key) const {
  return options_.key_prefix + ":state:" + key;
}

bool RedisStateStore::ensure_connected() {
  return redis_usable(context_) || reconnect();
}

bool RedisStateStore::reconnect() {
  context_ = connect_redis(options_.endpoint, "store");
  return context_ != nullptr;
}

bool RedisStateStore::save(const std::string& key, const nlohmann::json& doc) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string target = redis_key(key);
  const std::string payload = doc.dump();

  if (!ensure_connected()) {
    return false;
  }
  if (save_impl(target, payload)) {
    return true;
  }
  if (!reconnect()) {
    return false;
  }
  return save_impl(target, payload);
}

std::optional<nlohmann::json> RedisStateStore::load(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string target = redis_key(key);

  std::string payload;
  read_status status = read_status::FAILED;
  if (ensure_connected()) {
    status = load_impl(target, payload);
    if (status == read_status::FAILED && reconnect()) {
      status = load_impl(target, payload);
    }
  }
  if (status == read_status::FAILED) {
    throw StoreUnavailable("redis unavailable while reading " + target);
  }
  if (status == read_status::MISSING) {
    return std::nullopt;
  }

  nlohmann::json doc = nlohmann::json::parse(payload, nullptr, false);
  if (doc.is_discarded()) {
    throw std::runtime_error("corrupt state document in redis key " + target);
  }
  return doc;
}

bool RedisStateStore::save_impl(const std::string& redis_key, const std::string& payload) {
  const char* argv[] = {"SET", redis_key.c_str(), payload.c_str()};
  const std::size_t argv_len[] = {3, redis_key.size(), payload.size()};

  redisReply* reply = static_cast<redisReply*>(redisCommandArgv(context_.get(), 3, argv, argv_len));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[store] SET " << redis_key << " rejected: " << (reply->str != nullptr ? reply->str : "unknown")
              << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

RedisStateStore::read_status RedisStateStore::load_impl(const std::string& redis_key, std::string& payload) {
  const char* argv[] = {"GET", redis_key.c_str()};
  const std::size_t argv_len[] = {3, redis_key.size()};

  redisReply* reply = static_cast<redisReply*>(redisCommandArgv(context_.get(), 2, argv, argv_len));
  if (reply == nullptr) {
    return read_status::FAILED;
  }

  read_status status = read_status::FAILED;
  if (reply->type == REDIS_REPLY_NIL) {
    status = read_status::MISSING;
  } else if (reply->type == REDIS_REPLY_STRING && reply->str != nullptr) {
    payload.assign(reply->str, reply->len);
    status = read_status::FOUND;
  }
  freeReplyObject(reply);
  return status;
}

}  // namespace pwr_agent::store
