#include "store/state_store.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "store/redis_store.hpp"

namespace pwr_agent::store {

FileStateStore::FileStateStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::filesystem::path FileStateStore::path_for(const std::string& key) const {
  return directory_ / (key + ".json");
}

bool FileStateStore::save(const std::string& key, const nlohmann::json& doc) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::error_code error;
  std::filesystem::create_directories(directory_, error);
  if (error) {
    std::cerr << "[store] cannot create " << directory_ << ": " << error.message() << '\n';
    return false;
  }

  const std::filesystem::path target = path_for(key);
  std::filesystem::path temporary = target;
  temporary += ".tmp";

  {
    std::ofstream out(temporary, std::ios::trunc);
    if (!out.is_open()) {
      std::cerr << "[store] cannot open " << temporary << " for writing\n";
      return false;
    }
    out << doc.dump();
    out.flush();
    if (!out.good()) {
      std::cerr << "[store] write failed for " << temporary << '\n';
      return false;
    }
  }

  std::filesystem::rename(temporary, target, error);
  if (error) {
    std::cerr << "[store] rename to " << target << " failed: " << error.message() << '\n';
    std::filesystem::remove(temporary, error);
    return false;
  }
  return true;
}

std::optional<nlohmann::json> FileStateStore::load(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  const std::filesystem::path target = path_for(key);
  std::error_code error;
  if (!std::filesystem::exists(target, error)) {
    if (error) {
      throw StoreUnavailable("cannot stat " + target.string() + ": " + error.message());
    }
    return std::nullopt;
  }
  std::ifstream in(target);
  if (!in.is_open()) {
    throw StoreUnavailable("cannot open " + target.string());
  }

  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if (doc.is_discarded()) {
    throw std::runtime_error("corrupt state document: " + target.string());
  }
  return doc;
}

bool MemoryStateStore::save(const std::string& key, const nlohmann::json& doc) {
  std::lock_guard<std::mutex> lock(mutex_);
  docs_[key] = doc;
  return true;
}

std::optional<nlohmann::json> MemoryStateStore::load(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = docs_.find(key);
  if (it == docs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::shared_ptr<StateStore> make_state_store(const core::AgentConfig& config) {
  if (config.store.backend == "file") {
    return std::make_shared<FileStateStore>(config.store.path);
  }
  if (config.store.backend == "redis") {
    RedisStoreOptions options{};
    options.endpoint.host = config.redis.host;
    options.endpoint.port = config.redis.port;
    options.endpoint.unix_socket = config.redis.unix_socket;
    options.key_prefix = config.store.key_prefix;
    return std::make_shared<RedisStateStore>(options);
  }
  if (config.store.backend == "memory") {
    return std::make_shared<MemoryStateStore>();
  }
  throw std::runtime_error("unknown store backend: " + config.store.backend);
}

}  // namespace pwr_agent::store
