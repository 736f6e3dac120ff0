#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "core/config.hpp"

namespace pwr_agent::store {

// Document keys shared by the controller and the learner.
inline constexpr const char* kActiveActionsKey = "active_actions";
inline constexpr const char* kLearnerBufferKey = "learner_buffer";
inline constexpr const char* kModelKey = "model";

// Thrown by load() when the backend cannot be read at all. Callers must not
// treat this as a missing key.
class StoreUnavailable : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Durable key/value storage for JSON documents. save() reports failure
// instead of throwing; load() returns nothing for a missing key, throws
// StoreUnavailable when the backend cannot be reached and throws
// std::runtime_error for a document that exists but cannot be parsed.
class StateStore {
 public:
  virtual ~StateStore() = default;

  virtual bool save(const std::string& key, const nlohmann::json& doc) = 0;
  virtual std::optional<nlohmann::json> load(const std::string& key) = 0;
};

// One <key>.json file per document under a directory. Writes go to a
// temporary file which is renamed over the target.
class FileStateStore final : public StateStore {
 public:
  explicit FileStateStore(std::filesystem::path directory);

  bool save(const std::string& key, const nlohmann::json& doc) override;
  std::optional<nlohmann::json> load(const std::string& key) override;

  [[nodiscard]] std::filesystem::path path_for(const std::string& key) const;

 private:
  std::filesystem::path directory_;
  std::mutex mutex_{};
};

class MemoryStateStore final : public StateStore {
 public:
  bool save(const std::string& key, const nlohmann::json& doc) override;
  std::optional<nlohmann::json> load(const std::string& key) override;

 private:
  std::mutex mutex_{};
  std::unordered_map<std::string, nlohmann::json> docs_{};
};

// Builds the backend named by store.backend. Throws std::runtime_error for
// an unknown backend.
std::shared_ptr<StateStore> make_state_store(const core::AgentConfig& config);

}  // namespace pwr_agent::store
