#include "monitor/replay_monitor.hpp"

#include <bitset>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "store/codec.hpp"

namespace pwr_agent::monitor {
namespace {

bool is_skippable(const std::string& line) {
  const auto first = line.find_first_not_of(" \t\r");
  return first == std::string::npos || line[first] == '#';
}

}  // namespace

ReplayMonitor::ReplayMonitor(std::string path, const std::chrono::milliseconds interval, const bool loop,
                             core::Clock clock)
    : path_(std::move(path)), interval_(interval), loop_(loop), clock_(std::move(clock)) {}

ReplayMonitor::~ReplayMonitor() { stop(); }

std::vector<model::system_snapshot> ReplayMonitor::load_frames(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("unable to open replay file: " + path);
  }

  std::vector<model::system_snapshot> frames;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (is_skippable(line)) {
      continue;
    }
    const nlohmann::json doc = nlohmann::json::parse(line, nullptr, false);
    if (doc.is_discarded()) {
      throw std::runtime_error(path + ":" + std::to_string(line_no) + ": invalid JSON");
    }
    try {
      frames.push_back(store::snapshot_from_json(doc));
    } catch (const std::runtime_error& error) {
      throw std::runtime_error(path + ":" + std::to_string(line_no) + ": " + error.what());
    }
  }

  if (frames.empty()) {
    throw std::runtime_error("replay file holds no snapshots: " + path);
  }
  return frames;
}

void ReplayMonitor::start() {
  if (worker_.joinable()) {
    return;
  }
  frames_ = load_frames(path_);
  cursor_ = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
  }
  std::cerr << "[monitor] replaying " << frames_.size() << " snapshots from " << path_ << '\n';
  publish_next();
  worker_ = std::thread([this] { run(); });
}

void ReplayMonitor::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  wake_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

std::optional<model::system_snapshot> ReplayMonitor::latest_snapshot() const { return cell_.latest_snapshot(); }

void ReplayMonitor::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (wake_.wait_for(lock, interval_, [this] { return stopping_; })) {
      break;
    }
    lock.unlock();
    const bool more = publish_next();
    lock.lock();
    if (!more) {
      std::cerr << "[monitor] replay finished\n";
      break;
    }
  }
}

bool ReplayMonitor::publish_next() {
  if (cursor_ >= frames_.size()) {
    if (!loop_) {
      return false;
    }
    cursor_ = 0;
  }

  model::system_snapshot snapshot = frames_[cursor_++];
  snapshot.timestamp_ms = clock_();
  if (snapshot.unavailable != 0) {
    unavailable_metrics_.fetch_add(std::bitset<32>(snapshot.unavailable).count());
  }
  cell_.publish(snapshot);
  return loop_ || cursor_ < frames_.size();
}

}  // namespace pwr_agent::monitor
