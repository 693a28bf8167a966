#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "chatpack/common.hpp"

namespace chatpack {

// Counters for one pipeline run.
class Metrics {
 public:
  Metrics() : started_ms_(now_ms()) {}

  void inc(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }

  uint64_t get(const std::string& key) const {
    const auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second;
  }

  int64_t elapsed_ms() const { return now_ms() - started_ms_; }

  json to_json() const {
    json j = json::object();
    for (const auto& kv : counters_) {
      j[kv.first] = kv.second;
    }
    j["elapsedMs"] = elapsed_ms();
    return j;
  }

 private:
  std::map<std::string, uint64_t> counters_;
  int64_t started_ms_;
};

}  // namespace chatpack
