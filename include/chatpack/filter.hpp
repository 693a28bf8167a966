#pragma once

#include <optional>
#include <string>
#include <vector>

#include "chatpack/datetime.hpp"
#include "chatpack/sequence.hpp"

namespace chatpack {

// Conjunction of an inclusive date range and an exact, case-sensitive sender.
struct FilterConfig {
  std::optional<int64_t> date_from_ms;
  std::optional<int64_t> date_to_ms;  // last millisecond of the --before day
  std::optional<std::string> sender;

  FilterConfig& with_date_from(const std::string& date) {
    date_from_ms = require_date(date);
    return *this;
  }

  FilterConfig& with_date_to(const std::string& date) {
    date_to_ms = require_date(date) + kMsPerDay - 1;
    return *this;
  }

  FilterConfig& with_sender(const std::string& name) {
    sender = name;
    return *this;
  }

  bool is_active() const { return date_from_ms || date_to_ms || sender; }

  bool matches(const Message& m) const {
    if (date_from_ms && m.timestamp_ms < *date_from_ms) {
      return false;
    }
    if (date_to_ms && m.timestamp_ms > *date_to_ms) {
      return false;
    }
    return !sender || m.sender == *sender;
  }

 private:
  static int64_t require_date(const std::string& date) {
    const auto ts = parse_date(date);
    if (!ts) {
      throw ConfigError("Invalid date '" + date + "': expected YYYY-MM-DD");
    }
    return *ts;
  }
};

class FilterSource : public MessageSource {
 public:
  FilterSource(MessageSource& upstream, FilterConfig config) : upstream_(upstream), config_(std::move(config)) {}

  std::optional<Message> next() override {
    while (auto m = upstream_.next()) {
      if (config_.matches(*m)) {
        return m;
      }
      ++rejected_;
    }
    return std::nullopt;
  }

  std::size_t rejected() const { return rejected_; }

 private:
  MessageSource& upstream_;
  FilterConfig config_;
  std::size_t rejected_{0};
};

inline std::vector<Message> filter_messages(std::vector<Message> messages, const FilterConfig& config) {
  VectorSource source(std::move(messages));
  FilterSource filtered(source, config);
  return drain(filtered);
}

}  // namespace chatpack
