#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "chatpack/sequence.hpp"

namespace chatpack {

struct MergeOptions {
  std::string separator{" | "};
  // Only records that were neighbours in the export merge; a record removed
  // upstream (filter, parse error) breaks the run.
  bool consecutive_only{true};
};

inline bool can_merge(const Message& prev, const Message& next, const MergeOptions& options) {
  if (prev.is_service() || next.is_service() || prev.sender != next.sender) {
    return false;
  }
  if (!options.consecutive_only || !prev.span || !next.span) {
    return true;
  }
  return prev.span->last + 1 == next.span->first;
}

// Folds `next` into `run`. The run takes the earliest timestamp and keeps its
// first reply and forward; ids survive only while every constituent has one.
inline void absorb(Message& run, Message&& next, const MergeOptions& options) {
  run.timestamp_ms = std::min(run.timestamp_ms, next.timestamp_ms);
  if (!next.text.empty()) {
    if (!run.text.empty()) {
      run.text += options.separator;
    }
    run.text += next.text;
  }
  if (!next.id) {
    run.id.reset();
  }
  if (next.edited_ms && (!run.edited_ms || *next.edited_ms > *run.edited_ms)) {
    run.edited_ms = next.edited_ms;
  }
  for (auto& a : next.attachments) {
    run.attachments.push_back(std::move(a));
  }
  if (run.span && next.span) {
    run.span->last = next.span->last;
  } else {
    run.span.reset();
  }
}

// Holds at most one open run; memory is bounded by the longest run.
class MergeSource : public MessageSource {
 public:
  MergeSource(MessageSource& upstream, MergeOptions options) : upstream_(upstream), options_(std::move(options)) {}

  std::optional<Message> next() override {
    if (!run_) {
      run_ = upstream_.next();
      if (!run_) {
        return std::nullopt;
      }
    }
    while (auto m = upstream_.next()) {
      if (can_merge(*run_, *m, options_)) {
        absorb(*run_, std::move(*m), options_);
        ++merged_away_;
        continue;
      }
      Message done = std::move(*run_);
      run_ = std::move(m);
      return done;
    }
    Message done = std::move(*run_);
    run_.reset();
    return done;
  }

  std::size_t merged_away() const { return merged_away_; }

 private:
  MessageSource& upstream_;
  MergeOptions options_;
  std::optional<Message> run_;
  std::size_t merged_away_{0};
};

inline std::vector<Message> merge_consecutive(std::vector<Message> messages, const MergeOptions& options = {}) {
  VectorSource source(std::move(messages));
  MergeSource merged(source, options);
  return drain(merged);
}

}  // namespace chatpack
