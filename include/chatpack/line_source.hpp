#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "chatpack/input.hpp"
#include "chatpack/sequence.hpp"

namespace chatpack {

// Base for line-oriented exports. A record is only complete once the next
// header line (or end of input) is seen, so subclasses hold at most one
// pending message and push finished records into a short ready queue.
class LineRecordSource : public RecordSource {
 public:
  std::optional<Record> next() override {
    for (;;) {
      if (!ready_.empty()) {
        Record r = std::move(ready_.front());
        ready_.pop_front();
        return r;
      }
      if (finished_) {
        return std::nullopt;
      }
      std::string line;
      if (!next_line(line)) {
        finished_ = true;
        on_end();
        continue;
      }
      on_line(line);
    }
  }

 protected:
  explicit LineRecordSource(InputCursor cursor) : cursor_(std::move(cursor)) { cursor_.skip_bom(); }

  virtual void on_line(const std::string& line) = 0;
  virtual void on_end() = 0;

  // Buffers up to `max_lines` leading lines for format detection; they are
  // replayed through on_line() afterwards.
  std::vector<std::string> sample(std::size_t max_lines) {
    std::string line;
    while (lookahead_.size() < max_lines && cursor_.read_line(line)) {
      lookahead_.push_back(line);
    }
    return std::vector<std::string>(lookahead_.begin(), lookahead_.end());
  }

  void emit(Record record) {
    ordinals_.stamp(record);
    ready_.push_back(std::move(record));
  }

  std::size_t line_number() const { return line_no_; }

 private:
  bool next_line(std::string& line) {
    if (!lookahead_.empty()) {
      line = std::move(lookahead_.front());
      lookahead_.pop_front();
    } else if (!cursor_.read_line(line)) {
      return false;
    }
    ++line_no_;
    return true;
  }

  InputCursor cursor_;
  std::deque<std::string> lookahead_;
  std::deque<Record> ready_;
  OrdinalCounter ordinals_;
  std::size_t line_no_{0};
  bool finished_{false};
};

}  // namespace chatpack
