#pragma once

#include <cstddef>
#include <istream>
#include <streambuf>
#include <string>

namespace chatpack {

// Byte cursor over an input stream with unbounded look-ahead for sniffing.
// Only sniffed bytes are held in memory; the rest is pulled from the
// stream buffer on demand.
class InputCursor {
 public:
  static constexpr int kEof = -1;

  explicit InputCursor(std::istream& in) : buf_(in.rdbuf()) {}

  int peek() {
    if (pending_pos_ < pending_.size()) {
      return static_cast<unsigned char>(pending_[pending_pos_]);
    }
    if (!buf_) {
      return kEof;
    }
    const auto c = buf_->sgetc();
    return c == std::char_traits<char>::eof() ? kEof : static_cast<unsigned char>(c);
  }

  int get() {
    int c = kEof;
    if (pending_pos_ < pending_.size()) {
      c = static_cast<unsigned char>(pending_[pending_pos_++]);
      if (pending_pos_ == pending_.size()) {
        pending_.clear();
        pending_pos_ = 0;
      }
    } else if (buf_) {
      const auto r = buf_->sbumpc();
      c = r == std::char_traits<char>::eof() ? kEof : static_cast<unsigned char>(r);
    }
    if (c != kEof) {
      ++offset_;
    }
    return c;
  }

  // Up to `n` upcoming bytes without consuming them.
  std::string sniff(std::size_t n) {
    while (pending_.size() - pending_pos_ < n && buf_) {
      const auto r = buf_->sbumpc();
      if (r == std::char_traits<char>::eof()) {
        break;
      }
      pending_.push_back(static_cast<char>(r));
    }
    return pending_.substr(pending_pos_, n);
  }

  void skip_bom() {
    if (sniff(3) == "\xEF\xBB\xBF") {
      get();
      get();
      get();
    }
  }

  // Reads one line without its terminator ("\n" or "\r\n"). False at end of input.
  bool read_line(std::string& out) {
    out.clear();
    int c = get();
    if (c == kEof) {
      return false;
    }
    while (c != kEof && c != '\n') {
      out.push_back(static_cast<char>(c));
      c = get();
    }
    if (!out.empty() && out.back() == '\r') {
      out.pop_back();
    }
    return true;
  }

  std::size_t offset() const { return offset_; }

 private:
  std::streambuf* buf_;
  std::string pending_;
  std::size_t pending_pos_{0};
  std::size_t offset_{0};
};

}  // namespace chatpack
