#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace chatpack {

// Input unusable as a whole: unreadable, empty, not the declared dialect,
// malformed or truncated. Raised before any output when detectable up front.
class FileFatalError : public std::runtime_error {
 public:
  explicit FileFatalError(const std::string& what) : std::runtime_error(what) {}
};

class OutputIOError : public std::runtime_error {
 public:
  explicit OutputIOError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// One rejected record. Yielded in-band by parsers; never thrown.
struct ParseError {
  std::size_t position{0};  // element index (JSON) or 1-based line number (text)
  std::string reason;

  std::string describe() const {
    return "record " + std::to_string(position) + ": " + reason;
  }
};

}  // namespace chatpack
