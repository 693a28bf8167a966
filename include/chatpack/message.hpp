#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "chatpack/errors.hpp"

namespace chatpack {

struct Attachment {
  std::string kind;  // photo, video, audio, file, sticker, share, reaction, ...
  std::string name;
  std::string caption;

  bool operator==(const Attachment&) const = default;
};

enum class MessageKind { kRegular, kService };

// Range of parser ordinals a record was built from. Merge uses it to tell
// neighbours in the original export from neighbours left after filtering.
struct SourceSpan {
  std::uint64_t first{0};
  std::uint64_t last{0};

  bool operator==(const SourceSpan&) const = default;
};

struct Message {
  std::string sender;
  int64_t timestamp_ms{0};
  std::string text;
  std::optional<std::uint64_t> id;
  std::optional<std::uint64_t> reply_to;
  std::optional<int64_t> edited_ms;
  std::optional<std::string> forwarded_from;
  std::vector<Attachment> attachments;
  MessageKind kind{MessageKind::kRegular};
  std::optional<SourceSpan> span;

  bool is_service() const { return kind == MessageKind::kService; }

  bool operator==(const Message&) const = default;
};

inline constexpr const char* kSystemSender = "System";

using Record = std::variant<Message, ParseError>;

}  // namespace chatpack
