#pragma once

#include <limits>
#include <memory>
#include <optional>
#include <string>

#include "chatpack/datetime.hpp"
#include "chatpack/sequence.hpp"

namespace chatpack {

namespace telegram {

inline bool ends_with_space(const std::string& s) {
  return !s.empty() && std::isspace(static_cast<unsigned char>(s.back()));
}

inline bool starts_with_space(const std::string& s) {
  return !s.empty() && std::isspace(static_cast<unsigned char>(s.front()));
}

// "text" is either a plain string or a list of plain strings and entity
// objects ({"type": "bold", "text": "..."}). Adjacent fragments are kept
// apart by exactly one space.
inline std::string flatten_text(const json& text) {
  if (text.is_string()) {
    return text.get<std::string>();
  }
  if (!text.is_array()) {
    return "";
  }
  std::string out;
  for (const auto& part : text) {
    std::string fragment;
    if (part.is_string()) {
      fragment = part.get<std::string>();
    } else if (part.is_object()) {
      fragment = detail::json_string(part, "text");
    }
    if (fragment.empty()) {
      continue;
    }
    if (!out.empty() && !ends_with_space(out) && !starts_with_space(fragment)) {
      out.push_back(' ');
    }
    out += fragment;
  }
  return out;
}

inline constexpr int64_t kMaxUnixSeconds = std::numeric_limits<int64_t>::max() / 1000;

// Either "<key>_unixtime" (seconds, string or number) or the ISO "<key>".
// Seconds that do not fit in milliseconds are rejected.
inline std::optional<int64_t> read_time(const json& msg, const std::string& key) {
  const auto unix_it = msg.find(key + "_unixtime");
  if (unix_it != msg.end()) {
    if (const auto secs = detail::json_u64(*unix_it)) {
      if (*secs > static_cast<uint64_t>(kMaxUnixSeconds)) {
        return std::nullopt;
      }
      return static_cast<int64_t>(*secs) * 1000;
    }
  }
  const auto it = msg.find(key);
  if (it == msg.end()) {
    return std::nullopt;
  }
  if (it->is_number_unsigned()) {
    const uint64_t secs = it->get<uint64_t>();
    if (secs > static_cast<uint64_t>(kMaxUnixSeconds)) {
      return std::nullopt;
    }
    return static_cast<int64_t>(secs) * 1000;
  }
  if (it->is_number_integer()) {
    const int64_t secs = it->get<int64_t>();
    if (secs > kMaxUnixSeconds || secs < -kMaxUnixSeconds) {
      return std::nullopt;
    }
    return secs * 1000;
  }
  if (it->is_string()) {
    return parse_iso8601(it->get<std::string>());
  }
  return std::nullopt;
}

inline std::string media_kind(const std::string& media_type) {
  if (media_type.empty()) return "file";
  if (media_type == "voice_message") return "voice";
  if (media_type == "video_file" || media_type == "video_message") return "video";
  if (media_type == "audio_file") return "audio";
  if (media_type == "animation") return "gif";
  return media_type;  // sticker and anything newer
}

inline std::vector<Attachment> read_attachments(const json& msg) {
  std::vector<Attachment> out;
  const std::string photo = detail::json_string(msg, "photo");
  if (!photo.empty()) {
    out.push_back(Attachment{"photo", detail::file_name_of(photo), ""});
  }
  const std::string file = detail::json_string(msg, "file");
  const std::string media_type = detail::json_string(msg, "media_type");
  if (!file.empty() || !media_type.empty()) {
    std::string name = detail::json_string(msg, "file_name");
    if (name.empty()) {
      name = detail::file_name_of(file);
    }
    out.push_back(Attachment{media_kind(media_type), name, detail::json_string(msg, "sticker_emoji")});
  }
  if (msg.contains("location_information") && msg["location_information"].is_object()) {
    const auto& loc = msg["location_information"];
    std::ostringstream ss;
    ss << loc.value("latitude", 0.0) << "," << loc.value("longitude", 0.0);
    out.push_back(Attachment{"location", "", ss.str()});
  }
  if (msg.contains("poll") && msg["poll"].is_object()) {
    out.push_back(Attachment{"poll", "", detail::json_string(msg["poll"], "question")});
  }
  if (msg.contains("contact_information") && msg["contact_information"].is_object()) {
    const auto& c = msg["contact_information"];
    out.push_back(Attachment{"contact", trim(detail::json_string(c, "first_name") + " " +
                                             detail::json_string(c, "last_name")),
                             ""});
  }
  return out;
}

inline std::optional<Record> convert(const json& msg, std::size_t index, const ParserOptions& options) {
  if (!msg.is_object()) {
    return Record{ParseError{index, "message is not an object"}};
  }
  std::string type = detail::json_string(msg, "type");
  if (type.empty()) {
    type = "message";
  }
  const bool service = type == "service";
  if (!service && type != "message") {
    return Record{ParseError{index, "unknown message type '" + type + "'"}};
  }
  if (service && !options.include_system) {
    return std::nullopt;
  }

  Message m;
  const auto ts = read_time(msg, "date");
  if (!ts) {
    return Record{ParseError{index, "missing or unparseable date"}};
  }
  m.timestamp_ms = *ts;
  m.id = detail::json_u64(msg, "id");
  m.text = flatten_text(msg.contains("text") ? msg["text"] : json());

  if (service) {
    m.kind = MessageKind::kService;
    m.sender = detail::json_string(msg, "actor");
    if (m.sender.empty()) {
      m.sender = kSystemSender;
    }
    if (m.text.empty()) {
      m.text = detail::json_string(msg, "action");
    }
    return Record{std::move(m)};
  }

  m.sender = detail::json_string(msg, "from");
  if (m.sender.empty()) {
    // Deleted accounts export "from": null but keep the peer id.
    m.sender = detail::json_string(msg, "from_id");
  }
  if (m.sender.empty()) {
    return Record{ParseError{index, "missing sender"}};
  }

  m.reply_to = detail::json_u64(msg, "reply_to_message_id");
  m.edited_ms = read_time(msg, "edited");
  const std::string forwarded = detail::json_string(msg, "forwarded_from");
  if (!forwarded.empty()) {
    m.forwarded_from = forwarded;
  }
  m.attachments = read_attachments(msg);
  return Record{std::move(m)};
}

}  // namespace telegram

// Telegram Desktop "Export chat history" JSON: {"name", "type", "id", "messages": [...]}.
struct TelegramParser {
  ParserOptions options;

  std::unique_ptr<RecordSource> stream(std::istream& in) const {
    return std::make_unique<JsonStreamSource>(in, "messages", false, converter());
  }

  std::unique_ptr<RecordSource> parse_buffer(const std::string& text) const {
    return std::make_unique<JsonDocumentSource>(text, "messages", false, converter());
  }

 private:
  ElementConverter converter() const {
    const ParserOptions opts = options;
    return [opts](const json& element, std::size_t index) { return telegram::convert(element, index, opts); };
  }
};

}  // namespace chatpack
