#pragma once

#include <memory>
#include <optional>
#include <string>

#include "chatpack/encoding.hpp"
#include "chatpack/sequence.hpp"

namespace chatpack {

namespace instagram {

// Every string in a Meta export is UTF-8 read back as Latin-1.
inline std::string text_field(const json& obj, const char* key) {
  return repair_mojibake(detail::json_string(obj, key));
}

inline void read_media(const json& msg, const char* key, const char* kind, std::vector<Attachment>& out) {
  const auto it = msg.find(key);
  if (it == msg.end() || !it->is_array()) {
    return;
  }
  for (const auto& item : *it) {
    if (!item.is_object()) {
      continue;
    }
    out.push_back(Attachment{kind, detail::file_name_of(text_field(item, "uri")), ""});
  }
}

inline std::vector<Attachment> read_attachments(const json& msg) {
  std::vector<Attachment> out;
  read_media(msg, "photos", "photo", out);
  read_media(msg, "videos", "video", out);
  read_media(msg, "audio_files", "audio", out);
  read_media(msg, "gifs", "gif", out);
  read_media(msg, "files", "file", out);

  if (msg.contains("sticker") && msg["sticker"].is_object()) {
    out.push_back(Attachment{"sticker", detail::file_name_of(text_field(msg["sticker"], "uri")), ""});
  }
  if (msg.contains("share") && msg["share"].is_object()) {
    const auto& share = msg["share"];
    out.push_back(Attachment{"share", text_field(share, "link"), text_field(share, "share_text")});
  }
  if (msg.contains("reactions") && msg["reactions"].is_array()) {
    for (const auto& r : msg["reactions"]) {
      if (r.is_object()) {
        out.push_back(Attachment{"reaction", text_field(r, "actor"), text_field(r, "reaction")});
      }
    }
  }
  return out;
}

inline std::optional<Record> convert(const json& msg, std::size_t index) {
  if (!msg.is_object()) {
    return Record{ParseError{index, "message is not an object"}};
  }
  Message m;
  m.sender = text_field(msg, "sender_name");
  if (m.sender.empty()) {
    return Record{ParseError{index, "missing sender_name"}};
  }
  const auto it = msg.find("timestamp_ms");
  if (it == msg.end() || !it->is_number_integer()) {
    return Record{ParseError{index, "missing timestamp_ms"}};
  }
  m.timestamp_ms = it->get<int64_t>();
  m.text = text_field(msg, "content");
  m.attachments = read_attachments(msg);
  return Record{std::move(m)};
}

}  // namespace instagram

// Instagram "Download your information" message_N.json:
// {"participants": [...], "messages": [...], "title": ...}. Messages are kept
// in file order (Meta writes newest first).
struct InstagramParser {
  ParserOptions options;

  std::unique_ptr<RecordSource> stream(std::istream& in) const {
    return std::make_unique<JsonStreamSource>(in, "messages", false, &instagram::convert);
  }

  std::unique_ptr<RecordSource> parse_buffer(const std::string& text) const {
    return std::make_unique<JsonDocumentSource>(text, "messages", false, &instagram::convert);
  }
};

}  // namespace chatpack
