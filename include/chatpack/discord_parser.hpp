#pragma once

#include <cctype>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "chatpack/datetime.hpp"
#include "chatpack/line_source.hpp"
#include "chatpack/locale_date.hpp"
#include "chatpack/sequence.hpp"

namespace chatpack {

namespace discord {

enum class Dialect {
  kExporterJson,  // DiscordChatExporter: {"guild", "channel", "messages": [...]}
  kDiscrubArray,  // Discrub: [ {...}, {...} ]
  kExporterText,  // DiscordChatExporter plain text
};

inline constexpr std::size_t kSniffLimit = 4096;

// Looks at the first significant bytes without consuming them.
inline Dialect sniff_dialect(InputCursor& cursor) {
  const std::string head = cursor.sniff(kSniffLimit);
  std::size_t pos = 0;
  while (pos < head.size() && std::isspace(static_cast<unsigned char>(head[pos]))) {
    ++pos;
  }
  if (pos >= head.size()) {
    throw FileFatalError("Discord export is empty");
  }
  if (head[pos] == '{') {
    return Dialect::kExporterJson;
  }
  if (head[pos] == '[') {
    std::size_t after = pos + 1;
    while (after < head.size() && std::isspace(static_cast<unsigned char>(head[after]))) {
      ++after;
    }
    if (after < head.size() && (head[after] == '{' || head[after] == ']')) {
      return Dialect::kDiscrubArray;
    }
  }
  return Dialect::kExporterText;
}

inline std::string attachment_kind(const std::string& name) {
  const auto dot = name.find_last_of('.');
  if (dot == std::string::npos) {
    return "file";
  }
  std::string ext = to_lower(name.substr(dot + 1));
  const auto query = ext.find('?');
  if (query != std::string::npos) {
    ext.resize(query);
  }
  if (ext == "png" || ext == "jpg" || ext == "jpeg" || ext == "gif" || ext == "webp") return "photo";
  if (ext == "mp4" || ext == "mov" || ext == "webm" || ext == "mkv") return "video";
  if (ext == "mp3" || ext == "ogg" || ext == "wav" || ext == "flac" || ext == "m4a") return "audio";
  return "file";
}

inline Attachment attachment_from_url(const std::string& url) {
  std::string name = detail::file_name_of(url);
  const auto query = name.find('?');
  if (query != std::string::npos) {
    name.resize(query);
  }
  return Attachment{attachment_kind(name), name, ""};
}

inline std::string author_name(const json& msg) {
  const std::string flat = detail::json_string(msg, "userName");
  if (!flat.empty()) {
    return flat;
  }
  const auto it = msg.find("author");
  if (it == msg.end() || !it->is_object()) {
    return "";
  }
  for (const char* key : {"nickname", "global_name", "name", "username"}) {
    const std::string v = detail::json_string(*it, key);
    if (!v.empty()) {
      return v;
    }
  }
  return "";
}

// DiscordChatExporter writes type names, Discrub writes the numeric API type.
inline bool is_regular_type(const json& msg) {
  const auto it = msg.find("type");
  if (it == msg.end() || it->is_null()) {
    return true;
  }
  if (it->is_string()) {
    const std::string t = it->get<std::string>();
    return t.empty() || t == "Default" || t == "Reply";
  }
  if (it->is_number_integer()) {
    const auto t = it->get<int64_t>();
    return t == 0 || t == 19;
  }
  return false;
}

inline std::optional<int64_t> read_timestamp(const json& msg, const char* key) {
  const std::string raw = detail::json_string(msg, key);
  if (raw.empty()) {
    return std::nullopt;
  }
  return parse_iso8601(raw);
}

inline std::optional<std::uint64_t> read_reply(const json& msg) {
  for (const char* key : {"reference", "message_reference"}) {
    const auto it = msg.find(key);
    if (it != msg.end() && it->is_object()) {
      for (const char* id_key : {"messageId", "message_id"}) {
        if (auto id = detail::json_u64(*it, id_key)) {
          return id;
        }
      }
    }
  }
  return std::nullopt;
}

inline std::vector<Attachment> read_attachments(const json& msg) {
  std::vector<Attachment> out;
  const auto files = msg.find("attachments");
  if (files != msg.end() && files->is_array()) {
    for (const auto& a : *files) {
      if (!a.is_object()) {
        continue;
      }
      std::string name = detail::json_string(a, "fileName");
      if (name.empty()) name = detail::json_string(a, "filename");
      if (name.empty()) {
        out.push_back(attachment_from_url(detail::json_string(a, "url")));
      } else {
        out.push_back(Attachment{attachment_kind(name), name, ""});
      }
    }
  }
  for (const char* key : {"stickers", "sticker_items"}) {
    const auto it = msg.find(key);
    if (it == msg.end() || !it->is_array()) {
      continue;
    }
    for (const auto& s : *it) {
      if (s.is_object()) {
        out.push_back(Attachment{"sticker", detail::json_string(s, "name"), ""});
      }
    }
  }
  return out;
}

inline std::optional<Record> convert(const json& msg, std::size_t index, const ParserOptions& options) {
  if (!msg.is_object()) {
    return Record{ParseError{index, "message is not an object"}};
  }
  const bool service = !is_regular_type(msg);
  if (service && !options.include_system) {
    return std::nullopt;
  }

  Message m;
  const auto ts = read_timestamp(msg, "timestamp");
  if (!ts) {
    return Record{ParseError{index, "missing or unparseable timestamp"}};
  }
  m.timestamp_ms = *ts;
  m.sender = author_name(msg);
  m.text = detail::json_string(msg, "content");
  m.id = detail::json_u64(msg, "id");

  if (service) {
    m.kind = MessageKind::kService;
    if (m.sender.empty()) {
      m.sender = kSystemSender;
    }
    if (m.text.empty()) {
      m.text = detail::json_string(msg, "type");
    }
    return Record{std::move(m)};
  }
  if (m.sender.empty()) {
    return Record{ParseError{index, "missing author"}};
  }

  m.edited_ms = read_timestamp(msg, "timestampEdited");
  if (!m.edited_ms) {
    m.edited_ms = read_timestamp(msg, "edited_timestamp");
  }
  m.reply_to = read_reply(msg);
  m.attachments = read_attachments(msg);
  return Record{std::move(m)};
}

}  // namespace discord

// DiscordChatExporter plain text:
//   ==============================================================
//   Guild: Server
//   Channel: general
//   ==============================================================
//
//   [1/15/2024 10:30 AM] Alice
//   Hello
//   {Attachments}
//   https://cdn.discordapp.com/attachments/1/2/photo.png
//
//   ==============================================================
//   Exported 1 message(s)
//   ==============================================================
class DiscordTextSource : public LineRecordSource {
 public:
  explicit DiscordTextSource(InputCursor cursor) : LineRecordSource(std::move(cursor)) {
    const auto layout = detect_date_layout(sample(kSampleLines));
    if (!layout) {
      throw FileFatalError("not a Discord export: no \"[date time] author\" header found");
    }
    layout_ = *layout;
  }

 protected:
  void on_line(const std::string& line) override {
    if (footer_) {
      return;
    }
    if (starts_with(line, "=====")) {
      // The preamble is fenced too; only a fence after messages starts the footer.
      if (seen_header_) {
        flush();
        footer_ = true;
      }
      return;
    }

    const auto header = line.empty() || line[0] != '[' ? std::nullopt : split_header(line);
    if (header && header->bracketed) {
      flush();
      seen_header_ = true;
      const auto ts = header_timestamp(*header, layout_);
      std::string author = trim(header->rest);
      static const std::string kPinned = " (pinned)";
      if (author.size() > kPinned.size() && author.compare(author.size() - kPinned.size(), kPinned.size(), kPinned) == 0) {
        author.resize(author.size() - kPinned.size());
      }
      if (!ts) {
        emit(ParseError{line_number(), std::string("date does not match layout ") + layout_name(layout_)});
        return;
      }
      if (author.empty()) {
        emit(ParseError{line_number(), "missing author"});
        return;
      }
      Message m;
      m.sender = std::move(author);
      m.timestamp_ms = *ts;
      pending_ = std::move(m);
      section_ = Section::kContent;
      return;
    }

    if (!pending_) {
      return;
    }
    const std::string t = trim(line);
    if (t.size() > 2 && t.front() == '{' && t.back() == '}' && t.find(' ') == std::string::npos) {
      if (t == "{Attachments}") {
        section_ = Section::kAttachments;
      } else if (t == "{Stickers}") {
        section_ = Section::kStickers;
      } else {
        section_ = Section::kOther;  // {Embed}, {Reactions}, ...
      }
      return;
    }
    switch (section_) {
      case Section::kContent:
        if (!pending_->text.empty()) {
          pending_->text.push_back('\n');
        }
        pending_->text += line;
        break;
      case Section::kAttachments:
        if (!t.empty()) {
          pending_->attachments.push_back(discord::attachment_from_url(t));
        }
        break;
      case Section::kStickers:
        if (!t.empty()) {
          pending_->attachments.push_back(Attachment{"sticker", t, ""});
        }
        break;
      case Section::kOther:
        break;
    }
  }

  void on_end() override { flush(); }

 private:
  enum class Section { kContent, kAttachments, kStickers, kOther };

  static constexpr std::size_t kSampleLines = 1000;

  void flush() {
    if (!pending_) {
      return;
    }
    Message m = std::move(*pending_);
    pending_.reset();
    m.text = trim(m.text);
    emit(Record{std::move(m)});
  }

  DateLayout layout_{DateLayout::kMonthDayYear};
  std::optional<Message> pending_;
  Section section_{Section::kContent};
  bool seen_header_{false};
  bool footer_{false};
};

// Auto-detects the export dialect from its first significant byte.
struct DiscordParser {
  ParserOptions options;

  std::unique_ptr<RecordSource> stream(std::istream& in) const { return open(InputCursor(in)); }

  std::unique_ptr<RecordSource> parse_buffer(const std::string& text) const {
    std::istringstream sniff_in(text);
    InputCursor cursor(sniff_in);
    cursor.skip_bom();
    if (discord::sniff_dialect(cursor) == discord::Dialect::kExporterText) {
      return std::make_unique<BufferedSource>(text, [](std::istream& in) -> std::unique_ptr<RecordSource> {
        return std::make_unique<DiscordTextSource>(InputCursor(in));
      });
    }
    return std::make_unique<JsonDocumentSource>(text, "messages", true, converter());
  }

 private:
  std::unique_ptr<RecordSource> open(InputCursor cursor) const {
    cursor.skip_bom();
    switch (discord::sniff_dialect(cursor)) {
      case discord::Dialect::kExporterJson:
        return std::make_unique<JsonStreamSource>(std::move(cursor), "messages", false, converter());
      case discord::Dialect::kDiscrubArray:
        return std::make_unique<JsonStreamSource>(std::move(cursor), "messages", true, converter());
      case discord::Dialect::kExporterText:
      default:
        return std::make_unique<DiscordTextSource>(std::move(cursor));
    }
  }

  ElementConverter converter() const {
    const ParserOptions opts = options;
    return [opts](const json& element, std::size_t index) { return discord::convert(element, index, opts); };
  }
};

}  // namespace chatpack
