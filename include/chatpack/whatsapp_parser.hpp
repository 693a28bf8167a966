#pragma once

#include <memory>
#include <optional>
#include <string>

#include "chatpack/line_source.hpp"
#include "chatpack/locale_date.hpp"

namespace chatpack {

namespace whatsapp {

inline constexpr std::size_t kSampleLines = 1000;

// Placeholder bodies WhatsApp writes instead of media when exporting without it.
inline std::optional<Attachment> media_placeholder(const std::string& text) {
  const std::string low = to_lower(trim(text));
  static const std::pair<const char*, const char*> kPlaceholders[] = {
      {"<media omitted>", "media"},     {"image omitted", "photo"},    {"video omitted", "video"},
      {"audio omitted", "audio"},       {"document omitted", "file"},  {"sticker omitted", "sticker"},
      {"gif omitted", "gif"},           {"contact card omitted", "contact"},
  };
  for (const auto& [needle, kind] : kPlaceholders) {
    if (low == needle) {
      return Attachment{kind, "", ""};
    }
  }

  // iOS: "<attached: 00000012-PHOTO-2024-01-15-10-30-00.jpg>"
  if (starts_with(low, "<attached:") && low.back() == '>') {
    const std::string name = trim(trim(text).substr(10, trim(text).size() - 11));
    std::string kind = "file";
    if (name.find("PHOTO") != std::string::npos) kind = "photo";
    else if (name.find("VIDEO") != std::string::npos) kind = "video";
    else if (name.find("AUDIO") != std::string::npos) kind = "audio";
    else if (name.find("STICKER") != std::string::npos) kind = "sticker";
    return Attachment{kind, name, ""};
  }

  // Android: "IMG-20240115-WA0001.jpg (file attached)"
  static const std::string kAttachedSuffix = " (file attached)";
  const std::string t = trim(text);
  if (t.size() > kAttachedSuffix.size() &&
      to_lower(t.substr(t.size() - kAttachedSuffix.size())) == kAttachedSuffix &&
      t.find('\n') == std::string::npos) {
    return Attachment{"file", t.substr(0, t.size() - kAttachedSuffix.size()), ""};
  }
  return std::nullopt;
}

// System notices whose text can itself contain ": ", such as a quoted group
// subject. Only the part before the first ": " is checked, so a regular
// message quoting one of these phrases keeps its sender.
inline bool is_system_notice(const std::string& rest) {
  static const char* const kMarkers[] = {
      " changed the group description", " changed the description", " changed the subject",
      " changed the group name",        " changed this group's",    " created group ",
      "Messages and calls are end-to-end encrypted",
  };
  const std::string head = rest.substr(0, rest.find(": "));
  for (const char* marker : kMarkers) {
    if (head.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace whatsapp

// Line-oriented "Export chat" text:
//   15/01/2024, 10:30 - Alice: Hello
//   continuation of Alice's message
//   15/01/2024, 10:31 - Alice added Bob        (system notice)
//   [1/15/24, 10:32:05 AM] Bob: Hi             (iOS)
class WhatsAppSource : public LineRecordSource {
 public:
  WhatsAppSource(InputCursor cursor, ParserOptions options)
      : LineRecordSource(std::move(cursor)), options_(options) {
    const auto lines = sample(whatsapp::kSampleLines);
    bool any_content = false;
    for (const auto& l : lines) {
      if (!trim(l).empty()) {
        any_content = true;
        break;
      }
    }
    if (!any_content) {
      throw FileFatalError("WhatsApp export is empty");
    }
    const auto layout = detect_date_layout(lines);
    if (!layout) {
      throw FileFatalError("cannot detect the WhatsApp date format: no line in the first " +
                           std::to_string(lines.size()) + " looks like a message header");
    }
    layout_ = *layout;
    Logger::log(Logger::Level::kDebug, std::string("WhatsApp date layout: ") + layout_name(layout_));
  }

 protected:
  void on_line(const std::string& line) override {
    const auto header = split_header(line);
    if (!header) {
      if (pending_) {
        pending_->text.push_back('\n');
        pending_->text += line;
      }
      return;
    }

    flush();
    const auto ts = header_timestamp(*header, layout_);
    if (!ts) {
      emit(ParseError{line_number(), std::string("date does not match layout ") + layout_name(layout_)});
      return;
    }

    Message m;
    m.timestamp_ms = *ts;
    const std::string& rest = header->rest;
    const bool notice = whatsapp::is_system_notice(rest);
    std::size_t colon = notice ? std::string::npos : rest.find(": ");
    if (!notice && colon == std::string::npos && !rest.empty() && rest.back() == ':') {
      colon = rest.size() - 1;
    }
    if (colon == std::string::npos) {
      m.kind = MessageKind::kService;
      m.sender = kSystemSender;
      m.text = rest;
    } else {
      m.sender = trim(rest.substr(0, colon));
      m.text = colon + 2 <= rest.size() ? rest.substr(colon + 2) : std::string();
      if (m.sender.empty()) {
        emit(ParseError{line_number(), "empty sender"});
        return;
      }
    }
    pending_ = std::move(m);
  }

  void on_end() override { flush(); }

 private:
  void flush() {
    if (!pending_) {
      return;
    }
    Message m = std::move(*pending_);
    pending_.reset();
    if (m.is_service() && !options_.include_system) {
      return;
    }
    if (!m.is_service()) {
      if (auto media = whatsapp::media_placeholder(m.text)) {
        m.attachments.push_back(std::move(*media));
        m.text.clear();
      }
    }
    emit(Record{std::move(m)});
  }

  ParserOptions options_;
  DateLayout layout_{DateLayout::kDayMonthYear};
  std::optional<Message> pending_;
};

struct WhatsAppParser {
  ParserOptions options;

  std::unique_ptr<RecordSource> stream(std::istream& in) const {
    return std::make_unique<WhatsAppSource>(InputCursor(in), options);
  }

  std::unique_ptr<RecordSource> parse_buffer(const std::string& text) const {
    const ParserOptions opts = options;
    return std::make_unique<BufferedSource>(text, [opts](std::istream& in) -> std::unique_ptr<RecordSource> {
      return std::make_unique<WhatsAppSource>(InputCursor(in), opts);
    });
  }
};

}  // namespace chatpack
