#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "chatpack/datetime.hpp"
#include "chatpack/message.hpp"

namespace chatpack {

// Optional columns/keys. Sender and content are always written.
struct FieldSelection {
  bool timestamps{false};
  bool replies{false};  // reply_to and forwarded_from
  bool edited{false};
  bool ids{false};
  bool attachments{false};
};

enum class OutputFormat { kCsv, kJson, kJsonl };

inline OutputFormat parse_format(const std::string& raw) {
  const std::string name = to_lower(trim(raw));
  if (name == "csv") return OutputFormat::kCsv;
  if (name == "json") return OutputFormat::kJson;
  if (name == "jsonl" || name == "ndjson") return OutputFormat::kJsonl;
  throw ConfigError("Unknown format '" + raw + "': expected csv, json or jsonl");
}

inline const char* format_extension(OutputFormat f) {
  switch (f) {
    case OutputFormat::kCsv:
      return "csv";
    case OutputFormat::kJson:
      return "json";
    case OutputFormat::kJsonl:
    default:
      return "jsonl";
  }
}

inline std::string format_name(OutputFormat f) {
  std::string name = format_extension(f);
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return name;
}

inline std::string default_output_path(OutputFormat f) {
  return std::string("optimized_chat.") + format_extension(f);
}

// Object for one message with keys in a fixed order.
inline nlohmann::ordered_json message_to_json(const Message& m, const FieldSelection& fields) {
  nlohmann::ordered_json j;
  if (fields.timestamps) {
    j["timestamp"] = format_timestamp(m.timestamp_ms);
  }
  if (fields.ids && m.id) {
    j["id"] = *m.id;
  }
  j["sender"] = m.sender;
  j["content"] = m.text;
  if (fields.replies) {
    if (m.reply_to) {
      j["reply_to"] = *m.reply_to;
    }
    if (m.forwarded_from) {
      j["forwarded_from"] = *m.forwarded_from;
    }
  }
  if (fields.edited && m.edited_ms) {
    j["edited"] = format_timestamp(*m.edited_ms);
  }
  if (fields.attachments && !m.attachments.empty()) {
    auto arr = nlohmann::ordered_json::array();
    for (const auto& a : m.attachments) {
      nlohmann::ordered_json item;
      item["kind"] = a.kind;
      if (!a.name.empty()) item["name"] = a.name;
      if (!a.caption.empty()) item["caption"] = a.caption;
      arr.push_back(std::move(item));
    }
    j["attachments"] = std::move(arr);
  }
  return j;
}

inline std::string dump_json(const nlohmann::ordered_json& j, int indent = -1) {
  return j.dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

// Streams messages to `out` one at a time. Any stream failure raises
// OutputIOError.
class MessageWriter {
 public:
  virtual ~MessageWriter() = default;

  virtual void begin() = 0;
  virtual void write(const Message& m) = 0;
  virtual void finish() = 0;

  std::size_t written() const { return written_; }

 protected:
  MessageWriter(std::ostream& out, FieldSelection fields) : out_(out), fields_(fields) {}

  void check() {
    if (!out_) {
      throw OutputIOError("write to output failed");
    }
  }

  std::ostream& out_;
  FieldSelection fields_;
  std::size_t written_{0};
};

class CsvWriter : public MessageWriter {
 public:
  CsvWriter(std::ostream& out, FieldSelection fields, char delimiter = ',')
      : MessageWriter(out, fields), delimiter_(delimiter) {}

  void begin() override {
    std::vector<std::string> header;
    if (fields_.timestamps) header.push_back("Timestamp");
    if (fields_.ids) header.push_back("ID");
    header.push_back("Sender");
    header.push_back("Content");
    if (fields_.replies) {
      header.push_back("ReplyTo");
      header.push_back("ForwardedFrom");
    }
    if (fields_.edited) header.push_back("Edited");
    if (fields_.attachments) header.push_back("Attachments");
    write_row(header);
  }

  void write(const Message& m) override {
    std::vector<std::string> row;
    if (fields_.timestamps) row.push_back(format_timestamp(m.timestamp_ms));
    if (fields_.ids) row.push_back(m.id ? std::to_string(*m.id) : "");
    row.push_back(m.sender);
    row.push_back(m.text);
    if (fields_.replies) {
      row.push_back(m.reply_to ? std::to_string(*m.reply_to) : "");
      row.push_back(m.forwarded_from.value_or(""));
    }
    if (fields_.edited) row.push_back(m.edited_ms ? format_timestamp(*m.edited_ms) : "");
    if (fields_.attachments) row.push_back(join_attachments(m.attachments));
    write_row(row);
    ++written_;
  }

  void finish() override {
    out_.flush();
    check();
  }

  std::string escape(const std::string& field) const {
    if (field.find_first_of(std::string("\"\r\n") + delimiter_) == std::string::npos) {
      return field;
    }
    std::string out = "\"";
    for (char c : field) {
      if (c == '"') {
        out += "\"\"";
      } else {
        out.push_back(c);
      }
    }
    out.push_back('"');
    return out;
  }

 private:
  static std::string join_attachments(const std::vector<Attachment>& attachments) {
    std::string out;
    for (const auto& a : attachments) {
      if (!out.empty()) {
        out += "; ";
      }
      out += a.kind;
      if (!a.name.empty()) {
        out += ":" + a.name;
      }
    }
    return out;
  }

  void write_row(const std::vector<std::string>& fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
      if (i > 0) {
        out_ << delimiter_;
      }
      out_ << escape(fields[i]);
    }
    out_ << '\n';
    check();
  }

  char delimiter_;
};

// A single array; one element per line, or indented with `pretty`.
class JsonWriter : public MessageWriter {
 public:
  JsonWriter(std::ostream& out, FieldSelection fields, bool pretty = false)
      : MessageWriter(out, fields), pretty_(pretty) {}

  void begin() override {
    out_ << '[';
    check();
  }

  void write(const Message& m) override {
    out_ << (written_ == 0 ? "\n" : ",\n");
    if (pretty_) {
      std::string body = dump_json(message_to_json(m, fields_), 2);
      std::string indented = "  ";
      for (char c : body) {
        indented.push_back(c);
        if (c == '\n') {
          indented += "  ";
        }
      }
      out_ << indented;
    } else {
      out_ << dump_json(message_to_json(m, fields_));
    }
    check();
    ++written_;
  }

  void finish() override {
    out_ << (written_ == 0 ? "]\n" : "\n]\n");
    out_.flush();
    check();
  }

 private:
  bool pretty_;
};

class JsonlWriter : public MessageWriter {
 public:
  JsonlWriter(std::ostream& out, FieldSelection fields) : MessageWriter(out, fields) {}

  void begin() override {}

  void write(const Message& m) override {
    out_ << dump_json(message_to_json(m, fields_)) << '\n';
    check();
    ++written_;
  }

  void finish() override {
    out_.flush();
    check();
  }
};

struct WriterOptions {
  FieldSelection fields;
  bool pretty{false};
  char csv_delimiter{','};
};

inline std::unique_ptr<MessageWriter> make_writer(OutputFormat format, std::ostream& out, const WriterOptions& options) {
  switch (format) {
    case OutputFormat::kCsv:
      return std::make_unique<CsvWriter>(out, options.fields, options.csv_delimiter);
    case OutputFormat::kJson:
      return std::make_unique<JsonWriter>(out, options.fields, options.pretty);
    case OutputFormat::kJsonl:
    default:
      return std::make_unique<JsonlWriter>(out, options.fields);
  }
}

}  // namespace chatpack
