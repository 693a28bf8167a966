#pragma once

#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "chatpack/json_stream.hpp"
#include "chatpack/message.hpp"

namespace chatpack {

struct ParserOptions {
  bool include_system{false};  // keep service/system notices as kService records
};

// Pull-based, finite, single-pass sequence of parser output. Restarting means
// opening a new source over the input.
class RecordSource {
 public:
  virtual ~RecordSource() = default;
  virtual std::optional<Record> next() = 0;
};

// Pull-based sequence of accepted messages; the shape every pipeline stage
// consumes and produces.
class MessageSource {
 public:
  virtual ~MessageSource() = default;
  virtual std::optional<Message> next() = 0;
};

class VectorSource : public MessageSource {
 public:
  explicit VectorSource(std::vector<Message> messages) : messages_(std::move(messages)) {}

  std::optional<Message> next() override {
    if (pos_ >= messages_.size()) {
      return std::nullopt;
    }
    return std::move(messages_[pos_++]);
  }

 private:
  std::vector<Message> messages_;
  std::size_t pos_{0};
};

inline std::vector<Message> drain(MessageSource& source) {
  std::vector<Message> out;
  while (auto m = source.next()) {
    out.push_back(std::move(*m));
  }
  return out;
}

// Runs a stream-based source over an in-memory copy of the input.
class BufferedSource : public RecordSource {
 public:
  template <typename Open>
  BufferedSource(std::string text, Open open)
      : stream_(std::make_unique<std::istringstream>(std::move(text))), inner_(open(*stream_)) {}

  std::optional<Record> next() override { return inner_->next(); }

 private:
  std::unique_ptr<std::istringstream> stream_;
  std::unique_ptr<RecordSource> inner_;
};

// Hands out consecutive source ordinals and stamps them on produced records.
class OrdinalCounter {
 public:
  void stamp(Record& record) {
    if (auto* m = std::get_if<Message>(&record)) {
      m->span = SourceSpan{next_, next_};
    }
    ++next_;
  }

 private:
  std::uint64_t next_{0};
};

// Converts one JSON array element into a record; nullopt drops it silently.
using ElementConverter = std::function<std::optional<Record>(const json& element, std::size_t index)>;

// Type mismatches inside one element reject that element only.
inline std::optional<Record> convert_element(const ElementConverter& convert, const json& element,
                                             std::size_t index) {
  try {
    return convert(element, index);
  } catch (const json::exception& e) {
    return Record{ParseError{index, e.what()}};
  }
}

class JsonStreamSource : public RecordSource {
 public:
  JsonStreamSource(std::istream& in, const std::string& key, bool allow_root_array, ElementConverter convert)
      : JsonStreamSource(InputCursor(in), key, allow_root_array, std::move(convert)) {}

  // Takes over a cursor that may already hold sniffed bytes.
  JsonStreamSource(InputCursor cursor, const std::string& key, bool allow_root_array, ElementConverter convert)
      : cursor_(std::move(cursor)), reader_(cursor_, key, allow_root_array), convert_(std::move(convert)) {
    reader_.open();
  }

  std::optional<Record> next() override {
    while (auto raw = reader_.next_element()) {
      json element;
      try {
        element = json::parse(*raw);
      } catch (const json::parse_error& e) {
        throw FileFatalError("malformed JSON in message " + std::to_string(reader_.index()) + ": " + e.what());
      }
      auto record = convert_element(convert_, element, reader_.index());
      if (record) {
        ordinals_.stamp(*record);
        return record;
      }
    }
    return std::nullopt;
  }

 private:
  InputCursor cursor_;
  JsonElementReader reader_;
  ElementConverter convert_;
  OrdinalCounter ordinals_;
};

class JsonDocumentSource : public RecordSource {
 public:
  JsonDocumentSource(const std::string& text, const std::string& key, bool allow_root_array,
                     ElementConverter convert)
      : root_(parse_document(text)),
        elements_(&locate_message_array(root_, key, allow_root_array)),
        convert_(std::move(convert)) {}

  std::optional<Record> next() override {
    while (pos_ < elements_->size()) {
      const std::size_t index = pos_ + 1;
      auto record = convert_element(convert_, (*elements_)[pos_++], index);
      if (record) {
        ordinals_.stamp(*record);
        return record;
      }
    }
    return std::nullopt;
  }

 private:
  json root_;
  const json* elements_;
  ElementConverter convert_;
  OrdinalCounter ordinals_;
  std::size_t pos_{0};
};

// Small helpers shared by the JSON converters.
namespace detail {

inline std::string json_string(const json& obj, const char* key) {
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

// Accepts non-negative integers and all-digit strings (Discord snowflakes).
inline std::optional<std::uint64_t> json_u64(const json& v) {
  if (v.is_number_unsigned()) {
    return v.get<std::uint64_t>();
  }
  if (v.is_number_integer()) {
    const auto i = v.get<std::int64_t>();
    if (i >= 0) {
      return static_cast<std::uint64_t>(i);
    }
    return std::nullopt;
  }
  if (v.is_string()) {
    return parse_u64(v.get<std::string>());
  }
  return std::nullopt;
}

inline std::optional<std::uint64_t> json_u64(const json& obj, const char* key) {
  const auto it = obj.find(key);
  if (it == obj.end()) {
    return std::nullopt;
  }
  return json_u64(*it);
}

inline std::string file_name_of(const std::string& path) {
  const auto slash = path.find_last_of("/\\");
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

}  // namespace detail

}  // namespace chatpack
