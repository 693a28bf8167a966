#pragma once

#include <optional>
#include <string>

#include "chatpack/common.hpp"
#include "chatpack/errors.hpp"
#include "chatpack/input.hpp"

namespace chatpack {

// Incremental reader for the message array of a JSON export. It walks the
// document byte by byte and hands out one raw array element at a time, so
// only the element currently being read is resident.
//
// The array is either the value of top-level key `key`, or the document root
// when `allow_root_array` is set. Structural problems throw FileFatalError,
// including anything malformed after the array closes.
class JsonElementReader {
 public:
  JsonElementReader(InputCursor& in, std::string key, bool allow_root_array)
      : in_(in), key_(std::move(key)), allow_root_array_(allow_root_array) {}

  void open() {
    in_.skip_bom();
    skip_ws();
    const int c = in_.peek();
    if (c == InputCursor::kEof) {
      throw FileFatalError("document is empty");
    }
    if (c == '[') {
      if (!allow_root_array_) {
        throw FileFatalError("expected a JSON object with a \"" + key_ + "\" array, found an array");
      }
      in_.get();
      in_object_ = false;
      return;
    }
    if (c != '{') {
      throw FileFatalError("not a JSON document");
    }
    in_.get();

    for (;;) {
      skip_ws();
      if (in_.peek() == '}') {
        break;
      }
      if (in_.peek() != '"') {
        fail("expected an object key");
      }
      std::string name;
      read_string(&name);
      skip_ws();
      expect(':');
      skip_ws();
      if (name == key_) {
        if (in_.peek() != '[') {
          throw FileFatalError("\"" + key_ + "\" is not an array");
        }
        in_.get();
        return;
      }
      skip_value();
      skip_ws();
      if (in_.peek() == ',') {
        in_.get();
        continue;
      }
      if (in_.peek() == '}') {
        break;
      }
      fail("expected ',' or '}'");
    }
    throw FileFatalError("no \"" + key_ + "\" array in document");
  }

  // Raw text of the next element, or nullopt after the closing bracket.
  std::optional<std::string> next_element() {
    if (done_) {
      return std::nullopt;
    }
    skip_ws();
    if (in_.peek() == ']') {
      in_.get();
      close_document();
      return std::nullopt;
    }
    std::string raw;
    capture_value(&raw);
    ++index_;

    skip_ws();
    const int c = in_.peek();
    if (c == ',') {
      in_.get();
      skip_ws();
      if (in_.peek() == ']') {
        fail("trailing ',' in array");
      }
      return raw;
    }
    if (c == ']') {
      in_.get();
      close_document();
      return raw;
    }
    if (c == InputCursor::kEof) {
      throw FileFatalError("document is truncated inside the \"" + key_ + "\" array");
    }
    fail("expected ',' or ']' after array element");
    return std::nullopt;
  }

  std::size_t index() const { return index_; }

 private:
  [[noreturn]] void fail(const std::string& what) const {
    throw FileFatalError("malformed JSON at byte " + std::to_string(in_.offset()) + ": " + what);
  }

  // Reads past the closing bracket: the remaining members of the enclosing
  // object, its '}', then nothing but whitespace.
  void close_document() {
    done_ = true;
    skip_ws();
    if (in_object_) {
      for (;;) {
        const int c = in_.peek();
        if (c == '}') {
          in_.get();
          break;
        }
        if (c == InputCursor::kEof) {
          throw FileFatalError("document is truncated after the \"" + key_ + "\" array");
        }
        if (c != ',') {
          fail("expected ',' or '}'");
        }
        in_.get();
        skip_ws();
        if (in_.peek() != '"') {
          fail("expected an object key");
        }
        read_string(nullptr);
        skip_ws();
        expect(':');
        skip_ws();
        skip_value();
        skip_ws();
      }
      skip_ws();
    }
    if (in_.peek() != InputCursor::kEof) {
      fail("unexpected data after the end of the document");
    }
  }

  int take() {
    const int c = in_.get();
    if (c == InputCursor::kEof) {
      throw FileFatalError("document is truncated at byte " + std::to_string(in_.offset()));
    }
    return c;
  }

  void expect(char want) {
    if (in_.peek() != static_cast<unsigned char>(want)) {
      fail(std::string("expected '") + want + "'");
    }
    in_.get();
  }

  void skip_ws() {
    for (int c = in_.peek(); c == ' ' || c == '\t' || c == '\n' || c == '\r'; c = in_.peek()) {
      in_.get();
    }
  }

  // Consumes a string literal. With `decoded`, stores its unescaped value
  // (keys only, so escapes beyond the basic set are kept verbatim).
  void read_string(std::string* decoded, std::string* raw = nullptr) {
    take();  // opening quote
    if (raw) raw->push_back('"');
    for (;;) {
      const int c = take();
      if (raw) raw->push_back(static_cast<char>(c));
      if (c == '"') {
        return;
      }
      if (c == '\\') {
        const int e = take();
        if (raw) raw->push_back(static_cast<char>(e));
        if (decoded) {
          switch (e) {
            case 'n': decoded->push_back('\n'); break;
            case 't': decoded->push_back('\t'); break;
            case 'r': decoded->push_back('\r'); break;
            case 'b': decoded->push_back('\b'); break;
            case 'f': decoded->push_back('\f'); break;
            case 'u':
              decoded->append("\\u");
              break;
            default:
              decoded->push_back(static_cast<char>(e));
          }
        }
        continue;
      }
      if (decoded) decoded->push_back(static_cast<char>(c));
    }
  }

  // Copies (raw != nullptr) or skips one complete JSON value. Scalars end at
  // the first structural byte; their validity is left to json::parse.
  void capture_value(std::string* raw) {
    const int first = in_.peek();
    if (first == InputCursor::kEof) {
      throw FileFatalError("document is truncated at byte " + std::to_string(in_.offset()));
    }
    if (first == '"') {
      read_string(nullptr, raw);
      return;
    }
    if (first != '{' && first != '[') {
      for (int c = in_.peek(); c != InputCursor::kEof && c != ',' && c != ']' && c != '}' && c != ' ' &&
                               c != '\n' && c != '\r' && c != '\t';
           c = in_.peek()) {
        if (raw) raw->push_back(static_cast<char>(c));
        in_.get();
      }
      return;
    }

    std::string stack;
    for (;;) {
      const int c = in_.peek();
      if (c == '"') {
        read_string(nullptr, raw);
        continue;
      }
      take();
      if (raw) raw->push_back(static_cast<char>(c));
      if (c == '{' || c == '[') {
        stack.push_back(c == '{' ? '}' : ']');
      } else if (c == '}' || c == ']') {
        if (stack.empty() || stack.back() != c) {
          fail("mismatched bracket");
        }
        stack.pop_back();
        if (stack.empty()) {
          return;
        }
      }
    }
  }

  // Values outside the message array are never converted, so they are
  // validated here instead of by the element parser.
  void skip_value() {
    std::string raw;
    capture_value(&raw);
    if (!json::accept(raw)) {
      fail("invalid JSON value");
    }
  }

  InputCursor& in_;
  std::string key_;
  bool allow_root_array_;
  bool in_object_{true};
  bool done_{false};
  std::size_t index_{0};
};

// DOM counterpart used when the whole document is already in memory.
inline const json& locate_message_array(const json& root, const std::string& key, bool allow_root_array) {
  if (root.is_array()) {
    if (!allow_root_array) {
      throw FileFatalError("expected a JSON object with a \"" + key + "\" array, found an array");
    }
    return root;
  }
  if (!root.is_object()) {
    throw FileFatalError("not a JSON document");
  }
  const auto it = root.find(key);
  if (it == root.end()) {
    throw FileFatalError("no \"" + key + "\" array in document");
  }
  if (!it->is_array()) {
    throw FileFatalError("\"" + key + "\" is not an array");
  }
  return *it;
}

inline json parse_document(const std::string& text) {
  if (trim(text).empty()) {
    throw FileFatalError("document is empty");
  }
  try {
    return json::parse(text);
  } catch (const json::parse_error& e) {
    throw FileFatalError(std::string("malformed JSON: ") + e.what());
  }
}

}  // namespace chatpack
