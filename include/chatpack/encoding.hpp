#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace chatpack {

namespace detail {

// Strict decoder step: rejects overlong forms, surrogates and code points past U+10FFFF.
// Returns the number of bytes consumed, 0 on an invalid sequence.
inline std::size_t decode_utf8_at(const std::string& s, std::size_t i, char32_t& cp) {
  const auto byte = [&](std::size_t k) { return static_cast<unsigned char>(s[k]); };
  const unsigned char b0 = byte(i);
  if (b0 < 0x80) {
    cp = b0;
    return 1;
  }
  std::size_t len = 0;
  char32_t min = 0;
  if ((b0 & 0xE0) == 0xC0) {
    len = 2;
    cp = b0 & 0x1F;
    min = 0x80;
  } else if ((b0 & 0xF0) == 0xE0) {
    len = 3;
    cp = b0 & 0x0F;
    min = 0x800;
  } else if ((b0 & 0xF8) == 0xF0) {
    len = 4;
    cp = b0 & 0x07;
    min = 0x10000;
  } else {
    return 0;
  }
  if (i + len > s.size()) {
    return 0;
  }
  for (std::size_t k = 1; k < len; ++k) {
    const unsigned char b = byte(i + k);
    if ((b & 0xC0) != 0x80) {
      return 0;
    }
    cp = (cp << 6) | (b & 0x3F);
  }
  if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    return 0;
  }
  return len;
}

// Windows-1252 bytes 0x80..0x9F that map outside Latin-1.
inline std::optional<unsigned char> cp1252_byte_for(char32_t cp) {
  switch (cp) {
    case 0x20AC: return 0x80;
    case 0x201A: return 0x82;
    case 0x0192: return 0x83;
    case 0x201E: return 0x84;
    case 0x2026: return 0x85;
    case 0x2020: return 0x86;
    case 0x2021: return 0x87;
    case 0x02C6: return 0x88;
    case 0x2030: return 0x89;
    case 0x0160: return 0x8A;
    case 0x2039: return 0x8B;
    case 0x0152: return 0x8C;
    case 0x017D: return 0x8E;
    case 0x2018: return 0x91;
    case 0x2019: return 0x92;
    case 0x201C: return 0x93;
    case 0x201D: return 0x94;
    case 0x2022: return 0x95;
    case 0x2013: return 0x96;
    case 0x2014: return 0x97;
    case 0x02DC: return 0x98;
    case 0x2122: return 0x99;
    case 0x0161: return 0x9A;
    case 0x203A: return 0x9B;
    case 0x0153: return 0x9C;
    case 0x017E: return 0x9E;
    case 0x0178: return 0x9F;
    default: return std::nullopt;
  }
}

// One reversal of "UTF-8 bytes read as Latin-1/Windows-1252, then re-encoded".
// nullopt when the text does not carry that signature.
inline std::optional<std::string> unmangle_once(const std::string& s) {
  std::string bytes;
  bytes.reserve(s.size());
  bool saw_high = false;
  std::size_t i = 0;
  while (i < s.size()) {
    char32_t cp = 0;
    const std::size_t n = decode_utf8_at(s, i, cp);
    if (n == 0) {
      return std::nullopt;
    }
    i += n;
    if (cp < 0x80) {
      bytes.push_back(static_cast<char>(cp));
      continue;
    }
    saw_high = true;
    if (cp <= 0xFF) {
      bytes.push_back(static_cast<char>(static_cast<unsigned char>(cp)));
    } else if (const auto b = cp1252_byte_for(cp)) {
      bytes.push_back(static_cast<char>(*b));
    } else {
      return std::nullopt;
    }
  }
  if (!saw_high) {
    return std::nullopt;
  }
  // The recovered bytes must themselves be UTF-8 containing a multi-byte sequence.
  std::size_t j = 0;
  bool multibyte = false;
  while (j < bytes.size()) {
    char32_t cp = 0;
    const std::size_t n = decode_utf8_at(bytes, j, cp);
    if (n == 0) {
      return std::nullopt;
    }
    multibyte = multibyte || n > 1;
    j += n;
  }
  if (!multibyte) {
    return std::nullopt;
  }
  return bytes;
}

}  // namespace detail

inline bool looks_like_mojibake(const std::string& text) { return detail::unmangle_once(text).has_value(); }

// Undoes (possibly repeated) Latin-1/Windows-1252 double encoding. Text without
// the signature comes back unchanged; the result is a fixed point, so repeated
// calls are no-ops. Each pass strictly shrinks the string, which bounds the loop.
inline std::string repair_mojibake(const std::string& text) {
  std::string current = text;
  while (auto next = detail::unmangle_once(current)) {
    current = std::move(*next);
  }
  return current;
}

}  // namespace chatpack
