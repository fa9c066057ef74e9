#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jflat {

// Returns the escaped form of a raw string, ready to sit between two quotes.
using string_translator = std::function<std::string(std::string_view)>;

namespace detail {

inline bool needs_json_escape(unsigned char uc) noexcept {
  return uc == '"' || uc == '\\' || uc <= 0x1F;
}

inline std::size_t find_first_escape(std::string_view s) noexcept {
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (needs_json_escape(static_cast<unsigned char>(s[i]))) return i;
  }
  return s.size();
}

inline void append_u4(std::string& out, std::uint32_t unit) {
  static constexpr char hex[] = "0123456789ABCDEF";
  out.append("\\u", 2);
  out.push_back(hex[(unit >> 12) & 0xF]);
  out.push_back(hex[(unit >> 8) & 0xF]);
  out.push_back(hex[(unit >> 4) & 0xF]);
  out.push_back(hex[unit & 0xF]);
}

// Short escape for `c`, or nullptr when `c` has none.
inline const char* short_escape(char c) noexcept {
  switch (c) {
    case '"': return "\\\"";
    case '\\': return "\\\\";
    case '\b': return "\\b";
    case '\f': return "\\f";
    case '\n': return "\\n";
    case '\r': return "\\r";
    case '\t': return "\\t";
    default: return nullptr;
  }
}

// Quote, backslash and control characters; everything else is copied.
inline void escape_json_to(std::string& out, std::string_view s) {
  const char* data = s.data();
  const std::size_t n = s.size();
  const std::size_t first = find_first_escape(s);
  if (first == n) {
    out.append(data, n);
    return;
  }
  if (first > 0) out.append(data, first);

  std::size_t chunk_begin = first;
  for (std::size_t i = first; i < n; ++i) {
    const unsigned char uc = static_cast<unsigned char>(data[i]);
    if (!needs_json_escape(uc)) continue;

    if (i > chunk_begin) out.append(data + chunk_begin, i - chunk_begin);
    if (const char* esc = short_escape(data[i])) {
      out.append(esc, 2);
    } else {
      append_u4(out, uc);
    }
    chunk_begin = i + 1;
  }
  if (n > chunk_begin) out.append(data + chunk_begin, n - chunk_begin);
}

// Decodes one UTF-8 sequence at `i`. Returns false (and consumes one byte)
// when the bytes there are not well-formed UTF-8.
inline bool next_code_point(std::string_view s, std::size_t& i, std::uint32_t& cp) noexcept {
  const unsigned char b0 = static_cast<unsigned char>(s[i]);
  std::size_t len = 0;
  std::uint32_t min = 0;
  if (b0 < 0x80u) {
    cp = b0;
    ++i;
    return true;
  } else if ((b0 & 0xE0u) == 0xC0u) {
    len = 2;
    cp = b0 & 0x1Fu;
    min = 0x80u;
  } else if ((b0 & 0xF0u) == 0xE0u) {
    len = 3;
    cp = b0 & 0x0Fu;
    min = 0x800u;
  } else if ((b0 & 0xF8u) == 0xF0u) {
    len = 4;
    cp = b0 & 0x07u;
    min = 0x10000u;
  } else {
    cp = b0;
    ++i;
    return false;
  }

  if (i + len > s.size()) {
    cp = b0;
    ++i;
    return false;
  }
  for (std::size_t k = 1; k < len; ++k) {
    const unsigned char b = static_cast<unsigned char>(s[i + k]);
    if ((b & 0xC0u) != 0x80u) {
      cp = b0;
      ++i;
      return false;
    }
    cp = (cp << 6) | (b & 0x3Fu);
  }
  if (cp < min || cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu)) {
    cp = b0;
    ++i;
    return false;
  }
  i += len;
  return true;
}

// JSON escaping plus `\/` and `\uXXXX` for every non-ASCII code point.
// Bytes that are not valid UTF-8 come out as `\u00XX`.
inline void escape_ascii_to(std::string& out, std::string_view s) {
  std::size_t i = 0;
  while (i < s.size()) {
    const char c = s[i];
    const unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 0x80u) {
      if (const char* esc = short_escape(c)) {
        out.append(esc, 2);
      } else if (c == '/') {
        out.append("\\/", 2);
      } else if (uc <= 0x1F) {
        append_u4(out, uc);
      } else {
        out.push_back(c);
      }
      ++i;
      continue;
    }

    std::uint32_t cp = 0;
    if (!next_code_point(s, i, cp) || cp <= 0xFFFFu) {
      append_u4(out, cp);
      continue;
    }
    cp -= 0x10000u;
    append_u4(out, 0xD800u + (cp >> 10));
    append_u4(out, 0xDC00u + (cp & 0x3FFu));
  }
}

} // namespace detail

// Pluggable string escaping used for member names in keys and for string
// values at render time.
class escape_policy {
public:
  // Same as normal().
  escape_policy() : translate_(&escape_policy::translate_normal) {}

  explicit escape_policy(string_translator translate) : translate_(std::move(translate)) {
    if (!translate_) throw std::invalid_argument("jflat: escape policy needs a translator");
  }

  // Escapes quote, backslash and control characters; keeps `/` and non-ASCII text.
  static escape_policy normal() { return escape_policy(&escape_policy::translate_normal); }

  // Additionally escapes `/` and every non-ASCII code point.
  static escape_policy all_unicodes() { return escape_policy(&escape_policy::translate_all_unicodes); }

  std::string operator()(std::string_view s) const { return translate_(s); }

  void translate_to(std::string& out, std::string_view s) const { out += translate_(s); }

private:
  static std::string translate_normal(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    detail::escape_json_to(out, s);
    return out;
  }

  static std::string translate_all_unicodes(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    detail::escape_ascii_to(out, s);
    return out;
  }

  string_translator translate_;
};

} // namespace jflat
