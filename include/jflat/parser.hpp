#pragma once

#include <jflat/error.hpp>
#include <jflat/value.hpp>

#include <algorithm>
#include <cstdint>
#include <istream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jflat {

namespace detail {

// 1-based line and column of byte `pos`.
inline void locate(std::string_view s, std::size_t pos, std::size_t& line, std::size_t& col) {
  const std::string_view head = s.substr(0, std::min(pos, s.size()));
  line = 1 + static_cast<std::size_t>(std::count(head.begin(), head.end(), '\n'));
  const std::size_t nl = head.rfind('\n');
  col = (nl == std::string_view::npos) ? head.size() + 1 : head.size() - nl;
}

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline void skip_ws(std::string_view s, std::size_t& i) noexcept {
  while (i < s.size() && is_ws(s[i])) ++i;
}

inline int hex_digit(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Continuation bytes are filled from the back, then the lead byte takes
// whatever bits are left.
inline void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80u) {
    out.push_back(static_cast<char>(cp));
    return;
  }
  static const std::uint32_t lead[] = {0u, 0u, 0xC0u, 0xE0u, 0xF0u};
  const std::size_t n = cp < 0x800u ? 2 : (cp < 0x10000u ? 3 : 4);
  char buf[4];
  for (std::size_t k = n - 1; k > 0; --k) {
    buf[k] = static_cast<char>(0x80u | (cp & 0x3Fu));
    cp >>= 6;
  }
  buf[0] = static_cast<char>(lead[n] | cp);
  out.append(buf, n);
}

} // namespace detail

struct parse_options {
  std::size_t max_depth{512};
  bool require_eof{true};
};

struct parse_result {
  value val;
  error err;
};

// Strict JSON parser. Containers are tracked on an explicit stack, so input
// depth is limited by `max_depth` only, never by the native call stack.
struct parser {
  std::string_view s;
  std::size_t i{0};
  parse_options opt;

  struct frame {
    value container;
    std::string key; // pending member name while `container` is an object
  };

  parse_result run() {
    parse_result r;
    std::vector<frame> stack;
    value cur;

    detail::skip_ws(s, i);
    while (true) {
      if (i >= s.size()) {
        fail(r.err, error_code::unexpected_eof);
        return r;
      }

      const char c = s[i];
      if (c == '[' || c == '{') {
        if (stack.size() >= opt.max_depth) {
          fail(r.err, error_code::nesting_too_deep);
          return r;
        }
        ++i;
        detail::skip_ws(s, i);
        const char close = (c == '[') ? ']' : '}';
        if (i < s.size() && s[i] == close) {
          ++i;
          cur = (c == '[') ? value(value::array{}) : value(value::object{});
        } else {
          stack.push_back(frame{(c == '[') ? value(value::array{}) : value(value::object{}), {}});
          if (c == '{' && !parse_member_name(stack.back().key, r.err)) return r;
          detail::skip_ws(s, i);
          continue;
        }
      } else if (!parse_scalar(cur, r.err)) {
        return r;
      }

      // `cur` is complete: attach it, then close every container that ends here.
      bool next_value = false;
      while (!next_value) {
        if (stack.empty()) {
          r.val = std::move(cur);
          detail::skip_ws(s, i);
          if (opt.require_eof && i != s.size()) {
            fail(r.err, error_code::trailing_characters);
          }
          return r;
        }

        frame& top = stack.back();
        const bool in_object = top.container.is_object();
        if (in_object) {
          top.container.as_object().emplace_back(std::move(top.key), std::move(cur));
        } else {
          top.container.as_array().emplace_back(std::move(cur));
        }

        detail::skip_ws(s, i);
        if (i >= s.size()) {
          fail(r.err, error_code::unexpected_eof);
          return r;
        }
        const char d = s[i++];
        if (d == ',') {
          detail::skip_ws(s, i);
          if (in_object && !parse_member_name(top.key, r.err)) return r;
          detail::skip_ws(s, i);
          next_value = true;
        } else if ((d == ']' && !in_object) || (d == '}' && in_object)) {
          cur = std::move(top.container);
          stack.pop_back();
        } else {
          fail(r.err, error_code::expected_comma_or_end, i - 1);
          return r;
        }
      }
    }
  }

  // Records the first error only; always returns false.
  bool fail(error& e, error_code code, std::size_t at) {
    if (e) return false;
    e.code = code;
    e.offset = at;
    detail::locate(s, at, e.line, e.column);
    return false;
  }
  bool fail(error& e, error_code code) { return fail(e, code, i); }

  // "name" ws ':'
  bool parse_member_name(std::string& key, error& e) {
    if (i >= s.size()) return fail(e, error_code::unexpected_eof);
    if (s[i] != '"') return fail(e, error_code::expected_key_string);
    if (!parse_string(key, e)) return false;

    detail::skip_ws(s, i);
    if (i >= s.size()) return fail(e, error_code::unexpected_eof);
    if (s[i] != ':') return fail(e, error_code::expected_colon);
    ++i;
    return true;
  }

  bool parse_scalar(value& out, error& e) {
    const char c = s[i];
    switch (c) {
      case 'n': return parse_literal("null", value(nullptr), out, e);
      case 't': return parse_literal("true", value(true), out, e);
      case 'f': return parse_literal("false", value(false), out, e);
      case '"': {
        std::string str;
        if (!parse_string(str, e)) return false;
        out = value(std::move(str));
        return true;
      }
      default: break;
    }
    if (c != '-' && !detail::is_digit(c)) return fail(e, error_code::invalid_value);

    const std::size_t start = i;
    if (!detail::scan_number(s.data(), s.size(), i)) return fail(e, error_code::invalid_number, start);
    const std::string_view token = s.substr(start, i - start);
    if (!detail::exponent_in_range(token)) return fail(e, error_code::invalid_number, start);
    value v;
    v.data_ = detail::number_token{std::string(token)};
    out = std::move(v);
    return true;
  }

  bool parse_literal(std::string_view word, value v, value& out, error& e) {
    const std::string_view got = s.substr(i, word.size());
    if (got != word) {
      return fail(e, got.size() < word.size() ? error_code::unexpected_eof : error_code::invalid_value);
    }
    i += word.size();
    out = std::move(v);
    return true;
  }

  // Copies unescaped runs in one go; stops on the closing quote, a backslash
  // or a raw control character.
  bool parse_string(std::string& out, error& e) {
    const std::size_t open = i++;
    out.clear();
    while (true) {
      const std::size_t run = i;
      while (i < s.size() && s[i] != '"' && s[i] != '\\' && static_cast<unsigned char>(s[i]) >= 0x20) ++i;
      out.append(s.data() + run, i - run);
      if (i >= s.size()) return fail(e, error_code::unexpected_eof, open);

      const char c = s[i++];
      if (c == '"') return true;
      if (c != '\\') return fail(e, error_code::invalid_string, i - 1);
      if (i >= s.size()) return fail(e, error_code::unexpected_eof, open);
      if (!parse_escape(out, e)) return false;
    }
  }

  bool parse_escape(std::string& out, error& e) {
    const char esc = s[i++];
    switch (esc) {
      case '"':
      case '\\':
      case '/': out.push_back(esc); return true;
      case 'b': out.push_back('\b'); return true;
      case 'f': out.push_back('\f'); return true;
      case 'n': out.push_back('\n'); return true;
      case 'r': out.push_back('\r'); return true;
      case 't': out.push_back('\t'); return true;
      case 'u': return parse_unicode_escape(out, e);
      default: return fail(e, error_code::invalid_escape, i - 1);
    }
  }

  // Four hex digits; `i` only moves on success.
  bool read_hex4(std::uint32_t& cp) noexcept {
    if (s.size() - i < 4) return false;
    std::uint32_t v = 0;
    for (std::size_t k = 0; k < 4; ++k) {
      const int h = detail::hex_digit(s[i + k]);
      if (h < 0) return false;
      v = v * 16u + static_cast<std::uint32_t>(h);
    }
    cp = v;
    i += 4;
    return true;
  }

  // A high surrogate must be followed by an escaped low surrogate.
  bool parse_unicode_escape(std::string& out, error& e) {
    std::uint32_t cp = 0;
    if (!read_hex4(cp)) return fail(e, error_code::invalid_unicode_escape);
    if (cp >= 0xDC00u && cp <= 0xDFFFu) return fail(e, error_code::invalid_utf16_surrogate);
    if (cp >= 0xD800u && cp <= 0xDBFFu) {
      if (s.substr(i, 2) != "\\u") return fail(e, error_code::invalid_utf16_surrogate);
      i += 2;
      std::uint32_t low = 0;
      if (!read_hex4(low)) return fail(e, error_code::invalid_unicode_escape);
      if (low < 0xDC00u || low > 0xDFFFu) return fail(e, error_code::invalid_utf16_surrogate);
      cp = 0x10000u + ((cp - 0xD800u) << 10) + (low - 0xDC00u);
    }
    detail::append_utf8(out, cp);
    return true;
  }
};

inline parse_result parse(std::string_view json, parse_options opt = {}) {
  parser p;
  p.s = json;
  p.opt = opt;
  return p.run();
}

inline value parse_or_throw(std::string_view json, parse_options opt = {}) {
  auto r = parse(json, opt);
  if (r.err) throw parse_error(r.err);
  return std::move(r.val);
}

// Reads the remainder of `in`. Throws io_error when the stream fails.
inline std::string read_all(std::istream& in) {
  if (!in) throw io_error("source stream is not readable");
  std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) throw io_error("failed to read source stream");
  return text;
}

inline parse_result parse_stream(std::istream& in, parse_options opt = {}) {
  const std::string text = read_all(in);
  return parse(text, opt);
}

} // namespace jflat
