#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace jflat {

enum class error_code {
  ok = 0,
  unexpected_eof,
  invalid_value,
  invalid_number,
  invalid_string,
  invalid_escape,
  invalid_unicode_escape,
  invalid_utf16_surrogate,
  expected_colon,
  expected_comma_or_end,
  expected_key_string,
  trailing_characters,
  nesting_too_deep
};

struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
};

inline const char* to_string(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::unexpected_eof: return "unexpected end of input";
    case error_code::invalid_value: return "invalid value";
    case error_code::invalid_number: return "invalid number";
    case error_code::invalid_string: return "invalid string";
    case error_code::invalid_escape: return "invalid escape";
    case error_code::invalid_unicode_escape: return "invalid unicode escape";
    case error_code::invalid_utf16_surrogate: return "invalid utf-16 surrogate";
    case error_code::expected_colon: return "expected ':'";
    case error_code::expected_comma_or_end: return "expected ',' or end of container";
    case error_code::expected_key_string: return "expected member name";
    case error_code::trailing_characters: return "trailing characters";
    case error_code::nesting_too_deep: return "nesting too deep";
  }
  return "unknown error";
}

inline std::string describe(const error& e) {
  std::string out = to_string(e.code);
  out += " at line ";
  out += std::to_string(e.line);
  out += ", column ";
  out += std::to_string(e.column);
  return out;
}

// Malformed JSON input. The instance that raised it holds no partial result.
class parse_error : public std::runtime_error {
public:
  explicit parse_error(const error& e)
      : std::runtime_error("jflat: parse failed: " + describe(e)), err_(e) {}

  const error& err() const noexcept { return err_; }

private:
  error err_;
};

// Separator/bracket configuration rejected by a setter.
class config_error : public std::invalid_argument {
public:
  explicit config_error(const std::string& what) : std::invalid_argument("jflat: " + what) {}
};

// Reading a source stream failed.
class io_error : public std::runtime_error {
public:
  explicit io_error(const std::string& what) : std::runtime_error("jflat: " + what) {}
};

} // namespace jflat
