#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jflat {

namespace detail {

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

// JSON number grammar:
// -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
// Advances `i` past the token on success.
inline bool scan_number(const char* buf, std::size_t size, std::size_t& i) noexcept {
  if (i >= size) return false;

  if (buf[i] == '-') {
    ++i;
    if (i >= size) return false;
  }

  if (buf[i] == '0') {
    ++i;
    if (i < size && is_digit(buf[i])) return false;
  } else {
    if (buf[i] < '1' || buf[i] > '9') return false;
    ++i;
    while (i < size && is_digit(buf[i])) ++i;
  }

  if (i < size && buf[i] == '.') {
    ++i;
    if (i >= size || !is_digit(buf[i])) return false;
    while (i < size && is_digit(buf[i])) ++i;
  }

  if (i < size && (buf[i] == 'e' || buf[i] == 'E')) {
    ++i;
    if (i >= size) return false;
    if (buf[i] == '+' || buf[i] == '-') {
      ++i;
      if (i >= size) return false;
    }
    if (!is_digit(buf[i])) return false;
    while (i < size && is_digit(buf[i])) ++i;
  }
  return true;
}

inline bool is_number_token(std::string_view token) noexcept {
  std::size_t i = 0;
  return scan_number(token.data(), token.size(), i) && i == token.size();
}

// Largest exponent magnitude a number token may carry.
inline constexpr std::int64_t max_exponent = 999999999;

// Checks the exponent of a well-formed token; leading zeros do not count.
inline bool exponent_in_range(std::string_view token) noexcept {
  std::size_t i = token.find_first_of("eE");
  if (i == std::string_view::npos) return true;
  ++i;
  if (i < token.size() && (token[i] == '+' || token[i] == '-')) ++i;
  std::int64_t exp = 0;
  for (; i < token.size(); ++i) {
    exp = exp * 10 + (token[i] - '0');
    if (exp > max_exponent) return false;
  }
  return true;
}

// Numbers are kept as the source token so nothing is lost before coercion.
struct number_token {
  std::string raw;

  friend bool operator==(const number_token& a, const number_token& b) { return a.raw == b.raw; }
};

} // namespace detail

// Parsed JSON tree. Objects keep members in source order.
class value {
public:
  using array = std::vector<value>;
  using object = std::vector<std::pair<std::string, value>>;

  enum class kind { null, boolean, number, string, array, object };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  value(bool b) : data_(b) {}
  value(std::string s) : data_(std::move(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(array a) : data_(std::move(a)) {}
  value(object o) : data_(std::move(o)) {}

  static value number(std::string_view token) {
    if (!detail::is_number_token(token)) {
      throw std::invalid_argument("jflat: not a JSON number: " + std::string(token));
    }
    if (!detail::exponent_in_range(token)) {
      throw std::invalid_argument("jflat: number exponent out of range: " + std::string(token));
    }
    value v;
    v.data_ = detail::number_token{std::string(token)};
    return v;
  }

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::null;
      case 1: return kind::boolean;
      case 2: return kind::number;
      case 3: return kind::string;
      case 4: return kind::array;
      case 5: return kind::object;
      default: return kind::null;
    }
  }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_number() const noexcept { return std::holds_alternative<detail::number_token>(data_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<array>(data_); }
  bool is_object() const noexcept { return std::holds_alternative<object>(data_); }

  bool as_bool() const { return std::get<bool>(data_); }
  const std::string& number_text() const { return std::get<detail::number_token>(data_).raw; }
  const std::string& as_string() const { return std::get<std::string>(data_); }
  const array& as_array() const { return std::get<array>(data_); }
  const object& as_object() const { return std::get<object>(data_); }

  array& as_array() { return std::get<array>(data_); }
  object& as_object() { return std::get<object>(data_); }
  std::string& as_string() { return std::get<std::string>(data_); }

  // Number of members or elements; 0 for scalars.
  std::size_t size() const noexcept {
    if (const auto* a = std::get_if<array>(&data_)) return a->size();
    if (const auto* o = std::get_if<object>(&data_)) return o->size();
    return 0;
  }

  const value* find(std::string_view key) const noexcept {
    if (!is_object()) return nullptr;
    const auto& o = std::get<object>(data_);
    for (const auto& kv : o) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  value* find(std::string_view key) noexcept {
    if (!is_object()) return nullptr;
    auto& o = std::get<object>(data_);
    for (auto& kv : o) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  // Structural equality: member order matters, numbers compare by token.
  friend bool operator==(const value& a, const value& b) { return a.data_ == b.data_; }
  friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
  // index: 0 null, 1 bool, 2 number, 3 string, 4 array, 5 object
  std::variant<std::monostate, bool, detail::number_token, std::string, array, object> data_;

  friend struct parser;
};

} // namespace jflat
