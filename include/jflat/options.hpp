#pragma once

#include <jflat/error.hpp>
#include <jflat/escape.hpp>
#include <jflat/render.hpp>

#include <string>
#include <utility>

namespace jflat {

enum class flatten_mode {
  normal,     // descend into every non-empty object and array
  keep_arrays // descend into objects only; arrays become list values
};

namespace detail {

inline bool is_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

inline std::string quote_char(char c) {
  std::string out(1, '\'');
  out.push_back(c);
  out.push_back('\'');
  return out;
}

} // namespace detail

// Flattening configuration. Setters validate and return *this so calls
// chain; a rejected setter throws config_error and changes nothing.
class flatten_options {
public:
  flatten_options() = default;

  flatten_mode mode() const noexcept { return mode_; }
  const escape_policy& policy() const noexcept { return policy_; }
  char separator() const noexcept { return separator_; }
  char left_bracket() const noexcept { return left_; }
  char right_bracket() const noexcept { return right_; }
  print_mode printing() const noexcept { return print_; }
  const render_function& renderer() const noexcept { return renderer_; }

  flatten_options& with_flatten_mode(flatten_mode mode) noexcept {
    mode_ = mode;
    return *this;
  }

  flatten_options& with_escape_policy(escape_policy policy) {
    policy_ = std::move(policy);
    return *this;
  }

  flatten_options& with_separator(char separator) {
    if (separator == '"' || detail::is_space(separator)) {
      throw config_error("separator contains illegal character " + detail::quote_char(separator));
    }
    if (separator == left_ || separator == right_) {
      throw config_error("separator " + detail::quote_char(separator) + " is already used in brackets");
    }
    separator_ = separator;
    return *this;
  }

  flatten_options& with_brackets(char left, char right) {
    if (left == right) throw config_error("both brackets cannot be the same");
    check_bracket("left", left);
    check_bracket("right", right);
    left_ = left;
    right_ = right;
    return *this;
  }

  flatten_options& with_print_mode(print_mode mode) noexcept {
    print_ = mode;
    return *this;
  }

  flatten_options& with_renderer(render_function renderer) {
    if (!renderer) throw config_error("renderer must be callable");
    renderer_ = std::move(renderer);
    return *this;
  }

private:
  void check_bracket(const char* which, char c) const {
    if (c == '"' || detail::is_space(c) || c == separator_) {
      throw config_error(std::string(which) + " bracket contains illegal character " + detail::quote_char(c));
    }
  }

  flatten_mode mode_{flatten_mode::normal};
  escape_policy policy_{};
  char separator_{'.'};
  char left_{'['};
  char right_{']'};
  print_mode print_{print_mode::minimal};
  render_function renderer_{[](std::string& out, const output_value& v, print_mode mode,
                               const escape_policy& policy) { render_json(out, v, mode, policy); }};
};

} // namespace jflat
