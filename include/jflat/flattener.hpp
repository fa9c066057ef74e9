#pragma once

#include <jflat/error.hpp>
#include <jflat/flatten.hpp>
#include <jflat/options.hpp>
#include <jflat/output.hpp>
#include <jflat/parser.hpp>
#include <jflat/render.hpp>
#include <jflat/value.hpp>

#include <istream>
#include <optional>
#include <string>
#include <utility>

namespace jflat {

// Fluent, stateful front end over flatten_as_map()/flatten().
//
// The source is parsed in the constructor, or on first use for lazy()
// instances. The flattened map is computed once and cached; every setter
// drops the cache. Not safe for concurrent use.
class flattener {
public:
  explicit flattener(std::string json, parse_options popt = {}) : text_(std::move(json)), popt_(popt) {
    source();
  }

  // `in` is read to the end here.
  explicit flattener(std::istream& in, parse_options popt = {}) : in_(&in), popt_(popt) { source(); }

  // Defers parsing (and its errors) to the first call that needs the source.
  static flattener lazy(std::string json, parse_options popt = {}) {
    flattener f(lazy_tag{}, popt);
    f.text_ = std::move(json);
    return f;
  }

  // `in` must stay alive until the first call that needs the source.
  static flattener lazy(std::istream& in, parse_options popt = {}) {
    flattener f(lazy_tag{}, popt);
    f.in_ = &in;
    return f;
  }

  flattener& with_flatten_mode(flatten_mode mode) {
    opt_.with_flatten_mode(mode);
    invalidate();
    return *this;
  }

  flattener& with_escape_policy(escape_policy policy) {
    opt_.with_escape_policy(std::move(policy));
    invalidate();
    return *this;
  }

  flattener& with_separator(char separator) {
    opt_.with_separator(separator);
    invalidate();
    return *this;
  }

  flattener& with_brackets(char left, char right) {
    opt_.with_brackets(left, right);
    invalidate();
    return *this;
  }

  flattener& with_print_mode(print_mode mode) {
    opt_.with_print_mode(mode);
    invalidate();
    return *this;
  }

  flattener& with_renderer(render_function renderer) {
    opt_.with_renderer(std::move(renderer));
    invalidate();
    return *this;
  }

  const flatten_options& options() const noexcept { return opt_; }

  // Throws parse_error on malformed input, io_error if the stream fails.
  const value& source() const {
    if (!source_) {
      if (in_ != nullptr) {
        text_ = read_all(*in_);
        in_ = nullptr;
      }
      source_ = parse_or_throw(text_, popt_);
    }
    return *source_;
  }

  const flat_map& flatten_as_map() {
    if (!cache_) cache_ = jflat::flatten_as_map(source(), opt_);
    return *cache_;
  }

  std::string flatten() { return detail::render_flattened(source(), flatten_as_map(), opt_); }

  std::string to_string() const { return "flattener{source=" + dump(source()) + "}"; }

  friend bool operator==(const flattener& a, const flattener& b) { return a.source() == b.source(); }
  friend bool operator!=(const flattener& a, const flattener& b) { return !(a == b); }

private:
  struct lazy_tag {};

  flattener(lazy_tag, parse_options popt) : popt_(popt) {}

  void invalidate() noexcept { cache_.reset(); }

  mutable std::string text_;
  mutable std::istream* in_{nullptr};
  parse_options popt_;
  mutable std::optional<value> source_;
  flatten_options opt_;
  std::optional<flat_map> cache_;
};

} // namespace jflat
