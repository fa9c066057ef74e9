#pragma once

#include <jflat/decimal.hpp>
#include <jflat/key_encoder.hpp>
#include <jflat/options.hpp>
#include <jflat/output.hpp>
#include <jflat/parser.hpp>
#include <jflat/render.hpp>
#include <jflat/value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jflat {

namespace detail {

// One open container during traversal. `next` is the position of the child
// that will be visited next; the child being visited is next - 1.
struct frame {
  const value* container{nullptr};
  std::size_t next{0};
};

// Depth-first, pre-order walk over a parsed tree. Containers are kept on an
// explicit stack, so native stack usage does not grow with input depth.
class flatten_engine {
public:
  explicit flatten_engine(const flatten_options& opt) : opt_(opt), keys_(opt) {}

  flat_map run(const value& root) {
    flat_map out;
    frames_.clear();
    path_.clear();

    reduce(root, out);
    while (!frames_.empty()) {
      frame& top = frames_.back();
      if (top.next == top.container->size()) {
        frames_.pop_back();
        path_.pop_back();
        continue;
      }

      const std::size_t pos = top.next++;
      const value* child = nullptr;
      if (top.container->is_object()) {
        const auto& member = top.container->as_object()[pos];
        path_.back() = path_segment::named(member.first);
        child = &member.second;
      } else {
        path_.back() = path_segment::indexed(pos);
        child = &top.container->as_array()[pos];
      }
      reduce(*child, out);
    }
    return out;
  }

private:
  void push(const value& container) {
    frames_.push_back(frame{&container, 0});
    path_.emplace_back();
  }

  void reduce(const value& v, flat_map& out) {
    if (v.is_object() && v.size() != 0) {
      push(v);
      return;
    }
    if (v.is_array() && v.size() != 0) {
      if (opt_.mode() == flatten_mode::keep_arrays) {
        out.insert_or_assign(keys_.encode(path_), coerce(v));
      } else {
        push(v);
      }
      return;
    }

    // An empty object under the root key has nothing to say, whether it is
    // the document itself or a member spelled "root".
    std::string key = keys_.encode(path_);
    if (v.is_object() && key == root_key) return;
    out.insert_or_assign(std::move(key), coerce(v));
  }

  output_value coerce(const value& v) const {
    switch (v.type()) {
      case value::kind::null: return output_value(nullptr);
      case value::kind::boolean: return output_value(v.as_bool());
      case value::kind::string: return output_value(v.as_string());
      case value::kind::number: return output_value(decimal::parse(v.number_text()));
      case value::kind::array: {
        output_value::list items;
        if (opt_.mode() == flatten_mode::keep_arrays) {
          items.reserve(v.size());
          for (const value& e : v.as_array()) items.push_back(coerce(e));
        }
        return output_value(std::move(items));
      }
      case value::kind::object: {
        if (opt_.mode() == flatten_mode::keep_arrays && v.size() != 0) {
          // Objects inside kept arrays are flattened on their own.
          flatten_engine nested(opt_);
          return output_value(nested.run(v));
        }
        return output_value(flat_map{});
      }
    }
    return output_value(nullptr);
  }

  const flatten_options& opt_;
  key_encoder keys_;
  std::vector<frame> frames_;
  std::vector<path_segment> path_;
};

// True when `flatten()` should print the whole map rather than the value
// stored under the root key.
inline bool renders_as_map(const value& root, const flat_map& m) {
  return root.is_object() || (root.is_array() && !m.contains(root_key));
}

inline std::string render_flattened(const value& root, flat_map m, const flatten_options& opt) {
  std::string out;
  if (renders_as_map(root, m)) {
    opt.renderer()(out, output_value(std::move(m)), opt.printing(), opt.policy());
  } else {
    opt.renderer()(out, m.at(root_key), opt.printing(), opt.policy());
  }
  return out;
}

} // namespace detail

inline flat_map flatten_as_map(const value& root, const flatten_options& opt = flatten_options()) {
  detail::flatten_engine engine(opt);
  return engine.run(root);
}

inline std::string flatten(const value& root, const flatten_options& opt = flatten_options()) {
  return detail::render_flattened(root, flatten_as_map(root, opt), opt);
}

// Parse-then-flatten helpers. Malformed text throws parse_error; raise
// `popt.max_depth` for input nested deeper than 512 levels.
inline flat_map flatten_json_as_map(std::string_view json, const flatten_options& opt = flatten_options(),
                                    parse_options popt = {}) {
  return flatten_as_map(parse_or_throw(json, popt), opt);
}

inline std::string flatten_json(std::string_view json, const flatten_options& opt = flatten_options(),
                                parse_options popt = {}) {
  return flatten(parse_or_throw(json, popt), opt);
}

} // namespace jflat
