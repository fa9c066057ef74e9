#pragma once

#include <jflat/escape.hpp>
#include <jflat/output.hpp>
#include <jflat/value.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace jflat {

enum class print_mode { minimal, pretty };

// Renders an output value as JSON text, appending to `out`.
using render_function =
    std::function<void(std::string& out, const output_value& v, print_mode mode, const escape_policy& policy)>;

namespace detail {

inline void dump_string(std::string& out, std::string_view s, const escape_policy& policy) {
  out.push_back('"');
  policy.translate_to(out, s);
  out.push_back('"');
}

// Flattened keys are escaped when they are built.
inline void dump_key(std::string& out, const std::string& key) {
  out.push_back('"');
  out += key;
  out.push_back('"');
}

inline void dump_indent(std::string& out, int indent) {
  for (int i = 0; i < indent; ++i) out.push_back(' ');
}

struct dump_frame {
  const output_value::list* list{nullptr};
  const flat_map* map{nullptr};
  std::size_t idx{0};
};

inline void dump_scalar(std::string& out, const output_value& v, const escape_policy& policy) {
  switch (v.type()) {
    case output_value::kind::boolean:
      if (v.as_bool()) out.append("true", 4);
      else out.append("false", 5);
      return;
    case output_value::kind::string:
      dump_string(out, v.as_string(), policy);
      return;
    case output_value::kind::number:
      out += v.as_number().to_string();
      return;
    default:
      out.append("null", 4);
      return;
  }
}

// Writes a scalar, or opens a container and pushes a frame for it.
inline void dump_open(std::string& out, const output_value& v, const escape_policy& policy,
                      std::vector<dump_frame>& stack) {
  if (v.is_list()) {
    out.push_back('[');
    stack.push_back(dump_frame{&v.as_list(), nullptr, 0});
  } else if (v.is_map()) {
    out.push_back('{');
    stack.push_back(dump_frame{nullptr, &v.as_map(), 0});
  } else {
    dump_scalar(out, v, policy);
  }
}

inline void dump_minimal(std::string& out, std::vector<dump_frame>& stack, const escape_policy& policy) {
  while (!stack.empty()) {
    dump_frame& f = stack.back();
    if (f.list != nullptr) {
      if (f.idx == f.list->size()) {
        out.push_back(']');
        stack.pop_back();
        continue;
      }
      if (f.idx > 0) out.push_back(',');
      const output_value& child = (*f.list)[f.idx++];
      dump_open(out, child, policy, stack);
    } else {
      if (f.idx == f.map->size()) {
        out.push_back('}');
        stack.pop_back();
        continue;
      }
      if (f.idx > 0) out.push_back(',');
      const auto& kv = f.map->at(f.idx++);
      dump_key(out, kv.first);
      out.push_back(':');
      dump_open(out, kv.second, policy, stack);
    }
  }
}

inline void dump_pretty(std::string& out, const output_value& v, const escape_policy& policy, int indent);

inline void dump_pretty(std::string& out, const flat_map& m, const escape_policy& policy, int indent) {
  out.push_back('{');
  if (!m.empty()) out.push_back('\n');
  std::size_t idx = 0;
  for (const auto& kv : m) {
    dump_indent(out, indent + 2);
    dump_key(out, kv.first);
    out.append(": ", 2);
    dump_pretty(out, kv.second, policy, indent + 2);
    if (++idx != m.size()) out.push_back(',');
    out.push_back('\n');
  }
  if (!m.empty()) dump_indent(out, indent);
  out.push_back('}');
}

inline void dump_pretty(std::string& out, const output_value& v, const escape_policy& policy, int indent) {
  switch (v.type()) {
    case output_value::kind::list: {
      const auto& a = v.as_list();
      out.push_back('[');
      if (!a.empty()) out.push_back('\n');
      for (std::size_t idx = 0; idx < a.size(); ++idx) {
        dump_indent(out, indent + 2);
        dump_pretty(out, a[idx], policy, indent + 2);
        if (idx + 1 != a.size()) out.push_back(',');
        out.push_back('\n');
      }
      if (!a.empty()) dump_indent(out, indent);
      out.push_back(']');
      return;
    }
    case output_value::kind::map:
      dump_pretty(out, v.as_map(), policy, indent);
      return;
    default:
      dump_scalar(out, v, policy);
      return;
  }
}

} // namespace detail

// Default renderer. `minimal` emits no whitespace; `pretty` indents by two
// spaces and writes `"key": value`.
inline void render_json(std::string& out, const output_value& v, print_mode mode, const escape_policy& policy) {
  if (mode == print_mode::pretty) {
    detail::dump_pretty(out, v, policy, 0);
    return;
  }
  std::vector<detail::dump_frame> stack;
  detail::dump_open(out, v, policy, stack);
  detail::dump_minimal(out, stack, policy);
}

inline void render_json(std::string& out, const flat_map& m, print_mode mode, const escape_policy& policy) {
  if (mode == print_mode::pretty) {
    detail::dump_pretty(out, m, policy, 0);
    return;
  }
  std::vector<detail::dump_frame> stack;
  out.push_back('{');
  stack.push_back(detail::dump_frame{nullptr, &m, 0});
  detail::dump_minimal(out, stack, policy);
}

inline std::string render(const output_value& v, print_mode mode = print_mode::minimal,
                          const escape_policy& policy = escape_policy()) {
  std::string out;
  render_json(out, v, mode, policy);
  return out;
}

inline std::string render(const flat_map& m, print_mode mode = print_mode::minimal,
                          const escape_policy& policy = escape_policy()) {
  std::string out;
  render_json(out, m, mode, policy);
  return out;
}

// Compact JSON text of a parsed source tree.
inline std::string dump(const value& root) {
  struct frame {
    const value* v{nullptr};
    std::size_t idx{0};
  };

  std::string out;
  std::vector<frame> stack;
  stack.push_back(frame{&root, 0});

  while (!stack.empty()) {
    frame& f = stack.back();
    const value& cur = *f.v;

    switch (cur.type()) {
      case value::kind::null:
        out.append("null", 4);
        stack.pop_back();
        break;
      case value::kind::boolean:
        if (cur.as_bool()) out.append("true", 4);
        else out.append("false", 5);
        stack.pop_back();
        break;
      case value::kind::number:
        out += cur.number_text();
        stack.pop_back();
        break;
      case value::kind::string:
        out.push_back('"');
        detail::escape_json_to(out, cur.as_string());
        out.push_back('"');
        stack.pop_back();
        break;
      case value::kind::array: {
        const auto& a = cur.as_array();
        if (f.idx == 0) out.push_back('[');
        if (f.idx == a.size()) {
          out.push_back(']');
          stack.pop_back();
          break;
        }
        if (f.idx > 0) out.push_back(',');
        const value* child = &a[f.idx++];
        stack.push_back(frame{child, 0});
        break;
      }
      case value::kind::object: {
        const auto& o = cur.as_object();
        if (f.idx == 0) out.push_back('{');
        if (f.idx == o.size()) {
          out.push_back('}');
          stack.pop_back();
          break;
        }
        if (f.idx > 0) out.push_back(',');
        const auto& kv = o[f.idx++];
        out.push_back('"');
        detail::escape_json_to(out, kv.first);
        out.append("\":", 2);
        stack.push_back(frame{&kv.second, 0});
        break;
      }
    }
  }
  return out;
}

} // namespace jflat
