#pragma once

#include <jflat/options.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace jflat {

// Reserved key for a root that cannot be expressed as a map.
inline constexpr std::string_view root_key = "root";

// One step from the document root: an object member name or an array index.
struct path_segment {
  enum class kind { named, indexed };

  kind type{kind::indexed};
  std::string_view name;
  std::size_t index{0};

  static path_segment named(std::string_view n) noexcept { return path_segment{kind::named, n, 0}; }
  static path_segment indexed(std::size_t i) noexcept { return path_segment{kind::indexed, {}, i}; }
};

class key_encoder {
public:
  // Holds a reference; the options must outlive the encoder.
  explicit key_encoder(const flatten_options& opt) : opt_(opt) {}
  explicit key_encoder(flatten_options&&) = delete;

  // Member names that contain the separator, a bracket or whitespace would be
  // split wrongly when the key is read back, so they are fenced instead.
  bool needs_fencing(std::string_view name) const noexcept {
    for (const char c : name) {
      if (c == opt_.separator() || c == opt_.left_bracket() || c == opt_.right_bracket() || detail::is_space(c)) {
        return true;
      }
    }
    return false;
  }

  std::string encode(const std::vector<path_segment>& path) const {
    if (path.empty()) return std::string(root_key);

    std::string key;
    for (const path_segment& seg : path) {
      if (seg.type == path_segment::kind::indexed) {
        key.push_back(opt_.left_bracket());
        key += std::to_string(seg.index);
        key.push_back(opt_.right_bracket());
      } else if (needs_fencing(seg.name)) {
        key.push_back(opt_.left_bracket());
        key.append("\\\"", 2);
        opt_.policy().translate_to(key, seg.name);
        key.append("\\\"", 2);
        key.push_back(opt_.right_bracket());
      } else {
        if (!key.empty()) key.push_back(opt_.separator());
        opt_.policy().translate_to(key, seg.name);
      }
    }
    return key;
  }

private:
  const flatten_options& opt_;
};

} // namespace jflat
