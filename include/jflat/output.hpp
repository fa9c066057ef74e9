#pragma once

#include <jflat/decimal.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace jflat {

class output_value;

// Insertion-ordered string-keyed map with unique keys. Re-inserting a key
// replaces its value in place.
class flat_map {
public:
  using entry = std::pair<std::string, output_value>;
  using const_iterator = std::vector<entry>::const_iterator;

  flat_map() = default;

  std::size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }

  const_iterator begin() const noexcept { return entries_.begin(); }
  const_iterator end() const noexcept { return entries_.end(); }

  bool contains(std::string_view key) const { return index_.find(std::string(key)) != index_.end(); }

  inline const output_value* find(std::string_view key) const;
  inline const output_value& at(std::string_view key) const;
  inline const entry& at(std::size_t pos) const;

  inline void insert_or_assign(std::string key, output_value v);

  inline std::vector<std::string> keys() const;

  friend inline bool operator==(const flat_map& a, const flat_map& b);
  friend inline bool operator!=(const flat_map& a, const flat_map& b) { return !(a == b); }

private:
  std::vector<entry> entries_;
  std::unordered_map<std::string, std::size_t> index_;
};

// A flattened value: null, boolean, string, decimal, list or nested flat_map.
class output_value {
public:
  using list = std::vector<output_value>;

  enum class kind { null, boolean, string, number, list, map };

  output_value() noexcept : data_(std::monostate{}) {}
  output_value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  output_value(bool b) : data_(b) {}
  output_value(std::string s) : data_(std::move(s)) {}
  output_value(const char* s) : data_(std::string(s)) {}
  output_value(decimal d) : data_(std::move(d)) {}
  output_value(list l) : data_(std::move(l)) {}
  output_value(flat_map m) : data_(std::move(m)) {}

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::null;
      case 1: return kind::boolean;
      case 2: return kind::string;
      case 3: return kind::number;
      case 4: return kind::list;
      case 5: return kind::map;
      default: return kind::null;
    }
  }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_number() const noexcept { return std::holds_alternative<decimal>(data_); }
  bool is_list() const noexcept { return std::holds_alternative<list>(data_); }
  bool is_map() const noexcept { return std::holds_alternative<flat_map>(data_); }

  bool as_bool() const { return std::get<bool>(data_); }
  const std::string& as_string() const { return std::get<std::string>(data_); }
  const decimal& as_number() const { return std::get<decimal>(data_); }
  const list& as_list() const { return std::get<list>(data_); }
  const flat_map& as_map() const { return std::get<flat_map>(data_); }

  list& as_list() { return std::get<list>(data_); }
  flat_map& as_map() { return std::get<flat_map>(data_); }

  friend bool operator==(const output_value& a, const output_value& b) { return a.data_ == b.data_; }
  friend bool operator!=(const output_value& a, const output_value& b) { return !(a == b); }

private:
  // index: 0 null, 1 bool, 2 string, 3 number, 4 list, 5 map
  std::variant<std::monostate, bool, std::string, decimal, list, flat_map> data_;
};

inline const output_value* flat_map::find(std::string_view key) const {
  const auto it = index_.find(std::string(key));
  if (it == index_.end()) return nullptr;
  return &entries_[it->second].second;
}

inline const output_value& flat_map::at(std::string_view key) const {
  const output_value* v = find(key);
  if (!v) throw std::out_of_range("jflat: no such key: " + std::string(key));
  return *v;
}

inline const flat_map::entry& flat_map::at(std::size_t pos) const { return entries_.at(pos); }

inline void flat_map::insert_or_assign(std::string key, output_value v) {
  const auto it = index_.find(key);
  if (it != index_.end()) {
    entries_[it->second].second = std::move(v);
    return;
  }
  index_.emplace(key, entries_.size());
  entries_.emplace_back(std::move(key), std::move(v));
}

inline std::vector<std::string> flat_map::keys() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) out.push_back(e.first);
  return out;
}

// Order-sensitive: same keys in the same order with equal values.
inline bool operator==(const flat_map& a, const flat_map& b) { return a.entries_ == b.entries_; }

} // namespace jflat
