#include "test_common.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace jflat;

namespace {

struct rng {
  std::uint64_t s{0x9E3779B97F4A7C15ull};
  std::uint64_t next_u64() {
    // xorshift64*
    std::uint64_t x = s;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    s = x;
    return x * 2685821657736338717ull;
  }
  std::uint32_t next_u32() { return static_cast<std::uint32_t>(next_u64() >> 32); }
  std::size_t range(std::size_t n) { return n ? static_cast<std::size_t>(next_u64() % n) : 0u; }
  bool coin() { return (next_u64() & 1ull) != 0; }
};

// Member names lean on the characters that force fencing or escaping.
static std::string random_name(rng& r, std::size_t max_len) {
  static const char special[] = {'.', ' ', '[', ']', '"', '\\', '\t', '/'};
  const std::size_t len = r.range(max_len + 1);
  std::string out;
  out.reserve(len);
  for (std::size_t i = 0; i < len; ++i) {
    if (r.range(5) == 0) {
      out.push_back(special[r.range(sizeof(special))]);
    } else {
      out.push_back(static_cast<char>('a' + r.range(26)));
    }
  }
  return out;
}

static value random_number(rng& r) {
  std::string token;
  if (r.coin()) token.push_back('-');
  token += std::to_string(r.next_u32() % 100000u);
  if (r.coin()) {
    token.push_back('.');
    token += std::to_string(r.next_u32() % 1000u);
  }
  if (r.range(4) == 0) {
    token += "e";
    token += std::to_string(r.range(20));
  }
  return value::number(token);
}

static value random_value(rng& r, int depth, bool arrays);

static value random_array(rng& r, int depth) {
  value::array a;
  const std::size_t n = r.range(6);
  a.reserve(n);
  for (std::size_t i = 0; i < n; ++i) a.emplace_back(random_value(r, depth - 1, true));
  return value(std::move(a));
}

// Names are unique within an object so that distinct paths give distinct keys.
static value random_object(rng& r, int depth, bool arrays) {
  value::object o;
  const std::size_t n = r.range(6);
  o.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    std::string name = random_name(r, 6) + std::to_string(i);
    o.emplace_back(std::move(name), random_value(r, depth - 1, arrays));
  }
  return value(std::move(o));
}

static value random_value(rng& r, int depth, bool arrays) {
  const std::uint32_t k = r.next_u32() % (depth <= 0 ? 4u : 6u);
  switch (k) {
    case 0: return value(nullptr);
    case 1: return value(r.coin());
    case 2: return random_number(r);
    case 3: return value(random_name(r, 12));
    case 4:
      if (arrays) return random_array(r, depth);
      return random_object(r, depth, arrays);
    default: return random_object(r, depth, arrays);
  }
}

// Number of entries a normal-mode flatten should emit.
static std::size_t count_terminals(const value& v, bool is_root) {
  if (v.is_object()) {
    if (v.size() == 0) return is_root ? 0u : 1u;
    std::size_t n = 0;
    for (const auto& kv : v.as_object()) n += count_terminals(kv.second, false);
    return n;
  }
  if (v.is_array()) {
    if (v.size() == 0) return 1u;
    std::size_t n = 0;
    for (const value& e : v.as_array()) n += count_terminals(e, false);
    return n;
  }
  return 1u;
}

static void check_entry_kinds(const flat_map& m) {
  for (const auto& kv : m) {
    const output_value& v = kv.second;
    // Normal mode never emits a non-empty container.
    if (v.is_list()) JFLAT_CHECK(v.as_list().empty());
    if (v.is_map()) JFLAT_CHECK(v.as_map().empty());
  }
}

} // namespace

static void test_random_documents() {
  rng r;
  const escape_policy normal = escape_policy::normal();

  for (int iter = 0; iter < 1500; ++iter) {
    const value doc = random_object(r, 4, true);

    const flat_map m = flatten_as_map(doc);
    JFLAT_CHECK(m == flatten_as_map(doc));
    JFLAT_CHECK(m.size() == count_terminals(doc, true));
    check_entry_kinds(m);

    // The rendered map is valid JSON whose member names are the keys.
    const std::string text = flatten(doc);
    auto pr = parse(text);
    JFLAT_CHECK(!pr.err);
    JFLAT_CHECK(pr.val.is_object());
    const auto& members = pr.val.as_object();
    JFLAT_CHECK(members.size() == m.size());
    for (std::size_t i = 0; i < members.size(); ++i) {
      JFLAT_CHECK_EQ(normal(members[i].first), m.at(i).first);
    }

    // keep_arrays output is valid JSON too.
    flatten_options keep;
    keep.with_flatten_mode(flatten_mode::keep_arrays);
    JFLAT_CHECK(!parse(flatten(doc, keep)).err);
  }
}

static void test_modes_agree_without_arrays() {
  rng r;
  r.s = 0xD1B54A32D192ED03ull;
  flatten_options keep;
  keep.with_flatten_mode(flatten_mode::keep_arrays);

  for (int iter = 0; iter < 1000; ++iter) {
    const value doc = random_object(r, 5, false);
    JFLAT_CHECK(flatten_as_map(doc) == flatten_as_map(doc, keep));
    JFLAT_CHECK_EQ(flatten(doc), flatten(doc, keep));
  }
}

static void test_deep_nesting() {
  const std::size_t depth = 100000;
  value v = value::number("1");
  for (std::size_t i = 0; i < depth; ++i) {
    value::object o;
    o.emplace_back(i % 2 ? "k" : "k k", std::move(v));
    v = value(std::move(o));
  }

  const flat_map m = flatten_as_map(v);
  JFLAT_CHECK(m.size() == 1);
  const std::string& key = m.at(0).first;
  // Outermost member is "k"; every other level is fenced for its space.
  const std::string fenced = "[\\\"k k\\\"]";
  JFLAT_CHECK(key.size() == 1 + 2 * (depth / 2 - 1) + fenced.size() * (depth / 2));
  JFLAT_CHECK(key.compare(0, fenced.size() + 1, "k" + fenced) == 0);
  JFLAT_CHECK(key.compare(key.size() - fenced.size(), fenced.size(), fenced) == 0);
  JFLAT_CHECK_EQ(m.at(0).second.as_number().to_string(), "1");

  // Release from the inside out.
  std::vector<value> chain;
  chain.push_back(std::move(v));
  while (chain.back().is_object()) {
    value inner = std::move(chain.back().as_object()[0].second);
    chain.back().as_object().clear();
    chain.push_back(std::move(inner));
  }
  JFLAT_CHECK(chain.size() == depth + 1);
}

void test_random() {
  test_random_documents();
  test_modes_agree_without_arrays();
  test_deep_nesting();
}
