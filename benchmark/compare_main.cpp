#include <jflat/jflat.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// nlohmann/json
#include <nlohmann/json.hpp>

// jsoncpp
#include <json/json.h>

// RapidJSON
#include <rapidjson/document.h>

// Parse+flatten throughput: jflat against comparable flatteners built on
// other JSON libraries. The hand-written flatteners below only join keys with
// '.' and "[i]" (no fencing, no escaping), so they are a lower bound on the
// work jflat does.

namespace {

using clock_type = std::chrono::high_resolution_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

std::string make_payload(std::size_t n_objects, std::size_t str_len) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> ch('a', 'z');

  std::string s;
  s.reserve(n_objects * (str_len + 128));
  s.push_back('[');
  for (std::size_t i = 0; i < n_objects; ++i) {
    if (i) s.push_back(',');
    s += "{\"id\":";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ",\"ok\":";
    s += (i % 2 == 0) ? "true" : "false";
    s += ",\"name\":\"";

    for (std::size_t k = 0; k < str_len; ++k) {
      s.push_back(static_cast<char>(ch(rng)));
    }

    if ((i % 16) == 0) {
      s += "\\n";
      s += "\\u4F60\\u597D";
    }

    s += "\",\"meta\":{\"score\":";
    s += (i % 3 == 0) ? "3.141592653589793" : "1e-10";
    s += ",\"tags\":[\"a\",\"b\",{\"c\":null}]}";
    s += "}";
  }
  s.push_back(']');
  return s;
}

struct bench_result {
  double seconds{0.0};
  std::size_t bytes{0};
};

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<double> secs;
  secs.reserve(runs);
  std::size_t bytes = 0;
  for (std::size_t r = 0; r < runs; ++r) {
    const auto br = fn();
    secs.push_back(br.seconds);
    bytes = br.bytes;
  }
  std::nth_element(secs.begin(), secs.begin() + (secs.size() / 2), secs.end());
  return {secs[secs.size() / 2], bytes};
}

void print_mbps(const char* name, const bench_result& r, std::size_t leaves) {
  const double mib = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mibps = (r.seconds > 0.0) ? (mib / r.seconds) : 0.0;
  std::cout << name << ": " << mibps << " MiB/s (" << r.seconds << " s, " << leaves << " leaves)" << "\n";
}

void append_index(std::string& key, std::size_t i) {
  key.push_back('[');
  key += std::to_string(i);
  key.push_back(']');
}

void append_name(std::string& key, std::string_view name) {
  if (!key.empty()) key.push_back('.');
  key.append(name.data(), name.size());
}

// jflat

std::size_t jflat_flatten(std::string_view json) {
  return jflat::flatten_json_as_map(json).size();
}

// nlohmann/json ships its own flatten() with JSON-pointer keys.

std::size_t nlohmann_flatten(std::string_view json_text) {
  using nlohmann::ordered_json;
  const ordered_json j = ordered_json::parse(json_text, nullptr, false, false);
  if (j.is_discarded()) {
    std::cerr << "nlohmann: input parse failed\n";
    std::exit(1);
  }
  return j.flatten().size();
}

// jsoncpp

struct jsoncpp_frame {
  const Json::Value* v{nullptr};
  std::vector<std::string> names;
  Json::ArrayIndex next{0};
  std::size_t key_len{0};
};

std::size_t jsoncpp_flatten(std::string_view json) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  Json::Value root;
  std::string errs;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  if (!reader->parse(json.data(), json.data() + json.size(), &root, &errs)) {
    std::cerr << "jsoncpp: input parse failed: " << errs << "\n";
    std::exit(1);
  }

  std::vector<std::pair<std::string, const Json::Value*>> out;
  std::vector<jsoncpp_frame> stack;
  std::string key;
  auto visit = [&](const Json::Value& v) {
    if ((v.isObject() || v.isArray()) && !v.empty()) {
      jsoncpp_frame f;
      f.v = &v;
      if (v.isObject()) f.names = v.getMemberNames();
      f.key_len = key.size();
      stack.push_back(std::move(f));
      return;
    }
    out.emplace_back(key, &v);
  };

  visit(root);
  while (!stack.empty()) {
    jsoncpp_frame& top = stack.back();
    key.resize(top.key_len);
    if (top.next == top.v->size()) {
      stack.pop_back();
      continue;
    }
    const Json::ArrayIndex pos = top.next++;
    if (top.v->isObject()) {
      append_name(key, top.names[pos]);
      visit((*top.v)[top.names[pos]]);
    } else {
      append_index(key, pos);
      visit((*top.v)[pos]);
    }
  }
  do_not_optimize(out.data());
  return out.size();
}

// RapidJSON

struct rapidjson_frame {
  const rapidjson::Value* v{nullptr};
  rapidjson::SizeType next{0};
  std::size_t key_len{0};
};

std::size_t rapidjson_flatten(std::string_view json) {
  rapidjson::Document d;
  d.Parse(json.data(), json.size());
  if (d.HasParseError()) {
    std::cerr << "rapidjson: input parse failed\n";
    std::exit(1);
  }

  std::vector<std::pair<std::string, const rapidjson::Value*>> out;
  std::vector<rapidjson_frame> stack;
  std::string key;
  auto visit = [&](const rapidjson::Value& v) {
    if ((v.IsObject() && v.MemberCount() != 0) || (v.IsArray() && !v.Empty())) {
      stack.push_back(rapidjson_frame{&v, 0, key.size()});
      return;
    }
    out.emplace_back(key, &v);
  };

  visit(d);
  while (!stack.empty()) {
    rapidjson_frame& top = stack.back();
    key.resize(top.key_len);
    const rapidjson::SizeType size = top.v->IsObject() ? top.v->MemberCount() : top.v->Size();
    if (top.next == size) {
      stack.pop_back();
      continue;
    }
    const rapidjson::SizeType pos = top.next++;
    if (top.v->IsObject()) {
      const auto& member = *(top.v->MemberBegin() + pos);
      append_name(key, std::string_view(member.name.GetString(), member.name.GetStringLength()));
      visit(member.value);
    } else {
      append_index(key, pos);
      visit((*top.v)[pos]);
    }
  }
  do_not_optimize(out.data());
  return out.size();
}

template <class Flatten>
bench_result bench(std::string_view json, std::size_t iters, Flatten&& flatten_fn, std::size_t& leaves) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    leaves = flatten_fn(json);
    do_not_optimize(leaves);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t iters = 50;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = make_payload(n_objects, 24);
  std::cout << "payload bytes: " << payload.size() << "\n";

  // Warm-up
  do_not_optimize(jflat_flatten(payload));
  do_not_optimize(nlohmann_flatten(payload));
  do_not_optimize(jsoncpp_flatten(payload));
  do_not_optimize(rapidjson_flatten(payload));

  std::cout << "\n== Parse+flatten ==\n";
  std::size_t leaves = 0;
  auto r = run_median(runs, [&] { return bench(payload, iters, jflat_flatten, leaves); });
  print_mbps("jflat", r, leaves);
  r = run_median(runs, [&] { return bench(payload, iters, nlohmann_flatten, leaves); });
  print_mbps("nlohmann flatten()", r, leaves);
  r = run_median(runs, [&] { return bench(payload, iters, jsoncpp_flatten, leaves); });
  print_mbps("jsoncpp walk", r, leaves);
  r = run_median(runs, [&] { return bench(payload, iters, rapidjson_flatten, leaves); });
  print_mbps("rapidjson walk", r, leaves);

  return 0;
}
