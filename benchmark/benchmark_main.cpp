#include <jflat/jflat.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

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

// Records with a nested object and a short array each, so both descent and
// key building show up in the numbers.
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

    // Some values need escaping on output.
    if ((i % 16) == 0) {
      s += "\\n";
      s += "\\u4F60\\u597D";
    }

    s += "\",\"meta\":{\"score\":";
    s += (i % 3 == 0) ? "3.141592653589793" : "1e-10";
    s += ",\"owner.name\":\"x\",\"tags\":[\"a\",\"b\",{\"c\":null}]}";
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

bench_result bench_parse(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = jflat::parse(json);
    do_not_optimize(r.err.code);
    do_not_optimize(r.val.size());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, json.size() * iters};
}

bench_result bench_flatten_map(const jflat::value& doc, std::size_t bytes, std::size_t iters,
                               const jflat::flatten_options& opt) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    const auto m = jflat::flatten_as_map(doc, opt);
    do_not_optimize(m.size());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, bytes * iters};
}

bench_result bench_flatten_text(const jflat::value& doc, std::size_t iters, const jflat::flatten_options& opt) {
  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    const auto out = jflat::flatten(doc, opt);
    bytes += out.size();
    do_not_optimize(out.size());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, bytes};
}

void print_mbps(const char* name, const bench_result& r) {
  const double mb = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mbps = (r.seconds > 0.0) ? (mb / r.seconds) : 0.0;
  std::cout << name << ": " << mbps << " MiB/s (" << r.seconds << " s)" << "\n";
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t str_len = 24;
  std::size_t iters = 100;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = make_payload(n_objects, str_len);
  std::cout << "payload bytes: " << payload.size() << "\n";

  auto r = jflat::parse(payload);
  if (r.err) {
    std::cerr << "input parse failed: " << jflat::describe(r.err) << "\n";
    return 1;
  }
  const jflat::value& doc = r.val;

  jflat::flatten_options normal;
  jflat::flatten_options keep;
  keep.with_flatten_mode(jflat::flatten_mode::keep_arrays);
  jflat::flatten_options ascii;
  ascii.with_escape_policy(jflat::escape_policy::all_unicodes());
  jflat::flatten_options pretty;
  pretty.with_print_mode(jflat::print_mode::pretty);

  // Warm-up
  do_not_optimize(jflat::flatten_as_map(doc, normal).size());

  print_mbps("parse", run_median(runs, [&] { return bench_parse(payload, iters); }));
  print_mbps("flatten_as_map(normal)", run_median(runs, [&] { return bench_flatten_map(doc, payload.size(), iters, normal); }));
  print_mbps("flatten_as_map(keep_arrays)", run_median(runs, [&] { return bench_flatten_map(doc, payload.size(), iters, keep); }));
  print_mbps("flatten(minimal)", run_median(runs, [&] { return bench_flatten_text(doc, iters, normal); }));
  print_mbps("flatten(all_unicodes)", run_median(runs, [&] { return bench_flatten_text(doc, iters, ascii); }));
  print_mbps("flatten(pretty)", run_median(runs, [&] { return bench_flatten_text(doc, iters, pretty); }));

  return 0;
}
