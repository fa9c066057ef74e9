#include <jflat/jflat.hpp>

#include <json/json.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Flattens every file twice, once with jflat and once by walking a jsoncpp
// tree, and compares the resulting (key, leaf) sets. jsoncpp keeps object
// members sorted, so entries are compared without regard to order.

namespace {

bool read_all(const char* path, std::string& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  ifs.seekg(0, std::ios::end);
  const auto end = ifs.tellg();
  if (end < 0) return false;
  out.resize(static_cast<std::size_t>(end));
  ifs.seekg(0, std::ios::beg);
  if (!out.empty()) {
    if (!ifs.read(out.data(), static_cast<std::streamsize>(out.size()))) return false;
  }
  return true;
}

using entry = std::pair<std::string, std::string>;

std::string number_text(double d) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", d);
  return buf;
}

std::string describe_leaf(const jflat::output_value& v) {
  switch (v.type()) {
    case jflat::output_value::kind::null: return "null";
    case jflat::output_value::kind::boolean: return v.as_bool() ? "true" : "false";
    case jflat::output_value::kind::string: return "s:" + v.as_string();
    case jflat::output_value::kind::number: return "n:" + number_text(std::stod(v.as_number().to_string()));
    case jflat::output_value::kind::list: return v.as_list().empty() ? "[]" : "[...]";
    case jflat::output_value::kind::map: return v.as_map().empty() ? "{}" : "{...}";
  }
  return "?";
}

std::string describe_leaf(const Json::Value& v) {
  if (v.isNull()) return "null";
  if (v.isBool()) return v.asBool() ? "true" : "false";
  if (v.isString()) return "s:" + v.asString();
  if (v.isNumeric()) return "n:" + number_text(v.asDouble());
  if (v.isArray()) return v.empty() ? "[]" : "[...]";
  return v.empty() ? "{}" : "{...}";
}

struct step {
  bool indexed{false};
  std::string name;
  Json::ArrayIndex index{0};
};

struct walk_frame {
  const Json::Value* container{nullptr};
  std::vector<std::string> names;
  Json::ArrayIndex next{0};
};

std::string encode(const jflat::key_encoder& keys, const std::vector<step>& path) {
  std::vector<jflat::path_segment> segs;
  segs.reserve(path.size());
  for (const step& s : path) {
    segs.push_back(s.indexed ? jflat::path_segment::indexed(s.index) : jflat::path_segment::named(s.name));
  }
  return keys.encode(segs);
}

// Normal-mode flattening over a jsoncpp tree.
std::vector<entry> flatten_jsoncpp(const Json::Value& root, const jflat::flatten_options& opt) {
  const jflat::key_encoder keys(opt);
  std::vector<entry> out;
  std::vector<walk_frame> stack;
  std::vector<step> path;

  auto visit = [&](const Json::Value& v) {
    if ((v.isObject() || v.isArray()) && !v.empty()) {
      walk_frame f;
      f.container = &v;
      if (v.isObject()) f.names = v.getMemberNames();
      stack.push_back(std::move(f));
      path.emplace_back();
      return;
    }
    std::string key = encode(keys, path);
    if (v.isObject() && key == jflat::root_key) return;
    out.emplace_back(std::move(key), describe_leaf(v));
  };

  visit(root);
  while (!stack.empty()) {
    walk_frame& top = stack.back();
    if (top.next == top.container->size()) {
      stack.pop_back();
      path.pop_back();
      continue;
    }
    const Json::ArrayIndex pos = top.next++;
    const Json::Value* child = nullptr;
    if (top.container->isObject()) {
      path.back() = step{false, top.names[pos], 0};
      child = &(*top.container)[top.names[pos]];
    } else {
      path.back() = step{true, {}, pos};
      child = &(*top.container)[pos];
    }
    visit(*child);
  }
  return out;
}

// 0 match, 1 mismatch or parse failure, 2 read failure.
int check_one(const char* path) {
  std::string text;
  if (!read_all(path, text)) return 2;

  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["allowTrailingCommas"] = false;
  builder["strictRoot"] = false;

  Json::Value root;
  std::string errs;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
    std::cerr << "jsoncpp rejected " << path << ": " << errs << "\n";
    return 1;
  }

  const jflat::flatten_options opt;
  jflat::flat_map m;
  try {
    m = jflat::flatten_json_as_map(text, opt);
  } catch (const jflat::parse_error& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  std::vector<entry> got;
  for (const auto& kv : m) got.emplace_back(kv.first, describe_leaf(kv.second));
  std::vector<entry> want = flatten_jsoncpp(root, opt);

  std::sort(got.begin(), got.end());
  std::sort(want.begin(), want.end());
  if (got == want) return 0;

  std::cerr << "mismatch: " << path << " (jflat " << got.size() << " entries, jsoncpp " << want.size() << ")\n";
  for (const entry& e : got) {
    if (!std::binary_search(want.begin(), want.end(), e)) std::cerr << "  only jflat:   " << e.first << " = " << e.second << "\n";
  }
  for (const entry& e : want) {
    if (!std::binary_search(got.begin(), got.end(), e)) std::cerr << "  only jsoncpp: " << e.first << " = " << e.second << "\n";
  }
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  if (argc == 3 && std::string_view{argv[1]} == "--list") {
    std::ifstream in(argv[2]);
    if (!in) {
      std::cerr << "failed to read list file: " << argv[2] << "\n";
      return 2;
    }

    bool any_fail = false;
    bool any_io_fail = false;
    std::string path;
    while (std::getline(in, path)) {
      if (path.empty()) continue;
      const int rc = check_one(path.c_str());
      std::cout << path << (rc == 0 ? "\tOK\n" : "\tFAIL\n");
      if (rc != 0) any_fail = true;
      if (rc == 2) any_io_fail = true;
    }
    return any_io_fail ? 2 : (any_fail ? 1 : 0);
  }

  if (argc < 2) {
    std::cerr << "usage: jflat_jsoncpp_crosscheck <file.json>...\n";
    std::cerr << "       jflat_jsoncpp_crosscheck --list <paths.txt>\n";
    return 2;
  }

  int worst = 0;
  for (int i = 1; i < argc; ++i) {
    const int rc = check_one(argv[i]);
    if (rc == 2) std::cerr << "read failed: " << argv[i] << "\n";
    worst = std::max(worst, rc);
  }
  return worst;
}
