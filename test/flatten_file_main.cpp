#include <jflat/jflat.hpp>

#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

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

void usage() {
  std::cerr << "usage: jflat_flatten_file [options] <file.json>...\n";
  std::cerr << "       jflat_flatten_file [options] --list <paths.txt>\n";
  std::cerr << "options:\n";
  std::cerr << "  --keep-arrays            keep arrays as list values\n";
  std::cerr << "  --pretty                 indent the output\n";
  std::cerr << "  --separator C            key separator (default '.')\n";
  std::cerr << "  --brackets LR            index brackets (default '[]')\n";
  std::cerr << "  --escape normal|all-unicodes\n";
}

// 0 ok, 1 parse failure, 2 read failure.
int flatten_one(const char* path, const jflat::flatten_options& opt, std::string& out) {
  std::string text;
  if (!read_all(path, text)) return 2;

  auto r = jflat::parse(std::string_view{text.data(), text.size()});
  if (r.err) {
    std::cerr << "parse failed: " << path << "\n";
    std::cerr << "  " << jflat::describe(r.err) << " (offset " << r.err.offset << ")\n";
    return 1;
  }
  out = jflat::flatten(r.val, opt);
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  jflat::flatten_options opt;
  std::string list_path;
  std::vector<std::string> files;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string_view arg{argv[i]};
      const bool has_next = i + 1 < argc;
      if (arg == "--keep-arrays") {
        opt.with_flatten_mode(jflat::flatten_mode::keep_arrays);
      } else if (arg == "--pretty") {
        opt.with_print_mode(jflat::print_mode::pretty);
      } else if (arg == "--separator" && has_next) {
        const std::string_view v{argv[++i]};
        if (v.size() != 1) {
          std::cerr << "--separator takes one character\n";
          return 2;
        }
        opt.with_separator(v[0]);
      } else if (arg == "--brackets" && has_next) {
        const std::string_view v{argv[++i]};
        if (v.size() != 2) {
          std::cerr << "--brackets takes two characters\n";
          return 2;
        }
        opt.with_brackets(v[0], v[1]);
      } else if (arg == "--escape" && has_next) {
        const std::string_view v{argv[++i]};
        if (v == "normal") {
          opt.with_escape_policy(jflat::escape_policy::normal());
        } else if (v == "all-unicodes") {
          opt.with_escape_policy(jflat::escape_policy::all_unicodes());
        } else {
          std::cerr << "unknown escape policy: " << v << "\n";
          return 2;
        }
      } else if (arg == "--list" && has_next) {
        list_path = argv[++i];
      } else if (!arg.empty() && arg[0] == '-') {
        usage();
        return 2;
      } else {
        files.emplace_back(arg);
      }
    }
  } catch (const jflat::config_error& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  if (!list_path.empty()) {
    std::ifstream in(list_path);
    if (!in) {
      std::cerr << "failed to read list file: " << list_path << "\n";
      return 2;
    }
    std::string path;
    while (std::getline(in, path)) {
      if (!path.empty()) files.push_back(path);
    }
  }

  if (files.empty()) {
    usage();
    return 2;
  }

  bool any_fail = false;
  bool any_io_fail = false;
  const bool labelled = files.size() > 1;
  for (const std::string& path : files) {
    std::string out;
    const int rc = flatten_one(path.c_str(), opt, out);
    if (rc == 0) {
      if (labelled) std::cout << path << "\t";
      std::cout << out << "\n";
      continue;
    }
    any_fail = true;
    if (rc == 2) {
      any_io_fail = true;
      std::cerr << "read failed: " << path << "\n";
    }
    if (labelled) std::cout << path << "\tFAIL\n";
  }
  return any_io_fail ? 2 : (any_fail ? 1 : 0);
}
