// Parse and render throughput for rdjson, lenient against strict, over the
// sample documents in data/ and a few generated shapes.

#include "bench_common.hpp"

#include <rdjson/rdjson.hpp>

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#ifndef RDJSON_SAMPLE_DIR
  #define RDJSON_SAMPLE_DIR "data"
#endif

namespace {

struct shape {
  std::string name;
  std::string text;
};

struct bench_options {
  std::size_t rounds{5};
  std::size_t passes{2000};
  std::size_t records{500};
  std::string sample_dir{RDJSON_SAMPLE_DIR};
};

// Records shaped like the "roles" entries of the object sample.
std::string make_records(std::size_t n) {
  std::string s = "[";
  for (std::size_t i = 0; i < n; ++i) {
    if (i) s += ", ";
    s += "{\"id\": ";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ", \"role\": \"";
    s += (i % 3 == 0) ? "admin" : "viewer";
    s += "\", \"active\": ";
    s += (i % 2 == 0) ? "true" : "false";
    s += ", \"score\": ";
    s += std::to_string(static_cast<std::uint64_t>(i % 100));
    s += ".25, \"pair\": [";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ", -1]}";
  }
  s += "]";
  return s;
}

std::string make_nested(std::size_t depth) {
  std::string s;
  for (std::size_t i = 0; i < depth; ++i) s += "[1, ";
  s += "\"leaf\"";
  for (std::size_t i = 0; i < depth; ++i) s += "]";
  return s;
}

bool load_shapes(const bench_options& opt, std::vector<shape>& out) {
  for (const char* file : {"object_test.json", "array_test.json"}) {
    const std::string path = opt.sample_dir + "/" + file;
    shape sh;
    sh.name = std::string_view(file).substr(0, std::string_view(file).find('.'));
    if (!rdjson_bench::read_file(path, sh.text)) {
      std::cerr << "failed to read sample: " << path << "\n";
      return false;
    }
    out.push_back(std::move(sh));
  }

  out.push_back({"records", make_records(opt.records)});
  out.push_back({"nested", make_nested(200)});

  // The renderer's own output, trailing commas included.
  const auto records = rdjson::parse(out[2].text);
  if (records.err) {
    std::cerr << "records shape: " << rdjson::format_error(records.err) << "\n";
    return false;
  }
  out.push_back({"records_pretty", rdjson::dump(records.doc)});
  return true;
}

void bench_shape(const shape& sh, const bench_options& opt) {
  rdjson::parse_options lenient;
  rdjson::parse_options strict;
  strict.strict = true;

  const auto parsed = rdjson::parse(sh.text, lenient);
  if (parsed.err) {
    std::cerr << sh.name << ": " << rdjson::format_error(parsed.err) << "\n";
    return;
  }

  rdjson_bench::print_row(sh.name, "parse(lenient)", rdjson_bench::measure(opt.rounds, opt.passes, [&] {
                            const auto r = rdjson::parse(sh.text, lenient);
                            rdjson_bench::keep(r.doc.size());
                            return sh.text.size();
                          }));

  const auto strict_check = rdjson::parse(sh.text, strict);
  if (strict_check.err) {
    rdjson_bench::print_skipped(sh.name, "parse(strict)", rdjson::error_message(strict_check.err.code));
  } else {
    rdjson_bench::print_row(sh.name, "parse(strict)", rdjson_bench::measure(opt.rounds, opt.passes, [&] {
                              const auto r = rdjson::parse(sh.text, strict);
                              rdjson_bench::keep(r.doc.size());
                              return sh.text.size();
                            }));
  }

  std::string out;
  rdjson_bench::print_row(sh.name, "dump", rdjson_bench::measure(opt.rounds, opt.passes, [&] {
                            out.clear();
                            rdjson::dump_to(out, parsed.doc);
                            rdjson_bench::keep(out.size());
                            return out.size();
                          }));

  rdjson_bench::print_row(sh.name, "dump_compact", rdjson_bench::measure(opt.rounds, opt.passes, [&] {
                            const std::string s = rdjson::dump_compact(parsed.doc);
                            rdjson_bench::keep(s.size());
                            return s.size();
                          }));
}

void usage() {
  std::cerr << "usage: rdjson_bench [--rounds N] [--passes N] [--records N] [--samples DIR]\n";
}

} // namespace

int main(int argc, char** argv) {
  bench_options opt;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if (i + 1 >= argc) {
      usage();
      return 2;
    }
    try {
      if (arg == "--rounds") {
        opt.rounds = static_cast<std::size_t>(std::stoull(argv[++i]));
      } else if (arg == "--passes") {
        opt.passes = static_cast<std::size_t>(std::stoull(argv[++i]));
      } else if (arg == "--records") {
        opt.records = static_cast<std::size_t>(std::stoull(argv[++i]));
      } else if (arg == "--samples") {
        opt.sample_dir = argv[++i];
      } else {
        std::cerr << "unknown option: " << arg << "\n";
        usage();
        return 2;
      }
    } catch (const std::exception& ex) {
      std::cerr << "bad value for " << arg << ": " << ex.what() << "\n";
      return 2;
    }
  }

  std::vector<shape> shapes;
  if (!load_shapes(opt, shapes)) return 2;

  for (const auto& sh : shapes) {
    std::cout << sh.name << ": " << sh.text.size() << " bytes\n";
  }
  std::cout << "rounds=" << opt.rounds << " passes=" << opt.passes << "\n\n";

  rdjson_bench::print_header();
  for (const auto& sh : shapes) bench_shape(sh, opt);
  return 0;
}
