// benchmarks/bench_all.cpp
// drip::json vs nlohmann/json vs simdjson on standard JSON files.
// drip decodes one code point at a time; these numbers track regressions.
//
// Usage:
//   ./bench_all [file.json]     # single file (default: twitter.json)
//   ./bench_all --all           # run all 4 standard files sequentially

#include "utils.hpp"
#include <drip_json/drip_json.hpp>
#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------

static void run_file(const std::string &filename, size_t N) {
  std::string content;
  try {
    content = bench::read_file(filename);
  } catch (const std::exception &e) {
    std::cerr << "Skip " << filename << ": " << e.what() << "\n";
    return;
  }
  if (content.empty()) {
    std::cerr << "Skip " << filename << ": empty\n";
    return;
  }

  const size_t bytes = content.size();
  bench::print_table_header(filename, bytes, N);

  // 1. drip::json, UTF-8 entry point
  {
    bench::Timer pt, st;
    pt.start();
    for (size_t i = 0; i < N; ++i)
      (void)drip::json::decode(std::string_view(content));
    double p_ns = pt.elapsed_ns() / N;

    drip::json::Value doc = drip::json::decode(std::string_view(content));
    st.start();
    for (size_t i = 0; i < N; ++i)
      (void)doc.dump();
    double s_ns = st.elapsed_ns() / N;

    // Correctness: round-trip via nlohmann comparison
    std::string out = doc.dump();
    bool ok = false;
    try {
      ok = (nlohmann::json::parse(content) == nlohmann::json::parse(out));
    } catch (const nlohmann::json::exception &e) {
      std::cerr << "  nlohmann: " << e.what() << "\n";
    }
    if (!ok)
      std::cerr << "  drip verify FAIL (snippet: " << out.substr(0, 80)
                << "...)\n";

    bench::Row{"drip", bytes, p_ns, s_ns, ok}.print();
  }

  // 2. drip::json, code points pre-decoded, Decoder fed 4096 at a time
  {
    const drip::json::String text =
        drip::json::utf8_to_code_points(content);
    const size_t chunk = 4096;

    bench::Timer pt;
    pt.start();
    for (size_t i = 0; i < N; ++i) {
      drip::json::Decoder d;
      drip::json::StringView view(text);
      for (size_t pos = 0; pos < view.size(); pos += chunk)
        d.feed(view.substr(pos, chunk));
      (void)d.finish();
    }
    double p_ns = pt.elapsed_ns() / N;
    bench::Row{"drip (Decoder chunks)", bytes, p_ns, 0.0, true}.print();
  }

  // 3. simdjson (parse-only timing)
  {
    simdjson::dom::parser parser;
    simdjson::padded_string padded(content);

    bench::Timer pt;
    pt.start();
    for (size_t i = 0; i < N; ++i) {
      simdjson::dom::element doc;
      auto error = parser.parse(padded).get(doc);
      if (error) {
        std::cerr << "  simdjson: " << error << "\n";
        break;
      }
    }
    double p_ns = pt.elapsed_ns() / N;
    bench::Row{"simdjson (parse)", bytes, p_ns, 0.0, true}.print();
  }

  // 4. nlohmann/json (baseline)
  {
    bench::Timer pt, st;
    pt.start();
    for (size_t i = 0; i < N; ++i)
      (void)nlohmann::json::parse(content);
    double p_ns = pt.elapsed_ns() / N;

    nlohmann::json j = nlohmann::json::parse(content);
    st.start();
    for (size_t i = 0; i < N; ++i)
      (void)j.dump();
    double s_ns = st.elapsed_ns() / N;

    bench::Row{"nlohmann", bytes, p_ns, s_ns, true}.print();
  }

  std::cout << "\n";
}

// ---------------------------------------------------------------------------

int main(int argc, char **argv) {
  const size_t N = 30;

  std::vector<std::string> files;
  if (argc >= 2 && std::strcmp(argv[1], "--all") == 0)
    files = {"twitter.json", "canada.json", "citm_catalog.json",
             "gsoc-2018.json"};
  else
    files = {(argc >= 2) ? argv[1] : "twitter.json"};

  for (const auto &f : files) {
    try {
      run_file(f, N);
    } catch (const drip::json::ParseError &e) {
      std::cerr << f << ": " << e.format() << "\n";
      return 1;
    }
  }
  return 0;
}
