// benchmarks/bench_all.cpp
// Unified benchmark: spool::json vs nlohmann/json vs yyjson vs simdjson vs
// RapidJSON. "Walk" visits every scalar with each library's streaming or
// lazy API; "Tree" builds each library's in-memory document.
//
// Usage:
//   ./bench_all [file.json]     # single file (default: twitter.json)
//   ./bench_all --all           # run all 4 standard files sequentially

#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <rapidjson/document.h>
#include <rapidjson/reader.h>
#include <simdjson.h>
#include <spool_json/spool_json.hpp>
#include <yyjson.h>

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// ── Scalar counters, one per library ──────────────────────────────────────

static size_t walk_spool(spool::json::JsonReader &reader) {
  using spool::json::Token;
  size_t scalars = 0;
  while (true) {
    switch (reader.peek()) {
    case Token::BeginArray:
      reader.begin_array();
      break;
    case Token::EndArray:
      reader.end_array();
      break;
    case Token::BeginObject:
      reader.begin_object();
      break;
    case Token::EndObject:
      reader.end_object();
      break;
    case Token::Name:
      (void)reader.next_name();
      break;
    case Token::String:
      (void)reader.next_string();
      ++scalars;
      break;
    case Token::Number:
      (void)reader.next_double();
      ++scalars;
      break;
    case Token::Boolean:
      (void)reader.next_boolean();
      ++scalars;
      break;
    case Token::Null:
      reader.next_null();
      ++scalars;
      break;
    case Token::EndDocument:
      return scalars;
    }
  }
}

class NlohmannCounter : public nlohmann::json_sax<nlohmann::json> {
public:
  size_t scalars = 0;

  bool null() override { return ++scalars, true; }
  bool boolean(bool) override { return ++scalars, true; }
  bool number_integer(number_integer_t) override { return ++scalars, true; }
  bool number_unsigned(number_unsigned_t) override {
    return ++scalars, true;
  }
  bool number_float(number_float_t, const string_t &) override {
    return ++scalars, true;
  }
  bool string(string_t &) override { return ++scalars, true; }
  bool binary(binary_t &) override { return ++scalars, true; }
  bool start_object(std::size_t) override { return true; }
  bool key(string_t &) override { return true; }
  bool end_object() override { return true; }
  bool start_array(std::size_t) override { return true; }
  bool end_array() override { return true; }
  bool parse_error(std::size_t, const std::string &,
                   const nlohmann::detail::exception &) override {
    return false;
  }
};

struct RapidCounter
    : rapidjson::BaseReaderHandler<rapidjson::UTF8<>, RapidCounter> {
  size_t scalars = 0;

  bool Null() { return ++scalars, true; }
  bool Bool(bool) { return ++scalars, true; }
  bool Int(int) { return ++scalars, true; }
  bool Uint(unsigned) { return ++scalars, true; }
  bool Int64(int64_t) { return ++scalars, true; }
  bool Uint64(uint64_t) { return ++scalars, true; }
  bool Double(double) { return ++scalars, true; }
  bool String(const char *, rapidjson::SizeType, bool) {
    return ++scalars, true;
  }
  bool Key(const char *, rapidjson::SizeType, bool) { return true; }
};

static size_t walk_simdjson(simdjson::ondemand::value value) {
  size_t scalars = 0;
  simdjson::ondemand::json_type type = value.type();
  switch (type) {
  case simdjson::ondemand::json_type::array:
    for (auto child : value.get_array())
      scalars += walk_simdjson(child.value());
    return scalars;
  case simdjson::ondemand::json_type::object:
    for (auto field : value.get_object())
      scalars += walk_simdjson(field.value());
    return scalars;
  case simdjson::ondemand::json_type::number:
    (void)double(value.get_double());
    return 1;
  case simdjson::ondemand::json_type::string:
    (void)std::string_view(value.get_string());
    return 1;
  case simdjson::ondemand::json_type::boolean:
    (void)bool(value.get_bool());
    return 1;
  default:
    (void)bool(value.is_null());
    return 1;
  }
}

static size_t walk_yyjson(yyjson_val *value) {
  size_t scalars = 0;
  size_t idx, max;
  if (yyjson_is_arr(value)) {
    yyjson_val *child;
    yyjson_arr_foreach(value, idx, max, child) {
      scalars += walk_yyjson(child);
    }
    return scalars;
  }
  if (yyjson_is_obj(value)) {
    yyjson_val *key, *child;
    yyjson_obj_foreach(value, idx, max, key, child) {
      (void)key;
      scalars += walk_yyjson(child);
    }
    return scalars;
  }
  return 1;
}

// ── Benchmark one file ─────────────────────────────────────────────────────

static void run_file(const std::string &filename, size_t N) {
  std::string content;
  try {
    content = bench::read_file(filename.c_str());
  } catch (const std::exception &e) {
    std::cerr << "Skip " << filename << ": " << e.what() << "\n";
    return;
  }
  if (content.empty()) {
    std::cerr << "Skip " << filename << ": empty\n";
    return;
  }

  // Reference count of scalars every walk must agree with.
  size_t expected = 0;
  try {
    expected = walk_spool(*spool::json::JsonReader::of(content));
  } catch (const spool::json::JsonError &e) {
    std::cerr << "Skip " << filename << ": " << e.what() << "\n";
    return;
  }

  bench::print_header("bench_all - " + filename);
  std::cout << "Size: " << (content.size() / 1024.0) << " KB"
            << "  Scalars: " << expected << "  Iterations: " << N << "\n";
  bench::print_table_header();

  // ── 1. spool::json ───────────────────────────────────────────────────────
  {
    bool ok = true;
    bench::Timer wt, tt;
    wt.start();
    for (size_t i = 0; i < N; ++i)
      ok &= walk_spool(*spool::json::JsonReader::of(content)) == expected;
    double w_ns = wt.elapsed_ns() / N;

    tt.start();
    for (size_t i = 0; i < N; ++i)
      (void)spool::json::JsonReader::of(content)->read_json_value();
    double t_ns = tt.elapsed_ns() / N;

    // Correctness: the tree replayed through the tree reader walks the same
    auto tree = spool::json::JsonReader::of(content)->read_json_value();
    ok &= walk_spool(*spool::json::JsonReader::of_value(tree)) == expected;

    bench::Result{"spool::json", w_ns, t_ns, ok}.print();
  }

  // ── 2. nlohmann/json (SAX walk, DOM tree) ────────────────────────────────
  {
    bool ok = true;
    bench::Timer wt, tt;
    wt.start();
    for (size_t i = 0; i < N; ++i) {
      NlohmannCounter counter;
      ok &= nlohmann::json::sax_parse(content, &counter) &&
            counter.scalars == expected;
    }
    double w_ns = wt.elapsed_ns() / N;

    tt.start();
    for (size_t i = 0; i < N; ++i)
      (void)nlohmann::json::parse(content);
    double t_ns = tt.elapsed_ns() / N;

    bench::Result{"nlohmann", w_ns, t_ns, ok}.print();
  }

  // ── 3. yyjson (read, then visit) ─────────────────────────────────────────
  {
    bool ok = true;
    bench::Timer wt, tt;
    wt.start();
    for (size_t i = 0; i < N; ++i) {
      yyjson_doc *d = yyjson_read(content.c_str(), content.size(), 0);
      ok &= d && walk_yyjson(yyjson_doc_get_root(d)) == expected;
      yyjson_doc_free(d);
    }
    double w_ns = wt.elapsed_ns() / N;

    tt.start();
    for (size_t i = 0; i < N; ++i) {
      yyjson_doc *d = yyjson_read(content.c_str(), content.size(), 0);
      yyjson_doc_free(d);
    }
    double t_ns = tt.elapsed_ns() / N;

    bench::Result{"yyjson", w_ns, t_ns, ok}.print();
  }

  // ── 4. simdjson (On-Demand walk, DOM tree) ───────────────────────────────
  {
    bool ok = true;
    simdjson::padded_string padded(content);
    simdjson::ondemand::parser ondemand;
    simdjson::dom::parser dom;
    bench::Timer wt, tt;
    try {
      wt.start();
      for (size_t i = 0; i < N; ++i) {
        simdjson::ondemand::document doc = ondemand.iterate(padded);
        ok &= walk_simdjson(doc.get_value()) == expected;
      }
      double w_ns = wt.elapsed_ns() / N;

      tt.start();
      for (size_t i = 0; i < N; ++i)
        (void)simdjson::dom::element(dom.parse(padded));
      double t_ns = tt.elapsed_ns() / N;

      bench::Result{"simdjson", w_ns, t_ns, ok}.print();
    } catch (const simdjson::simdjson_error &e) {
      std::cerr << "  simdjson failed: " << e.what() << "\n";
    }
  }

  // ── 5. RapidJSON (Reader walk, Document tree) ────────────────────────────
  {
    bool ok = true;
    bench::Timer wt, tt;
    wt.start();
    for (size_t i = 0; i < N; ++i) {
      RapidCounter counter;
      rapidjson::Reader reader;
      rapidjson::StringStream ss(content.c_str());
      ok &= !reader.Parse(ss, counter).IsError() &&
            counter.scalars == expected;
    }
    double w_ns = wt.elapsed_ns() / N;

    tt.start();
    for (size_t i = 0; i < N; ++i) {
      rapidjson::Document d;
      d.Parse(content.c_str(), content.size());
    }
    double t_ns = tt.elapsed_ns() / N;

    bench::Result{"RapidJSON", w_ns, t_ns, ok}.print();
  }

  std::cout << "\n";
}

// ── main ──────────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
  const size_t N = 300;

  if (argc >= 2 && std::strcmp(argv[1], "--all") == 0) {
    const std::vector<std::string> files = {
        "twitter.json", "canada.json", "citm_catalog.json", "gsoc-2018.json"};
    for (const auto &f : files)
      run_file(f, N);
  } else {
    const std::string filename = (argc >= 2) ? argv[1] : "twitter.json";
    run_file(filename, N);
  }
  return 0;
}
