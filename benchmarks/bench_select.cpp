// benchmarks/bench_select.cpp
// select_name() against next_name() + string compare on a record stream.
// Only depends on spool_json.
//
// Usage (from the build directory):
//   ./bench_select                 # generated input, 200 iterations
//   ./bench_select --iter 500      # custom iteration count
//   ./bench_select --file x.json   # an array of objects read from disk

#include "utils.hpp"

#include <spool_json/spool_json.hpp>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace spool::json;

static const Options kFields =
    Options::of({"id", "name", "email", "active", "score"});

static std::string generate_records(int count) {
    std::string json = "[";
    for (int i = 0; i < count; ++i) {
        if (i)
            json += ',';
        json += "{\"id\":" + std::to_string(i) + ",\"name\":\"user" +
                std::to_string(i) + "\",\"email\":\"user" +
                std::to_string(i) + "@example.com\",\"active\":" +
                (i % 3 ? "true" : "false") + ",\"score\":" +
                std::to_string(i * 0.25) + ",\"extra\":[1,2]}";
    }
    json += "]";
    return json;
}

// Both strategies sum the ids.
static int64_t read_with_select(const std::string &json) {
    int64_t sum = 0;
    auto reader = JsonReader::of(json);
    reader->begin_array();
    while (reader->has_next()) {
        reader->begin_object();
        while (reader->has_next()) {
            std::optional<size_t> field = reader->select_name(kFields);
            if (!field) {
                reader->skip_name();
                reader->skip_value();
            } else if (*field == 0) {
                sum += reader->next_long();
            } else {
                reader->skip_value();
            }
        }
        reader->end_object();
    }
    reader->end_array();
    return sum;
}

static int64_t read_with_names(const std::string &json) {
    int64_t sum = 0;
    auto reader = JsonReader::of(json);
    reader->begin_array();
    while (reader->has_next()) {
        reader->begin_object();
        while (reader->has_next()) {
            std::string name = reader->next_name();
            if (name == "id")
                sum += reader->next_long();
            else
                reader->skip_value();
        }
        reader->end_object();
    }
    reader->end_array();
    return sum;
}

static double measure(int64_t (*fn)(const std::string &),
                      const std::string &json, int N, int64_t expected,
                      bool &ok) {
    for (int i = 0; i < 5; ++i)
        ok &= fn(json) == expected;
    bench::Timer timer;
    timer.start();
    for (int i = 0; i < N; ++i)
        ok &= fn(json) == expected;
    return timer.elapsed_us() / N;
}

int main(int argc, char **argv) {
    int iterations = 200;
    const char *file = nullptr;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--iter") == 0 && i + 1 < argc)
            iterations = std::atoi(argv[++i]);
        else if (std::strcmp(argv[i], "--file") == 0 && i + 1 < argc)
            file = argv[++i];
    }
    if (iterations <= 0)
        iterations = 1;

    std::string json;
    try {
        json = file ? bench::read_file(file) : generate_records(10000);
    } catch (const std::runtime_error &e) {
        std::fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    try {
        const int64_t expected = read_with_names(json);
        bool names_ok = true;
        bool select_ok = true;
        double names_us =
            measure(read_with_names, json, iterations, expected, names_ok);
        double select_us =
            measure(read_with_select, json, iterations, expected, select_ok);

        bench::print_header("select_name vs next_name");
        std::printf("Input: %zu bytes, %d iterations\n\n", json.size(),
                    iterations);
        std::printf("%-24s %12s %8s\n", "Strategy", "us/doc", "check");
        std::printf("%-24s %12.2f %8s\n", "next_name + compare", names_us,
                    names_ok ? "PASS" : "FAIL");
        std::printf("%-24s %12.2f %8s\n", "select_name", select_us,
                    select_ok ? "PASS" : "FAIL");
        std::printf("\nspeedup: %.2fx\n", names_us / select_us);
    } catch (const JsonError &e) {
        std::fprintf(stderr, "Invalid input: %s\n", e.what());
        return 1;
    }
    return 0;
}
