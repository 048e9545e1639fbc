// benchmarks/bench_path.cpp
// Full parse + get() against path-guided decode, with nlohmann/json
// parse + operator[] as the reference row.
//
// Usage (from the build directory):
//   ./benchmarks/bench_path                 # synthetic document
//   ./benchmarks/bench_path twitter.json    # any file; path "statuses",0,"id"
//   ./benchmarks/bench_path --iter 500

#include "utils.hpp"
#include <cstdlib>
#include <cstring>
#include <jsonport/jsonport.hpp>
#include <nlohmann/json.hpp>
#include <string>

// Shaped like twitter.json so the same path works on both.
static std::string synthetic_document(int statuses) {
  std::string json = "{\"statuses\":[";
  for (int i = 0; i < statuses; ++i) {
    if (i)
      json += ",";
    json += "{\"id\":" + std::to_string(1000000 + i) +
            ",\"text\":\"status text with \\\"escapes\\\" and \\u00e9\","
            "\"user\":{\"name\":\"user" +
            std::to_string(i) +
            "\",\"followers\":[1,2,3,4,5]},\"retweeted\":false,"
            "\"score\":" +
            std::to_string(i) + ".5}";
  }
  json += "],\"search_metadata\":{\"count\":" + std::to_string(statuses) +
          "}}";
  return json;
}

int main(int argc, char **argv) {
  const char *filename = nullptr;
  size_t iterations = 2000;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--iter") == 0 && i + 1 < argc)
      iterations = static_cast<size_t>(atoi(argv[++i]));
    else
      filename = argv[i];
  }

  std::string json_content =
      filename ? bench::read_file_or_empty(filename) : synthetic_document(500);
  if (json_content.empty()) {
    std::cerr << "Cannot read " << filename << "\n";
    return 1;
  }

  bench::print_header("Path Extraction Benchmark");
  std::cout << "Input: " << (filename ? filename : "synthetic") << " ("
            << (json_content.size() / 1024.0) << " KB), path statuses/0/id, "
            << iterations << " iterations\n\n";
  bench::print_table_header();

  const jsonport::Path path{"statuses", 0, "id"};

  // 1. jsonport
  {
    const int64_t expected = jsonport::parse(json_content).get(path).as_int();

    bench::Timer full_timer, path_timer;
    int64_t sink = 0;

    full_timer.start();
    for (size_t i = 0; i < iterations; ++i)
      sink += jsonport::parse(json_content).get(path).as_int();
    double full_ns = full_timer.elapsed_ns() / iterations;

    path_timer.start();
    for (size_t i = 0; i < iterations; ++i)
      sink += jsonport::parse(json_content, path).as_int();
    double path_ns = path_timer.elapsed_ns() / iterations;

    bool correct =
        sink == expected * static_cast<int64_t>(2 * iterations) &&
        jsonport::parse(json_content, path) ==
            jsonport::parse(json_content).get(path);
    bench::Result{"jsonport", full_ns, path_ns, correct}.print();
  }

  // 2. jsonport skip only (validation cost floor)
  {
    bench::Timer timer;
    size_t consumed = 0;
    timer.start();
    for (size_t i = 0; i < iterations; ++i)
      consumed += jsonport::skip(json_content);
    double skip_ns = timer.elapsed_ns() / iterations;
    bench::Result{"jsonport skip", skip_ns, skip_ns,
                  consumed == json_content.size() * iterations}
        .print();
  }

  // 3. nlohmann/json
  {
    bench::Timer timer;
    int64_t sink = 0;
    timer.start();
    for (size_t i = 0; i < iterations; ++i) {
      nlohmann::json doc = nlohmann::json::parse(json_content);
      sink += doc["statuses"][0]["id"].get<int64_t>();
    }
    double full_ns = timer.elapsed_ns() / iterations;
    const int64_t expected =
        jsonport::parse(json_content, path).as_int();
    bench::Result{"nlohmann", full_ns, full_ns,
                  sink == expected * static_cast<int64_t>(iterations)}
        .print();
  }

  return 0;
}
