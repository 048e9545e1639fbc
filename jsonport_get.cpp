#include <charconv>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <jsonport/jsonport.hpp>
#include <limits>
#include <string>

// Usage: jsonport_get [--string-as-number] [--all-as-bool] [--max-depth=N]
//                     <file|-> [key|index]...
//
// Decodes only what the path addresses and prints "TYPE value".

static bool is_index(const char *arg) {
  if (!*arg)
    return false;
  for (const char *p = arg; *p; ++p)
    if (*p < '0' || *p > '9')
      return false;
  return true;
}

// Decimal digits only; false on overflow.
static bool parse_count(const char *arg, int64_t &out) {
  if (!is_index(arg))
    return false;
  const char *end = arg + strlen(arg);
  auto [ptr, ec] = std::from_chars(arg, end, out);
  return ec == std::errc() && ptr == end;
}

static int usage() {
  std::cerr << "usage: jsonport_get [--string-as-number] [--all-as-bool]"
               " [--max-depth=N] <file|-> [key|index]...\n";
  return 2;
}

int main(int argc, char **argv) {
  jsonport::ParseOptions options;
  bool string_as_number = false;
  bool all_as_bool = false;

  int i = 1;
  for (; i < argc && strncmp(argv[i], "--", 2) == 0; ++i) {
    if (strcmp(argv[i], "--string-as-number") == 0) {
      string_as_number = true;
    } else if (strcmp(argv[i], "--all-as-bool") == 0) {
      all_as_bool = true;
    } else if (strncmp(argv[i], "--max-depth=", 12) == 0) {
      int64_t depth = 0;
      if (!parse_count(argv[i] + 12, depth)) {
        std::cerr << "invalid depth: " << argv[i] + 12 << "\n";
        return usage();
      }
      options.max_depth = static_cast<size_t>(depth);
    } else {
      std::cerr << "unknown option: " << argv[i] << "\n";
      return usage();
    }
  }
  if (i >= argc)
    return usage();

  const std::string source = argv[i++];
  jsonport::Path path;
  for (; i < argc; ++i) {
    int64_t index = 0;
    if (!is_index(argv[i]))
      path.push_back(std::string(argv[i]));
    else if (parse_count(argv[i], index))
      path.push_back(index);
    else
      // Beyond int64: no array is that long.
      path.push_back(std::numeric_limits<int64_t>::max());
  }

  try {
    jsonport::Value result;
    if (source == "-") {
      result = jsonport::decode_from(std::cin, path, options);
    } else {
      std::ifstream file(source, std::ios::binary);
      if (!file)
        throw jsonport::IoError("Cannot open: " + source);
      result = jsonport::decode_from(file, path, options);
    }
    result.set_string_as_number(string_as_number);
    result.set_all_as_bool(all_as_bool);

    std::cout << result << "\n";
    if (all_as_bool)
      std::cout << "bool: " << (result.as_bool() ? "true" : "false") << "\n";
    else if (string_as_number && result.is_string())
      std::cout << "number: " << result.as_double() << "\n";
    return result.is_valid() ? 0 : 1;
  } catch (const jsonport::ParseError &e) {
    std::cerr << source << ": " << e.format() << "\n";
  } catch (const jsonport::Error &e) {
    std::cerr << source << ": " << e.what() << "\n";
  }
  return 1;
}
