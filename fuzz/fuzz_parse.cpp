// fuzz_parse.cpp – libFuzzer target for the jsonport parse() API.
//
// Feeds arbitrary bytes to parse(), then walks whatever tree comes back
// through every accessor so that sticky errors and mode flags are hit too.
// AddressSanitizer + UBSanitizer flags are injected by the root
// CMakeLists.txt when JSONPORT_BUILD_FUZZ is ON.
//
// Build:
//   cmake -B build-fuzz \
//         -DJSONPORT_BUILD_FUZZ=ON \
//         -DJSONPORT_BUILD_TESTS=OFF \
//         -DCMAKE_CXX_COMPILER=clang++
//   cmake --build build-fuzz --target fuzz_parse
//
// Run (indefinitely):
//   ./build-fuzz/fuzz_parse fuzz/corpus/ -max_len=65536
//
// Reproduce a crash:
//   ./build-fuzz/fuzz_parse <crash-file>

#include <cstddef>
#include <cstdint>
#include <jsonport/jsonport.hpp>
#include <string_view>

using namespace jsonport;

static void touch(const Value &v, int depth) {
    (void)v.describe();
    (void)v.get_int();
    (void)v.get_double();
    (void)v.get_bool();
    (void)v.get_string();
    if (depth > 16)
        return;
    try {
        for (const Value &child : v.values())
            touch(child, depth + 1);
    } catch (const Error &) {
        // Scalars and Invalid have no children.
    }
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::string_view input(reinterpret_cast<const char *>(data), size);

    // ── 1. Default options ───────────────────────────────────────────────────
    Value v = try_parse(input);
    touch(v, 0);

    // ── 2. Mode flags on the same tree ───────────────────────────────────────
    Value flagged = v;
    flagged.set_string_as_number();
    flagged.set_all_as_bool();
    touch(flagged, 0);
    (void)flagged.get(0, "a", 1).get_bool();

    // ── 3. Strict: duplicates forbidden, shallow depth ───────────────────────
    ParseOptions opts;
    opts.allow_duplicate_keys = false;
    opts.max_depth = 8;
    touch(try_parse(input, opts), 0);

    return 0;
}
