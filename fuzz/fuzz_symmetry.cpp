// fuzz_symmetry.cpp – libFuzzer target cross-checking the three decoders.
//
// For any input:
//   - skip() succeeds exactly when parse() of the first value does, and
//     reports the same error message when both fail.
//   - parse(input, path) equals try_parse(input).get(path), including the
//     error message when the document is malformed.
// A violation aborts so libFuzzer records the input.
//
// Build:
//   cmake -B build-fuzz -DJSONPORT_BUILD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++
//   cmake --build build-fuzz --target fuzz_symmetry
//
// Run:
//   ./build-fuzz/fuzz_symmetry fuzz/corpus/ -max_len=4096

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <jsonport/jsonport.hpp>
#include <string>
#include <string_view>

using namespace jsonport;

static void fail(const char *what, std::string_view input) {
    std::fprintf(stderr, "symmetry violation: %s\ninput: %.*s\n", what,
                 static_cast<int>(input.size()), input.data());
    std::abort();
}

// First-key / first-element walk of the parsed tree, so that paths which
// actually resolve get exercised and not just misses.
static Path derive_path(const Value &root, size_t max_len) {
    Path path;
    const Value *cur = &root;
    while (path.size() < max_len) {
        if (cur->is_object() && cur->size() > 0) {
            const Member &m = cur->as_object().begin()[0];
            path.push_back(m.key);
            cur = &m.value;
        } else if (cur->is_array() && cur->size() > 0) {
            path.push_back(cur->size() - 1);
            cur = &cur->as_array()[cur->size() - 1];
        } else {
            break;
        }
    }
    return path;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::string_view input(reinterpret_cast<const char *>(data), size);

    // ── 1. skip() vs parse() of the same prefix ──────────────────────────────
    std::string skip_error;
    size_t consumed = 0;
    try {
        consumed = skip(input);
    } catch (const Error &e) {
        skip_error = e.what();
    }
    if (skip_error.empty()) {
        // skip() stops after the first value; parse() must accept that prefix.
        Value prefix = try_parse(input.substr(0, consumed));
        if (!prefix.is_valid())
            fail("skip accepted a value parse rejects", input);
    } else {
        Value whole = try_parse(input);
        if (whole.is_valid())
            fail("parse accepted a value skip rejects", input);
        if (whole.error_message() != skip_error)
            fail("skip and parse disagree on the error", input);
    }

    // ── 2. Path-guided decode vs parse + get ─────────────────────────────────
    Value full = try_parse(input);
    const Path fixed[] = {Path{}, Path{"a"}, Path{0}, Path{"a", 0},
                          Path{1, "b"}};
    for (const Path &path : fixed) {
        if (!(try_parse(input, path) == full.get(path)))
            fail("path decode differs from parse + get", input);
    }
    if (full.is_valid()) {
        for (size_t len = 1; len <= 4; ++len) {
            const Path path = derive_path(full, len);
            if (!(try_parse(input, path) == full.get(path)))
                fail("path decode differs on a resolving path", input);
        }
    }

    return 0;
}
