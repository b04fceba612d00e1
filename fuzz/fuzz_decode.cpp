// fuzz_decode.cpp - libFuzzer target for the drip::json decode() API.
//
// Feeds arbitrary byte sequences through the UTF-8 entry point, with and
// without surrogate combining, and pushes the same code points through a
// Decoder in two chunks. AddressSanitizer + UBSanitizer are injected by the
// root CMakeLists.txt when DRIP_JSON_BUILD_FUZZ is ON.
//
// Build:
//   cmake -B build-fuzz \
//         -DDRIP_JSON_BUILD_FUZZ=ON \
//         -DDRIP_JSON_BUILD_TESTS=OFF \
//         -DDRIP_JSON_BUILD_BENCHMARKS=OFF \
//         -DCMAKE_CXX_COMPILER=clang++
//   cmake --build build-fuzz --target fuzz_decode
//
// Run (indefinitely):
//   ./build-fuzz/fuzz_decode fuzz/corpus/ -max_len=65536
//
// Reproduce a crash:
//   ./build-fuzz/fuzz_decode <crash-file>

#include <drip_json/drip_json.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace drip::json;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::string_view input(reinterpret_cast<const char *>(data), size);

    // 1. Default options. ParseError derives from std::runtime_error.
    std::optional<Value> whole;
    try {
        whole = decode(input);
    } catch (const std::runtime_error &) {
        // Expected for malformed input.
    }

    // 2. Surrogate escapes kept as separate units, shallow depth limit
    try {
        ParseOptions opts;
        opts.combine_surrogates = false;
        opts.max_depth = 16;
        Value v = decode(input, opts);
        (void)v;
    } catch (const std::runtime_error &) {}

    // 3. Same input split at an arbitrary point must give the same answer
    String text;
    try {
        text = utf8_to_code_points(input);
    } catch (const ParseError &) {
        return 0;
    }
    const size_t split = text.empty() ? 0 : data[0] % (text.size() + 1);
    std::optional<Value> chunked;
    try {
        Decoder d;
        d.feed(StringView(text).substr(0, split));
        d.feed(StringView(text).substr(split));
        chunked = d.finish();
    } catch (const std::runtime_error &) {}

    if (whole.has_value() != chunked.has_value())
        std::abort();
    if (whole && !(*whole == *chunked))
        std::abort();

    // 4. dump() output decodes back to a value with the same dump()
    if (whole) {
        const std::string out = whole->dump();
        if (decode(out).dump() != out)
            std::abort();
    }

    return 0;
}
