// fuzz_reader.cpp – libFuzzer target for spool::json::JsonReader.
//
// Feeds arbitrary bytes through the streaming reader in strict and lenient
// mode and cross-checks the whole-value operations against each other:
//   - read_json_value() replayed through the tree reader must dump the same
//   - next_source() of a strict value must re-read to the same tree
//   - a raw token walk must never hit anything but JsonError
// AddressSanitizer + UBSanitizer are injected by the SPOOL_JSON_BUILD_FUZZ
// section of the root CMakeLists.txt.
//
// Build:
//   cmake -B build-fuzz \
//         -DSPOOL_JSON_BUILD_FUZZ=ON \
//         -DSPOOL_JSON_BUILD_TESTS=OFF \
//         -DCMAKE_CXX_COMPILER=clang++
//   cmake --build build-fuzz --target fuzz_reader
//
// Run (indefinitely):
//   ./build-fuzz/fuzz_reader fuzz/corpus/ -max_len=65536

#include <spool_json/spool_json.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

using namespace spool::json;

namespace {

// Walks every token with the primitive operations only.
void walk(JsonReader &reader) {
    size_t depth = 0;
    while (true) {
        switch (reader.peek()) {
        case Token::BeginArray:
            reader.begin_array();
            ++depth;
            break;
        case Token::BeginObject:
            reader.begin_object();
            ++depth;
            break;
        case Token::EndArray:
            reader.end_array();
            --depth;
            break;
        case Token::EndObject:
            reader.end_object();
            --depth;
            break;
        case Token::Name:
            reader.next_name();
            break;
        case Token::String:
            reader.next_string();
            break;
        case Token::Number:
            reader.next_string();
            break;
        case Token::Boolean:
            reader.next_boolean();
            break;
        case Token::Null:
            reader.next_null();
            break;
        case Token::EndDocument:
            if (depth != 0)
                __builtin_trap();
            return;
        }
        (void)reader.get_path();
    }
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::string input(reinterpret_cast<const char *>(data), size);

    for (bool lenient : {false, true}) {
        ReaderOptions options;
        options.lenient = lenient;

        // ── 1. Materialize, then replay through the tree reader ─────────────
        try {
            auto reader = JsonReader::of(input, options);
            JsonValue value = reader->read_json_value();
            auto replay = JsonReader::of_value(value, options);
            if (replay->read_json_value().dump() != value.dump())
                __builtin_trap();

            // ── 2. Raw bytes of a strict value re-read to the same tree ────
            if (!lenient) {
                auto source = JsonReader::of(input, options);
                std::string raw(source->next_source());
                if (JsonReader::of(raw, options)->read_json_value().dump() !=
                    value.dump())
                    __builtin_trap();
            }
        } catch (const JsonError &) {
            // Expected for malformed input.
        }

        // ── 3. Primitive token walk ─────────────────────────────────────────
        try {
            auto reader = JsonReader::of(input, options);
            walk(*reader);
        } catch (const JsonError &) {}

        // ── 4. Skip, with a lookahead snapshot taken first ─────────────────
        try {
            auto reader = JsonReader::of(input, options);
            auto peek = reader->peek_json();
            peek->skip_value();
            reader->skip_value();
        } catch (const JsonError &) {}
    }
    return 0;
}
