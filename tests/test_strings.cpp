#include <gtest/gtest.h>
#include <spool_json/spool_json.hpp>
#include <string>
#include <tuple>

using namespace spool::json;

class StringDecode
    : public ::testing::TestWithParam<
          std::tuple<std::string, std::string, std::string>> {};

TEST_P(StringDecode, Decodes) {
  auto [name, json, expected] = GetParam();
  auto reader = JsonReader::of("[" + json + "]");
  reader->begin_array();
  EXPECT_EQ(reader->next_string(), expected) << "Failed case: " << name;
  reader->end_array();
}

INSTANTIATE_TEST_SUITE_P(
    Escapes, StringDecode,
    ::testing::Values(
        std::make_tuple("Plain", R"("hello")", "hello"),
        std::make_tuple("Empty", R"("")", ""),
        std::make_tuple("Simple", R"("\"\\\/\b\f\n\r\t")",
                        "\"\\/\b\f\n\r\t"),
        std::make_tuple("Ascii", R"("A")", "A"),
        std::make_tuple("TwoByte", R"("\u00e9")", "\xC3\xA9"),
        std::make_tuple("ThreeByte", R"("\u20ac")", "\xE2\x82\xAC"),
        std::make_tuple("SurrogatePair", R"("\ud83d\ude00")",
                        "\xF0\x9F\x98\x80"),
        std::make_tuple("LoneHigh", R"("\ud83dx")", "\xEF\xBF\xBDx"),
        std::make_tuple("LoneLow", R"("\ude00x")", "\xEF\xBF\xBDx"),
        std::make_tuple("HighThenNonLow", R"("\ud83dA")",
                        "\xEF\xBF\xBD"
                        "A"),
        std::make_tuple("RawUtf8", "\"h\xC3\xA9llo \xE2\x82\xAC\"",
                        "h\xC3\xA9llo \xE2\x82\xAC"),
        std::make_tuple("Nul", R"("a\u0000b")", std::string("a\0b", 3))));

TEST(Strings, EscapedNames) {
  auto reader = JsonReader::of(R"({"a\"b":1,"\u00fc":2})");
  reader->begin_object();
  EXPECT_EQ(reader->next_name(), "a\"b");
  EXPECT_EQ(reader->get_path(), "$.a\"b");
  EXPECT_EQ(reader->next_int(), 1);
  EXPECT_EQ(reader->next_name(), "\xC3\xBC");
  EXPECT_EQ(reader->next_int(), 2);
  reader->end_object();
}

TEST(Strings, InvalidEscapes) {
  for (const char *json : {R"(["\x"])", R"(["\u00G0"])", R"(["\u00)"}) {
    auto reader = JsonReader::of(json);
    reader->begin_array();
    EXPECT_THROW(reader->next_string(), EncodingError) << json;
  }
}

TEST(Strings, LenientInvalidEscapeKeepsCharacter) {
  ReaderOptions options;
  options.lenient = true;
  auto reader = JsonReader::of(R"(["\q"])", options);
  reader->begin_array();
  EXPECT_EQ(reader->next_string(), "q");
}

TEST(Strings, WriteQuoted) {
  EXPECT_EQ(detail::quoted("plain"), "\"plain\"");
  EXPECT_EQ(detail::quoted("a\"b\\c"), R"("a\"b\\c")");
  EXPECT_EQ(detail::quoted("\b\f\n\r\t"), R"("\b\f\n\r\t")");
  EXPECT_EQ(detail::quoted(std::string("\x01\x1f", 2)), R"("\u0001\u001f")");
  EXPECT_EQ(detail::quoted("\xE2\x80\xA8\xE2\x80\xA9"), R"("\u2028\u2029")");
  EXPECT_EQ(detail::quoted("caf\xC3\xA9"), "\"caf\xC3\xA9\"");
}

TEST(Strings, DumpEscapes) {
  JsonValue value(JsonArray{"a\"b\n\x01", "\xE2\x80\xA8"});
  EXPECT_EQ(value.dump(), R"(["a\"b\n\u0001","\u2028"])");
}
