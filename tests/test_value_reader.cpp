#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <spool_json/spool_json.hpp>
#include <string>

using namespace spool::json;

namespace {

JsonValue sample() {
  JsonObject object;
  object.put("id", 7);
  object.put("name", "widget");
  object.put("parts", JsonValue(JsonArray{true, nullptr, 2.5}));
  return JsonValue(std::move(object));
}

} // namespace

TEST(ValueReader, WalksTree) {
  auto reader = JsonReader::of_value(sample());
  EXPECT_EQ(reader->peek(), Token::BeginObject);
  reader->begin_object();
  EXPECT_TRUE(reader->has_next());
  EXPECT_EQ(reader->peek(), Token::Name);
  EXPECT_EQ(reader->next_name(), "id");
  EXPECT_EQ(reader->peek(), Token::Number);
  EXPECT_EQ(reader->next_long(), 7);
  EXPECT_EQ(reader->next_name(), "name");
  EXPECT_EQ(reader->next_string(), "widget");
  EXPECT_EQ(reader->next_name(), "parts");
  reader->begin_array();
  EXPECT_TRUE(reader->next_boolean());
  EXPECT_EQ(reader->peek(), Token::Null);
  reader->next_null();
  EXPECT_EQ(reader->next_double(), 2.5);
  EXPECT_FALSE(reader->has_next());
  EXPECT_EQ(reader->peek(), Token::EndArray);
  reader->end_array();
  EXPECT_FALSE(reader->has_next());
  reader->end_object();
  EXPECT_EQ(reader->peek(), Token::EndDocument);
}

TEST(ValueReader, StructuralMismatch) {
  auto reader = JsonReader::of_value(sample());
  try {
    reader->begin_array();
    FAIL() << "root is an object";
  } catch (const DataError &e) {
    EXPECT_EQ(std::string(e.what()),
              "Expected BEGIN_ARRAY but was BEGIN_OBJECT at path $");
  }
  reader->begin_object();
  EXPECT_THROW(reader->end_object(), DataError);
  EXPECT_THROW(reader->next_string(), DataError);
  reader->next_name();
  EXPECT_THROW(reader->next_boolean(), DataError);
}

TEST(ValueReader, ValueMismatchReportsValueAndKind) {
  auto reader = JsonReader::of_value(JsonValue(JsonArray{"abc", 0.5}));
  reader->begin_array();
  try {
    reader->next_long();
    FAIL() << "abc is not a long";
  } catch (const DataError &e) {
    EXPECT_EQ(std::string(e.what()),
              "Expected a long but was \"abc\", a string, at path $[0]");
  }
  EXPECT_EQ(reader->next_string(), "abc");
  EXPECT_EQ(reader->next_string(), "0.5");
  reader->end_array();
}

TEST(ValueReader, PromoteNameToValue) {
  JsonObject object;
  object.put("5", "x");
  auto reader = JsonReader::of_value(JsonValue(std::move(object)));
  reader->begin_object();
  reader->promote_name_to_value();
  EXPECT_EQ(reader->peek(), Token::String);
  EXPECT_EQ(reader->get_path(), "$.5");
  EXPECT_EQ(reader->next_int(), 5);
  EXPECT_EQ(reader->next_string(), "x");
  EXPECT_FALSE(reader->has_next());
  reader->end_object();
}

TEST(ValueReader, PromoteNameOnStreamingReader) {
  auto reader = JsonReader::of(R"({"5":"x"})");
  reader->begin_object();
  reader->promote_name_to_value();
  EXPECT_EQ(reader->peek(), Token::String);
  EXPECT_EQ(reader->next_int(), 5);
  EXPECT_EQ(reader->next_string(), "x");
  reader->end_object();
}

TEST(ValueReader, NonFiniteNeedsLenient) {
  JsonValue tree(JsonArray{std::numeric_limits<double>::quiet_NaN()});
  auto strict = JsonReader::of_value(tree);
  strict->begin_array();
  try {
    strict->next_double();
    FAIL() << "NaN must be rejected in strict mode";
  } catch (const DataError &e) {
    EXPECT_EQ(std::string(e.what()),
              "JSON forbids NaN and infinities: NaN at path $[0]");
  }

  ReaderOptions options;
  options.lenient = true;
  auto lenient = JsonReader::of_value(tree, options);
  lenient->begin_array();
  EXPECT_TRUE(std::isnan(lenient->next_double()));
}

TEST(ValueReader, SelectString) {
  Options options = Options::of({"red", "green"});
  auto reader = JsonReader::of_value(JsonValue(JsonArray{"green", "blue"}));
  reader->begin_array();
  EXPECT_EQ(reader->select_string(options), std::optional<size_t>(1));
  EXPECT_EQ(reader->select_string(options), std::nullopt);
  EXPECT_EQ(reader->next_string(), "blue");
  reader->end_array();
}

TEST(ValueReader, ClosedReaderIsLogicError) {
  auto reader = JsonReader::of_value(sample());
  reader->begin_object();
  reader->close();
  EXPECT_EQ(reader->get_path(), "$");
  EXPECT_THROW(reader->peek(), std::logic_error);
  EXPECT_THROW(reader->has_next(), std::logic_error);
}

TEST(ValueReader, ScalarRoot) {
  auto reader = JsonReader::of_value(JsonValue("alone"));
  EXPECT_TRUE(reader->has_next());
  EXPECT_EQ(reader->next_string(), "alone");
  EXPECT_FALSE(reader->has_next());
  EXPECT_EQ(reader->peek(), Token::EndDocument);
  EXPECT_THROW(reader->next_string(), DataError);
}
