#include <gtest/gtest.h>
#include <memory>
#include <spool_json/spool_json.hpp>
#include <string>

using namespace spool::json;

// Every path test runs against the streaming reader and the tree reader.
enum class Backend { Stream, Tree };

class PathTest : public ::testing::TestWithParam<Backend> {
protected:
  std::unique_ptr<JsonReader> open(const std::string &json) {
    if (GetParam() == Backend::Stream)
      return JsonReader::of(json);
    return JsonReader::of_value(JsonReader::of(json)->read_json_value());
  }
};

TEST_P(PathTest, NestedObjectInsideArray) {
  auto reader = open(R"({"a":[1,2,{"b":3}]})");
  EXPECT_EQ(reader->get_path(), "$");
  reader->begin_object();
  EXPECT_EQ(reader->get_path(), "$.");
  EXPECT_EQ(reader->next_name(), "a");
  EXPECT_EQ(reader->get_path(), "$.a");
  reader->begin_array();
  EXPECT_EQ(reader->get_path(), "$.a[0]");
  EXPECT_EQ(reader->next_int(), 1);
  EXPECT_EQ(reader->get_path(), "$.a[1]");
  EXPECT_EQ(reader->next_int(), 2);
  EXPECT_EQ(reader->get_path(), "$.a[2]");
  reader->begin_object();
  EXPECT_EQ(reader->next_name(), "b");
  EXPECT_EQ(reader->get_path(), "$.a[2].b");
  EXPECT_EQ(reader->next_int(), 3);
  EXPECT_EQ(reader->get_path(), "$.a[2].b");
  reader->end_object();
  EXPECT_EQ(reader->get_path(), "$.a[3]");
  reader->end_array();
  EXPECT_EQ(reader->get_path(), "$.a");
  reader->end_object();
  EXPECT_EQ(reader->get_path(), "$");
  EXPECT_EQ(reader->peek(), Token::EndDocument);
}

TEST_P(PathTest, SkippedNamesReadAsNull) {
  auto reader = open(R"({"a":{"x":[1,2]},"b":2})");
  reader->begin_object();
  reader->skip_name();
  EXPECT_EQ(reader->get_path(), "$.null");
  reader->skip_value();
  EXPECT_EQ(reader->get_path(), "$.null");
  EXPECT_EQ(reader->next_name(), "b");
  EXPECT_EQ(reader->get_path(), "$.b");
  EXPECT_EQ(reader->next_int(), 2);
  reader->end_object();
}

TEST_P(PathTest, SkippedArrayElementsAdvanceIndex) {
  auto reader = open(R"([1,[2,3],4])");
  reader->begin_array();
  reader->skip_value();
  EXPECT_EQ(reader->get_path(), "$[1]");
  reader->skip_value();
  EXPECT_EQ(reader->get_path(), "$[2]");
  EXPECT_EQ(reader->next_int(), 4);
  EXPECT_EQ(reader->get_path(), "$[3]");
  reader->end_array();
}

TEST_P(PathTest, ErrorsCarryPath) {
  auto reader = open(R"({"a":[true]})");
  reader->begin_object();
  reader->next_name();
  reader->begin_array();
  try {
    reader->next_string();
    FAIL() << "reading a boolean as a string must throw";
  } catch (const DataError &e) {
    EXPECT_EQ(std::string(e.what()),
              "Expected a string but was BOOLEAN at path $.a[0]");
  }
  // The failed call consumed nothing.
  EXPECT_TRUE(reader->next_boolean());
  EXPECT_EQ(reader->get_path(), "$.a[1]");
}

TEST_P(PathTest, EmptyContainers) {
  auto reader = open(R"([[],{}])");
  reader->begin_array();
  reader->begin_array();
  EXPECT_EQ(reader->get_path(), "$[0][0]");
  EXPECT_FALSE(reader->has_next());
  reader->end_array();
  EXPECT_EQ(reader->get_path(), "$[1]");
  reader->begin_object();
  EXPECT_EQ(reader->get_path(), "$[1].");
  EXPECT_FALSE(reader->has_next());
  reader->end_object();
  EXPECT_EQ(reader->get_path(), "$[2]");
  reader->end_array();
}

INSTANTIATE_TEST_SUITE_P(Readers, PathTest,
                         ::testing::Values(Backend::Stream, Backend::Tree));
