#include <gtest/gtest.h>
#include <spool_json/spool_json.hpp>
#include <string>

using namespace spool::json;

TEST(PeekJson, SnapshotAdvancesIndependently) {
  auto reader = JsonReader::of(R"({"a":1,"b":[true]})");
  reader->begin_object();

  auto peek = reader->peek_json();
  EXPECT_EQ(peek->get_path(), "$.");
  EXPECT_EQ(peek->next_name(), "a");
  EXPECT_EQ(peek->next_int(), 1);
  EXPECT_EQ(peek->next_name(), "b");
  EXPECT_EQ(peek->get_path(), "$.b");
  EXPECT_EQ(reader->get_path(), "$.");

  EXPECT_EQ(reader->next_name(), "a");
  EXPECT_EQ(reader->next_int(), 1);
  EXPECT_EQ(reader->next_name(), "b");
  reader->begin_array();
  EXPECT_TRUE(reader->next_boolean());
  reader->end_array();
  reader->end_object();
}

TEST(PeekJson, SnapshotOfPendingNumber) {
  auto reader = JsonReader::of("[123.5, 2]");
  reader->begin_array();
  auto peek = reader->peek_json();
  EXPECT_EQ(peek->next_double(), 123.5);
  EXPECT_EQ(peek->next_int(), 2);
  peek->end_array();
  EXPECT_EQ(peek->peek(), Token::EndDocument);

  EXPECT_EQ(reader->peek(), Token::Number);
  EXPECT_EQ(reader->next_string(), "123.5");
  EXPECT_EQ(reader->next_int(), 2);
}

TEST(PeekJson, SnapshotReadsWholeDocument) {
  const std::string json = R"({"list":[1,"two",{"three":null}],"flag":false})";
  auto reader = JsonReader::of(json);
  auto peek = reader->peek_json();
  JsonValue ahead = peek->read_json_value();
  JsonValue value = reader->read_json_value();
  EXPECT_EQ(ahead, value);
}

TEST(PeekJson, StaleSnapshotIsLogicError) {
  auto reader = JsonReader::of(R"(["x","y"])");
  reader->begin_array();
  auto peek = reader->peek_json();
  EXPECT_EQ(reader->next_string(), "x");
  EXPECT_THROW(peek->peek(), std::logic_error);
  EXPECT_THROW(peek->next_string(), std::logic_error);
}

TEST(PeekJson, OriginCloseInvalidatesSnapshot) {
  auto reader = JsonReader::of("[1]");
  auto peek = reader->peek_json();
  reader->close();
  EXPECT_THROW(peek->begin_array(), std::logic_error);
}

TEST(PeekJson, ClosingSnapshotLeavesOriginOpen) {
  auto reader = JsonReader::of("[1, 2]");
  reader->begin_array();
  {
    auto peek = reader->peek_json();
    EXPECT_EQ(peek->next_int(), 1);
    peek->close();
    EXPECT_THROW(peek->peek(), std::logic_error);
  }
  EXPECT_EQ(reader->next_int(), 1);
  EXPECT_EQ(reader->next_int(), 2);
  reader->end_array();
}

TEST(PeekJson, CopiesFlagsNotTags) {
  ReaderOptions options;
  options.lenient = true;
  options.fail_on_unknown = true;
  auto reader = JsonReader::of("[a]", options);
  reader->set_tag<std::string>("origin");

  auto peek = reader->peek_json();
  EXPECT_TRUE(peek->lenient());
  EXPECT_TRUE(peek->fail_on_unknown());
  EXPECT_EQ(peek->tag<std::string>(), nullptr);
  ASSERT_NE(reader->tag<std::string>(), nullptr);
  EXPECT_EQ(*reader->tag<std::string>(), "origin");

  peek->set_lenient(false);
  EXPECT_TRUE(reader->lenient());
}

TEST(PeekJson, NestedSnapshots) {
  auto reader = JsonReader::of("[1, 2, 3]");
  reader->begin_array();
  auto first = reader->peek_json();
  EXPECT_EQ(first->next_int(), 1);
  auto second = first->peek_json();
  EXPECT_EQ(second->next_int(), 2);
  EXPECT_EQ(first->next_int(), 2);
  EXPECT_EQ(second->next_int(), 3);
  EXPECT_EQ(reader->next_int(), 1);
}

TEST(PeekJson, TreeSnapshotSurvivesOrigin) {
  auto reader = JsonReader::of_value(
      JsonReader::of(R"({"a":[1,2]})")->read_json_value());
  reader->begin_object();
  EXPECT_EQ(reader->next_name(), "a");
  reader->begin_array();
  auto peek = reader->peek_json();
  EXPECT_EQ(peek->get_path(), "$.a[0]");

  EXPECT_EQ(reader->next_int(), 1);
  EXPECT_EQ(reader->next_int(), 2);
  reader->end_array();
  reader->end_object();
  reader->close();

  EXPECT_EQ(peek->next_int(), 1);
  EXPECT_EQ(peek->next_int(), 2);
  peek->end_array();
  EXPECT_EQ(peek->get_path(), "$.a");
  peek->end_object();
}
