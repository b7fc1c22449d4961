#include <algorithm>
#include <cstring>
#include <gtest/gtest.h>
#include <memory>
#include <spool_json/spool_json.hpp>
#include <sstream>
#include <string>

using namespace spool::json;

namespace {

// Hands out at most `chunk` bytes per read.
class ChunkedSource : public Source {
public:
  ChunkedSource(std::string data, size_t chunk)
      : data_(std::move(data)), chunk_(chunk) {}

  size_t read(char *dst, size_t n) override {
    size_t count = std::min({n, chunk_, data_.size() - pos_});
    std::memcpy(dst, data_.data() + pos_, count);
    pos_ += count;
    return count;
  }

  void close() override { *closed_ = true; }

  std::shared_ptr<bool> closed_flag() const { return closed_; }

private:
  std::string data_;
  size_t chunk_;
  size_t pos_ = 0;
  std::shared_ptr<bool> closed_ = std::make_shared<bool>(false);
};

std::unique_ptr<JsonReader> chunked(const std::string &json, size_t chunk) {
  return JsonReader::of(std::make_unique<ChunkedSource>(json, chunk));
}

std::string big_array(int count) {
  std::string json = "[";
  for (int i = 0; i < count; ++i) {
    if (i)
      json += ", ";
    json += "\"item-" + std::to_string(i) + "\"";
  }
  json += "]";
  return json;
}

} // namespace

TEST(Streaming, OneByteSourceMatchesString) {
  const std::string json =
      R"({"a": [1, -2.5e-3, "xéy", true, null], "b": {"c": {}}})";
  JsonValue expected = JsonReader::of(json)->read_json_value();
  JsonValue actual = chunked(json, 1)->read_json_value();
  EXPECT_EQ(actual, expected);
}

TEST(Streaming, LongStringSpansSegments) {
  const std::string payload(3 * SourceBuffer::kSegmentSize + 17, 'x');
  const std::string json = "[\"" + payload + "\", 1]";
  auto reader = chunked(json, 7);
  reader->begin_array();
  EXPECT_EQ(reader->next_string(), payload);
  EXPECT_EQ(reader->next_int(), 1);
  reader->end_array();
}

TEST(Streaming, ManySmallValues) {
  const int count = 20000;
  auto reader = chunked(big_array(count), 3);
  reader->begin_array();
  int seen = 0;
  std::string last;
  while (reader->has_next()) {
    last = reader->next_string();
    ++seen;
  }
  reader->end_array();
  EXPECT_EQ(seen, count);
  EXPECT_EQ(last, "item-19999");
  EXPECT_EQ(reader->peek(), Token::EndDocument);
}

TEST(Streaming, SourceOfLargeComposite) {
  const std::string inner = big_array(5000);
  const std::string json = "{\"skip\": " + big_array(3000) +
                           ", \"keep\": " + inner + ", \"after\": 1}";
  auto reader = chunked(json, 5);
  reader->begin_object();
  EXPECT_EQ(reader->next_name(), "skip");
  reader->skip_value();
  EXPECT_EQ(reader->next_name(), "keep");
  EXPECT_EQ(std::string(reader->next_source()), inner);
  EXPECT_EQ(reader->next_name(), "after");
  EXPECT_EQ(reader->next_int(), 1);
  reader->end_object();
}

TEST(Streaming, SelectNameAcrossReads) {
  Options options = Options::of({"alpha", "beta"});
  auto reader = chunked(R"({"alpha":1,"beta":2,"gamma":3})", 1);
  reader->begin_object();
  EXPECT_EQ(reader->select_name(options), std::optional<size_t>(0));
  EXPECT_EQ(reader->next_int(), 1);
  EXPECT_EQ(reader->select_name(options), std::optional<size_t>(1));
  EXPECT_EQ(reader->next_int(), 2);
  EXPECT_EQ(reader->select_name(options), std::nullopt);
  EXPECT_EQ(reader->next_name(), "gamma");
  EXPECT_EQ(reader->next_int(), 3);
  reader->end_object();
}

TEST(Streaming, SelectNameNearEndOfInput) {
  Options options = Options::of({"a-much-longer-candidate", "b"});
  auto reader = chunked(R"({"b":0})", 2);
  reader->begin_object();
  EXPECT_EQ(reader->select_name(options), std::optional<size_t>(1));
  EXPECT_EQ(reader->next_int(), 0);
  reader->end_object();
}

TEST(Streaming, SnapshotReadsAheadOfBuffer) {
  const std::string json = big_array(4000);
  auto reader = chunked(json, 64);
  reader->begin_array();
  auto peek = reader->peek_json();
  int seen = 0;
  while (peek->has_next()) {
    peek->skip_value();
    ++seen;
  }
  EXPECT_EQ(seen, 4000);
  EXPECT_EQ(reader->next_string(), "item-0");
}

TEST(Streaming, IstreamSource) {
  std::istringstream in(R"([{"k": "v"}, 2])");
  auto reader = JsonReader::of(in);
  reader->begin_array();
  reader->begin_object();
  EXPECT_EQ(reader->next_name(), "k");
  EXPECT_EQ(reader->next_string(), "v");
  reader->end_object();
  EXPECT_EQ(reader->next_long(), 2);
  reader->end_array();
  EXPECT_EQ(reader->peek(), Token::EndDocument);
}

TEST(Streaming, CloseReleasesSource) {
  auto source = std::make_unique<ChunkedSource>("[1, 2]", 4);
  std::shared_ptr<bool> closed = source->closed_flag();
  auto reader = JsonReader::of(std::move(source));
  reader->begin_array();
  EXPECT_FALSE(*closed);
  auto peek = reader->peek_json();
  peek->close();
  EXPECT_FALSE(*closed);
  reader->close();
  EXPECT_TRUE(*closed);
}

TEST(Streaming, DestroyingReaderReleasesSource) {
  auto source = std::make_unique<ChunkedSource>("[]", 4);
  std::shared_ptr<bool> closed = source->closed_flag();
  {
    auto reader = JsonReader::of(std::move(source));
    reader->begin_array();
  }
  EXPECT_TRUE(*closed);
}
