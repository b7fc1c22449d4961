/**
 * @file spool_json.hpp
 * @brief Spool JSON - streaming, depth-first JSON token reader
 * @version 1.0.0
 *
 * Exposes a JSON document as an ordered sequence of tokens (structural
 * delimiters, property names and literal values) instead of a parse tree,
 * so recursive-descent consumers can walk arbitrarily large documents with
 * bounded memory.
 *
 * Components:
 * - ScopeStack:  nesting state machine + JSON path for diagnostics
 * - Options:     pre-encoded candidate strings for allocation-free matching
 * - JsonReader:  the token contract, with two implementations
 *     - Utf8Reader:  streaming lexer over a Source (string, istream, ...)
 *     - ValueReader: walks an in-memory JsonValue tree
 * - read_json_value(): generic materialization into JsonValue
 * - peek_json():  independent lookahead snapshots
 *
 * Requires C++20. Header-only, no dependencies beyond the standard library.
 *
 * License: MIT
 */

#ifndef SPOOL_JSON_HPP
#define SPOOL_JSON_HPP

#include <algorithm>
#include <any>
#include <array>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <istream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#if __cplusplus < 202002L && !defined(_MSVC_LANG)
#error "Spool JSON requires a C++20 compatible compiler."
#endif

#ifdef __GNUC__
#define SPOOL_INLINE __attribute__((always_inline)) inline
#define SPOOL_LIKELY(x) __builtin_expect(!!(x), 1)
#define SPOOL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define SPOOL_INLINE inline
#define SPOOL_LIKELY(x) (x)
#define SPOOL_UNLIKELY(x) (x)
#endif

namespace spool {
namespace json {

// ============================================================================
// Error Handling
// ============================================================================

/// Base class for failures caused by the input document.
class JsonError : public std::runtime_error {
public:
  explicit JsonError(const std::string &msg) : std::runtime_error(msg) {}
};

/// The bytes do not form valid JSON (or the lenient dialect) at this point.
class EncodingError : public JsonError {
public:
  size_t line, column, offset;

  EncodingError(const std::string &msg, size_t l = 0, size_t c = 0,
                size_t off = 0)
      : JsonError(msg), line(l), column(c), offset(off) {}

  std::string format() const {
    std::ostringstream oss;
    if (line > 0) {
      oss << "Syntax error at line " << line << ", column " << column << ": ";
    } else {
      oss << "Syntax error: ";
    }
    oss << what();
    return oss.str();
  }
};

/// The token stream is well formed but cannot be read the way it was asked
/// for: type mismatch, failed or inexact number, duplicate key, nesting too
/// deep, or unknown content while fail_on_unknown is set.
class DataError : public JsonError {
public:
  explicit DataError(const std::string &msg) : JsonError(msg) {}
};

/// Wrong-kind access on a JsonValue.
class TypeError : public std::runtime_error {
public:
  explicit TypeError(const std::string &msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Tokens & Scopes
// ============================================================================

enum class Token : uint8_t {
  BeginArray,
  EndArray,
  BeginObject,
  EndObject,
  Name,
  String,
  Number,
  Boolean,
  Null,
  EndDocument
};

inline const char *to_string(Token t) {
  switch (t) {
  case Token::BeginArray:
    return "BEGIN_ARRAY";
  case Token::EndArray:
    return "END_ARRAY";
  case Token::BeginObject:
    return "BEGIN_OBJECT";
  case Token::EndObject:
    return "END_OBJECT";
  case Token::Name:
    return "NAME";
  case Token::String:
    return "STRING";
  case Token::Number:
    return "NUMBER";
  case Token::Boolean:
    return "BOOLEAN";
  case Token::Null:
    return "NULL";
  case Token::EndDocument:
    return "END_DOCUMENT";
  }
  return "UNKNOWN";
}

inline std::ostream &operator<<(std::ostream &os, Token t) {
  return os << to_string(t);
}

// Nesting state of one level of the scope stack.
enum class Scope : uint8_t {
  EmptyArray,       // array with no elements read yet
  NonemptyArray,    // array with at least one element
  EmptyObject,      // object with no names read yet
  DanglingName,     // object whose name has been read, value pending
  NonemptyObject,   // object with at least one name/value pair
  EmptyDocument,    // top level, nothing read yet
  NonemptyDocument, // top level, a value has been read
  Closed            // reader closed
};

// ============================================================================
// ScopeStack: nesting state + path entries
// ============================================================================

/**
 * @brief Tracks the reader's nesting context and derives its JSON path.
 *
 * Three parallel arrays (scope, last name, element index) start at
 * kInitialCapacity levels and double on overflow. Growth stops at
 * kMaxDepth levels including the document level; a push past that raises
 * DataError and leaves the stack untouched.
 */
class ScopeStack {
public:
  static constexpr size_t kInitialCapacity = 32;
  static constexpr size_t kMaxDepth = 256;

  ScopeStack()
      : scopes_(kInitialCapacity), names_(kInitialCapacity),
        indices_(kInitialCapacity) {}

  void push(Scope scope) {
    if (size_ == scopes_.size()) {
      if (size_ >= kMaxDepth)
        throw DataError("Nesting too deep at " + path());
      grow();
    }
    scopes_[size_] = scope;
    names_[size_].reset();
    indices_[size_] = 0;
    ++size_;
  }

  void pop() {
    if (size_ <= 1)
      throw std::logic_error("Scope stack underflow at " + path());
    --size_;
    names_[size_].reset();
  }

  // Drops every level and restarts at a single document-level scope.
  void reset(Scope scope) {
    for (size_t i = 0; i < size_; ++i) {
      names_[i].reset();
      indices_[i] = 0;
    }
    scopes_[0] = scope;
    size_ = 1;
  }

  Scope top() const { return scopes_[size_ - 1]; }
  void set_top(Scope scope) { scopes_[size_ - 1] = scope; }

  size_t size() const { return size_; }
  size_t capacity() const { return scopes_.size(); }
  Scope at(size_t level) const { return scopes_[level]; }

  void set_name(std::string name) { names_[size_ - 1] = std::move(name); }
  const std::optional<std::string> &name(size_t level) const {
    return names_[level];
  }

  void advance_index() { ++indices_[size_ - 1]; }
  size_t index(size_t level) const { return indices_[level]; }

  /// JsonPath-style location: `$`, `.name` per object level, `[i]` per
  /// array level. Pure function of the stack.
  std::string path() const {
    std::string out = "$";
    for (size_t i = 0; i < size_; ++i) {
      switch (scopes_[i]) {
      case Scope::EmptyArray:
      case Scope::NonemptyArray:
        out += '[';
        out += std::to_string(indices_[i]);
        out += ']';
        break;
      case Scope::EmptyObject:
      case Scope::DanglingName:
      case Scope::NonemptyObject:
        out += '.';
        if (names_[i])
          out += *names_[i];
        break;
      case Scope::EmptyDocument:
      case Scope::NonemptyDocument:
      case Scope::Closed:
        break;
      }
    }
    return out;
  }

private:
  void grow() {
    size_t capacity = std::min(scopes_.size() * 2, kMaxDepth);
    scopes_.resize(capacity);
    names_.resize(capacity);
    indices_.resize(capacity);
  }

  std::vector<Scope> scopes_;
  std::vector<std::optional<std::string>> names_;
  std::vector<size_t> indices_;
  size_t size_ = 0;
};

// ============================================================================
// TagStore: per-reader, type-keyed side channel
// ============================================================================

class TagStore {
public:
  TagStore() = default;
  TagStore(TagStore &&) noexcept = default;
  TagStore &operator=(TagStore &&) noexcept = default;

  // Stores `value` under `key`; the value's dynamic type must be `key`.
  void set(std::type_index key, std::any value) {
    if (!value.has_value() || std::type_index(value.type()) != key) {
      throw std::invalid_argument(std::string("Tag value must be of type ") +
                                  key.name());
    }
    if (!tags_)
      tags_ = std::make_unique<std::unordered_map<std::type_index, std::any>>();
    (*tags_)[key] = std::move(value);
  }

  template <typename T> void set(T value) {
    set(std::type_index(typeid(T)), std::any(std::move(value)));
  }

  const std::any *find(std::type_index key) const {
    if (!tags_)
      return nullptr;
    auto it = tags_->find(key);
    return it == tags_->end() ? nullptr : &it->second;
  }

  template <typename T> const T *get() const {
    const std::any *tag = find(std::type_index(typeid(T)));
    return tag ? std::any_cast<T>(tag) : nullptr;
  }

  bool empty() const { return !tags_ || tags_->empty(); }

private:
  std::unique_ptr<std::unordered_map<std::type_index, std::any>> tags_;
};

// ============================================================================
// Reader configuration & shared state
// ============================================================================

struct ReaderOptions {
  bool lenient = false;
  bool fail_on_unknown = false;
};

// State every reader implementation carries. Move-only: the tag store has
// a single owner, and snapshots are made with fork().
struct ReaderContext {
  ScopeStack scopes;
  bool lenient = false;
  bool fail_on_unknown = false;
  TagStore tags;

  ReaderContext() = default;
  explicit ReaderContext(ReaderOptions options)
      : lenient(options.lenient), fail_on_unknown(options.fail_on_unknown) {
    scopes.push(Scope::EmptyDocument);
  }
  ReaderContext(ReaderContext &&) noexcept = default;
  ReaderContext &operator=(ReaderContext &&) noexcept = default;

  // Copies scopes, path entries and flags. Tags stay with this reader.
  ReaderContext fork() const {
    ReaderContext copy;
    copy.scopes = scopes;
    copy.lenient = lenient;
    copy.fail_on_unknown = fail_on_unknown;
    return copy;
  }
};

// ============================================================================
// Text helpers
// ============================================================================

namespace detail {

inline int hex_val(char c) noexcept {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F')
    return 10 + (c - 'A');
  return -1;
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline void append_utf8(std::string &out, uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

/// Appends `value` as a double-quoted JSON string. This is the canonical
/// wire form: `"` `\` and control characters are escaped (short forms where
/// JSON has them, otherwise lowercase \u00xx), as are U+2028 and U+2029.
inline void write_quoted(std::string &out, std::string_view value) {
  static constexpr char kHex[] = "0123456789abcdef";
  out.push_back('"');
  const char *p = value.data();
  const char *end = p + value.size();
  const char *last = p;
  while (p < end) {
    unsigned char c = static_cast<unsigned char>(*p);
    const char *replacement = nullptr;
    size_t width = 1;
    char unicode[7];
    switch (c) {
    case '"':
      replacement = "\\\"";
      break;
    case '\\':
      replacement = "\\\\";
      break;
    case '\b':
      replacement = "\\b";
      break;
    case '\f':
      replacement = "\\f";
      break;
    case '\n':
      replacement = "\\n";
      break;
    case '\r':
      replacement = "\\r";
      break;
    case '\t':
      replacement = "\\t";
      break;
    case 0xE2:
      // U+2028 LINE SEPARATOR and U+2029 PARAGRAPH SEPARATOR
      if (end - p >= 3 && static_cast<unsigned char>(p[1]) == 0x80 &&
          (static_cast<unsigned char>(p[2]) == 0xA8 ||
           static_cast<unsigned char>(p[2]) == 0xA9)) {
        replacement =
            static_cast<unsigned char>(p[2]) == 0xA8 ? "\\u2028" : "\\u2029";
        width = 3;
      }
      break;
    default:
      if (c < 0x20) {
        std::memcpy(unicode, "\\u00", 4);
        unicode[4] = kHex[c >> 4];
        unicode[5] = kHex[c & 0xF];
        unicode[6] = '\0';
        replacement = unicode;
      }
      break;
    }
    if (replacement == nullptr) {
      ++p;
      continue;
    }
    out.append(last, p);
    out.append(replacement);
    p += width;
    last = p;
  }
  out.append(last, p);
  out.push_back('"');
}

inline std::string quoted(std::string_view value) {
  std::string out;
  out.reserve(value.size() + 2);
  write_quoted(out, value);
  return out;
}

/// Shortest text that round-trips `value`; non-finite values use the
/// lenient literals NaN, Infinity and -Infinity.
inline std::string format_double(double value) {
  if (std::isnan(value))
    return "NaN";
  if (std::isinf(value))
    return value < 0 ? "-Infinity" : "Infinity";
  char buf[32];
  auto res = std::to_chars(buf, buf + sizeof(buf), value);
  return std::string(buf, res.ptr);
}

/// Parses decimal floating-point text, including NaN and [+-]Infinity.
/// Returns false unless the entire text is consumed.
inline bool parse_double(std::string_view text, double &out) {
  if (text == "NaN") {
    out = std::numeric_limits<double>::quiet_NaN();
    return true;
  }
  if (text == "Infinity" || text == "+Infinity") {
    out = std::numeric_limits<double>::infinity();
    return true;
  }
  if (text == "-Infinity") {
    out = -std::numeric_limits<double>::infinity();
    return true;
  }
  if (!text.empty() && text[0] == '+') {
    text.remove_prefix(1);
    if (!text.empty() && text[0] == '-')
      return false;
  }
  if (text.empty())
    return false;
  // from_chars also accepts "inf", "nan" and hex floats; JSON does not.
  for (char c : text) {
    if (!is_digit(c) && c != '-' && c != '+' && c != '.' && c != 'e' &&
        c != 'E')
      return false;
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  if (ptr != text.data() + text.size())
    return false;
  if (ec == std::errc::result_out_of_range) {
    // Overflow saturates to infinity and underflow to zero.
    std::string copy(text);
    out = std::strtod(copy.c_str(), nullptr);
    return true;
  }
  return ec == std::errc();
}

/// Parses decimal text (sign, digits, fraction, exponent) into an int64
/// only when the value it denotes is an exact integer in range: "1.0" and
/// "1e2" succeed, "1.5" and "1e19" do not.
inline bool parse_exact_integer(std::string_view text, int64_t &out) {
  size_t i = 0;
  const size_t n = text.size();
  bool negative = false;
  if (i < n && (text[i] == '-' || text[i] == '+')) {
    negative = text[i] == '-';
    ++i;
  }
  size_t start = i;
  while (i < n && is_digit(text[i]))
    ++i;
  std::string_view int_part = text.substr(start, i - start);
  std::string_view frac_part;
  if (i < n && text[i] == '.') {
    start = ++i;
    while (i < n && is_digit(text[i]))
      ++i;
    frac_part = text.substr(start, i - start);
  }
  if (int_part.empty() && frac_part.empty())
    return false;
  int64_t exponent = 0;
  if (i < n && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    bool exp_negative = false;
    if (i < n && (text[i] == '-' || text[i] == '+')) {
      exp_negative = text[i] == '-';
      ++i;
    }
    start = i;
    while (i < n && is_digit(text[i])) {
      if (exponent < 100000)
        exponent = exponent * 10 + (text[i] - '0');
      ++i;
    }
    if (i == start)
      return false;
    if (exp_negative)
      exponent = -exponent;
  }
  if (i != n)
    return false;

  std::string digits;
  digits.reserve(int_part.size() + frac_part.size());
  digits.append(int_part).append(frac_part);
  int64_t scale = exponent - static_cast<int64_t>(frac_part.size());
  size_t first = digits.find_first_not_of('0');
  if (first == std::string::npos) {
    out = 0;
    return true;
  }
  digits.erase(0, first);
  while (digits.back() == '0') {
    digits.pop_back();
    ++scale;
  }
  if (scale < 0 || static_cast<int64_t>(digits.size()) + scale > 19)
    return false;

  uint64_t magnitude = 0;
  for (char c : digits)
    magnitude = magnitude * 10 + static_cast<uint64_t>(c - '0');
  for (int64_t k = 0; k < scale; ++k) {
    if (magnitude > std::numeric_limits<uint64_t>::max() / 10)
      return false;
    magnitude *= 10;
  }

  constexpr uint64_t kMaxPositive =
      static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  if (negative) {
    if (magnitude > kMaxPositive + 1)
      return false;
    out = magnitude == kMaxPositive + 1
              ? std::numeric_limits<int64_t>::min()
              : -static_cast<int64_t>(magnitude);
  } else {
    if (magnitude > kMaxPositive)
      return false;
    out = static_cast<int64_t>(magnitude);
  }
  return true;
}

// Exact double -> int64 conversion; false for fractions and out-of-range.
inline bool exact_integer(double value, int64_t &out) {
  if (!std::isfinite(value) || std::floor(value) != value)
    return false;
  if (value < -9223372036854775808.0 || value >= 9223372036854775808.0)
    return false;
  out = static_cast<int64_t>(value);
  return true;
}

inline bool fits_int(int64_t value) {
  return value >= std::numeric_limits<int>::min() &&
         value <= std::numeric_limits<int>::max();
}

} // namespace detail

// ============================================================================
// Options: pre-encoded candidate strings
// ============================================================================

/**
 * @brief An immutable, ordered set of candidate strings for select_name()
 * and select_string().
 *
 * Each candidate is stored in its canonical wire form with the opening
 * quote removed and the closing quote kept, so it can be compared byte for
 * byte against input positioned just past an opening quote. The trailing
 * quote rules out prefix matches ("a" never matches "ab"). Input that
 * spells the same text with different escapes does not match; callers
 * fall back to next_name()/next_string().
 */
class Options {
public:
  static Options of(std::initializer_list<std::string_view> strings) {
    return Options(std::vector<std::string>(strings.begin(), strings.end()));
  }

  static Options of(std::vector<std::string> strings) {
    return Options(std::move(strings));
  }

  const std::vector<std::string> &strings() const { return strings_; }
  size_t size() const { return strings_.size(); }

  std::string_view encoded(size_t index) const { return encoded_[index]; }
  size_t max_encoded_length() const { return max_encoded_length_; }

  /// Index of the candidate whose encoded bytes are a prefix of `input`.
  std::optional<size_t> match(std::string_view input) const {
    if (input.empty())
      return std::nullopt;
    const unsigned char first = static_cast<unsigned char>(input[0]);
    for (uint32_t k = buckets_[first]; k < buckets_[first + 1]; ++k) {
      const std::string &candidate = encoded_[order_[k]];
      if (input.size() >= candidate.size() &&
          std::memcmp(input.data(), candidate.data(), candidate.size()) == 0)
        return order_[k];
    }
    return std::nullopt;
  }

  /// Index of the candidate equal to already-decoded `text`.
  std::optional<size_t> find(std::string_view text) const {
    for (size_t i = 0; i < strings_.size(); ++i) {
      if (strings_[i] == text)
        return i;
    }
    return std::nullopt;
  }

private:
  explicit Options(std::vector<std::string> strings)
      : strings_(std::move(strings)) {
    encoded_.reserve(strings_.size());
    for (const std::string &s : strings_) {
      std::string wire = detail::quoted(s);
      wire.erase(0, 1);
      max_encoded_length_ = std::max(max_encoded_length_, wire.size());
      encoded_.push_back(std::move(wire));
    }

    // Sort by encoded bytes and index the order by first byte.
    order_.resize(encoded_.size());
    for (uint32_t i = 0; i < order_.size(); ++i)
      order_[i] = i;
    std::stable_sort(order_.begin(), order_.end(),
                     [this](uint32_t a, uint32_t b) {
                       return encoded_[a] < encoded_[b];
                     });
    uint32_t pos = 0;
    const uint32_t n = static_cast<uint32_t>(order_.size());
    for (size_t b = 0; b < 256; ++b) {
      while (pos < n &&
             static_cast<unsigned char>(encoded_[order_[pos]][0]) < b)
        ++pos;
      buckets_[b] = pos;
    }
    buckets_[256] = n;
  }

  std::vector<std::string> strings_;
  std::vector<std::string> encoded_;
  std::vector<uint32_t> order_;
  std::array<uint32_t, 257> buckets_{};
  size_t max_encoded_length_ = 0;
};

// ============================================================================
// JsonValue: generic in-memory representation
// ============================================================================

enum class ValueType : uint8_t { Null, Boolean, Number, String, Array, Object };

inline const char *type_name(ValueType t) {
  switch (t) {
  case ValueType::Null:
    return "null";
  case ValueType::Boolean:
    return "boolean";
  case ValueType::Number:
    return "number";
  case ValueType::String:
    return "string";
  case ValueType::Array:
    return "array";
  case ValueType::Object:
    return "object";
  }
  return "unknown";
}

class JsonValue;
struct JsonMember;

using JsonArray = std::vector<JsonValue>;

/// Insertion-ordered map. put() on an existing key replaces the value in
/// place and hands back the previous one.
class JsonObject {
public:
  using iterator = std::vector<JsonMember>::iterator;
  using const_iterator = std::vector<JsonMember>::const_iterator;

  JsonObject();
  JsonObject(const JsonObject &other);
  JsonObject(JsonObject &&other) noexcept;
  JsonObject &operator=(const JsonObject &other);
  JsonObject &operator=(JsonObject &&other) noexcept;
  ~JsonObject();

  std::optional<JsonValue> put(std::string name, JsonValue value);

  const JsonValue *find(std::string_view name) const;
  bool contains(std::string_view name) const;
  const JsonValue &at(std::string_view name) const;
  const JsonMember &member(size_t index) const;

  size_t size() const;
  bool empty() const;

  iterator begin();
  iterator end();
  const_iterator begin() const;
  const_iterator end() const;

  bool operator==(const JsonObject &other) const;

private:
  std::vector<JsonMember> members_;
  std::map<std::string, size_t, std::less<>> index_;
};

class JsonValue {
public:
  JsonValue() = default;
  JsonValue(std::nullptr_t) {}
  JsonValue(bool b) : data_(b) {}
  JsonValue(int i) : data_(static_cast<double>(i)) {}
  JsonValue(long i) : data_(static_cast<double>(i)) {}
  JsonValue(long long i) : data_(static_cast<double>(i)) {}
  JsonValue(double d) : data_(d) {}
  JsonValue(const char *s) : data_(std::string(s)) {}
  JsonValue(std::string s) : data_(std::move(s)) {}
  JsonValue(std::string_view s) : data_(std::string(s)) {}
  JsonValue(JsonArray a) : data_(std::move(a)) {}
  JsonValue(JsonObject o) : data_(std::move(o)) {}

  ValueType type() const { return static_cast<ValueType>(data_.index()); }
  bool is_null() const { return type() == ValueType::Null; }
  bool is_bool() const { return type() == ValueType::Boolean; }
  bool is_number() const { return type() == ValueType::Number; }
  bool is_string() const { return type() == ValueType::String; }
  bool is_array() const { return type() == ValueType::Array; }
  bool is_object() const { return type() == ValueType::Object; }

  bool as_bool() const {
    if (const bool *b = std::get_if<bool>(&data_))
      return *b;
    throw TypeError("Not a boolean");
  }

  double as_number() const {
    if (const double *d = std::get_if<double>(&data_))
      return *d;
    throw TypeError("Not a number");
  }

  const std::string &as_string() const {
    if (const std::string *s = std::get_if<std::string>(&data_))
      return *s;
    throw TypeError("Not a string");
  }

  const JsonArray &as_array() const {
    if (const JsonArray *a = std::get_if<JsonArray>(&data_))
      return *a;
    throw TypeError("Not an array");
  }
  JsonArray &as_array() {
    if (JsonArray *a = std::get_if<JsonArray>(&data_))
      return *a;
    throw TypeError("Not an array");
  }

  const JsonObject &as_object() const {
    if (const JsonObject *o = std::get_if<JsonObject>(&data_))
      return *o;
    throw TypeError("Not an object");
  }
  JsonObject &as_object() {
    if (JsonObject *o = std::get_if<JsonObject>(&data_))
      return *o;
    throw TypeError("Not an object");
  }

  /// Compact JSON text.
  std::string dump() const {
    std::string out;
    dump_to(out);
    return out;
  }

  void dump_to(std::string &out) const;

  bool operator==(const JsonValue &other) const { return data_ == other.data_; }

private:
  std::variant<std::nullptr_t, bool, double, std::string, JsonArray,
               JsonObject>
      data_;
};

struct JsonMember {
  std::string name;
  JsonValue value;

  bool operator==(const JsonMember &other) const {
    return name == other.name && value == other.value;
  }
};

inline JsonObject::JsonObject() = default;
inline JsonObject::JsonObject(const JsonObject &other) = default;
inline JsonObject::JsonObject(JsonObject &&other) noexcept = default;
inline JsonObject &JsonObject::operator=(const JsonObject &other) = default;
inline JsonObject &
JsonObject::operator=(JsonObject &&other) noexcept = default;
inline JsonObject::~JsonObject() = default;

inline std::optional<JsonValue> JsonObject::put(std::string name,
                                                JsonValue value) {
  auto it = index_.find(name);
  if (it != index_.end()) {
    JsonValue previous = std::move(members_[it->second].value);
    members_[it->second].value = std::move(value);
    return previous;
  }
  index_.emplace(name, members_.size());
  members_.push_back(JsonMember{std::move(name), std::move(value)});
  return std::nullopt;
}

inline const JsonValue *JsonObject::find(std::string_view name) const {
  auto it = index_.find(name);
  return it == index_.end() ? nullptr : &members_[it->second].value;
}

inline bool JsonObject::contains(std::string_view name) const {
  return index_.find(name) != index_.end();
}

inline const JsonValue &JsonObject::at(std::string_view name) const {
  const JsonValue *value = find(name);
  if (!value)
    throw TypeError("No member named '" + std::string(name) + "'");
  return *value;
}

inline const JsonMember &JsonObject::member(size_t index) const {
  return members_[index];
}

inline size_t JsonObject::size() const { return members_.size(); }
inline bool JsonObject::empty() const { return members_.empty(); }
inline JsonObject::iterator JsonObject::begin() { return members_.begin(); }
inline JsonObject::iterator JsonObject::end() { return members_.end(); }
inline JsonObject::const_iterator JsonObject::begin() const {
  return members_.begin();
}
inline JsonObject::const_iterator JsonObject::end() const {
  return members_.end();
}

inline bool JsonObject::operator==(const JsonObject &other) const {
  return members_ == other.members_;
}

inline void JsonValue::dump_to(std::string &out) const {
  switch (type()) {
  case ValueType::Null:
    out += "null";
    break;
  case ValueType::Boolean:
    out += std::get<bool>(data_) ? "true" : "false";
    break;
  case ValueType::Number:
    out += detail::format_double(std::get<double>(data_));
    break;
  case ValueType::String:
    detail::write_quoted(out, std::get<std::string>(data_));
    break;
  case ValueType::Array: {
    out += '[';
    bool first = true;
    for (const JsonValue &item : std::get<JsonArray>(data_)) {
      if (!first)
        out += ',';
      first = false;
      item.dump_to(out);
    }
    out += ']';
    break;
  }
  case ValueType::Object: {
    out += '{';
    bool first = true;
    for (const JsonMember &m : std::get<JsonObject>(data_)) {
      if (!first)
        out += ',';
      first = false;
      detail::write_quoted(out, m.name);
      out += ':';
      m.value.dump_to(out);
    }
    out += '}';
    break;
  }
  }
}

// ============================================================================
// Byte Sources
// ============================================================================

/// Pull-based byte producer feeding a Utf8Reader.
class Source {
public:
  virtual ~Source() = default;

  // Copies up to `n` bytes into `dst`. Returns 0 only at end of input.
  virtual size_t read(char *dst, size_t n) = 0;

  virtual void close() {}
};

class StringSource final : public Source {
  std::string data_;
  size_t pos_ = 0;

public:
  explicit StringSource(std::string data) : data_(std::move(data)) {}

  size_t read(char *dst, size_t n) override {
    size_t count = std::min(n, data_.size() - pos_);
    std::memcpy(dst, data_.data() + pos_, count);
    pos_ += count;
    return count;
  }

  void close() override {
    data_.clear();
    data_.shrink_to_fit();
    pos_ = 0;
  }
};

// Reads from a caller-owned stream; close() does not close the stream.
class StreamSource final : public Source {
  std::istream *in_;

public:
  explicit StreamSource(std::istream &in) : in_(&in) {}

  size_t read(char *dst, size_t n) override {
    if (!in_)
      return 0;
    in_->read(dst, static_cast<std::streamsize>(n));
    if (in_->bad())
      throw std::runtime_error("Failed to read from stream");
    return static_cast<size_t>(in_->gcount());
  }

  void close() override { in_ = nullptr; }
};

/**
 * @brief Window of bytes pulled from a Source, shared between a reader and
 * its lookahead snapshots.
 *
 * Positions are absolute offsets into the input. The owning reader reports
 * its consumption point through release(); each advance bumps generation(),
 * which snapshots compare against to detect that they are stale. Bytes
 * below the keep point are dropped once they make up half the window.
 */
class SourceBuffer {
public:
  static constexpr size_t kSegmentSize = 8192;

  explicit SourceBuffer(std::unique_ptr<Source> source)
      : source_(std::move(source)) {}

  SourceBuffer(const SourceBuffer &) = delete;
  SourceBuffer &operator=(const SourceBuffer &) = delete;

  ~SourceBuffer() { close(); }

  // Ensures bytes up to (not including) `end` are buffered. Returns false
  // when the input ends first.
  bool require(uint64_t end) {
    while (limit() < end) {
      if (exhausted_)
        return false;
      fill();
    }
    return true;
  }

  uint64_t limit() const { return base_ + data_.size(); }

  SPOOL_INLINE char at(uint64_t pos) const { return data_[pos - base_]; }

  std::string_view view(uint64_t from, uint64_t to) const {
    return std::string_view(data_.data() + (from - base_), to - from);
  }

  // The owner consumed everything before `consumed`; bytes from `keep_from`
  // on must stay addressable.
  void release(uint64_t consumed, uint64_t keep_from) {
    if (consumed <= released_)
      return;
    released_ = consumed;
    ++generation_;
    uint64_t dead = std::min(keep_from, consumed) - base_;
    if (dead >= kSegmentSize && dead * 2 >= data_.size()) {
      data_.erase(0, dead);
      base_ += dead;
    }
  }

  uint64_t generation() const { return generation_; }
  bool closed() const { return closed_; }

  void close() {
    if (closed_)
      return;
    closed_ = true;
    exhausted_ = true;
    ++generation_;
    base_ = limit();
    data_.clear();
    if (source_) {
      source_->close();
      source_.reset();
    }
  }

private:
  void fill() {
    if (!source_) {
      exhausted_ = true;
      return;
    }
    size_t old_size = data_.size();
    data_.resize(old_size + kSegmentSize);
    size_t got = 0;
    try {
      got = source_->read(data_.data() + old_size, kSegmentSize);
    } catch (...) {
      data_.resize(old_size);
      throw;
    }
    data_.resize(old_size + got);
    if (got == 0)
      exhausted_ = true;
  }

  std::unique_ptr<Source> source_;
  std::string data_;
  uint64_t base_ = 0;
  uint64_t released_ = 0;
  uint64_t generation_ = 0;
  bool exhausted_ = false;
  bool closed_ = false;
};

// ============================================================================
// JsonReader: the token contract
// ============================================================================

/**
 * @brief Reads a JSON document as a depth-first stream of tokens.
 *
 * Every operation either consumes exactly one token (or one whole value
 * for skip_value(), next_source() and read_json_value()) or, for peek()
 * and has_next(), inspects the current token without consuming it.
 *
 * Numeric/string duality: next_string() accepts numbers and returns their
 * literal text, so integers too large for a double survive intact;
 * next_double(), next_long() and next_int() accept strings holding numbers.
 * next_long()/next_int() succeed on non-integral text only when the value
 * is exactly an integer that fits.
 *
 * Lenient mode accepts: several top-level values; NaN and Infinity;
 * line comments (`//`, `#`) and block comments; unquoted and single-quoted
 * names and strings; `;` as a separator; missing array elements (read as null);
 * `=` and `=>` in place of `:`.
 *
 * Not thread-safe. Errors: EncodingError (syntax), DataError (data),
 * std::logic_error (misuse, e.g. a closed reader or stale snapshot).
 */
class JsonReader {
public:
  virtual ~JsonReader() = default;

  static std::unique_ptr<JsonReader> of(std::string json,
                                        ReaderOptions options = {});
  static std::unique_ptr<JsonReader> of(std::istream &in,
                                        ReaderOptions options = {});
  static std::unique_ptr<JsonReader> of(std::unique_ptr<Source> source,
                                        ReaderOptions options = {});
  static std::unique_ptr<JsonReader> of_value(JsonValue value,
                                              ReaderOptions options = {});

  virtual void begin_array() = 0;
  virtual void end_array() = 0;
  virtual void begin_object() = 0;
  virtual void end_object() = 0;

  // True if the current array or object has another element.
  virtual bool has_next() = 0;

  // Type of the next token, without consuming it.
  virtual Token peek() = 0;

  virtual std::string next_name() = 0;

  /// Consumes the next name if it is one of `options` and returns its
  /// index; otherwise consumes nothing and returns nullopt.
  virtual std::optional<size_t> select_name(const Options &options) = 0;

  /// Discards the next name. DataError if fail_on_unknown() is set.
  virtual void skip_name() = 0;

  virtual std::string next_string() = 0;
  virtual std::optional<size_t> select_string(const Options &options) = 0;

  virtual bool next_boolean() = 0;
  virtual std::nullptr_t next_null() = 0;

  /// DataError if the literal is not a number, or is NaN/infinite outside
  /// lenient mode.
  virtual double next_double() = 0;
  virtual int64_t next_long() = 0;
  virtual int next_int() = 0;

  /**
   * Consumes the next value and returns its bytes exactly as they appear
   * in the input, internal whitespace included. The bytes are not
   * validated. The view is invalidated by the next call on this reader.
   */
  virtual std::string_view next_source() = 0;

  /// Skips the next value recursively. DataError if fail_on_unknown() is
  /// set.
  virtual void skip_value() = 0;

  // Makes a pending name readable through next_string().
  virtual void promote_name_to_value() = 0;

  /**
   * Returns a reader that starts at this reader's current position and
   * advances independently. It is valid only until this reader consumes
   * another token; using it afterwards throws std::logic_error. Tags are
   * not copied.
   */
  virtual std::unique_ptr<JsonReader> peek_json() = 0;

  virtual void close() = 0;

  // ---- Shared behavior --------------------------------------------------

  std::string get_path() const { return context().scopes.path(); }

  void set_lenient(bool lenient) { context().lenient = lenient; }
  bool lenient() const { return context().lenient; }

  void set_fail_on_unknown(bool fail) { context().fail_on_unknown = fail; }
  bool fail_on_unknown() const { return context().fail_on_unknown; }

  template <typename T> const T *tag() const {
    return context().tags.template get<T>();
  }
  template <typename T> void set_tag(T value) {
    context().tags.set(std::move(value));
  }
  void set_tag(std::type_index key, std::any value) {
    context().tags.set(key, std::move(value));
  }

  /// Reads the next value as a JsonValue: arrays become JsonArray, objects
  /// JsonObject (DataError on a repeated name), numbers double.
  JsonValue read_json_value();

protected:
  virtual ReaderContext &context() = 0;
  virtual const ReaderContext &context() const = 0;

  DataError unexpected(std::string_view expected, Token actual) const {
    return DataError("Expected " + std::string(expected) + " but was " +
                     to_string(actual) + " at path " + get_path());
  }

  DataError type_mismatch(const JsonValue &value,
                          std::string_view expected) const {
    if (value.is_null()) {
      return DataError("Expected " + std::string(expected) +
                       " but was null at path " + get_path());
    }
    return DataError("Expected " + std::string(expected) + " but was " +
                     value.dump() + ", a " + type_name(value.type()) +
                     ", at path " + get_path());
  }
};

inline JsonValue JsonReader::read_json_value() {
  switch (peek()) {
  case Token::BeginArray: {
    JsonArray list;
    begin_array();
    while (has_next())
      list.push_back(read_json_value());
    end_array();
    return JsonValue(std::move(list));
  }
  case Token::BeginObject: {
    JsonObject map;
    begin_object();
    while (has_next()) {
      std::string name = next_name();
      JsonValue value = read_json_value();
      std::optional<JsonValue> replaced = map.put(name, std::move(value));
      if (replaced) {
        throw DataError("Map key '" + name + "' has multiple values at path " +
                        get_path() + ": " + replaced->dump() + " and " +
                        map.at(name).dump());
      }
    }
    end_object();
    return JsonValue(std::move(map));
  }
  case Token::String:
    return JsonValue(next_string());
  case Token::Number:
    return JsonValue(next_double());
  case Token::Boolean:
    return JsonValue(next_boolean());
  case Token::Null:
    next_null();
    return JsonValue();
  default:
    throw std::logic_error("Expected a value but was " +
                           std::string(to_string(peek())) + " at path " +
                           get_path());
  }
}

// ============================================================================
// Utf8Reader: streaming tokenizer over a Source
// ============================================================================

/**
 * @brief Lexes UTF-8 JSON pulled from a Source, one token at a time.
 *
 * The next token is decoded lazily by do_peek() and cached in `peeked_`
 * until a consuming call runs. Structural tokens and keywords have their
 * bytes consumed while peeking; strings and non-integral numbers stay in
 * the buffer until read, which is what lets select_name() compare them in
 * place and next_source() return them verbatim.
 */
class Utf8Reader final : public JsonReader {
  enum class Peeked : uint8_t {
    None,
    BeginObject,
    EndObject,
    BeginArray,
    EndArray,
    True,
    False,
    Null,
    SingleQuoted,
    DoubleQuoted,
    Unquoted,
    Buffered, // text held in peeked_string_
    SingleQuotedName,
    DoubleQuotedName,
    UnquotedName,
    Long,   // integer held in peeked_long_
    Number, // peeked_number_length_ bytes at pos_
    Eof
  };

  // peek_number() states
  enum NumberChar : uint8_t {
    kNumberCharNone,
    kNumberCharSign,
    kNumberCharDigit,
    kNumberCharDecimal,
    kNumberCharFractionDigit,
    kNumberCharExpE,
    kNumberCharExpSign,
    kNumberCharExpDigit
  };

  static constexpr int64_t kMinIncompleteInteger =
      std::numeric_limits<int64_t>::min() / 10;

  struct ForkTag {};

  std::shared_ptr<SourceBuffer> buffer_;
  ReaderContext ctx_;
  bool owner_ = true;
  uint64_t generation_ = 0; // snapshots: buffer generation at fork time

  uint64_t pos_ = 0;         // next unread byte
  uint64_t token_start_ = 0; // first byte of the peeked token
  size_t line_ = 1;
  uint64_t line_start_ = 0;

  Peeked peeked_ = Peeked::None;
  int64_t peeked_long_ = 0;
  size_t peeked_number_length_ = 0;
  std::string peeked_string_;
  std::string source_scratch_;

public:
  explicit Utf8Reader(std::unique_ptr<Source> source,
                      ReaderOptions options = {})
      : buffer_(std::make_shared<SourceBuffer>(std::move(source))),
        ctx_(options) {}

  Utf8Reader(const Utf8Reader &) = delete;
  Utf8Reader &operator=(const Utf8Reader &) = delete;

  ~Utf8Reader() override {
    if (owner_)
      buffer_->close();
  }

  void begin_array() override;
  void end_array() override;
  void begin_object() override;
  void end_object() override;
  bool has_next() override;
  Token peek() override;
  std::string next_name() override;
  std::optional<size_t> select_name(const Options &options) override;
  void skip_name() override;
  std::string next_string() override;
  std::optional<size_t> select_string(const Options &options) override;
  bool next_boolean() override;
  std::nullptr_t next_null() override;
  double next_double() override;
  int64_t next_long() override;
  int next_int() override;
  std::string_view next_source() override;
  void skip_value() override;
  void promote_name_to_value() override;
  std::unique_ptr<JsonReader> peek_json() override;
  void close() override;

protected:
  ReaderContext &context() override { return ctx_; }
  const ReaderContext &context() const override { return ctx_; }

private:
  Utf8Reader(const Utf8Reader &origin, ForkTag)
      : buffer_(origin.buffer_), ctx_(origin.ctx_.fork()), owner_(false),
        generation_(origin.buffer_->generation()), pos_(origin.pos_),
        token_start_(origin.token_start_), line_(origin.line_),
        line_start_(origin.line_start_), peeked_(origin.peeked_),
        peeked_long_(origin.peeked_long_),
        peeked_number_length_(origin.peeked_number_length_),
        peeked_string_(origin.peeked_string_) {}

  // ---- buffer access ----------------------------------------------------

  SPOOL_INLINE bool request(size_t n) { return buffer_->require(pos_ + n); }
  SPOOL_INLINE char byte_at(size_t i) const { return buffer_->at(pos_ + i); }
  SPOOL_INLINE void skip_bytes(size_t n) { pos_ += n; }

  // Reports the consumption point; a peeked token keeps its bytes.
  void settle() {
    if (owner_) {
      uint64_t keep = peeked_ == Peeked::None ? pos_ : token_start_;
      buffer_->release(keep, keep);
    }
  }

  void consumed() {
    peeked_ = Peeked::None;
    settle();
  }

  Peeked set_peeked(Peeked p) {
    peeked_ = p;
    settle();
    return p;
  }

  Peeked current() {
    if (!owner_ && buffer_->generation() != generation_) {
      throw std::logic_error(
          "Lookahead reader used after the reader it was taken from advanced");
    }
    return peeked_ != Peeked::None ? peeked_ : do_peek();
  }

  EncodingError syntax_error(std::string_view message) const {
    return EncodingError(std::string(message) + " at path " + get_path(),
                         line_, static_cast<size_t>(pos_ - line_start_ + 1),
                         static_cast<size_t>(pos_));
  }

  void check_lenient() const {
    if (!ctx_.lenient) {
      throw syntax_error(
          "Use JsonReader::set_lenient(true) to accept malformed JSON");
    }
  }

  Peeked do_peek();
  Peeked peek_keyword();
  Peeked peek_number();
  bool is_literal(char c) const;
  int next_non_whitespace(bool throw_on_eof);
  bool skip_to_block_comment_end();
  void skip_to_end_of_line();
  std::string next_quoted_value(char quote);
  void skip_quoted_value(char quote);
  std::string next_unquoted_value();
  void skip_unquoted_value();
  void read_escape_character(std::string &out);
  uint64_t scan_composite();
  std::optional<size_t> select_quoted(const Options &options);
  std::string take_number_text();
};

inline Utf8Reader::Peeked Utf8Reader::do_peek() {
  ScopeStack &scopes = ctx_.scopes;
  const Scope peek_stack = scopes.top();
  switch (peek_stack) {
  case Scope::EmptyArray:
    scopes.set_top(Scope::NonemptyArray);
    break;
  case Scope::NonemptyArray: {
    // Look for a comma before the next element.
    int c = next_non_whitespace(true);
    skip_bytes(1);
    switch (c) {
    case ']':
      return set_peeked(Peeked::EndArray);
    case ';':
      check_lenient();
      break;
    case ',':
      break;
    default:
      throw syntax_error("Unterminated array");
    }
    break;
  }
  case Scope::EmptyObject:
  case Scope::NonemptyObject: {
    scopes.set_top(Scope::DanglingName);
    // Look for a comma before the next element.
    if (peek_stack == Scope::NonemptyObject) {
      int c = next_non_whitespace(true);
      skip_bytes(1);
      switch (c) {
      case '}':
        return set_peeked(Peeked::EndObject);
      case ';':
        check_lenient();
        break;
      case ',':
        break;
      default:
        throw syntax_error("Unterminated object");
      }
    }
    int c = next_non_whitespace(true);
    token_start_ = pos_;
    switch (c) {
    case '"':
      skip_bytes(1);
      return set_peeked(Peeked::DoubleQuotedName);
    case '\'':
      skip_bytes(1);
      check_lenient();
      return set_peeked(Peeked::SingleQuotedName);
    case '}':
      if (peek_stack != Scope::NonemptyObject) {
        skip_bytes(1);
        return set_peeked(Peeked::EndObject);
      }
      throw syntax_error("Expected name");
    default:
      check_lenient();
      if (is_literal(static_cast<char>(c)))
        return set_peeked(Peeked::UnquotedName);
      throw syntax_error("Expected name");
    }
  }
  case Scope::DanglingName: {
    scopes.set_top(Scope::NonemptyObject);
    // Look for a colon before the value.
    int c = next_non_whitespace(true);
    skip_bytes(1);
    switch (c) {
    case ':':
      break;
    case '=':
      check_lenient();
      if (request(1) && byte_at(0) == '>')
        skip_bytes(1);
      break;
    default:
      throw syntax_error("Expected ':'");
    }
    break;
  }
  case Scope::EmptyDocument:
    scopes.set_top(Scope::NonemptyDocument);
    break;
  case Scope::NonemptyDocument: {
    int c = next_non_whitespace(false);
    if (c == -1) {
      token_start_ = pos_;
      return set_peeked(Peeked::Eof);
    }
    check_lenient();
    break;
  }
  case Scope::Closed:
    throw std::logic_error("JsonReader is closed");
  }

  int c = next_non_whitespace(true);
  token_start_ = pos_;
  switch (c) {
  case ']':
    if (peek_stack == Scope::EmptyArray) {
      skip_bytes(1);
      return set_peeked(Peeked::EndArray);
    }
    [[fallthrough]];
  case ';':
  case ',':
    // In lenient mode, a 0-length literal in an array means 'null'.
    if (peek_stack == Scope::EmptyArray ||
        peek_stack == Scope::NonemptyArray) {
      check_lenient();
      return set_peeked(Peeked::Null);
    }
    throw syntax_error("Unexpected value");
  case '\'':
    check_lenient();
    skip_bytes(1);
    return set_peeked(Peeked::SingleQuoted);
  case '"':
    skip_bytes(1);
    return set_peeked(Peeked::DoubleQuoted);
  case '[':
    skip_bytes(1);
    return set_peeked(Peeked::BeginArray);
  case '{':
    skip_bytes(1);
    return set_peeked(Peeked::BeginObject);
  default:
    break;
  }

  Peeked result = peek_keyword();
  if (result != Peeked::None)
    return set_peeked(result);

  result = peek_number();
  if (result != Peeked::None)
    return set_peeked(result);

  if (!is_literal(byte_at(0)))
    throw syntax_error("Expected value");

  check_lenient();
  return set_peeked(Peeked::Unquoted);
}

inline Utf8Reader::Peeked Utf8Reader::peek_keyword() {
  std::string_view keyword;
  Peeked value;
  switch (byte_at(0)) {
  case 't':
  case 'T':
    keyword = "true";
    value = Peeked::True;
    break;
  case 'f':
  case 'F':
    keyword = "false";
    value = Peeked::False;
    break;
  case 'n':
  case 'N':
    keyword = "null";
    value = Peeked::Null;
    break;
  default:
    return Peeked::None;
  }

  // Upper-case keywords are a lenient extension.
  const bool ignore_case = ctx_.lenient;
  const size_t length = keyword.size();
  for (size_t i = 0; i < length; ++i) {
    if (!request(i + 1))
      return Peeked::None;
    char c = byte_at(i);
    if (c != keyword[i] &&
        !(ignore_case && c == static_cast<char>(keyword[i] - 'a' + 'A')))
      return Peeked::None;
  }

  // Don't match trues, falsey or nullsoft!
  if (request(length + 1) && is_literal(byte_at(length)))
    return Peeked::None;

  skip_bytes(length);
  return value;
}

inline Utf8Reader::Peeked Utf8Reader::peek_number() {
  int64_t value = 0; // Negative to accommodate INT64_MIN.
  bool negative = false;
  bool fits_in_long = true;
  NumberChar last = kNumberCharNone;

  size_t i = 0;
  bool done = false;
  for (; !done && request(i + 1); ++i) {
    char c = byte_at(i);
    switch (c) {
    case '-':
      if (last == kNumberCharNone) {
        negative = true;
        last = kNumberCharSign;
        continue;
      } else if (last == kNumberCharExpE) {
        last = kNumberCharExpSign;
        continue;
      }
      return Peeked::None;

    case '+':
      if (last == kNumberCharExpE) {
        last = kNumberCharExpSign;
        continue;
      }
      return Peeked::None;

    case 'e':
    case 'E':
      if (last == kNumberCharDigit || last == kNumberCharFractionDigit) {
        last = kNumberCharExpE;
        continue;
      }
      return Peeked::None;

    case '.':
      if (last == kNumberCharDigit) {
        last = kNumberCharDecimal;
        continue;
      }
      return Peeked::None;

    default:
      if (!detail::is_digit(c)) {
        if (!is_literal(c)) {
          done = true;
          break;
        }
        return Peeked::None;
      }
      if (last == kNumberCharSign || last == kNumberCharNone) {
        value = -(c - '0');
        last = kNumberCharDigit;
      } else if (last == kNumberCharDigit) {
        if (value == 0)
          return Peeked::None; // Leading '0' prefix is not allowed.
        if (fits_in_long) {
          fits_in_long = value > kMinIncompleteInteger ||
                         (value == kMinIncompleteInteger && (c - '0') <= 8);
          if (fits_in_long)
            value = value * 10 - (c - '0');
        }
      } else if (last == kNumberCharDecimal) {
        last = kNumberCharFractionDigit;
      } else if (last == kNumberCharExpE || last == kNumberCharExpSign) {
        last = kNumberCharExpDigit;
      }
    }
  }
  if (done)
    --i; // the terminating byte is not part of the number

  // We've read a complete number. Decide if it's a Long or a Number.
  if (last == kNumberCharDigit && fits_in_long &&
      (value != std::numeric_limits<int64_t>::min() || negative) &&
      (value != 0 || !negative)) {
    peeked_long_ = negative ? value : -value;
    skip_bytes(i);
    return Peeked::Long;
  } else if (last == kNumberCharDigit || last == kNumberCharFractionDigit ||
             last == kNumberCharExpDigit) {
    peeked_number_length_ = i;
    return Peeked::Number;
  }
  return Peeked::None;
}

inline bool Utf8Reader::is_literal(char c) const {
  switch (c) {
  case '/':
  case '\\':
  case ';':
  case '#':
  case '=':
    check_lenient(); // fall-through
    [[fallthrough]];
  case '{':
  case '}':
  case '[':
  case ']':
  case ':':
  case ',':
  case ' ':
  case '\t':
  case '\f':
  case '\r':
  case '\n':
    return false;
  default:
    return true;
  }
}

// Returns the next non-whitespace byte without consuming it, skipping
// comments in lenient mode. -1 at end of input unless `throw_on_eof`.
inline int Utf8Reader::next_non_whitespace(bool throw_on_eof) {
  size_t p = 0;
  while (request(p + 1)) {
    char c = byte_at(p++);
    if (c == '\n') {
      ++line_;
      line_start_ = pos_ + p;
      continue;
    }
    if (c == ' ' || c == '\r' || c == '\t')
      continue;

    skip_bytes(p - 1);
    p = 0;
    if (c == '/') {
      if (!request(2))
        return c;
      check_lenient();
      char next = byte_at(1);
      if (next == '*') {
        // skip a /* c-style comment */
        skip_bytes(2);
        if (!skip_to_block_comment_end())
          throw syntax_error("Unterminated comment");
        skip_bytes(2);
        continue;
      }
      if (next == '/') {
        // skip a // end-of-line comment
        skip_bytes(2);
        skip_to_end_of_line();
        continue;
      }
      return c;
    } else if (c == '#') {
      // Skip a # hash end-of-line comment. Not part of RFC 8259, but common
      // in configuration files.
      check_lenient();
      skip_to_end_of_line();
      continue;
    }
    return static_cast<unsigned char>(c);
  }
  skip_bytes(p);
  if (throw_on_eof)
    throw syntax_error("End of input");
  return -1;
}

// Advances to the "*/" that ends a block comment, leaving pos_ on it.
inline bool Utf8Reader::skip_to_block_comment_end() {
  while (request(2)) {
    char c = byte_at(0);
    if (c == '*' && byte_at(1) == '/')
      return true;
    skip_bytes(1);
    if (c == '\n') {
      ++line_;
      line_start_ = pos_;
    }
  }
  return false;
}

inline void Utf8Reader::skip_to_end_of_line() {
  while (request(1)) {
    char c = byte_at(0);
    skip_bytes(1);
    if (c == '\n') {
      ++line_;
      line_start_ = pos_;
      return;
    }
    if (c == '\r')
      return;
  }
}

inline void Utf8Reader::read_escape_character(std::string &out) {
  if (!request(1))
    throw syntax_error("Unterminated escape sequence");
  char escaped = byte_at(0);
  skip_bytes(1);
  switch (escaped) {
  case 'u': {
    auto read_hex4 = [this](size_t offset, uint32_t &cp) {
      cp = 0;
      for (size_t i = 0; i < 4; ++i) {
        int h = detail::hex_val(byte_at(offset + i));
        if (h < 0)
          return false;
        cp = (cp << 4) | static_cast<uint32_t>(h);
      }
      return true;
    };
    if (!request(4))
      throw syntax_error("Unterminated escape sequence");
    uint32_t cp = 0;
    if (!read_hex4(0, cp))
      throw syntax_error("\\u" + std::string(buffer_->view(pos_, pos_ + 4)));
    skip_bytes(4);
    if (cp >= 0xD800 && cp <= 0xDBFF) {
      // High surrogate: combine with a following \uDC00-\uDFFF.
      uint32_t low = 0;
      if (request(6) && byte_at(0) == '\\' && byte_at(1) == 'u' &&
          read_hex4(2, low) && low >= 0xDC00 && low <= 0xDFFF) {
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        skip_bytes(6);
      } else {
        cp = 0xFFFD;
      }
    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
      cp = 0xFFFD;
    }
    detail::append_utf8(out, cp);
    return;
  }
  case 't':
    out += '\t';
    return;
  case 'b':
    out += '\b';
    return;
  case 'n':
    out += '\n';
    return;
  case 'r':
    out += '\r';
    return;
  case 'f':
    out += '\f';
    return;
  case '"':
  case '\\':
  case '/':
    out += escaped;
    return;
  case '\n':
    ++line_;
    line_start_ = pos_;
    check_lenient();
    out += escaped;
    return;
  default:
    if (!ctx_.lenient)
      throw syntax_error(std::string("Invalid escape sequence: \\") + escaped);
    out += escaped;
    return;
  }
}

// Reads up to the closing `quote`; the opening quote is already consumed.
inline std::string Utf8Reader::next_quoted_value(char quote) {
  const char stops[3] = {quote, '\\', '\0'};
  std::string builder;
  while (true) {
    if (!request(1))
      throw syntax_error("Unterminated string");
    std::string_view window = buffer_->view(pos_, buffer_->limit());
    size_t i = window.find_first_of(stops);
    if (i == std::string_view::npos) {
      builder.append(window);
      skip_bytes(window.size());
      continue;
    }
    builder.append(window.substr(0, i));
    char c = window[i];
    skip_bytes(i + 1);
    if (c == quote)
      return builder;
    read_escape_character(builder);
  }
}

inline void Utf8Reader::skip_quoted_value(char quote) {
  const char stops[3] = {quote, '\\', '\0'};
  std::string discard;
  while (true) {
    if (!request(1))
      throw syntax_error("Unterminated string");
    std::string_view window = buffer_->view(pos_, buffer_->limit());
    size_t i = window.find_first_of(stops);
    if (i == std::string_view::npos) {
      skip_bytes(window.size());
      settle();
      continue;
    }
    char c = window[i];
    skip_bytes(i + 1);
    if (c == quote)
      return;
    discard.clear();
    read_escape_character(discard);
  }
}

inline std::string Utf8Reader::next_unquoted_value() {
  static constexpr std::string_view kTerminals = "{}[]:, \n\t\r\f/\\;#=";
  size_t i = 0;
  while (request(i + 1) && kTerminals.find(byte_at(i)) == std::string_view::npos)
    ++i;
  std::string result(buffer_->view(pos_, pos_ + i));
  skip_bytes(i);
  return result;
}

inline void Utf8Reader::skip_unquoted_value() {
  static constexpr std::string_view kTerminals = "{}[]:, \n\t\r\f/\\;#=";
  while (request(1) && kTerminals.find(byte_at(0)) == std::string_view::npos)
    skip_bytes(1);
}

inline std::string Utf8Reader::take_number_text() {
  std::string text(buffer_->view(pos_, pos_ + peeked_number_length_));
  skip_bytes(peeked_number_length_);
  return text;
}

// ---- structure --------------------------------------------------------------

inline void Utf8Reader::begin_array() {
  if (current() != Peeked::BeginArray)
    throw unexpected("BEGIN_ARRAY", peek());
  ctx_.scopes.push(Scope::EmptyArray);
  consumed();
}

inline void Utf8Reader::end_array() {
  if (current() != Peeked::EndArray)
    throw unexpected("END_ARRAY", peek());
  ctx_.scopes.pop();
  ctx_.scopes.advance_index();
  consumed();
}

inline void Utf8Reader::begin_object() {
  if (current() != Peeked::BeginObject)
    throw unexpected("BEGIN_OBJECT", peek());
  ctx_.scopes.push(Scope::EmptyObject);
  consumed();
}

inline void Utf8Reader::end_object() {
  if (current() != Peeked::EndObject)
    throw unexpected("END_OBJECT", peek());
  ctx_.scopes.pop();
  ctx_.scopes.advance_index();
  consumed();
}

inline bool Utf8Reader::has_next() {
  Peeked p = current();
  return p != Peeked::EndObject && p != Peeked::EndArray && p != Peeked::Eof;
}

inline Token Utf8Reader::peek() {
  switch (current()) {
  case Peeked::BeginObject:
    return Token::BeginObject;
  case Peeked::EndObject:
    return Token::EndObject;
  case Peeked::BeginArray:
    return Token::BeginArray;
  case Peeked::EndArray:
    return Token::EndArray;
  case Peeked::SingleQuotedName:
  case Peeked::DoubleQuotedName:
  case Peeked::UnquotedName:
    return Token::Name;
  case Peeked::True:
  case Peeked::False:
    return Token::Boolean;
  case Peeked::Null:
    return Token::Null;
  case Peeked::SingleQuoted:
  case Peeked::DoubleQuoted:
  case Peeked::Unquoted:
  case Peeked::Buffered:
    return Token::String;
  case Peeked::Long:
  case Peeked::Number:
    return Token::Number;
  case Peeked::Eof:
    return Token::EndDocument;
  case Peeked::None:
    break;
  }
  throw std::logic_error("Unexpected lexer state at path " + get_path());
}

// ---- names ------------------------------------------------------------------

inline std::string Utf8Reader::next_name() {
  std::string result;
  switch (current()) {
  case Peeked::UnquotedName:
    result = next_unquoted_value();
    break;
  case Peeked::DoubleQuotedName:
    result = next_quoted_value('"');
    break;
  case Peeked::SingleQuotedName:
    result = next_quoted_value('\'');
    break;
  default:
    throw unexpected("a name", peek());
  }
  consumed();
  ctx_.scopes.set_name(result);
  return result;
}

inline std::optional<size_t> Utf8Reader::select_quoted(const Options &options) {
  uint64_t end = pos_ + options.max_encoded_length();
  if (!buffer_->require(end))
    end = buffer_->limit();
  std::optional<size_t> index = options.match(buffer_->view(pos_, end));
  if (index)
    skip_bytes(options.encoded(*index).size());
  return index;
}

inline std::optional<size_t> Utf8Reader::select_name(const Options &options) {
  if (current() != Peeked::DoubleQuotedName)
    return std::nullopt;
  std::optional<size_t> index = select_quoted(options);
  if (index) {
    consumed();
    ctx_.scopes.set_name(options.strings()[*index]);
  }
  return index;
}

inline void Utf8Reader::skip_name() {
  if (ctx_.fail_on_unknown) {
    throw DataError("Cannot skip unexpected " + std::string(to_string(peek())) +
                    " at " + get_path());
  }
  switch (current()) {
  case Peeked::UnquotedName:
    skip_unquoted_value();
    break;
  case Peeked::DoubleQuotedName:
    skip_quoted_value('"');
    break;
  case Peeked::SingleQuotedName:
    skip_quoted_value('\'');
    break;
  default:
    throw unexpected("a name", peek());
  }
  consumed();
  ctx_.scopes.set_name("null");
}

inline void Utf8Reader::promote_name_to_value() {
  if (has_next()) {
    peeked_string_ = next_name();
    peeked_ = Peeked::Buffered;
  }
}

// ---- scalars ------------------------------------------------------------------

inline std::string Utf8Reader::next_string() {
  std::string result;
  switch (current()) {
  case Peeked::Unquoted:
    result = next_unquoted_value();
    break;
  case Peeked::DoubleQuoted:
    result = next_quoted_value('"');
    break;
  case Peeked::SingleQuoted:
    result = next_quoted_value('\'');
    break;
  case Peeked::Buffered:
    result = std::move(peeked_string_);
    peeked_string_.clear();
    break;
  case Peeked::Long:
    result = std::to_string(peeked_long_);
    break;
  case Peeked::Number:
    result = take_number_text();
    break;
  default:
    throw unexpected("a string", peek());
  }
  consumed();
  ctx_.scopes.advance_index();
  return result;
}

inline std::optional<size_t>
Utf8Reader::select_string(const Options &options) {
  Peeked p = current();
  std::optional<size_t> index;
  if (p == Peeked::Buffered) {
    index = options.find(peeked_string_);
    if (index)
      peeked_string_.clear();
  } else if (p == Peeked::DoubleQuoted) {
    index = select_quoted(options);
  }
  if (index) {
    consumed();
    ctx_.scopes.advance_index();
  }
  return index;
}

inline bool Utf8Reader::next_boolean() {
  Peeked p = current();
  if (p != Peeked::True && p != Peeked::False)
    throw unexpected("a boolean", peek());
  consumed();
  ctx_.scopes.advance_index();
  return p == Peeked::True;
}

inline std::nullptr_t Utf8Reader::next_null() {
  if (current() != Peeked::Null)
    throw unexpected("null", peek());
  consumed();
  ctx_.scopes.advance_index();
  return nullptr;
}

inline double Utf8Reader::next_double() {
  Peeked p = current();
  if (p == Peeked::Long) {
    consumed();
    ctx_.scopes.advance_index();
    return static_cast<double>(peeked_long_);
  }

  if (p == Peeked::Number) {
    peeked_string_ = take_number_text();
  } else if (p == Peeked::DoubleQuoted) {
    peeked_string_ = next_quoted_value('"');
  } else if (p == Peeked::SingleQuoted) {
    peeked_string_ = next_quoted_value('\'');
  } else if (p == Peeked::Unquoted) {
    peeked_string_ = next_unquoted_value();
  } else if (p != Peeked::Buffered) {
    throw unexpected("a double", peek());
  }

  // Keep the text so a failed parse can still be read with next_string().
  peeked_ = Peeked::Buffered;
  double result = 0;
  if (!detail::parse_double(peeked_string_, result)) {
    throw DataError("Expected a double but was " + peeked_string_ +
                    " at path " + get_path());
  }
  if (!ctx_.lenient && !std::isfinite(result)) {
    throw DataError("JSON forbids NaN and infinities: " +
                    detail::format_double(result) + " at path " + get_path());
  }
  peeked_string_.clear();
  consumed();
  ctx_.scopes.advance_index();
  return result;
}

inline int64_t Utf8Reader::next_long() {
  Peeked p = current();
  if (p == Peeked::Long) {
    consumed();
    ctx_.scopes.advance_index();
    return peeked_long_;
  }

  if (p == Peeked::Number) {
    peeked_string_ = take_number_text();
  } else if (p == Peeked::DoubleQuoted || p == Peeked::SingleQuoted) {
    peeked_string_ = next_quoted_value(p == Peeked::DoubleQuoted ? '"' : '\'');
  } else if (p != Peeked::Buffered) {
    throw unexpected("a long", peek());
  }

  peeked_ = Peeked::Buffered;
  int64_t result = 0;
  if (!detail::parse_exact_integer(peeked_string_, result)) {
    throw DataError("Expected a long but was " + peeked_string_ +
                    " at path " + get_path());
  }
  peeked_string_.clear();
  consumed();
  ctx_.scopes.advance_index();
  return result;
}

inline int Utf8Reader::next_int() {
  Peeked p = current();
  if (p == Peeked::Long) {
    if (!detail::fits_int(peeked_long_)) {
      throw DataError("Expected an int but was " +
                      std::to_string(peeked_long_) + " at path " + get_path());
    }
    consumed();
    ctx_.scopes.advance_index();
    return static_cast<int>(peeked_long_);
  }

  if (p == Peeked::Number) {
    peeked_string_ = take_number_text();
  } else if (p == Peeked::DoubleQuoted || p == Peeked::SingleQuoted) {
    peeked_string_ = next_quoted_value(p == Peeked::DoubleQuoted ? '"' : '\'');
  } else if (p != Peeked::Buffered) {
    throw unexpected("an int", peek());
  }

  peeked_ = Peeked::Buffered;
  int64_t result = 0;
  if (!detail::parse_exact_integer(peeked_string_, result) ||
      !detail::fits_int(result)) {
    throw DataError("Expected an int but was " + peeked_string_ +
                    " at path " + get_path());
  }
  peeked_string_.clear();
  consumed();
  ctx_.scopes.advance_index();
  return static_cast<int>(result);
}

// ---- whole values -------------------------------------------------------------

// Finds the end of the array or object whose opening bracket was just
// consumed, counting brackets outside strings and comments.
inline uint64_t Utf8Reader::scan_composite() {
  size_t depth = 1;
  while (depth > 0) {
    if (!request(1))
      throw syntax_error("End of input");
    char c = byte_at(0);
    switch (c) {
    case '[':
    case '{':
      ++depth;
      skip_bytes(1);
      break;
    case ']':
    case '}':
      --depth;
      skip_bytes(1);
      break;
    case '"':
      skip_bytes(1);
      skip_quoted_value('"');
      break;
    case '\'':
      skip_bytes(1);
      if (ctx_.lenient)
        skip_quoted_value('\'');
      break;
    case '/':
      if (ctx_.lenient && request(2) && byte_at(1) == '*') {
        skip_bytes(2);
        if (!skip_to_block_comment_end())
          throw syntax_error("Unterminated comment");
        skip_bytes(2);
      } else if (ctx_.lenient && request(2) && byte_at(1) == '/') {
        skip_bytes(2);
        skip_to_end_of_line();
      } else {
        skip_bytes(1);
      }
      break;
    case '#':
      skip_bytes(1);
      if (ctx_.lenient)
        skip_to_end_of_line();
      break;
    case '\n':
      skip_bytes(1);
      ++line_;
      line_start_ = pos_;
      break;
    default:
      skip_bytes(1);
      break;
    }
  }
  return pos_;
}

inline std::string_view Utf8Reader::next_source() {
  Peeked p = current();
  const uint64_t start = token_start_;
  switch (p) {
  case Peeked::BeginArray:
  case Peeked::BeginObject:
    scan_composite();
    break;
  case Peeked::DoubleQuoted:
    skip_quoted_value('"');
    break;
  case Peeked::SingleQuoted:
    skip_quoted_value('\'');
    break;
  case Peeked::Unquoted:
    skip_unquoted_value();
    break;
  case Peeked::Number:
    skip_bytes(peeked_number_length_);
    break;
  case Peeked::Long:
  case Peeked::True:
  case Peeked::False:
    break;
  case Peeked::Null:
    if (start == pos_) {
      // Lenient missing array element: there are no bytes to return.
      consumed();
      ctx_.scopes.advance_index();
      return "null";
    }
    break;
  case Peeked::Buffered:
    source_scratch_ = std::move(peeked_string_);
    peeked_string_.clear();
    consumed();
    ctx_.scopes.advance_index();
    return source_scratch_;
  default:
    throw unexpected("a value", peek());
  }

  peeked_ = Peeked::None;
  // Keep the value's bytes addressable until the next call.
  if (owner_)
    buffer_->release(pos_, start);
  ctx_.scopes.advance_index();
  return buffer_->view(start, pos_);
}

inline void Utf8Reader::skip_value() {
  if (ctx_.fail_on_unknown) {
    throw DataError("Cannot skip unexpected " + std::string(to_string(peek())) +
                    " at " + get_path());
  }
  size_t count = 0;
  do {
    switch (current()) {
    case Peeked::BeginArray:
      ctx_.scopes.push(Scope::EmptyArray);
      ++count;
      break;
    case Peeked::BeginObject:
      ctx_.scopes.push(Scope::EmptyObject);
      ++count;
      break;
    case Peeked::EndArray:
    case Peeked::EndObject:
      if (count == 0)
        throw unexpected("a value", peek());
      --count;
      ctx_.scopes.pop();
      break;
    case Peeked::UnquotedName:
    case Peeked::Unquoted:
      skip_unquoted_value();
      break;
    case Peeked::DoubleQuoted:
    case Peeked::DoubleQuotedName:
      skip_quoted_value('"');
      break;
    case Peeked::SingleQuoted:
    case Peeked::SingleQuotedName:
      skip_quoted_value('\'');
      break;
    case Peeked::Number:
      skip_bytes(peeked_number_length_);
      break;
    case Peeked::Eof:
      throw unexpected("a value", peek());
    default:
      break;
    }
    peeked_string_.clear();
    consumed();
  } while (count != 0);

  ctx_.scopes.advance_index();
  ctx_.scopes.set_name("null");
}

// ---- lifecycle ------------------------------------------------------------------

inline std::unique_ptr<JsonReader> Utf8Reader::peek_json() {
  // Decode the next token first so this reader's later peek() and
  // has_next() calls do not move it.
  (void)current();
  return std::unique_ptr<JsonReader>(new Utf8Reader(*this, ForkTag{}));
}

inline void Utf8Reader::close() {
  peeked_ = Peeked::None;
  peeked_string_.clear();
  ctx_.scopes.reset(Scope::Closed);
  if (owner_)
    buffer_->close();
}

// ============================================================================
// ValueReader: token stream over an in-memory JsonValue
// ============================================================================

/**
 * @brief Replays a JsonValue tree through the JsonReader contract.
 *
 * Numbers are held as doubles, so next_long() and next_int() succeed only
 * for values that are exactly integral and in range, and next_string() on a
 * number returns its shortest round-trip text. Option tables are matched
 * against the decoded strings. The tree is immutable and shared, so
 * snapshots taken by peek_json() stay valid regardless of what this reader
 * does afterwards.
 */
class ValueReader final : public JsonReader {
  struct Frame {
    const JsonArray *array = nullptr;
    const JsonObject *object = nullptr;
    size_t next = 0;            // next element or member
    bool value_pending = false; // objects: the member's name was consumed
  };

  struct ForkTag {};

  std::shared_ptr<const JsonValue> root_;
  ReaderContext ctx_;
  std::vector<Frame> frames_;
  bool root_consumed_ = false;
  bool closed_ = false;
  std::optional<std::string> promoted_;
  std::string source_scratch_;

public:
  explicit ValueReader(std::shared_ptr<const JsonValue> root,
                       ReaderOptions options = {})
      : root_(std::move(root)), ctx_(options) {}

  ValueReader(const ValueReader &) = delete;
  ValueReader &operator=(const ValueReader &) = delete;

  void begin_array() override;
  void end_array() override;
  void begin_object() override;
  void end_object() override;
  bool has_next() override;
  Token peek() override;
  std::string next_name() override;
  std::optional<size_t> select_name(const Options &options) override;
  void skip_name() override;
  std::string next_string() override;
  std::optional<size_t> select_string(const Options &options) override;
  bool next_boolean() override;
  std::nullptr_t next_null() override;
  double next_double() override;
  int64_t next_long() override;
  int next_int() override;
  std::string_view next_source() override;
  void skip_value() override;
  void promote_name_to_value() override;
  std::unique_ptr<JsonReader> peek_json() override;
  void close() override;

protected:
  ReaderContext &context() override { return ctx_; }
  const ReaderContext &context() const override { return ctx_; }

private:
  ValueReader(const ValueReader &origin, ForkTag)
      : root_(origin.root_), ctx_(origin.ctx_.fork()), frames_(origin.frames_),
        root_consumed_(origin.root_consumed_), closed_(origin.closed_),
        promoted_(origin.promoted_) {}

  static Token token_of(const JsonValue &value) {
    switch (value.type()) {
    case ValueType::Null:
      return Token::Null;
    case ValueType::Boolean:
      return Token::Boolean;
    case ValueType::Number:
      return Token::Number;
    case ValueType::String:
      return Token::String;
    case ValueType::Array:
      return Token::BeginArray;
    case ValueType::Object:
      return Token::BeginObject;
    }
    return Token::Null;
  }

  // The value at the current position, or null at a name or an end token.
  const JsonValue *current_value() const {
    if (frames_.empty())
      return root_consumed_ ? nullptr : root_.get();
    const Frame &frame = frames_.back();
    if (frame.array) {
      return frame.next < frame.array->size() ? &(*frame.array)[frame.next]
                                              : nullptr;
    }
    if (frame.value_pending)
      return &frame.object->member(frame.next).value;
    return nullptr;
  }

  Token current_token() const {
    if (closed_)
      throw std::logic_error("JsonReader is closed");
    if (promoted_)
      return Token::String;
    if (const JsonValue *value = current_value())
      return token_of(*value);
    if (frames_.empty())
      return Token::EndDocument;
    const Frame &frame = frames_.back();
    if (frame.array)
      return Token::EndArray;
    return frame.next < frame.object->size() ? Token::Name : Token::EndObject;
  }

  // Value of the expected kind at the current position, or DataError.
  const JsonValue &require(Token expected, std::string_view what) const {
    Token actual = current_token();
    if (actual != expected || promoted_)
      throw unexpected(what, actual);
    return *current_value();
  }

  const std::string &require_name(std::string_view what) const {
    Token actual = current_token();
    if (actual != Token::Name)
      throw unexpected(what, actual);
    const Frame &frame = frames_.back();
    return frame.object->member(frame.next).name;
  }

  // Marks the pending name of the top object as read.
  void consume_name(std::string name) {
    frames_.back().value_pending = true;
    ctx_.scopes.set_top(Scope::DanglingName);
    ctx_.scopes.set_name(std::move(name));
  }

  // Moves past the value at the current position.
  void consume_value() {
    if (frames_.empty()) {
      root_consumed_ = true;
      ctx_.scopes.set_top(Scope::NonemptyDocument);
    } else {
      Frame &frame = frames_.back();
      ++frame.next;
      frame.value_pending = false;
      ctx_.scopes.set_top(frame.array ? Scope::NonemptyArray
                                      : Scope::NonemptyObject);
    }
    ctx_.scopes.advance_index();
  }

  std::string take_promoted() {
    std::string name = std::move(*promoted_);
    promoted_.reset();
    ctx_.scopes.advance_index();
    return name;
  }

  void end_composite(Token expected, std::string_view what) {
    Token actual = current_token();
    if (actual != expected || promoted_)
      throw unexpected(what, actual);
    frames_.pop_back();
    ctx_.scopes.pop();
    consume_value();
  }

  static bool to_integer(const JsonValue &value, int64_t &out) {
    if (value.is_number())
      return detail::exact_integer(value.as_number(), out);
    if (value.is_string())
      return detail::parse_exact_integer(value.as_string(), out);
    return false;
  }

  const JsonValue &require_numeric(std::string_view what) const {
    Token actual = current_token();
    if (actual != Token::Number && actual != Token::String)
      throw unexpected(what, actual);
    return *current_value();
  }
};

inline void ValueReader::begin_array() {
  const JsonValue &value = require(Token::BeginArray, "BEGIN_ARRAY");
  ctx_.scopes.push(Scope::EmptyArray);
  Frame frame;
  frame.array = &value.as_array();
  frames_.push_back(frame);
}

inline void ValueReader::end_array() {
  end_composite(Token::EndArray, "END_ARRAY");
}

inline void ValueReader::begin_object() {
  const JsonValue &value = require(Token::BeginObject, "BEGIN_OBJECT");
  ctx_.scopes.push(Scope::EmptyObject);
  Frame frame;
  frame.object = &value.as_object();
  frames_.push_back(frame);
}

inline void ValueReader::end_object() {
  end_composite(Token::EndObject, "END_OBJECT");
}

inline bool ValueReader::has_next() {
  Token t = current_token();
  return t != Token::EndArray && t != Token::EndObject &&
         t != Token::EndDocument;
}

inline Token ValueReader::peek() { return current_token(); }

inline std::string ValueReader::next_name() {
  std::string name = require_name("a name");
  consume_name(name);
  return name;
}

inline std::optional<size_t>
ValueReader::select_name(const Options &options) {
  if (current_token() != Token::Name)
    return std::nullopt;
  const Frame &frame = frames_.back();
  const std::string &name = frame.object->member(frame.next).name;
  std::optional<size_t> index = options.find(name);
  if (index)
    consume_name(name);
  return index;
}

inline void ValueReader::skip_name() {
  if (ctx_.fail_on_unknown) {
    throw DataError("Cannot skip unexpected " +
                    std::string(to_string(current_token())) + " at " +
                    get_path());
  }
  (void)require_name("a name");
  consume_name("null");
}

inline std::string ValueReader::next_string() {
  if (current_token() == Token::String && promoted_)
    return take_promoted();
  Token actual = current_token();
  if (actual != Token::String && actual != Token::Number)
    throw unexpected("a string", actual);
  const JsonValue &value = *current_value();
  std::string result = value.is_string()
                           ? value.as_string()
                           : detail::format_double(value.as_number());
  consume_value();
  return result;
}

inline std::optional<size_t>
ValueReader::select_string(const Options &options) {
  if (current_token() != Token::String)
    return std::nullopt;
  std::optional<size_t> index =
      options.find(promoted_ ? *promoted_ : current_value()->as_string());
  if (index) {
    if (promoted_)
      take_promoted();
    else
      consume_value();
  }
  return index;
}

inline bool ValueReader::next_boolean() {
  bool result = require(Token::Boolean, "a boolean").as_bool();
  consume_value();
  return result;
}

inline std::nullptr_t ValueReader::next_null() {
  (void)require(Token::Null, "null");
  consume_value();
  return nullptr;
}

inline double ValueReader::next_double() {
  double result = 0;
  if (promoted_) {
    if (!detail::parse_double(*promoted_, result)) {
      throw DataError("Expected a double but was " + *promoted_ +
                      " at path " + get_path());
    }
  } else {
    const JsonValue &value = require_numeric("a double");
    if (value.is_number()) {
      result = value.as_number();
    } else if (!detail::parse_double(value.as_string(), result)) {
      throw type_mismatch(value, "a double");
    }
  }
  if (!ctx_.lenient && !std::isfinite(result)) {
    throw DataError("JSON forbids NaN and infinities: " +
                    detail::format_double(result) + " at path " + get_path());
  }
  if (promoted_)
    take_promoted();
  else
    consume_value();
  return result;
}

inline int64_t ValueReader::next_long() {
  int64_t result = 0;
  if (promoted_) {
    if (!detail::parse_exact_integer(*promoted_, result)) {
      throw DataError("Expected a long but was " + *promoted_ + " at path " +
                      get_path());
    }
    take_promoted();
    return result;
  }
  const JsonValue &value = require_numeric("a long");
  if (!to_integer(value, result))
    throw type_mismatch(value, "a long");
  consume_value();
  return result;
}

inline int ValueReader::next_int() {
  int64_t result = 0;
  if (promoted_) {
    if (!detail::parse_exact_integer(*promoted_, result) ||
        !detail::fits_int(result)) {
      throw DataError("Expected an int but was " + *promoted_ + " at path " +
                      get_path());
    }
    take_promoted();
    return static_cast<int>(result);
  }
  const JsonValue &value = require_numeric("an int");
  if (!to_integer(value, result) || !detail::fits_int(result))
    throw type_mismatch(value, "an int");
  consume_value();
  return static_cast<int>(result);
}

// There are no input bytes behind a tree, so the value is re-encoded. A
// promoted name is returned as its text, like the streaming reader does.
inline std::string_view ValueReader::next_source() {
  if (current_token() == Token::String && promoted_) {
    source_scratch_ = take_promoted();
    return source_scratch_;
  }
  const JsonValue *value = current_value();
  if (!value)
    throw unexpected("a value", current_token());
  source_scratch_ = value->dump();
  consume_value();
  return source_scratch_;
}

inline void ValueReader::skip_value() {
  if (ctx_.fail_on_unknown) {
    throw DataError("Cannot skip unexpected " +
                    std::string(to_string(current_token())) + " at " +
                    get_path());
  }
  Token actual = current_token();
  if (promoted_) {
    promoted_.reset();
    ctx_.scopes.advance_index();
  } else if (actual == Token::Name) {
    frames_.back().value_pending = true;
    ctx_.scopes.set_top(Scope::DanglingName);
    ctx_.scopes.advance_index();
  } else if (current_value()) {
    consume_value();
  } else {
    throw unexpected("a value", actual);
  }
  ctx_.scopes.set_name("null");
}

inline void ValueReader::promote_name_to_value() {
  if (current_token() == Token::Name) {
    std::string name = next_name();
    promoted_ = std::move(name);
  }
}

inline std::unique_ptr<JsonReader> ValueReader::peek_json() {
  (void)current_token();
  return std::unique_ptr<JsonReader>(new ValueReader(*this, ForkTag{}));
}

inline void ValueReader::close() {
  closed_ = true;
  frames_.clear();
  promoted_.reset();
  ctx_.scopes.reset(Scope::Closed);
}

// ============================================================================
// Factories
// ============================================================================

inline std::unique_ptr<JsonReader> JsonReader::of(std::string json,
                                                  ReaderOptions options) {
  return of(std::make_unique<StringSource>(std::move(json)), options);
}

inline std::unique_ptr<JsonReader> JsonReader::of(std::istream &in,
                                                  ReaderOptions options) {
  return of(std::make_unique<StreamSource>(in), options);
}

inline std::unique_ptr<JsonReader> JsonReader::of(std::unique_ptr<Source> source,
                                                  ReaderOptions options) {
  return std::make_unique<Utf8Reader>(std::move(source), options);
}

inline std::unique_ptr<JsonReader> JsonReader::of_value(JsonValue value,
                                                        ReaderOptions options) {
  return std::make_unique<ValueReader>(
      std::make_shared<const JsonValue>(std::move(value)), options);
}

} // namespace json
} // namespace spool

#endif // SPOOL_JSON_HPP
