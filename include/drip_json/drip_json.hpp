/**
 * @file drip_json.hpp
 * @brief drip_json v1.0 - character-at-a-time JSON decoder
 * @version 1.0.0
 *
 * Every JSON grammar rule is a small state machine that is fed one code
 * point per call and answers with an Outcome:
 *
 *   Pending          consumed, nothing to report yet
 *   Partial(value)   provisional value (numbers only, no terminator)
 *   Done(value)      grammar-final, the machine is finished
 *   Rejected(error)  input invalid, the machine is dead
 *
 * ValueMachine runs every alternative on the first code point and keeps the
 * survivor. ArrayMachine and ObjectMachine spawn a fresh ValueMachine per
 * element and inspect delimiters before forwarding them.
 *
 * Header-only, C++20 STL only.
 *
 * License: MIT
 */

#ifndef DRIP_JSON_HPP
#define DRIP_JSON_HPP

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <memory>
#include <new>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#if __cplusplus < 202002L
#error "drip_json requires a C++20 compatible compiler."
#endif

// ============================================================================
// Data Types
// ============================================================================

namespace drip {
namespace json {

// One Unicode scalar value, or a lone UTF-16 surrogate unit
using CodePoint = char32_t;
using String = std::u32string;
using StringView = std::u32string_view;
template <typename T> using Vector = std::vector<T>;

} // namespace json
} // namespace drip

namespace drip {
namespace json {

// ============================================================================
// Error Handling
// ============================================================================

enum class Error {
  Ok = 0,
  UnexpectedCharacter,
  ExpectedQuote,
  UnterminatedString,
  InvalidEscape,
  InvalidUnicodeEscape,
  InvalidNumberFormat,
  LeadingZeroViolation,
  MissingColon,
  TrailingComma,
  UnexpectedCloseOrComma,
  NoMatchingGrammar,
  IncompleteInput,
  TrailingCharacters,
  NestingTooDeep,
  InvalidUtf8
};

inline const char *error_message(Error e) {
  switch (e) {
  case Error::Ok:
    return "No error";
  case Error::UnexpectedCharacter:
    return "Unexpected character";
  case Error::ExpectedQuote:
    return "Expected '\"' to open a string";
  case Error::UnterminatedString:
    return "Unterminated string";
  case Error::InvalidEscape:
    return "Invalid escape sequence";
  case Error::InvalidUnicodeEscape:
    return "Invalid \\u escape, expected 4 hex digits";
  case Error::InvalidNumberFormat:
    return "Invalid number format";
  case Error::LeadingZeroViolation:
    return "Leading zeros are not allowed in numbers";
  case Error::MissingColon:
    return "Missing ':' between object key and value";
  case Error::TrailingComma:
    return "Trailing comma";
  case Error::UnexpectedCloseOrComma:
    return "Unexpected ',' or closing bracket";
  case Error::NoMatchingGrammar:
    return "No JSON value starts with this character";
  case Error::IncompleteInput:
    return "Incomplete input";
  case Error::TrailingCharacters:
    return "Unexpected characters after the JSON value";
  case Error::NestingTooDeep:
    return "Nesting too deep";
  case Error::InvalidUtf8:
    return "Invalid UTF-8";
  default:
    return "Unknown error";
  }
}

inline std::ostream &operator<<(std::ostream &os, Error e) {
  return os << error_message(e);
}

class ParseError : public std::runtime_error {
public:
  Error code;
  CodePoint character;
  size_t line, column, offset;

  ParseError(Error e, CodePoint ch = 0, size_t l = 0, size_t c = 0,
             size_t off = 0)
      : std::runtime_error(error_message(e)), code(e), character(ch), line(l),
        column(c), offset(off) {}

  std::string format() const {
    std::ostringstream oss;
    if (line > 0) {
      oss << "Parse error at line " << line << ", column " << column << ": ";
    } else {
      oss << "Parse error at offset " << offset << ": ";
    }
    oss << what();
    if (character != 0) {
      oss << " (U+" << std::hex << std::uppercase
          << static_cast<uint32_t>(character) << ")";
    }
    return oss.str();
  }
};

class TypeError : public std::runtime_error {
public:
  TypeError(const std::string &msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Configuration
// ============================================================================

struct ParseOptions {
  // Arrays and objects nested deeper than this are rejected.
  size_t max_depth = 1024;
  // Join an escaped high/low surrogate pair into one code point. When
  // false every hex escape is stored as its own code unit.
  bool combine_surrogates = true;
};

namespace detail {

inline bool is_ws(CodePoint c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline bool is_digit(CodePoint c) noexcept { return c >= '0' && c <= '9'; }

inline int hex_val(CodePoint c) noexcept {
  if (c >= '0' && c <= '9')
    return static_cast<int>(c - '0');
  if (c >= 'a' && c <= 'f')
    return 10 + static_cast<int>(c - 'a');
  if (c >= 'A' && c <= 'F')
    return 10 + static_cast<int>(c - 'A');
  return -1;
}

inline bool is_high_surrogate(CodePoint c) noexcept {
  return c >= 0xD800 && c <= 0xDBFF;
}

inline bool is_low_surrogate(CodePoint c) noexcept {
  return c >= 0xDC00 && c <= 0xDFFF;
}

inline void append_utf8(std::string &out, CodePoint cp) {
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    // Lone surrogates land here too (WTF-8 style)
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

/**
 * @brief Value of a validated number literal that std::from_chars reported
 * as out of range.
 *
 * Decides between overflow (+/-inf) and underflow (+/-0) from the decimal
 * magnitude of the mantissa plus the exponent.
 */
inline double out_of_range_value(std::string_view num) {
  const bool negative = !num.empty() && num.front() == '-';
  if (negative)
    num.remove_prefix(1);

  const size_t e = num.find_first_of("eE");
  const std::string_view mantissa = num.substr(0, e);

  long long exponent = 0;
  if (e != std::string_view::npos) {
    std::string_view digits = num.substr(e + 1);
    bool exp_negative = false;
    if (!digits.empty() && (digits.front() == '-' || digits.front() == '+')) {
      exp_negative = digits.front() == '-';
      digits.remove_prefix(1);
    }
    for (char d : digits) {
      if (exponent < 1000000000LL)
        exponent = exponent * 10 + (d - '0');
    }
    if (exp_negative)
      exponent = -exponent;
  }

  const size_t dot = mantissa.find('.');
  const std::string_view int_part = mantissa.substr(0, dot);
  long long magnitude;
  if (int_part != "0") {
    magnitude = static_cast<long long>(int_part.size());
  } else {
    const std::string_view frac =
        dot == std::string_view::npos ? std::string_view{}
                                      : mantissa.substr(dot + 1);
    const size_t first_nonzero = frac.find_first_not_of('0');
    if (first_nonzero == std::string_view::npos)
      return negative ? -0.0 : 0.0;
    magnitude = -static_cast<long long>(first_nonzero);
  }

  const double v = (magnitude + exponent > 0)
                       ? std::numeric_limits<double>::infinity()
                       : 0.0;
  return negative ? -v : v;
}

} // namespace detail

// ============================================================================
// Text Conversion
// ============================================================================

/**
 * @brief Decode UTF-8 bytes into code points.
 *
 * Strict RFC 3629: overlong forms, encoded surrogates, values above
 * U+10FFFF and truncated sequences throw ParseError(Error::InvalidUtf8).
 */
inline String utf8_to_code_points(std::string_view bytes) {
  String out;
  out.reserve(bytes.size());
  const auto *str = reinterpret_cast<const unsigned char *>(bytes.data());
  const auto *begin = str;
  const auto *end = str + bytes.size();
  size_t line = 1, column = 1;

  auto fail = [&](const unsigned char *at) -> ParseError {
    return ParseError(Error::InvalidUtf8, 0, line, column,
                      static_cast<size_t>(at - begin));
  };

  while (str < end) {
    const unsigned char *start = str;
    unsigned char c = *str++;
    if (c < 0x80) {
      out.push_back(c);
      if (c == '\n') {
        ++line;
        column = 1;
      } else {
        ++column;
      }
      continue;
    }
    if (c < 0xC2 || c > 0xF4)
      throw fail(start); // Invalid start
    int n = (c < 0xE0) ? 1 : (c < 0xF0) ? 2 : 3;
    if (str + n > end)
      throw fail(start);

    unsigned char c2 = *str++;
    if ((c2 & 0xC0) != 0x80)
      throw fail(start);
    if (n == 1) {
      out.push_back(((c & 0x1F) << 6) | (c2 & 0x3F));
      ++column;
      continue;
    }

    unsigned char c3 = *str++;
    if ((c3 & 0xC0) != 0x80)
      throw fail(start);
    if (c == 0xE0 && c2 < 0xA0)
      throw fail(start); // Overlong
    if (c == 0xED && c2 >= 0xA0)
      throw fail(start); // Surrogate
    if (n == 2) {
      out.push_back(((c & 0x0F) << 12) | ((c2 & 0x3F) << 6) | (c3 & 0x3F));
      ++column;
      continue;
    }

    unsigned char c4 = *str++;
    if ((c4 & 0xC0) != 0x80)
      throw fail(start);
    if (c == 0xF0 && c2 < 0x90)
      throw fail(start); // Overlong
    if (c == 0xF4 && c2 >= 0x90)
      throw fail(start); // Out of range
    out.push_back(((c & 0x07) << 18) | ((c2 & 0x3F) << 12) |
                  ((c3 & 0x3F) << 6) | (c4 & 0x3F));
    ++column;
  }
  return out;
}

inline std::string to_utf8(StringView s) {
  std::string out;
  out.reserve(s.size());
  for (CodePoint cp : s)
    detail::append_utf8(out, cp);
  return out;
}

// ============================================================================
// Value Model
// ============================================================================

enum class ValueType : uint8_t { Null, Boolean, Number, String, Array, Object };

class Value;
struct Member;

class Array {
  Vector<Value> items_;

public:
  using value_type = Value;
  using iterator = Vector<Value>::iterator;
  using const_iterator = Vector<Value>::const_iterator;

  Array();
  Array(std::initializer_list<Value> init);

  void push_back(const Value &v);
  void push_back(Value &&v);
  void reserve(size_t n);
  size_t size() const;
  bool empty() const;

  Value &operator[](size_t index);
  const Value &operator[](size_t index) const;

  iterator begin();
  iterator end();
  const_iterator begin() const;
  const_iterator end() const;
};

class Object {
  // Insertion order, unique keys
  Vector<Member> members_;

public:
  using value_type = Member;
  using iterator = Vector<Member>::iterator;
  using const_iterator = Vector<Member>::const_iterator;

  Object();
  Object(std::initializer_list<Member> init);
  Object(const Object &other);
  Object(Object &&other) noexcept;
  Object &operator=(const Object &other);
  Object &operator=(Object &&other) noexcept;
  ~Object();

  // An existing key keeps its position and takes the new value.
  void insert_or_assign(String key, Value value);

  Value *find(StringView key);
  const Value *find(StringView key) const;
  bool contains(StringView key) const;

  Value &operator[](StringView key);
  const Value &operator[](StringView key) const;

  iterator begin();
  iterator end();
  const_iterator begin() const;
  const_iterator end() const;
  size_t size() const;
  bool empty() const;
};

class Value {
  ValueType type_;

  union {
    bool bool_val;
    double number_val;
    String string_val;
    Array array_val;
    Object object_val;
  };

public:
  Value() : type_(ValueType::Null) {}
  Value(std::nullptr_t) : type_(ValueType::Null) {}
  Value(bool b) : type_(ValueType::Boolean), bool_val(b) {}
  Value(int i) : type_(ValueType::Number), number_val(i) {}
  Value(double d) : type_(ValueType::Number), number_val(d) {}
  Value(const String &s) : type_(ValueType::String) {
    new (&string_val) String(s);
  }
  Value(String &&s) : type_(ValueType::String) {
    new (&string_val) String(std::move(s));
  }
  Value(StringView sv) : type_(ValueType::String) {
    new (&string_val) String(sv);
  }
  Value(const char32_t *s) : type_(ValueType::String) {
    new (&string_val) String(s);
  }
  // Would silently become a bool; use U"..." or utf8_to_code_points().
  Value(const char *) = delete;

  Value(Array &&a) : type_(ValueType::Array) {
    new (&array_val) Array(std::move(a));
  }
  Value(const Array &a) : type_(ValueType::Array) { new (&array_val) Array(a); }
  Value(Object &&o) : type_(ValueType::Object) {
    new (&object_val) Object(std::move(o));
  }
  Value(const Object &o) : type_(ValueType::Object) {
    new (&object_val) Object(o);
  }

  Value(const Value &other) : type_(other.type_) { copy_from(other); }
  Value(Value &&other) noexcept : type_(other.type_) {
    move_from(std::move(other));
  }

  Value &operator=(const Value &other) {
    if (this != &other) {
      Value tmp(other);
      destroy();
      type_ = tmp.type_;
      move_from(std::move(tmp));
    }
    return *this;
  }

  Value &operator=(Value &&other) noexcept {
    if (this != &other) {
      destroy();
      type_ = other.type_;
      move_from(std::move(other));
    }
    return *this;
  }

  ~Value() { destroy(); }

  ValueType type() const { return type_; }
  bool is_null() const { return type_ == ValueType::Null; }
  bool is_bool() const { return type_ == ValueType::Boolean; }
  bool is_number() const { return type_ == ValueType::Number; }
  bool is_string() const { return type_ == ValueType::String; }
  bool is_array() const { return type_ == ValueType::Array; }
  bool is_object() const { return type_ == ValueType::Object; }

  bool as_bool() const {
    if (!is_bool())
      throw TypeError("Not a boolean");
    return bool_val;
  }

  double as_number() const {
    if (!is_number())
      throw TypeError("Not a number");
    return number_val;
  }

  const String &as_string() const {
    if (!is_string())
      throw TypeError("Value is not a string");
    return string_val;
  }
  String &as_string() {
    if (!is_string())
      throw TypeError("Value is not a string");
    return string_val;
  }

  const Array &as_array() const {
    if (!is_array())
      throw TypeError("Not an array");
    return array_val;
  }
  Array &as_array() {
    if (!is_array())
      throw TypeError("Not an array");
    return array_val;
  }

  const Object &as_object() const {
    if (!is_object())
      throw TypeError("Not an object");
    return object_val;
  }
  Object &as_object() {
    if (!is_object())
      throw TypeError("Not an object");
    return object_val;
  }

  Value &operator[](size_t index) { return as_array()[index]; }
  const Value &operator[](size_t index) const { return as_array()[index]; }
  Value &operator[](int index) { return (*this)[static_cast<size_t>(index)]; }
  const Value &operator[](int index) const {
    return (*this)[static_cast<size_t>(index)];
  }
  Value &operator[](StringView key) { return as_object()[key]; }
  const Value &operator[](StringView key) const { return as_object()[key]; }
  Value &operator[](const char32_t *key) { return (*this)[StringView(key)]; }
  const Value &operator[](const char32_t *key) const {
    return (*this)[StringView(key)];
  }

  const Value *find(StringView key) const {
    return is_object() ? object_val.find(key) : nullptr;
  }

  bool contains(StringView key) const {
    return is_object() && object_val.contains(key);
  }

  size_t size() const;
  bool empty() const;

  std::string dump() const;

  static Value null() { return Value(nullptr); }
  static Value array() { return Value(Array{}); }
  static Value object() { return Value(Object{}); }

private:
  void destroy();
  void copy_from(const Value &other);
  void move_from(Value &&other);
};

inline bool operator==(const Value &a, const Value &b);

struct Member {
  String key;
  Value value;
};

// ============================================================================
// Array & Object Implementation (out of line, Value must be complete)
// ============================================================================

inline Array::Array() = default;
inline Array::Array(std::initializer_list<Value> init) : items_(init) {}

inline void Array::push_back(const Value &v) { items_.push_back(v); }
inline void Array::push_back(Value &&v) { items_.push_back(std::move(v)); }
inline void Array::reserve(size_t n) { items_.reserve(n); }
inline size_t Array::size() const { return items_.size(); }
inline bool Array::empty() const { return items_.empty(); }

inline Value &Array::operator[](size_t index) {
  if (index >= items_.size())
    throw std::out_of_range("Array index out of range");
  return items_[index];
}
inline const Value &Array::operator[](size_t index) const {
  if (index >= items_.size())
    throw std::out_of_range("Array index out of range");
  return items_[index];
}

inline Array::iterator Array::begin() { return items_.begin(); }
inline Array::iterator Array::end() { return items_.end(); }
inline Array::const_iterator Array::begin() const { return items_.begin(); }
inline Array::const_iterator Array::end() const { return items_.end(); }

inline Object::Object() = default;
inline Object::Object(const Object &other) = default;
inline Object::Object(Object &&other) noexcept = default;
inline Object &Object::operator=(const Object &other) = default;
inline Object &Object::operator=(Object &&other) noexcept = default;
inline Object::~Object() = default;
inline Object::Object(std::initializer_list<Member> init) {
  for (const auto &m : init)
    insert_or_assign(m.key, m.value);
}

inline void Object::insert_or_assign(String key, Value value) {
  if (Value *existing = find(key)) {
    *existing = std::move(value);
    return;
  }
  members_.push_back(Member{std::move(key), std::move(value)});
}

inline Value *Object::find(StringView key) {
  for (auto &m : members_) {
    if (m.key == key)
      return &m.value;
  }
  return nullptr;
}

inline const Value *Object::find(StringView key) const {
  for (const auto &m : members_) {
    if (m.key == key)
      return &m.value;
  }
  return nullptr;
}

inline bool Object::contains(StringView key) const {
  return find(key) != nullptr;
}

inline Value &Object::operator[](StringView key) {
  if (Value *v = find(key))
    return *v;
  members_.push_back(Member{String(key), Value()});
  return members_.back().value;
}

inline const Value &Object::operator[](StringView key) const {
  if (const Value *v = find(key))
    return *v;
  throw std::out_of_range("Key not found: " + to_utf8(key));
}

inline Object::iterator Object::begin() { return members_.begin(); }
inline Object::iterator Object::end() { return members_.end(); }
inline Object::const_iterator Object::begin() const { return members_.begin(); }
inline Object::const_iterator Object::end() const { return members_.end(); }
inline size_t Object::size() const { return members_.size(); }
inline bool Object::empty() const { return members_.empty(); }

inline size_t Value::size() const {
  if (is_array())
    return array_val.size();
  if (is_object())
    return object_val.size();
  return 0;
}

inline bool Value::empty() const {
  if (is_array())
    return array_val.empty();
  if (is_object())
    return object_val.empty();
  return true;
}

inline void Value::destroy() {
  switch (type_) {
  case ValueType::String:
    string_val.~String();
    break;
  case ValueType::Array:
    array_val.~Array();
    break;
  case ValueType::Object:
    object_val.~Object();
    break;
  default:
    break;
  }
  type_ = ValueType::Null;
}

inline void Value::copy_from(const Value &other) {
  switch (other.type_) {
  case ValueType::Null:
    break;
  case ValueType::Boolean:
    bool_val = other.bool_val;
    break;
  case ValueType::Number:
    number_val = other.number_val;
    break;
  case ValueType::String:
    new (&string_val) String(other.string_val);
    break;
  case ValueType::Array:
    new (&array_val) Array(other.array_val);
    break;
  case ValueType::Object:
    new (&object_val) Object(other.object_val);
    break;
  }
}

inline void Value::move_from(Value &&other) {
  switch (other.type_) {
  case ValueType::Null:
    break;
  case ValueType::Boolean:
    bool_val = other.bool_val;
    break;
  case ValueType::Number:
    number_val = other.number_val;
    break;
  case ValueType::String:
    new (&string_val) String(std::move(other.string_val));
    break;
  case ValueType::Array:
    new (&array_val) Array(std::move(other.array_val));
    break;
  case ValueType::Object:
    new (&object_val) Object(std::move(other.object_val));
    break;
  }
}

inline bool operator==(const Value &a, const Value &b) {
  if (a.type() != b.type())
    return false;
  switch (a.type()) {
  case ValueType::Null:
    return true;
  case ValueType::Boolean:
    return a.as_bool() == b.as_bool();
  case ValueType::Number:
    return a.as_number() == b.as_number();
  case ValueType::String:
    return a.as_string() == b.as_string();
  case ValueType::Array: {
    auto &aa = a.as_array();
    auto &ab = b.as_array();
    if (aa.size() != ab.size())
      return false;
    for (size_t i = 0; i < aa.size(); i++) {
      if (!(aa[i] == ab[i]))
        return false;
    }
    return true;
  }
  case ValueType::Object: {
    // Order-insensitive: two objects with the same members are equal
    auto &oa = a.as_object();
    auto &ob = b.as_object();
    if (oa.size() != ob.size())
      return false;
    for (const auto &m : oa) {
      const Value *other = ob.find(m.key);
      if (!other || !(m.value == *other))
        return false;
    }
    return true;
  }
  }
  return false;
}

inline bool operator!=(const Value &a, const Value &b) { return !(a == b); }

// ============================================================================
// Serialization (diagnostics)
// ============================================================================

class StringBuffer {
  std::string buffer_;

public:
  StringBuffer() { buffer_.reserve(256); }

  void put(char c) { buffer_.push_back(c); }
  void write(const char *data, size_t len) { buffer_.append(data, len); }
  void write(std::string_view s) { buffer_.append(s); }
  void clear() { buffer_.clear(); }

  const std::string &str() const { return buffer_; }
  size_t size() const { return buffer_.size(); }
};

class Serializer {
  StringBuffer &out_;

public:
  explicit Serializer(StringBuffer &out) : out_(out) {}

  void write(const Value &v) {
    switch (v.type()) {
    case ValueType::Null:
      out_.write("null", 4);
      break;
    case ValueType::Boolean:
      write(v.as_bool());
      break;
    case ValueType::Number:
      write(v.as_number());
      break;
    case ValueType::String:
      write_string(v.as_string());
      break;
    case ValueType::Array: {
      out_.put('[');
      bool first = true;
      for (const auto &item : v.as_array()) {
        if (!first)
          out_.put(',');
        first = false;
        write(item);
      }
      out_.put(']');
      break;
    }
    case ValueType::Object: {
      out_.put('{');
      bool first = true;
      for (const auto &m : v.as_object()) {
        if (!first)
          out_.put(',');
        first = false;
        write_string(m.key);
        out_.put(':');
        write(m.value);
      }
      out_.put('}');
      break;
    }
    }
  }

  void write(bool value) {
    out_.write(value ? "true" : "false", value ? 4 : 5);
  }

  void write(double value) {
    if (value != value) {
      out_.write("null", 4);
      return;
    }
    if (value == std::numeric_limits<double>::infinity() ||
        value == -std::numeric_limits<double>::infinity()) {
      out_.write(value < 0 ? "\"-Infinity\"" : "\"Infinity\"");
      return;
    }
    // Shortest representation that round-trips
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc())
      throw std::runtime_error("Failed to format number");
    out_.write(buf, static_cast<size_t>(ptr - buf));
  }

  void write_string(StringView str) {
    out_.put('"');
    std::string utf8;
    for (CodePoint c : str) {
      switch (c) {
      case '"':
        out_.write("\\\"", 2);
        break;
      case '\\':
        out_.write("\\\\", 2);
        break;
      case '\b':
        out_.write("\\b", 2);
        break;
      case '\f':
        out_.write("\\f", 2);
        break;
      case '\n':
        out_.write("\\n", 2);
        break;
      case '\r':
        out_.write("\\r", 2);
        break;
      case '\t':
        out_.write("\\t", 2);
        break;
      default:
        if (c < 0x20 || detail::is_high_surrogate(c) ||
            detail::is_low_surrogate(c)) {
          write_unicode_escape(c);
        } else {
          utf8.clear();
          detail::append_utf8(utf8, c);
          out_.write(utf8);
        }
        break;
      }
    }
    out_.put('"');
  }

private:
  void write_unicode_escape(CodePoint c) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    char esc[6] = {'\\', 'u', kHex[(c >> 12) & 0xF], kHex[(c >> 8) & 0xF],
                   kHex[(c >> 4) & 0xF], kHex[c & 0xF]};
    out_.write(esc, sizeof(esc));
  }
};

inline std::string Value::dump() const {
  StringBuffer buf;
  Serializer ser(buf);
  ser.write(*this);
  return buf.str();
}

inline std::ostream &operator<<(std::ostream &os, const Value &v) {
  return os << v.dump();
}

// ============================================================================
// Outcome: result of feeding one code point
// ============================================================================

struct Pending {};

struct Partial {
  Value value;
};

struct Done {
  Value value;
};

struct Rejected {
  Error error;
  CodePoint character;
};

/**
 * @brief Tagged result of Machine::feed().
 *
 * "No value yet" is its own alternative, so null, false, 0 and empty
 * containers are always carried as real values.
 */
class Outcome {
  std::variant<Pending, Partial, Done, Rejected> state_;

public:
  Outcome() = default;
  Outcome(Pending) {}
  Outcome(Partial p) : state_(std::move(p)) {}
  Outcome(Done d) : state_(std::move(d)) {}
  Outcome(Rejected r) : state_(r) {}

  static Outcome pending() { return Outcome(); }
  static Outcome partial(Value v) { return Outcome(Partial{std::move(v)}); }
  static Outcome done(Value v) { return Outcome(Done{std::move(v)}); }
  static Outcome rejected(Error e, CodePoint c) {
    return Outcome(Rejected{e, c});
  }

  bool is_pending() const { return std::holds_alternative<Pending>(state_); }
  bool is_partial() const { return std::holds_alternative<Partial>(state_); }
  bool is_done() const { return std::holds_alternative<Done>(state_); }
  bool is_rejected() const { return std::holds_alternative<Rejected>(state_); }
  bool is_terminal() const { return is_done() || is_rejected(); }

  const Value &value() const {
    if (const auto *p = std::get_if<Partial>(&state_))
      return p->value;
    if (const auto *d = std::get_if<Done>(&state_))
      return d->value;
    throw std::logic_error("Outcome carries no value");
  }

  Value take_value() {
    if (auto *p = std::get_if<Partial>(&state_))
      return std::move(p->value);
    if (auto *d = std::get_if<Done>(&state_))
      return std::move(d->value);
    throw std::logic_error("Outcome carries no value");
  }

  Error error() const {
    const auto *r = std::get_if<Rejected>(&state_);
    return r ? r->error : Error::Ok;
  }

  CodePoint character() const {
    const auto *r = std::get_if<Rejected>(&state_);
    return r ? r->character : 0;
  }
};

// ============================================================================
// Machines
// ============================================================================

/**
 * @brief Incremental parser for one grammar rule.
 *
 * feed() takes exactly one code point. Once an Outcome is Done or Rejected
 * the machine is terminal and feeding it again throws std::logic_error.
 */
class Machine {
  bool finished_ = false;

public:
  virtual ~Machine() = default;

  Outcome feed(CodePoint c) {
    if (finished_)
      throw std::logic_error("feed() called on a finished machine");
    Outcome out = step(c);
    finished_ = out.is_terminal();
    return out;
  }

  bool finished() const { return finished_; }

  // Error to report when input ends while this machine is still open.
  virtual Error truncation_error() const { return Error::IncompleteInput; }

protected:
  virtual Outcome step(CodePoint c) = 0;
};

using MachinePtr = std::unique_ptr<Machine>;

// Defined after ValueMachine; containers spawn one per element.
inline MachinePtr make_value_machine(size_t depth,
                                     const ParseOptions &options);

// ----------------------------------------------------------------------------
// LiteralMachine: true / false / null
// ----------------------------------------------------------------------------

class LiteralMachine final : public Machine {
  String literal_;
  Value value_;
  size_t matched_ = 0;

public:
  LiteralMachine(String literal, Value value)
      : literal_(std::move(literal)), value_(std::move(value)) {
    if (literal_.empty())
      throw std::invalid_argument("LiteralMachine needs a non-empty literal");
  }

protected:
  Outcome step(CodePoint c) override {
    if (c != literal_[matched_])
      return Outcome::rejected(Error::UnexpectedCharacter, c);
    if (++matched_ == literal_.size())
      return Outcome::done(std::move(value_));
    return Outcome::pending();
  }
};

// ----------------------------------------------------------------------------
// StringMachine
// ----------------------------------------------------------------------------

class StringMachine final : public Machine {
  enum class State : uint8_t {
    ExpectOpenQuote,
    InBody,
    InEscape,
    InUnicodeEscape
  };

  State state_ = State::ExpectOpenQuote;
  String value_;
  CodePoint unit_ = 0;
  int hex_digits_ = 0;
  CodePoint pending_high_ = 0; // high surrogate waiting for its low half
  bool combine_surrogates_;

public:
  explicit StringMachine(bool combine_surrogates = true)
      : combine_surrogates_(combine_surrogates) {}

  Error truncation_error() const override {
    return state_ == State::ExpectOpenQuote ? Error::IncompleteInput
                                            : Error::UnterminatedString;
  }

protected:
  Outcome step(CodePoint c) override {
    switch (state_) {
    case State::ExpectOpenQuote:
      if (c != '"')
        return Outcome::rejected(Error::ExpectedQuote, c);
      state_ = State::InBody;
      return Outcome::pending();

    case State::InBody:
      if (c == '\\') {
        state_ = State::InEscape;
        return Outcome::pending();
      }
      flush_high_surrogate();
      if (c == '"')
        return Outcome::done(Value(std::move(value_)));
      value_.push_back(c);
      return Outcome::pending();

    case State::InEscape: {
      if (c == 'u') {
        state_ = State::InUnicodeEscape;
        unit_ = 0;
        hex_digits_ = 0;
        return Outcome::pending();
      }
      flush_high_surrogate();
      CodePoint decoded;
      switch (c) {
      case '"':
      case '\\':
      case '/':
        decoded = c;
        break;
      case 'b':
        decoded = '\b';
        break;
      case 'f':
        decoded = '\f';
        break;
      case 'n':
        decoded = '\n';
        break;
      case 'r':
        decoded = '\r';
        break;
      case 't':
        decoded = '\t';
        break;
      default:
        return Outcome::rejected(Error::InvalidEscape, c);
      }
      value_.push_back(decoded);
      state_ = State::InBody;
      return Outcome::pending();
    }

    case State::InUnicodeEscape: {
      const int h = detail::hex_val(c);
      if (h < 0)
        return Outcome::rejected(Error::InvalidUnicodeEscape, c);
      unit_ = (unit_ << 4) | static_cast<CodePoint>(h);
      if (++hex_digits_ < 4)
        return Outcome::pending();
      state_ = State::InBody;
      append_unit(unit_);
      return Outcome::pending();
    }
    }
    return Outcome::rejected(Error::UnexpectedCharacter, c);
  }

private:
  void flush_high_surrogate() {
    if (pending_high_ != 0) {
      value_.push_back(pending_high_);
      pending_high_ = 0;
    }
  }

  void append_unit(CodePoint unit) {
    if (combine_surrogates_) {
      if (pending_high_ != 0 && detail::is_low_surrogate(unit)) {
        value_.push_back(0x10000 + ((pending_high_ - 0xD800) << 10) +
                         (unit - 0xDC00));
        pending_high_ = 0;
        return;
      }
      flush_high_surrogate();
      if (detail::is_high_surrogate(unit)) {
        pending_high_ = unit;
        return;
      }
    }
    value_.push_back(unit);
  }
};

// ----------------------------------------------------------------------------
// NumberMachine
// ----------------------------------------------------------------------------

/**
 * @brief -? (0 | [1-9][0-9]*) (. [0-9]+)? ([eE] [+-]? [0-9]+)?
 *
 * Numbers have no terminator, so this machine never reports Done. Every
 * code point that leaves it in an accepting state yields Partial with the
 * value so far; the caller adopts the last Partial when it sees a delimiter
 * or the end of input.
 *
 * Conversion reruns only for digits that can move the rounded double, so a
 * literal thousands of digits long still costs linear time.
 */
class NumberMachine final : public Machine {
  enum class State : uint8_t {
    Start,
    Sign,
    Zero,
    Integer,
    Dot,
    Fraction,
    Exponent,
    ExponentSign,
    ExponentDigits
  };

  // A double is fixed by its first 767 significant digits plus whether any
  // nonzero digit follows them.
  static constexpr size_t kMaxSignificantDigits = 800;
  static constexpr size_t kMaxExponentDigits = 10;

  State state_ = State::Start;
  std::string digits_;
  double value_ = 0.0;
  size_t significant_ = 0;
  size_t exponent_significant_ = 0;
  bool sticky_ = false; // nonzero digit seen past kMaxSignificantDigits

public:
  NumberMachine() { digits_.reserve(24); }

protected:
  Outcome step(CodePoint c) override {
    const bool digit = detail::is_digit(c);
    switch (state_) {
    case State::Start:
      if (c == '-')
        return advance(State::Sign, c);
      [[fallthrough]];
    case State::Sign:
      if (c == '0')
        return accept(State::Zero, c);
      if (digit)
        return accept(State::Integer, c);
      break;

    case State::Zero:
      if (digit)
        return Outcome::rejected(Error::LeadingZeroViolation, c);
      [[fallthrough]];
    case State::Integer:
      if (digit)
        return accept(State::Integer, c);
      if (c == '.')
        return advance(State::Dot, c);
      if (c == 'e' || c == 'E')
        return advance(State::Exponent, c);
      break;

    case State::Dot:
      if (digit)
        return accept(State::Fraction, c);
      break;

    case State::Fraction:
      if (digit)
        return accept(State::Fraction, c);
      if (c == 'e' || c == 'E')
        return advance(State::Exponent, c);
      break;

    case State::Exponent:
      if (c == '+' || c == '-')
        return advance(State::ExponentSign, c);
      [[fallthrough]];
    case State::ExponentSign:
    case State::ExponentDigits:
      if (digit)
        return accept(State::ExponentDigits, c);
      break;
    }
    return Outcome::rejected(Error::InvalidNumberFormat, c);
  }

private:
  Outcome advance(State next, CodePoint c) {
    digits_.push_back(static_cast<char>(c));
    state_ = next;
    return Outcome::pending();
  }

  Outcome accept(State next, CodePoint c) {
    digits_.push_back(static_cast<char>(c));
    state_ = next;
    if (moves_value(c))
      value_ = current_value();
    return Outcome::partial(Value(value_));
  }

  bool moves_value(CodePoint c) {
    if (state_ == State::Zero)
      return true;
    if (state_ == State::ExponentDigits) {
      if (c != '0' || exponent_significant_ > 0)
        ++exponent_significant_;
      return exponent_significant_ > 0 &&
             exponent_significant_ <= kMaxExponentDigits;
    }

    if (c != '0' || significant_ > 0)
      ++significant_;
    if (significant_ == 0)
      return false; // 0.000 is still +/-0
    if (significant_ <= kMaxSignificantDigits)
      return true;
    if (state_ == State::Integer)
      return false; // already infinite
    if (c == '0' || sticky_)
      return false;
    sticky_ = true;
    return true;
  }

  double current_value() const {
    double result = 0.0;
    const char *first = digits_.data();
    const char *last = first + digits_.size();
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec == std::errc::result_out_of_range)
      return detail::out_of_range_value(digits_);
    if (ec != std::errc() || ptr != last)
      throw std::logic_error("NumberMachine accepted an invalid literal");
    return result;
  }
};

// ----------------------------------------------------------------------------
// ArrayMachine
// ----------------------------------------------------------------------------

class ArrayMachine final : public Machine {
  enum class State : uint8_t {
    ExpectOpenBracket,
    ExpectElementOrClose,
    InElement,
    ExpectCommaOrClose,
    ExpectElement
  };

  State state_ = State::ExpectOpenBracket;
  size_t depth_;
  ParseOptions options_;
  Array items_;
  MachinePtr element_;
  std::optional<Value> partial_;

public:
  explicit ArrayMachine(size_t depth = 0, ParseOptions options = {})
      : depth_(depth), options_(options) {}

  Error truncation_error() const override {
    return element_ ? element_->truncation_error() : Error::IncompleteInput;
  }

protected:
  Outcome step(CodePoint c) override {
    switch (state_) {
    case State::ExpectOpenBracket:
      if (c != '[')
        return Outcome::rejected(Error::UnexpectedCharacter, c);
      if (depth_ >= options_.max_depth)
        return Outcome::rejected(Error::NestingTooDeep, c);
      state_ = State::ExpectElementOrClose;
      return Outcome::pending();

    case State::ExpectElementOrClose:
      if (detail::is_ws(c))
        return Outcome::pending();
      if (c == ']')
        return Outcome::done(Value(std::move(items_)));
      if (c == ',')
        return Outcome::rejected(Error::UnexpectedCloseOrComma, c);
      return start_element(c);

    case State::ExpectElement:
      if (detail::is_ws(c))
        return Outcome::pending();
      if (c == ']')
        return Outcome::rejected(Error::TrailingComma, c);
      if (c == ',')
        return Outcome::rejected(Error::UnexpectedCloseOrComma, c);
      return start_element(c);

    case State::InElement:
      // A number only ends at a delimiter; look before forwarding.
      if (partial_ && (c == ',' || c == ']' || detail::is_ws(c))) {
        finish_element(std::move(*partial_));
        return after_element(c);
      }
      return feed_element(c);

    case State::ExpectCommaOrClose:
      return after_element(c);
    }
    return Outcome::rejected(Error::UnexpectedCharacter, c);
  }

private:
  Outcome start_element(CodePoint c) {
    element_ = make_value_machine(depth_ + 1, options_);
    state_ = State::InElement;
    return feed_element(c);
  }

  Outcome feed_element(CodePoint c) {
    Outcome out = element_->feed(c);
    if (out.is_rejected())
      return out;
    if (out.is_done()) {
      finish_element(out.take_value());
    } else if (out.is_partial()) {
      partial_ = out.take_value();
    } else {
      partial_.reset();
    }
    return Outcome::pending();
  }

  void finish_element(Value v) {
    items_.push_back(std::move(v));
    element_.reset();
    partial_.reset();
    state_ = State::ExpectCommaOrClose;
  }

  Outcome after_element(CodePoint c) {
    if (detail::is_ws(c))
      return Outcome::pending();
    if (c == ',') {
      state_ = State::ExpectElement;
      return Outcome::pending();
    }
    if (c == ']')
      return Outcome::done(Value(std::move(items_)));
    return Outcome::rejected(Error::UnexpectedCharacter, c);
  }
};

// ----------------------------------------------------------------------------
// ObjectMachine
// ----------------------------------------------------------------------------

class ObjectMachine final : public Machine {
  enum class State : uint8_t {
    ExpectOpenBrace,
    ExpectKeyOrClose,
    ExpectKey,
    InKey,
    ExpectColon,
    ExpectValue,
    InValue,
    ExpectCommaOrClose
  };

  State state_ = State::ExpectOpenBrace;
  size_t depth_;
  ParseOptions options_;
  Object members_;
  String key_;
  MachinePtr child_; // key StringMachine or value ValueMachine
  std::optional<Value> partial_;

public:
  explicit ObjectMachine(size_t depth = 0, ParseOptions options = {})
      : depth_(depth), options_(options) {}

  Error truncation_error() const override {
    return child_ ? child_->truncation_error() : Error::IncompleteInput;
  }

protected:
  Outcome step(CodePoint c) override {
    switch (state_) {
    case State::ExpectOpenBrace:
      if (c != '{')
        return Outcome::rejected(Error::UnexpectedCharacter, c);
      if (depth_ >= options_.max_depth)
        return Outcome::rejected(Error::NestingTooDeep, c);
      state_ = State::ExpectKeyOrClose;
      return Outcome::pending();

    case State::ExpectKeyOrClose:
      if (detail::is_ws(c))
        return Outcome::pending();
      if (c == '}')
        return Outcome::done(Value(std::move(members_)));
      if (c == ',')
        return Outcome::rejected(Error::UnexpectedCloseOrComma, c);
      return start_key(c);

    case State::ExpectKey:
      if (detail::is_ws(c))
        return Outcome::pending();
      if (c == '}')
        return Outcome::rejected(Error::TrailingComma, c);
      if (c == ',')
        return Outcome::rejected(Error::UnexpectedCloseOrComma, c);
      return start_key(c);

    case State::InKey:
      return feed_key(c);

    case State::ExpectColon:
      if (detail::is_ws(c))
        return Outcome::pending();
      if (c != ':')
        return Outcome::rejected(Error::MissingColon, c);
      state_ = State::ExpectValue;
      return Outcome::pending();

    case State::ExpectValue:
      if (detail::is_ws(c))
        return Outcome::pending();
      if (c == ',' || c == '}')
        return Outcome::rejected(Error::UnexpectedCloseOrComma, c);
      child_ = make_value_machine(depth_ + 1, options_);
      state_ = State::InValue;
      return feed_value(c);

    case State::InValue:
      if (partial_ && (c == ',' || c == '}' || detail::is_ws(c))) {
        finish_member(std::move(*partial_));
        return after_member(c);
      }
      return feed_value(c);

    case State::ExpectCommaOrClose:
      return after_member(c);
    }
    return Outcome::rejected(Error::UnexpectedCharacter, c);
  }

private:
  Outcome start_key(CodePoint c) {
    child_ = std::make_unique<StringMachine>(options_.combine_surrogates);
    state_ = State::InKey;
    return feed_key(c);
  }

  Outcome feed_key(CodePoint c) {
    Outcome out = child_->feed(c);
    if (out.is_rejected())
      return out;
    if (out.is_done()) {
      key_ = std::move(out.take_value().as_string());
      child_.reset();
      state_ = State::ExpectColon;
    }
    return Outcome::pending();
  }

  Outcome feed_value(CodePoint c) {
    Outcome out = child_->feed(c);
    if (out.is_rejected())
      return out;
    if (out.is_done()) {
      finish_member(out.take_value());
    } else if (out.is_partial()) {
      partial_ = out.take_value();
    } else {
      partial_.reset();
    }
    return Outcome::pending();
  }

  void finish_member(Value v) {
    members_.insert_or_assign(std::move(key_), std::move(v));
    key_.clear();
    child_.reset();
    partial_.reset();
    state_ = State::ExpectCommaOrClose;
  }

  Outcome after_member(CodePoint c) {
    if (detail::is_ws(c))
      return Outcome::pending();
    if (c == ',') {
      state_ = State::ExpectKey;
      return Outcome::pending();
    }
    if (c == '}')
      return Outcome::done(Value(std::move(members_)));
    return Outcome::rejected(Error::UnexpectedCharacter, c);
  }
};

// ----------------------------------------------------------------------------
// ValueMachine: parallel dispatch, then forward to the survivor
// ----------------------------------------------------------------------------

class ValueMachine final : public Machine {
  size_t depth_;
  ParseOptions options_;
  MachinePtr active_;

public:
  explicit ValueMachine(size_t depth = 0, ParseOptions options = {})
      : depth_(depth), options_(options) {}

  Error truncation_error() const override {
    return active_ ? active_->truncation_error() : Error::IncompleteInput;
  }

protected:
  Outcome step(CodePoint c) override {
    if (active_)
      return active_->feed(c);
    return dispatch(c);
  }

private:
  // Enumeration order is the tie-break order.
  Vector<MachinePtr> alternatives() const {
    Vector<MachinePtr> alts;
    alts.reserve(7);
    alts.push_back(std::make_unique<NumberMachine>());
    alts.push_back(std::make_unique<ObjectMachine>(depth_, options_));
    alts.push_back(std::make_unique<ArrayMachine>(depth_, options_));
    alts.push_back(
        std::make_unique<StringMachine>(options_.combine_surrogates));
    alts.push_back(std::make_unique<LiteralMachine>(U"null", Value(nullptr)));
    alts.push_back(std::make_unique<LiteralMachine>(U"false", Value(false)));
    alts.push_back(std::make_unique<LiteralMachine>(U"true", Value(true)));
    return alts;
  }

  Outcome dispatch(CodePoint c) {
    Vector<MachinePtr> alts = alternatives();
    std::optional<Outcome> first;
    Error failure = Error::NoMatchingGrammar;

    for (auto &candidate : alts) {
      Outcome out = candidate->feed(c);
      if (out.is_rejected()) {
        if (out.error() == Error::NestingTooDeep)
          failure = Error::NestingTooDeep;
        continue;
      }
      if (!first) {
        first = std::move(out);
        active_ = std::move(candidate);
      }
    }

    if (!first)
      return Outcome::rejected(failure, c);
    return std::move(*first);
  }
};

inline MachinePtr make_value_machine(size_t depth,
                                     const ParseOptions &options) {
  return std::make_unique<ValueMachine>(depth, options);
}

// ============================================================================
// Decoder: the driver, push style
// ============================================================================

/**
 * @brief Feeds code points to one ValueMachine and tracks positions.
 *
 * Leading and trailing whitespace is skipped. A top-level number ends at
 * whitespace or at finish(). The first rejection throws ParseError and
 * the decoder then refuses input until reset().
 */
class Decoder {
  enum class State : uint8_t { Leading, InValue, Trailing, Failed, Finished };

  ParseOptions options_;
  std::unique_ptr<ValueMachine> root_;
  State state_ = State::Leading;
  std::optional<Value> result_;
  bool partial_ = false;

  size_t offset_ = 0;
  size_t line_ = 1;
  size_t column_ = 1;

public:
  explicit Decoder(ParseOptions options = {})
      : options_(options),
        root_(std::make_unique<ValueMachine>(0, options_)) {}

  void feed(CodePoint c) {
    switch (state_) {
    case State::Failed:
      throw std::logic_error("Decoder used after a parse error");
    case State::Finished:
      throw std::logic_error("Decoder used after finish()");

    case State::Leading:
      if (detail::is_ws(c))
        break;
      state_ = State::InValue;
      [[fallthrough]];

    case State::InValue:
      if (partial_ && detail::is_ws(c)) {
        partial_ = false;
        state_ = State::Trailing;
        break;
      }
      feed_root(c);
      break;

    case State::Trailing:
      if (!detail::is_ws(c))
        fail(Error::TrailingCharacters, c);
      break;
    }
    advance(c);
  }

  void feed(StringView text) {
    for (CodePoint c : text)
      feed(c);
  }

  // True once a complete value has been seen (numbers: once ended by
  // whitespace; otherwise only finish() can end them).
  bool done() const { return state_ == State::Trailing; }

  Value finish() {
    if (state_ == State::Failed)
      throw std::logic_error("Decoder used after a parse error");
    if (state_ == State::Finished)
      throw std::logic_error("finish() called twice");

    if (state_ == State::Trailing || (state_ == State::InValue && partial_)) {
      state_ = State::Finished;
      return std::move(*result_);
    }

    const Error e = state_ == State::InValue ? root_->truncation_error()
                                             : Error::IncompleteInput;
    fail(e, 0);
  }

  void reset() {
    root_ = std::make_unique<ValueMachine>(0, options_);
    state_ = State::Leading;
    result_.reset();
    partial_ = false;
    offset_ = 0;
    line_ = 1;
    column_ = 1;
  }

  size_t offset() const { return offset_; }
  size_t line() const { return line_; }
  size_t column() const { return column_; }

private:
  void feed_root(CodePoint c) {
    Outcome out = root_->feed(c);
    if (out.is_rejected())
      fail(out.error(), out.character());
    if (out.is_done()) {
      result_ = out.take_value();
      partial_ = false;
      state_ = State::Trailing;
    } else if (out.is_partial()) {
      result_ = out.take_value();
      partial_ = true;
    } else {
      result_.reset();
      partial_ = false;
    }
  }

  [[noreturn]] void fail(Error e, CodePoint c) {
    state_ = State::Failed;
    throw ParseError(e, c, line_, column_, offset_);
  }

  void advance(CodePoint c) {
    ++offset_;
    if (c == '\n') {
      ++line_;
      column_ = 1;
    } else {
      ++column_;
    }
  }
};

// ============================================================================
// Global API
// ============================================================================

inline Value decode(StringView text, ParseOptions options = {}) {
  Decoder decoder(options);
  decoder.feed(text);
  return decoder.finish();
}

inline Value decode(const char32_t *text, ParseOptions options = {}) {
  return decode(StringView(text), options);
}

// UTF-8 input. InvalidUtf8 errors carry a byte offset; every other
// ParseError offset counts code points.
inline Value decode(std::string_view utf8, ParseOptions options = {}) {
  return decode(StringView(utf8_to_code_points(utf8)), options);
}

inline Value decode(const char *utf8, ParseOptions options = {}) {
  return decode(std::string_view(utf8), options);
}

inline std::optional<Value> try_decode(StringView text,
                                       ParseOptions options = {}) noexcept {
  try {
    return decode(text, options);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

inline std::optional<Value> try_decode(std::string_view utf8,
                                       ParseOptions options = {}) noexcept {
  try {
    return decode(utf8, options);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

} // namespace json
} // namespace drip

#endif // DRIP_JSON_HPP
