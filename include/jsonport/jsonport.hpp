/**
 * @file jsonport.hpp
 * @brief jsonport - schemaless JSON access with path-guided decoding
 * @version 1.0.0
 *
 * Parses JSON text into a dynamically typed Value and reads it back through
 * typed, path-based accessors with explicit coercion rules.
 *
 * - Recursive-descent parser: strict grammar, permissive number scanning
 * - Skip engine: validates and steps over a value without building it
 * - Path-guided decode: materializes only the subtree on a key path
 * - Lazy numbers: kept as source text, converted on access
 *
 * License: MIT
 */

#ifndef JSONPORT_HPP
#define JSONPORT_HPP

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <initializer_list>
#include <istream>
#include <iterator>
#include <optional>
#include <ostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#if __cplusplus < 202002L
#error "jsonport requires a C++20 compatible compiler."
#endif

namespace jsonport {

// ============================================================================
// Value Types
// ============================================================================

enum class Type : uint8_t {
  Invalid = 0,
  Object,
  Array,
  String,
  Number,
  Bool,
  Null
};

inline const char *type_name(Type t) {
  switch (t) {
  case Type::Invalid:
    return "INVALID";
  case Type::Object:
    return "OBJECT";
  case Type::Array:
    return "ARRAY";
  case Type::String:
    return "STRING";
  case Type::Number:
    return "NUMBER";
  case Type::Bool:
    return "BOOL";
  case Type::Null:
    return "NULL";
  }
  return nullptr;
}

inline std::string to_string(Type t) {
  if (const char *name = type_name(t))
    return name;
  return "UNKNOWN(" + std::to_string(static_cast<int>(t)) + ")";
}

inline std::ostream &operator<<(std::ostream &os, Type t) {
  return os << to_string(t);
}

// ============================================================================
// Error Handling
// ============================================================================

enum class ErrorCode : uint8_t {
  Syntax,
  TrailingData,
  DepthExceeded,
  TypeMismatch,
  KeyType,
  ConversionOverflow,
  NumberFormat,
  UnsupportedOperation,
  Io
};

class Error : public std::runtime_error {
public:
  Error(ErrorCode code, const std::string &msg)
      : std::runtime_error(msg), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

// Raised while reading JSON text. `offset` is the number of bytes consumed
// before the failure.
class ParseError : public Error {
public:
  size_t line, column, offset;

  ParseError(ErrorCode code, const std::string &msg, size_t l, size_t c,
             size_t off)
      : Error(code, msg), line(l), column(c), offset(off) {}

  std::string format() const {
    std::ostringstream oss;
    oss << "Parse error at line " << line << ", column " << column << ": "
        << what();
    return oss.str();
  }
};

class SyntaxError : public ParseError {
public:
  SyntaxError(const std::string &msg, size_t l, size_t c, size_t off)
      : ParseError(ErrorCode::Syntax, msg, l, c, off) {}
};

class TrailingDataError : public ParseError {
public:
  TrailingDataError(const std::string &msg, size_t l, size_t c, size_t off)
      : ParseError(ErrorCode::TrailingData, msg, l, c, off) {}
};

class DepthExceededError : public ParseError {
public:
  DepthExceededError(const std::string &msg, size_t l, size_t c, size_t off)
      : ParseError(ErrorCode::DepthExceeded, msg, l, c, off) {}
};

class TypeMismatchError : public Error {
public:
  TypeMismatchError(Type expected, Type found, const std::string &detail)
      : Error(ErrorCode::TypeMismatch,
              "type mismatch: expected " + to_string(expected) + ", found " +
                  to_string(found) + (detail.empty() ? "" : " " + detail)),
        expected_(expected), found_(found) {}

  Type expected() const { return expected_; }
  Type found() const { return found_; }

private:
  Type expected_;
  Type found_;
};

class KeyTypeError : public Error {
public:
  explicit KeyTypeError(const std::string &key_type)
      : Error(ErrorCode::KeyType, "key type " + key_type + " not supported") {}
};

class ConversionOverflowError : public Error {
public:
  explicit ConversionOverflowError(const std::string &msg)
      : Error(ErrorCode::ConversionOverflow, msg) {}
};

class NumberFormatError : public Error {
public:
  explicit NumberFormatError(const std::string &msg)
      : Error(ErrorCode::NumberFormat, msg) {}
};

class UnsupportedOperationError : public Error {
public:
  UnsupportedOperationError(Type t, const std::string &operation)
      : Error(ErrorCode::UnsupportedOperation,
              "type " + to_string(t) + " does not support " + operation) {}
  explicit UnsupportedOperationError(const std::string &msg)
      : Error(ErrorCode::UnsupportedOperation, msg) {}
};

class IoError : public Error {
public:
  explicit IoError(const std::string &msg) : Error(ErrorCode::Io, msg) {}
};

// ============================================================================
// Number Conversion
// ============================================================================

namespace detail {

inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

inline bool is_number_char(char c) {
  return is_digit(c) || c == '.' || c == 'e' || c == 'E' || c == '+' ||
         c == '-';
}

inline bool is_decimal_text(std::string_view s) {
  bool has_digit = false;
  for (char c : s) {
    if (!is_number_char(c))
      return false;
    has_digit = has_digit || is_digit(c);
  }
  return has_digit;
}

// from_chars does not take a leading '+'; text reached through
// string-as-number may carry one.
inline std::string_view strip_plus(std::string_view s) {
  if (s.size() > 1 && s[0] == '+' && (is_digit(s[1]) || s[1] == '.'))
    s.remove_prefix(1);
  return s;
}

inline double to_double(std::string_view text) {
  const std::string_view body = strip_plus(text);
  if (!is_decimal_text(body))
    throw NumberFormatError("invalid number literal \"" + std::string(text) +
                            "\"");

  double out = 0;
  const char *first = body.data();
  const char *last = first + body.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (ptr != last || ec == std::errc::invalid_argument)
    throw NumberFormatError("invalid number literal \"" + std::string(text) +
                            "\"");

  if (ec == std::errc::result_out_of_range) {
    // from_chars reports underflow the same way; only overflow is an error.
    const std::string terminated(body);
    const double d = std::strtod(terminated.c_str(), nullptr);
    if (std::isinf(d))
      throw ConversionOverflowError("number " + std::string(text) +
                                    " overflows float64");
    return d;
  }
  return out;
}

inline int64_t to_int64(std::string_view text) {
  const std::string_view body = strip_plus(text);
  int64_t out = 0;
  const char *first = body.data();
  const char *last = first + body.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec == std::errc() && ptr == last)
    return out;

  // Not an exact integer: truncate the double toward zero when it fits.
  const double d = to_double(text);
  if (d >= -9223372036854775808.0 && d < 9223372036854775808.0)
    return static_cast<int64_t>(d);
  throw ConversionOverflowError("number " + std::string(text) +
                                " overflows int64");
}

} // namespace detail

// ============================================================================
// Keys & Paths
// ============================================================================

class Value;

// One path segment: a member name or an array index. Any other key type is
// carried as Unsupported and reported as KeyTypeError when used.
class Key {
public:
  enum class Kind : uint8_t { Name, Index, Unsupported };

  Key(const char *name) : kind_(Kind::Name), name_(name) {}
  Key(std::string name) : kind_(Kind::Name), name_(std::move(name)) {}
  Key(std::string_view name) : kind_(Kind::Name), name_(name) {}

  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>,
                             int> = 0>
  Key(T index) : kind_(Kind::Index), index_(normalize(index)) {}

  Key(bool) : kind_(Kind::Unsupported), name_("bool") {}
  Key(double) : kind_(Kind::Unsupported), name_("double") {}
  Key(std::nullptr_t) : kind_(Kind::Unsupported), name_("nullptr_t") {}

  // String -> name, integral Number -> index, anything else unsupported.
  explicit Key(const Value &v);

  Kind kind() const { return kind_; }
  bool is_name() const { return kind_ == Kind::Name; }
  bool is_index() const { return kind_ == Kind::Index; }

  // Member name, or the offending type for an Unsupported key.
  const std::string &name() const { return name_; }
  int64_t index() const { return index_; }

private:
  template <typename T> static int64_t normalize(T v) {
    if constexpr (std::is_signed_v<T>) {
      return static_cast<int64_t>(v);
    } else {
      constexpr uint64_t max = static_cast<uint64_t>(INT64_MAX);
      return static_cast<uint64_t>(v) > max ? INT64_MAX
                                            : static_cast<int64_t>(v);
    }
  }

  Kind kind_;
  std::string name_;
  int64_t index_ = 0;
};

class Path {
  std::vector<Key> keys_;

public:
  using const_iterator = std::vector<Key>::const_iterator;

  Path() = default;
  Path(std::initializer_list<Key> keys) : keys_(keys) {}
  explicit Path(std::vector<Key> keys) : keys_(std::move(keys)) {}

  void push_back(Key key) { keys_.push_back(std::move(key)); }
  size_t size() const { return keys_.size(); }
  bool empty() const { return keys_.empty(); }
  const Key &operator[](size_t i) const { return keys_[i]; }

  const_iterator begin() const { return keys_.begin(); }
  const_iterator end() const { return keys_.end(); }
};

// ============================================================================
// Value Model
// ============================================================================

class Array {
  std::vector<Value> items_;

public:
  using value_type = Value;
  using const_iterator = std::vector<Value>::const_iterator;

  Array();
  Array(std::initializer_list<Value> init);
  Array(const Array &other);
  Array(Array &&other) noexcept;
  Array &operator=(const Array &other);
  Array &operator=(Array &&other) noexcept;
  ~Array();

  void push_back(const Value &v);
  void push_back(Value &&v);
  void reserve(size_t n);
  size_t size() const;
  bool empty() const;

  const Value &operator[](size_t index) const;

  const_iterator begin() const;
  const_iterator end() const;
};

struct Member;

class Object {
  // Sorted by key. insert() on an existing key replaces its value.
  std::vector<Member> fields_;

public:
  using value_type = Member;
  using const_iterator = std::vector<Member>::const_iterator;

  Object();
  // Sorts once; of members sharing a key the last one is kept.
  explicit Object(std::vector<Member> members);
  Object(const Object &other);
  Object(Object &&other) noexcept;
  Object &operator=(const Object &other);
  Object &operator=(Object &&other) noexcept;
  ~Object();

  void insert(std::string key, Value value);
  bool contains(std::string_view key) const;
  const Value *find(std::string_view key) const;

  size_t size() const;
  bool empty() const;

  const_iterator begin() const;
  const_iterator end() const;
};

class Value {
  Type type_;
  bool string_as_number_ = false;
  bool all_as_bool_ = false;

  union {
    bool bool_val;
    std::string string_val; // String content, or the raw Number literal
    Array array_val;
    Object object_val;
  };

  std::exception_ptr error_;

public:
  Value() : type_(Type::Null) {}
  Value(std::nullptr_t) : type_(Type::Null) {}
  Value(bool b) : type_(Type::Bool), bool_val(b) {}
  Value(const char *s) : type_(Type::String) {
    new (&string_val) std::string(s);
  }
  Value(std::string s) : type_(Type::String) {
    new (&string_val) std::string(std::move(s));
  }
  Value(std::string_view s) : type_(Type::String) {
    new (&string_val) std::string(s);
  }
  Value(Array a) : type_(Type::Array) { new (&array_val) Array(std::move(a)); }
  Value(Object o) : type_(Type::Object) {
    new (&object_val) Object(std::move(o));
  }

  // Numbers are built from their literal text only; see Value::number().
  template <typename T,
            std::enable_if_t<
                std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
  Value(T) = delete;

  static Value number(std::string_view literal) {
    Value v;
    v.type_ = Type::Number;
    new (&v.string_val) std::string(literal);
    return v;
  }

  static Value invalid(std::exception_ptr error) {
    Value v;
    v.type_ = Type::Invalid;
    v.error_ = std::move(error);
    return v;
  }

  template <typename E> static Value invalid(E error) {
    return invalid(std::make_exception_ptr(std::move(error)));
  }

  Value(const Value &other)
      : type_(other.type_), string_as_number_(other.string_as_number_),
        all_as_bool_(other.all_as_bool_), error_(other.error_) {
    copy_from(other);
  }

  Value(Value &&other) noexcept
      : type_(other.type_), string_as_number_(other.string_as_number_),
        all_as_bool_(other.all_as_bool_), error_(std::move(other.error_)) {
    move_from(std::move(other));
  }

  Value &operator=(const Value &other) {
    if (this != &other) {
      Value tmp(other);
      *this = std::move(tmp);
    }
    return *this;
  }

  // `other` may live inside this value's own payload, so it is moved out
  // before the payload is destroyed.
  Value &operator=(Value &&other) noexcept {
    if (this != &other) {
      Value tmp(static_cast<Value &&>(other));
      destroy();
      type_ = tmp.type_;
      string_as_number_ = tmp.string_as_number_;
      all_as_bool_ = tmp.all_as_bool_;
      error_ = std::move(tmp.error_);
      move_from(std::move(tmp));
    }
    return *this;
  }

  ~Value() { destroy(); }

  Type type() const { return type_; }
  bool is_valid() const { return type_ != Type::Invalid; }
  bool is_null() const { return type_ == Type::Null; }
  bool is_bool() const { return type_ == Type::Bool; }
  bool is_number() const { return type_ == Type::Number; }
  bool is_string() const { return type_ == Type::String; }
  bool is_array() const { return type_ == Type::Array; }
  bool is_object() const { return type_ == Type::Object; }

  // Stored error of an Invalid value; null otherwise.
  std::exception_ptr error() const { return error_; }
  std::string error_message() const;

  // ---- Mode flags --------------------------------------------------------
  // Copied onto every value produced by navigation from this one.

  // Lets as_int()/as_double() read String content as a number literal.
  void set_string_as_number(bool enable = true) { string_as_number_ = enable; }

  // Lets as_bool() accept every type:
  //   STRING, ARRAY, OBJECT: size() != 0
  //   NUMBER: as_double() != 0
  //   NULL: false
  void set_all_as_bool(bool enable = true) { all_as_bool_ = enable; }

  bool string_as_number() const { return string_as_number_; }
  bool all_as_bool() const { return all_as_bool_; }

  // ---- Scalar access -----------------------------------------------------

  const std::string &as_string() const {
    if (type_ != Type::String)
      fail(Type::String);
    return string_val;
  }

  const std::string &as_number_literal() const {
    if (type_ != Type::Number)
      fail(Type::Number);
    return string_val;
  }

  // Throws ConversionOverflowError beyond the double range, never +-inf.
  double as_double() const { return detail::to_double(number_text()); }

  // Exact when the literal is an int64; otherwise the double value truncated
  // toward zero, which loses precision for very large magnitudes.
  int64_t as_int() const { return detail::to_int64(number_text()); }

  bool as_bool() const;

  // Bytes of a STRING, elements of an ARRAY, members of an OBJECT.
  size_t size() const;

  std::optional<int64_t> get_int() const {
    try {
      return as_int();
    } catch (const Error &) {
      return std::nullopt;
    }
  }

  std::optional<double> get_double() const {
    try {
      return as_double();
    } catch (const Error &) {
      return std::nullopt;
    }
  }

  std::optional<bool> get_bool() const {
    try {
      return as_bool();
    } catch (const Error &) {
      return std::nullopt;
    }
  }

  std::optional<std::string> get_string() const {
    if (type_ != Type::String)
      return std::nullopt;
    return string_val;
  }

  // ---- Containers --------------------------------------------------------

  const Array &as_array() const {
    if (type_ != Type::Array)
      fail(Type::Array);
    return array_val;
  }

  const Object &as_object() const {
    if (type_ != Type::Object)
      fail(Type::Object);
    return object_val;
  }

  std::vector<std::string> keys() const;
  std::vector<Value> values() const;
  std::vector<Value> elements() const;

  std::vector<int64_t> int_array() const;
  std::vector<double> double_array() const;
  std::vector<bool> bool_array() const;
  std::vector<std::string> string_array() const;

  // ---- Navigation --------------------------------------------------------
  // Never throws: failures come back as an Invalid value.

  // NULL when the member is absent.
  Value member(std::string_view name) const;

  // NULL when the index is out of range.
  Value element(int64_t index) const;

  // member() for name keys, element() for index keys; the first error stops
  // the walk. get_from() starts at path[first].
  Value get(const Path &path) const { return get_from(path, 0); }
  Value get_from(const Path &path, size_t first) const;

  template <typename... Keys,
            std::enable_if_t<(std::is_constructible_v<Key, const Keys &> &&
                              ...),
                             int> = 0>
  Value get(const Keys &...keys) const {
    return get(Path{Key(keys)...});
  }

  // ARRAY of get(path) over the elements of an ARRAY or the values of an
  // OBJECT.
  Value each_of(const Path &path) const;

  template <typename... Keys,
            std::enable_if_t<(std::is_constructible_v<Key, const Keys &> &&
                              ...),
                             int> = 0>
  Value each_of(const Keys &...keys) const {
    return each_of(Path{Key(keys)...});
  }

  // Short rendering used in diagnostics.
  std::string describe() const;

private:
  std::string_view number_text() const {
    if (type_ == Type::Number || (type_ == Type::String && string_as_number_))
      return string_val;
    fail(Type::Number);
  }

  TypeMismatchError mismatch_error(Type expected) const {
    return TypeMismatchError(expected, type_, describe());
  }

  [[noreturn]] void fail(Type expected) const {
    if (type_ == Type::Invalid)
      std::rethrow_exception(error_);
    throw mismatch_error(expected);
  }

  Value mismatch(Type expected) const {
    if (type_ == Type::Invalid)
      return *this;
    return Value::invalid(mismatch_error(expected));
  }

  Value inherit(Value v) const {
    v.string_as_number_ = string_as_number_;
    v.all_as_bool_ = all_as_bool_;
    return v;
  }

  void destroy();
  void copy_from(const Value &other);
  void move_from(Value &&other);
};

struct Member {
  std::string key;
  Value value;
};

// ============================================================================
// Array & Object Implementation
// ============================================================================

inline Array::Array() = default;
inline Array::Array(std::initializer_list<Value> init) : items_(init) {}
inline Array::Array(const Array &other) = default;
inline Array::Array(Array &&other) noexcept = default;
inline Array &Array::operator=(const Array &other) = default;
inline Array &Array::operator=(Array &&other) noexcept = default;
inline Array::~Array() = default;

inline void Array::push_back(const Value &v) { items_.push_back(v); }
inline void Array::push_back(Value &&v) { items_.push_back(std::move(v)); }
inline void Array::reserve(size_t n) { items_.reserve(n); }
inline size_t Array::size() const { return items_.size(); }
inline bool Array::empty() const { return items_.empty(); }

inline const Value &Array::operator[](size_t index) const {
  return items_[index];
}

inline Array::const_iterator Array::begin() const { return items_.begin(); }
inline Array::const_iterator Array::end() const { return items_.end(); }

inline Object::Object() = default;
inline Object::Object(const Object &other) = default;
inline Object::Object(Object &&other) noexcept = default;
inline Object &Object::operator=(const Object &other) = default;
inline Object &Object::operator=(Object &&other) noexcept = default;
inline Object::~Object() = default;

namespace detail {
inline bool member_less(const Member &m, std::string_view key) {
  return m.key < key;
}
} // namespace detail

inline Object::Object(std::vector<Member> members)
    : fields_(std::move(members)) {
  std::stable_sort(
      fields_.begin(), fields_.end(),
      [](const Member &a, const Member &b) { return a.key < b.key; });
  auto out = fields_.begin();
  for (auto it = fields_.begin(); it != fields_.end();) {
    auto last = it;
    while (std::next(last) != fields_.end() && std::next(last)->key == it->key)
      ++last;
    if (out != last)
      *out = std::move(*last);
    ++out;
    it = std::next(last);
  }
  fields_.erase(out, fields_.end());
}

inline void Object::insert(std::string key, Value value) {
  auto it = std::lower_bound(fields_.begin(), fields_.end(),
                             std::string_view(key), detail::member_less);
  if (it != fields_.end() && it->key == key) {
    it->value = std::move(value);
    return;
  }
  fields_.insert(it, Member{std::move(key), std::move(value)});
}

inline const Value *Object::find(std::string_view key) const {
  auto it = std::lower_bound(fields_.begin(), fields_.end(), key,
                             detail::member_less);
  if (it != fields_.end() && it->key == key)
    return &it->value;
  return nullptr;
}

inline bool Object::contains(std::string_view key) const {
  return find(key) != nullptr;
}

inline size_t Object::size() const { return fields_.size(); }
inline bool Object::empty() const { return fields_.empty(); }
inline Object::const_iterator Object::begin() const { return fields_.begin(); }
inline Object::const_iterator Object::end() const { return fields_.end(); }

// ============================================================================
// Value Implementation
// ============================================================================

inline void Value::destroy() {
  switch (type_) {
  case Type::String:
  case Type::Number:
    string_val.~basic_string();
    break;
  case Type::Array:
    array_val.~Array();
    break;
  case Type::Object:
    object_val.~Object();
    break;
  default:
    break;
  }
}

inline void Value::copy_from(const Value &other) {
  switch (other.type_) {
  case Type::Bool:
    bool_val = other.bool_val;
    break;
  case Type::String:
  case Type::Number:
    new (&string_val) std::string(other.string_val);
    break;
  case Type::Array:
    new (&array_val) Array(other.array_val);
    break;
  case Type::Object:
    new (&object_val) Object(other.object_val);
    break;
  default:
    break;
  }
}

inline void Value::move_from(Value &&other) {
  switch (other.type_) {
  case Type::Bool:
    bool_val = other.bool_val;
    break;
  case Type::String:
  case Type::Number:
    new (&string_val) std::string(std::move(other.string_val));
    break;
  case Type::Array:
    new (&array_val) Array(std::move(other.array_val));
    break;
  case Type::Object:
    new (&object_val) Object(std::move(other.object_val));
    break;
  default:
    break;
  }
}

inline std::string Value::error_message() const {
  if (!error_)
    return {};
  try {
    std::rethrow_exception(error_);
  } catch (const std::exception &e) {
    return e.what();
  }
}

inline std::string Value::describe() const {
  constexpr size_t kMaxShown = 32;
  switch (type_) {
  case Type::String:
    if (string_val.size() > kMaxShown)
      return "\"" + string_val.substr(0, kMaxShown) + "...\"";
    return "\"" + string_val + "\"";
  case Type::Number:
    return string_val;
  case Type::Bool:
    return bool_val ? "true" : "false";
  case Type::Null:
    return "null";
  case Type::Array:
    return "[...]";
  case Type::Object:
    return "{...}";
  case Type::Invalid:
    return error_message();
  }
  return {};
}

inline bool Value::as_bool() const {
  if (type_ == Type::Bool)
    return bool_val;
  if (!all_as_bool_)
    fail(Type::Bool);
  switch (type_) {
  case Type::String:
  case Type::Array:
  case Type::Object:
    return size() != 0;
  case Type::Number:
    return as_double() != 0;
  case Type::Null:
    return false;
  default:
    fail(Type::Bool);
  }
}

inline size_t Value::size() const {
  switch (type_) {
  case Type::String:
    return string_val.size();
  case Type::Array:
    return array_val.size();
  case Type::Object:
    return object_val.size();
  case Type::Invalid:
    std::rethrow_exception(error_);
  default:
    throw UnsupportedOperationError(type_, "size()");
  }
}

inline std::vector<std::string> Value::keys() const {
  const Object &obj = as_object();
  std::vector<std::string> out;
  out.reserve(obj.size());
  for (const Member &m : obj)
    out.push_back(m.key);
  return out;
}

inline std::vector<Value> Value::values() const {
  const Object &obj = as_object();
  std::vector<Value> out;
  out.reserve(obj.size());
  for (const Member &m : obj)
    out.push_back(inherit(m.value));
  return out;
}

inline std::vector<Value> Value::elements() const {
  const Array &arr = as_array();
  std::vector<Value> out;
  out.reserve(arr.size());
  for (const Value &e : arr)
    out.push_back(inherit(e));
  return out;
}

// The typed array conversions fail on the first bad element and return
// nothing in that case.

inline std::vector<int64_t> Value::int_array() const {
  const Array &arr = as_array();
  std::vector<int64_t> out;
  out.reserve(arr.size());
  for (const Value &e : arr)
    out.push_back(inherit(e).as_int());
  return out;
}

inline std::vector<double> Value::double_array() const {
  const Array &arr = as_array();
  std::vector<double> out;
  out.reserve(arr.size());
  for (const Value &e : arr)
    out.push_back(inherit(e).as_double());
  return out;
}

inline std::vector<bool> Value::bool_array() const {
  const Array &arr = as_array();
  std::vector<bool> out;
  out.reserve(arr.size());
  for (const Value &e : arr)
    out.push_back(inherit(e).as_bool());
  return out;
}

inline std::vector<std::string> Value::string_array() const {
  const Array &arr = as_array();
  std::vector<std::string> out;
  out.reserve(arr.size());
  for (const Value &e : arr)
    out.push_back(e.as_string());
  return out;
}

inline Value Value::member(std::string_view name) const {
  if (type_ != Type::Object)
    return mismatch(Type::Object);
  const Value *found = object_val.find(name);
  return inherit(found ? *found : Value());
}

inline Value Value::element(int64_t index) const {
  if (type_ != Type::Array)
    return mismatch(Type::Array);
  if (index < 0 || static_cast<uint64_t>(index) >= array_val.size())
    return inherit(Value());
  return inherit(array_val[static_cast<size_t>(index)]);
}

inline Value Value::get_from(const Path &path, size_t first) const {
  // Walk by pointer; only a produced NULL or error needs storage.
  const Value *cur = this;
  Value produced;
  for (size_t i = first; i < path.size(); ++i) {
    if (cur->type_ == Type::Invalid)
      break;
    const Key &key = path[i];
    const Value *next = nullptr;
    switch (key.kind()) {
    case Key::Kind::Name:
      if (cur->type_ != Type::Object) {
        produced = cur->mismatch(Type::Object);
        cur = &produced;
        continue;
      }
      next = cur->object_val.find(key.name());
      break;
    case Key::Kind::Index:
      if (cur->type_ != Type::Array) {
        produced = cur->mismatch(Type::Array);
        cur = &produced;
        continue;
      }
      if (key.index() >= 0 &&
          static_cast<uint64_t>(key.index()) < cur->array_val.size())
        next = &cur->array_val[static_cast<size_t>(key.index())];
      break;
    case Key::Kind::Unsupported:
      return Value::invalid(KeyTypeError(key.name()));
    }
    if (next) {
      cur = next;
    } else {
      produced = Value();
      cur = &produced;
    }
  }
  return inherit(*cur);
}

inline Value Value::each_of(const Path &path) const {
  if (type_ == Type::Invalid)
    return *this;
  if (type_ != Type::Array && type_ != Type::Object)
    return Value::invalid(UnsupportedOperationError(type_, "each_of()"));

  Array out;
  out.reserve(size());
  if (type_ == Type::Array) {
    for (const Value &e : array_val) {
      Value picked = e.get(path);
      if (!picked.is_valid())
        return picked;
      out.push_back(inherit(std::move(picked)));
    }
  } else {
    for (const Member &m : object_val) {
      Value picked = m.value.get(path);
      if (!picked.is_valid())
        return picked;
      out.push_back(inherit(std::move(picked)));
    }
  }
  return inherit(Value(std::move(out)));
}

inline Key::Key(const Value &v)
    : kind_(Kind::Unsupported), name_(to_string(v.type())) {
  if (v.is_string()) {
    kind_ = Kind::Name;
    name_ = v.as_string();
  } else if (v.is_number()) {
    const std::string &text = v.as_number_literal();
    int64_t index = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), index);
    if (ec == std::errc() && ptr == text.data() + text.size()) {
      kind_ = Kind::Index;
      index_ = index;
      name_.clear();
    }
  }
}

// Structural equality; mode flags are not compared and Invalid values are
// equal when their error messages are.
inline bool operator==(const Value &a, const Value &b) {
  if (a.type() != b.type())
    return false;
  switch (a.type()) {
  case Type::Invalid:
    return a.error_message() == b.error_message();
  case Type::Null:
    return true;
  case Type::Bool:
    return a.as_bool() == b.as_bool();
  case Type::String:
    return a.as_string() == b.as_string();
  case Type::Number:
    return a.as_number_literal() == b.as_number_literal();
  case Type::Array: {
    const Array &aa = a.as_array();
    const Array &ab = b.as_array();
    if (aa.size() != ab.size())
      return false;
    for (size_t i = 0; i < aa.size(); i++) {
      if (!(aa[i] == ab[i]))
        return false;
    }
    return true;
  }
  case Type::Object: {
    const Object &oa = a.as_object();
    const Object &ob = b.as_object();
    if (oa.size() != ob.size())
      return false;
    for (const Member &m : oa) {
      const Value *other = ob.find(m.key);
      if (!other || !(m.value == *other))
        return false;
    }
    return true;
  }
  }
  return false;
}

inline std::ostream &operator<<(std::ostream &os, const Value &v) {
  return os << to_string(v.type()) << ' ' << v.describe();
}

// ============================================================================
// Scanners
// ============================================================================

struct ParseOptions {
  size_t max_depth = 1024;
  bool allow_duplicate_keys = true;
};

namespace detail {

inline bool is_space(char c) {
  switch (c) {
  case ' ':
  case '\t':
  case '\n':
  case '\r':
  case '\v':
  case '\f':
    return true;
  default:
    return false;
  }
}

inline int hex_val(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F')
    return 10 + (c - 'A');
  return -1;
}

// \uXXXX at p, or -1.
inline int32_t read_u4(const char *p, const char *end) {
  if (end - p < 6 || p[0] != '\\' || p[1] != 'u')
    return -1;
  int32_t cp = 0;
  for (int i = 2; i < 6; ++i) {
    const int h = hex_val(p[i]);
    if (h < 0)
      return -1;
    cp = (cp << 4) | h;
  }
  return cp;
}

inline void append_utf8(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Length of the well-formed UTF-8 sequence at p, or 0. Overlong forms,
// surrogates and code points past U+10FFFF are rejected.
inline size_t utf8_sequence(const char *p, const char *end) {
  const auto at = [&](ptrdiff_t i) {
    return static_cast<unsigned char>(p[i]);
  };
  const ptrdiff_t avail = end - p;
  const unsigned char c = at(0);
  if (c < 0x80)
    return 1;
  const auto cont = [&](ptrdiff_t i, unsigned char lo, unsigned char hi) {
    return i < avail && at(i) >= lo && at(i) <= hi;
  };
  if (c >= 0xC2 && c <= 0xDF)
    return cont(1, 0x80, 0xBF) ? 2 : 0;
  if (c >= 0xE0 && c <= 0xEF) {
    const unsigned char lo = c == 0xE0 ? 0xA0 : 0x80;
    const unsigned char hi = c == 0xED ? 0x9F : 0xBF;
    return cont(1, lo, hi) && cont(2, 0x80, 0xBF) ? 3 : 0;
  }
  if (c >= 0xF0 && c <= 0xF4) {
    const unsigned char lo = c == 0xF0 ? 0x90 : 0x80;
    const unsigned char hi = c == 0xF4 ? 0x8F : 0xBF;
    return cont(1, lo, hi) && cont(2, 0x80, 0xBF) && cont(3, 0x80, 0xBF) ? 4
                                                                         : 0;
  }
  return 0;
}

inline bool valid_utf8(const char *p, const char *end) {
  while (p < end) {
    const size_t n = utf8_sequence(p, end);
    if (n == 0)
      return false;
    p += n;
  }
  return true;
}

inline std::string describe_char(char c) {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= 0x20 && uc < 0x7F)
    return std::string("'") + c + "'";
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%02X", uc);
  return buf;
}

} // namespace detail

// Cursor over the input shared by Parser, Skipper and PathDecoder. Holds the
// byte-level scanners and the nesting depth, and raises every ParseError so
// that all three report identical failures.
class Scanner {
  const char *p_;
  const char *start_;
  const char *end_;
  size_t depth_ = 0;
  ParseOptions options_;
  std::string scratch_;

public:
  explicit Scanner(std::string_view json, const ParseOptions &options = {})
      : p_(json.data()), start_(json.data()), end_(json.data() + json.size()),
        options_(options) {}

  size_t offset() const { return static_cast<size_t>(p_ - start_); }
  const ParseOptions &options() const { return options_; }

  void skip_ws() {
    while (p_ < end_ && detail::is_space(*p_))
      ++p_;
  }

  // Next non-space byte, not consumed.
  char peek() {
    skip_ws();
    if (p_ >= end_)
      throw_error<SyntaxError>("Unexpected end of input");
    return *p_;
  }

  void expect(char c, const char *msg) {
    if (peek() != c)
      throw_error<SyntaxError>(msg);
    ++p_;
  }

  void expect_end() {
    skip_ws();
    if (p_ < end_)
      throw_error<TrailingDataError>("Unexpected content after JSON");
  }

  // Consumes the '{' or '[' at the cursor. An empty aggregate is closed
  // right away and reported as false.
  bool open(char close) {
    if (++depth_ > options_.max_depth)
      throw_error<DepthExceededError>("Nesting depth exceeds " +
                                      std::to_string(options_.max_depth));
    ++p_;
    if (peek() == close) {
      ++p_;
      --depth_;
      return false;
    }
    return true;
  }

  // After an element: true on ',', false once `close` is consumed.
  bool next_separator(char close, const char *msg) {
    const char c = peek();
    if (c == ',') {
      ++p_;
      return true;
    }
    if (c != close)
      throw_error<SyntaxError>(msg);
    ++p_;
    --depth_;
    return false;
  }

  void expect_literal(std::string_view lit) {
    if (static_cast<size_t>(end_ - p_) < lit.size() ||
        std::memcmp(p_, lit.data(), lit.size()) != 0)
      throw_error<SyntaxError>("Expected '" + std::string(lit) + "'");
    p_ += lit.size();
  }

  // Permissive: '-' or a digit, then any run of [0-9.eE+-]. Numeric grammar
  // is checked when the literal is converted.
  std::string_view scan_number() {
    const char *begin = p_;
    if (*p_ != '-' && !detail::is_digit(*p_))
      throw_error<SyntaxError>("Unexpected character " +
                               detail::describe_char(*p_));
    ++p_;
    while (p_ < end_ && detail::is_number_char(*p_))
      ++p_;
    return std::string_view(begin, static_cast<size_t>(p_ - begin));
  }

  std::string_view read_string();

  std::string_view read_key(size_t &at) {
    if (peek() != '"')
      throw_error<SyntaxError>("Expected string key");
    at = offset();
    return read_string();
  }

  [[noreturn]] void throw_duplicate_key(std::string_view key, size_t at) const {
    throw_error_at<SyntaxError>("Duplicate key: " + std::string(key),
                                start_ + at);
  }

private:
  void decode_string(const char *r, const char *end, std::string &out) const;

  template <typename E>
  [[noreturn]] void throw_error(const std::string &msg) const {
    throw_error_at<E>(msg, p_);
  }

  template <typename E>
  [[noreturn]] void throw_error_at(const std::string &msg,
                                   const char *where) const {
    size_t line = 1;
    size_t column = 1;
    for (const char *cur = start_; cur < where; ++cur) {
      if (*cur == '\n') {
        line++;
        column = 1;
      } else {
        column++;
      }
    }
    throw E(msg, line, column, static_cast<size_t>(where - start_));
  }
};

// The string at the cursor, decoded. The view points into the input when
// the literal has no escapes, no control bytes and valid UTF-8; otherwise it
// points into scratch storage that the next call overwrites.
inline std::string_view Scanner::read_string() {
  const char *open = p_;
  const char *begin = ++p_;
  const char *q = begin;
  bool escaped = false;
  bool plain = true;
  bool ascii = true;
  for (; q < end_; ++q) {
    const unsigned char c = static_cast<unsigned char>(*q);
    if (escaped) {
      escaped = false;
      continue;
    }
    if (c == '\\') {
      escaped = true;
      plain = false;
    } else if (c == '"') {
      break;
    } else if (c < 0x20) {
      plain = false;
    } else if (c >= 0x80) {
      ascii = false;
    }
  }
  if (q >= end_)
    throw_error_at<SyntaxError>("Unterminated string", open);

  p_ = q + 1;
  if (plain && (ascii || detail::valid_utf8(begin, q)))
    return std::string_view(begin, static_cast<size_t>(q - begin));

  scratch_.clear();
  decode_string(begin, q, scratch_);
  return scratch_;
}

inline void Scanner::decode_string(const char *r, const char *end,
                                   std::string &out) const {
  while (r < end) {
    const unsigned char c = static_cast<unsigned char>(*r);
    if (c == '\\') {
      const char *esc = r++;
      switch (*r) {
      case '"':
      case '\\':
      case '/':
        out += *r++;
        break;
      case 'b':
        out += '\b';
        ++r;
        break;
      case 'f':
        out += '\f';
        ++r;
        break;
      case 'n':
        out += '\n';
        ++r;
        break;
      case 'r':
        out += '\r';
        ++r;
        break;
      case 't':
        out += '\t';
        ++r;
        break;
      case 'u': {
        int32_t cp = detail::read_u4(esc, end);
        if (cp < 0)
          throw_error_at<SyntaxError>("Invalid unicode escape", esc);
        r = esc + 6;
        if (cp >= 0xD800 && cp <= 0xDFFF) {
          // Only a high surrogate followed by a low one forms a pair; any
          // other surrogate becomes U+FFFD and the next escape is left alone.
          const int32_t lo = detail::read_u4(r, end);
          if (cp <= 0xDBFF && lo >= 0xDC00 && lo <= 0xDFFF) {
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
            r += 6;
          } else {
            cp = 0xFFFD;
          }
        }
        detail::append_utf8(out, static_cast<uint32_t>(cp));
        break;
      }
      default:
        throw_error_at<SyntaxError>(std::string("Invalid escape '\\") + *r +
                                        "'",
                                    esc);
      }
    } else if (c < 0x20) {
      throw_error_at<SyntaxError>("Invalid control character in string", r);
    } else if (c < 0x80) {
      out += static_cast<char>(c);
      ++r;
    } else {
      const size_t n = detail::utf8_sequence(r, end);
      if (n == 0) {
        detail::append_utf8(out, 0xFFFD);
        ++r;
      } else {
        out.append(r, n);
        r += n;
      }
    }
  }
}

// ============================================================================
// Parser
// ============================================================================

class Parser {
  Scanner &scanner_;

public:
  explicit Parser(Scanner &scanner) : scanner_(scanner) {}

  Value parse_value() {
    switch (scanner_.peek()) {
    case '{':
      return parse_object();
    case '[':
      return parse_array();
    case '"':
      return Value(scanner_.read_string());
    case 't':
      scanner_.expect_literal("true");
      return Value(true);
    case 'f':
      scanner_.expect_literal("false");
      return Value(false);
    case 'n':
      scanner_.expect_literal("null");
      return Value();
    default:
      return Value::number(scanner_.scan_number());
    }
  }

private:
  Value parse_object() {
    if (!scanner_.open('}'))
      return Value(Object());

    const bool track_keys = !scanner_.options().allow_duplicate_keys;
    std::set<std::string, std::less<>> seen;
    std::vector<Member> members;
    do {
      size_t key_at = 0;
      std::string key(scanner_.read_key(key_at));
      scanner_.expect(':', "Expected ':'");
      Value value = parse_value();
      if (track_keys && !seen.insert(key).second)
        scanner_.throw_duplicate_key(key, key_at);
      members.push_back(Member{std::move(key), std::move(value)});
    } while (scanner_.next_separator('}', "Expected ',' or '}'"));

    return Value(Object(std::move(members)));
  }

  Value parse_array() {
    Array arr;
    if (!scanner_.open(']'))
      return Value(std::move(arr));

    do {
      arr.push_back(parse_value());
    } while (scanner_.next_separator(']', "Expected ',' or ']'"));

    return Value(std::move(arr));
  }
};

// ============================================================================
// Skip Engine
// ============================================================================

// Same grammar, same failures and same consumption as Parser, but nothing is
// built.
class Skipper {
  Scanner &scanner_;

public:
  explicit Skipper(Scanner &scanner) : scanner_(scanner) {}

  void skip_value() {
    switch (scanner_.peek()) {
    case '{':
      skip_object();
      break;
    case '[':
      skip_array();
      break;
    case '"':
      scanner_.read_string();
      break;
    case 't':
      scanner_.expect_literal("true");
      break;
    case 'f':
      scanner_.expect_literal("false");
      break;
    case 'n':
      scanner_.expect_literal("null");
      break;
    default:
      scanner_.scan_number();
      break;
    }
  }

private:
  void skip_object() {
    if (!scanner_.open('}'))
      return;

    const bool track_keys = !scanner_.options().allow_duplicate_keys;
    std::set<std::string, std::less<>> seen;
    do {
      size_t key_at = 0;
      std::string_view key = scanner_.read_key(key_at);
      std::string name;
      if (track_keys)
        name = key;
      scanner_.expect(':', "Expected ':'");
      skip_value();
      if (track_keys && !seen.insert(name).second)
        scanner_.throw_duplicate_key(name, key_at);
    } while (scanner_.next_separator('}', "Expected ',' or '}'"));
  }

  void skip_array() {
    if (!scanner_.open(']'))
      return;

    do {
      skip_value();
    } while (scanner_.next_separator(']', "Expected ',' or ']'"));
  }
};

// ============================================================================
// Path-Guided Decode
// ============================================================================

// Parses only what `path` addresses and skips the rest, while still reading
// the whole value so that errors match a full parse followed by get(path).
class PathDecoder {
  Scanner &scanner_;
  Parser parser_;
  Skipper skipper_;
  const Path &path_;

public:
  PathDecoder(Scanner &scanner, const Path &path)
      : scanner_(scanner), parser_(scanner), skipper_(scanner), path_(path) {}

  Value decode() { return decode_value(0); }

private:
  Value decode_value(size_t i) {
    if (i == path_.size())
      return parser_.parse_value();

    const Key &key = path_[i];
    const char c = scanner_.peek();
    if (key.is_name() && c == '{')
      return decode_object(i);
    if (key.is_index() && c == '[')
      return decode_array(i);

    // Kind mismatch or unsupported key. The error depends only on the
    // container's kind, so an aggregate is skipped and stands in empty.
    if (c == '{') {
      skipper_.skip_value();
      return Value(Object()).get_from(path_, i);
    }
    if (c == '[') {
      skipper_.skip_value();
      return Value(Array()).get_from(path_, i);
    }
    return parser_.parse_value().get_from(path_, i);
  }

  Value decode_object(size_t i) {
    const std::string &name = path_[i].name();
    if (!scanner_.open('}'))
      return Value().get_from(path_, i + 1);

    const bool track_keys = !scanner_.options().allow_duplicate_keys;
    std::set<std::string, std::less<>> seen;
    Value result;
    bool found = false;
    do {
      size_t key_at = 0;
      std::string_view key = scanner_.read_key(key_at);
      const bool match = key == name;
      std::string seen_key;
      if (track_keys)
        seen_key = key;
      scanner_.expect(':', "Expected ':'");
      if (match) {
        // A repeated key overwrites, so a later match replaces this one.
        result = decode_value(i + 1);
        found = true;
      } else {
        skipper_.skip_value();
      }
      if (track_keys && !seen.insert(seen_key).second)
        scanner_.throw_duplicate_key(seen_key, key_at);
    } while (scanner_.next_separator('}', "Expected ',' or '}'"));

    return found ? result : Value().get_from(path_, i + 1);
  }

  Value decode_array(size_t i) {
    const int64_t target = path_[i].index();
    if (!scanner_.open(']'))
      return Value().get_from(path_, i + 1);

    Value result;
    bool found = false;
    int64_t n = 0;
    do {
      if (n == target) {
        result = decode_value(i + 1);
        found = true;
      } else {
        skipper_.skip_value();
      }
      ++n;
    } while (scanner_.next_separator(']', "Expected ',' or ']'"));

    return found ? result : Value().get_from(path_, i + 1);
  }
};

// ============================================================================
// Global API
// ============================================================================

inline Value parse(std::string_view json, const ParseOptions &options = {}) {
  Scanner scanner(json, options);
  Value result = Parser(scanner).parse_value();
  scanner.expect_end();
  return result;
}

// Same result as parse(json).get(path), building only the addressed subtree.
inline Value parse(std::string_view json, const Path &path,
                   const ParseOptions &options = {}) {
  Scanner scanner(json, options);
  Value result = PathDecoder(scanner, path).decode();
  scanner.expect_end();
  return result;
}

inline Value try_parse(std::string_view json,
                       const ParseOptions &options = {}) {
  try {
    return parse(json, options);
  } catch (const Error &) {
    return Value::invalid(std::current_exception());
  }
}

inline Value try_parse(std::string_view json, const Path &path,
                       const ParseOptions &options = {}) {
  try {
    return parse(json, path, options);
  } catch (const Error &) {
    return Value::invalid(std::current_exception());
  }
}

// Bytes taken by the first value in `json`, leading whitespace included.
// Trailing content is not inspected.
inline size_t skip(std::string_view json, const ParseOptions &options = {}) {
  Scanner scanner(json, options);
  Skipper(scanner).skip_value();
  return scanner.offset();
}

namespace detail {
inline std::string read_all(std::istream &in) {
  std::string data((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  if (in.bad())
    throw IoError("Failed to read input stream");
  return data;
}
} // namespace detail

inline Value decode_from(std::istream &in, const ParseOptions &options = {}) {
  return parse(detail::read_all(in), options);
}

inline Value decode_from(std::istream &in, const Path &path,
                         const ParseOptions &options = {}) {
  return parse(detail::read_all(in), path, options);
}

inline Value load_file(const std::string &filename,
                       const ParseOptions &options = {}) {
  std::ifstream file(filename, std::ios::binary);
  if (!file)
    throw IoError("Cannot open: " + filename);
  return decode_from(file, options);
}

} // namespace jsonport

#endif // JSONPORT_HPP
