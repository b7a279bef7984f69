#pragma once

// docbridge: the dynamic document value tree.
// A closed variant of the primitive document kinds plus the extended kinds, each of which has
// an equivalent "extended representation" as a plain document.

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace docbridge {

class value;

namespace detail {

inline int hex_val(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= static_cast<unsigned char>('0') && uc <= static_cast<unsigned char>('9')) {
    return static_cast<int>(uc - static_cast<unsigned char>('0'));
  }
  const unsigned char lc = static_cast<unsigned char>(uc | 0x20u); // ASCII to-lower
  if (lc >= static_cast<unsigned char>('a') && lc <= static_cast<unsigned char>('f')) {
    return 10 + static_cast<int>(lc - static_cast<unsigned char>('a'));
  }
  return -1;
}

inline std::string to_hex(const std::uint8_t* data, std::size_t n) {
  static constexpr char hex[] = "0123456789abcdef";
  std::string out;
  out.reserve(n * 2);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(hex[(data[i] >> 4) & 0xF]);
    out.push_back(hex[data[i] & 0xF]);
  }
  return out;
}

inline bool from_hex(std::string_view s, std::vector<std::uint8_t>& out) {
  if (s.size() % 2 != 0) return false;
  out.clear();
  out.reserve(s.size() / 2);
  for (std::size_t i = 0; i < s.size(); i += 2) {
    const int hi = hex_val(s[i]);
    const int lo = hex_val(s[i + 1]);
    if ((hi | lo) < 0) return false;
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return true;
}

} // namespace detail

class object_id {
public:
  static constexpr std::size_t size = 12;
  using bytes_type = std::array<std::uint8_t, size>;

  object_id() noexcept : bytes_{} {}
  explicit object_id(const bytes_type& bytes) noexcept : bytes_(bytes) {}

  // Accepts exactly 24 hex digits, either case.
  static bool from_hex(std::string_view hex, object_id& out) noexcept {
    if (hex.size() != size * 2) return false;
    bytes_type b{};
    for (std::size_t i = 0; i < size; ++i) {
      const int hi = detail::hex_val(hex[2 * i]);
      const int lo = detail::hex_val(hex[2 * i + 1]);
      if ((hi | lo) < 0) return false;
      b[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    out.bytes_ = b;
    return true;
  }

  std::string to_hex() const { return detail::to_hex(bytes_.data(), bytes_.size()); }

  const bytes_type& bytes() const noexcept { return bytes_; }

  friend bool operator==(const object_id& a, const object_id& b) noexcept { return a.bytes_ == b.bytes_; }
  friend bool operator!=(const object_id& a, const object_id& b) noexcept { return !(a == b); }

private:
  bytes_type bytes_;
};

// UTC milliseconds since the Unix epoch.
struct date_time {
  std::int64_t millis{0};

  friend bool operator==(const date_time& a, const date_time& b) noexcept { return a.millis == b.millis; }
  friend bool operator!=(const date_time& a, const date_time& b) noexcept { return !(a == b); }
};

struct binary {
  std::uint8_t subtype{0};
  std::vector<std::uint8_t> bytes{};

  friend bool operator==(const binary& a, const binary& b) { return a.subtype == b.subtype && a.bytes == b.bytes; }
  friend bool operator!=(const binary& a, const binary& b) { return !(a == b); }
};

struct regex {
  std::string pattern{};
  std::string options{};

  friend bool operator==(const regex& a, const regex& b) { return a.pattern == b.pattern && a.options == b.options; }
  friend bool operator!=(const regex& a, const regex& b) { return !(a == b); }
};

struct javascript_code {
  std::string code{};

  friend bool operator==(const javascript_code& a, const javascript_code& b) { return a.code == b.code; }
  friend bool operator!=(const javascript_code& a, const javascript_code& b) { return !(a == b); }
};

struct javascript_code_with_scope {
  std::string code{};
  std::vector<std::pair<std::string, value>> scope{};
};

// Defined once value is complete.
inline bool operator==(const javascript_code_with_scope& a, const javascript_code_with_scope& b);
inline bool operator!=(const javascript_code_with_scope& a, const javascript_code_with_scope& b);

struct timestamp {
  std::uint32_t time{0};
  std::uint32_t increment{0};

  friend bool operator==(const timestamp& a, const timestamp& b) noexcept {
    return a.time == b.time && a.increment == b.increment;
  }
  friend bool operator!=(const timestamp& a, const timestamp& b) noexcept { return !(a == b); }
};

class value {
public:
  using array = std::vector<value>;
  using document = std::vector<std::pair<std::string, value>>;

  enum class kind {
    null,
    boolean,
    int32,
    int64,
    floating_point,
    string,
    array,
    document,
    object_id,
    date_time,
    binary,
    regex,
    javascript_code,
    javascript_code_with_scope,
    timestamp
  };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  value(bool b) : data_(b) {}
  value(std::int32_t i) : data_(i) {}
  value(std::int64_t i) : data_(i) {}
  value(double d) : data_(d) {}
  value(std::string s) : data_(std::move(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(array a) : data_(std::move(a)) {}
  value(document d) : data_(std::move(d)) {}
  value(docbridge::object_id oid) : data_(oid) {}
  value(docbridge::date_time dt) : data_(dt) {}
  value(docbridge::binary b) : data_(std::move(b)) {}
  value(docbridge::regex r) : data_(std::move(r)) {}
  value(docbridge::javascript_code c) : data_(std::move(c)) {}
  value(docbridge::javascript_code_with_scope c) : data_(std::move(c)) {}
  value(docbridge::timestamp t) : data_(t) {}

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::null;
      case 1: return kind::boolean;
      case 2: return kind::int32;
      case 3: return kind::int64;
      case 4: return kind::floating_point;
      case 5: return kind::string;
      case 6: return kind::array;
      case 7: return kind::document;
      case 8: return kind::object_id;
      case 9: return kind::date_time;
      case 10: return kind::binary;
      case 11: return kind::regex;
      case 12: return kind::javascript_code;
      case 13: return kind::javascript_code_with_scope;
      case 14: return kind::timestamp;
      default: return kind::null;
    }
  }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_int32() const noexcept { return std::holds_alternative<std::int32_t>(data_); }
  bool is_int64() const noexcept { return std::holds_alternative<std::int64_t>(data_); }
  bool is_double() const noexcept { return std::holds_alternative<double>(data_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<array>(data_); }
  bool is_document() const noexcept { return std::holds_alternative<document>(data_); }
  // Kinds that only decode generically through their extended representation.
  bool is_extended() const noexcept { return data_.index() >= 8; }

  bool as_bool() const { return std::get<bool>(data_); }
  std::int32_t as_int32() const { return std::get<std::int32_t>(data_); }
  std::int64_t as_int64() const { return std::get<std::int64_t>(data_); }
  double as_double() const { return std::get<double>(data_); }

  const std::string& as_string() const { return std::get<std::string>(data_); }
  const array& as_array() const { return std::get<array>(data_); }
  const document& as_document() const { return std::get<document>(data_); }

  std::string& as_string() { return std::get<std::string>(data_); }
  array& as_array() { return std::get<array>(data_); }
  document& as_document() { return std::get<document>(data_); }

  const docbridge::object_id& as_object_id() const { return std::get<docbridge::object_id>(data_); }
  const docbridge::date_time& as_date_time() const { return std::get<docbridge::date_time>(data_); }
  const docbridge::binary& as_binary() const { return std::get<docbridge::binary>(data_); }
  const docbridge::regex& as_regex() const { return std::get<docbridge::regex>(data_); }
  const docbridge::javascript_code& as_javascript_code() const { return std::get<docbridge::javascript_code>(data_); }
  const docbridge::javascript_code_with_scope& as_javascript_code_with_scope() const {
    return std::get<docbridge::javascript_code_with_scope>(data_);
  }
  const docbridge::timestamp& as_timestamp() const { return std::get<docbridge::timestamp>(data_); }

  // First entry with the given key; duplicates are kept in insertion order.
  const value* find(std::string_view key) const noexcept {
    if (!is_document()) return nullptr;
    for (const auto& kv : std::get<document>(data_)) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  value* find(std::string_view key) noexcept {
    if (!is_document()) return nullptr;
    for (auto& kv : std::get<document>(data_)) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  // Extended representation of an extended kind. Throws std::logic_error on a primitive kind.
  document to_extended_document() const;

  // Recognises the extended forms produced by to_extended_document; any other document is
  // returned as a plain document value.
  static value from_extended_document(document d);

  friend bool operator==(const value& a, const value& b) { return a.data_ == b.data_; }
  friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
  // index: 0 null, 1 bool, 2 int32, 3 int64, 4 double, 5 string, 6 array, 7 document,
  // 8.. extended kinds
  std::variant<std::monostate, bool, std::int32_t, std::int64_t, double, std::string, array, document,
               docbridge::object_id, docbridge::date_time, docbridge::binary, docbridge::regex,
               docbridge::javascript_code, docbridge::javascript_code_with_scope, docbridge::timestamp>
      data_;
};

using document = value::document;

inline bool operator==(const javascript_code_with_scope& a, const javascript_code_with_scope& b) {
  return a.code == b.code && a.scope == b.scope;
}
inline bool operator!=(const javascript_code_with_scope& a, const javascript_code_with_scope& b) { return !(a == b); }

inline const char* to_string(value::kind k) noexcept {
  switch (k) {
    case value::kind::null: return "null";
    case value::kind::boolean: return "boolean";
    case value::kind::int32: return "int32";
    case value::kind::int64: return "int64";
    case value::kind::floating_point: return "double";
    case value::kind::string: return "string";
    case value::kind::array: return "array";
    case value::kind::document: return "document";
    case value::kind::object_id: return "object_id";
    case value::kind::date_time: return "date_time";
    case value::kind::binary: return "binary";
    case value::kind::regex: return "regex";
    case value::kind::javascript_code: return "javascript_code";
    case value::kind::javascript_code_with_scope: return "javascript_code_with_scope";
    case value::kind::timestamp: return "timestamp";
  }
  return "unknown";
}

inline document value::to_extended_document() const {
  document d;
  switch (type()) {
    case kind::object_id:
      d.emplace_back("$oid", as_object_id().to_hex());
      return d;
    case kind::date_time: {
      document n;
      n.emplace_back("$numberLong", as_date_time().millis);
      d.emplace_back("$date", std::move(n));
      return d;
    }
    case kind::binary: {
      const auto& b = as_binary();
      d.emplace_back("$binary", detail::to_hex(b.bytes.data(), b.bytes.size()));
      d.emplace_back("type", static_cast<std::int64_t>(b.subtype));
      return d;
    }
    case kind::regex:
      d.emplace_back("$regex", as_regex().pattern);
      d.emplace_back("$options", as_regex().options);
      return d;
    case kind::javascript_code:
      d.emplace_back("$code", as_javascript_code().code);
      return d;
    case kind::javascript_code_with_scope:
      d.emplace_back("$code", as_javascript_code_with_scope().code);
      d.emplace_back("$scope", as_javascript_code_with_scope().scope);
      return d;
    case kind::timestamp: {
      document t;
      t.emplace_back("t", static_cast<std::int32_t>(as_timestamp().time));
      t.emplace_back("i", static_cast<std::int32_t>(as_timestamp().increment));
      d.emplace_back("$timestamp", std::move(t));
      return d;
    }
    default:
      throw std::logic_error(std::string("docbridge: no extended representation for ") + to_string(type()));
  }
}

namespace detail {

inline bool integer_of(const value& v, std::int64_t& out) noexcept {
  if (v.is_int32()) {
    out = v.as_int32();
    return true;
  }
  if (v.is_int64()) {
    out = v.as_int64();
    return true;
  }
  return false;
}

// Returns the members for keys `a` and `b` when `d` holds exactly those two keys.
inline bool two_keys(const document& d, std::string_view a, std::string_view b, const value*& va, const value*& vb) noexcept {
  if (d.size() != 2) return false;
  if (d[0].first == a && d[1].first == b) {
    va = &d[0].second;
    vb = &d[1].second;
    return true;
  }
  if (d[0].first == b && d[1].first == a) {
    va = &d[1].second;
    vb = &d[0].second;
    return true;
  }
  return false;
}

} // namespace detail

inline value value::from_extended_document(document d) {
  if (d.size() == 1) {
    const std::string& key = d[0].first;
    const value& v = d[0].second;
    if (key == "$oid" && v.is_string()) {
      docbridge::object_id oid;
      if (docbridge::object_id::from_hex(v.as_string(), oid)) return value(oid);
    } else if (key == "$date" && v.is_document()) {
      const document& inner = v.as_document();
      std::int64_t ms = 0;
      if (inner.size() == 1 && inner[0].first == "$numberLong" && detail::integer_of(inner[0].second, ms)) {
        return value(docbridge::date_time{ms});
      }
    } else if (key == "$code" && v.is_string()) {
      return value(docbridge::javascript_code{v.as_string()});
    } else if (key == "$timestamp" && v.is_document()) {
      const value* t = nullptr;
      const value* i = nullptr;
      std::int64_t tv = 0;
      std::int64_t iv = 0;
      if (detail::two_keys(v.as_document(), "t", "i", t, i) && detail::integer_of(*t, tv) && detail::integer_of(*i, iv)) {
        return value(docbridge::timestamp{static_cast<std::uint32_t>(tv), static_cast<std::uint32_t>(iv)});
      }
    }
    return value(std::move(d));
  }

  const value* a = nullptr;
  const value* b = nullptr;
  if (detail::two_keys(d, "$binary", "type", a, b) && a->is_string()) {
    std::int64_t subtype = 0;
    std::vector<std::uint8_t> bytes;
    if (detail::integer_of(*b, subtype) && subtype >= 0 && subtype <= 0xFF && detail::from_hex(a->as_string(), bytes)) {
      return value(docbridge::binary{static_cast<std::uint8_t>(subtype), std::move(bytes)});
    }
  } else if (detail::two_keys(d, "$regex", "$options", a, b) && a->is_string() && b->is_string()) {
    return value(docbridge::regex{a->as_string(), b->as_string()});
  } else if (detail::two_keys(d, "$code", "$scope", a, b) && a->is_string() && b->is_document()) {
    return value(docbridge::javascript_code_with_scope{a->as_string(), b->as_document()});
  }
  return value(std::move(d));
}

} // namespace docbridge
