#pragma once

// docbridge: type-directed decoding of document value trees into C++ types.
// Error taxonomy shared by every cursor. Data errors are returned, never thrown.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace docbridge {

enum class error_code {
  ok = 0,
  end_of_stream,
  expected_enum,
  expected_single_key_map,
  expected_variant_name,
  expected_tuple,
  expected_struct,
  length_mismatch,
  unknown_field,
  syntax,
  nesting_too_deep
};

struct error {
  error_code code{error_code::ok};
  // Unconsumed element count for length_mismatch.
  std::size_t remaining{0};
  // Field name for unknown_field, message for syntax.
  std::string detail{};
  // Location inside the decoded tree, e.g. "/items/3/name". Empty at the root.
  std::string path{};

  explicit operator bool() const noexcept { return code != error_code::ok; }

  static error make(error_code code, std::string detail = {}) {
    error e;
    e.code = code;
    e.detail = std::move(detail);
    return e;
  }

  static error syntax(std::string message) { return make(error_code::syntax, std::move(message)); }

  static error unknown_field(std::string name) { return make(error_code::unknown_field, std::move(name)); }

  static error length_mismatch(std::size_t remaining) {
    error e;
    e.code = error_code::length_mismatch;
    e.remaining = remaining;
    return e;
  }

  // Prepends one path segment; called while the error unwinds out of a nested cursor.
  void prefix_path(const std::string& segment) {
    std::string p;
    p.reserve(segment.size() + 1 + path.size());
    p.push_back('/');
    p += segment;
    p += path;
    path = std::move(p);
  }
};

inline const char* to_string(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::end_of_stream: return "end_of_stream";
    case error_code::expected_enum: return "expected_enum";
    case error_code::expected_single_key_map: return "expected_single_key_map";
    case error_code::expected_variant_name: return "expected_variant_name";
    case error_code::expected_tuple: return "expected_tuple";
    case error_code::expected_struct: return "expected_struct";
    case error_code::length_mismatch: return "length_mismatch";
    case error_code::unknown_field: return "unknown_field";
    case error_code::syntax: return "syntax";
    case error_code::nesting_too_deep: return "nesting_too_deep";
  }
  return "unknown";
}

// "kind: detail at /path", suitable for reporting a failed decode to an end user.
inline std::string describe(const error& e) {
  std::string out = to_string(e.code);
  switch (e.code) {
    case error_code::length_mismatch:
      out += ": ";
      out += std::to_string(e.remaining);
      out += " element(s) left unread";
      break;
    case error_code::unknown_field:
      out += ": unknown field `";
      out += e.detail;
      out += '`';
      break;
    default:
      if (!e.detail.empty()) {
        out += ": ";
        out += e.detail;
      }
      break;
  }
  if (!e.path.empty()) {
    out += " at ";
    out += e.path;
  }
  return out;
}

class decode_exception : public std::runtime_error {
public:
  explicit decode_exception(error e) : std::runtime_error("docbridge: " + describe(e)), err_(std::move(e)) {}

  const error& err() const noexcept { return err_; }

private:
  error err_;
};

} // namespace docbridge
