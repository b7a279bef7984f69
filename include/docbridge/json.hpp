#pragma once

// docbridge: strict JSON text <-> value tree, with optional recognition of the extended forms
// ({"$oid": ...}, {"$date": ...}, ...). Used by the tools and tests to build trees from text.

#include <docbridge/value.hpp>

#include <cassert>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace docbridge {

enum class parse_error_code {
  ok = 0,
  unexpected_eof,
  invalid_value,
  invalid_number,
  invalid_string,
  invalid_escape,
  invalid_unicode_escape,
  invalid_utf16_surrogate,
  expected_colon,
  expected_comma_or_end,
  expected_key_string,
  trailing_characters,
  nesting_too_deep
};

struct parse_error {
  parse_error_code code{parse_error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};

  constexpr explicit operator bool() const noexcept { return code != parse_error_code::ok; }
};

namespace detail {

inline void update_line_col(std::string_view s, std::size_t pos, std::size_t& line, std::size_t& col) {
  line = 1;
  col = 1;
  for (std::size_t i = 0; i < pos && i < s.size(); ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
}

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline void skip_ws(std::string_view s, std::size_t& i) noexcept {
  while (i < s.size() && is_ws(s[i])) ++i;
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline void append_utf8(std::string& out, std::uint32_t cp) {
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

inline bool parse_u4(std::string_view s, std::size_t& i, std::uint32_t& out_cp) {
  if (i + 4 > s.size()) return false;
  std::uint32_t v = 0;
  for (std::size_t k = 0; k < 4; ++k) {
    const int h = hex_val(s[i + k]);
    if (h < 0) return false;
    v = (v << 4) | static_cast<std::uint32_t>(h);
  }
  i += 4;
  out_cp = v;
  return true;
}

inline double parse_double(std::string_view token) {
  // Token is not NUL-terminated; avoid a heap alloc for typical short numbers.
  constexpr std::size_t kStackCap = 128;
  if (token.size() < kStackCap) {
    char buf[kStackCap];
    if (!token.empty()) std::memcpy(buf, token.data(), token.size());
    buf[token.size()] = '\0';
    return std::strtod(buf, nullptr);
  }
  return std::strtod(std::string(token).c_str(), nullptr);
}

// JSON number grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
// Integers become int32 when they fit, else int64; everything else is a double.
inline bool parse_number(std::string_view s, std::size_t& i, value& out) {
  const std::size_t start = i;
  const std::size_t size = s.size();
  if (i >= size) return false;

  bool neg = false;
  if (s[i] == '-') {
    neg = true;
    ++i;
    if (i >= size) return false;
  }

  std::uint64_t acc = 0;
  bool overflow = false;

  if (s[i] == '0') {
    ++i;
    if (i < size && is_digit(s[i])) return false;
  } else {
    if (s[i] < '1' || s[i] > '9') return false;
    while (i < size && is_digit(s[i])) {
      const std::uint64_t d = static_cast<std::uint64_t>(s[i] - '0');
      if (!overflow) {
        if (acc > ((std::numeric_limits<std::uint64_t>::max)() - d) / 10u) {
          overflow = true;
        } else {
          acc = acc * 10u + d;
        }
      }
      ++i;
    }
  }

  bool is_int = true;
  if (i < size && s[i] == '.') {
    is_int = false;
    ++i;
    if (i >= size || !is_digit(s[i])) return false;
    while (i < size && is_digit(s[i])) ++i;
  }

  if (i < size && (s[i] == 'e' || s[i] == 'E')) {
    is_int = false;
    ++i;
    if (i >= size) return false;
    if (s[i] == '+' || s[i] == '-') {
      ++i;
      if (i >= size) return false;
    }
    if (!is_digit(s[i])) return false;
    while (i < size && is_digit(s[i])) ++i;
  }

  const std::string_view token = s.substr(start, i - start);
  const std::uint64_t limit = neg ? static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)()) + 1u
                                  : static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)());
  if (!is_int || overflow || acc > limit) {
    out = value(parse_double(token));
    return true;
  }

  std::int64_t v = 0;
  if (neg) {
    v = (acc == limit) ? (std::numeric_limits<std::int64_t>::min)() : -static_cast<std::int64_t>(acc);
  } else {
    v = static_cast<std::int64_t>(acc);
  }
  if (v >= (std::numeric_limits<std::int32_t>::min)() && v <= (std::numeric_limits<std::int32_t>::max)()) {
    out = value(static_cast<std::int32_t>(v));
  } else {
    out = value(v);
  }
  return true;
}

} // namespace detail

struct parse_options {
  std::size_t max_depth{256};
  bool require_eof{true};
  // Turn documents matching an extended form into the extended kind.
  bool extended{true};
};

struct parse_result {
  value val;
  parse_error err;
};

struct parser {
  std::string_view s;
  std::size_t i{0};
  parse_options opt;

  parse_result run() {
    parse_result r;
    detail::skip_ws(s, i);
    r.val = parse_value(0, r.err);
    if (r.err) return r;

    detail::skip_ws(s, i);
    if (opt.require_eof && i != s.size()) {
      set_error(r.err, parse_error_code::trailing_characters);
      return r;
    }
    return r;
  }

  void set_error(parse_error& e, parse_error_code code, std::size_t at = (std::numeric_limits<std::size_t>::max)()) {
    if (e) return;
    e.code = code;
    e.offset = (at == (std::numeric_limits<std::size_t>::max)()) ? i : at;
    detail::update_line_col(s, e.offset, e.line, e.column);
  }

  // `depth` counts the containers enclosing this value.
  value parse_value(std::size_t depth, parse_error& e) {
    if (i >= s.size()) {
      set_error(e, parse_error_code::unexpected_eof);
      return nullptr;
    }

    const char c = s[i];
    switch (c) {
      case 'n': return parse_literal("null", 4, nullptr, e);
      case 't': return parse_literal("true", 4, value(true), e);
      case 'f': return parse_literal("false", 5, value(false), e);
      case '"': {
        std::string out;
        if (!parse_string(out, e)) return nullptr;
        return value(std::move(out));
      }
      case '[':
      case '{':
        if (depth + 1 > opt.max_depth) {
          set_error(e, parse_error_code::nesting_too_deep);
          return nullptr;
        }
        return c == '[' ? parse_array(depth + 1, e) : parse_object(depth + 1, e);
      default: {
        if (c == '-' || detail::is_digit(c)) {
          const std::size_t start = i;
          value v;
          if (!detail::parse_number(s, i, v)) {
            set_error(e, parse_error_code::invalid_number, start);
            return nullptr;
          }
          return v;
        }
        set_error(e, parse_error_code::invalid_value);
        return nullptr;
      }
    }
  }

  value parse_literal(const char* lit, std::size_t len, value v, parse_error& e) {
    if (i + len > s.size()) {
      set_error(e, parse_error_code::unexpected_eof);
      return nullptr;
    }
    if (std::memcmp(s.data() + i, lit, len) != 0) {
      set_error(e, parse_error_code::invalid_value);
      return nullptr;
    }
    i += len;
    return v;
  }

  bool parse_string(std::string& out, parse_error& e) {
    // Disallow raw control chars.
    if (i >= s.size() || s[i] != '"') {
      set_error(e, parse_error_code::invalid_string);
      return false;
    }
    const std::size_t quote_pos = i;
    ++i;
    out.clear();

    const std::size_t n = s.size();
    std::size_t chunk_begin = i;
    while (i < n) {
      const char c = s[i];
      if (c == '"') {
        out.append(s.data() + chunk_begin, i - chunk_begin);
        ++i;
        return true;
      }
      if (c == '\\') {
        out.append(s.data() + chunk_begin, i - chunk_begin);
        ++i;
        if (i >= n) {
          set_error(e, parse_error_code::unexpected_eof, quote_pos);
          return false;
        }
        const char esc = s[i++];
        switch (esc) {
          case '"': out.push_back('"'); break;
          case '\\': out.push_back('\\'); break;
          case '/': out.push_back('/'); break;
          case 'b': out.push_back('\b'); break;
          case 'f': out.push_back('\f'); break;
          case 'n': out.push_back('\n'); break;
          case 'r': out.push_back('\r'); break;
          case 't': out.push_back('\t'); break;
          case 'u': {
            std::uint32_t cp = 0;
            if (!detail::parse_u4(s, i, cp)) {
              set_error(e, parse_error_code::invalid_unicode_escape, i);
              return false;
            }
            if (cp >= 0xD800u && cp <= 0xDBFFu) {
              if (i + 2 > n || s[i] != '\\' || s[i + 1] != 'u') {
                set_error(e, parse_error_code::invalid_utf16_surrogate, i);
                return false;
              }
              i += 2;
              std::uint32_t low = 0;
              if (!detail::parse_u4(s, i, low)) {
                set_error(e, parse_error_code::invalid_unicode_escape, i);
                return false;
              }
              if (low < 0xDC00u || low > 0xDFFFu) {
                set_error(e, parse_error_code::invalid_utf16_surrogate, i);
                return false;
              }
              cp = 0x10000u + (((cp - 0xD800u) << 10) | (low - 0xDC00u));
            } else if (cp >= 0xDC00u && cp <= 0xDFFFu) {
              set_error(e, parse_error_code::invalid_utf16_surrogate, i);
              return false;
            }
            detail::append_utf8(out, cp);
            break;
          }
          default:
            set_error(e, parse_error_code::invalid_escape, i - 1);
            return false;
        }
        chunk_begin = i;
        continue;
      }
      if (static_cast<unsigned char>(c) <= 0x1F) {
        set_error(e, parse_error_code::invalid_string, i);
        return false;
      }
      ++i;
    }

    set_error(e, parse_error_code::unexpected_eof, quote_pos);
    return false;
  }

  value parse_array(std::size_t depth, parse_error& e) {
    assert(i < s.size() && s[i] == '[');
    ++i;
    detail::skip_ws(s, i);

    value::array a;
    if (i < s.size() && s[i] == ']') {
      ++i;
      return value(std::move(a));
    }

    while (true) {
      detail::skip_ws(s, i);
      value elem = parse_value(depth, e);
      if (e) return nullptr;
      a.emplace_back(std::move(elem));

      detail::skip_ws(s, i);
      if (i >= s.size()) {
        set_error(e, parse_error_code::unexpected_eof);
        return nullptr;
      }
      const char c = s[i++];
      if (c == ',') continue;
      if (c == ']') return value(std::move(a));
      set_error(e, parse_error_code::expected_comma_or_end, i - 1);
      return nullptr;
    }
  }

  value parse_object(std::size_t depth, parse_error& e) {
    assert(i < s.size() && s[i] == '{');
    ++i;
    detail::skip_ws(s, i);

    document d;
    if (i < s.size() && s[i] == '}') {
      ++i;
      return value(std::move(d));
    }

    while (true) {
      detail::skip_ws(s, i);
      if (i >= s.size()) {
        set_error(e, parse_error_code::unexpected_eof);
        return nullptr;
      }
      if (s[i] != '"') {
        set_error(e, parse_error_code::expected_key_string);
        return nullptr;
      }
      std::string key;
      if (!parse_string(key, e)) return nullptr;

      detail::skip_ws(s, i);
      if (i >= s.size()) {
        set_error(e, parse_error_code::unexpected_eof);
        return nullptr;
      }
      if (s[i] != ':') {
        set_error(e, parse_error_code::expected_colon);
        return nullptr;
      }
      ++i;

      detail::skip_ws(s, i);
      value v = parse_value(depth, e);
      if (e) return nullptr;
      d.emplace_back(std::move(key), std::move(v));

      detail::skip_ws(s, i);
      if (i >= s.size()) {
        set_error(e, parse_error_code::unexpected_eof);
        return nullptr;
      }
      const char c = s[i++];
      if (c == ',') continue;
      if (c == '}') return opt.extended ? value::from_extended_document(std::move(d)) : value(std::move(d));
      set_error(e, parse_error_code::expected_comma_or_end, i - 1);
      return nullptr;
    }
  }
};

inline parse_result parse(std::string_view json, parse_options opt = {}) {
  parser p;
  p.s = json;
  p.opt = opt;
  return p.run();
}

inline value parse_or_throw(std::string_view json, parse_options opt = {}) {
  auto r = parse(json, opt);
  if (r.err) throw std::runtime_error("docbridge: parse failed at offset " + std::to_string(r.err.offset));
  return std::move(r.val);
}

namespace detail {

inline void dump_escaped(std::string& out, std::string_view s) {
  static constexpr char hex[] = "0123456789ABCDEF";

  out.push_back('"');
  std::size_t chunk_begin = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const unsigned char uc = static_cast<unsigned char>(s[i]);

    const char* esc = nullptr;
    switch (s[i]) {
      case '"': esc = "\\\""; break;
      case '\\': esc = "\\\\"; break;
      case '\b': esc = "\\b"; break;
      case '\f': esc = "\\f"; break;
      case '\n': esc = "\\n"; break;
      case '\r': esc = "\\r"; break;
      case '\t': esc = "\\t"; break;
      default: break;
    }

    if (esc != nullptr) {
      out.append(s.data() + chunk_begin, i - chunk_begin);
      out.append(esc, 2);
      chunk_begin = i + 1;
    } else if (uc <= 0x1F) {
      out.append(s.data() + chunk_begin, i - chunk_begin);
      out.append("\\u00", 4);
      out.push_back(hex[(uc >> 4) & 0xF]);
      out.push_back(hex[uc & 0xF]);
      chunk_begin = i + 1;
    }
  }
  out.append(s.data() + chunk_begin, s.size() - chunk_begin);
  out.push_back('"');
}

inline void dump_int64(std::string& out, std::int64_t v) {
  char buf[32];
  auto r = std::to_chars(buf, buf + sizeof(buf), v);
  if (r.ec != std::errc{}) {
    throw std::runtime_error("docbridge: failed to format integer");
  }
  out.append(buf, static_cast<std::size_t>(r.ptr - buf));
}

inline void dump_double(std::string& out, double d) {
  if (!std::isfinite(d)) {
    throw std::runtime_error("docbridge: cannot dump NaN/Inf as JSON number");
  }
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.17g", d);
  if (n <= 0 || static_cast<std::size_t>(n) >= sizeof(buf)) throw std::runtime_error("docbridge: failed to format double");
  out.append(buf, static_cast<std::size_t>(n));
  // Keep doubles distinguishable from integers on the way back in.
  if (std::strpbrk(buf, ".eE") == nullptr) out.append(".0", 2);
}

inline void dump_document(std::string& out, const document& d);

inline void dump_value(std::string& out, const value& v) {
  switch (v.type()) {
    case value::kind::null: out.append("null", 4); return;
    case value::kind::boolean:
      if (v.as_bool()) out.append("true", 4);
      else out.append("false", 5);
      return;
    case value::kind::int32: dump_int64(out, v.as_int32()); return;
    case value::kind::int64: dump_int64(out, v.as_int64()); return;
    case value::kind::floating_point: dump_double(out, v.as_double()); return;
    case value::kind::string: dump_escaped(out, v.as_string()); return;
    case value::kind::array: {
      const auto& a = v.as_array();
      out.push_back('[');
      for (std::size_t idx = 0; idx < a.size(); ++idx) {
        if (idx > 0) out.push_back(',');
        dump_value(out, a[idx]);
      }
      out.push_back(']');
      return;
    }
    case value::kind::document: dump_document(out, v.as_document()); return;
    default: dump_document(out, v.to_extended_document()); return;
  }
}

inline void dump_document(std::string& out, const document& d) {
  out.push_back('{');
  for (std::size_t idx = 0; idx < d.size(); ++idx) {
    if (idx > 0) out.push_back(',');
    dump_escaped(out, d[idx].first);
    out.push_back(':');
    dump_value(out, d[idx].second);
  }
  out.push_back('}');
}

} // namespace detail

// Compact JSON; extended kinds are written in their extended form.
inline std::string dump(const value& v) {
  std::string out;
  out.reserve(256);
  detail::dump_value(out, v);
  return out;
}

} // namespace docbridge
