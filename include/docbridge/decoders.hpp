#pragma once

// docbridge: decoders for scalars, standard containers and the value tree itself.

#include <docbridge/decoder.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace docbridge {

namespace detail {

template <class T>
std::string integer_name() {
  std::string s = std::is_signed<T>::value ? "int" : "uint";
  s += std::to_string(sizeof(T) * 8);
  return s;
}

template <class T>
bool integer_fits(std::int64_t v) noexcept {
  if constexpr (std::is_signed<T>::value) {
    return v >= static_cast<std::int64_t>((std::numeric_limits<T>::min)()) &&
           v <= static_cast<std::int64_t>((std::numeric_limits<T>::max)());
  } else {
    return v >= 0 && static_cast<std::uint64_t>(v) <= static_cast<std::uint64_t>((std::numeric_limits<T>::max)());
  }
}

template <class T, class A>
void reserve_for(std::vector<T, A>& v, std::size_t n) {
  v.reserve(n);
}

template <class C>
void reserve_for(C& /*c*/, std::size_t /*n*/) {}

} // namespace detail

template <>
struct decoder<bool> {
  struct visitor : visitor_base<visitor> {
    bool& out;
    explicit visitor(bool& o) noexcept : out(o) {}
    std::string expecting() const { return "boolean"; }
    error visit_bool(bool v) {
      out = v;
      return {};
    }
  };

  template <class Source>
  static error decode(Source& src, bool& out) {
    visitor v(out);
    return src.visit(v);
  }
};

// All integral types except bool and char, from int32/int64 with a range check.
template <class T>
struct decoder<T, std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value &&
                                   !std::is_same<T, char>::value>> {
  struct visitor : visitor_base<visitor> {
    T& out;
    explicit visitor(T& o) noexcept : out(o) {}
    std::string expecting() const { return detail::integer_name<T>(); }
    error visit_i32(std::int32_t v) { return store(v); }
    error visit_i64(std::int64_t v) { return store(v); }

    error store(std::int64_t v) {
      if (!detail::integer_fits<T>(v)) {
        return error::syntax("invalid value: integer " + std::to_string(v) + " out of range for " + expecting());
      }
      out = static_cast<T>(v);
      return {};
    }
  };

  template <class Source>
  static error decode(Source& src, T& out) {
    visitor v(out);
    return src.visit(v);
  }
};

template <class T>
struct decoder<T, std::enable_if_t<std::is_floating_point<T>::value>> {
  struct visitor : visitor_base<visitor> {
    T& out;
    explicit visitor(T& o) noexcept : out(o) {}
    std::string expecting() const { return "a floating point number"; }
    error visit_f64(double v) {
      out = static_cast<T>(v);
      return {};
    }
    error visit_i32(std::int32_t v) {
      out = static_cast<T>(v);
      return {};
    }
    error visit_i64(std::int64_t v) {
      out = static_cast<T>(v);
      return {};
    }
  };

  template <class Source>
  static error decode(Source& src, T& out) {
    visitor v(out);
    return src.visit(v);
  }
};

template <>
struct decoder<std::string> {
  struct visitor : visitor_base<visitor> {
    std::string& out;
    explicit visitor(std::string& o) noexcept : out(o) {}
    std::string expecting() const { return "string"; }
    error visit_string(std::string&& v) {
      out = std::move(v);
      return {};
    }
  };

  template <class Source>
  static error decode(Source& src, std::string& out) {
    visitor v(out);
    return src.visit(v);
  }
};

template <>
struct decoder<char> {
  struct visitor : visitor_base<visitor> {
    char& out;
    explicit visitor(char& o) noexcept : out(o) {}
    std::string expecting() const { return "a single character"; }
    error visit_string(std::string&& v) {
      if (v.size() != 1) return error::syntax("invalid value: string \"" + v + "\", expected a single character");
      out = v[0];
      return {};
    }
  };

  template <class Source>
  static error decode(Source& src, char& out) {
    visitor v(out);
    return src.visit(v);
  }
};

namespace detail {

template <class Unit>
struct unit_decoder {
  struct visitor : visitor_base<visitor> {
    std::string expecting() const { return "unit"; }
    error visit_unit() { return {}; }
  };

  template <class Source>
  static error decode(Source& src, Unit& out) {
    out = Unit{};
    visitor v;
    return src.visit_unit(v);
  }
};

} // namespace detail

template <>
struct decoder<std::monostate> : detail::unit_decoder<std::monostate> {};

template <>
struct decoder<std::nullptr_t> : detail::unit_decoder<std::nullptr_t> {};

template <class T>
struct decoder<std::optional<T>> {
  struct visitor : visitor_base<visitor> {
    std::optional<T>& out;
    explicit visitor(std::optional<T>& o) noexcept : out(o) {}
    std::string expecting() const { return "option"; }
    error visit_none() {
      out.reset();
      return {};
    }
    template <class Source>
    error visit_some(Source& src) {
      out.emplace();
      return decoder<T>::decode(src, *out);
    }
  };

  template <class Source>
  static error decode(Source& src, std::optional<T>& out) {
    visitor v(out);
    return src.visit_option(v);
  }
};

namespace detail {

// Growable sequences. A unit offered in place of a sequence decodes as empty.
template <class Container>
struct sequence_visitor : visitor_base<sequence_visitor<Container>> {
  Container& out;
  explicit sequence_visitor(Container& o) noexcept : out(o) {}
  std::string expecting() const { return "a sequence"; }

  error visit_unit() {
    out.clear();
    return {};
  }

  error visit_seq(seq_cursor& seq) {
    using elem_type = typename Container::value_type;
    out.clear();
    reserve_for(out, seq.size_hint());
    error e;
    while (true) {
      elem_type elem{};
      if (!seq.next_element(elem, e)) break;
      out.push_back(std::move(elem));
    }
    if (e) return e;
    return seq.finish();
  }
};

template <class Tuple, std::size_t... I>
error read_positional(seq_cursor& seq, Tuple& out, std::index_sequence<I...>) {
  error e;
  std::size_t read = 0;
  const bool complete = ((seq.next_element(std::get<I>(out), e) && (++read, true)) && ...);
  if (!complete) {
    if (e) return e;
    return error::make(error_code::end_of_stream, "expected " + std::to_string(sizeof...(I)) +
                                                      " elements, found " + std::to_string(read));
  }
  return seq.finish();
}

// Fixed-size positional targets: std::array, std::pair, std::tuple.
template <class Tuple>
struct tuple_visitor : visitor_base<tuple_visitor<Tuple>> {
  static constexpr std::size_t size = std::tuple_size<Tuple>::value;

  Tuple& out;
  explicit tuple_visitor(Tuple& o) noexcept : out(o) {}
  std::string expecting() const { return "a tuple of size " + std::to_string(size); }

  error visit_unit() {
    if (size != 0) return this->invalid("unit");
    return {};
  }

  error visit_seq(seq_cursor& seq) { return read_positional(seq, out, std::make_index_sequence<size>{}); }
};

template <class Map>
struct map_visitor : visitor_base<map_visitor<Map>> {
  Map& out;
  explicit map_visitor(Map& o) noexcept : out(o) {}
  std::string expecting() const { return "a map"; }

  error visit_unit() {
    out.clear();
    return {};
  }

  error visit_map(map_cursor& map) {
    out.clear();
    error e;
    while (true) {
      typename Map::key_type k{};
      const key_state st = map.next_key(k, e);
      if (st == key_state::fatal) return e;
      if (st == key_state::end) break;
      typename Map::mapped_type v{};
      if ((e = map.next_value(v))) return e;
      out.insert_or_assign(std::move(k), std::move(v));
    }
    return map.finish();
  }
};

} // namespace detail

template <class T, class A>
struct decoder<std::vector<T, A>> {
  template <class Source>
  static error decode(Source& src, std::vector<T, A>& out) {
    detail::sequence_visitor<std::vector<T, A>> v(out);
    return src.visit(v);
  }
};

template <class T, class A>
struct decoder<std::deque<T, A>> {
  template <class Source>
  static error decode(Source& src, std::deque<T, A>& out) {
    detail::sequence_visitor<std::deque<T, A>> v(out);
    return src.visit(v);
  }
};

template <class T, std::size_t N>
struct decoder<std::array<T, N>> {
  template <class Source>
  static error decode(Source& src, std::array<T, N>& out) {
    detail::tuple_visitor<std::array<T, N>> v(out);
    return src.visit(v);
  }
};

template <class A, class B>
struct decoder<std::pair<A, B>> {
  template <class Source>
  static error decode(Source& src, std::pair<A, B>& out) {
    detail::tuple_visitor<std::pair<A, B>> v(out);
    return src.visit(v);
  }
};

template <class... Ts>
struct decoder<std::tuple<Ts...>> {
  template <class Source>
  static error decode(Source& src, std::tuple<Ts...>& out) {
    detail::tuple_visitor<std::tuple<Ts...>> v(out);
    return src.visit(v);
  }
};

// Duplicate keys: the last one wins.
template <class K, class V, class C, class A>
struct decoder<std::map<K, V, C, A>> {
  template <class Source>
  static error decode(Source& src, std::map<K, V, C, A>& out) {
    detail::map_visitor<std::map<K, V, C, A>> v(out);
    return src.visit(v);
  }
};

template <class K, class V, class H, class E, class A>
struct decoder<std::unordered_map<K, V, H, E, A>> {
  template <class Source>
  static error decode(Source& src, std::unordered_map<K, V, H, E, A>& out) {
    detail::map_visitor<std::unordered_map<K, V, H, E, A>> v(out);
    return src.visit(v);
  }
};

// Identity: rebuilds a value tree. Documents pass through from_extended_document, so extended
// kinds that reached the bridge as their extended representation are recovered.
template <>
struct decoder<value> {
  struct visitor : visitor_base<visitor> {
    value& out;
    explicit visitor(value& o) noexcept : out(o) {}
    std::string expecting() const { return "any value"; }

    error visit_unit() {
      out = value(nullptr);
      return {};
    }
    error visit_none() {
      out = value(nullptr);
      return {};
    }
    template <class Source>
    error visit_some(Source& src) {
      return decoder<value>::decode(src, out);
    }
    error visit_bool(bool v) {
      out = value(v);
      return {};
    }
    error visit_i32(std::int32_t v) {
      out = value(v);
      return {};
    }
    error visit_i64(std::int64_t v) {
      out = value(v);
      return {};
    }
    error visit_f64(double v) {
      out = value(v);
      return {};
    }
    error visit_string(std::string&& v) {
      out = value(std::move(v));
      return {};
    }

    error visit_seq(seq_cursor& seq) {
      value::array a;
      detail::sequence_visitor<value::array> sv(a);
      if (error e = sv.visit_seq(seq)) return e;
      out = value(std::move(a));
      return {};
    }

    error visit_map(map_cursor& map) {
      document d;
      d.reserve(map.size_hint());
      error e;
      while (true) {
        std::string k;
        const key_state st = map.next_key(k, e);
        if (st == key_state::fatal) return e;
        if (st == key_state::end) break;
        value v;
        if ((e = map.next_value(v))) return e;
        d.emplace_back(std::move(k), std::move(v));
      }
      if ((e = map.finish())) return e;
      out = value::from_extended_document(std::move(d));
      return {};
    }

    template <class Source>
    error visit_newtype(Source& src) {
      return decoder<value>::decode(src, out);
    }
  };

  template <class Source>
  static error decode(Source& src, value& out) {
    visitor v(out);
    return src.visit(v);
  }
};

// Ordered documents, duplicate keys kept. Extended kinds arrive as their extended form.
template <>
struct decoder<document> {
  struct visitor : visitor_base<visitor> {
    document& out;
    explicit visitor(document& o) noexcept : out(o) {}
    std::string expecting() const { return "a document"; }

    error visit_map(map_cursor& map) {
      out.clear();
      out.reserve(map.size_hint());
      error e;
      while (true) {
        std::string k;
        const key_state st = map.next_key(k, e);
        if (st == key_state::fatal) return e;
        if (st == key_state::end) break;
        value v;
        if ((e = map.next_value(v))) return e;
        out.emplace_back(std::move(k), std::move(v));
      }
      return map.finish();
    }
  };

  template <class Source>
  static error decode(Source& src, document& out) {
    visitor v(out);
    return src.visit(v);
  }
};

namespace detail {

// Extended kinds travel as documents; rebuild the value and require the expected kind.
template <class Source, class T>
error decode_extended(Source& src, T& out, value::kind k, const T& (value::*get)() const) {
  // An absent extended field has no unit form.
  if constexpr (std::is_same<Source, unit_source>::value) return error::make(error_code::end_of_stream);
  value v;
  if (error e = decoder<value>::decode(src, v)) return e;
  if (v.type() != k) {
    return error::syntax(std::string("invalid type: ") + to_string(v.type()) + ", expected " + to_string(k));
  }
  out = (v.*get)();
  return {};
}

} // namespace detail

template <>
struct decoder<object_id> {
  template <class Source>
  static error decode(Source& src, object_id& out) {
    return detail::decode_extended(src, out, value::kind::object_id, &value::as_object_id);
  }
};

template <>
struct decoder<date_time> {
  template <class Source>
  static error decode(Source& src, date_time& out) {
    return detail::decode_extended(src, out, value::kind::date_time, &value::as_date_time);
  }
};

template <>
struct decoder<binary> {
  template <class Source>
  static error decode(Source& src, binary& out) {
    return detail::decode_extended(src, out, value::kind::binary, &value::as_binary);
  }
};

template <>
struct decoder<regex> {
  template <class Source>
  static error decode(Source& src, regex& out) {
    return detail::decode_extended(src, out, value::kind::regex, &value::as_regex);
  }
};

template <>
struct decoder<javascript_code> {
  template <class Source>
  static error decode(Source& src, javascript_code& out) {
    return detail::decode_extended(src, out, value::kind::javascript_code, &value::as_javascript_code);
  }
};

template <>
struct decoder<javascript_code_with_scope> {
  template <class Source>
  static error decode(Source& src, javascript_code_with_scope& out) {
    return detail::decode_extended(src, out, value::kind::javascript_code_with_scope,
                                   &value::as_javascript_code_with_scope);
  }
};

template <>
struct decoder<timestamp> {
  template <class Source>
  static error decode(Source& src, timestamp& out) {
    return detail::decode_extended(src, out, value::kind::timestamp, &value::as_timestamp);
  }
};

// Transparent single-member wrapper; `Tag` distinguishes otherwise identical wrappers.
template <class T, class Tag = void>
struct newtype {
  T inner{};
};

template <class T, class Tag>
struct decoder<newtype<T, Tag>> {
  struct visitor : visitor_base<visitor> {
    newtype<T, Tag>& out;
    explicit visitor(newtype<T, Tag>& o) noexcept : out(o) {}
    std::string expecting() const { return "newtype"; }
    template <class Source>
    error visit_newtype(Source& src) {
      return decoder<T>::decode(src, out.inner);
    }
  };

  template <class Source>
  static error decode(Source& src, newtype<T, Tag>& out) {
    visitor v(out);
    return src.visit_newtype("newtype", v);
  }
};

} // namespace docbridge
