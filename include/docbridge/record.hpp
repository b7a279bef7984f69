#pragma once

// docbridge: decoding of user structs (named fields) and unit-only enums.
//
//   struct point { int x; std::optional<int> y; };
//   DOCBRIDGE_RECORD(point, DOCBRIDGE_FIELD(point, x), DOCBRIDGE_FIELD(point, y))
//
// DOCBRIDGE_RECORD specialises docbridge::decoder and must be used at global scope.

#include <docbridge/decoders.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace docbridge {

template <class T, class M>
struct field_def {
  std::string_view name;
  M T::*member;
};

template <class T, class M>
constexpr field_def<T, M> field(std::string_view name, M T::*member) noexcept {
  return {name, member};
}

// Key type for record decoding: resolves a document key to the index of a declared field.
struct field_key {
  name_list names{};
  std::size_t index{0};
};

template <>
struct decoder<field_key> {
  struct visitor : visitor_base<visitor> {
    field_key& out;
    explicit visitor(field_key& o) noexcept : out(o) {}
    std::string expecting() const { return "a field identifier"; }
    error visit_string(std::string&& v) {
      const std::size_t i = out.names.index_of(v);
      if (i == out.names.size()) return error::unknown_field(std::move(v));
      out.index = i;
      return {};
    }
  };

  template <class Source>
  static error decode(Source& src, field_key& out) {
    visitor v(out);
    return src.visit(v);
  }
};

template <class T, class... Fields>
class record_visitor : public visitor_base<record_visitor<T, Fields...>> {
public:
  static constexpr std::size_t field_count = sizeof...(Fields);

  record_visitor(T& out, std::string_view type_name, const Fields&... fields)
      : out_(out), type_name_(type_name), fields_(fields...), names_{{fields.name...}} {}

  std::string expecting() const { return "struct " + std::string(type_name_); }

  name_list field_names() const noexcept { return name_list(names_.data(), names_.size()); }

  // Keys are matched against the declared fields. The first unknown key ends the scan, so a
  // declared field appearing after it is treated as missing.
  error visit_map(map_cursor& map) {
    std::array<bool, field_count> seen{};
    error e;
    while (true) {
      field_key key{field_names(), 0};
      const key_state st = map.next_key(key, e);
      if (st == key_state::fatal) return e;
      if (st == key_state::end) break;
      if (seen[key.index]) {
        error dup = error::syntax("duplicate field `" + std::string(names_[key.index]) + "`");
        dup.prefix_path(map.last_key());
        return dup;
      }
      seen[key.index] = true;
      if ((e = read_field(map, key.index, std::index_sequence_for<Fields...>{}))) return e;
    }
    if ((e = fill_missing(map, seen, std::index_sequence_for<Fields...>{}))) return e;
    return map.finish();
  }

  // Positional form: fields in declaration order.
  error visit_seq(seq_cursor& seq) { return read_in_order(seq, std::index_sequence_for<Fields...>{}); }

private:
  template <std::size_t... I>
  error read_field(map_cursor& map, std::size_t index, std::index_sequence<I...>) {
    error e;
    ((I == index ? (void)(e = map.next_value(out_.*(std::get<I>(fields_).member))) : (void)0), ...);
    return e;
  }

  template <std::size_t... I>
  error fill_missing(map_cursor& map, const std::array<bool, field_count>& seen, std::index_sequence<I...>) {
    error e;
    (void)((seen[I] || !(e = map.missing_field(std::get<I>(fields_).name, out_.*(std::get<I>(fields_).member)))) &&
           ...);
    return e;
  }

  template <std::size_t... I>
  error read_in_order(seq_cursor& seq, std::index_sequence<I...>) {
    error e;
    std::size_t read = 0;
    const bool complete = ((seq.next_element(out_.*(std::get<I>(fields_).member), e) && (++read, true)) && ...);
    if (!complete) {
      if (e) return e;
      return error::make(error_code::end_of_stream, "expected " + std::to_string(field_count) +
                                                        " fields, found " + std::to_string(read));
    }
    return seq.finish();
  }

  T& out_;
  std::string_view type_name_;
  std::tuple<Fields...> fields_;
  std::array<std::string_view, field_count> names_;
};

template <class T, class... Fields>
record_visitor<T, Fields...> make_record_visitor(T& out, std::string_view type_name, const Fields&... fields) {
  return record_visitor<T, Fields...>(out, type_name, fields...);
}

template <class Source, class T, class... Fields>
error decode_record(Source& src, T& out, std::string_view type_name, const Fields&... fields) {
  record_visitor<T, Fields...> v(out, type_name, fields...);
  return src.visit(v);
}

template <class E>
struct enum_label {
  std::string_view name;
  E enumerator;
};

// Unit-only enums, encoded as `{"Label": null}`.
template <class E, std::size_t N>
class label_visitor : public visitor_base<label_visitor<E, N>> {
public:
  label_visitor(E& out, std::string_view type_name, const enum_label<E> (&labels)[N])
      : out_(out), type_name_(type_name), labels_(labels) {
    for (std::size_t i = 0; i < N; ++i) names_[i] = labels[i].name;
  }

  std::string expecting() const { return "enum " + std::string(type_name_); }

  name_list variants() const noexcept { return name_list(names_.data(), names_.size()); }

  error visit_enum(union_cursor& u) {
    std::string name;
    if (error e = u.variant_name(name)) return e;
    for (std::size_t i = 0; i < N; ++i) {
      if (labels_[i].name != name) continue;
      if (error e = u.unit_payload()) return e;
      out_ = labels_[i].enumerator;
      return {};
    }
    return u.unknown_variant(name);
  }

private:
  E& out_;
  std::string_view type_name_;
  const enum_label<E>* labels_;
  std::array<std::string_view, N> names_{};
};

template <class Source, class E, std::size_t N>
error decode_labels(Source& src, E& out, std::string_view type_name, const enum_label<E> (&labels)[N]) {
  label_visitor<E, N> v(out, type_name, labels);
  return src.visit_enum(type_name, v.variants(), v);
}

} // namespace docbridge

#define DOCBRIDGE_FIELD(Type, member) ::docbridge::field(#member, &Type::member)

#define DOCBRIDGE_RECORD(Type, ...)                                   \
  namespace docbridge {                                               \
  template <>                                                         \
  struct decoder<Type> {                                              \
    template <class Source>                                           \
    static error decode(Source& src, Type& out) {                     \
      return decode_record(src, out, #Type, __VA_ARGS__);             \
    }                                                                 \
  };                                                                  \
  }
