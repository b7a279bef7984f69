#pragma once

// docbridge: the shape-directed reconstruction protocol.
//
// A target type opts in by specialising `decoder<T>` with
//
//   template <class Source> static error decode(Source& src, T& out);
//
// and issuing one shape request against the source: `visit` (anything, self-describing),
// `visit_unit`, `visit_option`, `visit_newtype` or `visit_enum`. The source answers by calling
// back into a visitor, handing it scalars or a sub-cursor (seq_cursor, map_cursor, union_cursor)
// from which the visitor pulls nested values. Every nested value is decoded through a fresh
// value_cursor, so recursion depth equals tree depth and is bounded by decode_options::max_depth.

#include <docbridge/error.hpp>
#include <docbridge/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace docbridge {

struct decode_options {
  std::size_t max_depth{256};
};

// Outcome of map_cursor::next_key. `end` covers both exhaustion and the unknown-field stop.
enum class key_state { key, end, fatal };

// Non-owning view of a names array (variant or field names); the array must outlive it.
class name_list {
public:
  name_list() noexcept = default;
  template <std::size_t N>
  name_list(const std::string_view (&names)[N]) noexcept : first_(names), count_(N) {}
  name_list(const std::string_view* first, std::size_t count) noexcept : first_(first), count_(count) {}

  const std::string_view* begin() const noexcept { return first_; }
  const std::string_view* end() const noexcept { return first_ + count_; }
  std::size_t size() const noexcept { return count_; }
  bool empty() const noexcept { return count_ == 0; }

  // Index of `name`, or size() when absent.
  std::size_t index_of(std::string_view name) const noexcept {
    for (std::size_t i = 0; i < count_; ++i) {
      if (first_[i] == name) return i;
    }
    return count_;
  }

private:
  const std::string_view* first_{nullptr};
  std::size_t count_{0};
};

template <class T, class Enable = void>
struct decoder;

class value_cursor;
class unit_source;
class seq_cursor;
class map_cursor;
class union_cursor;

// Defaults for every visitor callback: reject with a syntax error naming what was found and
// what the derived visitor expects (`std::string expecting() const`).
template <class Derived>
struct visitor_base {
  error visit_unit() { return invalid("unit"); }
  error visit_none() { return invalid("none"); }
  template <class Source>
  error visit_some(Source& /*src*/) {
    return invalid("optional value");
  }
  error visit_bool(bool /*v*/) { return invalid("boolean"); }
  error visit_i32(std::int32_t /*v*/) { return invalid("int32"); }
  error visit_i64(std::int64_t /*v*/) { return invalid("int64"); }
  error visit_f64(double /*v*/) { return invalid("double"); }
  error visit_string(std::string&& /*v*/) { return invalid("string"); }
  error visit_seq(seq_cursor& /*seq*/) { return invalid("array"); }
  error visit_map(map_cursor& /*map*/) { return invalid("document"); }
  template <class Source>
  error visit_newtype(Source& /*src*/) {
    return invalid("newtype");
  }
  error visit_enum(union_cursor& /*u*/) { return invalid("enum"); }

protected:
  error invalid(const char* got) const {
    std::string msg = "invalid type: ";
    msg += got;
    msg += ", expected ";
    msg += static_cast<const Derived&>(*this).expecting();
    return error::syntax(std::move(msg));
  }
};

namespace detail {

inline error check_depth(std::size_t depth, const decode_options& opt) {
  if (depth < opt.max_depth) return {};
  return error::make(error_code::nesting_too_deep,
                     "maximum nesting depth " + std::to_string(opt.max_depth) + " exceeded");
}

[[noreturn]] inline void reused_after_failure() {
  throw std::logic_error("docbridge: cursor reused after failure");
}

} // namespace detail

// Root source: holds at most one pending value. Reading empties the slot; refilling a full slot
// is a contract violation.
class value_cursor {
public:
  explicit value_cursor(decode_options opt = {}, std::size_t depth = 0) noexcept : opt_(opt), depth_(depth) {}
  explicit value_cursor(value v, decode_options opt = {}, std::size_t depth = 0)
      : pending_(std::move(v)), opt_(opt), depth_(depth) {}

  value_cursor(const value_cursor&) = delete;
  value_cursor& operator=(const value_cursor&) = delete;

  void put(value v) {
    if (pending_) throw std::logic_error("docbridge: pending slot already holds a value");
    pending_ = std::move(v);
  }

  std::optional<value> take() noexcept {
    std::optional<value> v = std::move(pending_);
    pending_.reset();
    return v;
  }

  bool has_pending() const noexcept { return pending_.has_value(); }
  std::size_t depth() const noexcept { return depth_; }
  const decode_options& options() const noexcept { return opt_; }

  template <class V>
  error visit(V& v);

  template <class V>
  error visit_unit(V& v) {
    return visit(v);
  }

  template <class V>
  error visit_option(V& v) {
    if (!pending_) return error::make(error_code::end_of_stream);
    if (pending_->is_null()) {
      pending_.reset();
      return v.visit_none();
    }
    // The same pending value is decoded once more by the inner request.
    return v.visit_some(*this);
  }

  template <class V>
  error visit_newtype(std::string_view /*name*/, V& v) {
    return v.visit_newtype(*this);
  }

  // `variants` is only used for diagnostics.
  template <class V>
  error visit_enum(std::string_view name, name_list variants, V& v);

private:
  std::optional<value> pending_{};
  decode_options opt_;
  std::size_t depth_{0};
};

// Stand-in source for a field that never appeared in a document: offers unit to self-describing
// and unit requests, none to optional requests. A visitor that rejects unit marks a required
// field, reported as end_of_stream.
class unit_source {
public:
  template <class V>
  error visit(V& v) {
    error e = v.visit_unit();
    if (e.code == error_code::syntax) return error::make(error_code::end_of_stream);
    return e;
  }

  template <class V>
  error visit_unit(V& v) {
    return v.visit_unit();
  }

  template <class V>
  error visit_option(V& v) {
    return v.visit_none();
  }

  template <class V>
  error visit_newtype(std::string_view /*name*/, V& v) {
    return v.visit_newtype(*this);
  }

  template <class V>
  error visit_enum(std::string_view /*name*/, name_list /*variants*/, V& /*v*/) {
    return error::make(error_code::end_of_stream);
  }
};

class seq_cursor {
public:
  // `depth` is the depth of the elements.
  seq_cursor(value::array elems, decode_options opt, std::size_t depth)
      : elems_(std::move(elems)), remaining_(elems_.size()), opt_(opt), depth_(depth) {}

  seq_cursor(const seq_cursor&) = delete;
  seq_cursor& operator=(const seq_cursor&) = delete;

  // Decodes the next element into `out`. Returns false at the end of the sequence, or on
  // failure with `e` set.
  template <class T>
  bool next_element(T& out, error& e) {
    if (failed_) detail::reused_after_failure();
    if (remaining_ == 0) return false;
    const std::size_t index = pos_++;
    --remaining_;
    value_cursor elem(std::move(elems_[index]), opt_, depth_);
    e = decoder<T>::decode(elem, out);
    if (e) {
      e.prefix_path(std::to_string(index));
      failed_ = true;
      return false;
    }
    return true;
  }

  // Fails with length_mismatch when elements are left unread.
  error finish() {
    if (failed_) detail::reused_after_failure();
    if (remaining_ == 0) return {};
    failed_ = true;
    return error::length_mismatch(remaining_);
  }

  // Exact number of unread elements.
  std::size_t size_hint() const noexcept { return remaining_; }

  // As a source (tuple payloads): an empty sequence is offered as unit.
  template <class V>
  error visit(V& v) {
    if (remaining_ == 0) return v.visit_unit();
    return v.visit_seq(*this);
  }

private:
  value::array elems_;
  std::size_t pos_{0};
  std::size_t remaining_{0};
  decode_options opt_;
  std::size_t depth_{0};
  bool failed_{false};
};

class map_cursor {
public:
  // `depth` is the depth of the entry values.
  map_cursor(document entries, decode_options opt, std::size_t depth)
      : entries_(std::move(entries)), remaining_(entries_.size()), opt_(opt), depth_(depth) {}

  map_cursor(const map_cursor&) = delete;
  map_cursor& operator=(const map_cursor&) = delete;

  // Decodes the next key into `out` and buffers its value for next_value. A key that `K`
  // reports as an unknown field ends the iteration: the entries after it are never reached.
  template <class K>
  key_state next_key(K& out, error& e) {
    if (failed_) detail::reused_after_failure();
    if (value_) throw std::logic_error("docbridge: next_key called before the previous value was read");
    if (stopped_at_ || remaining_ == 0) return key_state::end;
    auto& entry = entries_[pos_++];
    --remaining_;
    key_ = std::move(entry.first);
    value_ = std::move(entry.second);

    value_cursor kc(value(key_), opt_, depth_);
    error ke = decoder<K>::decode(kc, out);
    if (!ke) return key_state::key;
    value_.reset();
    if (ke.code == error_code::unknown_field) {
      stopped_at_ = key_;
      return key_state::end;
    }
    ke.prefix_path(key_);
    e = std::move(ke);
    failed_ = true;
    return key_state::fatal;
  }

  // Decodes the value buffered by the preceding successful next_key.
  template <class T>
  error next_value(T& out) {
    if (failed_) detail::reused_after_failure();
    if (!value_) throw std::logic_error("docbridge: next_value called without a preceding key");
    value_cursor vc(std::move(*value_), opt_, depth_);
    value_.reset();
    error e = decoder<T>::decode(vc, out);
    if (e) {
      e.prefix_path(key_);
      failed_ = true;
    }
    return e;
  }

  // Trailing entries are ignored.
  error finish() {
    if (failed_) detail::reused_after_failure();
    return {};
  }

  // Fills a declared field that no key produced, from a unit_source.
  template <class V>
  error missing_field(std::string_view field, V& out) {
    if (failed_) detail::reused_after_failure();
    unit_source src;
    error e = decoder<V>::decode(src, out);
    if (e) {
      e.prefix_path(std::string(field));
      failed_ = true;
    }
    return e;
  }

  std::size_t size_hint() const noexcept { return remaining_; }

  const std::string& last_key() const noexcept { return key_; }

  // The key that ended iteration as an unknown field, if any.
  const std::optional<std::string>& stopped_at() const noexcept { return stopped_at_; }

  // As a source (struct payloads).
  template <class V>
  error visit(V& v) {
    return v.visit_map(*this);
  }

private:
  document entries_;
  std::size_t pos_{0};
  std::size_t remaining_{0};
  std::optional<value> value_{};
  std::string key_{};
  std::optional<std::string> stopped_at_{};
  decode_options opt_;
  std::size_t depth_{0};
  bool failed_{false};
};

// Cursor over the single entry of an enum document: the key is the discriminant, the value the
// payload. Each is consumed at most once.
class union_cursor {
public:
  // `depth` is the depth of the payload value.
  union_cursor(std::string variant, value payload, name_list variants, decode_options opt, std::size_t depth)
      : name_(variant),
        variant_(value(std::move(variant))),
        payload_(std::move(payload)),
        variants_(variants),
        opt_(opt),
        depth_(depth) {}

  union_cursor(const union_cursor&) = delete;
  union_cursor& operator=(const union_cursor&) = delete;

  template <class K>
  error variant_name(K& out) {
    value_cursor c(take(variant_, "discriminant"), opt_, depth_);
    return track(decoder<K>::decode(c, out));
  }

  error unit_payload();

  template <class T>
  error newtype_payload(T& out) {
    value_cursor c(take(payload_, "payload"), opt_, depth_);
    return track(decoder<T>::decode(c, out));
  }

  // Payload must be an array; it is offered to `v` positionally.
  template <class V>
  error tuple_payload(std::size_t /*arity*/, V& v) {
    value p = take(payload_, "payload");
    if (!p.is_array()) return track(error::make(error_code::expected_tuple, "expected a tuple"));
    if (error e = detail::check_depth(depth_, opt_)) return track(std::move(e));
    seq_cursor seq(std::move(p.as_array()), opt_, depth_ + 1);
    return track(seq.visit(v));
  }

  // Payload must be a document; it is offered to `v` by name. `fields` is advisory.
  template <class V>
  error struct_payload(name_list /*fields*/, V& v) {
    value p = take(payload_, "payload");
    if (!p.is_document()) return track(error::make(error_code::expected_struct, "expected a struct"));
    if (error e = detail::check_depth(depth_, opt_)) return track(std::move(e));
    map_cursor map(std::move(p.as_document()), opt_, depth_ + 1);
    return track(map.visit(v));
  }

  // Raw discriminant, available for diagnostics even after variant_name consumed it.
  const std::string& name() const noexcept { return name_; }
  name_list variants() const noexcept { return variants_; }

  // Error for a discriminant the target does not know; lists the advisory variant names.
  error unknown_variant(std::string_view got) {
    std::string msg = "unknown variant `";
    msg += got;
    msg += '`';
    if (!variants_.empty()) {
      msg += ", expected one of ";
      bool first = true;
      for (std::string_view v : variants_) {
        if (!first) msg += ", ";
        first = false;
        msg += '`';
        msg += v;
        msg += '`';
      }
    }
    return track(error::syntax(std::move(msg)));
  }

private:
  value take(std::optional<value>& slot, const char* what) {
    if (failed_) detail::reused_after_failure();
    if (!slot) throw std::logic_error(std::string("docbridge: enum ") + what + " already consumed");
    value v = std::move(*slot);
    slot.reset();
    return v;
  }

  error track(error e) {
    if (e) {
      e.prefix_path(name_);
      failed_ = true;
    }
    return e;
  }

  std::string name_;
  std::optional<value> variant_;
  std::optional<value> payload_;
  name_list variants_;
  decode_options opt_;
  std::size_t depth_{0};
  bool failed_{false};
};

template <class V>
error value_cursor::visit(V& v) {
  std::optional<value> taken = take();
  if (!taken) return error::make(error_code::end_of_stream);
  value& val = *taken;

  switch (val.type()) {
    case value::kind::floating_point:
      return v.visit_f64(val.as_double());
    case value::kind::string:
      return v.visit_string(std::move(val.as_string()));
    case value::kind::array: {
      if (error e = detail::check_depth(depth_, opt_)) return e;
      seq_cursor seq(std::move(val.as_array()), opt_, depth_ + 1);
      return v.visit_seq(seq);
    }
    case value::kind::document: {
      if (error e = detail::check_depth(depth_, opt_)) return e;
      map_cursor map(std::move(val.as_document()), opt_, depth_ + 1);
      return v.visit_map(map);
    }
    case value::kind::boolean:
      return v.visit_bool(val.as_bool());
    case value::kind::null:
      return v.visit_unit();
    case value::kind::int32:
      return v.visit_i32(val.as_int32());
    case value::kind::int64:
      return v.visit_i64(val.as_int64());
    default: {
      // Extended kinds decode generically through their extended representation.
      if (error e = detail::check_depth(depth_, opt_)) return e;
      map_cursor map(val.to_extended_document(), opt_, depth_ + 1);
      return v.visit_map(map);
    }
  }
}

template <class V>
error value_cursor::visit_enum(std::string_view /*name*/, name_list variants, V& v) {
  std::optional<value> taken = take();
  if (!taken) return error::make(error_code::end_of_stream);
  if (!taken->is_document()) {
    return error::make(error_code::expected_enum,
                       std::string("expected an enum, found ") + to_string(taken->type()));
  }
  document& d = taken->as_document();
  // Enums are encoded as documents with a single key:value pair.
  if (d.empty()) return error::make(error_code::expected_variant_name, "expected a variant name");
  if (d.size() != 1) {
    return error::make(error_code::expected_single_key_map,
                       "expected a single-key document, found " + std::to_string(d.size()) + " keys");
  }
  if (error e = detail::check_depth(depth_, opt_)) return e;
  union_cursor u(std::move(d[0].first), std::move(d[0].second), variants, opt_, depth_ + 1);
  return v.visit_enum(u);
}

inline error union_cursor::unit_payload() {
  struct unit_visitor : visitor_base<unit_visitor> {
    std::string expecting() const { return "unit variant"; }
    error visit_unit() { return {}; }
  };
  unit_visitor uv;
  value_cursor c(take(payload_, "payload"), opt_, depth_);
  return track(c.visit_unit(uv));
}

// -----------------------------
// Entry points

template <class T>
struct decode_result {
  T val{};
  error err{};
};

template <class T>
error decode_into(value v, T& out, decode_options opt = {}) {
  value_cursor root(std::move(v), opt);
  return decoder<T>::decode(root, out);
}

template <class T>
decode_result<T> decode(value v, decode_options opt = {}) {
  decode_result<T> r;
  r.err = decode_into(std::move(v), r.val, opt);
  return r;
}

template <class T>
T decode_or_throw(value v, decode_options opt = {}) {
  auto r = decode<T>(std::move(v), opt);
  if (r.err) throw decode_exception(std::move(r.err));
  return std::move(r.val);
}

} // namespace docbridge
