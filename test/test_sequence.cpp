#include "test_common.hpp"

#include <array>
#include <deque>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace docbridge;
using docbridge_test::json;

namespace {

value::array ints(int n) {
  value::array a;
  for (int i = 0; i < n; ++i) a.emplace_back(std::int32_t{i});
  return a;
}

// Reads a fixed number of leading elements, then finishes.
struct prefix_visitor : visitor_base<prefix_visitor> {
  std::size_t take;
  std::vector<int> got{};
  explicit prefix_visitor(std::size_t n) : take(n) {}
  std::string expecting() const { return "a prefix"; }
  error visit_seq(seq_cursor& seq) {
    error e;
    for (std::size_t i = 0; i < take; ++i) {
      int v = 0;
      if (!seq.next_element(v, e)) return e ? e : error::make(error_code::end_of_stream);
      got.push_back(v);
    }
    return seq.finish();
  }
};

} // namespace

static void test_length_invariant() {
  for (int n = 0; n <= 5; ++n) {
    for (int k = 0; k <= n; ++k) {
      seq_cursor seq(ints(n), decode_options{}, 1);
      DOCBRIDGE_CHECK(seq.size_hint() == static_cast<std::size_t>(n));
      error e;
      for (int i = 0; i < k; ++i) {
        int v = -1;
        DOCBRIDGE_CHECK(seq.next_element(v, e));
        DOCBRIDGE_CHECK(v == i);
      }
      DOCBRIDGE_CHECK(seq.size_hint() == static_cast<std::size_t>(n - k));
      error fin = seq.finish();
      if (k == n) {
        DOCBRIDGE_CHECK(!fin);
      } else {
        docbridge_test::check_err(fin, error_code::length_mismatch);
        DOCBRIDGE_CHECK(fin.remaining == static_cast<std::size_t>(n - k));
      }
    }
  }
}

static void test_end_of_sequence() {
  seq_cursor seq(ints(1), decode_options{}, 1);
  error e;
  int v = 0;
  DOCBRIDGE_CHECK(seq.next_element(v, e));
  DOCBRIDGE_CHECK(!seq.next_element(v, e));
  DOCBRIDGE_CHECK(!e);
  DOCBRIDGE_CHECK(!seq.finish());
}

static void test_prefix_visitor_reports_leftovers() {
  prefix_visitor pv(2);
  value_cursor c(json("[7,8,9]"));
  error e = c.visit(pv);
  docbridge_test::check_err(e, error_code::length_mismatch);
  DOCBRIDGE_CHECK(e.remaining == 1);
  DOCBRIDGE_CHECK(pv.got.size() == 2);
  DOCBRIDGE_CHECK(describe(e) == "length_mismatch: 1 element(s) left unread");
}

static void test_vectors_and_deques() {
  {
    auto r = decode<std::vector<int>>(json("[1,2,3]"));
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK((r.val == std::vector<int>{1, 2, 3}));
  }
  {
    auto r = decode<std::vector<std::vector<std::string>>>(json(R"([["a"],[],["b","c"]])"));
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.size() == 3);
    DOCBRIDGE_CHECK(r.val[1].empty());
    DOCBRIDGE_CHECK(r.val[2][1] == "c");
  }
  {
    auto r = decode<std::deque<double>>(json("[1, 2.5]"));
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.size() == 2 && r.val[1] == 2.5);
  }
  {
    auto r = decode<std::vector<int>>(json("[]"));
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.empty());
  }
  {
    // A null in place of a sequence decodes as empty.
    auto r = decode<std::vector<int>>(value(nullptr));
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.empty());
  }
  {
    auto r = decode<std::vector<int>>(json(R"({"a":1})"));
    docbridge_test::check_err(r.err, error_code::syntax);
    DOCBRIDGE_CHECK(r.err.detail == "invalid type: document, expected a sequence");
  }
}

static void test_element_error_path() {
  auto r = decode<std::vector<std::vector<int>>>(json(R"([[1],[2,"x"]])"));
  docbridge_test::check_err(r.err, error_code::syntax);
  DOCBRIDGE_CHECK(r.err.path == "/1/1");
  DOCBRIDGE_CHECK(describe(r.err) == "syntax: invalid type: string, expected int32 at /1/1");
}

static void test_fixed_size_targets() {
  {
    auto r = decode<std::array<int, 3>>(json("[4,5,6]"));
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val[2] == 6);
  }
  {
    auto r = decode<std::pair<std::string, int>>(json(R"(["k", 1])"));
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.first == "k" && r.val.second == 1);
  }
  {
    auto r = decode<std::tuple<int, bool, std::string>>(json(R"([1, true, "s"])"));
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(std::get<1>(r.val));
    DOCBRIDGE_CHECK(std::get<2>(r.val) == "s");
  }
  {
    // Source longer than the target.
    auto r = decode<std::pair<int, int>>(json("[1,2,3,4]"));
    docbridge_test::check_err(r.err, error_code::length_mismatch);
    DOCBRIDGE_CHECK(r.err.remaining == 2);
  }
  {
    // Source shorter than the target.
    auto r = decode<std::tuple<int, int, int>>(json("[1]"));
    docbridge_test::check_err(r.err, error_code::end_of_stream);
    DOCBRIDGE_CHECK(r.err.detail == "expected 3 elements, found 1");
  }
  {
    auto r = decode<std::tuple<>>(json("[]"));
    DOCBRIDGE_CHECK(!r.err);
  }
  {
    auto r = decode<std::array<int, 2>>(value(nullptr));
    docbridge_test::check_err(r.err, error_code::syntax);
  }
}

static void test_failed_cursor_is_poisoned() {
  value::array a;
  a.emplace_back("not an int");
  a.emplace_back(std::int32_t{2});
  seq_cursor seq(std::move(a), decode_options{}, 1);
  error e;
  int v = 0;
  DOCBRIDGE_CHECK(!seq.next_element(v, e));
  docbridge_test::check_err(e, error_code::syntax);
  DOCBRIDGE_CHECK(e.path == "/0");
  DOCBRIDGE_EXPECT_THROW(seq.next_element(v, e));
  DOCBRIDGE_EXPECT_THROW(seq.finish());

  seq_cursor short_seq(ints(3), decode_options{}, 1);
  DOCBRIDGE_CHECK(short_seq.next_element(v, e));
  docbridge_test::check_err(short_seq.finish(), error_code::length_mismatch);
  DOCBRIDGE_EXPECT_THROW(short_seq.finish());
}

void test_sequence() {
  test_length_invariant();
  test_end_of_sequence();
  test_prefix_visitor_reports_leftovers();
  test_vectors_and_deques();
  test_element_error_path();
  test_fixed_size_targets();
  test_failed_cursor_is_poisoned();
}
