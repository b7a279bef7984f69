#include <docbridge/docbridge.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

struct order_line {
  std::int64_t sku{0};
  std::int32_t qty{0};
  double price{0.0};
};

struct order {
  docbridge::object_id id{};
  std::string customer{};
  bool paid{false};
  std::optional<std::string> note{};
  std::vector<order_line> lines{};
};

DOCBRIDGE_RECORD(order_line, DOCBRIDGE_FIELD(order_line, sku), DOCBRIDGE_FIELD(order_line, qty),
                 DOCBRIDGE_FIELD(order_line, price))
DOCBRIDGE_RECORD(order, DOCBRIDGE_FIELD(order, id), DOCBRIDGE_FIELD(order, customer), DOCBRIDGE_FIELD(order, paid),
                 DOCBRIDGE_FIELD(order, note), DOCBRIDGE_FIELD(order, lines))

namespace {

using clock_type = std::chrono::high_resolution_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

docbridge::value make_orders(std::size_t n_orders, std::size_t name_len) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> ch('a', 'z');

  docbridge::value::array orders;
  orders.reserve(n_orders);
  for (std::size_t i = 0; i < n_orders; ++i) {
    docbridge::object_id::bytes_type raw{};
    for (auto& b : raw) b = static_cast<std::uint8_t>(rng());

    std::string name;
    for (std::size_t k = 0; k < name_len; ++k) name.push_back(static_cast<char>(ch(rng)));

    docbridge::value::array lines;
    for (std::size_t l = 0; l < 1 + (i % 4); ++l) {
      docbridge::document line;
      line.emplace_back("sku", docbridge::value(static_cast<std::int64_t>(rng() >> 1)));
      line.emplace_back("qty", docbridge::value(static_cast<std::int32_t>(1 + l)));
      line.emplace_back("price", docbridge::value(3.25 * static_cast<double>(l + 1)));
      lines.emplace_back(std::move(line));
    }

    docbridge::document d;
    d.emplace_back("id", docbridge::value(docbridge::object_id(raw)));
    d.emplace_back("customer", docbridge::value(std::move(name)));
    d.emplace_back("paid", docbridge::value(i % 2 == 0));
    if (i % 8 == 0) d.emplace_back("note", docbridge::value("rush"));
    d.emplace_back("lines", docbridge::value(std::move(lines)));
    orders.emplace_back(std::move(d));
  }
  return docbridge::value(std::move(orders));
}

struct bench_result {
  double seconds{0.0};
  std::size_t items{0};
};

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<double> secs;
  secs.reserve(runs);
  std::size_t items = 0;
  for (std::size_t r = 0; r < runs; ++r) {
    const auto br = fn();
    secs.push_back(br.seconds);
    items = br.items;
  }
  std::nth_element(secs.begin(), secs.begin() + (secs.size() / 2), secs.end());
  return {secs[secs.size() / 2], items};
}

// The tree is copied outside the timed region; decoding consumes its input.
bench_result bench_decode_records(const docbridge::value& tree, std::size_t n_orders, std::size_t iters) {
  double sec = 0.0;
  for (std::size_t i = 0; i < iters; ++i) {
    docbridge::value input = tree;
    const auto t0 = clock_type::now();
    auto r = docbridge::decode<std::vector<order>>(std::move(input));
    const auto t1 = clock_type::now();
    if (r.err) {
      std::cerr << "decode failed: " << docbridge::describe(r.err) << "\n";
      std::exit(1);
    }
    do_not_optimize(r.val.size());
    sec += std::chrono::duration<double>(t1 - t0).count();
  }
  return {sec, n_orders * iters};
}

bench_result bench_decode_identity(const docbridge::value& tree, std::size_t n_orders, std::size_t iters) {
  double sec = 0.0;
  for (std::size_t i = 0; i < iters; ++i) {
    docbridge::value input = tree;
    const auto t0 = clock_type::now();
    auto r = docbridge::decode<docbridge::value>(std::move(input));
    const auto t1 = clock_type::now();
    do_not_optimize(r.err.code);
    sec += std::chrono::duration<double>(t1 - t0).count();
  }
  return {sec, n_orders * iters};
}

bench_result bench_parse_and_decode(std::string_view json, std::size_t n_orders, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto pr = docbridge::parse(json);
    auto r = docbridge::decode<std::vector<order>>(std::move(pr.val));
    do_not_optimize(r.err.code);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), n_orders * iters};
}

void print_rate(const char* name, const bench_result& r) {
  const double per_sec = (r.seconds > 0.0) ? (static_cast<double>(r.items) / r.seconds) : 0.0;
  std::cout << name << ": " << per_sec << " records/s (" << r.seconds << " s)" << "\n";
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_orders = 2000;
  std::size_t name_len = 16;
  std::size_t iters = 50;
  std::size_t runs = 5;

  if (argc >= 2) n_orders = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const docbridge::value tree = make_orders(n_orders, name_len);
  const std::string json = docbridge::dump(tree);
  std::cout << "records: " << n_orders << ", json bytes: " << json.size() << "\n";

  // Warm-up
  {
    auto r = docbridge::decode<std::vector<order>>(tree);
    if (r.err) {
      std::cerr << "decode failed: " << docbridge::describe(r.err) << "\n";
      return 1;
    }
    do_not_optimize(r.val.size());
  }

  print_rate("decode(records)", run_median(runs, [&] { return bench_decode_records(tree, n_orders, iters); }));
  print_rate("decode(value)", run_median(runs, [&] { return bench_decode_identity(tree, n_orders, iters); }));
  print_rate("parse+decode(records)", run_median(runs, [&] { return bench_parse_and_decode(json, n_orders, iters); }));

  return 0;
}
