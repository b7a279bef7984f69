#include "test_common.hpp"

#include <string>
#include <vector>

using namespace docbridge;

namespace {

struct rng {
  std::uint64_t s{0x9E3779B97F4A7C15ull};
  std::uint64_t next_u64() {
    // xorshift64*
    std::uint64_t x = s;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    s = x;
    return x * 2685821657736338717ull;
  }
  std::uint32_t next_u32() { return static_cast<std::uint32_t>(next_u64() >> 32); }
  std::size_t range(std::size_t n) { return n ? static_cast<std::size_t>(next_u64() % n) : 0u; }
  bool coin() { return (next_u64() & 1ull) != 0; }
};

static std::string random_string(rng& r, std::size_t max_len) {
  const std::size_t len = r.range(max_len + 1);
  std::string out;
  out.reserve(len);
  for (std::size_t i = 0; i < len; ++i) {
    const std::uint32_t pick = r.next_u32() % 16u;
    switch (pick) {
      case 0: out.push_back('\"'); break;
      case 1: out.push_back('\\'); break;
      case 2: out.push_back('\n'); break;
      case 3: out.push_back('$'); break;
      default: {
        char c = static_cast<char>(' ' + (r.next_u32() % 95u));
        out.push_back(c);
        break;
      }
    }
  }
  return out;
}

static value random_value(rng& r, int depth);

static value random_array(rng& r, int depth) {
  value::array a;
  const std::size_t n = r.range(6);
  a.reserve(n);
  for (std::size_t i = 0; i < n; ++i) a.emplace_back(random_value(r, depth - 1));
  return value(std::move(a));
}

static value random_document(rng& r, int depth) {
  document d;
  const std::size_t n = r.range(6);
  d.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    // Fixed prefix keeps random documents from spelling an extended form.
    std::string key = "k" + random_string(r, 8);
    d.emplace_back(std::move(key), random_value(r, depth - 1));
  }
  return value(std::move(d));
}

static value random_extended(rng& r) {
  switch (r.next_u32() % 5u) {
    case 0: {
      object_id::bytes_type b{};
      for (auto& byte : b) byte = static_cast<std::uint8_t>(r.next_u32());
      return value(object_id(b));
    }
    case 1: return value(date_time{static_cast<std::int64_t>(r.next_u64() >> 20) - (std::int64_t{1} << 42)});
    case 2: {
      binary b;
      b.subtype = static_cast<std::uint8_t>(r.range(6));
      b.bytes.resize(r.range(8));
      for (auto& byte : b.bytes) byte = static_cast<std::uint8_t>(r.next_u32());
      return value(std::move(b));
    }
    case 3: return value(regex{random_string(r, 6), "i"});
    default: return value(timestamp{r.next_u32(), r.next_u32()});
  }
}

static value random_scalar(rng& r) {
  switch (r.next_u32() % 6u) {
    case 0: return value(nullptr);
    case 1: return value(r.coin());
    case 2: return value(static_cast<std::int32_t>(r.next_u32()));
    case 3: return value(static_cast<std::int64_t>(r.next_u64() | (std::uint64_t{1} << 62)));
    case 4: {
      const double base = static_cast<double>(static_cast<std::int32_t>(r.next_u32() % 2000000u) - 1000000);
      return value(base / 1000.0 + 0.5);
    }
    default: return value(random_string(r, 20));
  }
}

static value random_value(rng& r, int depth) {
  if (depth <= 0) return random_scalar(r);
  switch (r.next_u32() % 4u) {
    case 0: return random_scalar(r);
    case 1: return random_extended(r);
    case 2: return random_array(r, depth);
    default: return random_document(r, depth);
  }
}

} // namespace

void test_random() {
  rng r;
  // Deterministic pseudo-fuzz: identity decode must rebuild the tree exactly, both directly
  // and after a trip through text.
  for (int iter = 0; iter < 2000; ++iter) {
    const value v = random_value(r, 4);

    auto direct = decode<value>(v);
    DOCBRIDGE_CHECK(!direct.err);
    DOCBRIDGE_CHECK(direct.val == v);

    const std::string s = dump(v);
    auto pr = parse(s);
    DOCBRIDGE_CHECK(!pr.err);
    auto via_text = decode<value>(std::move(pr.val));
    DOCBRIDGE_CHECK(!via_text.err);
    DOCBRIDGE_CHECK(dump(via_text.val) == s);
  }
}
