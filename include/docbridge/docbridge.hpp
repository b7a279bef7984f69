#pragma once

// docbridge: type-directed decoding of BSON-style value trees.
//
//   auto r = docbridge::decode<std::vector<int>>(docbridge::parse_or_throw("[1,2,3]"));
//   if (r.err) std::cerr << docbridge::describe(r.err) << "\n";

#include <docbridge/error.hpp>
#include <docbridge/value.hpp>
#include <docbridge/decoder.hpp>
#include <docbridge/decoders.hpp>
#include <docbridge/record.hpp>
#include <docbridge/json.hpp>
