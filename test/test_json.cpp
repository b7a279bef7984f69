#include "test_common.hpp"

#include <cstring>
#include <limits>
#include <string>

using namespace docbridge;

static void test_integer_widths() {
  {
    auto r = parse("2147483647");
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.is_int32());
  }
  {
    auto r = parse("-2147483648");
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.is_int32());
    DOCBRIDGE_CHECK(r.val.as_int32() == (std::numeric_limits<std::int32_t>::min)());
  }
  {
    auto r = parse("2147483648");
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.is_int64());
    DOCBRIDGE_CHECK(r.val.as_int64() == 2147483648LL);
  }
  {
    auto r = parse("-9223372036854775808");
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.is_int64());
    DOCBRIDGE_CHECK(r.val.as_int64() == (std::numeric_limits<std::int64_t>::min)());
  }
  {
    // One above int64 max falls back to double.
    auto r = parse("9223372036854775808");
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.is_double());
  }
  {
    auto r = parse("-0");
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.is_int32());
    DOCBRIDGE_CHECK(dump(r.val) == "0");
  }
}

static void test_fractions_are_doubles() {
  const char* cases[] = {"1.25", "0.0", "1e10", "1E+10", "-3.14159e-2"};
  for (const char* token : cases) {
    auto r = parse(token);
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.is_double());
  }
  auto r = parse("2.0");
  DOCBRIDGE_CHECK(dump(r.val) == "2.0");
  DOCBRIDGE_CHECK(parse(dump(r.val)).val.is_double());
}

static void test_invalid_numbers() {
  const char* bad[] = {"", "-", "+1", "00", "01", "-01", "1.", ".1", "1e", "1e+", "--1", "0x10", "NaN", "Infinity"};
  for (const char* s : bad) {
    auto r = parse(s);
    DOCBRIDGE_CHECK(r.err);
  }
}

static void test_strings_and_escapes() {
  {
    auto r = parse("\"\\\"\\\\\\/\\b\\f\\n\\r\\t\"");
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.as_string() == "\"\\/\b\f\n\r\t");
  }
  {
    auto r = parse("\"\\u00e9\\uD83D\\uDE03\"");
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.as_string() == "\xC3\xA9\xF0\x9F\x98\x83");
  }
  {
    auto r = parse("\"\\v\"");
    docbridge_test::check_parse_err(r.err, parse_error_code::invalid_escape);
  }
  {
    auto r = parse("\"\\u12G4\"");
    docbridge_test::check_parse_err(r.err, parse_error_code::invalid_unicode_escape);
  }
  {
    auto r = parse("\"\\uD800\"");
    docbridge_test::check_parse_err(r.err, parse_error_code::invalid_utf16_surrogate);
  }
  {
    auto r = parse("\"a\n\"");
    docbridge_test::check_parse_err(r.err, parse_error_code::invalid_string);
  }
  {
    value v(std::string("x\n\"y\\z\x01"));
    auto r = parse(dump(v));
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val == v);
  }
}

static void test_structure_errors() {
  {
    auto r = parse("{\"a\":1,}");
    docbridge_test::check_parse_err(r.err, parse_error_code::expected_key_string);
  }
  {
    auto r = parse("[1 2]");
    docbridge_test::check_parse_err(r.err, parse_error_code::expected_comma_or_end);
  }
  {
    auto r = parse("\"unterminated");
    docbridge_test::check_parse_err(r.err, parse_error_code::unexpected_eof);
  }
  {
    auto r = parse(R"({"a" 1})");
    docbridge_test::check_parse_err(r.err, parse_error_code::expected_colon);
  }
  {
    auto r = parse("[1,]");
    docbridge_test::check_parse_err(r.err, parse_error_code::invalid_value);
  }
  {
    auto r = parse("nullx");
    docbridge_test::check_parse_err(r.err, parse_error_code::trailing_characters);
  }
  {
    parse_options opt;
    opt.require_eof = false;
    auto r = parse("true 123", opt);
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.as_bool());
  }
}

static void test_error_line_column_tracking() {
  const char* json = "{\n  \"a\": 1,\n  \"b\": 01\n}";
  auto r = parse(json);
  docbridge_test::check_parse_err(r.err, parse_error_code::invalid_number);
  DOCBRIDGE_CHECK(r.err.offset < std::strlen(json));
  DOCBRIDGE_CHECK(r.err.line == 3);
  DOCBRIDGE_CHECK(r.err.column == 8);
  DOCBRIDGE_EXPECT_THROW(parse_or_throw(json));
}

static void test_max_depth_option() {
  parse_options opt;
  opt.max_depth = 2;
  DOCBRIDGE_CHECK(!parse("[[0]]", opt).err);
  DOCBRIDGE_CHECK(!parse("[{}]", opt).err);
  docbridge_test::check_parse_err(parse("[[[0]]]", opt).err, parse_error_code::nesting_too_deep);
  docbridge_test::check_parse_err(parse("[[[]]]", opt).err, parse_error_code::nesting_too_deep);
}

static void test_extended_forms() {
  {
    auto r = parse(R"({"_id":{"$oid":"507f1f77bcf86cd799439011"},"at":{"$date":{"$numberLong":1500000000000}}})");
    DOCBRIDGE_CHECK(!r.err);
    const value* id = r.val.find("_id");
    DOCBRIDGE_CHECK(id && id->type() == value::kind::object_id);
    DOCBRIDGE_CHECK(id->as_object_id().to_hex() == "507f1f77bcf86cd799439011");
    const value* at = r.val.find("at");
    DOCBRIDGE_CHECK(at && at->type() == value::kind::date_time);
    DOCBRIDGE_CHECK(at->as_date_time().millis == 1500000000000);
  }
  {
    auto r = parse(R"({"type":0,"$binary":"00ff"})");
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.type() == value::kind::binary);
    DOCBRIDGE_CHECK(r.val.as_binary().bytes.size() == 2);
    DOCBRIDGE_CHECK(r.val.as_binary().bytes[1] == 0xff);
  }
  {
    parse_options opt;
    opt.extended = false;
    auto r = parse(R"({"$oid":"507f1f77bcf86cd799439011"})", opt);
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.is_document());
  }
  {
    const char* text = R"j({"re":{"$regex":"^a","$options":"i"},"ts":{"$timestamp":{"t":5,"i":1}},"js":{"$code":"f()"}})j";
    auto r = parse(text);
    DOCBRIDGE_CHECK(!r.err);
    DOCBRIDGE_CHECK(r.val.find("re")->type() == value::kind::regex);
    DOCBRIDGE_CHECK(r.val.find("ts")->type() == value::kind::timestamp);
    DOCBRIDGE_CHECK(r.val.find("js")->type() == value::kind::javascript_code);
    DOCBRIDGE_CHECK(dump(r.val) == text);
  }
}

static void test_dump_order_and_nan() {
  const char* json = R"({"k":"v","n":42,"a":[true,false,null,3.5],"o":{}})";
  auto r = parse(json);
  DOCBRIDGE_CHECK(!r.err);
  DOCBRIDGE_CHECK(dump(r.val) == json);
  DOCBRIDGE_EXPECT_THROW(dump(value(std::numeric_limits<double>::quiet_NaN())));
  DOCBRIDGE_EXPECT_THROW(dump(value(std::numeric_limits<double>::infinity())));
}

void test_json() {
  test_integer_widths();
  test_fractions_are_doubles();
  test_invalid_numbers();
  test_strings_and_escapes();
  test_structure_errors();
  test_error_line_column_tracking();
  test_max_depth_option();
  test_extended_forms();
  test_dump_order_and_nan();
}
