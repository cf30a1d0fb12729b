#include "test_common.hpp"

#include <limits>
#include <string>

using namespace rdjson;

namespace {

value first_element(std::string_view json) {
  auto r = parse(json);
  if (r.err) ::rdjson_test::fail("!r.err", __FILE__, __LINE__, rdjson::format_error(r.err).c_str());
  return r.doc.as_array().at(0);
}

} // namespace

static void test_integers() {
  {
    const value v = first_element("[0]");
    RDJSON_CHECK(v.is_int());
    RDJSON_CHECK(v.as_int() == 0);
  }
  {
    const value v = first_element("[-0]");
    RDJSON_CHECK(v.is_int());
    RDJSON_CHECK(v.as_int() == 0);
  }
  {
    const value v = first_element("[-42]");
    RDJSON_CHECK(v.is_int());
    RDJSON_CHECK(v.as_int() == -42);
  }
  {
    // Leading zeros are read as plain decimal.
    const value v = first_element("[007]");
    RDJSON_CHECK(v.is_int());
    RDJSON_CHECK(v.as_int() == 7);
  }
  {
    const value v = first_element("[9223372036854775807]");
    RDJSON_CHECK(v.is_int());
    RDJSON_CHECK(v.as_int() == (std::numeric_limits<std::int64_t>::max)());
  }
  {
    const value v = first_element("[-9223372036854775808]");
    RDJSON_CHECK(v.is_int());
    RDJSON_CHECK(v.as_int() == (std::numeric_limits<std::int64_t>::min)());
  }
  {
    // as_double widens integers.
    const value v = first_element("[12]");
    RDJSON_CHECK(v.is_number());
    RDJSON_CHECK(v.as_double() == 12.0);
  }
}

static void test_floats() {
  struct float_case {
    const char* json;
    double expected;
  };
  const float_case cases[] = {
      {"[1.5]", 1.5},
      {"[0.0]", 0.0},
      {"[-3.25]", -3.25},
      {"[10.000]", 10.0},
      {"[3.141592653589793]", 3.141592653589793},
      {"[2.]", 2.0},
      {"[-.5]", -0.5},
      {"[0.1]", 0.1},
  };
  for (const auto& c : cases) {
    const value v = first_element(c.json);
    RDJSON_CHECK(v.is_float());
    RDJSON_CHECK(!v.is_int());
    RDJSON_CHECK(v.as_double() == c.expected);
  }

  // A dot always makes a float, even for a whole number.
  const value whole = first_element("[4.0]");
  RDJSON_CHECK(whole.is_float());
  RDJSON_CHECK(whole.as_double() == 4.0);
}

static void test_long_float_lexemes() {
  {
    // Longer than any fixed conversion buffer.
    const std::string json = "[0." + std::string(150, '0') + "1]";
    const value v = first_element(json);
    RDJSON_CHECK(v.is_float());
    RDJSON_CHECK(v.as_double() == 1e-151);
  }
  {
    const std::string json = "[-1" + std::string(200, '0') + ".25]";
    const value v = first_element(json);
    RDJSON_CHECK(v.is_float());
    RDJSON_CHECK(v.as_double() == -1e200);
  }
  {
    // Out of double range.
    auto r = parse("[1" + std::string(400, '0') + ".0]");
    RDJSON_CHECK_ERR(r.err, error_code::invalid_number);
  }
}

static void test_number_ends_at_first_other_byte() {
  const document doc = RDJSON_PARSE_OK("[12,3.5]");
  RDJSON_CHECK(doc.as_array().size() == 2);
  RDJSON_CHECK(doc.as_array()[0].as_int() == 12);
  RDJSON_CHECK(doc.as_array()[1].as_double() == 3.5);

  const document obj = RDJSON_PARSE_OK(R"({"n":-8})");
  RDJSON_CHECK(obj.find("n")->as_int() == -8);
}

static void test_invalid_numbers() {
  const char* bad[] = {
      "[1.2.3]",
      "[-]",
      "[--1]",
      "[-.]",
      "[1..]",
      "[9223372036854775808]",
      "[-9223372036854775809]",
      "[99999999999999999999999]",
  };
  for (const char* s : bad) {
    auto r = parse(s);
    RDJSON_CHECK_ERR(r.err, error_code::invalid_number);
    RDJSON_CHECK(is_value_error(r.err.code));
    RDJSON_CHECK(r.err.offset == 1);
  }
}

static void test_unsupported_number_syntax() {
  {
    // Exponents are not part of the number grammar: 'e' ends the lexeme and
    // is then rejected as a value of its own.
    auto r = parse("[1e5]");
    RDJSON_CHECK_ERR(r.err, error_code::invalid_value);
    RDJSON_CHECK(r.err.offset == 2);
  }
  {
    auto r = parse("[+1]");
    RDJSON_CHECK_ERR(r.err, error_code::invalid_value);
    RDJSON_CHECK(r.err.offset == 1);
  }
  {
    auto r = parse("[.5]");
    RDJSON_CHECK_ERR(r.err, error_code::invalid_value);
  }
}

void test_numbers() {
  test_integers();
  test_floats();
  test_long_float_lexemes();
  test_number_ends_at_first_other_byte();
  test_invalid_numbers();
  test_unsupported_number_syntax();
}
