#include "test_common.hpp"

#include <string_view>

using rdjson::detail::scanner;
using rdjson::detail::token;

static void test_advance_and_peek() {
  scanner sc;
  sc.src = "ab";
  RDJSON_CHECK(sc.peek() == 'a');
  RDJSON_CHECK(sc.advance() == 'a');
  RDJSON_CHECK(sc.peek() == 'b');
  RDJSON_CHECK(sc.advance() == 'b');
  RDJSON_CHECK(sc.at_end());
  // End-of-input sentinel.
  RDJSON_CHECK(sc.peek() == '\0');
}

static void test_advance_past_end_is_inert() {
  scanner sc;
  sc.src = "x\n";
  sc.advance();
  sc.advance();
  RDJSON_CHECK(sc.at_end());
  RDJSON_CHECK(sc.line == 2);

  RDJSON_CHECK(sc.advance() == '\0');
  RDJSON_CHECK(sc.advance() == '\0');
  RDJSON_CHECK(sc.current == 2);
  RDJSON_CHECK(sc.line == 2);

  scanner empty;
  RDJSON_CHECK(empty.advance() == '\0');
  RDJSON_CHECK(empty.current == 0);
}

static void test_match_char_leaves_cursor_on_mismatch() {
  scanner sc;
  sc.src = ":x";
  RDJSON_CHECK(!sc.match_char(','));
  RDJSON_CHECK(sc.current == 0);
  RDJSON_CHECK(sc.match_char(':'));
  RDJSON_CHECK(sc.current == 1);
  RDJSON_CHECK(!sc.match_char(':'));
  RDJSON_CHECK(sc.current == 1);

  sc.current = 2;
  RDJSON_CHECK(!sc.match_char('x'));
}

static void test_match_close_swallows_glued_comma() {
  {
    scanner sc;
    sc.src = "],1";
    RDJSON_CHECK(sc.match_close(']'));
    RDJSON_CHECK(sc.current == 2);
  }
  {
    // Only a comma directly after the bracket is taken.
    scanner sc;
    sc.src = "] ,";
    RDJSON_CHECK(sc.match_close(']'));
    RDJSON_CHECK(sc.current == 1);
  }
  {
    scanner sc;
    sc.src = "}";
    RDJSON_CHECK(!sc.match_close(']'));
    RDJSON_CHECK(sc.current == 0);
    RDJSON_CHECK(sc.match_close('}'));
    RDJSON_CHECK(sc.at_end());
  }
}

static void test_skip_whitespace_counts_lines() {
  scanner sc;
  sc.src = " \t\r\n\n  x\n";
  sc.skip_whitespace();
  RDJSON_CHECK(sc.peek() == 'x');
  RDJSON_CHECK(sc.current == 7);
  RDJSON_CHECK(sc.line == 3);

  sc.advance();
  sc.skip_whitespace();
  RDJSON_CHECK(sc.at_end());
  RDJSON_CHECK(sc.line == 4);

  // Stops cleanly at end of input.
  sc.skip_whitespace();
  RDJSON_CHECK(sc.at_end());
}

static void test_token_spans_do_not_copy() {
  const std::string_view src = "\"hello\" 12.5";
  scanner sc;
  sc.src = src;

  sc.advance();
  sc.mark_start(sc.current);
  while (sc.peek() != '"') sc.advance();
  const token t = sc.make_token();
  RDJSON_CHECK(t.start == 1);
  RDJSON_CHECK(t.length == 5);

  const std::string_view lex = sc.lexeme(t);
  RDJSON_CHECK(lex == "hello");
  RDJSON_CHECK(lex.data() == src.data() + 1);

  sc.advance();
  sc.skip_whitespace();
  sc.mark_start(sc.current);
  while (!sc.at_end()) sc.advance();
  RDJSON_CHECK(sc.lexeme(sc.make_token()) == "12.5");
}

static void test_column_at() {
  const std::string_view s = "ab\ncd\n";
  RDJSON_CHECK(rdjson::detail::column_at(s, 0) == 1);
  RDJSON_CHECK(rdjson::detail::column_at(s, 1) == 2);
  RDJSON_CHECK(rdjson::detail::column_at(s, 2) == 3);
  RDJSON_CHECK(rdjson::detail::column_at(s, 3) == 1);
  RDJSON_CHECK(rdjson::detail::column_at(s, 4) == 2);
  RDJSON_CHECK(rdjson::detail::column_at(s, 6) == 1);

  std::size_t line = 0;
  std::size_t col = 0;
  rdjson::detail::update_line_col(s, 4, line, col);
  RDJSON_CHECK(line == 2);
  RDJSON_CHECK(col == 2);
}

void test_scanner() {
  test_advance_and_peek();
  test_advance_past_end_is_inert();
  test_match_char_leaves_cursor_on_mismatch();
  test_match_close_swallows_glued_comma();
  test_skip_whitespace_counts_lines();
  test_token_spans_do_not_copy();
  test_column_at();
}
