#pragma once

// rdjson: a small, header-only C++17 JSON reader.
// A recursive-descent scanner builds an object- or array-rooted document;
// the renderer dumps it back as indented text.
// Separators are lenient by default; parse_options::strict enforces RFC 8259 commas.

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace rdjson {

// Config: floating-point parsing backend.
// Override by defining RDJSON_USE_FROM_CHARS_DOUBLE to 0/1 before including this header.
#ifndef RDJSON_USE_FROM_CHARS_DOUBLE
  #define RDJSON_USE_FROM_CHARS_DOUBLE 0
#endif

enum class error_code {
  ok = 0,
  unexpected_eof,
  invalid_root,
  invalid_value,
  invalid_number,
  invalid_literal,
  expected_colon,
  expected_key_string,
  expected_comma_or_end,
  trailing_characters,
  nesting_too_deep
};

struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
};

inline const char* error_message(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::unexpected_eof: return "unexpected end of input";
    case error_code::invalid_root: return "non-object or non-array at top level";
    case error_code::invalid_value: return "unexpected value";
    case error_code::invalid_number: return "invalid number";
    case error_code::invalid_literal: return "invalid literal, expected true or false";
    case error_code::expected_colon: return "expected colon after key";
    case error_code::expected_key_string: return "expected string key";
    case error_code::expected_comma_or_end: return "expected comma or closing bracket";
    case error_code::trailing_characters: return "trailing characters after document";
    case error_code::nesting_too_deep: return "nesting too deep";
  }
  return "unknown error";
}

// Value-level errors come from the value grammar and are escalated by the enclosing container.
// Everything else is raised by the structural productions directly.
inline bool is_value_error(error_code code) noexcept {
  return code == error_code::invalid_value || code == error_code::invalid_number;
}

inline std::string format_error(const error& e) {
  std::string out;
  out += "[line ";
  out += std::to_string(e.line);
  out += ", column ";
  out += std::to_string(e.column);
  out += "] ";
  out += error_message(e.code);
  return out;
}

class parse_error : public std::runtime_error {
public:
  explicit parse_error(const error& e) : std::runtime_error("rdjson: " + format_error(e)), err_(e) {}

  const error& err() const noexcept { return err_; }

private:
  error err_;
};

namespace detail {

inline void update_line_col(std::string_view s, std::size_t pos, std::size_t& line, std::size_t& col) {
  line = 1;
  col = 1;
  for (std::size_t i = 0; i < pos && i < s.size(); ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
}

inline std::size_t column_at(std::string_view s, std::size_t pos) noexcept {
  if (pos > s.size()) pos = s.size();
  const std::size_t nl = s.rfind('\n', pos == 0 ? 0 : pos - 1);
  if (nl == std::string_view::npos || nl >= pos) return pos + 1;
  return pos - nl;
}

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

// A lexeme inside the source: [start, start + length).
struct token {
  std::size_t start{0};
  std::size_t length{0};
};

// Byte cursor over the source. Structural characters are ASCII, so UTF-8
// payload bytes inside strings are carried through untouched.
struct scanner {
  std::string_view src;
  std::size_t start{0};
  std::size_t current{0};
  std::size_t line{1};

  bool at_end() const noexcept { return current >= src.size(); }

  char peek() const noexcept { return at_end() ? '\0' : src[current]; }

  // At end of input the cursor stays put and '\0' is returned; callers
  // check at_end() first and report unexpected_eof themselves.
  char advance() noexcept {
    if (at_end()) return '\0';
    const char c = src[current++];
    if (c == '\n') ++line;
    return c;
  }

  bool match_char(char expected) noexcept {
    if (at_end() || src[current] != expected) return false;
    advance();
    return true;
  }

  // Closing bracket, plus one comma glued to it.
  bool match_close(char close) noexcept {
    if (!match_char(close)) return false;
    if (peek() == ',') advance();
    return true;
  }

  void skip_whitespace() noexcept {
    while (!at_end() && is_ws(src[current])) advance();
  }

  void mark_start(std::size_t at) noexcept { start = at; }

  token make_token() const noexcept { return token{start, current - start}; }

  std::string_view lexeme(token t) const noexcept { return src.substr(t.start, t.length); }
};

inline bool parse_int64(std::string_view lexeme, std::int64_t& out) noexcept {
  const char* first = lexeme.data();
  const char* last = lexeme.data() + lexeme.size();
  const auto r = std::from_chars(first, last, out);
  return r.ec == std::errc{} && r.ptr == last;
}

inline bool parse_double(std::string_view lexeme, double& out) {
  // Backend choice:
  // - strtod: robust everywhere, but needs a NUL-terminated copy.
  // - from_chars: locale-free and allocation-free, but library support varies.
#if defined(RDJSON_USE_FROM_CHARS_DOUBLE) && RDJSON_USE_FROM_CHARS_DOUBLE
  {
    const char* first = lexeme.data();
    const char* last = lexeme.data() + lexeme.size();
    const auto r = std::from_chars(first, last, out, std::chars_format::fixed);
    return r.ec == std::errc{} && r.ptr == last && std::isfinite(out);
  }
#else
  // The lexeme is not NUL-terminated; avoid heap alloc for typical short numbers.
  constexpr std::size_t kStackCap = 128;
  char stack_buf[kStackCap];
  std::string heap_buf;
  const char* cstr = nullptr;
  if (lexeme.size() < kStackCap) {
    if (!lexeme.empty()) std::memcpy(stack_buf, lexeme.data(), lexeme.size());
    stack_buf[lexeme.size()] = '\0';
    cstr = stack_buf;
  } else {
    heap_buf.assign(lexeme.data(), lexeme.size());
    cstr = heap_buf.c_str();
  }
  char* end = nullptr;
  out = std::strtod(cstr, &end);
  return end == cstr + lexeme.size() && std::isfinite(out);
#endif
}

} // namespace detail

class value;
inline bool operator==(const value& a, const value& b);

class value {
public:
  using array = std::vector<value>;
  using object = std::vector<std::pair<std::string, value>>;

  enum class kind { string, integer, floating, boolean, object, array };

  value() : data_(std::string()) {}
  value(bool b) : data_(b) {}
  value(std::string s) : data_(std::move(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(array a) : data_(std::move(a)) {}
  value(object o) : data_(std::move(o)) {}

  static value integer(std::int64_t i) {
    value v;
    v.data_ = i;
    return v;
  }

  static value floating(double d) {
    value v;
    v.data_ = d;
    return v;
  }

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::string;
      case 1: return kind::integer;
      case 2: return kind::floating;
      case 3: return kind::boolean;
      case 4: return kind::object;
      default: return kind::array;
    }
  }

  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_int() const noexcept { return std::holds_alternative<std::int64_t>(data_); }
  bool is_float() const noexcept { return std::holds_alternative<double>(data_); }
  bool is_number() const noexcept { return is_int() || is_float(); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_object() const noexcept { return std::holds_alternative<object>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<array>(data_); }

  bool as_bool() const { return std::get<bool>(data_); }
  std::int64_t as_int() const { return std::get<std::int64_t>(data_); }

  double as_double() const {
    if (is_int()) return static_cast<double>(std::get<std::int64_t>(data_));
    return std::get<double>(data_);
  }

  const std::string& as_string() const { return std::get<std::string>(data_); }
  const array& as_array() const { return std::get<array>(data_); }
  const object& as_object() const { return std::get<object>(data_); }

  std::string& as_string() { return std::get<std::string>(data_); }
  array& as_array() { return std::get<array>(data_); }
  object& as_object() { return std::get<object>(data_); }

  const value* find(std::string_view key) const noexcept {
    if (!is_object()) return nullptr;
    for (const auto& kv : std::get<object>(data_)) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  value* find(std::string_view key) noexcept {
    if (!is_object()) return nullptr;
    for (auto& kv : std::get<object>(data_)) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  // Last write wins; a replaced key keeps its original position.
  void set(std::string key, value v);

  void push_back(value v) { as_array().push_back(std::move(v)); }

  friend bool operator==(const value& a, const value& b);
  friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
  // index: 0 string, 1 integer, 2 floating, 3 boolean, 4 object, 5 array
  std::variant<std::string, std::int64_t, double, bool, object, array> data_;
};

namespace detail {

inline void insert_or_assign(value::object& o, std::string key, value v) {
  for (auto& kv : o) {
    if (kv.first == key) {
      kv.second = std::move(v);
      return;
    }
  }
  o.emplace_back(std::move(key), std::move(v));
}

inline const value* find_member(const value::object& o, std::string_view key) noexcept {
  for (const auto& kv : o) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

// Member order is not significant; keys are unique within an object.
inline bool objects_equal(const value::object& a, const value::object& b) {
  if (a.size() != b.size()) return false;
  for (const auto& kv : a) {
    const value* other = find_member(b, kv.first);
    if (!other || !(kv.second == *other)) return false;
  }
  return true;
}

inline bool arrays_equal(const value::array& a, const value::array& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!(a[i] == b[i])) return false;
  }
  return true;
}

} // namespace detail

inline void value::set(std::string key, value v) {
  detail::insert_or_assign(as_object(), std::move(key), std::move(v));
}

inline bool operator==(const value& a, const value& b) {
  if (a.data_.index() != b.data_.index()) return false;
  switch (a.type()) {
    case value::kind::string: return a.as_string() == b.as_string();
    case value::kind::integer: return a.as_int() == b.as_int();
    case value::kind::floating: return std::get<double>(a.data_) == std::get<double>(b.data_);
    case value::kind::boolean: return a.as_bool() == b.as_bool();
    case value::kind::object: return detail::objects_equal(a.as_object(), b.as_object());
    case value::kind::array: return detail::arrays_equal(a.as_array(), b.as_array());
  }
  return false;
}

// Parse result root: always a container, never a bare scalar.
class document {
public:
  enum class kind { object, array };

  document() = default;
  explicit document(value::object o) : root_(std::move(o)) {}
  explicit document(value::array a) : root_(std::move(a)) {}

  kind type() const noexcept { return root_.index() == 0 ? kind::object : kind::array; }

  bool is_object() const noexcept { return root_.index() == 0; }
  bool is_array() const noexcept { return root_.index() == 1; }

  const value::object& as_object() const { return std::get<value::object>(root_); }
  const value::array& as_array() const { return std::get<value::array>(root_); }
  value::object& as_object() { return std::get<value::object>(root_); }
  value::array& as_array() { return std::get<value::array>(root_); }

  std::size_t size() const noexcept {
    return is_object() ? std::get<value::object>(root_).size() : std::get<value::array>(root_).size();
  }

  bool empty() const noexcept { return size() == 0; }

  const value* find(std::string_view key) const noexcept {
    if (!is_object()) return nullptr;
    return detail::find_member(std::get<value::object>(root_), key);
  }

  // Copies the root into a container value.
  value to_value() const {
    if (is_object()) return value(as_object());
    return value(as_array());
  }

  friend bool operator==(const document& a, const document& b) {
    if (a.type() != b.type()) return false;
    if (a.is_object()) return detail::objects_equal(a.as_object(), b.as_object());
    return detail::arrays_equal(a.as_array(), b.as_array());
  }
  friend bool operator!=(const document& a, const document& b) { return !(a == b); }

private:
  std::variant<value::object, value::array> root_;
};

struct parse_options {
  // RFC 8259 separators: commas required between members, no trailing comma,
  // nothing but a quoted key may start an object member.
  bool strict{false};
  std::size_t max_depth{256};
  bool require_eof{false};
};

struct parse_result {
  document doc;
  error err;
};

struct parser {
  detail::scanner sc;
  parse_options opt;

  parse_result run() {
    parse_result r;
    sc.skip_whitespace();
    if (sc.at_end()) {
      set_error(r.err, error_code::unexpected_eof);
      return r;
    }

    const std::size_t root_pos = sc.current;
    const char c = sc.advance();
    document doc;
    if (c == '{') {
      value::object o = parse_object(1, root_pos, r.err);
      if (r.err) return r;
      doc = document(std::move(o));
    } else if (c == '[') {
      value::array a = parse_array(1, root_pos, r.err);
      if (r.err) return r;
      doc = document(std::move(a));
    } else {
      set_error(r.err, error_code::invalid_root, root_pos);
      return r;
    }

    if (opt.require_eof) {
      sc.skip_whitespace();
      if (!sc.at_end()) {
        set_error(r.err, error_code::trailing_characters);
        return r;
      }
    }
    r.doc = std::move(doc);
    return r;
  }

  void set_error(error& e, error_code code, std::size_t at = std::numeric_limits<std::size_t>::max()) {
    if (e) return;
    e.code = code;
    if (at == std::numeric_limits<std::size_t>::max()) {
      e.offset = sc.current;
      e.line = sc.line;
      e.column = detail::column_at(sc.src, e.offset);
      return;
    }
    e.offset = at;
    detail::update_line_col(sc.src, at, e.line, e.column);
  }

  // The lead character has not been consumed yet.
  value parse_value(std::size_t depth, error& e) {
    if (sc.at_end()) {
      set_error(e, error_code::unexpected_eof);
      return {};
    }

    const std::size_t lead_pos = sc.current;
    const char c = sc.advance();
    switch (c) {
      case '"': {
        std::string out;
        if (!parse_string(out, lead_pos, e)) return {};
        return value(std::move(out));
      }
      case '{': {
        value::object o = parse_object(depth + 1, lead_pos, e);
        if (e) return {};
        return value(std::move(o));
      }
      case '[': {
        value::array a = parse_array(depth + 1, lead_pos, e);
        if (e) return {};
        return value(std::move(a));
      }
      case 't': return parse_literal("rue", 3, lead_pos, value(true), e);
      case 'f': return parse_literal("alse", 4, lead_pos, value(false), e);
      default: {
        if (c == '-' || detail::is_digit(c)) return parse_number(lead_pos, e);
        set_error(e, error_code::invalid_value, lead_pos);
        return {};
      }
    }
  }

  value parse_literal(const char* rest, std::size_t len, std::size_t lead_pos, value v, error& e) {
    for (std::size_t k = 0; k < len; ++k) {
      if (sc.at_end()) {
        set_error(e, error_code::unexpected_eof);
        return {};
      }
      if (sc.advance() != rest[k]) {
        set_error(e, error_code::invalid_literal, lead_pos);
        return {};
      }
    }
    return v;
  }

  // Opening quote already consumed. Backslashes are not interpreted: the
  // string ends at the next quote, escaped or not.
  bool parse_string(std::string& out, std::size_t quote_pos, error& e) {
    sc.mark_start(sc.current);
    while (!sc.at_end() && sc.peek() != '"') sc.advance();
    if (sc.at_end()) {
      set_error(e, error_code::unexpected_eof, quote_pos);
      return false;
    }
    const std::string_view text = sc.lexeme(sc.make_token());
    sc.advance();
    out.assign(text.data(), text.size());
    return true;
  }

  // Digits and dots after the lead; a dot anywhere makes it a float lexeme.
  value parse_number(std::size_t lead_pos, error& e) {
    sc.mark_start(lead_pos);
    bool is_float = false;
    while (detail::is_digit(sc.peek()) || sc.peek() == '.') {
      if (sc.advance() == '.') is_float = true;
    }
    const std::string_view lexeme = sc.lexeme(sc.make_token());

    if (is_float) {
      double d = 0.0;
      if (!detail::parse_double(lexeme, d)) {
        set_error(e, error_code::invalid_number, lead_pos);
        return {};
      }
      return value::floating(d);
    }

    std::int64_t i = 0;
    if (!detail::parse_int64(lexeme, i)) {
      set_error(e, error_code::invalid_number, lead_pos);
      return {};
    }
    return value::integer(i);
  }

  // Opening quote of the key already consumed.
  void parse_member(value::object& o, std::size_t depth, error& e) {
    std::string key;
    if (!parse_string(key, sc.current - 1, e)) return;

    sc.skip_whitespace();
    if (sc.at_end()) {
      set_error(e, error_code::unexpected_eof);
      return;
    }
    if (!sc.match_char(':')) {
      set_error(e, error_code::expected_colon);
      return;
    }
    sc.skip_whitespace();

    value v = parse_value(depth, e);
    if (e) return;
    detail::insert_or_assign(o, std::move(key), std::move(v));
  }

  value::array parse_array(std::size_t depth, std::size_t open_pos, error& e) {
    if (depth > opt.max_depth) {
      set_error(e, error_code::nesting_too_deep, open_pos);
      return {};
    }
    if (opt.strict) return parse_array_strict(depth, e);

    value::array a;
    sc.skip_whitespace();
    while (!sc.match_close(']')) {
      value elem = parse_value(depth, e);
      if (e) return {};
      a.emplace_back(std::move(elem));

      sc.skip_whitespace();
      sc.match_char(',');
      sc.skip_whitespace();
    }
    return a;
  }

  value::object parse_object(std::size_t depth, std::size_t open_pos, error& e) {
    if (depth > opt.max_depth) {
      set_error(e, error_code::nesting_too_deep, open_pos);
      return {};
    }
    if (opt.strict) return parse_object_strict(depth, e);

    value::object o;
    sc.skip_whitespace();
    while (!sc.match_close('}')) {
      if (sc.at_end()) {
        set_error(e, error_code::unexpected_eof);
        return {};
      }
      // Anything that does not open a key is skipped, commas included.
      if (sc.advance() == '"') {
        parse_member(o, depth, e);
        if (e) return {};
      }
      sc.skip_whitespace();
    }
    return o;
  }

  value::array parse_array_strict(std::size_t depth, error& e) {
    value::array a;
    sc.skip_whitespace();
    if (sc.match_char(']')) return a;

    while (true) {
      sc.skip_whitespace();
      value elem = parse_value(depth, e);
      if (e) return {};
      a.emplace_back(std::move(elem));

      sc.skip_whitespace();
      if (sc.at_end()) {
        set_error(e, error_code::unexpected_eof);
        return {};
      }
      const std::size_t sep_pos = sc.current;
      const char c = sc.advance();
      if (c == ',') continue;
      if (c == ']') return a;
      set_error(e, error_code::expected_comma_or_end, sep_pos);
      return {};
    }
  }

  value::object parse_object_strict(std::size_t depth, error& e) {
    value::object o;
    sc.skip_whitespace();
    if (sc.match_char('}')) return o;

    while (true) {
      sc.skip_whitespace();
      if (sc.at_end()) {
        set_error(e, error_code::unexpected_eof);
        return {};
      }
      if (sc.peek() != '"') {
        set_error(e, error_code::expected_key_string);
        return {};
      }
      sc.advance();
      parse_member(o, depth, e);
      if (e) return {};

      sc.skip_whitespace();
      if (sc.at_end()) {
        set_error(e, error_code::unexpected_eof);
        return {};
      }
      const std::size_t sep_pos = sc.current;
      const char c = sc.advance();
      if (c == ',') continue;
      if (c == '}') return o;
      set_error(e, error_code::expected_comma_or_end, sep_pos);
      return {};
    }
  }
};

inline parse_result parse(std::string_view json, parse_options opt = {}) {
  parser p;
  p.sc.src = json;
  p.opt = opt;
  return p.run();
}

inline document parse_or_throw(std::string_view json, parse_options opt = {}) {
  auto r = parse(json, opt);
  if (r.err) throw parse_error(r.err);
  return std::move(r.doc);
}

// -----------------------------
// Rendering
// -----------------------------

namespace detail {

inline void dump_indent(std::string& out, int depth) {
  for (int i = 0; i < depth; ++i) out.append("  ", 2);
}

inline void dump_int64(std::string& out, std::int64_t v) {
  char buf[32];
  auto r = std::to_chars(buf, buf + sizeof(buf), v);
  if (r.ec != std::errc{}) {
    throw std::runtime_error("rdjson: failed to format integer");
  }
  out.append(buf, static_cast<std::size_t>(r.ptr - buf));
}

// Shortest round-trip digits in fixed notation, always with a '.', so the
// text reads back as a float and never needs exponent syntax.
inline void dump_double(std::string& out, double d) {
  if (!std::isfinite(d)) {
    throw std::runtime_error("rdjson: cannot dump NaN/Inf as a number");
  }
  // Fixed notation of the extreme doubles runs to ~330 characters.
  char buf[512];
  auto r = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::fixed);
  if (r.ec != std::errc{}) {
    throw std::runtime_error("rdjson: failed to format double");
  }
  const std::size_t n = static_cast<std::size_t>(r.ptr - buf);
  out.append(buf, n);
  if (std::memchr(buf, '.', n) == nullptr) out.append(".0", 2);
}

inline void dump_string(std::string& out, std::string_view s) {
  out.push_back('"');
  out.append(s.data(), s.size());
  out.push_back('"');
}

inline void dump_pretty(std::string& out, const value& v, int depth);

inline void dump_pretty_array(std::string& out, const value::array& a, int depth) {
  out.append("[\n", 2);
  for (const auto& elem : a) {
    dump_indent(out, depth);
    dump_pretty(out, elem, depth + 1);
    out.append(",\n", 2);
  }
  dump_indent(out, depth - 1);
  out.push_back(']');
}

inline void dump_pretty_object(std::string& out, const value::object& o, int depth) {
  out.append("{\n", 2);
  for (const auto& kv : o) {
    dump_indent(out, depth);
    dump_string(out, kv.first);
    out.append(": ", 2);
    dump_pretty(out, kv.second, depth + 1);
    out.append(",\n", 2);
  }
  dump_indent(out, depth - 1);
  out.push_back('}');
}

inline void dump_pretty(std::string& out, const value& v, int depth) {
  switch (v.type()) {
    case value::kind::string:
      dump_string(out, v.as_string());
      return;
    case value::kind::integer:
      dump_int64(out, v.as_int());
      return;
    case value::kind::floating:
      dump_double(out, v.as_double());
      return;
    case value::kind::boolean:
      out += v.as_bool() ? "true" : "false";
      return;
    case value::kind::array:
      dump_pretty_array(out, v.as_array(), depth);
      return;
    case value::kind::object:
      dump_pretty_object(out, v.as_object(), depth);
      return;
  }
}

inline void dump_compact(std::string& out, const value& v);

inline void dump_compact_array(std::string& out, const value::array& a) {
  out.push_back('[');
  for (std::size_t idx = 0; idx < a.size(); ++idx) {
    if (idx > 0) out.push_back(',');
    dump_compact(out, a[idx]);
  }
  out.push_back(']');
}

inline void dump_compact_object(std::string& out, const value::object& o) {
  out.push_back('{');
  for (std::size_t idx = 0; idx < o.size(); ++idx) {
    if (idx > 0) out.push_back(',');
    dump_string(out, o[idx].first);
    out.push_back(':');
    dump_compact(out, o[idx].second);
  }
  out.push_back('}');
}

inline void dump_compact(std::string& out, const value& v) {
  switch (v.type()) {
    case value::kind::array:
      dump_compact_array(out, v.as_array());
      return;
    case value::kind::object:
      dump_compact_object(out, v.as_object());
      return;
    default:
      // Scalars have no layout of their own.
      dump_pretty(out, v, 0);
      return;
  }
}

} // namespace detail

// Pretty form of a nested value, as it appears at the first nesting level.
inline std::string dump(const value& v) {
  std::string out;
  detail::dump_pretty(out, v, 1);
  return out;
}

inline void dump_to(std::string& out, const document& d) {
  if (d.is_object()) {
    detail::dump_pretty_object(out, d.as_object(), 1);
  } else {
    detail::dump_pretty_array(out, d.as_array(), 1);
  }
  out.push_back('\n');
}

inline std::string dump(const document& d) {
  std::string out;
  dump_to(out, d);
  return out;
}

// Single-line strict JSON: no whitespace, no trailing commas.
inline std::string dump_compact(const document& d) {
  std::string out;
  if (d.is_object()) {
    detail::dump_compact_object(out, d.as_object());
  } else {
    detail::dump_compact_array(out, d.as_array());
  }
  return out;
}

inline std::ostream& operator<<(std::ostream& os, const document& d) {
  return os << dump(d);
}

} // namespace rdjson
