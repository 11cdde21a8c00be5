#include "wordcount/jsonlite.hpp"

// Architecture notes on jsonlite:
//
// The parser is a single-pass recursive descent over a string_view. It never
// throws: the first error is latched in Parser::err and every production
// returns early once it is set.
//
// std::stod()/std::stoull() are only used on digit strings that the grammar
// has already validated, and they are wrapped so that range errors surface as
// JsonError instead of exceptions.

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace wordcount::jsonlite {

namespace {

constexpr std::size_t kMaxDepth = 128;

void append_utf8(std::string& o, std::uint32_t cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xF0 | (cp >> 18));
    o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  std::string_view s;
  size_t i{0};
  size_t depth{0};
  std::optional<JsonError> err;

  void fail(const std::string& msg) {
    if (!err) err = JsonError{"json_parse_error", msg + " at offset " + std::to_string(i)};
  }

  void ws() {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r')) ++i;
  }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  bool parse_hex4(std::uint32_t& out) {
    if (i + 4 > s.size()) { fail("truncated \\u escape"); return false; }
    out = 0;
    for (int k = 0; k < 4; ++k) {
      char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<std::uint32_t>(c - 'A' + 10);
      else { fail("invalid \\u escape"); return false; }
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { fail("expected string"); return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (static_cast<unsigned char>(c) < 0x20) { fail("control character in string"); return {}; }
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      char n = s[i++];
      switch (n) {
        case '"': o += '"'; break;
        case '\\': o += '\\'; break;
        case '/': o += '/'; break;
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!parse_hex4(cp)) return {};
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            std::uint32_t lo = 0;
            if (i + 1 >= s.size() || s[i] != '\\' || s[i + 1] != 'u') { fail("unpaired surrogate"); return {}; }
            i += 2;
            if (!parse_hex4(lo)) return {};
            if (lo < 0xDC00 || lo > 0xDFFF) { fail("unpaired surrogate"); return {}; }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unpaired surrogate");
            return {};
          }
          append_utf8(o, cp);
          break;
        }
        default:
          fail("invalid escape");
          return {};
      }
    }
    fail("unterminated string");
    return {};
  }

  bool digits() {
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    return true;
  }

  Value parse_number() {
    const size_t start = i;
    bool negative = false;
    if (s[i] == '-') { negative = true; ++i; }
    if (s.compare(i, 8, "Infinity") == 0 || s.compare(i, 3, "NaN") == 0) {
      fail("NaN/Infinity unsupported");
      return {};
    }
    if (!digits()) { fail("unexpected token"); return {}; }
    if (s[start + (negative ? 1 : 0)] == '0' && i - start > (negative ? 2u : 1u)) {
      fail("leading zero");
      return {};
    }
    bool is_double = negative;
    if (i < s.size() && s[i] == '.') {
      ++i;
      if (!digits()) { fail("invalid number format"); return {}; }
      is_double = true;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (!digits()) { fail("invalid exponent"); return {}; }
      is_double = true;
    }
    const std::string num(s.substr(start, i - start));
    try {
      if (!is_double) return Value{static_cast<std::uint64_t>(std::stoull(num))};
      const double d = std::stod(num);
      if (!std::isfinite(d)) { fail("number out of range"); return {}; }
      return Value{d};
    } catch (const std::exception&) {
      // Integers beyond uint64 degrade to double, as the engine always did.
      try {
        const double d = std::stod(num);
        if (std::isfinite(d)) return Value{d};
      } catch (const std::exception&) {
      }
      fail("number out of range");
      return {};
    }
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { fail("unexpected eof"); return {}; }
    if (s[i] == '{') return parse_object();
    if (s[i] == '[') return parse_array();
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    if (s[i] == '-' || std::isdigit(static_cast<unsigned char>(s[i]))) return parse_number();
    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0) {
      fail("NaN/Infinity unsupported");
      return {};
    }
    fail("unexpected token");
    return {};
  }

  Value parse_object() {
    if (++depth > kMaxDepth) { fail("nesting too deep"); return {}; }
    Object out;
    eat('{');
    if (eat('}')) { --depth; return Value{std::move(out)}; }
    while (!err) {
      ws();
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { fail("expected :"); break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { fail("expected , or }"); break; }
    }
    --depth;
    return Value{std::move(out)};
  }

  Value parse_array() {
    if (++depth > kMaxDepth) { fail("nesting too deep"); return {}; }
    Array out;
    eat('[');
    if (eat(']')) { --depth; return Value{std::move(out)}; }
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { fail("expected , or ]"); break; }
    }
    --depth;
    return Value{std::move(out)};
  }
};

void write(std::string& out, const Value& v);

void write_string(std::string& out, std::string_view s) {
  out += '"';
  out += escape(s);
  out += '"';
}

void write(std::string& out, const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) { out += "null"; return; }
  if (const auto* b = std::get_if<bool>(&v.v)) { out += *b ? "true" : "false"; return; }
  if (const auto* n = std::get_if<std::uint64_t>(&v.v)) { out += std::to_string(*n); return; }
  if (const auto* d = std::get_if<double>(&v.v)) {
    // Non-finite values have no JSON spelling; they never reach the boundary as numbers.
    out += std::isfinite(*d) ? format_double(*d) : "null";
    return;
  }
  if (const auto* s = std::get_if<std::string>(&v.v)) { write_string(out, *s); return; }
  if (const auto* o = std::get_if<Object>(&v.v)) {
    out += '{';
    bool first = true;
    for (const auto& [k, vv] : *o) {
      if (!first) out += ',';
      first = false;
      write_string(out, k);
      out += ':';
      write(out, vv);
    }
    out += '}';
    return;
  }
  out += '[';
  bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) {
    if (!first) out += ',';
    first = false;
    write(out, vv);
  }
  out += ']';
}

}  // namespace

Value parse_value(std::string_view text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_value();
  p.ws();
  if (!p.err && p.i != text.size()) p.fail("trailing data");
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

Object parse(std::string_view text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  auto v = parse_value(text, &err);
  if (!err && !v.is_object()) err = JsonError{"json_parse_error", "expected a JSON object"};
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

std::string to_json(const Value& v) {
  std::string out;
  out.reserve(128);
  write(out, v);
  return out;
}

// Shortest round-tripping form: try %.15g, fall back to %.17g when the
// shorter form does not read back bit-identical.
std::string format_double(double d) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.15g", d);
  if (n > 0 && std::strtod(buf, nullptr) != d) n = std::snprintf(buf, sizeof(buf), "%.17g", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string result(buf, static_cast<size_t>(n));
  if (result.find_first_of(".eEn") == std::string::npos) result += ".0";
  return result;
}

// Fast path for strings with no escape characters (the common case).
std::string escape(std::string_view s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return std::string(s);

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    } else {
      o += c;
    }
  }
  return o;
}

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}
bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return def;
  return std::get<std::uint64_t>(it->second.v);
}
double get_double(const Object& obj, const std::string& key, double def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (std::holds_alternative<double>(it->second.v)) return std::get<double>(it->second.v);
  if (std::holds_alternative<std::uint64_t>(it->second.v)) return static_cast<double>(std::get<std::uint64_t>(it->second.v));
  return def;
}
std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return out;
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (std::holds_alternative<std::string>(item.v)) {
      out.push_back(std::get<std::string>(item.v));
    }
  }
  return out;
}

}  // namespace wordcount::jsonlite
