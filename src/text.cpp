#include "wordcount/text.hpp"

#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace wordcount::text {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

// Decodes one code point starting at s[i] and advances i. Returns false on a
// malformed sequence (i still advances by one byte).
bool next(std::string_view s, std::size_t& i, char32_t& out) {
  const auto b0 = static_cast<unsigned char>(s[i]);
  if (b0 < 0x80) {
    out = b0;
    ++i;
    return true;
  }
  std::size_t len = 0;
  char32_t cp = 0;
  char32_t min = 0;
  if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; min = 0x80; }
  else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; min = 0x800; }
  else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; min = 0x10000; }
  else { ++i; return false; }

  if (i + len > s.size()) { ++i; return false; }
  for (std::size_t k = 1; k < len; ++k) {
    const auto b = static_cast<unsigned char>(s[i + k]);
    if ((b & 0xC0) != 0x80) { ++i; return false; }
    cp = (cp << 6) | (b & 0x3F);
  }
  if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) { ++i; return false; }
  out = cp;
  i += len;
  return true;
}

}  // namespace

bool is_valid_utf8(std::string_view bytes) {
  std::size_t i = 0;
  char32_t cp = 0;
  while (i < bytes.size()) {
    if (!next(bytes, i, cp)) return false;
  }
  return true;
}

std::vector<char32_t> decode(std::string_view utf8) {
  std::vector<char32_t> out;
  out.reserve(utf8.size());
  std::size_t i = 0;
  while (i < utf8.size()) {
    char32_t cp = 0;
    out.push_back(next(utf8, i, cp) ? cp : kReplacement);
  }
  return out;
}

void append(std::string& out, char32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

bool is_whitespace(char32_t cp) {
  return u_isUWhiteSpace(static_cast<UChar32>(cp));
}

bool is_alphanumeric(char32_t cp) {
  const auto c = static_cast<UChar32>(cp);
  if (u_hasBinaryProperty(c, UCHAR_ALPHABETIC)) return true;
  switch (u_charType(c)) {
    case U_DECIMAL_DIGIT_NUMBER:
    case U_LETTER_NUMBER:
    case U_OTHER_NUMBER:
      return true;
    default:
      return false;
  }
}

std::size_t length(std::string_view utf8) {
  std::size_t n = 0;
  std::size_t i = 0;
  char32_t cp = 0;
  while (i < utf8.size()) {
    next(utf8, i, cp);
    ++n;
  }
  return n;
}

std::string to_lower(std::string_view utf8) {
  // Invalid sequences become U+FFFD, matching decode().
  icu::UnicodeString u = icu::UnicodeString::fromUTF8(
      icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
  u.toLower(icu::Locale::getRoot());
  std::string out;
  u.toUTF8String(out);
  return out;
}

std::vector<std::string> split_whitespace(std::string_view utf8) {
  std::vector<std::string> out;
  std::size_t i = 0;
  std::size_t start = 0;
  bool in_token = false;
  while (i < utf8.size()) {
    const std::size_t at = i;
    char32_t cp = 0;
    const bool ok = next(utf8, i, cp);
    const bool ws = ok && is_whitespace(cp);
    if (ws && in_token) {
      out.emplace_back(utf8.substr(start, at - start));
      in_token = false;
    } else if (!ws && !in_token) {
      start = at;
      in_token = true;
    }
  }
  if (in_token) out.emplace_back(utf8.substr(start));
  return out;
}

}  // namespace wordcount::text
