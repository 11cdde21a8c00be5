#pragma once

// wordcount/text.hpp — UTF-8 helpers shared by the codec and phase handlers.
//
// UTF-8 decoding is local; character properties and case mapping come from
// ICU's Unicode data and never depend on the process locale:
//   - whitespace is the White_Space property.
//   - alphanumeric is Alphabetic, or a number (Nd, Nl, No).
//   - lowercasing is the full root-locale mapping, so one code point may
//     become several and a word-final capital sigma becomes U+03C2.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wordcount::text {

// True when bytes form well-formed UTF-8 (no overlongs, surrogates or
// code points above U+10FFFF).
bool is_valid_utf8(std::string_view bytes);

// Decode valid UTF-8 into code points. Invalid sequences decode as U+FFFD.
std::vector<char32_t> decode(std::string_view utf8);
void append(std::string& out, char32_t cp);

bool is_whitespace(char32_t cp);
bool is_alphanumeric(char32_t cp);

// Number of code points (not bytes).
std::size_t length(std::string_view utf8);

std::string to_lower(std::string_view utf8);

// Split on runs of whitespace; empty tokens are never produced.
std::vector<std::string> split_whitespace(std::string_view utf8);

}  // namespace wordcount::text
