#pragma once

// wordcount/codec.hpp — Request/Response envelope <-> UTF-8 JSON bytes.
//
// All format concerns live here; the dispatcher and phase handlers only ever
// see decoded Request/Response values.
//
// Wire shapes:
//   Request  {"node": string, "function": string, "config"?: any, "input"?: any}
//   Response {"success": bool, "output": any|null, "error": string|null,
//             "next": string|null}
//
// A JSON null for config/input decodes as absent. Responses always carry all
// four keys; absent optionals are written as null.

#include <optional>
#include <string>
#include <string_view>

#include "wordcount/jsonlite.hpp"
#include "wordcount/types.hpp"

namespace wordcount {

struct DecodeError {
  ErrorCode code{ErrorCode::none};
  std::string message;
};

// Fails with invalid_encoding (not UTF-8) or malformed_request (not the
// Request shape). On failure *error is populated and nullopt returned.
std::optional<Request> decode_request(std::string_view bytes, DecodeError* error);

jsonlite::Value response_to_value(const Response& response);
std::string encode_response(const Response& response);

std::optional<Response> decode_response(std::string_view bytes, DecodeError* error);

// Encoded failure Response for a decode error. Always decodable.
std::string encode_decode_error(const DecodeError& error);

}  // namespace wordcount
