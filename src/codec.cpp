#include "wordcount/codec.hpp"

#include "wordcount/text.hpp"

namespace wordcount {

namespace {

void set_error(DecodeError* error, ErrorCode code, std::string message) {
  if (error) *error = DecodeError{code, std::move(message)};
}

// Optional members decode as absent when missing or null.
std::optional<jsonlite::Value> optional_member(const jsonlite::Object& obj, const std::string& key) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v || v->is_null()) return std::nullopt;
  return *v;
}

// Required string member. Returns false and fills reason on failure.
bool required_string(const jsonlite::Object& obj, const std::string& key, std::string& out, std::string& reason) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v) {
    reason = "missing field `" + key + "`";
    return false;
  }
  const auto* s = std::get_if<std::string>(&v->v);
  if (!s) {
    reason = "invalid type for `" + key + "`, expected a string";
    return false;
  }
  out = *s;
  return true;
}

// Optional string member: absent/null -> nullopt, string -> value, else error.
bool optional_string(const jsonlite::Object& obj, const std::string& key, std::optional<std::string>& out,
                     std::string& reason) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v || v->is_null()) {
    out.reset();
    return true;
  }
  const auto* s = std::get_if<std::string>(&v->v);
  if (!s) {
    reason = "invalid type for `" + key + "`, expected a string or null";
    return false;
  }
  out = *s;
  return true;
}

}  // namespace

std::optional<Request> decode_request(std::string_view bytes, DecodeError* error) {
  if (!text::is_valid_utf8(bytes)) {
    set_error(error, ErrorCode::invalid_encoding, "Invalid UTF-8 input");
    return std::nullopt;
  }

  std::optional<jsonlite::JsonError> jerr;
  jsonlite::Object obj = jsonlite::parse(bytes, &jerr);
  if (jerr) {
    set_error(error, ErrorCode::malformed_request, "Failed to parse request: " + jerr->message);
    return std::nullopt;
  }

  Request req;
  std::string reason;
  if (!required_string(obj, "node", req.node, reason) || !required_string(obj, "function", req.function, reason)) {
    set_error(error, ErrorCode::malformed_request, "Failed to parse request: " + reason);
    return std::nullopt;
  }
  req.config = optional_member(obj, "config");
  req.input = optional_member(obj, "input");
  return req;
}

jsonlite::Value response_to_value(const Response& response) {
  jsonlite::Object o;
  o["success"] = response.success;
  o["output"] = response.output ? *response.output : jsonlite::Value{};
  o["error"] = response.error ? jsonlite::Value{*response.error} : jsonlite::Value{};
  o["next"] = response.next ? jsonlite::Value{*response.next} : jsonlite::Value{};
  return o;
}

std::string encode_response(const Response& response) {
  return jsonlite::to_json(response_to_value(response));
}

std::optional<Response> decode_response(std::string_view bytes, DecodeError* error) {
  if (!text::is_valid_utf8(bytes)) {
    set_error(error, ErrorCode::invalid_encoding, "Invalid UTF-8 input");
    return std::nullopt;
  }
  std::optional<jsonlite::JsonError> jerr;
  jsonlite::Object obj = jsonlite::parse(bytes, &jerr);
  if (jerr) {
    set_error(error, ErrorCode::malformed_request, "Failed to parse response: " + jerr->message);
    return std::nullopt;
  }

  const jsonlite::Value* success = jsonlite::find(obj, "success");
  if (!success || !std::holds_alternative<bool>(success->v)) {
    set_error(error, ErrorCode::malformed_request, "Failed to parse response: missing field `success`");
    return std::nullopt;
  }

  Response r;
  r.success = std::get<bool>(success->v);
  r.output = optional_member(obj, "output");
  std::string reason;
  if (!optional_string(obj, "error", r.error, reason) || !optional_string(obj, "next", r.next, reason)) {
    set_error(error, ErrorCode::malformed_request, "Failed to parse response: " + reason);
    return std::nullopt;
  }
  return r;
}

std::string encode_decode_error(const DecodeError& error) {
  return encode_response(Response::fail(error.code, error.message));
}

}  // namespace wordcount
