#include "wordcount/dispatcher.hpp"

#include "wordcount/codec.hpp"
#include "wordcount/hash.hpp"
#include "wordcount/phases.hpp"

namespace wordcount {

Response dispatch(const Request& request) {
  const auto phase = phase_from_string(request.function);
  if (!phase) return Response::fail(ErrorCode::unknown_function, "Unknown function: " + request.function);

  switch (*phase) {
    case Phase::prep: return handle_prep(request);
    case Phase::exec: return handle_exec(request);
    case Phase::post: return handle_post(request);
  }
  return Response::fail(ErrorCode::unknown_function, "Unknown function: " + request.function);
}

std::string invoke(std::string_view request_bytes, InvocationEvent* event) {
  if (event) {
    event->kind = "invoke";
    event->invocation_id = invocation_digest(request_bytes);
    event->bytes_in = request_bytes.size();
  }

  DecodeError err;
  const auto request = decode_request(request_bytes, &err);
  if (!request) {
    std::string out = encode_decode_error(err);
    if (event) {
      event->ok = false;
      event->error_code = to_string(err.code);
      event->bytes_out = out.size();
    }
    return out;
  }

  const Response response = dispatch(*request);
  std::string out = encode_response(response);
  if (event) {
    event->node = request->node;
    event->function = request->function;
    event->ok = response.success;
    event->error_code = to_string(response.error_code);
    event->next = response.next.value_or("");
    event->bytes_out = out.size();
  }
  return out;
}

}  // namespace wordcount
