#pragma once

// wordcount/dispatcher.hpp — Routes one decoded Request to one phase handler.
//
// The module holds no state between calls: every dispatch starts and ends
// idle. Transition table, keyed on Request.function:
//
//   "prep" -> handle_prep
//   "exec" -> handle_exec
//   "post" -> handle_post
//   other  -> unknown_function ("Unknown function: <name>")
//
// No retries, no queuing: one request in, one response out.

#include <string>
#include <string_view>

#include "wordcount/observability.hpp"
#include "wordcount/types.hpp"

namespace wordcount {

Response dispatch(const Request& request);

// Full byte-level transform: decode -> dispatch -> encode. Never fails; a
// decode error becomes an encoded success=false Response. When event is
// non-null its node/function/ok/error_code/next/bytes fields are filled in.
std::string invoke(std::string_view request_bytes, InvocationEvent* event = nullptr);

}  // namespace wordcount
