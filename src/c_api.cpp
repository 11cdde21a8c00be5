#include "wordcount/c_api.h"

// Stable guest ABI implementation.
//
// This file wraps the C++ API (arena, descriptor, dispatcher) behind a pure-C
// boundary. Key invariants:
//   - No C++ types or exceptions cross the ABI boundary.
//   - Every call emits exactly one InvocationEvent (dealloc/alloc excepted).
//   - std::bad_alloc is allocator exhaustion and aborts; any other exception
//     becomes a success=false Response with internal_error.

#include <cstdlib>
#include <exception>
#include <new>
#include <string>
#include <string_view>

#include "wordcount/arena.hpp"
#include "wordcount/codec.hpp"
#include "wordcount/descriptor.hpp"
#include "wordcount/dispatcher.hpp"
#include "wordcount/hash.hpp"
#include "wordcount/observability.hpp"
#include "wordcount/version.hpp"

static_assert(WORDCOUNT_ABI_VERSION == wordcount::version::GUEST_ABI_VERSION,
              "c_api.h and version.hpp disagree on the ABI version");

namespace {

[[noreturn]] void out_of_memory() {
  wordcount::log_warning("c_api", "allocator exhausted; aborting");
  std::abort();
}

std::size_t finish(wordcount::InvocationEvent& ev, std::uint64_t duration_ns, const std::string& payload,
                   std::uint8_t* out, std::size_t capacity) {
  const std::size_t n = wordcount::copy_truncated(payload, out, capacity);
  ev.duration_ns = duration_ns;
  ev.bytes_out = n;
  ev.truncated = n > capacity || (out == nullptr && n > 0);
  wordcount::emit_invocation_event(ev);
  return n;
}

}  // namespace

extern "C" {

uint32_t wordcount_abi_version(void) {
  return WORDCOUNT_ABI_VERSION;
}

uint8_t* wordcount_alloc(size_t size) {
  return wordcount::arena_allocate(size);
}

void wordcount_dealloc(uint8_t* ptr, size_t size) {
  // Refusals are logged by the arena; the ABI has no channel to report them.
  (void)wordcount::arena_release(ptr, size);
}

size_t wordcount_metadata(uint8_t* out, size_t capacity) {
  try {
    wordcount::InvocationEvent ev;
    ev.kind = "describe";
    std::uint64_t ns = 0;
    std::string json;
    {
      wordcount::ScopeTimer timer(ns);
      json = wordcount::descriptor_json();
    }
    ev.invocation_id = wordcount::descriptor_digest(json);
    ev.ok = true;
    return finish(ev, ns, json, out, capacity);
  } catch (const std::bad_alloc&) {
    out_of_memory();
  }
}

size_t wordcount_call(const uint8_t* in, size_t in_len, uint8_t* out, size_t capacity) {
  try {
    const std::string_view request =
        in ? std::string_view(reinterpret_cast<const char*>(in), in_len) : std::string_view();

    wordcount::InvocationEvent ev;
    std::uint64_t ns = 0;
    std::string response;
    {
      wordcount::ScopeTimer timer(ns);
      try {
        response = wordcount::invoke(request, &ev);
      } catch (const std::bad_alloc&) {
        throw;
      } catch (const std::exception& e) {
        ev.ok = false;
        ev.error_code = wordcount::to_string(wordcount::ErrorCode::internal_error);
        response = wordcount::encode_response(
            wordcount::Response::fail(wordcount::ErrorCode::internal_error, std::string("Internal error: ") + e.what()));
      }
    }
    return finish(ev, ns, response, out, capacity);
  } catch (const std::bad_alloc&) {
    out_of_memory();
  }
}

}  // extern "C"
