#pragma once

// wordcount/descriptor.hpp — Static self-description reported to the host.
//
// The document is built from constants only: no input, no side effects, and
// byte-identical output on every call (jsonlite sorts object keys).

#include <cstddef>
#include <cstdint>
#include <string>

#include "wordcount/jsonlite.hpp"

namespace wordcount {

// Declared resource limits. Enforced by the host, not by the module.
struct ResourceLimits {
  std::string memory{"5MB"};
  std::uint64_t timeout_ms{3000};
};

jsonlite::Value descriptor_document();
std::string descriptor_json();

// Writes the descriptor into out (at most capacity bytes) and returns the
// true encoded length. Callers retry with a larger buffer when the result
// exceeds capacity.
std::size_t describe(std::uint8_t* out, std::size_t capacity);

}  // namespace wordcount
