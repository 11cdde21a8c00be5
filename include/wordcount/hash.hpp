#pragma once

#include <string>
#include <string_view>

namespace wordcount {

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
std::string blake3_library_version();

// Domain-separated hashing for different contexts
std::string hash_domain(std::string_view domain, std::string_view payload);

// "req:" digest of the raw request bytes. Identifies an invocation in events.
std::string invocation_digest(std::string_view request_bytes);

// "desc:" digest of the encoded descriptor document.
std::string descriptor_digest(std::string_view descriptor_json);

}  // namespace wordcount
