#include "wordcount/hash.hpp"

// BLAKE3 is the sole hash primitive. Digests are only used as identifiers in
// observability output, never for security decisions.
//
// Domain separation: "req:" and "desc:" prefixes keep a request digest from
// ever colliding with a descriptor digest over the same bytes.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace wordcount {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

std::string blake3_library_version() {
  const char* v = blake3_version();
  return v ? std::string(v) : std::string("unknown");
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string invocation_digest(std::string_view request_bytes) {
  return hash_domain("req:", request_bytes);
}

std::string descriptor_digest(std::string_view descriptor_json) {
  return hash_domain("desc:", descriptor_json);
}

}  // namespace wordcount
