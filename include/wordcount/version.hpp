#pragma once

// wordcount/version.hpp — Version constants for every surface the host sees.
//
// INVARIANT:
//   All constants are compile-time. The host may call wordcount_abi_version()
//   before anything else and refuse the module on mismatch.

#include <cstdint>
#include <string>

namespace wordcount {
namespace version {

// ---------------------------------------------------------------------------
// GUEST_ABI_VERSION
// Increment when the exported functions in c_api.h change signature or
// semantics (buffer ownership, truncation contract, export names).
// ---------------------------------------------------------------------------
constexpr uint32_t GUEST_ABI_VERSION = 1;

// ---------------------------------------------------------------------------
// WIRE_FORMAT_VERSION
// Tracks the Request/Response envelope. Adding or removing a required field,
// or changing how absent optionals are encoded, requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t WIRE_FORMAT_VERSION = 1;

// Semantic version advertised in the descriptor.
constexpr const char* MODULE_SEMVER = "1.0.0";

struct VersionManifest {
  uint32_t guest_abi{GUEST_ABI_VERSION};
  uint32_t wire_format{WIRE_FORMAT_VERSION};
  std::string module_semver;
  std::string hash_primitive;
  std::string hash_library_version;
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace wordcount
