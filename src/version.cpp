#include "wordcount/version.hpp"

#include <sstream>

#include "wordcount/hash.hpp"

namespace wordcount {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.module_semver = MODULE_SEMVER;
  m.hash_primitive = "blake3";
  m.hash_library_version = blake3_library_version();
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"guest_abi\":" << m.guest_abi
    << ",\"wire_format\":" << m.wire_format
    << ",\"module_semver\":\"" << m.module_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"hash_library_version\":\"" << m.hash_library_version << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace wordcount
