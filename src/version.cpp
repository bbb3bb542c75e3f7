#include "keystone/version.hpp"

#include <sstream>

#include "keystone/hash.hpp"

namespace keystone {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver = semver.empty() ? "0.1.0" : semver;
  m.hash_primitive = hash_runtime_info().primitive;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"wal_format\":" << m.wal_format
    << ",\"state_layout\":" << m.state_layout
    << ",\"api\":" << m.api
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_wal_format(uint32_t found) {
  CompatibilityResult r;
  if (found == 0 || found > WAL_FORMAT_VERSION) {
    r.ok = false;
    r.error_code = "wal_format_unsupported";
    r.description = "WAL format " + std::to_string(found) + " is not readable by this build (max " +
                    std::to_string(WAL_FORMAT_VERSION) + ")";
  }
  return r;
}

}  // namespace version
}  // namespace keystone
