#pragma once

#include <string>

namespace sqlforge {

/// Build version and source provenance.
struct VersionInfo {
  std::string version;
  std::string git_commit;
  bool git_dirty = false;
};

/// Compile-time version/provenance of the library build.
/// MUST not perform IO.
VersionInfo get_version_info();
/// Returns `<version> (<commit>[-dirty])`.
std::string version_string();

}  // namespace sqlforge
