#include "sqlforge/version.h"

#ifndef SQLFORGE_VERSION
#define SQLFORGE_VERSION "0.0.0"
#endif

#ifndef SQLFORGE_GIT_COMMIT
#define SQLFORGE_GIT_COMMIT "unknown"
#endif

#ifndef SQLFORGE_GIT_DIRTY
#define SQLFORGE_GIT_DIRTY 0
#endif

namespace sqlforge {

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = SQLFORGE_VERSION;
  info.git_commit = SQLFORGE_GIT_COMMIT;
  info.git_dirty = (SQLFORGE_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace sqlforge
