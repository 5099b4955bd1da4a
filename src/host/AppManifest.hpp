#ifndef __EB_APP_MANIFEST__
#define __EB_APP_MANIFEST__

#include "Headers.hpp"

namespace eb {
/**
 * @brief Registration manifest the mail client needs to find this host.
 */
struct AppManifest {
  string name;
  string description;
  string path;
  string connectionType;
  vector<string> allowedExtensions;

  /** @brief The manifest for an executable installed at `path`. */
  static AppManifest create(const string& path);

  json toJson() const;
};
}  // namespace eb

#endif  // __EB_APP_MANIFEST__
