#include "AppManifest.hpp"

namespace eb {
namespace {
const char* NATIVE_APP_NAME = "editor_bridge";
const char* NATIVE_APP_DESCRIPTION =
    "Native messaging host that edits mail drafts in an external editor";
const char* CONNECTION_TYPE = "stdio";
const char* EXTENSION_ID = "editor-bridge@example.org";
}  // namespace

AppManifest AppManifest::create(const string& path) {
  AppManifest manifest;
  manifest.name = NATIVE_APP_NAME;
  manifest.description = NATIVE_APP_DESCRIPTION;
  manifest.path = path;
  manifest.connectionType = CONNECTION_TYPE;
  manifest.allowedExtensions.push_back(EXTENSION_ID);
  return manifest;
}

json AppManifest::toJson() const {
  json j;
  j["name"] = name;
  j["description"] = description;
  j["path"] = path;
  j["type"] = connectionType;
  j["allowed_extensions"] = allowedExtensions;
  return j;
}
}  // namespace eb
