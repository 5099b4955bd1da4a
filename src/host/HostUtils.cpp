#include "HostUtils.hpp"

#include "HeaderCodec.hpp"

namespace eb {
namespace {
// Unlike split(), keeps a trailing empty segment
vector<string> versionSegments(const string& version) {
  vector<string> segments;
  size_t start = 0;
  while (true) {
    auto dot = version.find('.', start);
    segments.push_back(version.substr(start, dot - start));
    if (dot == string::npos) {
      break;
    }
    start = dot + 1;
  }
  return segments;
}
}  // namespace

bool isVersionCompatible(const string& hostVersion,
                         const string& callerVersion) {
  auto host = versionSegments(hostVersion);
  auto caller = versionSegments(callerVersion);
  return host.size() == 3 && caller.size() == 3 && host[0] == caller[0] &&
         host[1] == caller[1];
}

string getTemporaryDocumentPath(const Compose& compose) {
  string directory = compose.configuration.temporaryDirectory;
  if (directory.empty()) {
    directory = GetTempDirectory();
  }
  fs::path path(directory);
  path /= string("editor_bridge_") + to_string(compose.tabId()) + ".eml";
  return path.string();
}

string withRecoveryHint(const string& message, const string& path) {
  return message + ".\nYou can try recovering data from " + path;
}

string buildEditorCommand(const string& commandTemplate, const string& path) {
  string command = commandTemplate;
  replaceAll(command, TEMPLATE_PLACEHOLDER, path);
  return command;
}
}  // namespace eb
