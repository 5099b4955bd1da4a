#ifndef __EB_COMPOSE_FIXTURES__
#define __EB_COMPOSE_FIXTURES__

#include "ComposeTypes.hpp"
#include "DocumentCodec.hpp"
#include "TestHeaders.hpp"

namespace eb {
inline Compose makeBlankCompose() {
  Compose compose;
  compose.configuration.version = "0.0.0";
  compose.tab = {{"id", 0},         {"index", 0},       {"windowId", 0},
                 {"highlighted", false}, {"active", false}, {"status", "complete"},
                 {"type", "messageCompose"}, {"mailTab", false}};
  compose.composeDetails.from = Recipient::email("someone@example.com");
  compose.composeDetails.isPlainText = true;
  return compose;
}

// Values of every header line called `name` (case-sensitive) before the
// first blank line.
inline vector<string> headerValues(const string& document, const string& name) {
  vector<string> values;
  istringstream iss(document);
  string line;
  while (getline(iss, line)) {
    if (trim(line).empty()) {
      break;
    }
    auto colon = line.find(':');
    if (colon != string::npos && trim(line.substr(0, colon)) == name) {
      values.push_back(trim(line.substr(colon + 1)));
    }
  }
  return values;
}

inline string headerValue(const string& document, const string& name) {
  auto values = headerValues(document, name);
  REQUIRE(values.size() == 1);
  return values[0];
}

// Parses into a copy so that one request can be reused across sections
inline Compose parseDocument(const Compose& request, const string& document) {
  Compose response = request;
  DocumentCodec::parse(response, document);
  return response;
}
}  // namespace eb

#endif  // __EB_COMPOSE_FIXTURES__
