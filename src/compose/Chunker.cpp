#include "Chunker.hpp"

namespace eb {
vector<Compose> Chunker::split(const Compose& compose, size_t maxBodyLength) {
  const string& body = compose.composeDetails.getBody();
  vector<string> bodies;
  string chunk;
  size_t pos = 0;
  while (pos < body.length()) {
    size_t length = utf8SequenceLength(body, pos);
    if (length == 0) {
      // Not expected once the body went through toValidUtf8
      length = 1;
    }
    chunk.append(body, pos, length);
    pos += length;
    if (chunk.length() > maxBodyLength) {
      bodies.push_back(chunk);
      chunk.clear();
    }
  }
  bodies.push_back(chunk);

  vector<Compose> responses;
  for (size_t a = 0; a < bodies.size(); a++) {
    Compose response = compose;
    response.composeDetails.setBody(bodies[a]);
    response.configuration.sequence = int64_t(a);
    response.configuration.total = int64_t(bodies.size());
    responses.push_back(response);
  }
  VLOG(1) << "Split body of " << body.length() << " bytes into "
          << responses.size() << " response(s)";
  return responses;
}
}  // namespace eb
