#include "StdioTransport.hpp"

#include "StreamUtils.hpp"

namespace eb {
StdioTransport::StdioTransport(int _inFd, int _outFd)
    : inFd(_inFd), outFd(_outFd) {}

json StdioTransport::readMessage() {
  unsigned char header[4];
  if (!StreamUtils::readAllUnlessEof(inFd, (char*)header, sizeof(header))) {
    throw StreamClosedException();
  }
  int64_t length = decodeLength(header);
  if (length > MAX_INBOUND_FRAME_LENGTH) {
    // If the message is too big, assume the stream is desynchronized
    string s = string("Invalid frame size (>128 MB): ") + to_string(length);
    throw std::runtime_error(s.c_str());
  }
  string payload(length, '\0');
  if (length > 0) {
    StreamUtils::readAll(inFd, &payload[0], length);
  }
  VLOG(2) << "Read frame of " << length << " bytes";
  try {
    return json::parse(payload);
  } catch (const json::parse_error& pe) {
    throw std::runtime_error(string("Invalid JSON frame: ") + pe.what());
  }
}

void StdioTransport::writeMessage(const json& message) {
  string frame = encodeFrame(message.dump(-1, ' ', false,
                                          json::error_handler_t::replace));
  lock_guard<mutex> guard(writeMutex);
  StreamUtils::writeAll(outFd, frame.data(), frame.length());
  VLOG(2) << "Wrote frame of " << frame.length() - 4 << " bytes";
}

string StdioTransport::encodeFrame(const string& payload) {
  if (payload.length() > numeric_limits<uint32_t>::max()) {
    throw std::runtime_error("Message too large to frame");
  }
  uint32_t length = uint32_t(payload.length());
  string frame(4, '\0');
  frame[0] = char(length & 0xff);
  frame[1] = char((length >> 8) & 0xff);
  frame[2] = char((length >> 16) & 0xff);
  frame[3] = char((length >> 24) & 0xff);
  frame.append(payload);
  return frame;
}

uint32_t StdioTransport::decodeLength(const unsigned char* header) {
  return uint32_t(header[0]) | (uint32_t(header[1]) << 8) |
         (uint32_t(header[2]) << 16) | (uint32_t(header[3]) << 24);
}
}  // namespace eb
