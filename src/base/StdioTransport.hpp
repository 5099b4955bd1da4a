#ifndef __EB_STDIO_TRANSPORT__
#define __EB_STDIO_TRANSPORT__

#include "Headers.hpp"
#include "MessageTransport.hpp"

namespace eb {
/**
 * @brief Native messaging framing over a pair of file descriptors.
 *
 * Every frame is a 4-byte little-endian unsigned length followed by that many
 * bytes of UTF-8 JSON.  By default it reads stdin and writes stdout.
 */
class StdioTransport : public MessageTransport {
 public:
  StdioTransport(int _inFd = STDIN_FILENO, int _outFd = STDOUT_FILENO);

  virtual json readMessage();
  virtual void writeMessage(const json& message);

  /** @brief Prepends the little-endian length header to a payload. */
  static string encodeFrame(const string& payload);
  /** @brief Decodes a 4-byte little-endian length header. */
  static uint32_t decodeLength(const unsigned char* header);

 protected:
  int inFd;
  int outFd;
  /** @brief Held for the duration of one frame write. */
  mutex writeMutex;
};
}  // namespace eb

#endif  // __EB_STDIO_TRANSPORT__
