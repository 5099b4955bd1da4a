#ifndef __EB_STREAM_UTILS__
#define __EB_STREAM_UTILS__

#include "Headers.hpp"

namespace eb {
/**
 * @brief Blocking read/write loops over plain file descriptors (stdin,
 * stdout, pipes).
 */
class StreamUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN.
   * @throws std::runtime_error when the descriptor is closed or fails.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Reads exactly `count` bytes from the descriptor, waiting for data.
   * @throws std::runtime_error when the stream closes before `count` bytes.
   */
  static void readAll(int fd, char* buf, size_t count);

  /**
   * @brief Like `readAll`, but returns false when the stream is already at
   * its end before the first byte.
   */
  static bool readAllUnlessEof(int fd, char* buf, size_t count);

  /** @brief Reads until end of stream. */
  static string readToEnd(int fd);
};
}  // namespace eb
#endif  // __EB_STREAM_UTILS__
