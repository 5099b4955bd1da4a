#ifndef __EB_MESSAGE_TRANSPORT__
#define __EB_MESSAGE_TRANSPORT__

#include "Headers.hpp"

namespace eb {
/**
 * @brief The peer closed the stream between two messages.
 */
class StreamClosedException : public std::runtime_error {
 public:
  StreamClosedException() : std::runtime_error("Stream closed") {}
};

/**
 * @brief Exchanges one JSON value per message with the mail client.
 *
 * Implementations must be safe to call `writeMessage` from several worker
 * threads at once: a frame is always written as a whole.
 */
class MessageTransport {
 public:
  virtual ~MessageTransport() {}

  /**
   * @brief Blocks until one full message is available.
   * @throws StreamClosedException when the stream ends between messages.
   * @throws std::runtime_error when the stream breaks or a frame is
   * malformed.
   */
  virtual json readMessage() = 0;

  /**
   * @brief Sends one message.
   * @throws std::runtime_error when the stream cannot be written.
   */
  virtual void writeMessage(const json& message) = 0;
};
}  // namespace eb

#endif  // __EB_MESSAGE_TRANSPORT__
