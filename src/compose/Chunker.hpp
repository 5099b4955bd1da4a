#ifndef __EB_CHUNKER__
#define __EB_CHUNKER__

#include "ComposeTypes.hpp"

namespace eb {
class Chunker {
 public:
  /**
   * @brief Splits the selected body into responses that each fit the
   * messaging size limit.
   *
   * Characters are accumulated and the chunk is flushed as soon as its byte
   * length exceeds `maxBodyLength`, so splits never fall inside a UTF-8
   * sequence.  The final chunk is always emitted, even when empty.  Every
   * response is a copy of `compose` with its body replaced and
   * `sequence`/`total` stamped.
   */
  static vector<Compose> split(const Compose& compose, size_t maxBodyLength);
};
}  // namespace eb

#endif  // __EB_CHUNKER__
