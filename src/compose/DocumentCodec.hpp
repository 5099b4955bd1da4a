#ifndef __EB_DOCUMENT_CODEC__
#define __EB_DOCUMENT_CODEC__

#include "ComposeTypes.hpp"
#include "HeaderCodec.hpp"
#include "MetaHeader.hpp"

namespace eb {
/**
 * @brief Converts a compose object to the editable header/body document and
 * merges an edited document back.
 *
 * Header lines end with `\r\n`; a blank line separates headers from the
 * body.  Once the blank line is seen everything that follows is body, even
 * text that looks like a header.
 */
class DocumentCodec {
 public:
  static void render(const Compose& compose, ostream& out);
  static string render(const Compose& compose);

  /**
   * @brief Merges an edited document into `compose`.
   *
   * Recipient lists, custom headers and send-on-exit are reset first so that
   * anything removed from the document reads as cleared.  Unknown headers
   * add one warning and turn send-on-exit off.
   *
   * @throws HeaderParseException when a reserved header holds a malformed
   * value.
   */
  static void parse(Compose& compose, istream& in);
  static void parse(Compose& compose, const string& document);

  /** @brief Rewrites every lone `\n` as `\r\n`. */
  static string normalizeLineEndings(const string& text);

 protected:
  static void applyHeader(Compose& compose, const string& name,
                          const string& value, vector<string>& unknownHeaders);
};
}  // namespace eb

#endif  // __EB_DOCUMENT_CODEC__
