#ifndef __EB_META_HEADER__
#define __EB_META_HEADER__

#include "HeaderCodec.hpp"

namespace eb {
/**
 * @brief Packs reserved headers into the single `X-EditorBridge` line,
 * aligns the expanded form, and escapes custom headers that would collide
 * with reserved names.
 */
class MetaHeader {
 public:
  /**
   * @brief Lays out `Name: value` strings in rows of `numColumns / 2`
   * headers, padding each column to its widest entry.  Entries without a
   * `": "` delimiter are skipped.
   */
  static vector<string> alignHeaders(const vector<string>& headers,
                                     int numColumns = 4);

  /**
   * @brief True when a rendered header may be moved into the meta line: its
   * name carries the reserved prefix and its value contains neither `,` nor
   * `:`.
   */
  static bool isCompactable(const string& name, const string& value);

  /**
   * @brief Joins prefixed headers as `Field: value, Field: value`, with the
   * reserved prefix stripped from each name.
   */
  static string pack(const vector<pair<string, string>>& headers);

  /**
   * @brief Splits a meta line value back into full header names and values.
   * Segments without a `:` are dropped.
   */
  static vector<pair<string, string>> unpack(const string& value);

  /** @brief True for names equal to or starting with the reserved prefix. */
  static bool collidesWithReserved(const string& name);

  /** @brief Doubles the reserved prefix on a colliding custom header name. */
  static string escapeCustomHeaderName(const string& name);

  /**
   * @brief Reverses `escapeCustomHeaderName` once.  Returns nullopt when the
   * name is not an escaped custom header.
   */
  static optional<string> unescapeCustomHeaderName(const string& name);
};
}  // namespace eb

#endif  // __EB_META_HEADER__
