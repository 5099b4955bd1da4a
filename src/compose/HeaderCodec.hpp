#ifndef __EB_HEADER_CODEC__
#define __EB_HEADER_CODEC__

#include "ComposeTypes.hpp"

namespace eb {
// Name of the compact meta header and prefix of every reserved header
extern const string RESERVED_PREFIX;
// RESERVED_PREFIX followed by the field separator
extern const string RESERVED_FIELD_PREFIX;
// Literal replaced by the document path in the editor command template
extern const string TEMPLATE_PLACEHOLDER;

/**
 * @brief A reserved header value that cannot be understood.  Aborts the
 * whole document parse.
 */
class HeaderParseException : public std::exception {
 public:
  HeaderParseException(const string& msg) : message(msg) {}
  inline virtual const char* what() const noexcept { return message.c_str(); }

 protected:
  string message;
};

enum class HeaderField {
  FROM,
  TO,
  CC,
  BCC,
  REPLY_TO,
  SUBJECT,
  PRIORITY,
  DELIVERY_FORMAT,
  ATTACH_VCARD,
  DELIVERY_STATUS_NOTIFICATION,
  RETURN_RECEIPT,
  ALLOW_CUSTOM_HEADERS,
  SEND_ON_EXIT,
  CUSTOM_HEADER,
  HELP,
  META,
};

/**
 * @brief One entry of the header vocabulary.
 *
 * The same table drives rendering, parsing and meta header compaction.
 */
struct HeaderDefinition {
  HeaderField field;
  string name;
  // Lower-case names accepted on parse, the canonical name included
  vector<string> aliases;
  // Returns the value to write for a single-valued reserved field, or nullopt
  // when the field is absent.  Empty for fields rendered elsewhere.
  function<optional<string>(const Compose&)> encode;
  // Applies one non-empty parsed value.  Returns false when the value is not
  // understood but the parse may continue.
  function<bool(Compose&, const string&)> decode;
};

class HeaderCodec {
 public:
  /** @brief Every known header, in rendering order. */
  static const vector<HeaderDefinition>& definitions();

  /** @brief Case-insensitive lookup by canonical name or alias. */
  static const HeaderDefinition* find(const string& name);

  static const HeaderDefinition& get(HeaderField field);

  /** @brief Emits an email address, or a node reference as one-line JSON. */
  static string encodeRecipient(const Recipient& recipient);

  /**
   * @brief Reads a recipient: a value starting with `{` is a node reference,
   * anything else an email address.
   * @throws HeaderParseException on an empty value or invalid JSON.
   */
  static Recipient decodeRecipient(const string& value);

  /** @brief Strips one pair of surrounding brackets, if present. */
  static optional<string> unbracket(const string& value);

  /** @brief Matches exactly `true` or `false`. */
  static optional<bool> decodeBool(const string& value);

  static string encodeBool(bool value) { return value ? "true" : "false"; }

  /** @brief Builds the parse error for a reserved header value. */
  static HeaderParseException parseError(HeaderField field,
                                         const string& value);

  /** @brief Documentation lines emitted unless suppressed. */
  static const vector<string>& helpLines();
};
}  // namespace eb

#endif  // __EB_HEADER_CODEC__
