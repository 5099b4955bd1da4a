#ifndef __EB_COMPOSE_TYPES__
#define __EB_COMPOSE_TYPES__

#include "Headers.hpp"

namespace eb {
enum class RecipientNodeType { CONTACT, MAILING_LIST };

/**
 * @brief Reference to an address book record kept by the mail client.
 */
struct RecipientNode {
  string id;
  RecipientNodeType type = RecipientNodeType::CONTACT;

  json toJson() const;
  static RecipientNode fromJson(const json& j);

  bool operator==(const RecipientNode& other) const {
    return id == other.id && type == other.type;
  }
};

/**
 * @brief Either a bare email address or a structured address book reference.
 */
struct Recipient {
  enum class Kind { EMAIL, NODE };

  Kind kind = Kind::EMAIL;
  string address;
  RecipientNode node;

  static Recipient email(const string& address);
  static Recipient fromNode(const RecipientNode& node);

  json toJson() const;
  static Recipient fromJson(const json& j);

  bool operator==(const Recipient& other) const {
    if (kind != other.kind) {
      return false;
    }
    return kind == Kind::EMAIL ? address == other.address : node == other.node;
  }
};

/**
 * @brief A recipient field as the mail client sends it: either one recipient
 * (not wrapped in an array) or a possibly empty array of recipients.
 */
struct RecipientList {
  enum class Kind { SINGLE, MULTIPLE };

  Kind kind = Kind::MULTIPLE;
  vector<Recipient> recipients;

  static RecipientList single(const Recipient& recipient);
  static RecipientList multiple(const vector<Recipient>& recipients);

  /**
   * @brief Appends a recipient; a SINGLE list becomes a MULTIPLE one holding
   * both recipients.
   */
  void add(const Recipient& recipient);
  /** @brief Resets to an empty MULTIPLE list. */
  void clear();

  json toJson() const;
  static RecipientList fromJson(const json& j);
};

enum class Priority { LOWEST, LOW, NORMAL, HIGH, HIGHEST };

enum class DeliveryFormat { AUTO, PLAIN_TEXT, HTML, BOTH };

/**
 * @brief Delivery format as three explicit states: not sent by the client,
 * sent as the default (`null`), or overridden with a concrete value.
 */
struct DeliveryFormatOverride {
  enum class State { ABSENT, DEFAULT, VALUE };

  State state = State::ABSENT;
  DeliveryFormat value = DeliveryFormat::AUTO;

  static DeliveryFormatOverride absent();
  static DeliveryFormatOverride byDefault();
  static DeliveryFormatOverride of(DeliveryFormat value);
};

/**
 * @brief Boolean preference that remembers whether the user changed it.
 *
 * `touched` is local state only and never crosses the wire.
 */
struct TrackedBool {
  optional<bool> value;
  bool touched = false;

  void set(bool newValue) {
    value = newValue;
    touched = true;
  }
};

struct CustomHeader {
  string name;
  string value;

  CustomHeader() {}
  CustomHeader(const string& _name, const string& _value);

  /** @brief Rewrites a case-insensitive `x-` prefix as `X-`. */
  static string canonicalName(const string& name);

  bool operator==(const CustomHeader& other) const {
    return name == other.name && value == other.value;
  }
};

struct Warning {
  string title;
  string message;

  json toJson() const;
  static Warning fromJson(const json& j);
};

struct Configuration {
  string version;
  int64_t sequence = 0;
  int64_t total = 1;
  string temporaryDirectory;
  string shell;
  // The command template; `/path/to/temp.eml` marks the document path
  string commandTemplate;
  bool sendOnExit = false;
  bool suppressHelpHeaders = false;
  bool metaHeaders = false;
  bool allowCustomHeaders = false;
  bool bypassVersionCheck = false;

  json toJson() const;
  static Configuration fromJson(const json& j);
};

struct ComposeDetails {
  Recipient from;
  RecipientList to;
  RecipientList cc;
  RecipientList bcc;
  RecipientList replyTo;
  string subject;
  bool isPlainText = false;
  string body;
  string plainTextBody;
  optional<Priority> priority;
  DeliveryFormatOverride deliveryFormat;
  TrackedBool attachVCard;
  optional<bool> deliveryStatusNotification;
  optional<bool> returnReceipt;
  vector<CustomHeader> customHeaders;
  // Keys this host does not interpret (attachments, identityId, ...)
  json extra = json::object();

  /** @brief The body selected by `isPlainText`. */
  const string& getBody() const;
  /** @brief Replaces the selected body and clears the other one. */
  void setBody(const string& newBody);

  json toJson() const;
  static ComposeDetails fromJson(const json& j);
};

/**
 * @brief One compose round trip, as received from and returned to the mail
 * client.
 */
struct Compose {
  Configuration configuration;
  vector<Warning> warnings;
  json tab = json::object();
  ComposeDetails composeDetails;

  /** @brief The tab identifier used to route responses. */
  int64_t tabId() const;

  json toJson() const;
  static Compose fromJson(const json& j);
};

struct Ping {
  json ping;
  json pong;
  string version;
  string hostVersion;
  bool compatible = false;

  json toJson() const;
  static Ping fromJson(const json& j);
};

struct ErrorResponse {
  json tab = json::object();
  bool reset = false;
  string title;
  string message;

  json toJson() const;
};

/** @brief True when an inbound message is a ping. */
bool isPing(const json& message);

string priorityToString(Priority priority);
/** @brief Case-insensitive; returns nullopt for an unknown keyword. */
optional<Priority> priorityFromString(const string& s);

string deliveryFormatToString(DeliveryFormat format);
/** @brief Case-insensitive; returns nullopt for an unknown keyword. */
optional<DeliveryFormat> deliveryFormatFromString(const string& s);
}  // namespace eb

#endif  // __EB_COMPOSE_TYPES__
