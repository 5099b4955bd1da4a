#include "ComposeTypes.hpp"

namespace eb {
namespace {
const set<string> KNOWN_DETAIL_KEYS = {
    "from",          "to",
    "cc",            "bcc",
    "replyTo",       "subject",
    "isPlainText",   "body",
    "plainTextBody", "priority",
    "deliveryFormat", "attachVCard",
    "deliveryStatusNotification", "returnReceipt",
    "customHeaders"};

const array<string, 5> PRIORITY_NAMES = {"lowest", "low", "normal", "high",
                                         "highest"};

const array<string, 4> DELIVERY_FORMAT_NAMES = {"auto", "plaintext", "html",
                                                "both"};

optional<bool> optionalBool(const json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) {
    return nullopt;
  }
  return j[key].get<bool>();
}
}  // namespace

json RecipientNode::toJson() const {
  json j;
  j["id"] = id;
  j["type"] = (type == RecipientNodeType::MAILING_LIST) ? "mailingList"
                                                        : "contact";
  return j;
}

RecipientNode RecipientNode::fromJson(const json& j) {
  RecipientNode node;
  node.id = j.at("id").get<string>();
  string type = j.at("type").get<string>();
  if (type == "contact") {
    node.type = RecipientNodeType::CONTACT;
  } else if (type == "mailingList") {
    node.type = RecipientNodeType::MAILING_LIST;
  } else {
    throw std::runtime_error("Unknown recipient type: " + type);
  }
  return node;
}

Recipient Recipient::email(const string& address) {
  Recipient r;
  r.kind = Kind::EMAIL;
  r.address = address;
  return r;
}

Recipient Recipient::fromNode(const RecipientNode& node) {
  Recipient r;
  r.kind = Kind::NODE;
  r.node = node;
  return r;
}

json Recipient::toJson() const {
  if (kind == Kind::NODE) {
    return node.toJson();
  }
  return address;
}

Recipient Recipient::fromJson(const json& j) {
  if (j.is_string()) {
    return email(j.get<string>());
  }
  if (j.is_object()) {
    return fromNode(RecipientNode::fromJson(j));
  }
  throw std::runtime_error("Invalid recipient: " + j.dump());
}

RecipientList RecipientList::single(const Recipient& recipient) {
  RecipientList list;
  list.kind = Kind::SINGLE;
  list.recipients.push_back(recipient);
  return list;
}

RecipientList RecipientList::multiple(const vector<Recipient>& recipients) {
  RecipientList list;
  list.kind = Kind::MULTIPLE;
  list.recipients = recipients;
  return list;
}

void RecipientList::add(const Recipient& recipient) {
  kind = Kind::MULTIPLE;
  recipients.push_back(recipient);
}

void RecipientList::clear() {
  kind = Kind::MULTIPLE;
  recipients.clear();
}

json RecipientList::toJson() const {
  if (kind == Kind::SINGLE && recipients.size() == 1) {
    return recipients[0].toJson();
  }
  json j = json::array();
  for (const auto& r : recipients) {
    j.push_back(r.toJson());
  }
  return j;
}

RecipientList RecipientList::fromJson(const json& j) {
  if (j.is_array()) {
    vector<Recipient> recipients;
    for (const auto& it : j) {
      recipients.push_back(Recipient::fromJson(it));
    }
    return multiple(recipients);
  }
  return single(Recipient::fromJson(j));
}

DeliveryFormatOverride DeliveryFormatOverride::absent() {
  return DeliveryFormatOverride();
}

DeliveryFormatOverride DeliveryFormatOverride::byDefault() {
  DeliveryFormatOverride o;
  o.state = State::DEFAULT;
  return o;
}

DeliveryFormatOverride DeliveryFormatOverride::of(DeliveryFormat value) {
  DeliveryFormatOverride o;
  o.state = State::VALUE;
  o.value = value;
  return o;
}

CustomHeader::CustomHeader(const string& _name, const string& _value)
    : name(canonicalName(_name)), value(_value) {}

string CustomHeader::canonicalName(const string& name) {
  if (startsWithIgnoreCase(name, "x-")) {
    return "X-" + name.substr(2);
  }
  return name;
}

json Warning::toJson() const {
  json j;
  j["title"] = title;
  j["message"] = message;
  return j;
}

Warning Warning::fromJson(const json& j) {
  Warning w;
  w.title = j.value("title", "");
  w.message = j.value("message", "");
  return w;
}

json Configuration::toJson() const {
  json j;
  j["version"] = version;
  j["sequence"] = sequence;
  j["total"] = total;
  j["temporaryDirectory"] = temporaryDirectory;
  j["sendOnExit"] = sendOnExit;
  j["suppressHelpHeaders"] = suppressHelpHeaders;
  j["metaHeaders"] = metaHeaders;
  j["allowCustomHeaders"] = allowCustomHeaders;
  j["bypassVersionCheck"] = bypassVersionCheck;
  return j;
}

Configuration Configuration::fromJson(const json& j) {
  Configuration c;
  c.version = j.at("version").get<string>();
  c.sequence = j.value("sequence", int64_t(0));
  c.total = j.value("total", int64_t(1));
  c.temporaryDirectory = j.value("temporaryDirectory", "");
  c.shell = j.value("shell", "");
  c.commandTemplate = j.value("template", "");
  c.sendOnExit = j.value("sendOnExit", false);
  c.suppressHelpHeaders = j.value("suppressHelpHeaders", false);
  c.metaHeaders = j.value("metaHeaders", false);
  c.allowCustomHeaders = j.value("allowCustomHeaders", false);
  c.bypassVersionCheck = j.value("bypassVersionCheck", false);
  return c;
}

const string& ComposeDetails::getBody() const {
  return isPlainText ? plainTextBody : body;
}

void ComposeDetails::setBody(const string& newBody) {
  body.clear();
  plainTextBody.clear();
  if (isPlainText) {
    plainTextBody = newBody;
  } else {
    body = newBody;
  }
}

json ComposeDetails::toJson() const {
  json j = extra.is_object() ? extra : json::object();
  j["from"] = from.toJson();
  j["to"] = to.toJson();
  j["cc"] = cc.toJson();
  j["bcc"] = bcc.toJson();
  j["replyTo"] = replyTo.toJson();
  j["subject"] = subject;
  j["isPlainText"] = isPlainText;
  if (!body.empty()) {
    j["body"] = body;
  }
  if (!plainTextBody.empty()) {
    j["plainTextBody"] = plainTextBody;
  }
  if (priority) {
    j["priority"] = priorityToString(*priority);
  }
  switch (deliveryFormat.state) {
    case DeliveryFormatOverride::State::ABSENT:
      break;
    case DeliveryFormatOverride::State::DEFAULT:
      j["deliveryFormat"] = nullptr;
      break;
    case DeliveryFormatOverride::State::VALUE:
      j["deliveryFormat"] = deliveryFormatToString(deliveryFormat.value);
      break;
  }
  if (attachVCard.value) {
    j["attachVCard"] = *attachVCard.value;
  }
  if (deliveryStatusNotification) {
    j["deliveryStatusNotification"] = *deliveryStatusNotification;
  }
  if (returnReceipt) {
    j["returnReceipt"] = *returnReceipt;
  }
  json headers = json::array();
  for (const auto& header : customHeaders) {
    headers.push_back({{"name", header.name}, {"value", header.value}});
  }
  j["customHeaders"] = headers;
  return j;
}

ComposeDetails ComposeDetails::fromJson(const json& j) {
  ComposeDetails d;
  d.from = Recipient::fromJson(j.at("from"));
  if (j.contains("to")) d.to = RecipientList::fromJson(j["to"]);
  if (j.contains("cc")) d.cc = RecipientList::fromJson(j["cc"]);
  if (j.contains("bcc")) d.bcc = RecipientList::fromJson(j["bcc"]);
  if (j.contains("replyTo")) d.replyTo = RecipientList::fromJson(j["replyTo"]);
  d.subject = j.value("subject", "");
  d.isPlainText = j.value("isPlainText", false);
  d.body = j.value("body", "");
  d.plainTextBody = j.value("plainTextBody", "");
  if (j.contains("priority") && !j["priority"].is_null()) {
    string s = j["priority"].get<string>();
    d.priority = priorityFromString(s);
    if (!d.priority) {
      throw std::runtime_error("Unknown priority: " + s);
    }
  }
  if (j.contains("deliveryFormat")) {
    if (j["deliveryFormat"].is_null()) {
      d.deliveryFormat = DeliveryFormatOverride::byDefault();
    } else {
      string s = j["deliveryFormat"].get<string>();
      auto format = deliveryFormatFromString(s);
      if (!format) {
        throw std::runtime_error("Unknown delivery format: " + s);
      }
      d.deliveryFormat = DeliveryFormatOverride::of(*format);
    }
  }
  d.attachVCard.value = optionalBool(j, "attachVCard");
  d.deliveryStatusNotification = optionalBool(j, "deliveryStatusNotification");
  d.returnReceipt = optionalBool(j, "returnReceipt");
  if (j.contains("customHeaders") && j["customHeaders"].is_array()) {
    for (const auto& it : j["customHeaders"]) {
      d.customHeaders.push_back(CustomHeader(it.at("name").get<string>(),
                                             it.value("value", "")));
    }
  }
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (KNOWN_DETAIL_KEYS.find(it.key()) == KNOWN_DETAIL_KEYS.end()) {
      d.extra[it.key()] = it.value();
    }
  }
  return d;
}

int64_t Compose::tabId() const {
  if (tab.is_object() && tab.contains("id") && tab["id"].is_number_integer()) {
    return tab["id"].get<int64_t>();
  }
  return 0;
}

json Compose::toJson() const {
  json j;
  j["configuration"] = configuration.toJson();
  json w = json::array();
  for (const auto& warning : warnings) {
    w.push_back(warning.toJson());
  }
  j["warnings"] = w;
  j["tab"] = tab;
  j["composeDetails"] = composeDetails.toJson();
  return j;
}

Compose Compose::fromJson(const json& j) {
  Compose c;
  c.configuration = Configuration::fromJson(j.at("configuration"));
  if (j.contains("warnings") && j["warnings"].is_array()) {
    for (const auto& it : j["warnings"]) {
      c.warnings.push_back(Warning::fromJson(it));
    }
  }
  c.tab = j.at("tab");
  c.composeDetails = ComposeDetails::fromJson(j.at("composeDetails"));
  return c;
}

json Ping::toJson() const {
  json j;
  j["ping"] = ping;
  j["pong"] = pong;
  j["version"] = version;
  j["hostVersion"] = hostVersion;
  j["compatible"] = compatible;
  return j;
}

Ping Ping::fromJson(const json& j) {
  Ping p;
  p.ping = j.at("ping");
  p.pong = j.value("pong", json());
  p.version = j.value("version", "");
  return p;
}

json ErrorResponse::toJson() const {
  json j;
  j["tab"] = tab;
  j["reset"] = reset;
  j["title"] = title;
  j["message"] = message;
  return j;
}

bool isPing(const json& message) {
  return message.is_object() && message.contains("ping");
}

string priorityToString(Priority priority) {
  return PRIORITY_NAMES[int(priority)];
}

optional<Priority> priorityFromString(const string& s) {
  string lower = toLower(s);
  for (int a = 0; a < int(PRIORITY_NAMES.size()); a++) {
    if (PRIORITY_NAMES[a] == lower) {
      return Priority(a);
    }
  }
  return nullopt;
}

string deliveryFormatToString(DeliveryFormat format) {
  return DELIVERY_FORMAT_NAMES[int(format)];
}

optional<DeliveryFormat> deliveryFormatFromString(const string& s) {
  string lower = toLower(s);
  for (int a = 0; a < int(DELIVERY_FORMAT_NAMES.size()); a++) {
    if (DELIVERY_FORMAT_NAMES[a] == lower) {
      return DeliveryFormat(a);
    }
  }
  return nullopt;
}
}  // namespace eb
