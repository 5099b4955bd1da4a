#include "HeaderCodec.hpp"

namespace eb {
const string RESERVED_PREFIX = "X-EditorBridge";
const string RESERVED_FIELD_PREFIX = RESERVED_PREFIX + "-";
const string TEMPLATE_PLACEHOLDER = "/path/to/temp.eml";

namespace {
HeaderDefinition makeDefinition(
    HeaderField field, const string& name, vector<string> extraAliases,
    function<optional<string>(const Compose&)> encode,
    function<bool(Compose&, const string&)> decode) {
  HeaderDefinition definition;
  definition.field = field;
  definition.name = name;
  definition.aliases.push_back(toLower(name));
  for (const auto& alias : extraAliases) {
    definition.aliases.push_back(alias);
  }
  definition.encode = encode;
  definition.decode = decode;
  return definition;
}

function<bool(Compose&, const string&)> appendTo(
    RecipientList ComposeDetails::*list) {
  return [list](Compose& c, const string& v) {
    (c.composeDetails.*list).add(HeaderCodec::decodeRecipient(v));
    return true;
  };
}

optional<string> encodeOptionalBool(const optional<bool>& value) {
  if (!value) {
    return nullopt;
  }
  return HeaderCodec::encodeBool(*value);
}

vector<HeaderDefinition> buildDefinitions() {
  vector<HeaderDefinition> d;
  d.push_back(makeDefinition(
      HeaderField::FROM, "From", {}, nullptr, [](Compose& c, const string& v) {
        c.composeDetails.from = HeaderCodec::decodeRecipient(v);
        return true;
      }));
  d.push_back(makeDefinition(HeaderField::TO, "To", {}, nullptr,
                             appendTo(&ComposeDetails::to)));
  d.push_back(makeDefinition(HeaderField::CC, "Cc", {}, nullptr,
                             appendTo(&ComposeDetails::cc)));
  d.push_back(makeDefinition(HeaderField::BCC, "Bcc", {}, nullptr,
                             appendTo(&ComposeDetails::bcc)));
  d.push_back(makeDefinition(HeaderField::REPLY_TO, "Reply-To", {}, nullptr,
                             appendTo(&ComposeDetails::replyTo)));
  d.push_back(makeDefinition(HeaderField::SUBJECT, "Subject", {}, nullptr,
                             [](Compose& c, const string& v) {
                               c.composeDetails.subject = v;
                               return true;
                             }));

  d.push_back(makeDefinition(
      HeaderField::PRIORITY, RESERVED_FIELD_PREFIX + "Priority", {},
      [](const Compose& c) -> optional<string> {
        if (!c.composeDetails.priority) {
          return nullopt;
        }
        return priorityToString(*c.composeDetails.priority);
      },
      [](Compose& c, const string& v) {
        auto priority = priorityFromString(v);
        if (!priority) {
          throw HeaderCodec::parseError(HeaderField::PRIORITY, v);
        }
        c.composeDetails.priority = priority;
        return true;
      }));
  d.push_back(makeDefinition(
      HeaderField::DELIVERY_FORMAT, RESERVED_FIELD_PREFIX + "Delivery-Format",
      {},
      [](const Compose& c) -> optional<string> {
        const auto& format = c.composeDetails.deliveryFormat;
        switch (format.state) {
          case DeliveryFormatOverride::State::ABSENT:
            return nullopt;
          case DeliveryFormatOverride::State::DEFAULT:
            return "[" + deliveryFormatToString(DeliveryFormat::AUTO) + "]";
          case DeliveryFormatOverride::State::VALUE:
            return deliveryFormatToString(format.value);
        }
        return nullopt;
      },
      [](Compose& c, const string& v) {
        if (HeaderCodec::unbracket(v)) {
          return true;
        }
        auto format = deliveryFormatFromString(v);
        if (!format) {
          throw HeaderCodec::parseError(HeaderField::DELIVERY_FORMAT, v);
        }
        c.composeDetails.deliveryFormat = DeliveryFormatOverride::of(*format);
        return true;
      }));
  d.push_back(makeDefinition(
      HeaderField::ATTACH_VCARD, RESERVED_FIELD_PREFIX + "Attach-vCard", {},
      [](const Compose& c) -> optional<string> {
        const auto& vcard = c.composeDetails.attachVCard;
        if (!vcard.value) {
          return nullopt;
        }
        string value = HeaderCodec::encodeBool(*vcard.value);
        return vcard.touched ? value : "[" + value + "]";
      },
      [](Compose& c, const string& v) {
        if (HeaderCodec::unbracket(v)) {
          return true;
        }
        auto value = HeaderCodec::decodeBool(v);
        if (!value) {
          throw HeaderCodec::parseError(HeaderField::ATTACH_VCARD, v);
        }
        c.composeDetails.attachVCard.set(*value);
        return true;
      }));
  d.push_back(makeDefinition(
      HeaderField::DELIVERY_STATUS_NOTIFICATION,
      RESERVED_FIELD_PREFIX + "Delivery-Status-Notification", {},
      [](const Compose& c) {
        return encodeOptionalBool(c.composeDetails.deliveryStatusNotification);
      },
      [](Compose& c, const string& v) {
        auto value = HeaderCodec::decodeBool(v);
        if (!value) {
          return false;
        }
        c.composeDetails.deliveryStatusNotification = value;
        return true;
      }));
  d.push_back(makeDefinition(
      HeaderField::RETURN_RECEIPT, RESERVED_FIELD_PREFIX + "Return-Receipt",
      {},
      [](const Compose& c) {
        return encodeOptionalBool(c.composeDetails.returnReceipt);
      },
      [](Compose& c, const string& v) {
        auto value = HeaderCodec::decodeBool(v);
        if (!value) {
          return false;
        }
        c.composeDetails.returnReceipt = value;
        return true;
      }));
  d.push_back(makeDefinition(
      HeaderField::ALLOW_CUSTOM_HEADERS,
      RESERVED_FIELD_PREFIX + "Allow-Custom-Headers",
      {"x-editorbridge-allow-x-headers"},
      [](const Compose& c) -> optional<string> {
        return HeaderCodec::encodeBool(
            c.configuration.allowCustomHeaders ||
            !c.composeDetails.customHeaders.empty());
      },
      [](Compose& c, const string& v) {
        auto value = HeaderCodec::decodeBool(v);
        if (!value) {
          return false;
        }
        c.configuration.allowCustomHeaders = *value;
        return true;
      }));
  d.push_back(makeDefinition(
      HeaderField::SEND_ON_EXIT, RESERVED_FIELD_PREFIX + "Send-On-Exit", {},
      [](const Compose& c) -> optional<string> {
        return HeaderCodec::encodeBool(c.configuration.sendOnExit);
      },
      [](Compose& c, const string& v) {
        // Anything but an exact "true" keeps the message unsent
        c.configuration.sendOnExit = (v == "true");
        return true;
      }));
  d.push_back(makeDefinition(
      HeaderField::CUSTOM_HEADER, RESERVED_FIELD_PREFIX + "Custom-Header",
      {"x-editorbridge-x-header"}, nullptr, [](Compose& c, const string& v) {
        auto colon = v.find(':');
        if (colon == string::npos) {
          return false;
        }
        string name = trim(v.substr(0, colon));
        if (name.empty()) {
          return false;
        }
        c.composeDetails.customHeaders.push_back(
            CustomHeader(name, trim(v.substr(colon + 1))));
        return true;
      }));
  d.push_back(makeDefinition(HeaderField::HELP, RESERVED_FIELD_PREFIX + "Help",
                             {}, nullptr,
                             [](Compose&, const string&) { return true; }));
  // Unpacked by the document parser, which resolves each packed field
  d.push_back(
      makeDefinition(HeaderField::META, RESERVED_PREFIX, {}, nullptr, nullptr));
  return d;
}
}  // namespace

const vector<HeaderDefinition>& HeaderCodec::definitions() {
  static const vector<HeaderDefinition> table = buildDefinitions();
  return table;
}

const HeaderDefinition* HeaderCodec::find(const string& name) {
  string key = toLower(trim(name));
  for (const auto& definition : definitions()) {
    for (const auto& alias : definition.aliases) {
      if (alias == key) {
        return &definition;
      }
    }
  }
  return NULL;
}

const HeaderDefinition& HeaderCodec::get(HeaderField field) {
  for (const auto& definition : definitions()) {
    if (definition.field == field) {
      return definition;
    }
  }
  STFATAL << "Header field missing from the vocabulary: " << int(field);
  throw std::runtime_error("Unreachable");
}

string HeaderCodec::encodeRecipient(const Recipient& recipient) {
  if (recipient.kind == Recipient::Kind::EMAIL) {
    return recipient.address;
  }
  string s = recipient.node.toJson().dump();
  s.erase(std::remove_if(s.begin(), s.end(),
                         [](char c) { return c == '\r' || c == '\n'; }),
          s.end());
  return s;
}

Recipient HeaderCodec::decodeRecipient(const string& value) {
  if (value.empty()) {
    throw HeaderParseException("EditorBridge failed to parse recipient: "
                               "empty value");
  }
  if (value[0] != '{') {
    return Recipient::email(value);
  }
  try {
    return Recipient::fromNode(RecipientNode::fromJson(json::parse(value)));
  } catch (const std::exception& e) {
    throw HeaderParseException("EditorBridge failed to parse recipient: " +
                               value + " (" + e.what() + ")");
  }
}

optional<string> HeaderCodec::unbracket(const string& value) {
  if (value.length() >= 2 && value.front() == '[' && value.back() == ']') {
    return value.substr(1, value.length() - 2);
  }
  return nullopt;
}

optional<bool> HeaderCodec::decodeBool(const string& value) {
  if (value == "true") {
    return true;
  }
  if (value == "false") {
    return false;
  }
  return nullopt;
}

HeaderParseException HeaderCodec::parseError(HeaderField field,
                                              const string& value) {
  return HeaderParseException("EditorBridge failed to parse " +
                              get(field).name + " value: " + value);
}

const vector<string>& HeaderCodec::helpLines() {
  static const vector<string> lines = {
      "Use one address per `To/Cc/Bcc/Reply-To` header",
      "    (e.g. two recipients require two `To:` headers).",
      "Remove surrounding brackets from header values",
      "    to override default settings.",
      "Custom header names must start with \"X-\".",
      "KEEP blank line below to separate headers from body.",
  };
  return lines;
}
}  // namespace eb
