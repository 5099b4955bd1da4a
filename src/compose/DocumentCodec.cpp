#include "DocumentCodec.hpp"

namespace eb {
namespace {
const string CRLF = "\r\n";
const string UNKNOWN_HEADERS_TITLE = "Unknown header(s) found";
const string UNKNOWN_HEADERS_MESSAGE =
    "EditorBridge did not recognise the following headers:";

// Header values must stay on one line
string singleLine(string value) {
  replace_if(
      value.begin(), value.end(), [](char c) { return c == '\r' || c == '\n'; },
      ' ');
  return value;
}

void addRecipients(vector<string>& lines, const string& name,
                   const RecipientList& list) {
  if (list.recipients.empty()) {
    // Present but cleared
    lines.push_back(name + ": ");
    return;
  }
  for (const auto& recipient : list.recipients) {
    lines.push_back(name + ": " +
                    singleLine(HeaderCodec::encodeRecipient(recipient)));
  }
}
}  // namespace

void DocumentCodec::render(const Compose& compose, ostream& out) {
  const auto& details = compose.composeDetails;
  vector<string> lines;
  lines.push_back("From: " +
                  singleLine(HeaderCodec::encodeRecipient(details.from)));
  addRecipients(lines, "To", details.to);
  addRecipients(lines, "Cc", details.cc);
  addRecipients(lines, "Bcc", details.bcc);
  addRecipients(lines, "Reply-To", details.replyTo);
  lines.push_back("Subject: " + singleLine(details.subject));

  vector<pair<string, string>> reserved;
  for (const auto& definition : HeaderCodec::definitions()) {
    if (!definition.encode) {
      continue;
    }
    auto value = definition.encode(compose);
    if (value) {
      reserved.push_back(make_pair(definition.name, *value));
    }
  }
  vector<pair<string, string>> custom;
  for (const auto& header : details.customHeaders) {
    custom.push_back(make_pair(MetaHeader::escapeCustomHeaderName(header.name),
                               singleLine(header.value)));
  }

  if (compose.configuration.metaHeaders) {
    vector<pair<string, string>> packed;
    vector<string> unpacked;
    for (const auto* group : {&reserved, &custom}) {
      for (const auto& it : *group) {
        if (MetaHeader::isCompactable(it.first, it.second)) {
          packed.push_back(it);
        } else {
          unpacked.push_back(it.first + ": " + it.second);
        }
      }
    }
    if (!packed.empty()) {
      lines.push_back(RESERVED_PREFIX + ": " + MetaHeader::pack(packed));
    }
    lines.insert(lines.end(), unpacked.begin(), unpacked.end());
  } else {
    vector<string> reservedLines;
    for (const auto& it : reserved) {
      reservedLines.push_back(it.first + ": " + it.second);
    }
    for (const auto& line : MetaHeader::alignHeaders(reservedLines, 2)) {
      lines.push_back(line);
    }
    for (const auto& it : custom) {
      lines.push_back(it.first + ": " + it.second);
    }
  }

  if (!compose.configuration.suppressHelpHeaders) {
    const string& helpName = HeaderCodec::get(HeaderField::HELP).name;
    for (const auto& help : HeaderCodec::helpLines()) {
      lines.push_back(helpName + ": " + help);
    }
  }

  for (const auto& line : lines) {
    out << line << CRLF;
  }
  out << CRLF;
  out << normalizeLineEndings(details.getBody());
}

string DocumentCodec::render(const Compose& compose) {
  ostringstream oss;
  render(compose, oss);
  return oss.str();
}

void DocumentCodec::parse(Compose& compose, istream& in) {
  auto& details = compose.composeDetails;
  details.to.clear();
  details.cc.clear();
  details.bcc.clear();
  details.replyTo.clear();
  details.customHeaders.clear();
  compose.configuration.sendOnExit = false;

  vector<string> unknownHeaders;
  string line;
  while (getline(in, line)) {
    string header = trim(toValidUtf8(line));
    if (header.empty()) {
      break;
    }
    auto colon = header.find(':');
    if (colon == string::npos) {
      LOG(WARNING) << "Ignoring header line without a colon: " << header;
      continue;
    }
    applyHeader(compose, header.substr(0, colon), header.substr(colon + 1),
                unknownHeaders);
  }

  if (!compose.configuration.allowCustomHeaders) {
    for (const auto& header : details.customHeaders) {
      unknownHeaders.push_back(header.name);
    }
    details.customHeaders.clear();
  }
  if (!unknownHeaders.empty()) {
    Warning warning;
    warning.title = UNKNOWN_HEADERS_TITLE;
    warning.message = UNKNOWN_HEADERS_MESSAGE;
    for (const auto& name : unknownHeaders) {
      warning.message += "\n- " + name;
    }
    LOG(INFO) << warning.message;
    compose.warnings.push_back(warning);
  }
  if (!compose.warnings.empty()) {
    compose.configuration.sendOnExit = false;
  }

  string body((istreambuf_iterator<char>(in)), istreambuf_iterator<char>());
  details.setBody(toValidUtf8(body));
}

void DocumentCodec::parse(Compose& compose, const string& document) {
  istringstream iss(document);
  parse(compose, iss);
}

string DocumentCodec::normalizeLineEndings(const string& text) {
  string result;
  result.reserve(text.length());
  for (size_t a = 0; a < text.length(); a++) {
    if (text[a] == '\n' && (a == 0 || text[a - 1] != '\r')) {
      result.push_back('\r');
    }
    result.push_back(text[a]);
  }
  return result;
}

void DocumentCodec::applyHeader(Compose& compose, const string& rawName,
                                const string& rawValue,
                                vector<string>& unknownHeaders) {
  string name = trim(rawName);
  string value = trim(rawValue);
  if (value.empty()) {
    VLOG(1) << "Skipping empty header: " << name;
    return;
  }

  const HeaderDefinition* definition = HeaderCodec::find(name);
  if (definition && definition->field == HeaderField::META) {
    for (const auto& it : MetaHeader::unpack(value)) {
      applyHeader(compose, it.first, it.second, unknownHeaders);
    }
    return;
  }

  auto unescaped = MetaHeader::unescapeCustomHeaderName(name);
  if (unescaped) {
    compose.composeDetails.customHeaders.push_back(
        CustomHeader(*unescaped, value));
    return;
  }

  if (definition) {
    if (!definition->decode(compose, value)) {
      LOG(WARNING) << "Invalid value for " << definition->name << ": "
                   << value;
      unknownHeaders.push_back(name);
    }
    return;
  }

  if (MetaHeader::collidesWithReserved(name)) {
    // A misspelled reserved header must not pass as a custom one
    unknownHeaders.push_back(name);
  } else if (startsWithIgnoreCase(name, "x-")) {
    compose.composeDetails.customHeaders.push_back(CustomHeader(name, value));
  } else {
    unknownHeaders.push_back(name);
  }
}
}  // namespace eb
