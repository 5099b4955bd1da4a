#include "MetaHeader.hpp"

namespace eb {
namespace {
const string NAME_DELIMITER = ": ";
const string COLUMN_DELIMITER = ", ";
}  // namespace

vector<string> MetaHeader::alignHeaders(const vector<string>& headers,
                                        int numColumns) {
  vector<pair<string, string>> entries;
  for (const auto& header : headers) {
    auto pos = header.find(NAME_DELIMITER);
    if (pos == string::npos) {
      VLOG(1) << "Not aligning header without delimiter: " << header;
      continue;
    }
    entries.push_back(make_pair(trim(header.substr(0, pos)),
                                trim(header.substr(pos + NAME_DELIMITER.length()))));
  }

  vector<size_t> widths(numColumns, 0);
  int column = 0;
  for (const auto& it : entries) {
    widths[column] = max(widths[column], it.first.length());
    column = (column + 1) % numColumns;
    widths[column] = max(widths[column], it.second.length());
    column = (column + 1) % numColumns;
  }

  vector<string> lines;
  column = 0;
  for (size_t a = 0; a < entries.size(); a++) {
    const string& name = entries[a].first;
    const string& value = entries[a].second;
    if (column == 0) {
      lines.push_back("");
    }
    string& line = lines.back();
    line += name + NAME_DELIMITER + string(widths[column] - name.length(), ' ');
    column++;
    line += value;
    if (column < numColumns - 1 && a + 1 < entries.size()) {
      line += string(widths[column] - value.length(), ' ') + COLUMN_DELIMITER;
    }
    column = (column + 1) % numColumns;
  }
  return lines;
}

bool MetaHeader::isCompactable(const string& name, const string& value) {
  return startsWithIgnoreCase(name, RESERVED_FIELD_PREFIX) &&
         value.find(',') == string::npos && value.find(':') == string::npos;
}

string MetaHeader::pack(const vector<pair<string, string>>& headers) {
  string packed;
  for (const auto& it : headers) {
    if (!packed.empty()) {
      packed += COLUMN_DELIMITER;
    }
    string field = it.first;
    if (startsWithIgnoreCase(field, RESERVED_FIELD_PREFIX)) {
      field = field.substr(RESERVED_FIELD_PREFIX.length());
    }
    packed += field + NAME_DELIMITER + it.second;
  }
  return packed;
}

vector<pair<string, string>> MetaHeader::unpack(const string& value) {
  vector<pair<string, string>> headers;
  for (const auto& segment : split(value, ',')) {
    string s = trim(segment);
    if (s.empty()) {
      continue;
    }
    auto colon = s.find(':');
    string field = trim(s.substr(0, colon));
    if (colon == string::npos || field.empty()) {
      LOG(WARNING) << "Dropping malformed meta header segment: " << s;
      continue;
    }
    headers.push_back(
        make_pair(RESERVED_FIELD_PREFIX + field, trim(s.substr(colon + 1))));
  }
  return headers;
}

bool MetaHeader::collidesWithReserved(const string& name) {
  string lower = toLower(trim(name));
  return lower == toLower(RESERVED_PREFIX) ||
         startsWithIgnoreCase(lower, RESERVED_FIELD_PREFIX);
}

string MetaHeader::escapeCustomHeaderName(const string& name) {
  if (collidesWithReserved(name)) {
    return RESERVED_FIELD_PREFIX + name;
  }
  return name;
}

optional<string> MetaHeader::unescapeCustomHeaderName(const string& name) {
  if (!startsWithIgnoreCase(name, RESERVED_FIELD_PREFIX)) {
    return nullopt;
  }
  string original = name.substr(RESERVED_FIELD_PREFIX.length());
  if (!collidesWithReserved(original)) {
    return nullopt;
  }
  return CustomHeader::canonicalName(original);
}
}  // namespace eb
