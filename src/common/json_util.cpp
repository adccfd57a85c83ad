#include "engram/common/json_util.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace engram::common {

namespace {

void append_utf8(std::string &out, unsigned int cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool parse_hex4(const std::string &raw, std::size_t pos, unsigned int &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    out <<= 4;
    if (ch >= '0' && ch <= '9') {
      out |= static_cast<unsigned int>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      out |= static_cast<unsigned int>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      out |= static_cast<unsigned int>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

std::size_t scalar_end(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

bool is_json_scalar(const std::string &token) {
  if (token == "true" || token == "false" || token == "null") {
    return true;
  }
  char *parse_end = nullptr;
  const double value = std::strtod(token.c_str(), &parse_end);
  return !token.empty() && parse_end == token.c_str() + token.size() && std::isfinite(value);
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      unsigned int cp = 0;
      if (!parse_hex4(raw, i + 1, cp)) {
        out.push_back(next);
        break;
      }
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        unsigned int low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  std::size_t key_pos = json.find(quoted);
  while (key_pos != std::string::npos) {
    // Only a quoted token followed by ':' is a key; "object":"embedding" is not.
    const std::size_t colon = json_skip_ws(json, key_pos + quoted.size());
    if (colon < json.size() && json[colon] == ':') {
      const std::size_t pos = json_skip_ws(json, colon + 1);
      if (pos < json.size() && json[pos] == '[') {
        const auto end = json_find_matching_token(json, pos, '[', ']');
        if (end == std::string::npos) {
          return "";
        }
        return json.substr(pos, end - pos + 1);
      }
    }
    key_pos = json.find(quoted, key_pos + quoted.size());
  }
  return "";
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> objects;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return objects;
  }
  ++pos;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    if (array_json[pos] != '{') {
      ++pos;
      continue;
    }
    const auto end = json_find_matching_token(array_json, pos, '{', '}');
    if (end == std::string::npos) {
      break;
    }
    objects.push_back(array_json.substr(pos, end - pos + 1));
    pos = end + 1;
  }
  return objects;
}

Result<std::vector<double>> json_parse_number_array(const std::string &array_json) {
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return Result<std::vector<double>>::failure("expected JSON array");
  }
  ++pos;

  std::vector<double> values;
  bool expect_value = true;
  while (true) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size()) {
      return Result<std::vector<double>>::failure("unterminated JSON array");
    }
    const char ch = array_json[pos];
    if (ch == ']') {
      if (expect_value && !values.empty()) {
        return Result<std::vector<double>>::failure("trailing comma in JSON array");
      }
      break;
    }
    if (ch == ',') {
      if (expect_value) {
        return Result<std::vector<double>>::failure("unexpected comma in JSON array");
      }
      expect_value = true;
      ++pos;
      continue;
    }
    if (!expect_value) {
      return Result<std::vector<double>>::failure("missing comma in JSON array");
    }

    const std::size_t end = scalar_end(array_json, pos);
    const std::string token = array_json.substr(pos, end - pos);
    char *parse_end = nullptr;
    const double value = std::strtod(token.c_str(), &parse_end);
    if (token.empty() || parse_end != token.c_str() + token.size() || !std::isfinite(value)) {
      return Result<std::vector<double>>::failure("invalid number in JSON array: " + token);
    }
    values.push_back(value);
    expect_value = false;
    pos = end;
  }

  return Result<std::vector<double>>::success(std::move(values));
}

Result<JsonFlatMap> json_parse_flat(const std::string &json) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return Result<JsonFlatMap>::failure("expected JSON object");
  }
  const auto close = json_find_matching_token(json, pos, '{', '}');
  if (close == std::string::npos || json_skip_ws(json, close + 1) != json.size()) {
    return Result<JsonFlatMap>::failure("unterminated JSON object");
  }

  JsonFlatMap result;
  ++pos;
  while (pos < close) {
    pos = json_skip_ws(json, pos);
    if (pos >= close) {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      return Result<JsonFlatMap>::failure("expected key at offset " + std::to_string(pos));
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos || key_end >= close) {
      return Result<JsonFlatMap>::failure("unterminated key");
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= close || json[pos] != ':') {
      return Result<JsonFlatMap>::failure("expected ':' after key " + key);
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= close) {
      return Result<JsonFlatMap>::failure("missing value for key " + key);
    }

    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos || val_end >= close) {
        return Result<JsonFlatMap>::failure("unterminated value for key " + key);
      }
      result[key] = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close_ch = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open, close_ch);
      if (end == std::string::npos || end >= close) {
        return Result<JsonFlatMap>::failure("unterminated nested value for key " + key);
      }
      result[key] = JsonFlatValue::raw(json.substr(pos, end - pos + 1));
      pos = end + 1;
    } else {
      const std::size_t end = scalar_end(json, pos);
      const std::string token = json.substr(pos, end - pos);
      if (!is_json_scalar(token)) {
        return Result<JsonFlatMap>::failure("invalid value for key " + key);
      }
      result[key] = JsonFlatValue::raw(token);
      pos = end;
    }
  }

  return Result<JsonFlatMap>::success(std::move(result));
}

std::string JsonFlatValue::to_json() const {
  if (is_string_) {
    return "\"" + json_escape(text_) + "\"";
  }
  return text_.empty() ? std::string("null") : text_;
}

std::string json_serialize_flat(const JsonFlatMap &values) {
  std::string out = "{";
  bool first = true;
  for (const auto &[key, value] : values) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    out += "\"" + json_escape(key) + "\":" + value.to_json();
  }
  out.push_back('}');
  return out;
}

} // namespace engram::common
