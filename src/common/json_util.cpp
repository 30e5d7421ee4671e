#include "shellwarden/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <sstream>

namespace shellwarden::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::optional<std::uint32_t> parse_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    value <<= 4;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

std::size_t scan_scalar_end(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
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
        static const char *hex = "0123456789abcdef";
        escaped += "\\u00";
        escaped.push_back(hex[(ch >> 4) & 0x0F]);
        escaped.push_back(hex[ch & 0x0F]);
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
      const auto code_point = parse_hex4(raw, i + 1);
      if (!code_point.has_value()) {
        out.push_back(next);
        break;
      }
      append_utf8(out, *code_point);
      i += 4;
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
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      i = end;
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

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return result;
  }

  ++pos;
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      break;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      break;
    }

    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        break;
      }
      result[key] = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open, close);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const std::size_t start = pos;
      pos = scan_scalar_end(json, pos);
      result[key] = json.substr(start, pos - start);
    }
  }

  return result;
}

std::optional<std::vector<std::string>> json_parse_string_array(const std::string &array_json) {
  const std::size_t open = json_skip_ws(array_json, 0);
  if (open >= array_json.size() || array_json[open] != '[') {
    return std::nullopt;
  }
  const auto close = json_find_matching_token(array_json, open, '[', ']');
  if (close == std::string::npos) {
    return std::nullopt;
  }

  std::vector<std::string> out;
  std::size_t pos = open + 1;
  while (pos < close) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= close) {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    if (array_json[pos] != '"') {
      return std::nullopt;
    }
    const auto end = json_find_string_end(array_json, pos);
    if (end == std::string::npos || end > close) {
      return std::nullopt;
    }
    out.push_back(json_unescape(array_json.substr(pos + 1, end - pos - 1)));
    pos = end + 1;
  }
  return out;
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << '"' << json_escape(values[i]) << '"';
  }
  out << ']';
  return out.str();
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  const std::size_t open = json_skip_ws(array_json, 0);
  if (open >= array_json.size() || array_json[open] != '[') {
    return out;
  }
  const auto close = json_find_matching_token(array_json, open, '[', ']');
  if (close == std::string::npos) {
    return out;
  }

  for (std::size_t i = open + 1; i < close; ++i) {
    const char ch = array_json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(array_json, i);
      if (end == std::string::npos) {
        break;
      }
      i = end;
      continue;
    }
    if (ch == '{') {
      const auto end = json_find_matching_token(array_json, i, '{', '}');
      if (end == std::string::npos) {
        break;
      }
      out.push_back(array_json.substr(i, end - i + 1));
      i = end;
    }
  }
  return out;
}

std::string json_extract_first_object(const std::string &text) {
  for (std::size_t pos = text.find('{'); pos != std::string::npos; pos = text.find('{', pos + 1)) {
    const auto end = json_find_matching_token(text, pos, '{', '}');
    if (end != std::string::npos) {
      return text.substr(pos, end - pos + 1);
    }
  }
  return "";
}

} // namespace shellwarden::common
