#pragma once

#include <cstdint>
#include <string>

namespace drop_common
{

/// JSON 문자열 리터럴 안에 넣을 수 있게 escape
inline std::string json_escape(const std::string & value)
{
  std::string out;
  out.reserve(value.size() + 16);
  for (const char c : value) {
    switch (c) {
      case '\"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          static const char * hex = "0123456789abcdef";
          out += "\\u00";
          out.push_back(hex[(c >> 4) & 0x0F]);
          out.push_back(hex[c & 0x0F]);
        } else {
          out.push_back(c);
        }
        break;
    }
  }
  return out;
}

/// JSON 문서에서 첫 "field":"value" 문자열을 꺼낸다.
/// chat completion 응답은 첫 "content" 값만 필요하므로
/// 전체 파서 대신 단순 스캐너로 둔다.
inline bool extract_json_string_field(
  const std::string & json, const std::string & field, std::string & out)
{
  const std::string key = "\"" + field + "\"";
  size_t search_from = 0;
  while (true) {
    const size_t key_pos = json.find(key, search_from);
    if (key_pos == std::string::npos) {
      return false;
    }
    size_t pos = key_pos + key.size();
    while (pos < json.size() && (json[pos] == ' ' || json[pos] == '\n' || json[pos] == '\t' || json[pos] == '\r')) {
      ++pos;
    }
    if (pos >= json.size() || json[pos] != ':') {
      search_from = key_pos + key.size();
      continue;
    }
    ++pos;
    while (pos < json.size() && (json[pos] == ' ' || json[pos] == '\n' || json[pos] == '\t' || json[pos] == '\r')) {
      ++pos;
    }
    if (pos >= json.size() || json[pos] != '"') {
      // "content": null 같은 경우
      search_from = pos;
      continue;
    }

    std::string value;
    bool escaping = false;
    for (size_t i = pos + 1; i < json.size(); ++i) {
      const char c = json[i];
      if (escaping) {
        switch (c) {
          case 'n':
            value.push_back('\n');
            break;
          case 'r':
            value.push_back('\r');
            break;
          case 't':
            value.push_back('\t');
            break;
          case 'u':
            // 한 단어 응답에는 non-ASCII escape가 필요 없음
            if (i + 4 < json.size()) {
              uint32_t code = 0;
              bool valid = true;
              for (size_t k = i + 1; k <= i + 4; ++k) {
                const char h = json[k];
                code <<= 4;
                if (h >= '0' && h <= '9') {
                  code |= static_cast<uint32_t>(h - '0');
                } else if (h >= 'a' && h <= 'f') {
                  code |= static_cast<uint32_t>(h - 'a' + 10);
                } else if (h >= 'A' && h <= 'F') {
                  code |= static_cast<uint32_t>(h - 'A' + 10);
                } else {
                  valid = false;
                }
              }
              if (valid && code < 0x80) {
                value.push_back(static_cast<char>(code));
              }
              i += 4;
            }
            break;
          default:
            value.push_back(c);
            break;
        }
        escaping = false;
        continue;
      }
      if (c == '\\') {
        escaping = true;
        continue;
      }
      if (c == '"') {
        out = value;
        return true;
      }
      value.push_back(c);
    }
    return false;
  }
}

}  // namespace drop_common
