#pragma once

#include <string>

namespace rocket {

inline bool decodeStringLiteralText(const std::string &literal, std::string &decoded, std::string &error) {
  if (literal.size() < 2 || literal.front() != '"' || literal.back() != '"') {
    error = "invalid string literal";
    return false;
  }
  decoded.clear();
  decoded.reserve(literal.size() - 2);
  for (size_t i = 1; i + 1 < literal.size(); ++i) {
    char c = literal[i];
    if (c == '\\' && i + 2 < literal.size()) {
      char next = literal[++i];
      switch (next) {
        case 'n':
          decoded.push_back('\n');
          break;
        case 't':
          decoded.push_back('\t');
          break;
        case '\\':
          decoded.push_back('\\');
          break;
        case '"':
          decoded.push_back('"');
          break;
        default:
          decoded.push_back(next);
          break;
      }
    } else {
      decoded.push_back(c);
    }
  }
  return true;
}

inline std::string encodeStringLiteral(const std::string &text) {
  std::string encoded = "\"";
  encoded.reserve(text.size() + 2);
  for (char c : text) {
    switch (c) {
      case '"':
        encoded += "\\\"";
        break;
      case '\\':
        encoded += "\\\\";
        break;
      case '\n':
        encoded += "\\n";
        break;
      case '\t':
        encoded += "\\t";
        break;
      default:
        encoded.push_back(c);
        break;
    }
  }
  encoded.push_back('"');
  return encoded;
}

} // namespace rocket
