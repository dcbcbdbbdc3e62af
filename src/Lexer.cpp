#include "rocket/Lexer.h"

#include <cctype>

namespace rocket {

Lexer::Lexer(const std::string &source) : source_(source) {}

std::vector<Token> Lexer::tokenize() {
  std::vector<Token> tokens;
  while (true) {
    skipWhitespace();
    if (pos_ >= source_.size()) {
      tokens.push_back({TokenKind::End, "", line_, column_, pos_});
      break;
    }
    char c = source_[pos_];
    if (c == '(') {
      tokens.push_back({TokenKind::LParen, "(", line_, column_, pos_});
      advance();
    } else if (c == ')') {
      tokens.push_back({TokenKind::RParen, ")", line_, column_, pos_});
      advance();
    } else if (c == '"') {
      tokens.push_back(readString());
    } else if (c == ';') {
      tokens.push_back(readComment());
    } else if (startsNumber()) {
      tokens.push_back(readNumber());
    } else {
      tokens.push_back(readSymbol());
    }
  }
  return tokens;
}

static bool isAsciiDigit(char c) {
  return c >= '0' && c <= '9';
}

bool Lexer::isSymbolBody(char c) const {
  return std::isspace(static_cast<unsigned char>(c)) == 0 && c != '(' && c != ')' && c != '"';
}

bool Lexer::startsNumber() const {
  char c = source_[pos_];
  if (isAsciiDigit(c)) {
    return true;
  }
  return c == '-' && pos_ + 1 < source_.size() && isAsciiDigit(source_[pos_ + 1]);
}

void Lexer::skipWhitespace() {
  while (pos_ < source_.size() && std::isspace(static_cast<unsigned char>(source_[pos_]))) {
    advance();
  }
}

void Lexer::advance() {
  if (pos_ >= source_.size()) {
    return;
  }
  if (source_[pos_] == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  ++pos_;
}

Token Lexer::readSymbol() {
  int startLine = line_;
  int startColumn = column_;
  size_t start = pos_;
  while (pos_ < source_.size() && isSymbolBody(source_[pos_])) {
    advance();
  }
  return {TokenKind::Symbol, source_.substr(start, pos_ - start), startLine, startColumn, start};
}

Token Lexer::readNumber() {
  int startLine = line_;
  int startColumn = column_;
  size_t start = pos_;
  if (source_[pos_] == '-') {
    advance();
  }
  while (pos_ < source_.size() && isAsciiDigit(source_[pos_])) {
    advance();
  }
  if (pos_ + 1 < source_.size() && source_[pos_] == '.' && isAsciiDigit(source_[pos_ + 1])) {
    advance();
    while (pos_ < source_.size() && isAsciiDigit(source_[pos_])) {
      advance();
    }
  }
  if (pos_ < source_.size() && isSymbolBody(source_[pos_])) {
    // Words such as `1st` or `2.0.1` start like numbers but are plain symbols.
    while (pos_ < source_.size() && isSymbolBody(source_[pos_])) {
      advance();
    }
    return {TokenKind::Symbol, source_.substr(start, pos_ - start), startLine, startColumn, start};
  }
  return {TokenKind::Number, source_.substr(start, pos_ - start), startLine, startColumn, start};
}

Token Lexer::readString() {
  int startLine = line_;
  int startColumn = column_;
  size_t start = pos_;
  advance();
  while (pos_ < source_.size()) {
    char c = source_[pos_];
    if (c == '\\') {
      advance();
      if (pos_ < source_.size()) {
        advance();
      }
      continue;
    }
    if (c == '"') {
      advance();
      return {TokenKind::String, source_.substr(start, pos_ - start), startLine, startColumn, start};
    }
    advance();
  }
  return {TokenKind::Invalid, "unterminated string literal", startLine, startColumn, start};
}

Token Lexer::readComment() {
  int startLine = line_;
  int startColumn = column_;
  size_t start = pos_;
  while (pos_ < source_.size() && source_[pos_] != '\n') {
    advance();
  }
  return {TokenKind::Comment, source_.substr(start, pos_ - start), startLine, startColumn, start};
}

} // namespace rocket
