#pragma once

#include <string>
#include <vector>

#include "rocket/Token.h"

namespace rocket {

class Lexer {
public:
  explicit Lexer(const std::string &source);

  std::vector<Token> tokenize();

private:
  bool isSymbolBody(char c) const;
  bool startsNumber() const;
  void skipWhitespace();
  void advance();

  Token readSymbol();
  Token readNumber();
  Token readString();
  Token readComment();

  const std::string &source_;
  size_t pos_ = 0;
  int line_ = 1;
  int column_ = 1;
};

} // namespace rocket
