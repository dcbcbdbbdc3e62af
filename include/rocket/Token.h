#pragma once

#include <cstddef>
#include <string>

namespace rocket {

enum class TokenKind {
  LParen,
  RParen,
  String,
  Number,
  Symbol,
  Comment,
  Invalid,
  End
};

struct Token {
  TokenKind kind = TokenKind::End;
  std::string text;
  int line = 1;
  int column = 1;
  size_t offset = 0;
};

} // namespace rocket
