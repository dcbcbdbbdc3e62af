#include "rocket/Parser.h"

#include "rocket/StringLiteral.h"

#include <string>
#include <utility>

namespace rocket {

bool Parser::parseExpr(Expr &out) {
  if (match(TokenKind::LParen)) {
    return parseList(out);
  }
  return parseAtom(out);
}

bool Parser::parseList(Expr &out) {
  const Token open = tokens_[pos_];
  if (listDepth_ >= kMaxListDepth) {
    return failAt(open, "lists nested deeper than " + std::to_string(kMaxListDepth) + " levels");
  }
  ++pos_;
  ++listDepth_;
  out.kind = Expr::Kind::List;
  out.line = open.line;
  out.column = open.column;
  out.items.clear();
  while (!match(TokenKind::RParen)) {
    if (match(TokenKind::End)) {
      return failAt(open, "unmatched '('");
    }
    Expr item;
    if (!parseExpr(item)) {
      return false;
    }
    out.items.push_back(std::move(item));
  }
  ++pos_;
  --listDepth_;
  return true;
}

bool Parser::parseAtom(Expr &out) {
  const Token &token = tokens_[pos_];
  out.line = token.line;
  out.column = token.column;
  switch (token.kind) {
  case TokenKind::Symbol:
    out.kind = Expr::Kind::Symbol;
    out.text = token.text;
    break;
  case TokenKind::Number:
    out.kind = Expr::Kind::Number;
    out.text = token.text;
    break;
  case TokenKind::String: {
    out.kind = Expr::Kind::String;
    std::string decodeError;
    if (!decodeStringLiteralText(token.text, out.text, decodeError)) {
      return fail(decodeError);
    }
    break;
  }
  case TokenKind::Invalid:
    return fail(token.text);
  default:
    return fail("expected expression");
  }
  ++pos_;
  return true;
}

} // namespace rocket
