#include "rocket/Parser.h"

#include "rocket/Lexer.h"

#include <utility>

namespace rocket {

Parser::Parser(std::vector<Token> tokens, std::string path) : tokens_(std::move(tokens)), path_(std::move(path)) {}

bool Parser::parse(Document &document, Error &error) {
  error_ = &error;
  document.path = path_;
  document.expressions.clear();
  while (!match(TokenKind::End)) {
    if (match(TokenKind::RParen)) {
      return fail("unexpected ')'");
    }
    Expr expr;
    if (!parseExpr(expr)) {
      return false;
    }
    document.expressions.push_back(std::move(expr));
  }
  return true;
}

bool Parser::parseLeading(Expr &expr, size_t &endOffset, Error &error) {
  error_ = &error;
  if (match(TokenKind::End)) {
    return fail("expected expression");
  }
  if (!parseExpr(expr)) {
    return false;
  }
  const Token &last = tokens_[pos_ - 1];
  endOffset = last.offset + last.text.size();
  return true;
}

void Parser::skipComments() {
  while (tokens_[pos_].kind == TokenKind::Comment) {
    ++pos_;
  }
}

bool Parser::match(TokenKind kind) {
  skipComments();
  return tokens_[pos_].kind == kind;
}

bool Parser::fail(const std::string &message) {
  return failAt(tokens_[pos_], message);
}

bool Parser::failAt(const Token &token, const std::string &message) {
  if (error_) {
    error_->fail(ErrorKind::Syntax, token.kind == TokenKind::Invalid ? token.text : message);
    error_->addLocation(path_, token.line, token.column);
  }
  return false;
}

bool parseDocument(const std::string &source, const std::string &path, Document &out, Error &error) {
  Lexer lexer(source);
  Parser parser(lexer.tokenize(), path);
  return parser.parse(out, error);
}

} // namespace rocket
