#pragma once

#include <string>
#include <vector>

#include "rocket/Ast.h"
#include "rocket/Error.h"
#include "rocket/Token.h"

namespace rocket {

class Parser {
public:
  // Lists nested deeper than this are a syntax error.
  static constexpr int kMaxListDepth = 256;

  Parser(std::vector<Token> tokens, std::string path);

  bool parse(Document &document, Error &error);
  // Parses one expression from the front of the stream; `endOffset` is the source offset just past it.
  bool parseLeading(Expr &expr, size_t &endOffset, Error &error);

private:
  bool parseExpr(Expr &out);
  bool parseList(Expr &out);
  bool parseAtom(Expr &out);

  void skipComments();
  bool match(TokenKind kind);
  bool fail(const std::string &message);
  bool failAt(const Token &token, const std::string &message);

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  int listDepth_ = 0;
  std::string path_;
  Error *error_ = nullptr;
};

// Lexes and parses `source`; `path` is recorded on the document and in syntax error locations.
bool parseDocument(const std::string &source, const std::string &path, Document &out, Error &error);

} // namespace rocket
