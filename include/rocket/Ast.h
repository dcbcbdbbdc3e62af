#pragma once

#include <string>
#include <vector>

namespace rocket {

struct Expr {
  enum class Kind { Symbol, String, Number, List } kind = Kind::Symbol;
  // Symbol and number source text, or the decoded contents of a string literal.
  std::string text;
  std::vector<Expr> items;
  int line = 1;
  int column = 1;

  bool isList() const { return kind == Kind::List; }
  // A list whose head is a `:name` symbol is a directive invocation.
  bool isDirectiveCall() const {
    return kind == Kind::List && !items.empty() && items.front().kind == Kind::Symbol &&
           !items.front().text.empty() && items.front().text[0] == ':';
  }
  std::string directiveName() const { return isDirectiveCall() ? items.front().text.substr(1) : std::string(); }
};

inline Expr makeStringExpr(std::string text, int line = 1, int column = 1) {
  Expr expr;
  expr.kind = Expr::Kind::String;
  expr.text = std::move(text);
  expr.line = line;
  expr.column = column;
  return expr;
}

struct Document {
  std::string path;
  std::vector<Expr> expressions;
};

} // namespace rocket
