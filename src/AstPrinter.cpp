#include "rocket/AstPrinter.h"

#include "rocket/StringLiteral.h"

#include <sstream>

namespace rocket {

namespace {
void printExpr(std::ostringstream &out, const Expr &expr) {
  switch (expr.kind) {
  case Expr::Kind::Symbol:
  case Expr::Kind::Number:
    out << expr.text;
    break;
  case Expr::Kind::String:
    out << encodeStringLiteral(expr.text);
    break;
  case Expr::Kind::List:
    out << "(";
    for (size_t i = 0; i < expr.items.size(); ++i) {
      if (i > 0) {
        out << " ";
      }
      printExpr(out, expr.items[i]);
    }
    out << ")";
    break;
  }
}
} // namespace

std::string AstPrinter::print(const Document &document) const {
  std::string out;
  for (const auto &expr : document.expressions) {
    out += print(expr);
    out += "\n";
  }
  return out;
}

std::string AstPrinter::print(const Expr &expr) const {
  std::ostringstream out;
  printExpr(out, expr);
  return out.str();
}

} // namespace rocket
