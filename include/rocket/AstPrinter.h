#pragma once

#include <string>

#include "rocket/Ast.h"

namespace rocket {

class AstPrinter {
public:
  std::string print(const Document &document) const;
  std::string print(const Expr &expr) const;
};

} // namespace rocket
