#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "rocket/Ast.h"
#include "rocket/Error.h"

namespace rocket {

class Evaluator;
struct EvalFrame;

struct DirectiveCall {
  const Expr &expr;
  const EvalFrame &frame;

  size_t argCount() const { return expr.items.empty() ? 0 : expr.items.size() - 1; }
  const Expr &arg(size_t index) const { return expr.items[index + 1]; }
};

// Handlers receive their arguments unevaluated and evaluate what they need through the evaluator.
using DirectiveHandler = bool (*)(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);

class DirectiveRegistry {
public:
  void add(std::string name, DirectiveHandler handler);
  DirectiveHandler find(const std::string &name) const;
  std::vector<std::string> names() const;

private:
  std::unordered_map<std::string, DirectiveHandler> handlers_;
};

DirectiveRegistry makeBuiltinRegistry();

} // namespace rocket
