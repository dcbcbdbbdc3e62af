#include "directives/Directives.h"

#include "rocket/TemplateMatcher.h"

#include <memory>
#include <utility>

namespace rocket::directives {

bool handleLet(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  if (call.argCount() == 0 || !call.arg(0).isList() || call.arg(0).items.size() % 2 != 0) {
    return error.fail(ErrorKind::Arity, ":let expects a list of name/value pairs followed by a body");
  }
  const std::vector<Expr> &pairs = call.arg(0).items;
  ScopeGuard scope(evaluator.scopes(), call.frame.scope);
  const EvalFrame inner{scope.id(), call.frame.documentPath};
  for (size_t i = 0; i < pairs.size(); i += 2) {
    std::string name;
    std::string value;
    if (!nameFromExpr(evaluator, pairs[i], inner, name, error) ||
        !evaluator.evaluate(pairs[i + 1], inner, value, error)) {
      return false;
    }
    if (!evaluator.scopes().define(
            scope.id(), name, Binding::macro(makeStringExpr(std::move(value), pairs[i].line, pairs[i].column)), error)) {
      return false;
    }
  }
  return evaluator.evaluateRange(call.expr.items, 2, inner, out, error);
}

bool handleDefine(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  const bool eager =
      call.argCount() == 3 && call.arg(0).kind == Expr::Kind::Symbol && call.arg(0).text == "evaluate";
  if (call.argCount() != 2 && !eager) {
    return failArity("define", "(name body) or (evaluate name body)", call.argCount(), error);
  }
  const size_t nameIndex = eager ? 1 : 0;
  std::string name;
  if (!nameFromExpr(evaluator, call.arg(nameIndex), call.frame, name, error)) {
    return false;
  }
  const Expr &body = call.arg(nameIndex + 1);
  Binding binding;
  if (eager) {
    std::string value;
    if (!evaluator.evaluate(body, call.frame, value, error)) {
      return false;
    }
    binding = Binding::macro(makeStringExpr(std::move(value), body.line, body.column));
  } else {
    binding = Binding::macro(body, call.frame.documentPath);
  }
  if (!evaluator.scopes().define(call.frame.scope, name, std::move(binding), error)) {
    return false;
  }
  out.clear();
  return true;
}

bool handleDefineTemplate(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  if (call.argCount() < 2 || !call.arg(1).isList()) {
    return error.fail(ErrorKind::Arity, ":define-template expects a name, a slot list and a body");
  }
  auto def = std::make_shared<TemplateDef>();
  if (!nameFromExpr(evaluator, call.arg(0), call.frame, def->name, error)) {
    return false;
  }
  for (const Expr &slotExpr : call.arg(1).items) {
    TemplateSlot slot;
    if (!compileTemplateSlot(slotExpr, slot, error)) {
      return false;
    }
    def->slots.push_back(std::move(slot));
  }
  def->body.assign(call.expr.items.begin() + 3, call.expr.items.end());
  def->documentPath = call.frame.documentPath;
  if (!evaluator.scopes().defineTemplate(call.frame.scope, std::move(def), error)) {
    return false;
  }
  out.clear();
  return true;
}

} // namespace rocket::directives
