#include "directives/Directives.h"

#include <memory>

namespace rocket::directives {
namespace {

bool evaluateDocumentAt(Evaluator &evaluator,
                        const DirectiveCall &call,
                        const std::string &requested,
                        bool mergeDefinitions,
                        std::string &out,
                        Error &error) {
  IncludeResolver &resolver = evaluator.resolver();
  const std::string canonical = resolver.resolvePath(requested, call.frame.documentPath);
  IncludeResolver::ActiveGuard active(resolver);
  std::shared_ptr<const Document> document;
  if (!active.enter(canonical, error) || !resolver.load(canonical, document, error)) {
    return false;
  }
  ScopeGuard scope(evaluator.scopes(), evaluator.rootScope());
  if (!evaluator.evaluateRange(document->expressions, 0, {scope.id(), document->path}, out, error)) {
    return false;
  }
  if (mergeDefinitions) {
    return evaluator.scopes().mergeInto(scope.id(), call.frame.scope, error);
  }
  return true;
}

bool runDocumentDirective(Evaluator &evaluator,
                          const DirectiveCall &call,
                          const std::string &directive,
                          bool mergeDefinitions,
                          std::string &out,
                          Error &error) {
  if (call.argCount() != 1) {
    return failArity(directive, "1 argument", call.argCount(), error);
  }
  std::string requested;
  if (!evaluateArg(evaluator, call, 0, requested, error)) {
    return false;
  }
  if (!evaluateDocumentAt(evaluator, call, requested, mergeDefinitions, out, error)) {
    error.addLocation(call.frame.documentPath, call.expr.line, call.expr.column);
    return false;
  }
  return true;
}

} // namespace

bool handleInclude(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  return runDocumentDirective(evaluator, call, "include", false, out, error);
}

bool handleImport(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  std::string discarded;
  if (!runDocumentDirective(evaluator, call, "import", true, discarded, error)) {
    return false;
  }
  out.clear();
  return true;
}

} // namespace rocket::directives
