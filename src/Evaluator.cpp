#include "rocket/Evaluator.h"

#include "rocket/Lexer.h"
#include "rocket/Parser.h"
#include "rocket/TemplateMatcher.h"

#include <cctype>
#include <utility>

namespace rocket {

namespace {
// Stand-in for the title of a reference resolved after evaluation.
constexpr char kReferenceOpen = '\x01';
constexpr char kReferenceClose = '\x02';

// `(:` starts an embedded call only when a directive name follows it directly, so prose such as
// "(: yes" stays text.
bool opensEmbeddedCall(const std::string &text, size_t pos) {
  if (pos + 2 >= text.size()) {
    return false;
  }
  const char next = text[pos + 2];
  return !std::isspace(static_cast<unsigned char>(next)) && next != '(' && next != ')' && next != '"';
}

size_t findEmbeddedCall(const std::string &text, size_t from) {
  size_t pos = text.find("(:", from);
  while (pos != std::string::npos && !opensEmbeddedCall(text, pos)) {
    pos = text.find("(:", pos + 1);
  }
  return pos;
}

void relocate(Expr &expr, int line, int column) {
  expr.line = line;
  expr.column = column;
  for (auto &item : expr.items) {
    relocate(item, line, column);
  }
}
} // namespace

Evaluator::Evaluator(Collaborators collaborators, EvaluatorOptions options)
    : collaborators_(std::move(collaborators)),
      options_(options),
      registry_(makeBuiltinRegistry()),
      resolver_(collaborators_.loader ? *collaborators_.loader : emptyLoader_) {}

bool Evaluator::DepthGuard::enter(Error &error) {
  if (evaluator_.depth_ >= evaluator_.options_.recursionLimit) {
    return error.fail(ErrorKind::RecursionLimit,
                      "recursion limit of " + std::to_string(evaluator_.options_.recursionLimit) + " exceeded");
  }
  ++evaluator_.depth_;
  entered_ = true;
  return true;
}

bool Evaluator::compileFile(const std::string &path, std::string &out, Error &error) {
  const std::string canonical = resolver_.resolvePath(path, "");
  IncludeResolver::ActiveGuard active(resolver_);
  std::shared_ptr<const Document> document;
  if (!active.enter(canonical, error) || !resolver_.load(canonical, document, error)) {
    return false;
  }
  return evaluateDocument(*document, out, error);
}

bool Evaluator::compileSource(const std::string &source, const std::string &path, std::string &out, Error &error) {
  const std::string documentPath = path.empty() ? std::string() : resolver_.resolvePath(path, "");
  Document document;
  if (!parseDocument(source, documentPath, document, error)) {
    return false;
  }
  IncludeResolver::ActiveGuard active(resolver_);
  if (!documentPath.empty() && !active.enter(documentPath, error)) {
    return false;
  }
  return evaluateDocument(document, out, error);
}

bool Evaluator::evaluateDocument(const Document &document, std::string &out, Error &error) {
  std::string result;
  if (!evaluateRange(document.expressions, 0, {scopes_.root(), document.path}, result, error)) {
    return false;
  }
  for (; sectionDepth_ > 0; --sectionDepth_) {
    result += "</section>";
  }
  if (!resolveReferences(result, error)) {
    return false;
  }
  out = std::move(result);
  return true;
}

bool Evaluator::enterHeading(int level, std::string &prefix, Error &error) {
  if (level > sectionDepth_ + 1) {
    return error.fail(ErrorKind::InvalidHeading,
                      ":h" + std::to_string(level) + " skips a level inside a level " + std::to_string(sectionDepth_) +
                          " section");
  }
  prefix.clear();
  if (level > sectionDepth_) {
    prefix = "<section>";
  }
  for (int open = sectionDepth_; open > level; --open) {
    prefix += "</section>";
  }
  sectionDepth_ = level;
  return true;
}

const std::string *Evaluator::findReference(const std::string &id) const {
  auto it = references_.find(id);
  return it == references_.end() ? nullptr : &it->second;
}

std::string Evaluator::deferReference(const std::string &id, const SourceLocation &site) {
  pendingReferences_.emplace_back(id, site);
  return std::string(1, kReferenceOpen) + id + kReferenceClose;
}

bool Evaluator::resolveReferences(std::string &text, Error &error) {
  if (pendingReferences_.empty()) {
    return true;
  }
  for (const auto &[id, site] : pendingReferences_) {
    if (!findReference(id)) {
      error.fail(ErrorKind::NotFound, "undefined reference: " + id);
      error.addLocation(site.path, site.line, site.column);
      return false;
    }
  }
  auto substitute = [this](const std::string &input) {
    std::string resolved;
    size_t pos = 0;
    size_t open = input.find(kReferenceOpen);
    while (open != std::string::npos) {
      const size_t close = input.find(kReferenceClose, open + 1);
      if (close == std::string::npos) {
        break;
      }
      resolved.append(input, pos, open - pos);
      const std::string *title = findReference(input.substr(open + 1, close - open - 1));
      if (title) {
        resolved += *title;
      } else {
        resolved.append(input, open, close + 1 - open);
      }
      pos = close + 1;
      open = input.find(kReferenceOpen, pos);
    }
    resolved.append(input, pos, std::string::npos);
    return resolved;
  };
  text = substitute(text);
  for (auto &[key, value] : metadata_) {
    value = substitute(value);
  }
  return true;
}

bool Evaluator::evaluate(const Expr &expr, const EvalFrame &frame, std::string &out, Error &error) {
  switch (expr.kind) {
  case Expr::Kind::Symbol:
  case Expr::Kind::String:
  case Expr::Kind::Number:
    out = expr.text;
    return true;
  case Expr::Kind::List:
    return evaluateList(expr, frame, out, error);
  }
  out.clear();
  return true;
}

bool Evaluator::evaluateRange(const std::vector<Expr> &exprs,
                              size_t first,
                              const EvalFrame &frame,
                              std::string &out,
                              Error &error) {
  std::string result;
  for (size_t i = first; i < exprs.size(); ++i) {
    std::string piece;
    if (!evaluate(exprs[i], frame, piece, error)) {
      return false;
    }
    result += piece;
  }
  out = std::move(result);
  return true;
}

bool Evaluator::evaluateList(const Expr &expr, const EvalFrame &frame, std::string &out, Error &error) {
  if (!expr.isDirectiveCall()) {
    return evaluateRange(expr.items, 0, frame, out, error);
  }
  if (!invokeDirective(expr.directiveName(), expr, frame, out, error)) {
    if (error.trace.empty()) {
      error.addLocation(frame.documentPath, expr.line, expr.column);
    }
    return false;
  }
  return true;
}

bool Evaluator::invokeDirective(const std::string &name,
                                const Expr &expr,
                                const EvalFrame &frame,
                                std::string &out,
                                Error &error) {
  if (DirectiveHandler handler = registry_.find(name)) {
    const DirectiveCall call{expr, frame};
    return handler(*this, call, out, error);
  }
  const Binding *found = scopes_.find(frame.scope, name);
  if (!found) {
    return error.fail(ErrorKind::UnknownDirective, "unknown directive: " + name);
  }
  if (found->kind == Binding::Kind::Templates) {
    return invokeTemplate(name, expr, frame, out, error);
  }
  // Copy: the body must outlive redefinitions made while it runs.
  const Binding binding = *found;
  return invokeMacro(name, binding, expr, frame, out, error);
}

bool Evaluator::invokeMacro(const std::string &name,
                            const Binding &binding,
                            const Expr &expr,
                            const EvalFrame &frame,
                            std::string &out,
                            Error &error) {
  if (expr.items.size() > 1) {
    return error.fail(ErrorKind::Arity, "macro '" + name + "' takes no arguments");
  }
  DepthGuard depth(*this);
  if (!depth.enter(error)) {
    return false;
  }
  std::string text;
  {
    ScopeGuard scope(scopes_, frame.scope);
    const std::string &bodyPath = binding.documentPath.empty() ? frame.documentPath : binding.documentPath;
    if (!evaluate(*binding.body, {scope.id(), bodyPath}, text, error)) {
      error.addLocation(frame.documentPath, expr.line, expr.column);
      return false;
    }
  }
  return reenter(std::move(text), expr, frame, out, error);
}

bool Evaluator::invokeTemplate(const std::string &name,
                               const Expr &expr,
                               const EvalFrame &frame,
                               std::string &out,
                               Error &error) {
  const TemplateList candidates = scopes_.findTemplates(frame.scope, name);
  std::vector<std::string> args;
  args.reserve(expr.items.size());
  for (size_t i = 1; i < expr.items.size(); ++i) {
    std::string value;
    if (!evaluate(expr.items[i], frame, value, error)) {
      return false;
    }
    args.push_back(std::move(value));
  }
  std::shared_ptr<const TemplateDef> selected;
  std::vector<std::string> captures;
  if (!selectTemplate(name, candidates, args, selected, captures, error)) {
    return false;
  }
  DepthGuard depth(*this);
  if (!depth.enter(error)) {
    return false;
  }
  std::string text;
  {
    ScopeGuard scope(scopes_, frame.scope);
    for (size_t i = 0; i < captures.size(); ++i) {
      Binding capture = Binding::macro(makeStringExpr(std::move(captures[i]), expr.line, expr.column));
      if (!scopes_.define(scope.id(), captureBindingName(i), std::move(capture), error)) {
        return false;
      }
    }
    const std::string &bodyPath = selected->documentPath.empty() ? frame.documentPath : selected->documentPath;
    if (!evaluateRange(selected->body, 0, {scope.id(), bodyPath}, text, error)) {
      error.addLocation(frame.documentPath, expr.line, expr.column);
      return false;
    }
  }
  return reenter(std::move(text), expr, frame, out, error);
}

bool Evaluator::reenter(std::string text, const Expr &site, const EvalFrame &frame, std::string &out, Error &error) {
  size_t start = findEmbeddedCall(text, 0);
  if (start == std::string::npos) {
    out = std::move(text);
    return true;
  }
  DepthGuard depth(*this);
  if (!depth.enter(error)) {
    return false;
  }
  // Text between embedded calls is kept verbatim; only the calls themselves are evaluated.
  std::string result;
  size_t pos = 0;
  while (start != std::string::npos) {
    result.append(text, pos, start - pos);
    const std::string tail = text.substr(start);
    Lexer lexer(tail);
    Parser parser(lexer.tokenize(), frame.documentPath);
    Expr call;
    size_t consumed = 0;
    if (!parser.parseLeading(call, consumed, error)) {
      // Produced text has no source positions of its own; report the invocation.
      error.trace.clear();
      error.addLocation(frame.documentPath, site.line, site.column);
      return false;
    }
    relocate(call, site.line, site.column);
    std::string piece;
    if (!evaluate(call, frame, piece, error)) {
      return false;
    }
    result += piece;
    pos = start + consumed;
    start = findEmbeddedCall(text, pos);
  }
  result.append(text, pos, std::string::npos);
  out = std::move(result);
  return true;
}

} // namespace rocket
