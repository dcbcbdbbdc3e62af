#include "directives/Directives.h"

#include <algorithm>
#include <utility>

namespace rocket::directives {
namespace {

bool renderAdmonition(Evaluator &evaluator,
                      const DirectiveCall &call,
                      const std::string &kind,
                      const std::string &defaultTitle,
                      std::string &out,
                      Error &error) {
  const size_t count = call.argCount();
  if (count == 0 || count > 2) {
    return failArity(kind, "1 or 2 arguments", count, error);
  }
  std::string title = defaultTitle;
  size_t bodyIndex = 0;
  if (count == 2) {
    if (!evaluateArg(evaluator, call, 0, title, error)) {
      return false;
    }
    bodyIndex = 1;
  }
  std::string body;
  if (!evaluateArg(evaluator, call, bodyIndex, body, error)) {
    return false;
  }
  out = "<div class=\"admonition admonition-" + kind + "\"><span class=\"admonition-title admonition-title-" + kind +
        "\">" + title + "</span>" + body + "</div>\n";
  return true;
}

// Component count requested by a version format: "x" -> 1, "x.y" -> 2, "" -> 0.
size_t versionComponentCount(const std::string &format) {
  if (format.empty()) {
    return 0;
  }
  return static_cast<size_t>(std::count(format.begin(), format.end(), '.')) + 1;
}

std::string truncateVersion(const std::string &version, size_t components) {
  if (components == 0) {
    return "";
  }
  size_t pos = 0;
  for (size_t seen = 0; seen < components; ++seen) {
    pos = version.find('.', pos);
    if (pos == std::string::npos) {
      return version;
    }
    if (seen + 1 < components) {
      ++pos;
    }
  }
  return version.substr(0, pos);
}

// Stops evaluating at the first argument that differs from the first one.
bool allEqual(Evaluator &evaluator, const DirectiveCall &call, const std::string &name, bool &equal, Error &error) {
  if (call.argCount() < 2) {
    return failArity(name, "at least 2 arguments", call.argCount(), error);
  }
  std::string first;
  if (!evaluateArg(evaluator, call, 0, first, error)) {
    return false;
  }
  equal = true;
  for (size_t i = 1; i < call.argCount(); ++i) {
    std::string value;
    if (!evaluateArg(evaluator, call, i, value, error)) {
      return false;
    }
    if (value != first) {
      equal = false;
      return true;
    }
  }
  return true;
}

} // namespace

bool evaluateArg(Evaluator &evaluator, const DirectiveCall &call, size_t index, std::string &out, Error &error) {
  return evaluator.evaluate(call.arg(index), call.frame, out, error);
}

bool evaluateArgsFrom(Evaluator &evaluator, const DirectiveCall &call, size_t first, std::string &out, Error &error) {
  return evaluator.evaluateRange(call.expr.items, first + 1, call.frame, out, error);
}

bool nameFromExpr(Evaluator &evaluator, const Expr &expr, const EvalFrame &frame, std::string &out, Error &error) {
  if (!expr.isList()) {
    out = expr.text;
    return true;
  }
  return evaluator.evaluate(expr, frame, out, error);
}

bool failArity(const std::string &directive, const std::string &expected, size_t got, Error &error) {
  return error.fail(ErrorKind::Arity,
                    ":" + directive + " expects " + expected + ", got " + std::to_string(got));
}

bool handleNull(Evaluator &, const DirectiveCall &, std::string &out, Error &) {
  out.clear();
  return true;
}

bool handleConcat(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  return evaluateArgsFrom(evaluator, call, 0, out, error);
}

bool handleMarkdown(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  std::string text;
  if (!evaluateArgsFrom(evaluator, call, 0, text, error)) {
    return false;
  }
  const auto &render = evaluator.collaborators().renderMarkdown;
  out = render ? render(text) : std::move(text);
  return true;
}

bool handleVersion(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  if (call.argCount() > 1) {
    return failArity("version", "at most 1 argument", call.argCount(), error);
  }
  const auto &provider = evaluator.collaborators().versionString;
  const std::string full = provider ? provider() : std::string();
  if (call.argCount() == 0) {
    out = full;
    return true;
  }
  std::string format;
  {
    ScopeGuard scope(evaluator.scopes(), call.frame.scope);
    if (!evaluator.scopes().define(scope.id(), "version", Binding::macro(makeStringExpr(full)), error)) {
      return false;
    }
    if (!evaluator.evaluate(call.arg(0), {scope.id(), call.frame.documentPath}, format, error)) {
      return false;
    }
  }
  out = truncateVersion(full, versionComponentCount(format));
  return true;
}

bool handleThemeConfig(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  if (call.argCount() % 2 != 0) {
    return failArity("theme-config", "key/value pairs", call.argCount(), error);
  }
  for (size_t i = 0; i < call.argCount(); i += 2) {
    std::string key;
    std::string value;
    if (!evaluateArg(evaluator, call, i, key, error) || !evaluateArg(evaluator, call, i + 1, value, error)) {
      return false;
    }
    evaluator.metadata()[key] = std::move(value);
  }
  out.clear();
  return true;
}

bool handleDefinitionList(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  std::string html = "<dl>";
  for (size_t i = 0; i < call.argCount(); ++i) {
    const Expr &entry = call.arg(i);
    if (!entry.isList() || entry.items.size() < 2) {
      return error.fail(ErrorKind::Arity, ":definition-list entries must be lists of a term and a definition");
    }
    std::string term;
    std::string body;
    if (!evaluator.evaluate(entry.items[0], call.frame, term, error) ||
        !evaluator.evaluateRange(entry.items, 1, call.frame, body, error)) {
      return false;
    }
    html += "<dt>" + term + "</dt><dd>" + body + "</dd>";
  }
  html += "</dl>";
  out = std::move(html);
  return true;
}

bool handleNote(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  return renderAdmonition(evaluator, call, "note", "Note", out, error);
}

bool handleWarning(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  return renderAdmonition(evaluator, call, "warning", "Warning", out, error);
}

bool handleIf(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  if (call.argCount() < 2 || call.argCount() > 3) {
    return failArity("if", "2 or 3 arguments", call.argCount(), error);
  }
  std::string condition;
  if (!evaluateArg(evaluator, call, 0, condition, error)) {
    return false;
  }
  if (!condition.empty()) {
    return evaluateArg(evaluator, call, 1, out, error);
  }
  if (call.argCount() == 3) {
    return evaluateArg(evaluator, call, 2, out, error);
  }
  out.clear();
  return true;
}

bool handleNot(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  if (call.argCount() != 1) {
    return failArity("not", "1 argument", call.argCount(), error);
  }
  std::string value;
  if (!evaluateArg(evaluator, call, 0, value, error)) {
    return false;
  }
  out = value.empty() ? "true" : "";
  return true;
}

bool handleEquals(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  bool equal = false;
  if (!allEqual(evaluator, call, "=", equal, error)) {
    return false;
  }
  out = equal ? "true" : "";
  return true;
}

bool handleNotEquals(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  bool equal = false;
  if (!allEqual(evaluator, call, "!=", equal, error)) {
    return false;
  }
  out = equal ? "" : "true";
  return true;
}

} // namespace rocket::directives
