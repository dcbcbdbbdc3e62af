#include "directives/Directives.h"

#include <cctype>
#include <utility>

namespace rocket::directives {
namespace {

std::string escapeAttribute(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '"':
      out += "&#34;";
      break;
    case '\'':
      out += "&#39;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '&':
      out += "&amp;";
      break;
    default:
      out += c;
      break;
    }
  }
  return out;
}

// "A Title!" -> "a-title33": ASCII letters and digits are lowercased, '-' and '_' kept, spaces become
// '-', other ASCII characters become their decimal code. Bytes of multi-byte characters pass through.
std::string headingSlug(const std::string &title) {
  std::string out;
  out.reserve(title.size());
  for (char c : title) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte >= 0x80) {
      out += c;
    } else if (std::isalnum(byte)) {
      out += static_cast<char>(std::tolower(byte));
    } else if (c == '-' || c == '_') {
      out += c;
    } else if (c == ' ') {
      out += '-';
    } else {
      out += std::to_string(static_cast<int>(byte));
    }
  }
  return out;
}

bool renderHeading(Evaluator &evaluator, const DirectiveCall &call, int level, std::string &out, Error &error) {
  const std::string directive = "h" + std::to_string(level);
  const size_t count = call.argCount();
  if (count == 0 || count > 2) {
    return failArity(directive, "1 or 2 arguments", count, error);
  }
  std::string first;
  if (!evaluateArg(evaluator, call, 0, first, error)) {
    return false;
  }
  std::string title;
  std::string id;
  if (count == 2) {
    if (!evaluateArg(evaluator, call, 1, title, error)) {
      return false;
    }
    id = std::move(first);
    evaluator.defineReference(id, title);
  } else {
    title = std::move(first);
    id = headingSlug(title);
  }
  evaluator.metadata().emplace("title", title);
  std::string prefix;
  if (!evaluator.enterHeading(level, prefix, error)) {
    return false;
  }
  const std::string tag = "h" + std::to_string(level);
  out = prefix + "<" + tag + " id=\"" + escapeAttribute(id) + "\">" + title + "</" + tag + ">";
  return true;
}

// A step is a (marker title body) list, or the name of a macro whose body is one.
bool evaluateStep(Evaluator &evaluator,
                  const DirectiveCall &call,
                  const Expr &step,
                  std::string &title,
                  std::string &body,
                  Error &error) {
  const std::string shape = ":steps entries must be (marker title body) lists or names bound to one";
  if (step.isList()) {
    if (step.items.size() != 3) {
      return error.fail(ErrorKind::Arity, shape);
    }
    return evaluator.evaluate(step.items[1], call.frame, title, error) &&
           evaluator.evaluate(step.items[2], call.frame, body, error);
  }
  if (step.kind != Expr::Kind::Symbol) {
    return error.fail(ErrorKind::Arity, shape);
  }
  Binding binding;
  if (!evaluator.scopes().lookup(call.frame.scope, step.text, binding, error)) {
    return false;
  }
  if (binding.kind != Binding::Kind::Macro || !binding.body->isList() || binding.body->items.size() != 3) {
    return error.fail(ErrorKind::Arity, shape);
  }
  const EvalFrame frame{call.frame.scope,
                        binding.documentPath.empty() ? call.frame.documentPath : binding.documentPath};
  return evaluator.evaluate(binding.body->items[1], frame, title, error) &&
         evaluator.evaluate(binding.body->items[2], frame, body, error);
}

} // namespace

bool handleHeading1(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  return renderHeading(evaluator, call, 1, out, error);
}

bool handleHeading2(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  return renderHeading(evaluator, call, 2, out, error);
}

bool handleHeading3(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  return renderHeading(evaluator, call, 3, out, error);
}

bool handleHeading4(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  return renderHeading(evaluator, call, 4, out, error);
}

bool handleHeading5(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  return renderHeading(evaluator, call, 5, out, error);
}

bool handleHeading6(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  return renderHeading(evaluator, call, 6, out, error);
}

bool handleDefineRef(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  if (call.argCount() != 2) {
    return failArity("define-ref", "2 arguments", call.argCount(), error);
  }
  std::string id;
  std::string title;
  if (!evaluateArg(evaluator, call, 0, id, error) || !evaluateArg(evaluator, call, 1, title, error)) {
    return false;
  }
  evaluator.defineReference(id, std::move(title));
  out.clear();
  return true;
}

bool handleRef(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  const size_t count = call.argCount();
  if (count == 0 || count > 2) {
    return failArity("ref", "1 or 2 arguments", count, error);
  }
  std::string id;
  if (!evaluateArg(evaluator, call, 0, id, error)) {
    return false;
  }
  std::string title;
  if (count == 2 && !evaluateArg(evaluator, call, 1, title, error)) {
    return false;
  }
  if (const std::string *known = evaluator.findReference(id)) {
    if (count == 1) {
      title = *known;
    }
  } else {
    // Forward reference: the target may still be defined later in the document.
    std::string deferred = evaluator.deferReference(id, {call.frame.documentPath, call.expr.line, call.expr.column});
    if (count == 1) {
      title = std::move(deferred);
    }
  }
  out = "<a href=\"#" + escapeAttribute(id) + "\">" + title + "</a>";
  return true;
}

bool handleSteps(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error) {
  std::string html = "<div class=\"steps\">";
  for (size_t i = 0; i < call.argCount(); ++i) {
    std::string title;
    std::string body;
    if (!evaluateStep(evaluator, call, call.arg(i), title, body, error)) {
      return false;
    }
    html += "<div class=\"steps__step\"><div class=\"steps__bullet\"><div class=\"steps__stepnumber\">" +
            std::to_string(i + 1) + "</div></div><h4>" + title + "</h4><div>" + body + "</div></div>";
  }
  html += "</div>";
  out = std::move(html);
  return true;
}

bool handleTable(Evaluator &, const DirectiveCall &, std::string &out, Error &) {
  out.clear();
  return true;
}

} // namespace rocket::directives
