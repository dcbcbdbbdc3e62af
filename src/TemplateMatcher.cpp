#include "rocket/TemplateMatcher.h"

#include <sstream>
#include <utility>

namespace rocket {

namespace {
// Appends one capture per group; groups that did not participate capture "".
bool matchPattern(const re2::RE2 &pattern, const std::string &input, std::vector<std::string> &captures) {
  const int groups = pattern.NumberOfCapturingGroups();
  std::vector<std::string> values(static_cast<size_t>(groups));
  std::vector<re2::RE2::Arg> args;
  args.reserve(values.size());
  for (auto &value : values) {
    args.emplace_back(&value);
  }
  std::vector<const re2::RE2::Arg *> argPointers;
  argPointers.reserve(args.size());
  for (const auto &arg : args) {
    argPointers.push_back(&arg);
  }
  if (!re2::RE2::FullMatchN(input, pattern, argPointers.data(), groups)) {
    return false;
  }
  for (auto &value : values) {
    captures.push_back(std::move(value));
  }
  return true;
}
} // namespace

bool compileTemplateSlot(const Expr &slotExpr, TemplateSlot &out, Error &error) {
  switch (slotExpr.kind) {
  case Expr::Kind::Symbol:
  case Expr::Kind::Number:
    out.kind = TemplateSlot::Kind::Literal;
    out.text = slotExpr.text;
    return true;
  case Expr::Kind::String:
    out.kind = TemplateSlot::Kind::Pattern;
    out.text = slotExpr.text;
    {
      re2::RE2::Options options;
      options.set_log_errors(false);
      auto pattern = std::make_shared<re2::RE2>(slotExpr.text, options);
      if (!pattern->ok()) {
        return error.fail(ErrorKind::InvalidPattern,
                          "invalid template pattern \"" + slotExpr.text + "\": " + pattern->error());
      }
      out.pattern = std::move(pattern);
    }
    return true;
  case Expr::Kind::List:
    break;
  }
  return error.fail(ErrorKind::Arity, "template slots must be literal tokens or pattern strings");
}

bool matchTemplate(const TemplateDef &def, const std::vector<std::string> &args, std::vector<std::string> &captures) {
  captures.clear();
  if (args.size() != def.slots.size()) {
    return false;
  }
  for (size_t i = 0; i < args.size(); ++i) {
    const TemplateSlot &slot = def.slots[i];
    if (slot.kind == TemplateSlot::Kind::Literal) {
      if (args[i] != slot.text) {
        captures.clear();
        return false;
      }
      continue;
    }
    if (!matchPattern(*slot.pattern, args[i], captures)) {
      captures.clear();
      return false;
    }
  }
  return true;
}

bool selectTemplate(const std::string &name,
                    const TemplateList &candidates,
                    const std::vector<std::string> &args,
                    std::shared_ptr<const TemplateDef> &selected,
                    std::vector<std::string> &captures,
                    Error &error) {
  for (const auto &candidate : candidates) {
    if (matchTemplate(*candidate, args, captures)) {
      selected = candidate;
      return true;
    }
  }
  std::ostringstream message;
  message << "no template named '" << name << "' matches (";
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      message << " ";
    }
    message << "\"" << args[i] << "\"";
  }
  message << ")";
  return error.fail(ErrorKind::NoMatchingTemplate, message.str());
}

std::string captureBindingName(size_t index) {
  return "$" + std::to_string(index + 1);
}

} // namespace rocket
