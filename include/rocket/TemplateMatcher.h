#pragma once

#include <memory>
#include <string>
#include <vector>

#include <re2/re2.h>

#include "rocket/Ast.h"
#include "rocket/Error.h"

namespace rocket {

struct TemplateSlot {
  enum class Kind { Literal, Pattern } kind = Kind::Literal;
  std::string text;
  std::shared_ptr<const re2::RE2> pattern;
};

struct TemplateDef {
  std::string name;
  std::vector<TemplateSlot> slots;
  std::vector<Expr> body;
  // Document the template was defined in; body locations are reported against it.
  std::string documentPath;
};

using TemplateList = std::vector<std::shared_ptr<const TemplateDef>>;

// String atoms become RE2 pattern slots; symbol and number atoms are literal tokens.
bool compileTemplateSlot(const Expr &slotExpr, TemplateSlot &out, Error &error);

// Every slot must match the argument in the same position. Pattern slots need a full match and
// contribute one capture per group, in slot order; unmatched optional groups capture "".
bool matchTemplate(const TemplateDef &def, const std::vector<std::string> &args, std::vector<std::string> &captures);

// Tries `candidates` in order (callers pass them most recent first) and stops at the first match.
bool selectTemplate(const std::string &name,
                    const TemplateList &candidates,
                    const std::vector<std::string> &args,
                    std::shared_ptr<const TemplateDef> &selected,
                    std::vector<std::string> &captures,
                    Error &error);

std::string captureBindingName(size_t index);

} // namespace rocket
