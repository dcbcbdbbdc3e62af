#pragma once

#include <string>

#include "rocket/DirectiveRegistry.h"
#include "rocket/Evaluator.h"

namespace rocket::directives {

bool handleNull(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleConcat(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleMarkdown(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleVersion(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleThemeConfig(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleDefinitionList(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleNote(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleWarning(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);

bool handleHeading1(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleHeading2(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleHeading3(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleHeading4(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleHeading5(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleHeading6(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleDefineRef(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleRef(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleSteps(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
// Accepted for compatibility; renders nothing.
bool handleTable(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);

bool handleLet(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleDefine(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleDefineTemplate(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);

bool handleInclude(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleImport(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);

bool handleIf(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleNot(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleEquals(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);
bool handleNotEquals(Evaluator &evaluator, const DirectiveCall &call, std::string &out, Error &error);

// Shared by the handlers above.
bool evaluateArg(Evaluator &evaluator, const DirectiveCall &call, size_t index, std::string &out, Error &error);
// Evaluates every argument from `first` on and concatenates the results.
bool evaluateArgsFrom(Evaluator &evaluator, const DirectiveCall &call, size_t first, std::string &out, Error &error);
// Atoms name themselves; a list is evaluated and its text is the name.
bool nameFromExpr(Evaluator &evaluator, const Expr &expr, const EvalFrame &frame, std::string &out, Error &error);
bool failArity(const std::string &directive, const std::string &expected, size_t got, Error &error);

} // namespace rocket::directives
