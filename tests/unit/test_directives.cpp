#include "rocket/Evaluator.h"

#include <doctest/doctest.h>

#include <map>

namespace {
struct CompileResult {
  bool ok = false;
  std::string output;
  rocket::Error error;
  std::map<std::string, std::string> metadata;
};

rocket::Collaborators testCollaborators() {
  rocket::Collaborators collaborators;
  collaborators.versionString = []() { return std::string("2.7.13"); };
  collaborators.renderMarkdown = [](const std::string &text) { return "<md>" + text + "</md>"; };
  return collaborators;
}

CompileResult compile(const std::string &source, rocket::Collaborators collaborators = testCollaborators()) {
  rocket::Evaluator evaluator(std::move(collaborators));
  CompileResult result;
  result.ok = evaluator.compileSource(source, "", result.output, result.error);
  result.metadata = evaluator.metadata();
  return result;
}

void checkArity(const std::string &source) {
  const auto result = compile(source);
  CHECK_FALSE(result.ok);
  CHECK(result.error.kind == rocket::ErrorKind::Arity);
}
} // namespace

TEST_SUITE_BEGIN("rocket.directives");

TEST_CASE("builtin registry lists every directive") {
  rocket::DirectiveRegistry registry = rocket::makeBuiltinRegistry();
  const std::vector<std::string> expected = {"!=", "=", "concat", "define", "define-ref", "define-template",
                                             "definition-list", "h1", "h2", "h3", "h4", "h5", "h6", "if",
                                             "import", "include", "let", "md", "not", "note", "null", "ref",
                                             "steps", "table", "theme-config", "version", "warning"};
  CHECK(registry.names() == expected);
  CHECK(registry.find("concat") != nullptr);
  CHECK(registry.find("missing") == nullptr);
}

TEST_CASE("null is empty everywhere") {
  CHECK(compile("(:null)").output == "");
  CHECK(compile("(:null ignored (:also ignored))").output == "");
  CHECK(compile("(:concat a (:null) b)").output == "ab");
}

TEST_CASE("concat joins without separators") {
  CHECK(compile("(:concat \"a\" \" \" \"b\")").output == "a b");
  CHECK(compile("(:concat)").output == "");
}

TEST_CASE("md forwards to the renderer") {
  CHECK(compile("(:md \"# Title\" (:concat \" x\"))").output == "<md># Title x</md>");
}

TEST_CASE("md passes text through without a renderer") {
  CHECK(compile("(:md \"*raw*\")", rocket::Collaborators{}).output == "*raw*");
}

TEST_CASE("version returns the provider string") {
  CHECK(compile("(:version)").output == "2.7.13");
}

TEST_CASE("version format selects components") {
  CHECK(compile("(:version \"x\")").output == "2");
  CHECK(compile("(:version \"x.y\")").output == "2.7");
  CHECK(compile("(:version \"x.y.z\")").output == "2.7.13");
  CHECK(compile("(:version \"x.y.z.w\")").output == "2.7.13");
  CHECK(compile("(:version (:version))").output == "2.7.13");
  CHECK(compile("(:version (:null))").output == "");
  checkArity("(:version a b)");
}

TEST_CASE("version accepts a bare symbol as its format") {
  const auto result = compile("(:version x) (:version)");
  REQUIRE(result.ok);
  CHECK(result.output == "22.7.13");
}

TEST_CASE("theme-config writes metadata with last write winning") {
  const auto result = compile("(:theme-config title \"A\" accent (:concat \"bl\" \"ue\") title \"B\")");
  REQUIRE(result.ok);
  CHECK(result.output == "");
  CHECK(result.metadata.size() == 2);
  CHECK(result.metadata.at("title") == "B");
  CHECK(result.metadata.at("accent") == "blue");
  checkArity("(:theme-config title)");
}

TEST_CASE("definition-list renders terms in order") {
  const auto result = compile("(:definition-list (apple \"A \" fruit) ((:concat b y) \"bee\"))");
  REQUIRE(result.ok);
  CHECK(result.output == "<dl><dt>apple</dt><dd>A fruit</dd><dt>by</dt><dd>bee</dd></dl>");
  CHECK(compile("(:definition-list)").output == "<dl></dl>");
  checkArity("(:definition-list (lonely))");
  checkArity("(:definition-list term)");
}

TEST_CASE("note and warning render admonitions") {
  CHECK(compile("(:note \"Body\")").output ==
        "<div class=\"admonition admonition-note\"><span class=\"admonition-title admonition-title-note\">Note"
        "</span>Body</div>\n");
  CHECK(compile("(:warning \"Careful\" (:concat \"hot \" \"stove\"))").output ==
        "<div class=\"admonition admonition-warning\"><span class=\"admonition-title admonition-title-warning\">"
        "Careful</span>hot stove</div>\n");
  checkArity("(:note)");
  checkArity("(:warning a b c)");
}

TEST_CASE("let binds sequentially and shadows only inside its body") {
  const auto result = compile("(:define x \"outer\")"
                              "(:let (x \"inner\" y (:concat (:x) \"+\")) (:x) \" \" (:y))"
                              "\" \" (:x)");
  REQUIRE(result.ok);
  CHECK(result.output == "inner inner+ outer");
}

TEST_CASE("let accepts computed names") {
  const auto result = compile("(:let ((:concat na me) \"v\") (:name))");
  REQUIRE(result.ok);
  CHECK(result.output == "v");
}

TEST_CASE("let rejects malformed binding lists") {
  checkArity("(:let)");
  checkArity("(:let (a) body)");
  checkArity("(:let a body)");
}

TEST_CASE("definitions inside let stay in the let scope") {
  const auto result = compile("(:let () (:define inside \"x\") (:inside)) (:inside)");
  CHECK_FALSE(result.ok);
  CHECK(result.error.kind == rocket::ErrorKind::UnknownDirective);
}

TEST_CASE("define validates its shape") {
  checkArity("(:define lonely)");
  checkArity("(:define a b c)");
  checkArity("(:define-template t)");
  checkArity("(:define-template t notalist \"body\")");
}

TEST_CASE("define and define-template return empty text") {
  const auto result = compile("(:define a \"x\")(:define-template t (y) \"z\")");
  REQUIRE(result.ok);
  CHECK(result.output == "");
}

TEST_CASE("if evaluates only the selected branch") {
  CHECK(compile("(:if yes then (:missing))").output == "then");
  CHECK(compile("(:if (:null) (:missing) otherwise)").output == "otherwise");
  CHECK(compile("(:if \"\" (:missing))").output == "");
  checkArity("(:if cond)");
}

TEST_CASE("not and equality") {
  CHECK(compile("(:not \"\")").output == "true");
  CHECK(compile("(:not x)").output == "");
  CHECK(compile("(:= a a (:concat a))").output == "true");
  CHECK(compile("(:= a b)").output == "");
  CHECK(compile("(:!= a b)").output == "true");
  CHECK(compile("(:!= a a)").output == "");
  CHECK(compile("(:if (:= (:version \"x\") 2) major-two)").output == "major-two");
  checkArity("(:= a)");
  checkArity("(:not)");
}

TEST_CASE("equality stops at the first mismatch") {
  CHECK(compile("(:= a b (:missing))").ok);
  CHECK(compile("(:= a b (:missing))").output == "");
  CHECK(compile("(:!= a b (:missing))").output == "true");
  const auto result = compile("(:= a a (:missing))");
  CHECK_FALSE(result.ok);
  CHECK(result.error.kind == rocket::ErrorKind::UnknownDirective);
}

TEST_CASE("failing arguments abort the directive") {
  const auto result = compile("(:concat ok (:concat (:broken)))");
  CHECK_FALSE(result.ok);
  CHECK(result.error.kind == rocket::ErrorKind::UnknownDirective);
  REQUIRE(result.error.trace.size() == 1);
  CHECK(result.error.trace[0].column == 22);
}

TEST_SUITE_END();
