#include "rocket/Lexer.h"
#include "rocket/Parser.h"

#include <doctest/doctest.h>

namespace {
bool parseSource(const std::string &source, rocket::Document &document, rocket::Error &error) {
  return rocket::parseDocument(source, "doc.rkt", document, error);
}
} // namespace

TEST_SUITE_BEGIN("rocket.parser");

TEST_CASE("parses atoms in order") {
  rocket::Document document;
  rocket::Error error;
  REQUIRE(parseSource("hello \"big world\" 12", document, error));
  REQUIRE(document.expressions.size() == 3);
  CHECK(document.expressions[0].kind == rocket::Expr::Kind::Symbol);
  CHECK(document.expressions[0].text == "hello");
  CHECK(document.expressions[1].kind == rocket::Expr::Kind::String);
  CHECK(document.expressions[1].text == "big world");
  CHECK(document.expressions[2].kind == rocket::Expr::Kind::Number);
  CHECK(document.path == "doc.rkt");
}

TEST_CASE("decodes string escapes") {
  rocket::Document document;
  rocket::Error error;
  REQUIRE(parseSource("\"a\\n\\t\\\\\\\"\\q\"", document, error));
  REQUIRE(document.expressions.size() == 1);
  CHECK(document.expressions[0].text == "a\n\t\\\"q");
}

TEST_CASE("parses nested lists and directive heads") {
  rocket::Document document;
  rocket::Error error;
  REQUIRE(parseSource("(:concat (a b) ())", document, error));
  REQUIRE(document.expressions.size() == 1);
  const rocket::Expr &call = document.expressions[0];
  CHECK(call.isDirectiveCall());
  CHECK(call.directiveName() == "concat");
  REQUIRE(call.items.size() == 3);
  CHECK(call.items[1].isList());
  CHECK_FALSE(call.items[1].isDirectiveCall());
  CHECK(call.items[1].items.size() == 2);
  CHECK(call.items[2].isList());
  CHECK(call.items[2].items.empty());
}

TEST_CASE("a bare colon-prefixed atom is not a directive call") {
  rocket::Document document;
  rocket::Error error;
  REQUIRE(parseSource(":concat (x :concat)", document, error));
  REQUIRE(document.expressions.size() == 2);
  CHECK_FALSE(document.expressions[0].isDirectiveCall());
  CHECK_FALSE(document.expressions[1].isDirectiveCall());
}

TEST_CASE("skips comments between expressions") {
  rocket::Document document;
  rocket::Error error;
  REQUIRE(parseSource("; leading\n(a ; inner\n b)\n; trailing", document, error));
  REQUIRE(document.expressions.size() == 1);
  CHECK(document.expressions[0].items.size() == 2);
}

TEST_CASE("records list positions") {
  rocket::Document document;
  rocket::Error error;
  REQUIRE(parseSource("\n  (:null)", document, error));
  REQUIRE(document.expressions.size() == 1);
  CHECK(document.expressions[0].line == 2);
  CHECK(document.expressions[0].column == 3);
}

TEST_CASE("rejects unmatched open paren at its position") {
  rocket::Document document;
  rocket::Error error;
  CHECK_FALSE(parseSource("a\n (b (c)", document, error));
  CHECK(error.kind == rocket::ErrorKind::Syntax);
  CHECK(error.message.find("unmatched '('") != std::string::npos);
  REQUIRE(error.trace.size() == 1);
  CHECK(error.trace[0].path == "doc.rkt");
  CHECK(error.trace[0].line == 2);
  CHECK(error.trace[0].column == 2);
}

TEST_CASE("rejects stray close paren") {
  rocket::Document document;
  rocket::Error error;
  CHECK_FALSE(parseSource("(a))", document, error));
  CHECK(error.kind == rocket::ErrorKind::Syntax);
  CHECK(error.message.find("unexpected ')'") != std::string::npos);
  REQUIRE(error.trace.size() == 1);
  CHECK(error.trace[0].column == 4);
}

TEST_CASE("rejects unterminated strings") {
  rocket::Document document;
  rocket::Error error;
  CHECK_FALSE(parseSource("(:md \"oops)", document, error));
  CHECK(error.kind == rocket::ErrorKind::Syntax);
  CHECK(error.message.find("unterminated string literal") != std::string::npos);
  REQUIRE(error.trace.size() == 1);
  CHECK(error.trace[0].column == 6);
}

TEST_CASE("rejects nesting past the depth limit") {
  rocket::Document document;
  rocket::Error error;
  CHECK_FALSE(parseSource(std::string(50000, '(') + std::string(50000, ')'), document, error));
  CHECK(error.kind == rocket::ErrorKind::Syntax);
  CHECK(error.message.find("nested deeper than") != std::string::npos);
  REQUIRE(error.trace.size() == 1);
  CHECK(error.trace[0].column == rocket::Parser::kMaxListDepth + 1);

  const int depth = rocket::Parser::kMaxListDepth;
  REQUIRE(parseSource(std::string(depth, '(') + "x" + std::string(depth, ')'), document, error));
  CHECK(document.expressions.size() == 1);
}

TEST_CASE("parses one leading expression and reports where it ends") {
  const std::string source = "(:x (y)) tail (:z)";
  rocket::Lexer lexer(source);
  rocket::Parser parser(lexer.tokenize(), "");
  rocket::Expr expr;
  size_t end = 0;
  rocket::Error error;
  REQUIRE(parser.parseLeading(expr, end, error));
  CHECK(expr.directiveName() == "x");
  CHECK(end == 8);
  CHECK(source.substr(end) == " tail (:z)");
}

TEST_SUITE_END();
