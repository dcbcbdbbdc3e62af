#include <doctest/doctest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

namespace {
std::filesystem::path tempDir() {
  auto dir = std::filesystem::temp_directory_path() / "rocket_tests";
  std::filesystem::create_directories(dir);
  return dir;
}

std::string writeTemp(const std::string &name, const std::string &contents) {
  auto path = tempDir() / name;
  std::filesystem::create_directories(path.parent_path());
  std::ofstream file(path);
  CHECK(file.good());
  file << contents;
  CHECK(file.good());
  return path.string();
}

int runCommand(const std::string &command) {
  int code = std::system(command.c_str());
#if defined(__unix__) || defined(__APPLE__)
  if (code == -1) {
    return -1;
  }
  if (WIFEXITED(code)) {
    return WEXITSTATUS(code);
  }
  return -1;
#else
  return code;
#endif
}

std::string readFile(const std::string &path) {
  std::ifstream file(path);
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::string outPath(const std::string &name) {
  return (tempDir() / name).string();
}
} // namespace

TEST_SUITE_BEGIN("rocket.cli");

TEST_CASE("compiles a document to an output file") {
  const std::string srcPath = writeTemp("cli_basic.rkt", "(:concat \"Hello\" \" \" \"world\")\n");
  const std::string output = outPath("cli_basic.html");
  CHECK(runCommand("./rocketc " + srcPath + " -o " + output) == 0);
  CHECK(readFile(output) == "Hello world");
}

TEST_CASE("writes to stdout without -o") {
  const std::string srcPath = writeTemp("cli_stdout.rkt", "(:note \"hi\")");
  const std::string output = outPath("cli_stdout.txt");
  CHECK(runCommand("./rocketc " + srcPath + " > " + output) == 0);
  CHECK(readFile(output).find("admonition-note") != std::string::npos);
}

TEST_CASE("uses the version string option") {
  const std::string srcPath = writeTemp("cli_version.rkt", "(:version) \"|\" (:version \"x.y\")");
  const std::string output = outPath("cli_version.txt");
  CHECK(runCommand("./rocketc " + srcPath + " --version-string 3.1.4 -o " + output) == 0);
  CHECK(readFile(output) == "3.1.4|3.1");
  CHECK(runCommand("./rocketc " + srcPath + " --version-string=9.8.7 -o " + output) == 0);
  CHECK(readFile(output) == "9.8.7|9.8");
}

TEST_CASE("resolves includes relative to the input file") {
  writeTemp("cli_site/parts/footer.rkt", "(:concat \"foot\")");
  const std::string srcPath = writeTemp("cli_site/index.rkt", "body \"+\" (:include \"parts/footer.rkt\")");
  const std::string output = outPath("cli_site.txt");
  CHECK(runCommand("./rocketc " + srcPath + " -o " + output) == 0);
  CHECK(readFile(output) == "body+foot");
}

TEST_CASE("writes sorted metadata") {
  const std::string srcPath = writeTemp("cli_meta.rkt", "(:theme-config title A accent blue title B)");
  const std::string output = outPath("cli_meta.txt");
  const std::string metadata = outPath("cli_meta.properties");
  CHECK(runCommand("./rocketc " + srcPath + " -o " + output + " --metadata-out " + metadata) == 0);
  CHECK(readFile(metadata) == "accent=blue\ntitle=B\n");
}

TEST_CASE("dumps the ast without evaluating") {
  const std::string srcPath = writeTemp("cli_dump.rkt", "(:missing  \"x\") ; comment\n42");
  const std::string output = outPath("cli_dump.txt");
  CHECK(runCommand("./rocketc " + srcPath + " --dump-stage ast > " + output) == 0);
  CHECK(readFile(output) == "(:missing \"x\")\n42\n");
}

TEST_CASE("reports evaluation errors with exit code 2") {
  const std::string srcPath = writeTemp("cli_unknown.rkt", "(:nope)");
  const std::string errPath = outPath("cli_unknown.err");
  CHECK(runCommand("./rocketc " + srcPath + " 2> " + errPath) == 2);
  const std::string diagnostics = readFile(errPath);
  CHECK(diagnostics.find("Evaluation error: UnknownDirective: unknown directive: nope") != std::string::npos);
  CHECK(diagnostics.find("cli_unknown.rkt:1:1") != std::string::npos);
}

TEST_CASE("reports parse errors with exit code 2") {
  const std::string srcPath = writeTemp("cli_syntax.rkt", "(:concat a");
  const std::string errPath = outPath("cli_syntax.err");
  CHECK(runCommand("./rocketc " + srcPath + " 2> " + errPath) == 2);
  CHECK(readFile(errPath).find("Parse error: SyntaxError") != std::string::npos);
}

TEST_CASE("recursion limit option bounds macro depth") {
  const std::string srcPath = writeTemp("cli_depth.rkt", "(:define a x) (:define b (:a)) (:b)");
  const std::string errPath = outPath("cli_depth.err");
  CHECK(runCommand("./rocketc " + srcPath + " --recursion-limit 1 > /dev/null 2> " + errPath) == 2);
  CHECK(readFile(errPath).find("RecursionLimitExceeded") != std::string::npos);
  CHECK(runCommand("./rocketc " + srcPath + " --recursion-limit=2 > /dev/null") == 0);
}

TEST_CASE("rejects bad arguments") {
  const std::string srcPath = writeTemp("cli_args.rkt", "x");
  const std::string errPath = outPath("cli_args.err");
  CHECK(runCommand("./rocketc 2> " + errPath) == 2);
  CHECK(readFile(errPath).find("Argument error: missing input file") != std::string::npos);
  CHECK(runCommand("./rocketc " + srcPath + " --bogus 2> " + errPath) == 2);
  CHECK(runCommand("./rocketc " + srcPath + " --recursion-limit zero 2> " + errPath) == 2);
  CHECK(readFile(errPath).find("invalid recursion limit") != std::string::npos);
  CHECK(runCommand("./rocketc " + srcPath + " --dump-stage ir 2> " + errPath) == 2);
}

TEST_CASE("missing input file is reported") {
  const std::string errPath = outPath("cli_missing.err");
  CHECK(runCommand("./rocketc " + outPath("does_not_exist.rkt") + " 2> " + errPath) == 2);
  CHECK(readFile(errPath).find("FileIOError") != std::string::npos);
}

TEST_SUITE_END();
