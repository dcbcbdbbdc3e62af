#include "rocket/AstPrinter.h"
#include "rocket/Evaluator.h"
#include "rocket/FileLoader.h"
#include "rocket/Options.h"
#include "rocket/Parser.h"

#include <charconv>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <system_error>

#ifndef ROCKET_VERSION_STRING
#define ROCKET_VERSION_STRING "0.0.0"
#endif

namespace {
bool parseRecursionLimit(const std::string &text, int &out, std::string &error) {
  int value = 0;
  const char *begin = text.data();
  const char *end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end || value <= 0) {
    error = "invalid recursion limit: " + text;
    return false;
  }
  out = value;
  return true;
}

bool parseArgs(int argc, char **argv, rocket::Options &out, std::string &error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-o" && i + 1 < argc) {
      out.outputPath = argv[++i];
    } else if (arg == "--version-string" && i + 1 < argc) {
      out.versionString = argv[++i];
    } else if (arg.rfind("--version-string=", 0) == 0) {
      out.versionString = arg.substr(std::string("--version-string=").size());
    } else if (arg == "--recursion-limit" && i + 1 < argc) {
      if (!parseRecursionLimit(argv[++i], out.recursionLimit, error)) {
        return false;
      }
    } else if (arg.rfind("--recursion-limit=", 0) == 0) {
      if (!parseRecursionLimit(arg.substr(std::string("--recursion-limit=").size()), out.recursionLimit, error)) {
        return false;
      }
    } else if (arg == "--dump-stage" && i + 1 < argc) {
      out.dumpStage = argv[++i];
    } else if (arg.rfind("--dump-stage=", 0) == 0) {
      out.dumpStage = arg.substr(std::string("--dump-stage=").size());
    } else if (arg == "--metadata-out" && i + 1 < argc) {
      out.metadataPath = argv[++i];
    } else if (arg.rfind("--metadata-out=", 0) == 0) {
      out.metadataPath = arg.substr(std::string("--metadata-out=").size());
    } else if (!arg.empty() && arg[0] == '-') {
      error = "unknown option: " + arg;
      return false;
    } else {
      if (!out.inputPath.empty()) {
        error = "multiple input files";
        return false;
      }
      out.inputPath = arg;
    }
  }
  if (out.inputPath.empty()) {
    error = "missing input file";
    return false;
  }
  if (!out.dumpStage.empty() && out.dumpStage != "ast") {
    error = "unsupported dump stage: " + out.dumpStage;
    return false;
  }
  if (out.versionString.empty()) {
    out.versionString = ROCKET_VERSION_STRING;
  }
  return true;
}

bool writeFile(const std::string &path, const std::string &contents) {
  std::ofstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  file << contents;
  return file.good();
}

std::string formatMetadata(const std::map<std::string, std::string> &metadata) {
  std::string text;
  for (const auto &[key, value] : metadata) {
    text += key + "=" + value + "\n";
  }
  return text;
}

int dumpAst(const rocket::FileLoader &loader, const std::string &inputPath) {
  const std::string canonical = loader.canonicalize(inputPath);
  std::string source;
  std::string loadError;
  if (!loader.load(canonical, source, loadError)) {
    std::cerr << "Evaluation error: FileIOError: " << loadError << "\n";
    return 2;
  }
  rocket::Document document;
  rocket::Error error;
  if (!rocket::parseDocument(source, canonical, document, error)) {
    std::cerr << "Parse error: " << error.describe() << "\n";
    return 2;
  }
  rocket::AstPrinter printer;
  std::cout << printer.print(document);
  return 0;
}
} // namespace

int main(int argc, char **argv) {
  rocket::Options options;
  std::string argError;
  if (!parseArgs(argc, argv, options, argError)) {
    std::cerr << "Argument error: " << argError << "\n";
    std::cerr << "Usage: rocketc <input.rkt> [-o <output>] [--version-string <v>] [--recursion-limit <n>] "
                 "[--dump-stage ast] [--metadata-out <path>]\n";
    return 2;
  }

  rocket::FilesystemLoader loader;
  if (options.dumpStage == "ast") {
    return dumpAst(loader, options.inputPath);
  }

  rocket::Collaborators collaborators;
  const std::string version = options.versionString;
  collaborators.versionString = [version]() { return version; };
  collaborators.renderMarkdown = [](const std::string &text) { return text; };
  collaborators.loader = &loader;
  rocket::EvaluatorOptions evaluatorOptions;
  evaluatorOptions.recursionLimit = options.recursionLimit;
  rocket::Evaluator evaluator(collaborators, evaluatorOptions);

  std::string output;
  rocket::Error error;
  if (!evaluator.compileFile(options.inputPath, output, error)) {
    const char *stage = error.kind == rocket::ErrorKind::Syntax ? "Parse error: " : "Evaluation error: ";
    std::cerr << stage << error.describe() << "\n";
    return 2;
  }

  if (!options.metadataPath.empty() && !writeFile(options.metadataPath, formatMetadata(evaluator.metadata()))) {
    std::cerr << "Output error: failed to write metadata: " << options.metadataPath << "\n";
    return 2;
  }
  if (options.outputPath.empty()) {
    std::cout << output;
    return 0;
  }
  if (!writeFile(options.outputPath, output)) {
    std::cerr << "Output error: failed to write output: " << options.outputPath << "\n";
    return 2;
  }
  return 0;
}
