#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rocket {

enum class ErrorKind {
  None,
  Syntax,
  UnknownDirective,
  NotFound,
  Arity,
  NoMatchingTemplate,
  CircularImport,
  FileIO,
  RecursionLimit,
  InvalidPattern,
  InvalidHeading
};

struct SourceLocation {
  std::string path;
  int line = 0;
  int column = 0;
};

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  // Innermost frame first; include/import sites are appended as the error unwinds.
  std::vector<SourceLocation> trace;

  // Always returns false so callers can write `return error.fail(...)`.
  bool fail(ErrorKind errorKind, std::string errorMessage);
  void addLocation(const std::string &path, int line, int column);
  bool ok() const { return kind == ErrorKind::None; }
  std::string describe() const;
};

std::string_view errorKindName(ErrorKind kind);

} // namespace rocket
