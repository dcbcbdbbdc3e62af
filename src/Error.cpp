#include "rocket/Error.h"

#include <sstream>
#include <utility>

namespace rocket {

bool Error::fail(ErrorKind errorKind, std::string errorMessage) {
  kind = errorKind;
  message = std::move(errorMessage);
  trace.clear();
  return false;
}

void Error::addLocation(const std::string &path, int line, int column) {
  trace.push_back({path, line, column});
}

std::string Error::describe() const {
  std::ostringstream out;
  out << errorKindName(kind) << ": " << message;
  for (const auto &location : trace) {
    out << "\n  at " << (location.path.empty() ? "<input>" : location.path) << ":" << location.line << ":"
        << location.column;
  }
  return out.str();
}

std::string_view errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "NoError";
  case ErrorKind::Syntax:
    return "SyntaxError";
  case ErrorKind::UnknownDirective:
    return "UnknownDirective";
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::Arity:
    return "ArityError";
  case ErrorKind::NoMatchingTemplate:
    return "NoMatchingTemplate";
  case ErrorKind::CircularImport:
    return "CircularImport";
  case ErrorKind::FileIO:
    return "FileIOError";
  case ErrorKind::RecursionLimit:
    return "RecursionLimitExceeded";
  case ErrorKind::InvalidPattern:
    return "InvalidPattern";
  case ErrorKind::InvalidHeading:
    return "InvalidHeading";
  }
  return "UnknownError";
}

} // namespace rocket
