#pragma once

#include <string>

namespace rocket {
struct Options {
  std::string inputPath;
  std::string outputPath;
  std::string versionString;
  std::string dumpStage;
  std::string metadataPath;
  int recursionLimit = 64;
};
} // namespace rocket
