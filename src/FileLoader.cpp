#include "rocket/FileLoader.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace rocket {

std::string FilesystemLoader::canonicalize(const std::string &path) const {
  std::error_code ec;
  std::filesystem::path absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return std::filesystem::path(path).lexically_normal().string();
  }
  std::filesystem::path canonical = std::filesystem::weakly_canonical(absolute, ec);
  if (ec) {
    return absolute.lexically_normal().string();
  }
  return canonical.string();
}

bool FilesystemLoader::load(const std::string &canonicalPath, std::string &contents, std::string &error) const {
  std::ifstream file(canonicalPath, std::ios::binary);
  if (!file) {
    error = "failed to read file: " + canonicalPath;
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    error = "failed while reading file: " + canonicalPath;
    return false;
  }
  contents = buffer.str();
  return true;
}

void MemoryLoader::addFile(const std::string &path, std::string contents) {
  files_[canonicalize(path)] = std::move(contents);
}

std::string MemoryLoader::canonicalize(const std::string &path) const {
  return std::filesystem::path(path).lexically_normal().generic_string();
}

bool MemoryLoader::load(const std::string &canonicalPath, std::string &contents, std::string &error) const {
  auto it = files_.find(canonicalPath);
  if (it == files_.end()) {
    error = "no such file: " + canonicalPath;
    return false;
  }
  ++loads_[canonicalPath];
  contents = it->second;
  return true;
}

size_t MemoryLoader::loadCount(const std::string &path) const {
  auto it = loads_.find(canonicalize(path));
  return it == loads_.end() ? 0 : it->second;
}

} // namespace rocket
