#pragma once

#include <string>
#include <unordered_map>

namespace rocket {

class FileLoader {
public:
  virtual ~FileLoader() = default;

  // Key used for the parsed-file cache and cycle detection.
  virtual std::string canonicalize(const std::string &path) const = 0;
  virtual bool load(const std::string &canonicalPath, std::string &contents, std::string &error) const = 0;
};

class FilesystemLoader final : public FileLoader {
public:
  std::string canonicalize(const std::string &path) const override;
  bool load(const std::string &canonicalPath, std::string &contents, std::string &error) const override;
};

// Serves documents registered up front; paths are normalized lexically and never touch the disk.
class MemoryLoader final : public FileLoader {
public:
  void addFile(const std::string &path, std::string contents);

  std::string canonicalize(const std::string &path) const override;
  bool load(const std::string &canonicalPath, std::string &contents, std::string &error) const override;

  size_t loadCount(const std::string &path) const;

private:
  std::unordered_map<std::string, std::string> files_;
  mutable std::unordered_map<std::string, size_t> loads_;
};

} // namespace rocket
