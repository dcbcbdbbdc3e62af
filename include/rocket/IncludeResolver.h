#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "rocket/Ast.h"
#include "rocket/Error.h"
#include "rocket/FileLoader.h"

namespace rocket {

class IncludeResolver {
public:
  explicit IncludeResolver(const FileLoader &loader);

  // Resolves `requested` against the directory of `fromDocument` and returns the canonical path.
  std::string resolvePath(const std::string &requested, const std::string &fromDocument) const;

  // Parses each canonical path at most once per resolver; later calls return the cached document.
  bool load(const std::string &canonicalPath, std::shared_ptr<const Document> &out, Error &error);

  // Fails with CircularImport when `canonicalPath` is already being resolved.
  bool enter(const std::string &canonicalPath, Error &error);
  void leave();

  const std::vector<std::string> &activeChain() const { return active_; }
  size_t cachedCount() const { return cache_.size(); }

  struct ActiveGuard {
    explicit ActiveGuard(IncludeResolver &resolver) : resolver_(resolver) {}
    ~ActiveGuard() {
      if (entered_) {
        resolver_.leave();
      }
    }
    ActiveGuard(const ActiveGuard &) = delete;
    ActiveGuard &operator=(const ActiveGuard &) = delete;

    bool enter(const std::string &canonicalPath, Error &error) {
      entered_ = resolver_.enter(canonicalPath, error);
      return entered_;
    }

  private:
    IncludeResolver &resolver_;
    bool entered_ = false;
  };

private:
  const FileLoader &loader_;
  std::unordered_map<std::string, std::shared_ptr<const Document>> cache_;
  std::vector<std::string> active_;
};

} // namespace rocket
