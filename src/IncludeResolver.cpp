#include "rocket/IncludeResolver.h"

#include "rocket/Parser.h"

#include <algorithm>
#include <filesystem>
#include <utility>

namespace rocket {

IncludeResolver::IncludeResolver(const FileLoader &loader) : loader_(loader) {}

std::string IncludeResolver::resolvePath(const std::string &requested, const std::string &fromDocument) const {
  std::filesystem::path target(requested);
  if (!target.is_absolute() && !fromDocument.empty()) {
    target = std::filesystem::path(fromDocument).parent_path() / target;
  }
  return loader_.canonicalize(target.string());
}

bool IncludeResolver::load(const std::string &canonicalPath, std::shared_ptr<const Document> &out, Error &error) {
  auto cached = cache_.find(canonicalPath);
  if (cached != cache_.end()) {
    out = cached->second;
    return true;
  }
  std::string source;
  std::string loadError;
  if (!loader_.load(canonicalPath, source, loadError)) {
    return error.fail(ErrorKind::FileIO, loadError);
  }
  auto document = std::make_shared<Document>();
  if (!parseDocument(source, canonicalPath, *document, error)) {
    return false;
  }
  out = document;
  cache_.emplace(canonicalPath, std::move(document));
  return true;
}

bool IncludeResolver::enter(const std::string &canonicalPath, Error &error) {
  auto existing = std::find(active_.begin(), active_.end(), canonicalPath);
  if (existing != active_.end()) {
    std::string chain;
    for (const auto &path : active_) {
      chain += path + " -> ";
    }
    chain += canonicalPath;
    return error.fail(ErrorKind::CircularImport, "circular import: " + chain);
  }
  active_.push_back(canonicalPath);
  return true;
}

void IncludeResolver::leave() {
  if (!active_.empty()) {
    active_.pop_back();
  }
}

} // namespace rocket
