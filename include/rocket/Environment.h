#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "rocket/Ast.h"
#include "rocket/Error.h"
#include "rocket/TemplateMatcher.h"

namespace rocket {

struct ScopeId {
  uint32_t index = 0;
  uint32_t generation = 0;

  bool operator==(const ScopeId &other) const { return index == other.index && generation == other.generation; }
  bool operator!=(const ScopeId &other) const { return !(*this == other); }
};

struct Binding {
  enum class Kind { Macro, Templates } kind = Kind::Macro;
  std::shared_ptr<const Expr> body;
  // Most recently defined first.
  TemplateList templates;
  // Document the macro body was written in; empty for values computed at runtime.
  std::string documentPath;

  static Binding macro(Expr body, std::string documentPath = {});
};

// Scope records addressed by index + generation. Released slots are reused with a bumped
// generation, so a handle kept past its frame is detected instead of aliasing a new scope.
class ScopeArena {
public:
  ScopeArena();

  ScopeId root() const { return root_; }
  ScopeId createChild(ScopeId parent);
  void release(ScopeId id);
  bool isLive(ScopeId id) const;
  size_t liveCount() const { return liveCount_; }

  bool define(ScopeId scope, const std::string &name, Binding binding, Error &error);
  bool defineTemplate(ScopeId scope, std::shared_ptr<const TemplateDef> def, Error &error);

  // Innermost binding wins; a miss at the root is a NotFound error.
  bool lookup(ScopeId scope, const std::string &name, Binding &out, Error &error) const;
  const Binding *find(ScopeId scope, const std::string &name) const;
  // Every visible template named `name`, innermost scope first. A macro binding hides outer templates.
  TemplateList findTemplates(ScopeId scope, const std::string &name) const;

  // Copies `source`'s definition table into `target`, overwriting same-named entries.
  bool mergeInto(ScopeId source, ScopeId target, Error &error);

private:
  struct ScopeRecord {
    uint32_t generation = 0;
    bool live = false;
    bool hasParent = false;
    ScopeId parent;
    std::unordered_map<std::string, Binding> table;
  };

  const ScopeRecord *record(ScopeId id) const;
  ScopeRecord *record(ScopeId id);
  bool staleScope(ScopeId id, Error &error) const;

  std::deque<ScopeRecord> records_;
  std::vector<uint32_t> freeList_;
  ScopeId root_;
  size_t liveCount_ = 0;
};

class ScopeGuard {
public:
  ScopeGuard(ScopeArena &arena, ScopeId parent) : arena_(arena), id_(arena.createChild(parent)) {}
  ~ScopeGuard() { arena_.release(id_); }
  ScopeGuard(const ScopeGuard &) = delete;
  ScopeGuard &operator=(const ScopeGuard &) = delete;

  ScopeId id() const { return id_; }

private:
  ScopeArena &arena_;
  ScopeId id_;
};

} // namespace rocket
