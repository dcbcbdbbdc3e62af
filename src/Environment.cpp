#include "rocket/Environment.h"

#include <utility>

namespace rocket {

Binding Binding::macro(Expr body, std::string documentPath) {
  Binding binding;
  binding.kind = Kind::Macro;
  binding.body = std::make_shared<const Expr>(std::move(body));
  binding.documentPath = std::move(documentPath);
  return binding;
}

ScopeArena::ScopeArena() {
  records_.emplace_back();
  records_.back().live = true;
  root_ = {0, 0};
  liveCount_ = 1;
}

ScopeId ScopeArena::createChild(ScopeId parent) {
  uint32_t index = 0;
  if (!freeList_.empty()) {
    index = freeList_.back();
    freeList_.pop_back();
  } else {
    index = static_cast<uint32_t>(records_.size());
    records_.emplace_back();
  }
  ScopeRecord &slot = records_[index];
  slot.live = true;
  slot.hasParent = true;
  slot.parent = parent;
  slot.table.clear();
  ++liveCount_;
  return {index, slot.generation};
}

void ScopeArena::release(ScopeId id) {
  if (id == root_) {
    return;
  }
  ScopeRecord *slot = record(id);
  if (!slot) {
    return;
  }
  slot->live = false;
  slot->table.clear();
  ++slot->generation;
  freeList_.push_back(id.index);
  --liveCount_;
}

bool ScopeArena::isLive(ScopeId id) const {
  return record(id) != nullptr;
}

const ScopeArena::ScopeRecord *ScopeArena::record(ScopeId id) const {
  if (id.index >= records_.size()) {
    return nullptr;
  }
  const ScopeRecord &slot = records_[id.index];
  if (!slot.live || slot.generation != id.generation) {
    return nullptr;
  }
  return &slot;
}

ScopeArena::ScopeRecord *ScopeArena::record(ScopeId id) {
  return const_cast<ScopeRecord *>(static_cast<const ScopeArena *>(this)->record(id));
}

bool ScopeArena::staleScope(ScopeId id, Error &error) const {
  return error.fail(ErrorKind::NotFound,
                    "scope " + std::to_string(id.index) + "#" + std::to_string(id.generation) + " is no longer live");
}

bool ScopeArena::define(ScopeId scope, const std::string &name, Binding binding, Error &error) {
  ScopeRecord *slot = record(scope);
  if (!slot) {
    return staleScope(scope, error);
  }
  slot->table[name] = std::move(binding);
  return true;
}

bool ScopeArena::defineTemplate(ScopeId scope, std::shared_ptr<const TemplateDef> def, Error &error) {
  ScopeRecord *slot = record(scope);
  if (!slot) {
    return staleScope(scope, error);
  }
  Binding &binding = slot->table[def->name];
  if (binding.kind != Binding::Kind::Templates) {
    binding = Binding();
    binding.kind = Binding::Kind::Templates;
  }
  binding.templates.insert(binding.templates.begin(), std::move(def));
  return true;
}

const Binding *ScopeArena::find(ScopeId scope, const std::string &name) const {
  const ScopeRecord *cursor = record(scope);
  while (cursor) {
    auto it = cursor->table.find(name);
    if (it != cursor->table.end()) {
      return &it->second;
    }
    cursor = cursor->hasParent ? record(cursor->parent) : nullptr;
  }
  return nullptr;
}

bool ScopeArena::lookup(ScopeId scope, const std::string &name, Binding &out, Error &error) const {
  if (!record(scope)) {
    return staleScope(scope, error);
  }
  const Binding *binding = find(scope, name);
  if (!binding) {
    return error.fail(ErrorKind::NotFound, "unbound name: " + name);
  }
  out = *binding;
  return true;
}

TemplateList ScopeArena::findTemplates(ScopeId scope, const std::string &name) const {
  TemplateList found;
  const ScopeRecord *cursor = record(scope);
  while (cursor) {
    auto it = cursor->table.find(name);
    if (it != cursor->table.end()) {
      if (it->second.kind == Binding::Kind::Macro) {
        break;
      }
      found.insert(found.end(), it->second.templates.begin(), it->second.templates.end());
    }
    cursor = cursor->hasParent ? record(cursor->parent) : nullptr;
  }
  return found;
}

bool ScopeArena::mergeInto(ScopeId source, ScopeId target, Error &error) {
  const ScopeRecord *from = record(source);
  if (!from) {
    return staleScope(source, error);
  }
  ScopeRecord *to = record(target);
  if (!to) {
    return staleScope(target, error);
  }
  for (const auto &[name, binding] : from->table) {
    to->table[name] = binding;
  }
  return true;
}

} // namespace rocket
