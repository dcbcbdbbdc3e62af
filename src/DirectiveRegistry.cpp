#include "rocket/DirectiveRegistry.h"

#include "directives/Directives.h"

#include <algorithm>
#include <array>
#include <string_view>

namespace {
struct BuiltinEntry {
  std::string_view name;
  rocket::DirectiveHandler handler;
};

constexpr std::array<BuiltinEntry, 27> kBuiltinDirectives = {{
    {"null", rocket::directives::handleNull},
    {"concat", rocket::directives::handleConcat},
    {"md", rocket::directives::handleMarkdown},
    {"version", rocket::directives::handleVersion},
    {"theme-config", rocket::directives::handleThemeConfig},
    {"definition-list", rocket::directives::handleDefinitionList},
    {"note", rocket::directives::handleNote},
    {"warning", rocket::directives::handleWarning},
    {"h1", rocket::directives::handleHeading1},
    {"h2", rocket::directives::handleHeading2},
    {"h3", rocket::directives::handleHeading3},
    {"h4", rocket::directives::handleHeading4},
    {"h5", rocket::directives::handleHeading5},
    {"h6", rocket::directives::handleHeading6},
    {"define-ref", rocket::directives::handleDefineRef},
    {"ref", rocket::directives::handleRef},
    {"steps", rocket::directives::handleSteps},
    {"table", rocket::directives::handleTable},
    {"let", rocket::directives::handleLet},
    {"define", rocket::directives::handleDefine},
    {"define-template", rocket::directives::handleDefineTemplate},
    {"include", rocket::directives::handleInclude},
    {"import", rocket::directives::handleImport},
    {"if", rocket::directives::handleIf},
    {"not", rocket::directives::handleNot},
    {"=", rocket::directives::handleEquals},
    {"!=", rocket::directives::handleNotEquals},
}};
} // namespace

namespace rocket {

void DirectiveRegistry::add(std::string name, DirectiveHandler handler) {
  handlers_[std::move(name)] = handler;
}

DirectiveHandler DirectiveRegistry::find(const std::string &name) const {
  auto it = handlers_.find(name);
  return it == handlers_.end() ? nullptr : it->second;
}

std::vector<std::string> DirectiveRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(handlers_.size());
  for (const auto &[name, _] : handlers_) {
    out.push_back(name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

DirectiveRegistry makeBuiltinRegistry() {
  DirectiveRegistry registry;
  for (const auto &entry : kBuiltinDirectives) {
    registry.add(std::string(entry.name), entry.handler);
  }
  return registry;
}

} // namespace rocket
