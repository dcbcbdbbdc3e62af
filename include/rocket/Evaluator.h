#pragma once

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "rocket/Ast.h"
#include "rocket/DirectiveRegistry.h"
#include "rocket/Environment.h"
#include "rocket/Error.h"
#include "rocket/FileLoader.h"
#include "rocket/IncludeResolver.h"

namespace rocket {

struct Collaborators {
  // Used by (:md ...); text passes through unchanged when unset.
  std::function<std::string(const std::string &)> renderMarkdown;
  std::function<std::string()> versionString;
  const FileLoader *loader = nullptr;
};

struct EvaluatorOptions {
  int recursionLimit = 64;
};

struct EvalFrame {
  ScopeId scope;
  // Document the evaluated expression came from; include paths resolve against its directory.
  std::string documentPath;
};

// One Evaluator is one compile run: the parsed-file cache, metadata and root scope live as long as it does.
class Evaluator {
public:
  explicit Evaluator(Collaborators collaborators, EvaluatorOptions options = {});
  Evaluator(const Evaluator &) = delete;
  Evaluator &operator=(const Evaluator &) = delete;

  bool compileFile(const std::string &path, std::string &out, Error &error);
  bool compileSource(const std::string &source, const std::string &path, std::string &out, Error &error);

  bool evaluate(const Expr &expr, const EvalFrame &frame, std::string &out, Error &error);
  // Evaluates `exprs[first..]` left to right and concatenates the results.
  bool evaluateRange(const std::vector<Expr> &exprs,
                     size_t first,
                     const EvalFrame &frame,
                     std::string &out,
                     Error &error);
  // Evaluates the `(:name ...)` calls embedded in text produced by a user directive. Calls found in
  // the text report `site`, the invocation that produced it, as their location.
  bool reenter(std::string text, const Expr &site, const EvalFrame &frame, std::string &out, Error &error);

  // Headings wrap their content in <section> elements. Sets `prefix` to the markup that closes
  // sections at or below `level` and opens one when the heading goes a level deeper.
  bool enterHeading(int level, std::string &prefix, Error &error);

  // Reference targets from (:define-ref id title) and headings with an explicit id.
  void defineReference(const std::string &id, std::string title) { references_[id] = std::move(title); }
  const std::string *findReference(const std::string &id) const;
  // Marks `id` as required by the end of the compile. Returns text that stands in for its title
  // until the whole document has been evaluated.
  std::string deferReference(const std::string &id, const SourceLocation &site);

  ScopeArena &scopes() { return scopes_; }
  const ScopeArena &scopes() const { return scopes_; }
  ScopeId rootScope() const { return scopes_.root(); }
  IncludeResolver &resolver() { return resolver_; }
  const Collaborators &collaborators() const { return collaborators_; }

  std::map<std::string, std::string> &metadata() { return metadata_; }
  const std::map<std::string, std::string> &metadata() const { return metadata_; }

  int depth() const { return depth_; }

  struct DepthGuard {
    explicit DepthGuard(Evaluator &evaluator) : evaluator_(evaluator) {}
    ~DepthGuard() {
      if (entered_) {
        --evaluator_.depth_;
      }
    }
    DepthGuard(const DepthGuard &) = delete;
    DepthGuard &operator=(const DepthGuard &) = delete;

    bool enter(Error &error);

  private:
    Evaluator &evaluator_;
    bool entered_ = false;
  };

private:
  bool evaluateList(const Expr &expr, const EvalFrame &frame, std::string &out, Error &error);
  bool invokeDirective(const std::string &name, const Expr &expr, const EvalFrame &frame, std::string &out, Error &error);
  bool invokeMacro(const std::string &name,
                   const Binding &binding,
                   const Expr &expr,
                   const EvalFrame &frame,
                   std::string &out,
                   Error &error);
  bool invokeTemplate(const std::string &name, const Expr &expr, const EvalFrame &frame, std::string &out, Error &error);
  bool evaluateDocument(const Document &document, std::string &out, Error &error);
  bool resolveReferences(std::string &text, Error &error);

  Collaborators collaborators_;
  EvaluatorOptions options_;
  DirectiveRegistry registry_;
  ScopeArena scopes_;
  MemoryLoader emptyLoader_;
  IncludeResolver resolver_;
  std::map<std::string, std::string> metadata_;
  std::map<std::string, std::string> references_;
  std::vector<std::pair<std::string, SourceLocation>> pendingReferences_;
  int sectionDepth_ = 0;
  int depth_ = 0;
};

} // namespace rocket
