// callscope/analysis/visited_path.hpp - Persistent root-to-node path
//
#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "callscope/model/signature.hpp"

namespace callscope
{

/**
 * The methods on the current root-to-node path of a traversal.
 *
 * Immutable: extended() returns a new path that shares its prefix with this
 * one, so sibling branches never observe each other's extensions.
 */
class VisitedPath
{
public:
  VisitedPath() = default;
  VisitedPath(const VisitedPath &) = default;
  VisitedPath & operator=(const VisitedPath &) = default;
  VisitedPath(VisitedPath &&) noexcept = default;
  VisitedPath & operator=(VisitedPath &&) noexcept = default;

  // Releases uniquely owned links one at a time instead of recursively
  ~VisitedPath()
  {
    std::shared_ptr<const Link> l = std::move(head_);
    while (l && l.use_count() == 1) {
      std::shared_ptr<const Link> next = l->parent;
      l = std::move(next);
    }
  }

  [[nodiscard]] VisitedPath extended(const MethodSignature & sig) const
  {
    VisitedPath next;
    next.head_ = std::make_shared<const Link>(Link{sig, head_, size() + 1});
    return next;
  }

  [[nodiscard]] bool contains(const MethodSignature & sig) const
  {
    for (const Link * l = head_.get(); l != nullptr; l = l->parent.get()) {
      if (l->sig == sig) {
        return true;
      }
    }
    return false;
  }

  [[nodiscard]] size_t size() const noexcept { return head_ ? head_->depth : 0; }
  [[nodiscard]] bool empty() const noexcept { return head_ == nullptr; }

  /// Signatures from root to the most recent entry
  [[nodiscard]] std::vector<MethodSignature> to_vector() const
  {
    std::vector<MethodSignature> out(size());
    size_t i = out.size();
    for (const Link * l = head_.get(); l != nullptr; l = l->parent.get()) {
      out[--i] = l->sig;
    }
    return out;
  }

private:
  struct Link
  {
    MethodSignature sig;
    std::shared_ptr<const Link> parent;
    size_t depth = 0;
  };

  std::shared_ptr<const Link> head_;
};

}  // namespace callscope
