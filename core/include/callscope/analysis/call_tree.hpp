// callscope/analysis/call_tree.hpp - Call tree produced by the explorer
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "callscope/model/signature.hpp"

namespace callscope
{

/**
 * Terminal marker of a call tree node. Only Expanded nodes have children.
 */
enum class CallNodeKind : uint8_t {
  Expanded,
  RecursiveCut,
  ExternalUnresolved,
  NotFound,
  BudgetExceeded,
  AmbiguousTarget,
};

/// Which part of the entry point was missing for a NotFound node
enum class MissingPart : uint8_t {
  None,
  Class,
  Method,
};

[[nodiscard]] std::string_view to_string(CallNodeKind kind) noexcept;

/**
 * A node of the call tree.
 *
 * Children are owned by value. Destruction is iterative so arbitrarily deep
 * trees can be released.
 */
struct CallTreeNode
{
  CallNodeKind kind = CallNodeKind::Expanded;

  /// Resolved method (Expanded, RecursiveCut, BudgetExceeded) or requested entry (NotFound)
  MethodSignature signature;

  /// Raw call text (ExternalUnresolved, AmbiguousTarget)
  std::string call_site;

  /// NotFound only
  MissingPart missing = MissingPart::None;

  /// AmbiguousTarget only, in declared order
  std::vector<MethodSignature> candidates;

  std::vector<CallTreeNode> children;

  CallTreeNode() = default;
  CallTreeNode(const CallTreeNode &) = default;
  CallTreeNode & operator=(const CallTreeNode &) = default;
  CallTreeNode(CallTreeNode &&) noexcept = default;
  CallTreeNode & operator=(CallTreeNode &&) noexcept = default;
  ~CallTreeNode();

  [[nodiscard]] bool is_leaf() const noexcept { return children.empty(); }

  /// Number of nodes in this subtree, including this one
  [[nodiscard]] size_t subtree_size() const;

  /// Depth of the deepest node below this one (0 for a leaf)
  [[nodiscard]] size_t height() const;

  // --- Factories ---
  [[nodiscard]] static CallTreeNode expanded(MethodSignature sig);
  [[nodiscard]] static CallTreeNode recursive_cut(MethodSignature sig);
  [[nodiscard]] static CallTreeNode external(std::string call_site);
  [[nodiscard]] static CallTreeNode not_found(MethodSignature requested, MissingPart missing);
  [[nodiscard]] static CallTreeNode budget_exceeded(MethodSignature sig);
  [[nodiscard]] static CallTreeNode ambiguous(
    std::string call_site, std::vector<MethodSignature> candidates);
};

}  // namespace callscope
