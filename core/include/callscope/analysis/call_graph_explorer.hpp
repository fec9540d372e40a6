// callscope/analysis/call_graph_explorer.hpp - Path-sensitive call tree construction
//
// Expands the invocation sites of an entry method depth-first, in statement
// order. Cycle detection is scoped to the current root-to-node path: a method
// reached through two different call chains is expanded once per chain, and
// a branch is cut only when it revisits a method already on its own chain.
//
#pragma once

#include <array>
#include <cstddef>
#include <string_view>

#include "callscope/analysis/call_tree.hpp"
#include "callscope/analysis/method_resolver.hpp"
#include "callscope/model/program_model.hpp"

namespace callscope
{

/**
 * Traversal options. A budget of 0 means unlimited.
 */
struct ExploreOptions
{
  ResolutionMode resolution = ResolutionMode::NameOnly;

  /// Stop the whole traversal once the tree holds this many nodes
  size_t max_nodes = 0;

  /// Do not expand callees deeper than this (root is depth 0)
  size_t max_depth = 0;
};

/**
 * Counters gathered while exploring.
 */
struct ExploreStats
{
  size_t node_count = 0;
  size_t max_depth_reached = 0;
  bool truncated = false;

  /// Indexed by CallNodeKind
  std::array<size_t, 6> by_kind{};

  [[nodiscard]] size_t count(CallNodeKind kind) const noexcept
  {
    return by_kind[static_cast<size_t>(kind)];
  }
};

/**
 * Builds call trees over a program model.
 *
 * The explorer itself is stateless between calls; every explore() starts
 * from an empty path.
 */
class CallGraphExplorer
{
public:
  explicit CallGraphExplorer(const ProgramModel & program, ExploreOptions options = {})
  : program_(program), options_(options)
  {
  }

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /**
   * Build the call tree of `entry_class`.`entry_method`.
   *
   * A missing class or method yields a single NotFound node.
   */
  [[nodiscard]] CallTreeNode explore(std::string_view entry_class, std::string_view entry_method);

  /**
   * Build the call tree of a method already looked up in the program.
   */
  [[nodiscard]] CallTreeNode explore(const MethodDescriptor & entry);

  // ===========================================================================
  // State
  // ===========================================================================

  /// Counters of the most recent explore() call
  [[nodiscard]] const ExploreStats & stats() const noexcept { return stats_; }

  [[nodiscard]] const ExploreOptions & options() const noexcept { return options_; }

private:
  void count_node(const CallTreeNode & node, size_t depth);

  const ProgramModel & program_;
  ExploreOptions options_;
  ExploreStats stats_;
};

}  // namespace callscope
