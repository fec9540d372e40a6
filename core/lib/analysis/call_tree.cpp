// callscope/analysis/call_tree.cpp - Call tree node helpers
//
#include "callscope/analysis/call_tree.hpp"

#include <algorithm>
#include <utility>

namespace callscope
{

std::string_view to_string(CallNodeKind kind) noexcept
{
  switch (kind) {
    case CallNodeKind::Expanded:
      return "expanded";
    case CallNodeKind::RecursiveCut:
      return "recursive_cut";
    case CallNodeKind::ExternalUnresolved:
      return "external_unresolved";
    case CallNodeKind::NotFound:
      return "not_found";
    case CallNodeKind::BudgetExceeded:
      return "budget_exceeded";
    case CallNodeKind::AmbiguousTarget:
      return "ambiguous_target";
  }
  return "unknown";
}

CallTreeNode::~CallTreeNode()
{
  if (children.empty()) {
    return;
  }

  // Detach descendants level by level so that no destructor below this one
  // ever sees a non-empty child list.
  std::vector<CallTreeNode> pending = std::move(children);
  children.clear();
  while (!pending.empty()) {
    CallTreeNode node = std::move(pending.back());
    pending.pop_back();
    for (auto & child : node.children) {
      pending.push_back(std::move(child));
    }
    node.children.clear();
  }
}

size_t CallTreeNode::subtree_size() const
{
  size_t count = 0;
  std::vector<const CallTreeNode *> stack{this};
  while (!stack.empty()) {
    const CallTreeNode * n = stack.back();
    stack.pop_back();
    ++count;
    for (const auto & c : n->children) {
      stack.push_back(&c);
    }
  }
  return count;
}

size_t CallTreeNode::height() const
{
  size_t deepest = 0;
  std::vector<std::pair<const CallTreeNode *, size_t>> stack{{this, 0}};
  while (!stack.empty()) {
    const auto [n, depth] = stack.back();
    stack.pop_back();
    deepest = std::max(deepest, depth);
    for (const auto & c : n->children) {
      stack.emplace_back(&c, depth + 1);
    }
  }
  return deepest;
}

CallTreeNode CallTreeNode::expanded(MethodSignature sig)
{
  CallTreeNode n;
  n.kind = CallNodeKind::Expanded;
  n.signature = std::move(sig);
  return n;
}

CallTreeNode CallTreeNode::recursive_cut(MethodSignature sig)
{
  CallTreeNode n;
  n.kind = CallNodeKind::RecursiveCut;
  n.signature = std::move(sig);
  return n;
}

CallTreeNode CallTreeNode::external(std::string call_site)
{
  CallTreeNode n;
  n.kind = CallNodeKind::ExternalUnresolved;
  n.call_site = std::move(call_site);
  if (auto sig = parse_signature(n.call_site)) {
    n.signature = std::move(*sig);
  }
  return n;
}

CallTreeNode CallTreeNode::not_found(MethodSignature requested, MissingPart missing)
{
  CallTreeNode n;
  n.kind = CallNodeKind::NotFound;
  n.signature = std::move(requested);
  n.missing = missing;
  return n;
}

CallTreeNode CallTreeNode::budget_exceeded(MethodSignature sig)
{
  CallTreeNode n;
  n.kind = CallNodeKind::BudgetExceeded;
  n.signature = std::move(sig);
  return n;
}

CallTreeNode CallTreeNode::ambiguous(std::string call_site, std::vector<MethodSignature> candidates)
{
  CallTreeNode n;
  n.kind = CallNodeKind::AmbiguousTarget;
  n.call_site = std::move(call_site);
  n.candidates = std::move(candidates);
  if (auto sig = parse_signature(n.call_site)) {
    n.signature = std::move(*sig);
  }
  return n;
}

}  // namespace callscope
