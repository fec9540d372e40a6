// callscope/analysis/call_graph_explorer.cpp - Path-sensitive call tree construction
//
#include "callscope/analysis/call_graph_explorer.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "callscope/analysis/visited_path.hpp"

namespace callscope
{

namespace
{

/// A method whose invocation sites are being expanded
struct Frame
{
  CallTreeNode * node = nullptr;
  const MethodDescriptor * method = nullptr;
  size_t next_site = 0;
  size_t depth = 0;
  VisitedPath path;
};

MethodSignature requested_signature(std::string_view cls, std::string_view method)
{
  MethodSignature sig;
  sig.class_name = std::string(cls);
  sig.method_name = std::string(method);
  sig.return_type.clear();
  sig.has_parameters = false;
  return sig;
}

std::vector<MethodSignature> candidate_signatures(const Resolution & r)
{
  std::vector<MethodSignature> out;
  out.reserve(r.candidates.size());
  for (const auto * m : r.candidates) {
    out.push_back(m->signature());
  }
  return out;
}

}  // namespace

CallTreeNode CallGraphExplorer::explore(std::string_view entry_class, std::string_view entry_method)
{
  const ClassDescriptor * cls = program_.find_class(entry_class);
  if (!cls) {
    stats_ = ExploreStats{};
    CallTreeNode root =
      CallTreeNode::not_found(requested_signature(entry_class, entry_method), MissingPart::Class);
    count_node(root, 0);
    return root;
  }

  const MethodDescriptor * method = program_.find_method_by_name(*cls, entry_method);
  if (!method) {
    stats_ = ExploreStats{};
    CallTreeNode root =
      CallTreeNode::not_found(requested_signature(entry_class, entry_method), MissingPart::Method);
    count_node(root, 0);
    return root;
  }

  return explore(*method);
}

CallTreeNode CallGraphExplorer::explore(const MethodDescriptor & entry)
{
  stats_ = ExploreStats{};
  const MethodResolver resolver(program_, options_.resolution);

  CallTreeNode root = CallTreeNode::expanded(entry.signature());
  count_node(root, 0);

  std::vector<Frame> stack;
  stack.push_back(Frame{&root, &entry, 0, 0, VisitedPath{}.extended(entry.signature())});

  while (!stack.empty()) {
    Frame & top = stack.back();
    const auto & sites = top.method->invocations();
    if (top.next_site >= sites.size()) {
      stack.pop_back();
      continue;
    }

    const InvocationSite & site = sites[top.next_site++];
    const size_t child_depth = top.depth + 1;
    auto & children = top.node->children;

    if (options_.max_nodes != 0 && stats_.node_count >= options_.max_nodes) {
      children.push_back(CallTreeNode::budget_exceeded(MethodSignature{}));
      count_node(children.back(), child_depth);
      stats_.truncated = true;
      break;
    }

    const Resolution r = resolver.resolve(site);

    if (r.kind == ResolutionKind::Unresolved) {
      children.push_back(CallTreeNode::external(site.target));
      count_node(children.back(), child_depth);
      continue;
    }

    if (r.kind == ResolutionKind::AmbiguousCandidates) {
      children.push_back(CallTreeNode::ambiguous(site.target, candidate_signatures(r)));
      count_node(children.back(), child_depth);
      continue;
    }

    const MethodDescriptor * callee = r.method;

    if (top.path.contains(callee->signature())) {
      children.push_back(CallTreeNode::recursive_cut(callee->signature()));
      count_node(children.back(), child_depth);
      continue;
    }

    if (options_.max_depth != 0 && child_depth > options_.max_depth) {
      children.push_back(CallTreeNode::budget_exceeded(callee->signature()));
      count_node(children.back(), child_depth);
      stats_.truncated = true;
      continue;
    }

    children.push_back(CallTreeNode::expanded(callee->signature()));
    CallTreeNode * child = &children.back();
    count_node(*child, child_depth);

    // `top` is invalidated by the push below
    VisitedPath child_path = top.path.extended(callee->signature());
    stack.push_back(Frame{child, callee, 0, child_depth, std::move(child_path)});
  }

  return root;
}

void CallGraphExplorer::count_node(const CallTreeNode & node, size_t depth)
{
  ++stats_.node_count;
  ++stats_.by_kind[static_cast<size_t>(node.kind)];
  stats_.max_depth_reached = std::max(stats_.max_depth_reached, depth);
}

}  // namespace callscope
