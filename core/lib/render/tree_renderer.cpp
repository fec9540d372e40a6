// callscope/render/tree_renderer.cpp - Text and JSON projections of a call tree
//
#include "callscope/render/tree_renderer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <sstream>
#include <utility>
#include <vector>

namespace callscope
{

namespace
{

using nlohmann::json;

constexpr const char * k_indent = "  ";

json j_node(const CallTreeNode & n)
{
  json j{{"kind", std::string(to_string(n.kind))}};

  if (!n.signature.class_name.empty()) {
    j["class"] = n.signature.class_name;
    j["method"] = n.signature.method_name;
    if (n.signature.has_parameters) {
      j["parameters"] = n.signature.parameters;
    }
    if (n.kind != CallNodeKind::NotFound) {
      j["signature"] = n.signature.to_string();
    }
  }

  if (!n.call_site.empty()) {
    j["call_site"] = n.call_site;
  }

  if (n.kind == CallNodeKind::NotFound) {
    j["missing"] = n.missing == MissingPart::Class ? "class" : "method";
  }

  if (n.kind == CallNodeKind::AmbiguousTarget) {
    json cands = json::array();
    for (const auto & c : n.candidates) {
      cands.push_back(c.to_string());
    }
    j["candidates"] = std::move(cands);
  }

  if (n.kind == CallNodeKind::Expanded) {
    j["children"] = json::array();
  }
  return j;
}

}  // namespace

std::string node_label(const CallTreeNode & node)
{
  switch (node.kind) {
    case CallNodeKind::Expanded:
      return node.signature.qualified_name();
    case CallNodeKind::RecursiveCut:
      return fmt::format("{} (recursive call, stopping here)", node.signature.qualified_name());
    case CallNodeKind::ExternalUnresolved:
      return fmt::format("{} (external or unresolved)", node.call_site);
    case CallNodeKind::NotFound:
      if (node.missing == MissingPart::Class) {
        return fmt::format("Class not found: {}", node.signature.class_name);
      }
      return fmt::format("Method not found: {}", node.signature.method_name);
    case CallNodeKind::BudgetExceeded:
      if (node.signature.class_name.empty()) {
        return "(budget exceeded, stopping here)";
      }
      return fmt::format("{} (budget exceeded, stopping here)", node.signature.qualified_name());
    case CallNodeKind::AmbiguousTarget:
      return fmt::format("{} (ambiguous: {} candidates)", node.call_site, node.candidates.size());
  }
  return {};
}

void render_text(const CallTreeNode & root, std::ostream & os)
{
  // Pre-order with an explicit stack; children pushed in reverse so the
  // first child is printed first.
  std::vector<std::pair<const CallTreeNode *, size_t>> stack{{&root, 0}};
  while (!stack.empty()) {
    const auto [node, depth] = stack.back();
    stack.pop_back();

    for (size_t i = 0; i < depth; ++i) {
      os << k_indent;
    }
    fmt::print(os, "{}\n", node_label(*node));

    for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
      stack.emplace_back(&*it, depth + 1);
    }
  }
}

std::string render_text(const CallTreeNode & root)
{
  std::ostringstream ss;
  render_text(root, ss);
  return ss.str();
}

json to_json(const CallTreeNode & root)
{
  struct Frame
  {
    const CallTreeNode * node;
    json * out;
    size_t next_child;
  };

  json result = j_node(root);
  std::vector<Frame> stack{{&root, &result, 0}};

  while (!stack.empty()) {
    Frame & top = stack.back();
    if (top.next_child >= top.node->children.size()) {
      stack.pop_back();
      continue;
    }

    const CallTreeNode & child = top.node->children[top.next_child++];
    json & arr = (*top.out)["children"];
    arr.push_back(j_node(child));
    json * child_json = &arr.back();
    stack.push_back(Frame{&child, child_json, 0});
  }

  return result;
}

std::string render_json(const CallTreeNode & root, int indent)
{
  return to_json(root).dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace callscope
