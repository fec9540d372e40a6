// callscope/render/tree_renderer.hpp - Text and JSON projections of a call tree
//
// Text output is one line per node in pre-order, indented two spaces per
// level:
//
// @code
//   com.example.AuthController.login
//     com.example.AuthService.check
//       <java.lang.String: int length()> (external or unresolved)
//     com.example.AuthController.login (recursive call, stopping here)
// @endcode
//
#pragma once

#include <iosfwd>
#include <string>

#include <nlohmann/json.hpp>

#include "callscope/analysis/call_tree.hpp"

namespace callscope
{

/**
 * Human-readable label of a single node (no indentation).
 */
[[nodiscard]] std::string node_label(const CallTreeNode & node);

/**
 * Render the tree as indented text. Every line ends with '\n'.
 */
[[nodiscard]] std::string render_text(const CallTreeNode & root);

/**
 * Stream variant of render_text().
 */
void render_text(const CallTreeNode & root, std::ostream & os);

/**
 * Serialize the tree to JSON.
 *
 * Each node is an object with a "kind" and, as applicable, "class",
 * "method", "parameters", "signature", "call_site", "missing",
 * "candidates" and "children".
 */
[[nodiscard]] nlohmann::json to_json(const CallTreeNode & root);

/**
 * Dump to_json() as text. A negative indent produces a single line.
 * Invalid UTF-8 in names is written as U+FFFD.
 */
[[nodiscard]] std::string render_json(const CallTreeNode & root, int indent = 2);

}  // namespace callscope
