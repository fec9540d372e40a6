// callscope/model/signature.hpp - Method signatures and their textual forms
//
// Call sites refer to their targets by signature text. Two spellings are
// understood:
//
//   <com.example.Service: boolean check(java.lang.String,int)>   (bytecode-tool form)
//   com.example.Service.check(java.lang.String,int)               (dotted form)
//
// The parameter list is optional in the dotted form.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace callscope
{

/**
 * Identity of a method: owning class, name and parameter types.
 *
 * The return type is informational and does not take part in equality.
 * `parameters` is empty-and-unknown when `has_parameters` is false, which
 * only happens for signatures parsed from dotted call-site text.
 */
struct MethodSignature
{
  std::string class_name;
  std::string method_name;
  std::vector<std::string> parameters;
  std::string return_type = "void";
  bool has_parameters = true;

  /// "pkg.Class.method", the label used in rendered trees
  [[nodiscard]] std::string qualified_name() const;

  /// "<pkg.Class: ret method(p1,p2)>"
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] size_t arity() const noexcept { return parameters.size(); }

  friend bool operator==(const MethodSignature & a, const MethodSignature & b)
  {
    return a.class_name == b.class_name && a.method_name == b.method_name &&
           a.has_parameters == b.has_parameters && a.parameters == b.parameters;
  }
  friend bool operator!=(const MethodSignature & a, const MethodSignature & b) { return !(a == b); }
};

/**
 * Parse signature text in either supported spelling.
 *
 * @return nullopt if the text is not a recognizable method signature
 */
[[nodiscard]] std::optional<MethodSignature> parse_signature(std::string_view text);

/**
 * Split a comma separated parameter list, trimming whitespace.
 * An empty (or all-blank) list yields no parameters.
 */
[[nodiscard]] std::vector<std::string> split_parameter_list(std::string_view list);

}  // namespace callscope
