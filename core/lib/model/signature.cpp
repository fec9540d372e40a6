// callscope/model/signature.cpp - Signature parsing and formatting
//
#include "callscope/model/signature.hpp"

#include <fmt/core.h>

#include <cctype>

namespace callscope
{

namespace
{

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

bool is_identifier_text(std::string_view s)
{
  if (s.empty()) return false;
  for (const char c : s) {
    const auto uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && c != '_' && c != '$' && c != '<' && c != '>') {
      return false;
    }
  }
  return true;
}

bool is_qualified_name(std::string_view s)
{
  if (s.empty() || s.front() == '.' || s.back() == '.') return false;
  size_t start = 0;
  while (start <= s.size()) {
    const size_t dot = s.find('.', start);
    const std::string_view part =
      s.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
    if (!is_identifier_text(part)) return false;
    if (dot == std::string_view::npos) break;
    start = dot + 1;
  }
  return true;
}

/// Parse "<pkg.Class: ret name(params)>"
std::optional<MethodSignature> parse_bracketed(std::string_view text)
{
  text = text.substr(1, text.size() - 2);

  const size_t colon = text.find(':');
  if (colon == std::string_view::npos) return std::nullopt;

  MethodSignature sig;
  const std::string_view cls = trim(text.substr(0, colon));
  if (!is_qualified_name(cls)) return std::nullopt;
  sig.class_name = std::string(cls);

  std::string_view rest = trim(text.substr(colon + 1));
  const size_t open = rest.find('(');
  const size_t close = rest.rfind(')');
  if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
    return std::nullopt;
  }
  if (!trim(rest.substr(close + 1)).empty()) return std::nullopt;

  const std::string_view head = trim(rest.substr(0, open));
  const size_t space = head.rfind(' ');
  if (space == std::string_view::npos) return std::nullopt;

  const std::string_view ret = trim(head.substr(0, space));
  const std::string_view name = trim(head.substr(space + 1));
  if (ret.empty() || !is_identifier_text(name)) return std::nullopt;

  sig.return_type = std::string(ret);
  sig.method_name = std::string(name);
  sig.parameters = split_parameter_list(rest.substr(open + 1, close - open - 1));
  sig.has_parameters = true;
  return sig;
}

/// Parse "pkg.Class.name" or "pkg.Class.name(params)"
std::optional<MethodSignature> parse_dotted(std::string_view text)
{
  MethodSignature sig;
  std::string_view path = text;

  const size_t open = text.find('(');
  if (open != std::string_view::npos) {
    if (text.back() != ')') return std::nullopt;
    sig.parameters = split_parameter_list(text.substr(open + 1, text.size() - open - 2));
    sig.has_parameters = true;
    path = trim(text.substr(0, open));
  } else {
    sig.has_parameters = false;
  }

  const size_t dot = path.rfind('.');
  if (dot == std::string_view::npos) return std::nullopt;

  const std::string_view cls = path.substr(0, dot);
  const std::string_view name = path.substr(dot + 1);
  if (!is_qualified_name(cls) || !is_identifier_text(name)) return std::nullopt;

  sig.class_name = std::string(cls);
  sig.method_name = std::string(name);
  sig.return_type.clear();
  return sig;
}

}  // namespace

std::string MethodSignature::qualified_name() const
{
  return fmt::format("{}.{}", class_name, method_name);
}

std::string MethodSignature::to_string() const
{
  std::string params;
  for (size_t i = 0; i < parameters.size(); ++i) {
    if (i > 0) params += ',';
    params += parameters[i];
  }
  const std::string ret = return_type.empty() ? std::string("?") : return_type;
  if (!has_parameters) {
    return fmt::format("<{}: {} {}(..)>", class_name, ret, method_name);
  }
  return fmt::format("<{}: {} {}({})>", class_name, ret, method_name, params);
}

std::optional<MethodSignature> parse_signature(std::string_view text)
{
  text = trim(text);
  if (text.size() < 2) return std::nullopt;

  if (text.front() == '<' && text.back() == '>') {
    return parse_bracketed(text);
  }
  return parse_dotted(text);
}

std::vector<std::string> split_parameter_list(std::string_view list)
{
  std::vector<std::string> out;
  if (trim(list).empty()) {
    return out;
  }

  size_t start = 0;
  while (true) {
    const size_t comma = list.find(',', start);
    const std::string_view part = trim(
      list.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));
    out.emplace_back(part);
    if (comma == std::string_view::npos) break;
    start = comma + 1;
  }
  return out;
}

}  // namespace callscope
