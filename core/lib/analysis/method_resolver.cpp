// callscope/analysis/method_resolver.cpp - Invocation site binding
//
#include "callscope/analysis/method_resolver.hpp"

namespace callscope
{

Resolution MethodResolver::resolve(const InvocationSite & site) const
{
  if (mode_ == ResolutionMode::SignatureAware) {
    return resolve_by_signature(site);
  }

  if (const MethodDescriptor * m = program_.resolve_invocation(site)) {
    return Resolution::resolved(m);
  }
  return Resolution::unresolved();
}

Resolution MethodResolver::resolve_by_signature(const InvocationSite & site) const
{
  const auto sig = parse_signature(site.target);
  if (!sig) {
    return Resolution::unresolved();
  }

  const ClassDescriptor * cls = program_.find_class(sig->class_name);
  if (!cls) {
    return Resolution::unresolved();
  }

  if (!sig->has_parameters) {
    if (const MethodDescriptor * m = program_.find_method_by_name(*cls, sig->method_name)) {
      return Resolution::resolved(m);
    }
    return Resolution::unresolved();
  }

  std::vector<const MethodDescriptor *> same_arity;
  for (const auto & m : cls->methods()) {
    if (m.name() != sig->method_name) continue;
    if (m.signature().parameters == sig->parameters) {
      return Resolution::resolved(&m);
    }
    if (m.signature().arity() == sig->arity()) {
      same_arity.push_back(&m);
    }
  }

  if (same_arity.empty()) {
    return Resolution::unresolved();
  }
  if (same_arity.size() == 1) {
    return Resolution::resolved(same_arity.front());
  }
  return Resolution::ambiguous(std::move(same_arity));
}

}  // namespace callscope
