// callscope/model/program_model.cpp - In-memory program model
//
#include "callscope/model/program_model.hpp"

namespace callscope
{

// ============================================================================
// ClassDescriptor
// ============================================================================

void ClassDescriptor::add_method(
  std::string method_name, std::vector<std::string> parameters, std::string return_type,
  std::vector<InvocationSite> invocations)
{
  MethodSignature sig;
  sig.class_name = name_;
  sig.method_name = std::move(method_name);
  sig.parameters = std::move(parameters);
  sig.return_type = std::move(return_type);
  sig.has_parameters = true;

  MethodDescriptor method(std::move(sig), std::move(invocations));
  method.owner_ = this;
  methods_.push_back(std::move(method));
}

// ============================================================================
// Program
// ============================================================================

const ClassDescriptor * Program::add_class(std::unique_ptr<ClassDescriptor> cls)
{
  if (!cls) {
    return nullptr;
  }
  if (index_.count(cls->name()) > 0) {
    return nullptr;
  }

  index_.emplace(cls->name(), classes_.size());
  classes_.push_back(std::move(cls));
  return classes_.back().get();
}

const ClassDescriptor * Program::find_class(std::string_view qualified_name) const
{
  const auto it = index_.find(std::string(qualified_name));
  if (it == index_.end()) {
    return nullptr;
  }
  return classes_[it->second].get();
}

const MethodDescriptor * Program::find_method_by_name(
  const ClassDescriptor & cls, std::string_view method_name) const
{
  for (const auto & m : cls.methods()) {
    if (m.name() == method_name) {
      return &m;
    }
  }
  return nullptr;
}

const MethodDescriptor * Program::resolve_invocation(const InvocationSite & site) const
{
  const auto sig = parse_signature(site.target);
  if (!sig) {
    return nullptr;
  }

  const ClassDescriptor * cls = find_class(sig->class_name);
  if (!cls) {
    return nullptr;
  }

  // Name-only binding: first declared method with a matching name
  return find_method_by_name(*cls, sig->method_name);
}

std::vector<const ClassDescriptor *> Program::classes() const
{
  std::vector<const ClassDescriptor *> result;
  result.reserve(classes_.size());
  for (const auto & c : classes_) {
    result.push_back(c.get());
  }
  return result;
}

size_t Program::method_count() const noexcept
{
  size_t count = 0;
  for (const auto & c : classes_) {
    count += c->methods().size();
  }
  return count;
}

}  // namespace callscope
