// callscope/model/program_model.hpp - Read-only program model
//
// The program model is the whole-program view the explorer queries: classes,
// their methods in declared order, and the invocation sites of each method
// body in statement order. It is loaded once per analysis run and never
// mutated afterwards.
//
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "callscope/model/signature.hpp"

namespace callscope
{

class ClassDescriptor;

// ============================================================================
// Descriptors
// ============================================================================

/**
 * A call statement in a method body, as written: the target signature text.
 */
struct InvocationSite
{
  std::string target;
};

/**
 * A method and the invocation sites of its body, in statement order.
 */
class MethodDescriptor
{
public:
  MethodDescriptor(MethodSignature signature, std::vector<InvocationSite> invocations)
  : signature_(std::move(signature)), invocations_(std::move(invocations))
  {
  }

  [[nodiscard]] const MethodSignature & signature() const noexcept { return signature_; }
  [[nodiscard]] const std::string & name() const noexcept { return signature_.method_name; }
  [[nodiscard]] const std::vector<InvocationSite> & invocations() const noexcept
  {
    return invocations_;
  }

  /// Owning class (set by ClassDescriptor::add_method)
  [[nodiscard]] const ClassDescriptor * owner() const noexcept { return owner_; }

private:
  friend class ClassDescriptor;

  MethodSignature signature_;
  std::vector<InvocationSite> invocations_;
  const ClassDescriptor * owner_ = nullptr;
};

/**
 * A class and its methods in declared order.
 */
class ClassDescriptor
{
public:
  explicit ClassDescriptor(std::string name) : name_(std::move(name)) {}

  // Methods point back at their owner
  ClassDescriptor(const ClassDescriptor &) = delete;
  ClassDescriptor & operator=(const ClassDescriptor &) = delete;

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] const std::vector<MethodDescriptor> & methods() const noexcept
  {
    return methods_;
  }

  /**
   * Append a method. Its signature's class name is forced to this class.
   */
  void add_method(std::string method_name, std::vector<std::string> parameters,
                  std::string return_type, std::vector<InvocationSite> invocations);

private:
  std::string name_;
  std::vector<MethodDescriptor> methods_;
};

// ============================================================================
// ProgramModel
// ============================================================================

/**
 * Query surface the explorer needs from a loaded program.
 *
 * Every lookup returns nullptr for "not found"; none of them throws.
 */
class ProgramModel
{
public:
  virtual ~ProgramModel() = default;

  [[nodiscard]] virtual const ClassDescriptor * find_class(
    std::string_view qualified_name) const = 0;

  /**
   * First method declared in `cls` whose name matches. Overloads are not
   * disambiguated.
   */
  [[nodiscard]] virtual const MethodDescriptor * find_method_by_name(
    const ClassDescriptor & cls, std::string_view method_name) const = 0;

  /**
   * Bind a call site to a method of the loaded program.
   *
   * Returns nullptr for calls leaving the program (libraries, runtime) and
   * for call text that is not a recognizable signature.
   */
  [[nodiscard]] virtual const MethodDescriptor * resolve_invocation(
    const InvocationSite & site) const = 0;
};

// ============================================================================
// Program
// ============================================================================

/**
 * In-memory program model.
 *
 * Owns its classes; descriptor pointers stay valid for the lifetime of the
 * Program.
 */
class Program final : public ProgramModel
{
public:
  Program() = default;

  Program(const Program &) = delete;
  Program & operator=(const Program &) = delete;
  Program(Program &&) = default;
  Program & operator=(Program &&) = default;

  /**
   * Add a class.
   *
   * @return the stored class, or nullptr if a class with the same name exists
   */
  const ClassDescriptor * add_class(std::unique_ptr<ClassDescriptor> cls);

  [[nodiscard]] const ClassDescriptor * find_class(std::string_view qualified_name) const override;

  [[nodiscard]] const MethodDescriptor * find_method_by_name(
    const ClassDescriptor & cls, std::string_view method_name) const override;

  [[nodiscard]] const MethodDescriptor * resolve_invocation(
    const InvocationSite & site) const override;

  /// Classes in insertion order
  [[nodiscard]] std::vector<const ClassDescriptor *> classes() const;

  [[nodiscard]] size_t size() const noexcept { return classes_.size(); }
  [[nodiscard]] bool empty() const noexcept { return classes_.empty(); }

  /// Total number of methods across all classes
  [[nodiscard]] size_t method_count() const noexcept;

private:
  std::vector<std::unique_ptr<ClassDescriptor>> classes_;
  std::unordered_map<std::string, size_t> index_;
};

}  // namespace callscope
