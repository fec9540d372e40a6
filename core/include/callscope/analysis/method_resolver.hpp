// callscope/analysis/method_resolver.hpp - Bind invocation sites to methods
//
#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "callscope/model/program_model.hpp"

namespace callscope
{

enum class ResolutionMode : uint8_t {
  /// First declared method of the owning class whose name matches
  NameOnly,
  /// Match on name and parameter types, reporting ambiguity
  SignatureAware,
};

enum class ResolutionKind : uint8_t {
  Resolved,
  AmbiguousCandidates,
  Unresolved,
};

/**
 * Outcome of resolving one invocation site.
 */
struct Resolution
{
  ResolutionKind kind = ResolutionKind::Unresolved;

  /// Set when kind == Resolved
  const MethodDescriptor * method = nullptr;

  /// Set when kind == AmbiguousCandidates, in declared order
  std::vector<const MethodDescriptor *> candidates;

  [[nodiscard]] bool is_resolved() const noexcept { return kind == ResolutionKind::Resolved; }

  [[nodiscard]] static Resolution resolved(const MethodDescriptor * m)
  {
    Resolution r;
    r.kind = ResolutionKind::Resolved;
    r.method = m;
    return r;
  }

  [[nodiscard]] static Resolution unresolved() { return Resolution{}; }

  [[nodiscard]] static Resolution ambiguous(std::vector<const MethodDescriptor *> candidates)
  {
    Resolution r;
    r.kind = ResolutionKind::AmbiguousCandidates;
    r.candidates = std::move(candidates);
    return r;
  }
};

/**
 * Maps invocation sites to candidate target methods of a program.
 *
 * In NameOnly mode the program model's own binding is used unchanged.
 * SignatureAware mode narrows same-name methods of the owning class:
 *
 *   - an exact parameter-type match resolves;
 *   - otherwise same-arity candidates are considered: one resolves, several
 *     are ambiguous, none is unresolved;
 *   - call text without a parameter list falls back to name-only binding.
 */
class MethodResolver
{
public:
  explicit MethodResolver(const ProgramModel & program, ResolutionMode mode = ResolutionMode::NameOnly)
  : program_(program), mode_(mode)
  {
  }

  [[nodiscard]] Resolution resolve(const InvocationSite & site) const;

  [[nodiscard]] ResolutionMode mode() const noexcept { return mode_; }

private:
  [[nodiscard]] Resolution resolve_by_signature(const InvocationSite & site) const;

  const ProgramModel & program_;
  ResolutionMode mode_;
};

}  // namespace callscope
