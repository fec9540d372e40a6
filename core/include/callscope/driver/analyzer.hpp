// callscope/driver/analyzer.hpp - Analysis driver
//
// Single entry point for the load -> explore pipeline. Used by the CLI and
// available to documentation tooling that wants the structured tree.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <gsl/span>

#include "callscope/analysis/call_graph_explorer.hpp"
#include "callscope/analysis/call_tree.hpp"
#include "callscope/basic/diagnostic.hpp"
#include "callscope/model/program_model.hpp"
#include "callscope/project/project_config.hpp"
#include "callscope/storage/result_sink.hpp"

namespace callscope
{

// ============================================================================
// Analysis Options
// ============================================================================

struct AnalysisOptions
{
  ExploreOptions explore;

  /// Receives one record per analyzed entry point (not owned, may be nullptr)
  ResultSink * sink = nullptr;

  /// Progress messages on stderr
  bool verbose = false;
};

// ============================================================================
// Analysis Result
// ============================================================================

/**
 * Outcome for one entry point.
 */
struct EntryAnalysis
{
  EntryPointConfig entry;
  CallTreeNode tree;
  ExploreStats stats;

  [[nodiscard]] bool found() const noexcept { return tree.kind != CallNodeKind::NotFound; }
};

struct AnalysisResult
{
  /// False only on setup failure (program could not be loaded, sink failure)
  bool success = false;

  DiagnosticBag diagnostics;

  /// One entry per requested entry point, in request order
  std::vector<EntryAnalysis> entries;

  /// Loaded program (kept for introspection)
  std::unique_ptr<Program> program;
};

// ============================================================================
// Analyzer
// ============================================================================

/**
 * Loads a program and explores entry points in it.
 *
 * The pipeline consists of:
 * 1. Program loading (fatal on failure)
 * 2. Call tree exploration per entry point (never fatal)
 * 3. Optional storage of each result in the supplied sink
 */
class Analyzer
{
public:
  /**
   * Analyze a single entry point.
   *
   * A missing class or method is reported as a NotFound tree plus a
   * warning; only setup failures make the result unsuccessful.
   */
  [[nodiscard]] static AnalysisResult analyze_call_stack(
    const std::filesystem::path & program_location, const std::string & class_name,
    const std::string & method_name, const AnalysisOptions & options = {});

  /**
   * Analyze several entry points against one loaded program.
   */
  [[nodiscard]] static AnalysisResult analyze_entries(
    const std::filesystem::path & program_location, gsl::span<const EntryPointConfig> entries,
    const AnalysisOptions & options = {});

  /**
   * Analyze every entry point of a project configuration.
   *
   * Resolution mode and budgets come from the project's analysis section.
   * The sink, if any, is owned by the caller.
   */
  [[nodiscard]] static AnalysisResult analyze_project(
    const ProjectConfig & config, ResultSink * sink = nullptr, bool verbose = false);

  /**
   * Explore entry points in an already loaded program.
   *
   * @return false if storing a result in the sink failed
   */
  static bool explore_entries(
    const ProgramModel & program, const std::string & program_location,
    gsl::span<const EntryPointConfig> entries, const AnalysisOptions & options,
    AnalysisResult & result);
};

}  // namespace callscope
