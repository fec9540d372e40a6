// callscope/driver/analyzer.cpp - Analysis driver implementation
//
#include "callscope/driver/analyzer.hpp"

#include <fmt/core.h>

#include <iostream>
#include <utility>

#include "callscope/model/program_loader.hpp"

namespace callscope
{

namespace
{

std::unique_ptr<Program> load_program(
  const std::filesystem::path & location, AnalysisResult & result, bool verbose)
{
  if (verbose) {
    std::cerr << "Loading program: " << location.string() << "\n";
  }

  ProgramLoader loader(&result.diagnostics);
  auto program = loader.load(location);
  if (!program) {
    // Loader diagnostics already describe the failure
    if (!result.diagnostics.has_errors()) {
      result.diagnostics.report_error("failed to load program")
        .with_code(diag_code::k_program_location)
        .with_location(location.string());
    }
    return nullptr;
  }

  if (verbose) {
    std::cerr << "Loaded " << program->size() << " classes, " << program->method_count()
              << " methods\n";
  }
  return program;
}

}  // namespace

AnalysisResult Analyzer::analyze_call_stack(
  const std::filesystem::path & program_location, const std::string & class_name,
  const std::string & method_name, const AnalysisOptions & options)
{
  const EntryPointConfig entry{class_name, method_name};
  return analyze_entries(program_location, gsl::span<const EntryPointConfig>(&entry, 1), options);
}

AnalysisResult Analyzer::analyze_entries(
  const std::filesystem::path & program_location, gsl::span<const EntryPointConfig> entries,
  const AnalysisOptions & options)
{
  AnalysisResult result;

  result.program = load_program(program_location, result, options.verbose);
  if (!result.program) {
    return result;
  }

  const bool stored =
    explore_entries(*result.program, program_location.string(), entries, options, result);

  result.success = stored && !result.diagnostics.has_errors();
  return result;
}

AnalysisResult Analyzer::analyze_project(
  const ProjectConfig & config, ResultSink * sink, bool verbose)
{
  AnalysisOptions options;
  options.explore.resolution = config.analysis.resolution;
  options.explore.max_nodes = config.analysis.max_nodes;
  options.explore.max_depth = config.analysis.max_depth;
  options.sink = sink;
  options.verbose = verbose;

  if (config.entry_points.empty()) {
    AnalysisResult result;
    result.diagnostics.report_error("no entry points defined in project configuration")
      .with_code(diag_code::k_configuration)
      .with_help("add an 'entry_points' list with 'class' and 'method' keys");
    return result;
  }

  return analyze_entries(config.resolved_program_location(), config.entry_points, options);
}

bool Analyzer::explore_entries(
  const ProgramModel & program, const std::string & program_location,
  gsl::span<const EntryPointConfig> entries, const AnalysisOptions & options,
  AnalysisResult & result)
{
  bool stored_all = true;
  CallGraphExplorer explorer(program, options.explore);

  for (const auto & entry : entries) {
    if (options.verbose) {
      std::cerr << "Exploring: " << entry.class_name << "." << entry.method_name << "\n";
    }

    EntryAnalysis analysis;
    analysis.entry = entry;
    analysis.tree = explorer.explore(entry.class_name, entry.method_name);
    analysis.stats = explorer.stats();

    if (!analysis.found()) {
      const bool missing_class = analysis.tree.missing == MissingPart::Class;
      result.diagnostics
        .report_warning(
          missing_class ? fmt::format("class not found: {}", entry.class_name)
                        : fmt::format(
                            "method not found: {} in {}", entry.method_name, entry.class_name))
        .with_code(diag_code::k_entry_not_found)
        .with_location(program_location);
    }

    if (analysis.stats.truncated) {
      result.diagnostics
        .report_info(fmt::format(
          "call tree of {}.{} was truncated by the traversal budget", entry.class_name,
          entry.method_name))
        .with_note(fmt::format("{} nodes explored", analysis.stats.node_count));
    }

    if (options.sink) {
      CallGraphRecord record;
      record.program_location = program_location;
      record.class_name = entry.class_name;
      record.method_name = entry.method_name;
      record.tree = &analysis.tree;
      record.stats = analysis.stats;

      const SinkStatus status = options.sink->store(record);
      if (!status.success) {
        result.diagnostics.report_error("failed to store call graph result: " + status.error)
          .with_code(diag_code::k_storage);
        stored_all = false;
      }
    }

    if (options.verbose) {
      std::cerr << "  " << analysis.stats.node_count << " nodes, depth "
                << analysis.stats.max_depth_reached << "\n";
    }

    result.entries.push_back(std::move(analysis));
  }

  if (options.sink) {
    const SinkStatus status = options.sink->flush();
    if (!status.success) {
      result.diagnostics.report_error("failed to flush call graph results: " + status.error)
        .with_code(diag_code::k_storage);
      stored_all = false;
    }
  }

  return stored_all;
}

}  // namespace callscope
