// callscope - Static call-graph explorer command line interface
//
// Usage:
//   callscope tree <class> <method> --program <path> [options]
//   callscope run [--project]
//   callscope init <project-name>
//
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "callscope/basic/diagnostic_printer.hpp"
#include "callscope/driver/analyzer.hpp"
#include "callscope/project/project_config.hpp"
#include "callscope/render/tree_renderer.hpp"
#include "callscope/storage/result_sink.hpp"

#ifndef CALLSCOPE_VERSION
#define CALLSCOPE_VERSION "0.1.0"
#endif

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "callscope v" << CALLSCOPE_VERSION << "\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  tree <class> <method>    Print the call tree of one method\n"
            << "  run                      Analyze the entry points of callscope.yaml\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Options:\n"
            << "  -p, --program <path>     Program manifest file or directory\n"
            << "  --json                   Print the tree as JSON\n"
            << "  --max-nodes <n>          Stop after n nodes (0 = unlimited)\n"
            << "  --max-depth <n>          Do not expand below depth n (0 = unlimited)\n"
            << "  --signature-aware        Resolve overloads by parameter types\n"
            << "  --store <file.jsonl>     Append results to a JSON Lines file\n"
            << "  --project                Use callscope.yaml from this directory or a parent\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const callscope::DiagnosticBag & diagnostics, bool color)
{
  const bool use_color = color && isatty(fileno(stderr)) != 0;
  callscope::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::string program_path;
  std::string store_path;
  std::optional<size_t> max_nodes;
  std::optional<size_t> max_depth;
  bool json = false;
  bool signature_aware = false;
  bool use_project = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

std::optional<size_t> parse_count(const std::string & text)
{
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return static_cast<size_t>(std::stoull(text));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    auto next_value = [&](std::string & out) {
      if (i + 1 < argc) {
        out = argv[++i];
        return true;
      }
      args.error = "missing value for " + arg;
      return false;
    };

    if (arg == "-p" || arg == "--program") {
      next_value(args.program_path);
    } else if (arg == "--store") {
      next_value(args.store_path);
    } else if (arg == "--max-nodes" || arg == "--max-depth") {
      std::string value;
      if (!next_value(value)) continue;
      const auto count = parse_count(value);
      if (!count) {
        args.error = "invalid number for " + arg + ": '" + value + "'";
        continue;
      }
      (arg == "--max-nodes" ? args.max_nodes : args.max_depth) = *count;
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--signature-aware") {
      args.signature_aware = true;
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.positional.push_back(arg);
    } else {
      args.error = "unknown option '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

std::unique_ptr<callscope::ResultSink> open_sink(const fs::path & path, bool color)
{
  callscope::SinkStatus status;
  auto sink = callscope::JsonLinesSink::open(path, status);
  if (!sink) {
    callscope::DiagnosticBag diags;
    diags.report_error("cannot open result store: " + status.error)
      .with_code(callscope::diag_code::k_storage)
      .with_location(path.string());
    print_diagnostics(diags, color);
  }
  return sink;
}

void print_trees(const callscope::AnalysisResult & result, bool json)
{
  if (json) {
    if (result.entries.size() == 1) {
      std::cout << callscope::render_json(result.entries.front().tree) << "\n";
      return;
    }
    nlohmann::json all = nlohmann::json::array();
    for (const auto & e : result.entries) {
      all.push_back(callscope::to_json(e.tree));
    }
    std::cout << all.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    return;
  }

  bool first = true;
  for (const auto & e : result.entries) {
    if (!first) std::cout << "\n";
    first = false;
    callscope::render_text(e.tree, std::cout);
  }
}

int cmd_tree(const CommandArgs & args)
{
  if (args.positional.size() != 2) {
    std::cerr << "error: class and method required\n";
    std::cerr << "usage: callscope tree <class> <method> --program <path>\n";
    return 1;
  }
  if (args.program_path.empty()) {
    std::cerr << "error: --program <path> is required\n";
    return 1;
  }

  callscope::AnalysisOptions options;
  options.verbose = args.verbose;
  options.explore.resolution = args.signature_aware ? callscope::ResolutionMode::SignatureAware
                                                    : callscope::ResolutionMode::NameOnly;
  options.explore.max_nodes = args.max_nodes.value_or(0);
  options.explore.max_depth = args.max_depth.value_or(0);

  std::unique_ptr<callscope::ResultSink> sink;
  if (!args.store_path.empty()) {
    sink = open_sink(args.store_path, !args.no_color);
    if (!sink) {
      return 1;
    }
    options.sink = sink.get();
  }

  const auto result = callscope::Analyzer::analyze_call_stack(
    fs::absolute(args.program_path), args.positional[0], args.positional[1], options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, !args.no_color);
  }

  if (!result.program) {
    return 1;
  }

  print_trees(result, args.json);
  return result.success ? 0 : 1;
}

int cmd_run(const CommandArgs & args)
{
  auto config_path = callscope::find_project_config(fs::current_path());
  if (!config_path) {
    std::cerr << "error: no " << callscope::k_project_config_file_name
              << " found in current directory or parents\n";
    return 1;
  }

  auto config_result = callscope::load_project_config(*config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return 1;
  }
  auto & config = config_result.config;

  // Command line flags override the project's settings
  if (!args.program_path.empty()) {
    config.program_location = fs::absolute(args.program_path);
  }
  if (args.signature_aware) {
    config.analysis.resolution = callscope::ResolutionMode::SignatureAware;
  }
  if (args.max_nodes) {
    config.analysis.max_nodes = *args.max_nodes;
  }
  if (args.max_depth) {
    config.analysis.max_depth = *args.max_depth;
  }
  if (!args.store_path.empty()) {
    config.output.store = fs::absolute(args.store_path);
  }

  if (args.verbose) {
    std::cerr << "Analyzing project: " << config.project.name << "\n";
  }

  std::unique_ptr<callscope::ResultSink> sink;
  if (const auto store = config.resolved_store()) {
    sink = open_sink(*store, !args.no_color);
    if (!sink) {
      return 1;
    }
  }

  const auto result = callscope::Analyzer::analyze_project(config, sink.get(), args.verbose);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, !args.no_color);
  }

  if (!result.program) {
    return 1;
  }

  print_trees(result, args.json || config.output.format == callscope::OutputFormat::Json);
  return result.success ? 0 : 1;
}

int cmd_init(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: callscope init <project-name>\n";
    return 1;
  }

  const std::string & name = args.positional.front();
  const fs::path project_dir = fs::current_path() / name;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir / "program");
    fs::create_directories(project_dir / "results");

    std::ofstream config(project_dir / callscope::k_project_config_file_name);
    config << "project:\n"
           << "  name: '" << name << "'\n"
           << "  version: '0.1.0'\n\n"
           << "program:\n"
           << "  location: './program'\n\n"
           << "analysis:\n"
           << "  resolution: name_only\n"
           << "  max_nodes: 0\n"
           << "  max_depth: 0\n\n"
           << "output:\n"
           << "  format: text\n"
           << "  store: './results/callgraph.jsonl'\n\n"
           << "entry_points:\n"
           << "  - class: 'com.example.App'\n"
           << "    method: 'main'\n";
    config.close();

    std::ofstream manifest(project_dir / "program" / "app.json");
    manifest << "{\n"
             << "  \"classes\": [\n"
             << "    {\n"
             << "      \"name\": \"com.example.App\",\n"
             << "      \"methods\": [\n"
             << "        {\n"
             << "          \"name\": \"main\",\n"
             << "          \"parameters\": [\"java.lang.String[]\"],\n"
             << "          \"invocations\": [\"<com.example.App: void run()>\"]\n"
             << "        },\n"
             << "        {\n"
             << "          \"name\": \"run\",\n"
             << "          \"invocations\": [\"<java.io.PrintStream: void println(java.lang.String)>\"]\n"
             << "        }\n"
             << "      ]\n"
             << "    }\n"
             << "  ]\n"
             << "}\n";
    manifest.close();

    std::cout << "Initialized new callscope project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << name << "\n"
              << "  callscope run\n";

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return 1;
  }

  if (args.command == "tree") {
    return cmd_tree(args);
  }

  if (args.command == "run") {
    return cmd_run(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
