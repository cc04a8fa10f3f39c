// pg-sema - PostgreSQL schema analyzer Command Line Interface
//
// Usage:
//   pg-sema check [files.sql... | --project]
//   pg-sema order [files.sql... | --project]
//   pg-sema infer [files.sql... | --project] [-o report.json]
//   pg-sema query "<sql>" [files.sql... | --project]
//   pg-sema dump-ast <file.sql>
//
#include <fmt/core.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "pg_sema/ast/ast_context.hpp"
#include "pg_sema/ast/json_visitor.hpp"
#include "pg_sema/basic/diagnostic_printer.hpp"
#include "pg_sema/driver/analyzer.hpp"
#include "pg_sema/project/project_config.hpp"
#include "pg_sema/report/report.hpp"
#include "pg_sema/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  fmt::print(
    stderr,
    "pg-sema - PostgreSQL schema analyzer v0.1.0\n\n"
    "Usage: {} <command> [options]\n\n"
    "Commands:\n"
    "  check [files.sql]          Check a schema (parse, link, infer)\n"
    "  order [files.sql]          Print objects in dependency order\n"
    "  infer [files.sql]          Write the inferred result types as JSON\n"
    "  query \"<sql>\" [files.sql]  Infer the columns of an ad-hoc SELECT\n"
    "  dump-ast <file.sql>        Print the parsed AST as JSON\n\n"
    "Options:\n"
    "  -o, --output <path>        Output file (infer)\n"
    "  --project                  Use pg-sema.yaml from the current directory or parents\n"
    "  -v, --verbose              Verbose output\n"
    "  --no-color                 Disable colored diagnostics\n"
    "  -h, --help                 Show this help message\n",
    program_name);
}

void print_diagnostics(
  const pg_sema::DiagnosticBag & diagnostics, const pg_sema::SourceRegistry * sources,
  bool use_color)
{
  pg_sema::SourceRegistry empty;
  pg_sema::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, sources ? *sources : empty);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> inputs;
  std::string output_path;
  bool use_project = false;
  bool verbose = false;
  bool no_color = false;
  bool show_help = false;
};

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

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.inputs.push_back(std::move(arg));
    } else {
      fmt::print(stderr, "warning: ignoring unknown option '{}'\n", arg);
    }
  }

  return args;
}

bool use_color(const CommandArgs & args) { return !args.no_color && isatty(fileno(stderr)) != 0; }

// ============================================================================
// Analysis
// ============================================================================

struct AnalysisRun
{
  pg_sema::AnalysisResult result;
  std::optional<pg_sema::ProjectConfig> config;
  bool ok = false;  ///< false if the run could not start (config or input errors)
};

/// Analyse the given files, or the project when none are given.
AnalysisRun run_analysis(const CommandArgs & args, const std::vector<std::string> & files)
{
  AnalysisRun run;
  pg_sema::AnalyzeOptions options;

  if (args.use_project || files.empty()) {
    auto config_path = pg_sema::find_project_config(fs::current_path());
    if (!config_path) {
      fmt::print(stderr, "error: no {} found in current directory or parents\n",
        pg_sema::k_project_config_file_name);
      return run;
    }

    auto config_result = pg_sema::load_project_config(*config_path);
    if (!config_result.success) {
      fmt::print(stderr, "error: {}\n", config_result.error);
      return run;
    }

    if (args.verbose) {
      fmt::print(stderr, "Analyzing project: {} ({})\n", config_result.config.package.name,
        config_path->string());
    }

    run.config = std::move(config_result.config);
    run.result = pg_sema::Analyzer::analyze_project(*run.config, options);
  } else {
    std::vector<fs::path> paths;
    for (const auto & f : files) {
      const fs::path p = fs::absolute(f);
      if (!fs::exists(p)) {
        fmt::print(stderr, "error: file not found: {}\n", p.string());
        return run;
      }
      paths.push_back(p);
    }

    if (args.verbose) {
      fmt::print(stderr, "Analyzing {} file(s)\n", paths.size());
    }
    run.result = pg_sema::Analyzer::analyze_files(paths, options);
  }

  if (args.verbose) {
    fmt::print(
      stderr, "Analyzed {} of {} object(s), {} failed, {} cycle(s)\n", run.result.objects.size(),
      run.result.order.size(), run.result.failed.size(), run.result.cycles.size());
  }

  if (!run.result.diagnostics.empty()) {
    print_diagnostics(run.result.diagnostics, run.result.sources.get(), use_color(args));
  }
  run.ok = true;
  return run;
}

bool write_output(const std::string & text, const fs::path & path)
{
  if (path.empty()) {
    std::cout << text << "\n";
    return true;
  }

  std::error_code ec;
  if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
  std::ofstream out(path);
  if (!out.is_open()) {
    fmt::print(stderr, "error: failed to open output file: {}\n", path.string());
    return false;
  }
  out << text << "\n";
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  AnalysisRun run = run_analysis(args, args.inputs);
  if (!run.ok) return 1;

  if (run.result.success) {
    fmt::print("{}: OK ({} objects)\n", args.inputs.empty() ? "project" : "schema",
      run.result.objects.size());
    return 0;
  }
  return 1;
}

int cmd_order(const CommandArgs & args)
{
  AnalysisRun run = run_analysis(args, args.inputs);
  if (!run.ok) return 1;

  for (const pg_sema::SchemaObject * obj : run.result.order) {
    fmt::print("{} {}\n", pg_sema::to_string(obj->get_kind()), obj->qualified_name());
  }
  return run.result.cycles.empty() ? 0 : 1;
}

int cmd_infer(const CommandArgs & args)
{
  AnalysisRun run = run_analysis(args, args.inputs);
  if (!run.ok) return 1;

  fs::path output = args.output_path;
  if (output.empty() && run.config && !run.config->output.report.empty()) {
    output = run.config->project_root / run.config->output.report;
  }

  const std::string text = pg_sema::to_json(run.result).dump(2);
  if (!write_output(text, output)) return 1;
  if (args.verbose && !output.empty()) {
    fmt::print(stderr, "Generated: {}\n", output.string());
  }
  return run.result.success ? 0 : 1;
}

int cmd_query(const CommandArgs & args)
{
  if (args.inputs.empty()) {
    fmt::print(stderr, "error: query text required\n");
    fmt::print(stderr, "usage: pg-sema query \"<sql>\" [files.sql... | --project]\n");
    return 1;
  }

  const std::string sql = args.inputs.front();
  const std::vector<std::string> files(args.inputs.begin() + 1, args.inputs.end());
  AnalysisRun run = run_analysis(args, files);
  if (!run.ok || !run.result.metadata) return 1;

  pg_sema::DiagnosticBag query_diags;
  auto fields = pg_sema::Analyzer::infer_query(run.result, sql, query_diags);
  if (!query_diags.empty()) {
    print_diagnostics(query_diags, run.result.sources.get(), use_color(args));
  }
  if (!fields) return 1;

  const auto report =
    pg_sema::fields_to_json(*fields, *run.result.metadata, *run.result.json);
  return write_output(report.dump(2), args.output_path) ? 0 : 1;
}

int cmd_dump_ast(const CommandArgs & args)
{
  if (args.inputs.empty()) {
    fmt::print(stderr, "error: input file required\n");
    fmt::print(stderr, "usage: pg-sema dump-ast <file.sql>\n");
    return 1;
  }

  const fs::path input_path = fs::absolute(args.inputs.front());
  std::ifstream file(input_path);
  if (!file.is_open()) {
    fmt::print(stderr, "error: failed to open file: {}\n", input_path.string());
    return 1;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  pg_sema::SourceRegistry sources;
  pg_sema::AstContext ast;
  pg_sema::DiagnosticBag diags;
  const auto parsed = pg_sema::parse_source(sources, input_path, buffer.str(), ast, diags);
  if (!diags.empty()) {
    print_diagnostics(diags, &sources, use_color(args));
  }

  if (!write_output(pg_sema::to_json(parsed.script).dump(2), args.output_path)) return 1;
  return diags.has_errors() ? 1 : 0;
}

}  // namespace

// ============================================================================
// Main
// ============================================================================

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return argc < 2 ? 1 : 0;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }
  if (args.command == "order") {
    return cmd_order(args);
  }
  if (args.command == "infer") {
    return cmd_infer(args);
  }
  if (args.command == "query") {
    return cmd_query(args);
  }
  if (args.command == "dump-ast") {
    return cmd_dump_ast(args);
  }

  fmt::print(stderr, "error: unknown command '{}'\n\n", args.command);
  print_usage(argv[0]);
  return 1;
}
